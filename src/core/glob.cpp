#include "core/glob.hpp"

#include <QStringList>

namespace folio {

namespace {

// Index of the ']' closing a class that opens at `open`, or -1.
qsizetype find_class_end(const QString& p, qsizetype open) {
    qsizetype i = open + 1;
    if (i < p.size() && (p[i] == QLatin1Char('!') || p[i] == QLatin1Char('^'))) ++i;
    // A leading ']' is part of the class.
    if (i < p.size() && p[i] == QLatin1Char(']')) ++i;
    for (; i < p.size(); ++i) {
        if (p[i] == QLatin1Char(']')) return i;
        if (p[i] == QLatin1Char('/')) return -1;
    }
    return -1;
}

// Index of the '}' closing an alternation that opens at `open`, or -1.
qsizetype find_brace_end(const QString& p, qsizetype open) {
    int depth = 0;
    for (qsizetype i = open; i < p.size(); ++i) {
        if (p[i] == QLatin1Char('{')) ++depth;
        else if (p[i] == QLatin1Char('}') && --depth == 0) return i;
    }
    return -1;
}

bool starts_segment(const QString& p, qsizetype i) {
    return i == 0 || p[i - 1] == QLatin1Char('/');
}

bool ends_segment(const QString& p, qsizetype i) {
    return i >= p.size() || p[i] == QLatin1Char('/');
}

QString translate(const QString& p, qsizetype begin, qsizetype end, bool in_braces);

QString translate_class(const QString& body) {
    QString out = QStringLiteral("[");
    qsizetype i = 0;
    if (!body.isEmpty() && (body[0] == QLatin1Char('!') || body[0] == QLatin1Char('^'))) {
        out += QLatin1Char('^');
        i = 1;
    }
    for (; i < body.size(); ++i) {
        const QChar c = body[i];
        if (c == QLatin1Char('\\') || c == QLatin1Char('[') || c == QLatin1Char(']') ||
            c == QLatin1Char('^')) {
            out += QLatin1Char('\\');
        }
        out += c;
    }
    out += QLatin1Char(']');
    return out;
}

QString translate_alternation(const QString& p, qsizetype open, qsizetype close) {
    QStringList options;
    int depth = 0;
    qsizetype start = open + 1;
    for (qsizetype i = open + 1; i < close; ++i) {
        if (p[i] == QLatin1Char('{')) ++depth;
        else if (p[i] == QLatin1Char('}')) --depth;
        else if (p[i] == QLatin1Char(',') && depth == 0) {
            options.append(translate(p, start, i, true));
            start = i + 1;
        }
    }
    options.append(translate(p, start, close, true));
    return QStringLiteral("(?:") + options.join(QLatin1Char('|')) + QLatin1Char(')');
}

QString translate(const QString& p, qsizetype begin, qsizetype end, bool in_braces) {
    QString out;
    qsizetype i = begin;
    while (i < end) {
        const QChar c = p[i];

        if (c == QLatin1Char('*')) {
            const bool double_star = i + 1 < end && p[i + 1] == QLatin1Char('*');
            if (double_star && !in_braces && starts_segment(p, i) && ends_segment(p, i + 2)) {
                if (i + 2 >= p.size()) {
                    // Trailing "**" matches everything below.
                    out += QStringLiteral(".*");
                    i += 2;
                } else {
                    // "**/" matches zero or more whole segments.
                    out += QStringLiteral("(?:[^/]*/)*");
                    i += 3;
                }
                continue;
            }
            out += QStringLiteral("[^/]*");
            i += double_star ? 2 : 1;
            continue;
        }

        if (c == QLatin1Char('?')) {
            out += QStringLiteral("[^/]");
            ++i;
            continue;
        }

        if (c == QLatin1Char('[')) {
            const auto close = find_class_end(p, i);
            if (close >= 0 && close < end) {
                out += translate_class(p.mid(i + 1, close - i - 1));
                i = close + 1;
                continue;
            }
        }

        if (c == QLatin1Char('{')) {
            const auto close = find_brace_end(p, i);
            if (close >= 0 && close < end) {
                out += translate_alternation(p, i, close);
                i = close + 1;
                continue;
            }
        }

        out += QRegularExpression::escape(QString(c));
        ++i;
    }
    return out;
}

} // namespace

Glob::Glob(QString pattern)
    : pattern_(std::move(pattern)),
      regex_(QRegularExpression::anchoredPattern(translate(pattern_, 0, pattern_.size(), false))) {}

bool Glob::matches(const QString& path) const {
    return regex_.match(path).hasMatch();
}

bool glob_match(const QString& pattern, const QString& path) {
    return Glob(pattern).matches(path);
}

} // namespace folio
