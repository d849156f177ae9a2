#pragma once

#include <QRegularExpression>
#include <QString>

namespace folio {

/**
 * Glob - a compiled path pattern matched against page sources.
 *
 * Supported syntax:
 *   *       any run of characters except '/'
 *   ?       one character except '/'
 *   **      as a whole segment: zero or more segments
 *   [abc]   character class, [!abc] negated
 *   {a,b}   alternation
 *
 * Anything else matches literally; malformed constructs (an unclosed '['
 * or '{') are literal too. A class with a reversed range never matches.
 */
class Glob {
public:
    explicit Glob(QString pattern);

    [[nodiscard]] bool matches(const QString& path) const;

    [[nodiscard]] const QString& pattern() const noexcept { return pattern_; }

    // Equivalent regular expression source, exposed for diagnostics.
    [[nodiscard]] QString regex_source() const { return regex_.pattern(); }

private:
    QString pattern_;
    QRegularExpression regex_;
};

/**
 * One-off match without keeping the compiled pattern.
 */
[[nodiscard]] bool glob_match(const QString& pattern, const QString& path);

} // namespace folio
