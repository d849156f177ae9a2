#include "core/page.hpp"

#include <QSet>

namespace folio {

namespace {

bool same_query(const QueryResult& a, const QueryResult& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

} // namespace

Page::Page(QString src, QString content, QVariantMap metadata)
    : content(std::move(content)),
      metadata(std::move(metadata)),
      src_(std::move(src)) {}

const PageList& Page::query(const QString& name) const {
    static const PageList empty;
    const auto it = queries.constFind(name);
    if (it == queries.constEnd() || !it.value()) {
        return empty;
    }
    return *it.value();
}

bool operator==(const Page& a, const Page& b) {
    if (a.src_ != b.src_ || a.content != b.content || a.metadata != b.metadata ||
        a.data != b.data || a.ignore != b.ignore || a.layout != b.layout) {
        return false;
    }
    if (a.queries.size() != b.queries.size()) {
        return false;
    }
    for (auto it = a.queries.constBegin(); it != a.queries.constEnd(); ++it) {
        const auto other = b.queries.constFind(it.key());
        if (other == b.queries.constEnd() || !same_query(it.value(), other.value())) {
            return false;
        }
    }
    return true;
}

std::optional<QString> find_duplicate_src(const PageList& pages) {
    QSet<QString> seen;
    seen.reserve(static_cast<qsizetype>(pages.size()));
    for (const auto& page : pages) {
        if (seen.contains(page.src())) {
            return page.src();
        }
        seen.insert(page.src());
    }
    return std::nullopt;
}

} // namespace folio
