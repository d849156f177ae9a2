#pragma once

#include <QMap>
#include <QString>
#include <QVariant>
#include <QVariantMap>

#include <memory>
#include <optional>
#include <vector>

namespace folio {

class Page;

using PageList = std::vector<Page>;

/**
 * QueryResult - an immutable snapshot of the page collection taken when the
 * query stage ran. Shared by every page that carries the query.
 */
using QueryResult = std::shared_ptr<const PageList>;

/**
 * Page - one output document flowing through the pipeline.
 *
 * `src` identifies the page for the whole run and cannot be reassigned
 * through the public interface. Everything else is an open bag that
 * handlers and directives mutate directly:
 *  - metadata: arbitrary key/value properties attached to the page
 *  - data: values from data operations, keyed by namespace
 *  - queries: named snapshots produced by the query stage
 */
class Page {
public:
    explicit Page(QString src, QString content = {}, QVariantMap metadata = {});

    [[nodiscard]] const QString& src() const noexcept { return src_; }

    QString content;
    QVariantMap metadata;
    QVariantMap data;
    bool ignore{false};
    std::optional<QString> layout;
    QMap<QString, QueryResult> queries;

    /**
     * Shorthand for metadata access.
     */
    [[nodiscard]] QVariant value(const QString& key) const { return metadata.value(key); }
    void set(const QString& key, const QVariant& value) { metadata.insert(key, value); }

    /**
     * Pages of a named query, or an empty list if the query never ran
     * for this page.
     */
    [[nodiscard]] const PageList& query(const QString& name) const;

    [[nodiscard]] bool has_query(const QString& name) const { return queries.contains(name); }

    friend bool operator==(const Page& a, const Page& b);

private:
    QString src_;
};

/**
 * Create a fresh page. Local metadata given here is owned by the page and
 * wins over metadata directives applied later.
 */
[[nodiscard]] inline Page create_page(QString src, QString content = {}, QVariantMap metadata = {}) {
    return Page(std::move(src), std::move(content), std::move(metadata));
}

/**
 * PageFactory - the page construction capability handed to generators.
 */
struct PageFactory {
    [[nodiscard]] Page operator()(QString src, QString content = {}, QVariantMap metadata = {}) const {
        return create_page(std::move(src), std::move(content), std::move(metadata));
    }
};

/**
 * First src that occurs more than once, if any.
 */
[[nodiscard]] std::optional<QString> find_duplicate_src(const PageList& pages);

} // namespace folio
