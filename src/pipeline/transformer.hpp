#pragma once

#include "core/failure.hpp"
#include "core/logging.hpp"
#include "core/page.hpp"
#include "core/result.hpp"
#include "pipeline/operations.hpp"

#include <QString>
#include <QVariantMap>

#include <memory>

namespace folio::data {
class DataLoader;
}

namespace folio::pipeline {

/**
 * Options recognized at construction.
 */
struct Options {
    QString source_dir;                 // resolves file-based data sources
    LogLevel log_level{LogLevel::Info};
};

/**
 * Transformer - registers page operations and runs them over a page set.
 *
 * Registration order is free; execution always follows the fixed stage
 * order:
 *
 *   data -> ignore -> metadata -> layout -> query
 *        -> transform -> transform_all -> generate
 *
 * Every stage completes before the next starts. The first failure from
 * any handler ends the run and is returned unchanged.
 *
 * Asynchronous handlers may complete later on the calling thread's event
 * loop (a QCoreApplication must exist for that) or from another thread.
 */
class Transformer {
public:
    explicit Transformer(Options options = {});
    Transformer(Options options, std::shared_ptr<const data::DataLoader> loader);
    ~Transformer();

    Transformer(const Transformer&) = delete;
    Transformer& operator=(const Transformer&) = delete;
    Transformer(Transformer&&) noexcept;
    Transformer& operator=(Transformer&&) noexcept;

    // Per-page transforms for pages whose src matches `pattern`.
    Transformer& transform(const QString& pattern, TransformFn fn);
    Transformer& transform_async(const QString& pattern, TransformAsyncFn fn);

    // Whole-collection transforms.
    Transformer& transform_all(TransformAllFn fn);
    Transformer& transform_all_async(TransformAllAsyncFn fn);

    /**
     * Attach data to every page under page.data[name]. A file name is
     * resolved against Options::source_dir; a function delivers the value
     * through its Done.
     */
    Transformer& data(const QString& name, const QString& file_name);
    Transformer& data(const QString& name, DataFn fn);

    Transformer& ignore(const QString& pattern);
    Transformer& metadata(const QString& pattern, QVariantMap values);
    Transformer& layout(const QString& pattern, const QString& layout);

    // Without a selector the query holds every page in collection order.
    Transformer& query(const QString& name, QuerySelector selector = {});

    Transformer& generate(GenerateFn generator);

    /**
     * Run every registered operation over `pages` and return the final
     * collection, or the first failure.
     */
    [[nodiscard]] Result<PageList, Failure> transform_pages(PageList pages) const;

    [[nodiscard]] const Registry& registry() const noexcept { return registry_; }

private:
    Options options_;
    std::shared_ptr<const data::DataLoader> loader_;
    Registry registry_;
};

} // namespace folio::pipeline
