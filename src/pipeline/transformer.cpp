#include "pipeline/transformer.hpp"

#include "data/data_loader.hpp"
#include "pipeline/stages.hpp"

#include <QElapsedTimer>

namespace folio::pipeline {

Transformer::Transformer(Options options)
    : Transformer(std::move(options), std::make_shared<data::FileDataLoader>()) {}

Transformer::Transformer(Options options, std::shared_ptr<const data::DataLoader> loader)
    : options_(std::move(options)),
      loader_(loader ? std::move(loader) : std::make_shared<data::FileDataLoader>()) {
    apply_log_level(options_.log_level);
}

Transformer::~Transformer() = default;
Transformer::Transformer(Transformer&&) noexcept = default;
Transformer& Transformer::operator=(Transformer&&) noexcept = default;

Transformer& Transformer::transform(const QString& pattern, TransformFn fn) {
    registry_.add(TransformOp{Glob(pattern), std::move(fn)});
    return *this;
}

Transformer& Transformer::transform_async(const QString& pattern, TransformAsyncFn fn) {
    registry_.add(TransformOp{Glob(pattern), std::move(fn)});
    return *this;
}

Transformer& Transformer::transform_all(TransformAllFn fn) {
    registry_.add(TransformAllOp{std::move(fn)});
    return *this;
}

Transformer& Transformer::transform_all_async(TransformAllAsyncFn fn) {
    registry_.add(TransformAllOp{std::move(fn)});
    return *this;
}

Transformer& Transformer::data(const QString& name, const QString& file_name) {
    registry_.add(DataOp{name, DataFile{file_name}});
    return *this;
}

Transformer& Transformer::data(const QString& name, DataFn fn) {
    registry_.add(DataOp{name, std::move(fn)});
    return *this;
}

Transformer& Transformer::ignore(const QString& pattern) {
    registry_.add(IgnoreOp{Glob(pattern)});
    return *this;
}

Transformer& Transformer::metadata(const QString& pattern, QVariantMap values) {
    registry_.add(MetadataOp{Glob(pattern), std::move(values)});
    return *this;
}

Transformer& Transformer::layout(const QString& pattern, const QString& layout) {
    registry_.add(LayoutOp{Glob(pattern), layout});
    return *this;
}

Transformer& Transformer::query(const QString& name, QuerySelector selector) {
    registry_.add(QueryOp{name, std::move(selector)});
    return *this;
}

Transformer& Transformer::generate(GenerateFn generator) {
    registry_.add(GenerateOp{std::move(generator)});
    return *this;
}

Result<PageList, Failure> Transformer::transform_pages(PageList pages) const {
    using Out = Result<PageList, Failure>;

    QElapsedTimer timer;
    timer.start();

    const auto failed = [](Failure failure) {
        qCWarning(folioPipelineLog).noquote() << "pipeline failed:" << failure.describe();
        return Out::err(std::move(failure));
    };

    if (const auto duplicate = find_duplicate_src(pages)) {
        qCCritical(folioPipelineLog) << "duplicate page src in input:" << *duplicate;
        return failed(Failure::contract("duplicate page src in input: " + duplicate->toStdString()));
    }

    auto result = run_data_stage(registry_.of_kind<DataOp>(), pages, *loader_, options_.source_dir);
    if (result.is_err()) return failed(std::move(result).unwrap_err());

    apply_ignore(registry_.of_kind<IgnoreOp>(), pages);
    apply_metadata(registry_.of_kind<MetadataOp>(), pages);
    apply_layout(registry_.of_kind<LayoutOp>(), pages);

    result = run_query_stage(registry_.of_kind<QueryOp>(), pages);
    if (result.is_err()) return failed(std::move(result).unwrap_err());

    result = run_transform_stage(registry_.of_kind<TransformOp>(), pages);
    if (result.is_err()) return failed(std::move(result).unwrap_err());

    result = run_transform_all_stage(registry_.of_kind<TransformAllOp>(), pages);
    if (result.is_err()) return failed(std::move(result).unwrap_err());

    result = run_generate_stage(registry_.of_kind<GenerateOp>(), pages);
    if (result.is_err()) return failed(std::move(result).unwrap_err());

    qCInfo(folioPipelineLog) << "transformed" << pages.size() << "page(s) in"
                             << timer.elapsed() << "ms";
    return Out::ok(std::move(pages));
}

} // namespace folio::pipeline
