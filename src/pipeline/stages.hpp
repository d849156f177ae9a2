#pragma once

#include "core/failure.hpp"
#include "core/page.hpp"
#include "core/result.hpp"
#include "pipeline/operations.hpp"

#include <QString>

#include <vector>

namespace folio::data {
class DataLoader;
}

namespace folio::pipeline {

using StageResult = Result<void, Failure>;

/**
 * Stage executors. Each one reads the working collection and, on success,
 * replaces it with the updated collection. On failure the collection is
 * left exactly as it was given.
 */

// Resolves every data operation and attaches the values to every page
// under page.data[name]. File sources go through `loader`.
[[nodiscard]] StageResult run_data_stage(const std::vector<const DataOp*>& ops,
                                         PageList& pages,
                                         const data::DataLoader& loader,
                                         const QString& source_dir);

// Directives never fail.
void apply_ignore(const std::vector<const IgnoreOp*>& ops, PageList& pages);
void apply_metadata(const std::vector<const MetadataOp*>& ops, PageList& pages);
void apply_layout(const std::vector<const LayoutOp*>& ops, PageList& pages);

// Fails only if a selector raises.
[[nodiscard]] StageResult run_query_stage(const std::vector<const QueryOp*>& ops, PageList& pages);

[[nodiscard]] StageResult run_transform_stage(const std::vector<const TransformOp*>& ops,
                                              PageList& pages);

[[nodiscard]] StageResult run_transform_all_stage(const std::vector<const TransformAllOp*>& ops,
                                                  PageList& pages);

[[nodiscard]] StageResult run_generate_stage(const std::vector<const GenerateOp*>& ops,
                                             PageList& pages);

} // namespace folio::pipeline
