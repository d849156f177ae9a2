#pragma once

#include "core/page.hpp"
#include "core/result.hpp"

#include <QString>

namespace folio::cli {

// One page per regular file below `root`, keyed by its '/'-separated
// relative path and carrying the file's UTF-8 text. Ordered by src.
[[nodiscard]] Result<PageList> discover_pages(const QString& root);

} // namespace folio::cli
