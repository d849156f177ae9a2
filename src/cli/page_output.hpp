#pragma once

#include "core/page.hpp"

#include <QString>

namespace folio::cli {

struct OutputOptions {
    bool include_ignored = true;
    bool include_content = false;  // JSON only
};

// One line per page:
//   index.html  [layout: _layout.html:main]
//   drafts/wip.html  (ignored)
[[nodiscard]] QString format_pages(const PageList& pages, const OutputOptions& options = {});

// JSON output:
// [
//   { "src", "ignore", "layout"?, "metadata", "data", "queries": { name: [src, ...] }, "content"? }
// ]
[[nodiscard]] QString format_pages_json(const PageList& pages, const OutputOptions& options = {});

} // namespace folio::cli
