#pragma once

#include "core/result.hpp"
#include "pipeline/operations.hpp"

#include <QMap>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

#include <optional>
#include <vector>

namespace folio::pipeline {
class Transformer;
}

namespace folio::cli {

struct MetadataRule {
    QString pattern;
    QVariantMap values;
};

struct LayoutRule {
    QString pattern;
    QString layout;
};

struct QueryRule {
    QString name;
    std::optional<QString> pattern;   // all pages when absent
    std::optional<QString> sort_by;   // metadata key
    bool descending{false};
};

/**
 * PipelineConfig - registrations declared in a JSON or YAML file.
 *
 *   data:     { site: site.yaml }
 *   ignore:   [ "drafts/**" ]
 *   metadata: [ { pattern: "blog/**", values: { section: blog } } ]
 *   layout:   [ { pattern: "*.html", layout: "_layout.html:main" } ]
 *   queries:  [ allPages, { name: posts, pattern: "blog/**", sort_by: date, descending: true } ]
 */
struct PipelineConfig {
    QMap<QString, QString> data;
    QStringList ignore;
    std::vector<MetadataRule> metadata;
    std::vector<LayoutRule> layout;
    std::vector<QueryRule> queries;
};

[[nodiscard]] Result<PipelineConfig> parse_pipeline_config(const QVariant& document);
[[nodiscard]] Result<PipelineConfig> load_pipeline_config(const QString& path);

/**
 * Selector keeping pages that match the rule's pattern in collection order,
 * then stable-sorted by the rule's metadata key if one is given. Pages
 * without the key sort after those that have it.
 */
[[nodiscard]] pipeline::QuerySelector make_selector(const QueryRule& rule);

// Registers data, ignore, metadata, layout and queries, in that order.
void apply_config(const PipelineConfig& config, pipeline::Transformer& transformer);

} // namespace folio::cli
