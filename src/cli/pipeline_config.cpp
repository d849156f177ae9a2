#include "cli/pipeline_config.hpp"

#include "core/glob.hpp"
#include "data/data_loader.hpp"
#include "pipeline/transformer.hpp"

#include <QMetaType>
#include <QSet>

#include <algorithm>
#include <utility>

namespace folio::cli {

namespace {

Error config_error(const QString& where, const QString& problem) {
    return Error{(QStringLiteral("config: '") + where + QStringLiteral("' ") + problem).toStdString()};
}

bool is_map(const QVariant& v) { return v.typeId() == QMetaType::QVariantMap; }
bool is_list(const QVariant& v) { return v.typeId() == QMetaType::QVariantList; }
bool is_string(const QVariant& v) { return v.typeId() == QMetaType::QString; }

Result<QString> require_string(const QVariantMap& map, const QString& key, const QString& where) {
    const auto value = map.value(key);
    if (!is_string(value)) {
        return Result<QString>::err(config_error(where + QLatin1Char('.') + key, QStringLiteral("must be a string")));
    }
    return Result<QString>::ok(value.toString());
}

Result<std::optional<QString>> optional_string(const QVariantMap& map, const QString& key, const QString& where) {
    using Out = Result<std::optional<QString>>;
    if (!map.contains(key) || !map.value(key).isValid()) {
        return Out::ok(std::nullopt);
    }
    return require_string(map, key, where).map([](QString s) { return std::optional<QString>(std::move(s)); });
}

Result<void> reject_unknown_keys(const QVariantMap& map, const QStringList& allowed, const QString& where) {
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        if (!allowed.contains(it.key())) {
            return Result<void>::err(config_error(where + QLatin1Char('.') + it.key(), QStringLiteral("is not a recognized key")));
        }
    }
    return Result<void>::ok();
}

Result<QVariantList> require_list(const QVariantMap& root, const QString& key) {
    const auto value = root.value(key);
    if (!is_list(value)) {
        return Result<QVariantList>::err(config_error(key, QStringLiteral("must be a sequence")));
    }
    return Result<QVariantList>::ok(value.toList());
}

Result<void> parse_data(const QVariant& value, PipelineConfig& config) {
    if (!is_map(value)) {
        return Result<void>::err(config_error(QStringLiteral("data"), QStringLiteral("must be a mapping")));
    }
    const auto map = value.toMap();
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        if (!is_string(it.value())) {
            return Result<void>::err(config_error(QStringLiteral("data.") + it.key(), QStringLiteral("must be a file name")));
        }
        config.data.insert(it.key(), it.value().toString());
    }
    return Result<void>::ok();
}

Result<void> parse_ignore(const QVariantList& items, PipelineConfig& config) {
    for (qsizetype i = 0; i < items.size(); ++i) {
        if (!is_string(items[i])) {
            return Result<void>::err(config_error(QStringLiteral("ignore[%1]").arg(i), QStringLiteral("must be a pattern string")));
        }
        config.ignore.append(items[i].toString());
    }
    return Result<void>::ok();
}

Result<void> parse_metadata(const QVariantList& items, PipelineConfig& config) {
    for (qsizetype i = 0; i < items.size(); ++i) {
        const auto where = QStringLiteral("metadata[%1]").arg(i);
        if (!is_map(items[i])) {
            return Result<void>::err(config_error(where, QStringLiteral("must be a mapping")));
        }
        const auto entry = items[i].toMap();
        auto keys = reject_unknown_keys(entry, {QStringLiteral("pattern"), QStringLiteral("values")}, where);
        if (keys.is_err()) return keys;

        auto pattern = require_string(entry, QStringLiteral("pattern"), where);
        if (pattern.is_err()) return Result<void>::err(pattern.unwrap_err());
        if (!is_map(entry.value(QStringLiteral("values")))) {
            return Result<void>::err(config_error(where + QStringLiteral(".values"), QStringLiteral("must be a mapping")));
        }
        config.metadata.push_back(MetadataRule{pattern.unwrap(), entry.value(QStringLiteral("values")).toMap()});
    }
    return Result<void>::ok();
}

Result<void> parse_layout(const QVariantList& items, PipelineConfig& config) {
    for (qsizetype i = 0; i < items.size(); ++i) {
        const auto where = QStringLiteral("layout[%1]").arg(i);
        if (!is_map(items[i])) {
            return Result<void>::err(config_error(where, QStringLiteral("must be a mapping")));
        }
        const auto entry = items[i].toMap();
        auto keys = reject_unknown_keys(entry, {QStringLiteral("pattern"), QStringLiteral("layout")}, where);
        if (keys.is_err()) return keys;

        auto pattern = require_string(entry, QStringLiteral("pattern"), where);
        if (pattern.is_err()) return Result<void>::err(pattern.unwrap_err());
        auto layout = require_string(entry, QStringLiteral("layout"), where);
        if (layout.is_err()) return Result<void>::err(layout.unwrap_err());
        config.layout.push_back(LayoutRule{pattern.unwrap(), layout.unwrap()});
    }
    return Result<void>::ok();
}

Result<QueryRule> parse_query(const QVariant& item, const QString& where) {
    if (is_string(item)) {
        return Result<QueryRule>::ok(QueryRule{.name = item.toString()});
    }
    if (!is_map(item)) {
        return Result<QueryRule>::err(config_error(where, QStringLiteral("must be a name or a mapping")));
    }

    const auto entry = item.toMap();
    auto keys = reject_unknown_keys(entry,
                                    {QStringLiteral("name"), QStringLiteral("pattern"),
                                     QStringLiteral("sort_by"), QStringLiteral("descending")},
                                    where);
    if (keys.is_err()) return Result<QueryRule>::err(keys.unwrap_err());

    auto name = require_string(entry, QStringLiteral("name"), where);
    if (name.is_err()) return Result<QueryRule>::err(name.unwrap_err());
    auto pattern = optional_string(entry, QStringLiteral("pattern"), where);
    if (pattern.is_err()) return Result<QueryRule>::err(pattern.unwrap_err());
    auto sort_by = optional_string(entry, QStringLiteral("sort_by"), where);
    if (sort_by.is_err()) return Result<QueryRule>::err(sort_by.unwrap_err());

    const auto descending = entry.value(QStringLiteral("descending"), false);
    if (descending.typeId() != QMetaType::Bool) {
        return Result<QueryRule>::err(config_error(where + QStringLiteral(".descending"), QStringLiteral("must be a boolean")));
    }

    return Result<QueryRule>::ok(QueryRule{
        .name = name.unwrap(),
        .pattern = pattern.unwrap(),
        .sort_by = sort_by.unwrap(),
        .descending = descending.toBool(),
    });
}

Result<void> parse_queries(const QVariantList& items, PipelineConfig& config) {
    QSet<QString> names;
    for (qsizetype i = 0; i < items.size(); ++i) {
        const auto where = QStringLiteral("queries[%1]").arg(i);
        auto rule = parse_query(items[i], where);
        if (rule.is_err()) return Result<void>::err(rule.unwrap_err());
        if (names.contains(rule.unwrap().name)) {
            return Result<void>::err(config_error(where, QStringLiteral("repeats query name ") + rule.unwrap().name));
        }
        names.insert(rule.unwrap().name);
        config.queries.push_back(std::move(rule).unwrap());
    }
    return Result<void>::ok();
}

// Sort keys group by kind first: numbers, then strings, then anything else
// by its text form. Mixed kinds therefore still order consistently.
int kind_rank(const QVariant& v) {
    switch (v.typeId()) {
        case QMetaType::Bool:
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong:
        case QMetaType::Double:
            return 0;
        case QMetaType::QString:
            return 1;
        default:
            return 2;
    }
}

// Ordering for the sort key; pages lacking it go last.
bool sorts_before(const QVariant& a, const QVariant& b) {
    if (!a.isValid()) return false;
    if (!b.isValid()) return true;

    const auto rank_a = kind_rank(a);
    const auto rank_b = kind_rank(b);
    if (rank_a != rank_b) return rank_a < rank_b;
    if (rank_a == 0) return a.toDouble() < b.toDouble();
    return QString::compare(a.toString(), b.toString()) < 0;
}

} // namespace

Result<PipelineConfig> parse_pipeline_config(const QVariant& document) {
    PipelineConfig config;
    if (!document.isValid()) {
        // An empty file declares nothing.
        return Result<PipelineConfig>::ok(config);
    }
    if (!is_map(document)) {
        return Result<PipelineConfig>::err(Error{"config: document must be a mapping"});
    }

    const auto root = document.toMap();
    const QStringList sections{QStringLiteral("data"), QStringLiteral("ignore"), QStringLiteral("metadata"),
                               QStringLiteral("layout"), QStringLiteral("queries")};
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!sections.contains(it.key())) {
            return Result<PipelineConfig>::err(config_error(it.key(), QStringLiteral("is not a recognized section")));
        }
    }

    if (root.contains(QStringLiteral("data"))) {
        auto parsed = parse_data(root.value(QStringLiteral("data")), config);
        if (parsed.is_err()) return Result<PipelineConfig>::err(parsed.unwrap_err());
    }

    using SectionParser = Result<void> (*)(const QVariantList&, PipelineConfig&);
    const std::pair<QString, SectionParser> list_sections[] = {
        {QStringLiteral("ignore"), parse_ignore},
        {QStringLiteral("metadata"), parse_metadata},
        {QStringLiteral("layout"), parse_layout},
        {QStringLiteral("queries"), parse_queries},
    };
    for (const auto& [key, parse_section] : list_sections) {
        if (!root.contains(key)) continue;
        auto items = require_list(root, key);
        if (items.is_err()) return Result<PipelineConfig>::err(items.unwrap_err());
        auto parsed = parse_section(items.unwrap(), config);
        if (parsed.is_err()) return Result<PipelineConfig>::err(parsed.unwrap_err());
    }
    return Result<PipelineConfig>::ok(std::move(config));
}

Result<PipelineConfig> load_pipeline_config(const QString& path) {
    return data::load_file(path).and_then([](const QVariant& document) {
        return parse_pipeline_config(document);
    });
}

pipeline::QuerySelector make_selector(const QueryRule& rule) {
    if (!rule.pattern && !rule.sort_by) {
        return {};
    }

    const auto glob = rule.pattern ? std::optional<Glob>(Glob(*rule.pattern)) : std::nullopt;
    return [glob, sort_by = rule.sort_by, descending = rule.descending](const PageList& pages) {
        PageList selected;
        for (const auto& page : pages) {
            if (!glob || glob->matches(page.src())) {
                selected.push_back(page);
            }
        }
        if (sort_by) {
            std::stable_sort(selected.begin(), selected.end(), [&](const Page& a, const Page& b) {
                const auto va = a.value(*sort_by);
                const auto vb = b.value(*sort_by);
                if (descending && va.isValid() && vb.isValid()) {
                    return sorts_before(vb, va);
                }
                return sorts_before(va, vb);
            });
        }
        return selected;
    };
}

void apply_config(const PipelineConfig& config, pipeline::Transformer& transformer) {
    for (auto it = config.data.constBegin(); it != config.data.constEnd(); ++it) {
        transformer.data(it.key(), it.value());
    }
    for (const auto& pattern : config.ignore) {
        transformer.ignore(pattern);
    }
    for (const auto& rule : config.metadata) {
        transformer.metadata(rule.pattern, rule.values);
    }
    for (const auto& rule : config.layout) {
        transformer.layout(rule.pattern, rule.layout);
    }
    for (const auto& rule : config.queries) {
        transformer.query(rule.name, make_selector(rule));
    }
}

} // namespace folio::cli
