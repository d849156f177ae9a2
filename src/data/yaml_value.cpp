#include "data/yaml_value.hpp"

#include <fkYAML/node.hpp>

#include <QVariantList>
#include <QVariantMap>

#include <cstdint>

namespace folio::data {

namespace {

QString key_text(const fkyaml::node& key) {
    if (key.is_string()) return QString::fromStdString(key.get_value<std::string>());
    if (key.is_integer()) return QString::number(key.get_value<std::int64_t>());
    if (key.is_boolean()) return key.get_value<bool>() ? QStringLiteral("true") : QStringLiteral("false");
    if (key.is_float_number()) return QString::number(key.get_value<double>());
    if (key.is_null()) return QStringLiteral("null");
    // Complex keys are flattened to their YAML text.
    return QString::fromStdString(fkyaml::node::serialize(key)).trimmed();
}

QVariant to_variant(const fkyaml::node& node) {
    if (node.is_mapping()) {
        QVariantMap map;
        for (const auto& [key, value] : node.map_items()) {
            map.insert(key_text(key), to_variant(value));
        }
        return map;
    }
    if (node.is_sequence()) {
        QVariantList list;
        for (const auto& item : node) {
            list.append(to_variant(item));
        }
        return list;
    }
    if (node.is_null()) return QVariant{};
    if (node.is_boolean()) return node.get_value<bool>();
    if (node.is_integer()) return static_cast<qint64>(node.get_value<std::int64_t>());
    if (node.is_float_number()) return node.get_value<double>();
    return QString::fromStdString(node.get_value<std::string>());
}

} // namespace

Result<QVariant> yaml_to_variant(const std::string& text) {
    try {
        const auto root = fkyaml::node::deserialize(text);
        return Result<QVariant>::ok(to_variant(root));
    } catch (const fkyaml::exception& e) {
        return Result<QVariant>::err(Error{std::string("malformed YAML: ") + e.what()});
    }
}

} // namespace folio::data
