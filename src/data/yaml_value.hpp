#pragma once

#include "core/result.hpp"

#include <QVariant>

#include <string>

namespace folio::data {

/**
 * Parse YAML text into Qt values: mappings become QVariantMap, sequences
 * QVariantList, scalars bool/qint64/double/QString, and null an invalid
 * QVariant. Only the first document of a stream is used.
 */
[[nodiscard]] Result<QVariant> yaml_to_variant(const std::string& text);

} // namespace folio::data
