#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>
#include <QVariant>

#include <optional>

namespace folio::data {

enum class DataFormat {
    Json,
    Yaml
};

/**
 * Pick a format from the file extension, falling back to the namespace
 * identifier the data was registered under ("json", "yaml", "yml").
 */
[[nodiscard]] std::optional<DataFormat> detect_format(const QString& file_name,
                                                      const QString& kind_hint = {});

[[nodiscard]] Result<QVariant> parse_json(const QByteArray& bytes);
[[nodiscard]] Result<QVariant> parse_yaml(const QByteArray& bytes);
[[nodiscard]] Result<QVariant> parse(DataFormat format, const QByteArray& bytes);

/**
 * DataLoader - resolves a named data file into a value.
 */
class DataLoader {
public:
    virtual ~DataLoader() = default;

    /**
     * Load `file_name` relative to `source_dir` (absolute names are used
     * as-is). `kind_hint` is the namespace the data was registered under.
     */
    [[nodiscard]] virtual Result<QVariant> load(const QString& source_dir,
                                                const QString& file_name,
                                                const QString& kind_hint) const = 0;
};

/**
 * FileDataLoader - reads JSON and YAML files from disk.
 */
class FileDataLoader final : public DataLoader {
public:
    [[nodiscard]] Result<QVariant> load(const QString& source_dir,
                                        const QString& file_name,
                                        const QString& kind_hint) const override;
};

/**
 * Read and parse a JSON or YAML file by its extension.
 */
[[nodiscard]] Result<QVariant> load_file(const QString& path);

} // namespace folio::data
