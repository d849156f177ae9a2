#include "data/data_loader.hpp"

#include "core/logging.hpp"
#include "data/yaml_value.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

namespace folio::data {

namespace {

std::optional<DataFormat> format_from_name(const QString& name) {
    const auto key = name.trimmed().toLower();
    if (key == QStringLiteral("json")) return DataFormat::Json;
    if (key == QStringLiteral("yaml") || key == QStringLiteral("yml")) return DataFormat::Yaml;
    return std::nullopt;
}

Result<QByteArray> read_all(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        return Result<QByteArray>::err(Error{("Data file not found: " + path).toStdString()});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray>::err(Error{
            ("Cannot read data file " + path + ": " + file.errorString()).toStdString()});
    }
    return Result<QByteArray>::ok(file.readAll());
}

Result<QVariant> read_and_parse(const QString& path, DataFormat format) {
    auto bytes = read_all(path);
    if (bytes.is_err()) {
        return Result<QVariant>::err(bytes.unwrap_err());
    }
    return parse(format, bytes.unwrap()).map_err([&path](Error e) {
        return Error{path.toStdString() + ": " + e.message, e.code};
    });
}

} // namespace

std::optional<DataFormat> detect_format(const QString& file_name, const QString& kind_hint) {
    if (auto by_extension = format_from_name(QFileInfo(file_name).suffix())) {
        return by_extension;
    }
    return format_from_name(kind_hint);
}

Result<QVariant> parse_json(const QByteArray& bytes) {
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(bytes, &error);
    if (error.error != QJsonParseError::NoError) {
        return Result<QVariant>::err(Error{
            QStringLiteral("malformed JSON at offset %1: %2")
                .arg(error.offset)
                .arg(error.errorString())
                .toStdString(),
            static_cast<int>(error.error)});
    }
    return Result<QVariant>::ok(doc.toVariant());
}

Result<QVariant> parse_yaml(const QByteArray& bytes) {
    return yaml_to_variant(bytes.toStdString());
}

Result<QVariant> parse(DataFormat format, const QByteArray& bytes) {
    switch (format) {
        case DataFormat::Json: return parse_json(bytes);
        case DataFormat::Yaml: return parse_yaml(bytes);
    }
    return Result<QVariant>::err(Error{"unsupported data format"});
}

Result<QVariant> FileDataLoader::load(const QString& source_dir,
                                      const QString& file_name,
                                      const QString& kind_hint) const {
    const auto path = QDir::cleanPath(QDir(source_dir.isEmpty() ? QDir::currentPath() : source_dir)
                                          .filePath(file_name));
    const auto format = detect_format(file_name, kind_hint);
    if (!format) {
        return Result<QVariant>::err(Error{
            ("Cannot infer data format for " + path + " (namespace '" + kind_hint + "')").toStdString()});
    }

    qCDebug(folioDataLog) << "loading" << path;
    return read_and_parse(path, *format);
}

Result<QVariant> load_file(const QString& path) {
    const auto format = detect_format(path);
    if (!format) {
        return Result<QVariant>::err(Error{("Unsupported file type: " + path).toStdString()});
    }
    return read_and_parse(path, *format);
}

} // namespace folio::data
