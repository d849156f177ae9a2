#pragma once

#include <QLoggingCategory>
#include <QString>

#include "core/result.hpp"

Q_DECLARE_LOGGING_CATEGORY(folioPipelineLog)
Q_DECLARE_LOGGING_CATEGORY(folioDataLog)
Q_DECLARE_LOGGING_CATEGORY(folioCliLog)

namespace folio {

// Ordered from quietest to noisiest; each level enables everything before it.
enum class LogLevel {
    Silent,
    Error,
    Warning,
    Info,
    Debug
};

[[nodiscard]] Result<LogLevel> parse_log_level(const QString& name);
[[nodiscard]] QString log_level_name(LogLevel level);

// Installs Qt filter rules for the folio.* categories. The rules are
// process-wide, so the most recent call wins.
void apply_log_level(LogLevel level);

// Installs a Qt message handler that appends every message to `path`,
// stamped with time, level and category. Returns an error if the file
// cannot be opened for appending.
[[nodiscard]] Result<void> install_file_logging(const QString& path);

} // namespace folio
