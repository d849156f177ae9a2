#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStringList>

Q_LOGGING_CATEGORY(folioPipelineLog, "folio.pipeline")
Q_LOGGING_CATEGORY(folioDataLog, "folio.data")
Q_LOGGING_CATEGORY(folioCliLog, "folio.cli")

namespace folio {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct FileSink {
    QMutex mu;
    QFile file;
};

FileSink& sink() {
    static FileSink s{};
    return s;
}

void file_message_handler(QtMsgType type,
                          const QMessageLogContext& ctx,
                          const QString& msg) {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (!s.file.isOpen()) {
        return;
    }

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    s.file.write(line.toUtf8());
    s.file.flush();
}

} // namespace

Result<LogLevel> parse_log_level(const QString& name) {
    const auto key = name.trimmed().toLower();
    if (key == QStringLiteral("silent")) return Result<LogLevel>::ok(LogLevel::Silent);
    if (key == QStringLiteral("error")) return Result<LogLevel>::ok(LogLevel::Error);
    if (key == QStringLiteral("warn") || key == QStringLiteral("warning")) {
        return Result<LogLevel>::ok(LogLevel::Warning);
    }
    if (key == QStringLiteral("info")) return Result<LogLevel>::ok(LogLevel::Info);
    if (key == QStringLiteral("debug")) return Result<LogLevel>::ok(LogLevel::Debug);
    return Result<LogLevel>::err(Error{("Unknown log level: " + name).toStdString()});
}

QString log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Silent: return QStringLiteral("silent");
        case LogLevel::Error: return QStringLiteral("error");
        case LogLevel::Warning: return QStringLiteral("warning");
        case LogLevel::Info: return QStringLiteral("info");
        case LogLevel::Debug: return QStringLiteral("debug");
    }
    return QStringLiteral("info");
}

void apply_log_level(LogLevel level) {
    const auto rule = [](const char* type, bool enabled) {
        return QStringLiteral("folio.*.%1=%2")
            .arg(QLatin1String(type), enabled ? QStringLiteral("true") : QStringLiteral("false"));
    };

    // Qt has no separate "error" level; critical is used for it.
    const QStringList rules{
        rule("critical", level >= LogLevel::Error),
        rule("warning", level >= LogLevel::Warning),
        rule("info", level >= LogLevel::Info),
        rule("debug", level >= LogLevel::Debug),
    };
    QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
}

Result<void> install_file_logging(const QString& path) {
    auto& s = sink();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        QDir().mkpath(QFileInfo(path).absolutePath());
        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return Result<void>::err(Error{("Cannot open log file: " + path).toStdString()});
        }
    }

    // Our handler already stamps time/level/category.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(file_message_handler);
    return Result<void>::ok();
}

} // namespace folio
