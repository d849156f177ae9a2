#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>

#include "cli/page_discovery.hpp"
#include "cli/page_output.hpp"
#include "cli/pipeline_config.hpp"
#include "core/logging.hpp"
#include "pipeline/transformer.hpp"

namespace {

int fail_with(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("folio");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Run a page transformation pipeline over a directory of pages."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Pipeline configuration file (JSON or YAML)."),
        QStringLiteral("file"));
    parser.addOption(configOption);

    const QCommandLineOption sourceDirOption(
        QStringList{QStringLiteral("source-dir")},
        QStringLiteral("Directory data files are resolved against (default: the config file's directory)."),
        QStringLiteral("dir"));
    parser.addOption(sourceDirOption);

    const QCommandLineOption logLevelOption(
        QStringList{QStringLiteral("log-level")},
        QStringLiteral("silent, error, warning, info or debug."),
        QStringLiteral("level"),
        QStringLiteral("warning"));
    parser.addOption(logLevelOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log messages to this file instead of stderr."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output the final pages as JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption contentOption(
        QStringList{QStringLiteral("content")},
        QStringLiteral("Include page content in JSON output."));
    parser.addOption(contentOption);

    const QCommandLineOption skipIgnoredOption(
        QStringList{QStringLiteral("skip-ignored")},
        QStringLiteral("Leave ignored pages out of the output."));
    parser.addOption(skipIgnoredOption);

    parser.addPositionalArgument(QStringLiteral("pages"),
                                 QStringLiteral("Directory containing the pages."));
    parser.process(app);

    const auto positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }
    const auto pagesDir = positional.first();

    const auto level = folio::parse_log_level(parser.value(logLevelOption));
    if (level.is_err()) {
        return fail_with(QString::fromStdString(level.unwrap_err().message));
    }
    folio::apply_log_level(level.unwrap());

    if (parser.isSet(logFileOption)) {
        const auto installed = folio::install_file_logging(parser.value(logFileOption));
        if (installed.is_err()) {
            return fail_with(QString::fromStdString(installed.unwrap_err().message));
        }
    }

    folio::cli::PipelineConfig config;
    QString sourceDir = parser.value(sourceDirOption);
    if (parser.isSet(configOption)) {
        const auto configPath = parser.value(configOption);
        auto loaded = folio::cli::load_pipeline_config(configPath);
        if (loaded.is_err()) {
            return fail_with(QString::fromStdString(loaded.unwrap_err().message));
        }
        config = std::move(loaded).unwrap();
        if (sourceDir.isEmpty()) {
            sourceDir = QFileInfo(configPath).absolutePath();
        }
    }
    if (sourceDir.isEmpty()) {
        sourceDir = pagesDir;
    }

    auto pages = folio::cli::discover_pages(pagesDir);
    if (pages.is_err()) {
        return fail_with(QString::fromStdString(pages.unwrap_err().message));
    }

    folio::pipeline::Transformer transformer(folio::pipeline::Options{
        .source_dir = sourceDir,
        .log_level = level.unwrap(),
    });
    folio::cli::apply_config(config, transformer);

    const auto result = transformer.transform_pages(std::move(pages).unwrap());
    if (result.is_err()) {
        return fail_with(result.unwrap_err().describe());
    }

    const folio::cli::OutputOptions output{
        .include_ignored = !parser.isSet(skipIgnoredOption),
        .include_content = parser.isSet(contentOption),
    };
    QTextStream(stdout) << (parser.isSet(jsonOption)
                                ? folio::cli::format_pages_json(result.unwrap(), output)
                                : folio::cli::format_pages(result.unwrap(), output));
    return 0;
}
