#include <catch2/catch_test_macros.hpp>
#include "cli/page_discovery.hpp"
#include "cli/page_output.hpp"
#include "cli/pipeline_config.hpp"
#include "core/logging.hpp"
#include "pipeline/transformer.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

using namespace folio;
using namespace folio::cli;

namespace {

void write_file(const QDir& root, const QString& relative, const QByteArray& bytes) {
    const auto path = root.filePath(relative);
    REQUIRE(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(bytes) == bytes.size());
}

QStringList& captured_messages() {
    static QStringList messages;
    return messages;
}

void capture_message(QtMsgType, const QMessageLogContext& ctx, const QString& msg) {
    captured_messages().append(QString::fromLatin1(ctx.category ? ctx.category : "") + QLatin1Char(' ') + msg);
}

} // namespace

TEST_CASE("discover_pages reads every file under the root sorted by src", "[integration][cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    write_file(root, QStringLiteral("index.html"), "<h1>Home</h1>");
    write_file(root, QStringLiteral("blog/b.html"), "B");
    write_file(root, QStringLiteral("blog/a.html"), "A");

    auto pages = discover_pages(dir.path());
    REQUIRE(pages.is_ok());

    const auto& list = pages.unwrap();
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].src() == QStringLiteral("blog/a.html"));
    REQUIRE(list[1].src() == QStringLiteral("blog/b.html"));
    REQUIRE(list[2].src() == QStringLiteral("index.html"));
    REQUIRE(list[2].content == QStringLiteral("<h1>Home</h1>"));
}

TEST_CASE("discover_pages reports a missing directory", "[integration][cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    auto pages = discover_pages(dir.filePath(QStringLiteral("absent")));
    REQUIRE(pages.is_err());
    REQUIRE(pages.unwrap_err().message.find("Pages directory not found") != std::string::npos);
}

TEST_CASE("format_pages lists layout and ignore flags", "[integration][cli]") {
    auto index = create_page(QStringLiteral("index.html"));
    index.layout = QStringLiteral("_layout.html:main");
    auto draft = create_page(QStringLiteral("drafts/wip.html"));
    draft.ignore = true;
    const PageList pages{index, draft};

    REQUIRE(format_pages(pages) ==
            QStringLiteral("index.html  [layout: _layout.html:main]\ndrafts/wip.html  (ignored)\n"));
    REQUIRE(format_pages(pages, OutputOptions{.include_ignored = false}) ==
            QStringLiteral("index.html  [layout: _layout.html:main]\n"));
    REQUIRE(format_pages({}).isEmpty());
}

TEST_CASE("format_pages_json includes queries by src", "[integration][cli]") {
    auto page = create_page(QStringLiteral("index.html"), QStringLiteral("body"),
                            {{QStringLiteral("title"), QStringLiteral("Home")}});
    page.queries.insert(QStringLiteral("allPages"),
                        std::make_shared<const PageList>(PageList{create_page(QStringLiteral("index.html")),
                                                                  create_page(QStringLiteral("about.html"))}));

    const auto text = format_pages_json({page}, OutputOptions{.include_content = true});
    const auto doc = QJsonDocument::fromJson(text.toUtf8());
    REQUIRE(doc.isArray());

    const auto obj = doc.array().at(0).toObject();
    REQUIRE(obj.value(QStringLiteral("src")).toString() == QStringLiteral("index.html"));
    REQUIRE_FALSE(obj.value(QStringLiteral("ignore")).toBool());
    REQUIRE_FALSE(obj.contains(QStringLiteral("layout")));
    REQUIRE(obj.value(QStringLiteral("metadata")).toObject().value(QStringLiteral("title")).toString() ==
            QStringLiteral("Home"));
    REQUIRE(obj.value(QStringLiteral("content")).toString() == QStringLiteral("body"));

    const auto all = obj.value(QStringLiteral("queries")).toObject().value(QStringLiteral("allPages")).toArray();
    REQUIRE(all.size() == 2);
    REQUIRE(all.at(1).toString() == QStringLiteral("about.html"));
}

TEST_CASE("a config file drives a run over discovered pages", "[integration][cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    write_file(root, QStringLiteral("pages/index.html"), "home");
    write_file(root, QStringLiteral("pages/drafts/wip.html"), "wip");
    write_file(root, QStringLiteral("site.json"), R"({"title": "Folio"})");
    write_file(root, QStringLiteral("folio.yaml"),
               "data:\n"
               "  site: site.json\n"
               "ignore:\n"
               "  - drafts/**\n"
               "layout:\n"
               "  - pattern: '*.html'\n"
               "    layout: base.html\n");

    auto config = load_pipeline_config(root.filePath(QStringLiteral("folio.yaml")));
    REQUIRE(config.is_ok());
    auto pages = discover_pages(root.filePath(QStringLiteral("pages")));
    REQUIRE(pages.is_ok());

    pipeline::Transformer transformer(pipeline::Options{.source_dir = dir.path(), .log_level = LogLevel::Silent});
    apply_config(config.unwrap(), transformer);
    auto result = transformer.transform_pages(std::move(pages).unwrap());
    REQUIRE(result.is_ok());

    const auto& out = result.unwrap();
    REQUIRE(out[0].src() == QStringLiteral("drafts/wip.html"));
    REQUIRE(out[0].ignore);
    REQUIRE_FALSE(out[0].layout.has_value());
    REQUIRE(out[1].layout == QStringLiteral("base.html"));
    REQUIRE(out[1].data.value(QStringLiteral("site")).toMap().value(QStringLiteral("title")).toString() ==
            QStringLiteral("Folio"));
    REQUIRE(format_pages(out, OutputOptions{.include_ignored = false}) == QStringLiteral("index.html  [layout: base.html]\n"));
}

TEST_CASE("discovery logs nothing once the level is silent", "[integration][cli][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    write_file(QDir(dir.path()), QStringLiteral("index.html"), "home");

    captured_messages().clear();
    const auto previous = qInstallMessageHandler(capture_message);

    apply_log_level(LogLevel::Silent);
    REQUIRE(discover_pages(dir.path()).is_ok());
    const auto silent_count = captured_messages().size();

    apply_log_level(LogLevel::Debug);
    REQUIRE(discover_pages(dir.path()).is_ok());
    const auto debug_count = captured_messages().size();

    apply_log_level(LogLevel::Silent);
    qInstallMessageHandler(previous);

    REQUIRE(silent_count == 0);
    REQUIRE(debug_count > 0);
    REQUIRE(captured_messages().first().startsWith(QStringLiteral("folio.cli ")));
}
