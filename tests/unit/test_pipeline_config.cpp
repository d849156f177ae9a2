#include <catch2/catch_test_macros.hpp>
#include "cli/pipeline_config.hpp"
#include "data/yaml_value.hpp"
#include "pipeline/transformer.hpp"

using namespace folio;
using namespace folio::cli;

namespace {

QVariant yaml(const char* text) {
    auto parsed = data::yaml_to_variant(text);
    REQUIRE(parsed.is_ok());
    return parsed.unwrap();
}

Page dated(const QString& src, const QVariant& date) {
    auto page = create_page(src);
    if (date.isValid()) page.set(QStringLiteral("date"), date);
    return page;
}

QStringList sources(const PageList& pages) {
    QStringList out;
    for (const auto& page : pages) out.append(page.src());
    return out;
}

} // namespace

TEST_CASE("parse_pipeline_config reads every section", "[config]") {
    auto config = parse_pipeline_config(yaml(
        "data:\n"
        "  site: site.yaml\n"
        "ignore:\n"
        "  - drafts/**\n"
        "metadata:\n"
        "  - pattern: blog/**\n"
        "    values:\n"
        "      section: blog\n"
        "layout:\n"
        "  - pattern: '*.html'\n"
        "    layout: _layout.html:main\n"
        "queries:\n"
        "  - allPages\n"
        "  - name: posts\n"
        "    pattern: blog/**\n"
        "    sort_by: date\n"
        "    descending: true\n"));
    REQUIRE(config.is_ok());

    const auto& c = config.unwrap();
    REQUIRE(c.data.value(QStringLiteral("site")) == QStringLiteral("site.yaml"));
    REQUIRE(c.ignore == QStringList{QStringLiteral("drafts/**")});
    REQUIRE(c.metadata.size() == 1);
    REQUIRE(c.metadata[0].values.value(QStringLiteral("section")).toString() == QStringLiteral("blog"));
    REQUIRE(c.layout.size() == 1);
    REQUIRE(c.layout[0].layout == QStringLiteral("_layout.html:main"));
    REQUIRE(c.queries.size() == 2);
    REQUIRE(c.queries[0].name == QStringLiteral("allPages"));
    REQUIRE_FALSE(c.queries[0].pattern.has_value());
    REQUIRE(c.queries[1].sort_by == QStringLiteral("date"));
    REQUIRE(c.queries[1].descending);
}

TEST_CASE("parse_pipeline_config accepts an empty document", "[config]") {
    auto config = parse_pipeline_config(QVariant{});
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().queries.empty());
}

TEST_CASE("parse_pipeline_config rejects malformed sections", "[config]") {
    REQUIRE(parse_pipeline_config(yaml("- a\n- b\n")).is_err());

    auto unknown = parse_pipeline_config(yaml("plugins: []\n"));
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.unwrap_err().message == "config: 'plugins' is not a recognized section");

    auto not_list = parse_pipeline_config(yaml("ignore: drafts/**\n"));
    REQUIRE(not_list.is_err());
    REQUIRE(not_list.unwrap_err().message == "config: 'ignore' must be a sequence");

    auto missing_layout = parse_pipeline_config(yaml("layout:\n  - pattern: a\n"));
    REQUIRE(missing_layout.is_err());
    REQUIRE(missing_layout.unwrap_err().message == "config: 'layout[0].layout' must be a string");

    auto extra_key = parse_pipeline_config(yaml("metadata:\n  - pattern: a\n    values: {}\n    colour: red\n"));
    REQUIRE(extra_key.is_err());
    REQUIRE(extra_key.unwrap_err().message == "config: 'metadata[0].colour' is not a recognized key");

    auto repeated = parse_pipeline_config(yaml("queries:\n  - allPages\n  - allPages\n"));
    REQUIRE(repeated.is_err());
    REQUIRE(repeated.unwrap_err().message == "config: 'queries[1]' repeats query name allPages");
}

TEST_CASE("make_selector without pattern or sort selects everything", "[config]") {
    REQUIRE_FALSE(static_cast<bool>(make_selector(QueryRule{.name = QStringLiteral("all")})));
}

TEST_CASE("make_selector filters by pattern and keeps collection order", "[config]") {
    const auto select = make_selector(QueryRule{
        .name = QStringLiteral("posts"),
        .pattern = QStringLiteral("blog/**"),
    });
    const PageList pages{create_page(QStringLiteral("blog/b.html")), create_page(QStringLiteral("index.html")),
                         create_page(QStringLiteral("blog/a.html"))};

    REQUIRE(sources(select(pages)) == QStringList{QStringLiteral("blog/b.html"), QStringLiteral("blog/a.html")});
}

TEST_CASE("make_selector sorts by metadata with missing keys last", "[config]") {
    const PageList pages{
        dated(QStringLiteral("c"), QStringLiteral("2024-03-01")),
        dated(QStringLiteral("none"), QVariant{}),
        dated(QStringLiteral("a"), QStringLiteral("2024-01-01")),
        dated(QStringLiteral("b"), QStringLiteral("2024-02-01")),
    };

    const auto ascending = make_selector(QueryRule{.name = QStringLiteral("q"), .sort_by = QStringLiteral("date")});
    REQUIRE(sources(ascending(pages)) ==
            QStringList{QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c"), QStringLiteral("none")});

    const auto descending = make_selector(QueryRule{
        .name = QStringLiteral("q"), .sort_by = QStringLiteral("date"), .descending = true});
    REQUIRE(sources(descending(pages)) ==
            QStringList{QStringLiteral("c"), QStringLiteral("b"), QStringLiteral("a"), QStringLiteral("none")});
}

TEST_CASE("apply_config registers declared operations", "[config]") {
    auto config = parse_pipeline_config(yaml(
        "ignore:\n"
        "  - drafts/**\n"
        "layout:\n"
        "  - pattern: '**/*'\n"
        "    layout: base.html\n"
        "queries:\n"
        "  - allPages\n"));
    REQUIRE(config.is_ok());

    pipeline::Transformer transformer(pipeline::Options{.log_level = LogLevel::Silent});
    apply_config(config.unwrap(), transformer);
    REQUIRE(transformer.registry().size() == 3);

    auto result = transformer.transform_pages({create_page(QStringLiteral("index.html")),
                                               create_page(QStringLiteral("drafts/wip.html"))});
    REQUIRE(result.is_ok());

    const auto& pages = result.unwrap();
    REQUIRE_FALSE(pages[0].ignore);
    REQUIRE(pages[1].ignore);
    REQUIRE(pages[0].layout == QStringLiteral("base.html"));
    REQUIRE(pages[1].query(QStringLiteral("allPages")).size() == 2);
}

TEST_CASE("make_selector orders mixed sort keys numbers first, then strings", "[config]") {
    const PageList pages{
        dated(QStringLiteral("text-b"), QStringLiteral("b")),
        dated(QStringLiteral("ten"), 10),
        dated(QStringLiteral("none"), QVariant{}),
        dated(QStringLiteral("text-a"), QStringLiteral("a")),
        dated(QStringLiteral("half"), 2.5),
    };

    const auto ascending = make_selector(QueryRule{.name = QStringLiteral("q"), .sort_by = QStringLiteral("date")});
    REQUIRE(sources(ascending(pages)) == QStringList{QStringLiteral("half"), QStringLiteral("ten"),
                                                     QStringLiteral("text-a"), QStringLiteral("text-b"),
                                                     QStringLiteral("none")});

    const auto descending = make_selector(QueryRule{
        .name = QStringLiteral("q"), .sort_by = QStringLiteral("date"), .descending = true});
    REQUIRE(sources(descending(pages)) == QStringList{QStringLiteral("text-b"), QStringLiteral("text-a"),
                                                      QStringLiteral("ten"), QStringLiteral("half"),
                                                      QStringLiteral("none")});
}
