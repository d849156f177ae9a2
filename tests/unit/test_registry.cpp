#include <catch2/catch_test_macros.hpp>
#include "pipeline/operations.hpp"

using namespace folio;
using namespace folio::pipeline;

TEST_CASE("Registry returns operations of one kind in registration order", "[registry]") {
    Registry registry;
    REQUIRE(registry.size() == 0);

    registry.add(LayoutOp{Glob(QStringLiteral("*.html")), QStringLiteral("first")});
    registry.add(IgnoreOp{Glob(QStringLiteral("drafts/**"))});
    registry.add(LayoutOp{Glob(QStringLiteral("index.html")), QStringLiteral("second")});

    REQUIRE(registry.size() == 3);

    const auto layouts = registry.of_kind<LayoutOp>();
    REQUIRE(layouts.size() == 2);
    REQUIRE(layouts[0]->layout == QStringLiteral("first"));
    REQUIRE(layouts[1]->layout == QStringLiteral("second"));

    REQUIRE(registry.of_kind<IgnoreOp>().size() == 1);
    REQUIRE(registry.of_kind<GenerateOp>().empty());
}

TEST_CASE("Registry keeps sync and async transforms interleaved", "[registry]") {
    Registry registry;
    registry.add(TransformOp{Glob(QStringLiteral("**/*")), TransformFn([](Page p) { return p; })});
    registry.add(TransformOp{Glob(QStringLiteral("**/*")), TransformAsyncFn([](Page p, Done<Page> done) { done(std::move(p)); })});
    registry.add(TransformOp{Glob(QStringLiteral("**/*")), TransformFn([](Page p) { return p; })});

    const auto transforms = registry.of_kind<TransformOp>();
    REQUIRE(transforms.size() == 3);
    REQUIRE(std::holds_alternative<TransformFn>(transforms[0]->handler));
    REQUIRE(std::holds_alternative<TransformAsyncFn>(transforms[1]->handler));
    REQUIRE(std::holds_alternative<TransformFn>(transforms[2]->handler));
}
