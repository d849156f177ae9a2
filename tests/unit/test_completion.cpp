#include <catch2/catch_test_macros.hpp>
#include "core/completion.hpp"
#include "core/failure.hpp"

#include <QTimer>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace folio;

TEST_CASE("Failure keeps the raised value unchanged", "[failure]") {
    const auto failure = Failure::raised(std::make_exception_ptr(std::string("D'oh")));

    REQUIRE(failure.origin() == Failure::Origin::Handler);
    REQUIRE(failure.is_raised());
    REQUIRE(failure.raised_as<std::string>() == std::string("D'oh"));
    REQUIRE_FALSE(failure.raised_as<int>().has_value());
    REQUIRE(failure.describe() == QStringLiteral("handler failed: D'oh"));
    REQUIRE_THROWS_AS(failure.rethrow(), std::string);
}

TEST_CASE("Failure matches raised exceptions by base class", "[failure]") {
    const auto failure = Failure::raised(std::make_exception_ptr(std::runtime_error("boom")));

    const auto as_base = failure.raised_as<std::exception>();
    REQUIRE(as_base.has_value());
    REQUIRE(failure.describe() == QStringLiteral("handler failed: boom"));
}

TEST_CASE("Failure from a structured error", "[failure]") {
    const auto failure = Failure::from_error(Failure::Origin::DataLoad, Error{"Data file not found: x.json"});

    REQUIRE(failure.is_error());
    REQUIRE(failure.error().message == "Data file not found: x.json");
    REQUIRE(failure.exception() == nullptr);
    REQUIRE(failure.describe() == QStringLiteral("data load failed: Data file not found: x.json"));
    REQUIRE_THROWS_AS(failure.rethrow(), std::runtime_error);
}

TEST_CASE("Failure::raised without a value is a contract failure", "[failure]") {
    const auto failure = Failure::raised(nullptr);

    REQUIRE(failure.origin() == Failure::Origin::Contract);
    REQUIRE(failure.is_error());
}

TEST_CASE("Completion settles with the first value", "[completion]") {
    auto completion = Completion<int>::make(QStringLiteral("first"));
    REQUIRE_FALSE(completion.pending.ready());

    completion.done(1);
    completion.done(2);

    REQUIRE(completion.pending.ready());
    auto outcome = completion.pending.wait();
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.unwrap() == 1);
}

TEST_CASE("Completion ignores a failure after a value", "[completion]") {
    auto completion = Completion<int>::make(QStringLiteral("late failure"));

    completion.done(7);
    completion.done.fail(std::string("too late"));

    auto outcome = completion.pending.wait();
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.unwrap() == 7);
}

TEST_CASE("Completion carries any failure value", "[completion]") {
    auto completion = Completion<int>::make(QStringLiteral("fails"));
    completion.done.fail(42);

    auto outcome = completion.pending.wait();
    REQUIRE(outcome.is_err());
    REQUIRE(outcome.unwrap_err().raised_as<int>() == 42);
}

TEST_CASE("Dropping every Done copy settles a contract failure", "[completion]") {
    auto completion = Completion<int>::make(QStringLiteral("forgotten"));
    auto pending = completion.pending;
    {
        auto done = std::move(completion.done);
        auto copy = done;
    }

    REQUIRE(pending.ready());
    auto outcome = pending.wait();
    REQUIRE(outcome.is_err());
    REQUIRE(outcome.unwrap_err().origin() == Failure::Origin::Contract);
}

TEST_CASE("invoke_async turns a throw into the failure", "[completion]") {
    auto outcome = invoke_async<int>(QStringLiteral("throws"), [](const Done<int>&) {
        throw std::string("D'oh");
    }).wait();

    REQUIRE(outcome.is_err());
    REQUIRE(outcome.unwrap_err().raised_as<std::string>() == std::string("D'oh"));
}

TEST_CASE("invoke_async waits for a deferred completion on the event loop", "[completion]") {
    auto outcome = invoke_async<QString>(QStringLiteral("deferred"), [](const Done<QString>& done) {
        QTimer::singleShot(0, [done] { done(QStringLiteral("later")); });
    }).wait();

    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.unwrap() == QStringLiteral("later"));
}

TEST_CASE("invoke_async waits for a completion from another thread", "[completion]") {
    std::thread worker;
    auto pending = invoke_async<int>(QStringLiteral("threaded"), [&worker](const Done<int>& done) {
        worker = std::thread([done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            done(99);
        });
    });

    auto outcome = pending.wait();
    worker.join();

    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.unwrap() == 99);
}

TEST_CASE("invoke_async reports a handler that never keeps its Done", "[completion]") {
    auto outcome = invoke_async<int>(QStringLiteral("ignores done"), [](const Done<int>&) {}).wait();

    REQUIRE(outcome.is_err());
    REQUIRE(outcome.unwrap_err().origin() == Failure::Origin::Contract);
}
