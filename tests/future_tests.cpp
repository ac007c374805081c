#include <stdexcept>
#include <string>
#include <thread>
#include <catch2/catch_test_macros.hpp>
#include "future.hpp"
#include "test_support.hpp"

TEST_CASE("Promise resolution is observed by its future", "[future]") {

    SECTION("Unresolved future has no value") {
        Promise<int> promise;
        Future<int> future = promise.futureResult();

        REQUIRE_FALSE(future.isFulfilled());
        REQUIRE(future.error() == nullptr);
        REQUIRE_THROWS_AS(future.value(), std::logic_error);
    }

    SECTION("Succeeded future carries the value") {
        Promise<std::string> promise;
        promise.succeed("done");

        Future<std::string> future = promise.futureResult();
        REQUIRE(future.isFulfilled());
        REQUIRE(future.isSucceeded());
        REQUIRE(future.value() == "done");
    }

    SECTION("Failed future rethrows the error") {
        Promise<int> promise;
        promise.fail(std::make_exception_ptr(std::runtime_error("boom")));

        Future<int> future = promise.futureResult();
        REQUIRE(future.isFailed());
        REQUIRE(future.error() != nullptr);
        REQUIRE_THROWS_AS(future.value(), std::runtime_error);
    }
}

TEST_CASE("Future callbacks", "[future]") {

    SECTION("Callbacks registered before and after resolution fire once each") {
        Promise<int> promise;
        Future<int> future = promise.futureResult();
        int early = 0;
        int late = 0;

        future.whenSuccess([&](const int& value) { early += value; });
        REQUIRE(early == 0);

        promise.succeed(5);
        REQUIRE(early == 5);

        future.whenSuccess([&](const int& value) { late += value; });
        REQUIRE(late == 5);
        REQUIRE(early == 5);
    }

    SECTION("Failure callbacks only fire on failure") {
        Promise<int> promise;
        bool succeeded = false;
        bool failed = false;
        promise.futureResult().whenSuccess([&](const int&) { succeeded = true; });
        promise.futureResult().whenFailure([&](std::exception_ptr) { failed = true; });

        promise.fail(std::make_exception_ptr(std::runtime_error("boom")));

        REQUIRE_FALSE(succeeded);
        REQUIRE(failed);
    }

    SECTION("Completion can be observed from another thread") {
        Promise<int> promise;
        Future<int> future = promise.futureResult();

        std::thread resolver([promise]() mutable { promise.succeed(42); });
        resolver.join();

        REQUIRE(future.isSucceeded());
        REQUIRE(future.value() == 42);
    }
}

TEST_CASE("Future composition", "[future]") {

    SECTION("map transforms the value") {
        Promise<int> promise;
        Future<std::string> mapped = promise.futureResult().map([](const int& value) {
            return std::to_string(value * 2);
        });

        promise.succeed(21);
        REQUIRE(mapped.value() == "42");
    }

    SECTION("map propagates the original failure") {
        Promise<int> promise;
        bool invoked = false;
        Future<int> mapped = promise.futureResult().map([&](const int& value) {
            invoked = true;
            return value;
        });

        promise.fail(std::make_exception_ptr(std::runtime_error("boom")));
        REQUIRE_FALSE(invoked);
        REQUIRE_THROWS_AS(mapped.value(), std::runtime_error);
    }

    SECTION("map turns a throwing transform into a failure") {
        Promise<int> promise;
        Future<int> mapped = promise.futureResult().map([](const int&) -> int {
            throw std::invalid_argument("bad value");
        });

        promise.succeed(1);
        REQUIRE_THROWS_AS(mapped.value(), std::invalid_argument);
    }

    SECTION("A throwing callback on the mapped future does not fail it twice") {
        Promise<int> promise;
        Future<int> mapped = promise.futureResult().map([](const int& value) { return value + 1; });
        mapped.whenSuccess([](const int&) { throw std::runtime_error("callback failed"); });

        REQUIRE_THROWS_AS(promise.succeed(1), std::runtime_error);
        REQUIRE(mapped.isSucceeded());
        REQUIRE(mapped.value() == 2);
    }

    SECTION("map to and from void") {
        Promise<int> promise;
        int seen = 0;
        Future<void> done = promise.futureResult().map([&](const int& value) { seen = value; });
        Future<std::string> text = done.map([](const Void&) { return std::string("finished"); });

        promise.succeed(3);
        REQUIRE(seen == 3);
        REQUIRE(done.isSucceeded());
        REQUIRE(text.value() == "finished");
    }

    SECTION("cascade forwards the result into another promise") {
        Promise<int> source;
        Promise<int> target;
        source.futureResult().cascade(target);

        source.succeed(7);
        REQUIRE(target.futureResult().value() == 7);
    }
}

TEST_CASE("Void promises", "[future]") {
    Promise<void> promise;
    Future<void> future = promise.futureResult();
    bool completed = false;
    future.whenSuccess([&](const Void&) { completed = true; });

    promise.succeed();
    REQUIRE(completed);
    REQUIRE(future.isSucceeded());
    REQUIRE_NOTHROW(future.value());
}

TEST_CASE("Resolving a promise twice is fatal", "[future][fatal]") {
    REQUIRE(terminatesFatally([] {
        Promise<int> promise;
        promise.succeed(1);
        promise.succeed(2);
    }));

    REQUIRE(terminatesFatally([] {
        Promise<int> promise;
        promise.succeed(1);
        promise.fail(std::make_exception_ptr(std::runtime_error("late")));
    }));
}
