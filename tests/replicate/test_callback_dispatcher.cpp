#include <catch2/catch_test_macros.hpp>

#include "replicate/CallbackDispatcher.hpp"
#include "utils/ErrorReporter.hpp"

#include <stdexcept>

using namespace replicate;

TEST_CASE("Callback dispatch", "[replicate][callback]") {
    utils::ErrorReporter::ClearErrors();
    const auto message = chat::ChatResult::success(chat::Message::assistant("Hello Ben!"));

    SECTION("Observer receives the result once") {
        int calls = 0;
        chat::ChatResult seen;
        CallbackDispatcher::dispatch(message, [&](const chat::ChatResult& r) {
            ++calls;
            seen = r;
        });

        REQUIRE(calls == 1);
        REQUIRE(seen == message);
    }

    SECTION("Errors are delivered as-is") {
        const auto failure = chat::ChatResult::failure(chat::ErrorKind::RemoteJob, "Your input is too long.");
        chat::ChatResult seen;
        CallbackDispatcher::dispatch(failure, [&](const chat::ChatResult& r) { seen = r; });

        REQUIRE(seen == failure);
    }

    SECTION("Empty observer is a no-op") {
        REQUIRE_NOTHROW(CallbackDispatcher::dispatch(message, {}));
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("Observer exceptions are contained") {
        REQUIRE_NOTHROW(CallbackDispatcher::dispatch(
            message, [](const chat::ChatResult&) { throw std::runtime_error("observer exploded"); }));

        auto last = utils::ErrorReporter::GetLastError();
        REQUIRE(last.category == utils::ErrorCategory::Callback);
        REQUIRE(last.technical_details == "observer exploded");
    }

    SECTION("Non-standard exceptions are contained") {
        REQUIRE_NOTHROW(CallbackDispatcher::dispatch(message, [](const chat::ChatResult&) { throw 42; }));

        auto last = utils::ErrorReporter::GetLastError();
        REQUIRE(last.category == utils::ErrorCategory::Callback);
        REQUIRE(last.severity == utils::ErrorSeverity::Warning);
    }

    utils::ErrorReporter::ClearErrors();
}
