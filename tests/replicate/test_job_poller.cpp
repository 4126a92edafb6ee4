#include <catch2/catch_test_macros.hpp>

#include "replicate/JobPoller.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/mock_http.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace replicate;
using namespace test_utils;
using std::chrono::milliseconds;

namespace {

constexpr const char* kStatusUrl = "https://api.replicate.com/v1/predictions/p1";

ReplicateConfig poll_config() {
    ReplicateConfig cfg;
    cfg.version = "ver-1";
    cfg.api_token = "r8_secret";
    return cfg;
}

} // namespace

TEST_CASE("Job polling", "[replicate][poller]") {
    utils::ErrorReporter::ClearErrors();
    MockHttpClient http;
    std::vector<milliseconds> sleeps;
    JobPoller poller(http, [&](milliseconds d) { sleeps.push_back(d); });
    auto cfg = poll_config();

    REQUIRE(poller.state() == PollState::Pending);

    SECTION("Waits through non-terminal states with exponential backoff") {
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "starting"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_succeeded("p1", { "Hello", " Ben!" }));

        auto result = poller.wait(cfg, "p1");
        REQUIRE(result.ok());
        REQUIRE((*result.value)["status"] == "succeeded");
        REQUIRE(poller.state() == PollState::Succeeded);
        REQUIRE(poller.attempts() == 5);
        REQUIRE(http.countRequests("GET") == 5);
        REQUIRE(sleeps == std::vector<milliseconds>{ milliseconds(250), milliseconds(500), milliseconds(1000),
                                                     milliseconds(2000) });
        REQUIRE(http.requests().front().header("Authorization") == "Bearer r8_secret");
    }

    SECTION("Backoff is capped at the max interval") {
        cfg.poll.initial_interval_ms = 1000;
        cfg.poll.max_interval_ms = 1500;
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_succeeded("p1", { "ok" }));

        REQUIRE(poller.wait(cfg, "p1").ok());
        REQUIRE(sleeps == std::vector<milliseconds>{ milliseconds(1000), milliseconds(1500), milliseconds(1500) });
    }

    SECTION("Already finished job is fetched once") {
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_succeeded("p1", { "done" }));

        REQUIRE(poller.wait(cfg, "p1").ok());
        REQUIRE(poller.attempts() == 1);
        REQUIRE(sleeps.empty());
    }

    SECTION("Failed job stops polling") {
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_failed("p1", "Your input is too long."));

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(*result.error == chat::ChatError{ chat::ErrorKind::RemoteJob, "Your input is too long." });
        REQUIRE(poller.state() == PollState::Failed);
        REQUIRE(http.countRequests("GET") == 2);
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::RemoteJob);
    }

    SECTION("Canceled job stops polling") {
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_canceled("p1"));

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::RemoteJob);
        REQUIRE(result.error->message == "Prediction canceled");
        REQUIRE(poller.state() == PollState::Canceled);
    }

    SECTION("Attempt budget is enforced") {
        cfg.poll.max_attempts = 3;
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::PollTimeout);
        REQUIRE(result.error->message == "prediction p1 still processing after 3 status checks");
        REQUIRE(http.countRequests("GET") == 3);
        REQUIRE(poller.state() == PollState::InFlight);
    }

    SECTION("Wall-clock deadline is enforced") {
        cfg.poll.max_duration_ms = 5;
        poller.setSleepFunction([](milliseconds d) { std::this_thread::sleep_for(d); });
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "starting"));

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::PollTimeout);
        REQUIRE(result.error->message == "prediction p1 still starting after 5 ms");
    }

    SECTION("Raised cancel flag stops before the first request") {
        std::atomic<bool> cancel{ true };

        auto result = poller.wait(cfg, "p1", &cancel);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::Cancelled);
        REQUIRE(http.requests().empty());
    }

    SECTION("Cancel flag raised while waiting") {
        std::atomic<bool> cancel{ false };
        poller.setSleepFunction([&](milliseconds) { cancel.store(true); });
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));

        auto result = poller.wait(cfg, "p1", &cancel);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::Cancelled);
        REQUIRE(result.error->message == "polling cancelled for prediction p1");
        REQUIRE(http.countRequests("GET") == 1);
    }

    SECTION("Unknown status is malformed") {
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "queued"));

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::MalformedResponse);
        REQUIRE(result.error->message == "unrecognized prediction status 'queued'");
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Protocol);
    }

    SECTION("Missing status is malformed") {
        MockResponse no_status;
        no_status.body = R"({"id":"p1"})";
        http.queueResponse("GET", kStatusUrl, no_status);

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::MalformedResponse);
    }

    SECTION("Transport failure is not retried") {
        http.queueResponse("GET", kStatusUrl, MockResponses::timeout_error());

        auto result = poller.wait(cfg, "p1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::Transport);
        REQUIRE(result.error->message == "Request timeout: Request timeout");
        REQUIRE(http.countRequests("GET") == 1);
    }

    SECTION("Job ids are escaped in the status URL") {
        http.queueResponse("GET", "https://api.replicate.com/v1/predictions/a%20b",
                           MockResponses::prediction_succeeded("a b", { "ok" }));

        REQUIRE(poller.wait(cfg, "a b").ok());
    }

    SECTION("Job id cannot leave the predictions path") {
        http.queueResponse("GET", "https://api.replicate.com/v1/predictions/..%2Fmodels%2Fx",
                           MockResponses::prediction_succeeded("x", { "ok" }));

        REQUIRE(poller.wait(cfg, "../models/x").ok());
        REQUIRE(http.requests().front().url == "https://api.replicate.com/v1/predictions/..%2Fmodels%2Fx");
    }

    SECTION("Zero initial interval still backs off") {
        cfg.poll.initial_interval_ms = 0;
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_status("p1", "processing"));
        http.queueResponse("GET", kStatusUrl, MockResponses::prediction_succeeded("p1", { "ok" }));

        REQUIRE(poller.wait(cfg, "p1").ok());
        REQUIRE(sleeps == std::vector<milliseconds>{ milliseconds(1), milliseconds(2) });
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Poll state names", "[replicate][poller]") {
    REQUIRE(std::string(pollStateToString(PollState::InFlight)) == "in-flight");
    REQUIRE(std::string(pollStateToString(PollState::Succeeded)) == "succeeded");
}
