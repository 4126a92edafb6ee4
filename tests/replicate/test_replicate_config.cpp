#include <catch2/catch_test_macros.hpp>

#include "replicate/ReplicateConfig.hpp"

#include <cstdlib>

using namespace replicate;

namespace {

ReplicateConfig valid_config() {
    ReplicateConfig cfg;
    cfg.version = "13c3cdee13ee059ab779f0291d29054dab00a47dad8261375654de5540165fb0";
    cfg.api_token = "r8_test";
    return cfg;
}

} // namespace

TEST_CASE("ReplicateConfig validation", "[replicate][config]") {

    SECTION("Defaults plus a version are valid") {
        auto result = ReplicateConfig::create(valid_config());
        REQUIRE(result.ok());
        REQUIRE(result.value->endpoint == "https://api.replicate.com/v1/");
        REQUIRE(result.value->model == "meta/llama-2-7b-chat");
        REQUIRE(result.value->temperature == 1.0);
        REQUIRE(result.value->top_p == 0.9);
        REQUIRE(result.value->top_k == 50);
        REQUIRE(result.value->receive_timeout_ms == 30000);
        REQUIRE_FALSE(result.value->stream);
    }

    SECTION("Version is required") {
        auto result = ReplicateConfig::create(ReplicateConfig{});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::Configuration);
        REQUIRE(result.error->message == "version: can't be blank");
    }

    SECTION("Streaming is rejected") {
        auto cfg = valid_config();
        cfg.stream = true;
        auto result = ReplicateConfig::create(cfg);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->message == "stream: streaming is currently unsupported for Replicate");
    }

    SECTION("Sampling parameters are range checked") {
        auto cfg = valid_config();
        cfg.temperature = 2.5;
        cfg.top_p = -0.1;
        cfg.top_k = 0;
        auto result = ReplicateConfig::create(cfg);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->message ==
                "temperature: must be between 0 and 2, top_p: must be between 0 and 1, "
                "top_k: must be between 1 and 1000");
    }

    SECTION("Boundary values are accepted") {
        auto cfg = valid_config();
        cfg.temperature = 0.0;
        cfg.top_p = 1.0;
        cfg.top_k = 1000;
        cfg.receive_timeout_ms = 0;
        REQUIRE(ReplicateConfig::create(cfg).ok());
    }

    SECTION("Negative receive timeout is rejected") {
        auto cfg = valid_config();
        cfg.receive_timeout_ms = -1;
        auto errors = cfg.validate();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].field == "receive_timeout");
    }

    SECTION("Poll policy is checked") {
        auto cfg = valid_config();
        cfg.poll.initial_interval_ms = 1000;
        cfg.poll.max_interval_ms = 500;
        cfg.poll.backoff_multiplier = 0.5;
        cfg.poll.max_duration_ms = 0;
        cfg.poll.max_attempts = -2;
        auto errors = cfg.validate();
        REQUIRE(errors.size() == 4);
        REQUIRE(errors[0].field == "poll.max_interval_ms");
        REQUIRE(errors[1].field == "poll.backoff_multiplier");
        REQUIRE(errors[2].field == "poll.max_duration_ms");
        REQUIRE(errors[3].field == "poll.max_attempts");
    }

    SECTION("Zero initial poll interval is rejected") {
        auto cfg = valid_config();
        cfg.poll.initial_interval_ms = 0;
        auto result = ReplicateConfig::create(cfg);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->message == "poll.initial_interval_ms: must be greater than 0");
    }

    SECTION("Poll duration is capped at one day") {
        auto cfg = valid_config();
        cfg.poll.max_duration_ms = PollPolicy::kMaxDurationLimitMs;
        REQUIRE(ReplicateConfig::create(cfg).ok());

        cfg.poll.max_duration_ms = 10000000000000000;
        auto result = ReplicateConfig::create(cfg);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->message == "poll.max_duration_ms: must be less than or equal to 86400000");
    }
}

TEST_CASE("ReplicateConfig from TOML", "[replicate][config]") {

    SECTION("Applies keys over defaults") {
        toml::table section = toml::parse(R"(
            version = "abc123"
            model = "meta/llama-2-70b-chat"
            temperature = 0.75
            top_k = 10
            receive_timeout = 15000

            [poll]
            initial_interval_ms = 100
            max_attempts = 20
        )");

        auto result = ReplicateConfig::fromToml(section);
        REQUIRE(result.ok());
        const auto& cfg = *result.value;
        REQUIRE(cfg.version == "abc123");
        REQUIRE(cfg.model == "meta/llama-2-70b-chat");
        REQUIRE(cfg.temperature == 0.75);
        REQUIRE(cfg.top_p == 0.9);
        REQUIRE(cfg.top_k == 10);
        REQUIRE(cfg.receive_timeout_ms == 15000);
        REQUIRE(cfg.poll.initial_interval_ms == 100);
        REQUIRE(cfg.poll.max_interval_ms == 5000);
        REQUIRE(cfg.poll.max_attempts == 20);
    }

    SECTION("Integer temperature is accepted") {
        toml::table section = toml::parse("temperature = 1");
        auto result = ReplicateConfig::fromToml(section);
        REQUIRE(result.ok());
        REQUIRE(result.value->temperature == 1.0);
    }

    SECTION("Wrongly typed keys fail") {
        toml::table section = toml::parse(R"(
            top_k = "ten"
            stream = "yes"
            poll = 5
        )");
        auto result = ReplicateConfig::fromToml(section);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == chat::ErrorKind::Configuration);
        REQUIRE(result.error->message == "top_k: is invalid, stream: is invalid, poll: is invalid");
    }

    SECTION("Missing version is left for create() to reject") {
        toml::table section = toml::parse("stream = true");
        auto result = ReplicateConfig::fromToml(section);
        REQUIRE(result.ok());
        REQUIRE(result.value->stream);
        REQUIRE_FALSE(ReplicateConfig::create(*result.value).ok());
    }

    SECTION("Huge poll duration loads but fails validation") {
        toml::table section = toml::parse("version = \"v\"\n[poll]\nmax_duration_ms = 10000000000000000\n");
        auto result = ReplicateConfig::fromToml(section);
        REQUIRE(result.ok());
        REQUIRE_FALSE(ReplicateConfig::create(*result.value).ok());
    }

    SECTION("Out of range integers fail") {
        toml::table section = toml::parse("top_k = 99999999999");
        auto result = ReplicateConfig::fromToml(section);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->message == "top_k: is out of range");
    }
}

TEST_CASE("API token resolution", "[replicate][config]") {
    ReplicateConfig cfg;

    SECTION("Configured token wins") {
        cfg.api_token = "r8_configured";
        REQUIRE(cfg.resolveApiToken() == "r8_configured");
    }

#ifndef _WIN32
    SECTION("Falls back to the environment") {
        ::setenv(ReplicateConfig::kTokenEnvVar, "r8_from_env", 1);
        REQUIRE(cfg.resolveApiToken() == "r8_from_env");
        ::unsetenv(ReplicateConfig::kTokenEnvVar);
        REQUIRE(cfg.resolveApiToken().empty());
    }
#endif
}
