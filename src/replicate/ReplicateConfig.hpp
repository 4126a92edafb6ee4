#pragma once

#include "chat/ChatResult.hpp"
#include "chat/Message.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace replicate
{

// Backoff and deadline applied while waiting on a prediction.
struct PollPolicy
{
    static constexpr std::int64_t kMaxDurationLimitMs = 24 * 60 * 60 * 1000;

    int initial_interval_ms = 250;
    int max_interval_ms = 5000;
    double backoff_multiplier = 2.0;
    std::int64_t max_duration_ms = 600000; // overall wall-clock budget for one job
    int max_attempts = 0;                  // 0 = no attempt limit
};

struct ReplicateConfig
{
    static constexpr const char* kDefaultEndpoint = "https://api.replicate.com/v1/";
    static constexpr const char* kDefaultModel = "meta/llama-2-7b-chat";
    static constexpr const char* kTokenEnvVar = "REPLICATE_API_TOKEN";
    static constexpr int kDefaultReceiveTimeoutMs = 30000;

    std::string endpoint = kDefaultEndpoint;
    std::string model = kDefaultModel;
    // All Replicate-hosted models are addressed by a specific version id.
    std::string version;
    std::string api_token;

    double temperature = 1.0;
    double top_p = 0.9;
    int top_k = 50;
    int receive_timeout_ms = kDefaultReceiveTimeoutMs;
    // Replicate only streams to a caller-provided webhook; unsupported here.
    bool stream = false;

    PollPolicy poll;

    std::vector<chat::FieldError> validate() const;

    // Token from the config, or from REPLICATE_API_TOKEN when unset.
    std::string resolveApiToken() const;

    static chat::Result<ReplicateConfig> create(ReplicateConfig draft);

    // Applies keys found in a [replicate] table on top of the defaults. Only wrongly
    // typed keys fail here; range and required-field checks happen in create().
    static chat::Result<ReplicateConfig> fromToml(const toml::table& section);
};

} // namespace replicate
