#include "ReplicateConfig.hpp"

#include <cstdlib>
#include <limits>
#include <optional>

namespace replicate
{

namespace
{

template <typename T>
void read_key(const toml::table& section, const char* key, T& out, std::vector<chat::FieldError>& errors,
              const std::string& prefix = {})
{
    const toml::node* node = section.get(key);
    if (!node)
        return;
    if (auto v = node->value<T>())
        out = *v;
    else
        errors.push_back({ prefix + key, "is invalid" });
}

void read_int(const toml::table& section, const char* key, int& out, std::vector<chat::FieldError>& errors,
              const std::string& prefix = {})
{
    std::int64_t wide = out;
    read_key(section, key, wide, errors, prefix);
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max())
    {
        errors.push_back({ prefix + key, "is out of range" });
        return;
    }
    out = static_cast<int>(wide);
}

} // namespace

std::vector<chat::FieldError> ReplicateConfig::validate() const
{
    std::vector<chat::FieldError> errors;

    if (endpoint.empty())
        errors.push_back({ "endpoint", "can't be blank" });
    if (model.empty())
        errors.push_back({ "model", "can't be blank" });
    if (version.empty())
        errors.push_back({ "version", "can't be blank" });

    if (!(temperature >= 0.0 && temperature <= 2.0))
        errors.push_back({ "temperature", "must be between 0 and 2" });
    if (!(top_p >= 0.0 && top_p <= 1.0))
        errors.push_back({ "top_p", "must be between 0 and 1" });
    if (top_k < 1 || top_k > 1000)
        errors.push_back({ "top_k", "must be between 1 and 1000" });
    if (receive_timeout_ms < 0)
        errors.push_back({ "receive_timeout", "must be greater than or equal to 0" });

    if (stream)
        errors.push_back({ "stream", "streaming is currently unsupported for Replicate" });

    if (poll.initial_interval_ms <= 0)
        errors.push_back({ "poll.initial_interval_ms", "must be greater than 0" });
    if (poll.max_interval_ms < poll.initial_interval_ms)
        errors.push_back({ "poll.max_interval_ms", "must be greater than or equal to poll.initial_interval_ms" });
    if (!(poll.backoff_multiplier >= 1.0))
        errors.push_back({ "poll.backoff_multiplier", "must be greater than or equal to 1" });
    if (poll.max_duration_ms <= 0)
        errors.push_back({ "poll.max_duration_ms", "must be greater than 0" });
    else if (poll.max_duration_ms > PollPolicy::kMaxDurationLimitMs)
        errors.push_back({ "poll.max_duration_ms", "must be less than or equal to 86400000" });
    if (poll.max_attempts < 0)
        errors.push_back({ "poll.max_attempts", "must be greater than or equal to 0" });

    return errors;
}

std::string ReplicateConfig::resolveApiToken() const
{
    if (!api_token.empty())
        return api_token;
    if (const char* env = std::getenv(kTokenEnvVar))
        return env;
    return {};
}

chat::Result<ReplicateConfig> ReplicateConfig::create(ReplicateConfig draft)
{
    const auto errors = draft.validate();
    if (!errors.empty())
        return chat::Result<ReplicateConfig>::failure(chat::ErrorKind::Configuration, chat::formatFieldErrors(errors));
    return chat::Result<ReplicateConfig>::success(std::move(draft));
}

chat::Result<ReplicateConfig> ReplicateConfig::fromToml(const toml::table& section)
{
    ReplicateConfig cfg;
    std::vector<chat::FieldError> errors;

    read_key(section, "endpoint", cfg.endpoint, errors);
    read_key(section, "model", cfg.model, errors);
    read_key(section, "version", cfg.version, errors);
    read_key(section, "api_token", cfg.api_token, errors);
    read_key(section, "temperature", cfg.temperature, errors);
    read_key(section, "top_p", cfg.top_p, errors);
    read_int(section, "top_k", cfg.top_k, errors);
    read_int(section, "receive_timeout", cfg.receive_timeout_ms, errors);
    read_key(section, "stream", cfg.stream, errors);

    if (const toml::node* poll_node = section.get("poll"))
    {
        if (const toml::table* poll = poll_node->as_table())
        {
            const std::string prefix = "poll.";
            read_int(*poll, "initial_interval_ms", cfg.poll.initial_interval_ms, errors, prefix);
            read_int(*poll, "max_interval_ms", cfg.poll.max_interval_ms, errors, prefix);
            read_key(*poll, "backoff_multiplier", cfg.poll.backoff_multiplier, errors, prefix);
            read_key(*poll, "max_duration_ms", cfg.poll.max_duration_ms, errors, prefix);
            read_int(*poll, "max_attempts", cfg.poll.max_attempts, errors, prefix);
        }
        else
        {
            errors.push_back({ "poll", "is invalid" });
        }
    }

    if (!errors.empty())
        return chat::Result<ReplicateConfig>::failure(chat::ErrorKind::Configuration, chat::formatFieldErrors(errors));

    return chat::Result<ReplicateConfig>::success(std::move(cfg));
}

} // namespace replicate
