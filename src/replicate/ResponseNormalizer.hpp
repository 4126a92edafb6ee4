#pragma once

#include "chat/Message.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace replicate
{

enum class JobStatus
{
    Starting,
    Processing,
    Succeeded,
    Failed,
    Canceled
};

std::optional<JobStatus> parseJobStatus(std::string_view status);
const char* jobStatusToString(JobStatus status);
bool isTerminal(JobStatus status);

class ResponseNormalizer
{
public:
    static constexpr const char* kCanceledMessage = "Prediction canceled";
    static constexpr const char* kFailedFallbackMessage = "Prediction failed";

    // Maps a terminal prediction payload to an assistant message or an error.
    // Pure function of the payload.
    static chat::ChatResult normalize(const nlohmann::json& payload);

    // Concatenates "output" fragments with no separator.
    static std::optional<std::string> joinOutput(const nlohmann::json& payload);

    // Provider-supplied reason for a failed or canceled prediction.
    static chat::ChatError remoteError(JobStatus status, const nlohmann::json& payload);
};

} // namespace replicate
