#include "ResponseNormalizer.hpp"

namespace replicate
{

std::optional<JobStatus> parseJobStatus(std::string_view status)
{
    if (status == "starting")
        return JobStatus::Starting;
    if (status == "processing")
        return JobStatus::Processing;
    if (status == "succeeded")
        return JobStatus::Succeeded;
    if (status == "failed")
        return JobStatus::Failed;
    if (status == "canceled")
        return JobStatus::Canceled;
    return std::nullopt;
}

const char* jobStatusToString(JobStatus status)
{
    switch (status)
    {
    case JobStatus::Starting:
        return "starting";
    case JobStatus::Processing:
        return "processing";
    case JobStatus::Succeeded:
        return "succeeded";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Canceled:
        return "canceled";
    }
    return "unknown";
}

bool isTerminal(JobStatus status)
{
    return status == JobStatus::Succeeded || status == JobStatus::Failed || status == JobStatus::Canceled;
}

std::optional<std::string> ResponseNormalizer::joinOutput(const nlohmann::json& payload)
{
    if (!payload.is_object() || !payload.contains("output"))
        return std::nullopt;

    const auto& output = payload["output"];
    if (output.is_string())
        return output.get<std::string>();
    if (!output.is_array())
        return std::nullopt;

    std::string joined;
    for (const auto& fragment : output)
    {
        if (!fragment.is_string())
            return std::nullopt;
        joined += fragment.get_ref<const std::string&>();
    }
    return joined;
}

chat::ChatError ResponseNormalizer::remoteError(JobStatus status, const nlohmann::json& payload)
{
    if (status == JobStatus::Canceled)
        return { chat::ErrorKind::RemoteJob, kCanceledMessage };

    if (payload.is_object() && payload.contains("error"))
    {
        const auto& error = payload["error"];
        if (error.is_string() && !error.get_ref<const std::string&>().empty())
            return { chat::ErrorKind::RemoteJob, error.get<std::string>() };
        if (!error.is_null() && !error.is_string())
            return { chat::ErrorKind::RemoteJob, error.dump() };
    }
    return { chat::ErrorKind::RemoteJob, kFailedFallbackMessage };
}

chat::ChatResult ResponseNormalizer::normalize(const nlohmann::json& payload)
{
    if (!payload.is_object() || !payload.contains("status") || !payload["status"].is_string())
        return chat::ChatResult::failure(chat::ErrorKind::MalformedResponse, "prediction payload is missing 'status'");

    const auto& status_text = payload["status"].get_ref<const std::string&>();
    const auto status = parseJobStatus(status_text);
    if (!status)
        return chat::ChatResult::failure(chat::ErrorKind::MalformedResponse,
                                         "unrecognized prediction status '" + status_text + "'");

    switch (*status)
    {
    case JobStatus::Succeeded:
    {
        auto content = joinOutput(payload);
        if (!content)
            return chat::ChatResult::failure(chat::ErrorKind::MalformedResponse,
                                             "succeeded prediction has no text 'output'");
        return chat::Message::create(chat::Role::Assistant, std::move(*content), chat::MessageStatus::Complete);
    }
    case JobStatus::Failed:
    case JobStatus::Canceled:
        return chat::ChatResult::failure(remoteError(*status, payload));
    case JobStatus::Starting:
    case JobStatus::Processing:
        break;
    }

    return chat::ChatResult::failure(chat::ErrorKind::MalformedResponse,
                                     std::string("prediction is not finished (status '") + status_text + "')");
}

} // namespace replicate
