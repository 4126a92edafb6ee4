#include "PredictionBackend.hpp"

#include "ModelVersions.hpp"
#include "ResponseNormalizer.hpp"

#include <plog/Log.h>

namespace replicate
{

HttpPredictionBackend::HttpPredictionBackend()
    : HttpPredictionBackend(std::make_shared<utils::CprHttpClient>())
{
}

HttpPredictionBackend::HttpPredictionBackend(std::shared_ptr<utils::HttpClient> http)
    : http_(std::move(http))
    , submitter_(*http_)
    , poller_(*http_)
{
}

chat::Result<std::string> HttpPredictionBackend::submit(const ReplicateConfig& cfg, const RenderedPrompt& rendered,
                                                        std::atomic<bool>* cancel_flag)
{
    return submitter_.submit(cfg, rendered, cancel_flag);
}

chat::Result<nlohmann::json> HttpPredictionBackend::await(const ReplicateConfig& cfg, const std::string& job_id,
                                                          std::atomic<bool>* cancel_flag)
{
    return poller_.wait(cfg, job_id, cancel_flag);
}

chat::Result<std::string> HttpPredictionBackend::latestVersion(const ReplicateConfig& cfg,
                                                               const std::string& model_id)
{
    return fetch_latest_version(*http_, cfg, model_id);
}

chat::Result<std::shared_ptr<CannedPredictionBackend>> CannedPredictionBackend::create(nlohmann::json payload)
{
    using CreateResult = chat::Result<std::shared_ptr<CannedPredictionBackend>>;

    if (!payload.is_object() || !payload.contains("status") || !payload["status"].is_string())
    {
        return CreateResult::failure(chat::ErrorKind::Configuration,
                                     "canned prediction must be an object with a terminal 'status'");
    }

    const auto& status_text = payload["status"].get_ref<const std::string&>();
    const auto status = parseJobStatus(status_text);
    if (!status || !isTerminal(*status))
    {
        return CreateResult::failure(chat::ErrorKind::Configuration,
                                     "canned prediction status '" + status_text +
                                         "' is not one of succeeded, failed, canceled");
    }

    return CreateResult::success(
        std::shared_ptr<CannedPredictionBackend>(new CannedPredictionBackend(std::move(payload), *status)));
}

CannedPredictionBackend::CannedPredictionBackend(nlohmann::json payload, JobStatus status)
    : payload_(std::move(payload))
    , status_(status)
{
}

chat::Result<std::string> CannedPredictionBackend::submit(const ReplicateConfig&, const RenderedPrompt& rendered,
                                                          std::atomic<bool>*)
{
    PLOG_WARNING << "Found canned prediction response. Will not make live API call.";
    ++submissions_;
    last_prompt_ = rendered;
    return chat::Result<std::string>::success(kCannedJobId);
}

chat::Result<nlohmann::json> CannedPredictionBackend::await(const ReplicateConfig&, const std::string&,
                                                            std::atomic<bool>*)
{
    if (status_ == JobStatus::Succeeded)
        return chat::Result<nlohmann::json>::success(payload_);
    return chat::Result<nlohmann::json>::failure(ResponseNormalizer::remoteError(status_, payload_));
}

chat::Result<std::string> CannedPredictionBackend::latestVersion(const ReplicateConfig& cfg, const std::string&)
{
    if (cfg.version.empty())
        return chat::Result<std::string>::failure(chat::ErrorKind::Configuration, "version: can't be blank");
    return chat::Result<std::string>::success(cfg.version);
}

} // namespace replicate
