#pragma once

#include "JobPoller.hpp"
#include "JobSubmitter.hpp"
#include "PromptRenderer.hpp"
#include "ReplicateConfig.hpp"
#include "chat/ChatResult.hpp"
#include "utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace replicate
{

// Submit/await pair used by ChatReplicate. Swapped out in tests and for canned responses.
class IPredictionBackend
{
public:
    virtual ~IPredictionBackend() = default;

    virtual const char* name() const = 0;

    virtual chat::Result<std::string> submit(const ReplicateConfig& cfg, const RenderedPrompt& rendered,
                                             std::atomic<bool>* cancel_flag) = 0;

    // Succeeded payload, or the error of a failed/canceled/unobservable job.
    virtual chat::Result<nlohmann::json> await(const ReplicateConfig& cfg, const std::string& job_id,
                                               std::atomic<bool>* cancel_flag) = 0;

    virtual chat::Result<std::string> latestVersion(const ReplicateConfig& cfg, const std::string& model_id) = 0;
};

class HttpPredictionBackend : public IPredictionBackend
{
public:
    // Uses cpr for transport.
    HttpPredictionBackend();

    explicit HttpPredictionBackend(std::shared_ptr<utils::HttpClient> http);

    const char* name() const override { return "http"; }

    chat::Result<std::string> submit(const ReplicateConfig& cfg, const RenderedPrompt& rendered,
                                     std::atomic<bool>* cancel_flag) override;

    chat::Result<nlohmann::json> await(const ReplicateConfig& cfg, const std::string& job_id,
                                       std::atomic<bool>* cancel_flag) override;

    chat::Result<std::string> latestVersion(const ReplicateConfig& cfg, const std::string& model_id) override;

    const JobPoller& poller() const { return poller_; }

    void setSleepFunction(JobPoller::SleepFn sleep) { poller_.setSleepFunction(std::move(sleep)); }

private:
    std::shared_ptr<utils::HttpClient> http_;
    JobSubmitter submitter_;
    JobPoller poller_;
};

/**
 * @brief Serves a preset terminal prediction instead of calling the API
 *
 * The payload must be a prediction object whose status is succeeded, failed
 * or canceled. Normalization and observer dispatch run exactly as for a live
 * prediction.
 */
class CannedPredictionBackend : public IPredictionBackend
{
public:
    static constexpr const char* kCannedJobId = "canned-prediction";

    static chat::Result<std::shared_ptr<CannedPredictionBackend>> create(nlohmann::json payload);

    const char* name() const override { return "canned"; }

    chat::Result<std::string> submit(const ReplicateConfig& cfg, const RenderedPrompt& rendered,
                                     std::atomic<bool>* cancel_flag) override;

    chat::Result<nlohmann::json> await(const ReplicateConfig& cfg, const std::string& job_id,
                                       std::atomic<bool>* cancel_flag) override;

    chat::Result<std::string> latestVersion(const ReplicateConfig& cfg, const std::string& model_id) override;

    int submissions() const { return submissions_; }

    const RenderedPrompt& lastPrompt() const { return last_prompt_; }

private:
    CannedPredictionBackend(nlohmann::json payload, JobStatus status);

    nlohmann::json payload_;
    JobStatus status_;
    int submissions_ = 0;
    RenderedPrompt last_prompt_;
};

} // namespace replicate
