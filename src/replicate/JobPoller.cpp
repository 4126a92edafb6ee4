#include "JobPoller.hpp"

#include "JobSubmitter.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <thread>

namespace replicate
{

namespace
{

bool is_cancelled(const std::atomic<bool>* flag)
{
    return flag && flag->load(std::memory_order_relaxed);
}

} // namespace

const char* pollStateToString(PollState state)
{
    switch (state)
    {
    case PollState::Pending:
        return "pending";
    case PollState::InFlight:
        return "in-flight";
    case PollState::Succeeded:
        return "succeeded";
    case PollState::Failed:
        return "failed";
    case PollState::Canceled:
        return "canceled";
    }
    return "unknown";
}

JobPoller::JobPoller(utils::HttpClient& http, SleepFn sleep)
    : http_(http)
    , sleep_(std::move(sleep))
{
}

chat::Result<nlohmann::json> JobPoller::wait(const ReplicateConfig& cfg, const std::string& job_id,
                                             std::atomic<bool>* cancel_flag)
{
    using JsonResult = chat::Result<nlohmann::json>;

    state_ = PollState::Pending;
    attempts_ = 0;

    const auto& policy = cfg.poll;
    const auto started = std::chrono::steady_clock::now();
    const auto budget_ms = std::clamp<std::int64_t>(policy.max_duration_ms, 0, PollPolicy::kMaxDurationLimitMs);
    const auto deadline = started + std::chrono::milliseconds(budget_ms);
    const auto url = utils::join_url(cfg.endpoint, "predictions/" + utils::url_escape_segment(job_id));

    double interval_ms = static_cast<double>(std::max(policy.initial_interval_ms, 1));
    std::string last_status = "pending";

    while (true)
    {
        if (is_cancelled(cancel_flag))
            return JsonResult::failure(chat::ErrorKind::Cancelled, "polling cancelled for prediction " + job_id);

        if (policy.max_attempts > 0 && attempts_ >= policy.max_attempts)
        {
            return JsonResult::failure(chat::ErrorKind::PollTimeout,
                                       "prediction " + job_id + " still " + last_status + " after " +
                                           std::to_string(attempts_) + " status checks");
        }

        if (std::chrono::steady_clock::now() >= deadline)
        {
            return JsonResult::failure(chat::ErrorKind::PollTimeout,
                                       "prediction " + job_id + " still " + last_status + " after " +
                                           std::to_string(budget_ms) + " ms");
        }

        ++attempts_;
        auto fetched = fetchStatus(cfg, url, cancel_flag);
        if (!fetched)
        {
            if (is_cancelled(cancel_flag))
                return JsonResult::failure(chat::ErrorKind::Cancelled, "polling cancelled for prediction " + job_id);
            return fetched;
        }

        const auto& payload = *fetched.value;
        const auto& status_text = payload["status"].get_ref<const std::string&>();
        const auto status = parseJobStatus(status_text);
        if (!status)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Protocol, "Unrecognized prediction status",
                                                job_id + ": " + status_text);
            return JsonResult::failure(chat::ErrorKind::MalformedResponse,
                                       "unrecognized prediction status '" + status_text + "'");
        }

        switch (*status)
        {
        case JobStatus::Succeeded:
            state_ = PollState::Succeeded;
            PLOG_INFO << "Replicate prediction " << job_id << " succeeded after " << attempts_ << " status checks";
            return fetched;
        case JobStatus::Failed:
        {
            state_ = PollState::Failed;
            auto error = ResponseNormalizer::remoteError(*status, payload);
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::RemoteJob, "Prediction failed",
                                                job_id + ": " + error.message);
            return JsonResult::failure(std::move(error));
        }
        case JobStatus::Canceled:
        {
            state_ = PollState::Canceled;
            PLOG_WARNING << "Replicate prediction " << job_id << " was canceled";
            return JsonResult::failure(ResponseNormalizer::remoteError(*status, payload));
        }
        case JobStatus::Starting:
        case JobStatus::Processing:
            break;
        }

        if (state_ != PollState::InFlight)
            PLOG_DEBUG << "prediction " << job_id << " is " << status_text;
        state_ = PollState::InFlight;
        last_status = status_text;

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const auto delay = std::min(std::chrono::milliseconds(static_cast<std::int64_t>(interval_ms)), remaining);
        if (delay.count() > 0)
            pause(delay, cancel_flag);

        interval_ms = std::min(interval_ms * policy.backoff_multiplier, static_cast<double>(policy.max_interval_ms));
    }
}

chat::Result<nlohmann::json> JobPoller::fetchStatus(const ReplicateConfig& cfg, const std::string& url,
                                                    std::atomic<bool>* cancel_flag)
{
    using JsonResult = chat::Result<nlohmann::json>;

    const auto response = http_.get(url, api_headers(cfg.resolveApiToken()), session_for(cfg, cancel_flag));
    if (!response.ok())
    {
        const auto description = utils::describe_http_failure(response);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Transport, "Prediction status check failed",
                                            description);
        return JsonResult::failure(chat::ErrorKind::Transport, description);
    }

    try
    {
        auto json = nlohmann::json::parse(response.text);
        if (!json.is_object() || !json.contains("status") || !json["status"].is_string())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Protocol,
                                                "Prediction status response has no status", response.text);
            return JsonResult::failure(chat::ErrorKind::MalformedResponse,
                                       "prediction status response is missing 'status'");
        }
        return JsonResult::success(std::move(json));
    }
    catch (const nlohmann::json::exception& ex)
    {
        return JsonResult::failure(chat::ErrorKind::MalformedResponse, std::string("parse error: ") + ex.what());
    }
}

void JobPoller::pause(std::chrono::milliseconds delay, std::atomic<bool>* cancel_flag) const
{
    if (sleep_)
    {
        sleep_(delay);
        return;
    }

    constexpr auto slice = std::chrono::milliseconds(50);
    const auto until = std::chrono::steady_clock::now() + delay;
    while (!is_cancelled(cancel_flag))
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until)
            break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, until - now));
    }
}

} // namespace replicate
