#pragma once

#include "ReplicateConfig.hpp"
#include "ResponseNormalizer.hpp"
#include "chat/ChatResult.hpp"
#include "utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace replicate
{

enum class PollState
{
    Pending,
    InFlight,
    Succeeded,
    Failed,
    Canceled
};

const char* pollStateToString(PollState state);

/**
 * @brief Blocks until a prediction reaches a terminal status
 *
 * Each iteration is one GET <endpoint>/predictions/{id}. Between non-terminal
 * observations the poller sleeps with exponential backoff; the whole wait is
 * bounded by PollPolicy::max_duration_ms and PollPolicy::max_attempts.
 *
 * Outcomes:
 *   succeeded            -> full payload
 *   failed / canceled    -> RemoteJob error
 *   unknown or no status -> MalformedResponse error
 *   HTTP failure         -> Transport error (not retried)
 *   budget exhausted     -> PollTimeout error
 *   cancel flag raised   -> Cancelled error
 */
class JobPoller
{
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    // sleep overrides the default interruptible sleep (tests record the backoff schedule).
    explicit JobPoller(utils::HttpClient& http, SleepFn sleep = {});

    chat::Result<nlohmann::json> wait(const ReplicateConfig& cfg, const std::string& job_id,
                                      std::atomic<bool>* cancel_flag = nullptr);

    PollState state() const { return state_; }

    int attempts() const { return attempts_; }

    void setSleepFunction(SleepFn sleep) { sleep_ = std::move(sleep); }

private:
    chat::Result<nlohmann::json> fetchStatus(const ReplicateConfig& cfg, const std::string& url,
                                             std::atomic<bool>* cancel_flag);
    void pause(std::chrono::milliseconds delay, std::atomic<bool>* cancel_flag) const;

    utils::HttpClient& http_;
    SleepFn sleep_;
    PollState state_ = PollState::Pending;
    int attempts_ = 0;
};

} // namespace replicate
