#pragma once

#include "PredictionBackend.hpp"
#include "ReplicateConfig.hpp"
#include "chat/Message.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace replicate
{

/**
 * @brief Chat model hosted on Replicate
 *
 * Turns a message list into a Replicate prediction, blocks until the
 * prediction finishes, and returns the result as a single assistant message.
 *
 * Caveats:
 *   - stream = true is rejected by the config (Replicate only streams to a webhook).
 *   - Tool/function calls are rejected before any request is made.
 *   - A submitted prediction is never canceled remotely; the cancel flag only
 *     stops the local wait.
 */
class ChatReplicate
{
public:
    static constexpr const char* kToolsUnsupportedMessage =
        "Function calls are not currently supported for Replicate-hosted models";

    // Validates cfg. A null backend talks to the live API through cpr.
    static chat::Result<ChatReplicate> create(ReplicateConfig cfg, std::shared_ptr<IPredictionBackend> backend = nullptr);

    const ReplicateConfig& config() const { return cfg_; }

    IPredictionBackend& backend() { return *backend_; }

    // Request body for POST /predictions.
    nlohmann::json forApi(const std::vector<chat::Message>& messages) const;

    /**
     * @brief Run one prediction and wait for it
     * @param messages Conversation; only the first system message is used
     * @param tools Must be empty
     * @param observer Invoked once with the result when the prediction reaches a terminal status
     * @param cancel_flag Optional; setting it stops waiting (the remote job keeps running)
     */
    chat::ChatResult call(const std::vector<chat::Message>& messages,
                          const std::vector<chat::ToolDescriptor>& tools = {},
                          const chat::ResultObserver& observer = {}, std::atomic<bool>* cancel_flag = nullptr);

    // Wraps prompt as [default system message, user prompt].
    chat::ChatResult call(const std::string& prompt, const std::vector<chat::ToolDescriptor>& tools = {},
                          const chat::ResultObserver& observer = {}, std::atomic<bool>* cancel_flag = nullptr);

    chat::Result<std::string> latestVersion(const std::string& model_id);

    chat::Result<std::string> latestVersion() { return latestVersion(cfg_.model); }

private:
    ChatReplicate(ReplicateConfig cfg, std::shared_ptr<IPredictionBackend> backend);

    ReplicateConfig cfg_;
    std::shared_ptr<IPredictionBackend> backend_;
};

} // namespace replicate
