#pragma once

#include "PromptRenderer.hpp"
#include "ReplicateConfig.hpp"
#include "chat/ChatResult.hpp"
#include "utils/HttpCommon.hpp"

#include <string>
#include <vector>

namespace replicate
{

// Authorization and content headers shared by every Replicate request.
std::vector<utils::Header> api_headers(const std::string& api_token);

utils::SessionConfig session_for(const ReplicateConfig& cfg, std::atomic<bool>* cancel_flag = nullptr);

class JobSubmitter
{
public:
    explicit JobSubmitter(utils::HttpClient& http);

    // POST <endpoint>/predictions. Creates the remote job; never retried.
    chat::Result<std::string> submit(const ReplicateConfig& cfg, const RenderedPrompt& rendered,
                                     std::atomic<bool>* cancel_flag = nullptr);

private:
    utils::HttpClient& http_;
};

} // namespace replicate
