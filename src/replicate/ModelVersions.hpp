#pragma once

#include "ReplicateConfig.hpp"
#include "chat/ChatResult.hpp"
#include "utils/HttpCommon.hpp"

#include <string>

namespace replicate
{

// GET <endpoint>/models/{model_id}/versions; the first listed version is the latest.
chat::Result<std::string> fetch_latest_version(utils::HttpClient& http, const ReplicateConfig& cfg,
                                               const std::string& model_id);

} // namespace replicate
