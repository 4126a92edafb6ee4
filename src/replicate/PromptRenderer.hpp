#pragma once

#include "ReplicateConfig.hpp"
#include "chat/Message.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace replicate
{

struct RenderedPrompt
{
    std::string system_prompt;
    std::string prompt;
};

// Flattens role-tagged messages into the llama-2 chat prompt Replicate expects.
class PromptRenderer
{
public:
    // user/system: raw text; assistant: "[INST] <text> [/INST]".
    // Throws std::invalid_argument for a role outside the known set.
    static std::string renderMessage(const chat::Message& message);

    // Only the first system message is kept as the system prompt; the rest are dropped.
    static RenderedPrompt renderPrompt(const std::vector<chat::Message>& messages);

    static nlohmann::json buildPredictionBody(const ReplicateConfig& cfg, const RenderedPrompt& rendered);
};

} // namespace replicate
