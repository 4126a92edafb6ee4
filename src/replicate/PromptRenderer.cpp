#include "PromptRenderer.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace replicate
{

std::string PromptRenderer::renderMessage(const chat::Message& message)
{
    switch (message.role)
    {
    case chat::Role::System:
    case chat::Role::User:
        return message.content;
    case chat::Role::Assistant:
        return "[INST] " + message.content + " [/INST]";
    }
    throw std::invalid_argument("cannot render message with role value " +
                                std::to_string(static_cast<int>(message.role)));
}

RenderedPrompt PromptRenderer::renderPrompt(const std::vector<chat::Message>& messages)
{
    RenderedPrompt out;
    bool have_system = false;
    bool first_line = true;

    for (const auto& message : messages)
    {
        if (message.role == chat::Role::System)
        {
            if (!have_system)
            {
                out.system_prompt = renderMessage(message);
                have_system = true;
            }
            else
            {
                PLOG_DEBUG << "dropping additional system message: '" << message.content << "'";
            }
            continue;
        }

        if (!first_line)
            out.prompt.push_back('\n');
        out.prompt += renderMessage(message);
        first_line = false;
    }

    return out;
}

nlohmann::json PromptRenderer::buildPredictionBody(const ReplicateConfig& cfg, const RenderedPrompt& rendered)
{
    nlohmann::json body = nlohmann::json::object();
    body["version"] = cfg.version;
    body["input"] = {
        { "temperature", cfg.temperature },
        { "top_p", cfg.top_p },
        { "top_k", cfg.top_k },
        { "system_prompt", rendered.system_prompt },
        { "prompt", rendered.prompt },
    };
    return body;
}

} // namespace replicate
