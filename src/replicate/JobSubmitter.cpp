#include "JobSubmitter.hpp"

#include "utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace replicate
{

std::vector<utils::Header> api_headers(const std::string& api_token)
{
    std::vector<utils::Header> headers;
    headers.push_back({ "Authorization", std::string("Bearer ") + api_token });
    headers.push_back({ "Content-Type", "application/json" });
    return headers;
}

utils::SessionConfig session_for(const ReplicateConfig& cfg, std::atomic<bool>* cancel_flag)
{
    utils::SessionConfig session;
    session.timeout_ms = cfg.receive_timeout_ms;
    if (session.timeout_ms > 0 && session.connect_timeout_ms > session.timeout_ms)
        session.connect_timeout_ms = session.timeout_ms;
    session.cancel_flag = cancel_flag;
    return session;
}

JobSubmitter::JobSubmitter(utils::HttpClient& http)
    : http_(http)
{
}

chat::Result<std::string> JobSubmitter::submit(const ReplicateConfig& cfg, const RenderedPrompt& rendered,
                                               std::atomic<bool>* cancel_flag)
{
    using StringResult = chat::Result<std::string>;

    const std::string body = PromptRenderer::buildPredictionBody(cfg, rendered).dump();
    PLOG_DEBUG << "final post body: " << body;

    const auto url = utils::join_url(cfg.endpoint, "predictions");
    const auto response = http_.postJson(url, body, api_headers(cfg.resolveApiToken()), session_for(cfg, cancel_flag));

    if (!response.ok())
    {
        const auto description = utils::describe_http_failure(response);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Transport, "Prediction submission failed",
                                            description);
        return StringResult::failure(chat::ErrorKind::Transport, description);
    }

    try
    {
        const auto json = nlohmann::json::parse(response.text);
        if (!json.is_object() || !json.contains("id") || !json["id"].is_string())
        {
            return StringResult::failure(chat::ErrorKind::MalformedResponse,
                                         "prediction response is missing 'id'");
        }

        auto id = json["id"].get<std::string>();
        if (id.empty())
            return StringResult::failure(chat::ErrorKind::MalformedResponse, "prediction response has an empty 'id'");

        PLOG_INFO << "Replicate prediction created: " << id << " (model " << cfg.model << ")";
        return StringResult::success(std::move(id));
    }
    catch (const nlohmann::json::exception& ex)
    {
        return StringResult::failure(chat::ErrorKind::MalformedResponse, std::string("parse error: ") + ex.what());
    }
}

} // namespace replicate
