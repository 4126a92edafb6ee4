#include "ModelVersions.hpp"

#include "JobSubmitter.hpp"
#include "utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace replicate
{

chat::Result<std::string> fetch_latest_version(utils::HttpClient& http, const ReplicateConfig& cfg,
                                               const std::string& model_id)
{
    using StringResult = chat::Result<std::string>;

    if (model_id.empty())
        return StringResult::failure(chat::ErrorKind::Configuration, "model: can't be blank");

    const auto url = utils::join_url(cfg.endpoint, "models/" + utils::url_escape_path(model_id) + "/versions");
    const auto response = http.get(url, api_headers(cfg.resolveApiToken()), session_for(cfg));
    if (!response.ok())
    {
        const auto description = utils::describe_http_failure(response);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Transport, "Model version lookup failed",
                                            model_id + ": " + description);
        return StringResult::failure(chat::ErrorKind::Transport, description);
    }

    try
    {
        const auto json = nlohmann::json::parse(response.text);
        if (!json.is_object() || !json.contains("results") || !json["results"].is_array())
            return StringResult::failure(chat::ErrorKind::MalformedResponse, "version list is missing 'results'");

        const auto& results = json["results"];
        if (results.empty())
            return StringResult::failure(chat::ErrorKind::MalformedResponse,
                                         "no versions published for model " + model_id);

        const auto& latest = results.at(0);
        if (!latest.is_object() || !latest.contains("id") || !latest["id"].is_string())
            return StringResult::failure(chat::ErrorKind::MalformedResponse, "latest version entry has no 'id'");

        auto id = latest["id"].get<std::string>();
        PLOG_INFO << "Latest version of " << model_id << ": " << id;
        return StringResult::success(std::move(id));
    }
    catch (const nlohmann::json::exception& ex)
    {
        return StringResult::failure(chat::ErrorKind::MalformedResponse, std::string("parse error: ") + ex.what());
    }
}

} // namespace replicate
