#include "Application.hpp"

#include "config/ConfigManager.hpp"
#include "replicate/ChatReplicate.hpp"
#include "replicate/ModelVersions.hpp"
#include "replicate/ReplicateConfig.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace
{

std::atomic<bool> g_cancel_requested{ false };

void handle_interrupt(int)
{
    g_cancel_requested.store(true);
}

} // namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    std::string usage_error;
    if (!parseCommandLineArgs(usage_error))
    {
        std::cerr << "replicate-chat: " << usage_error << "\n";
        printUsage();
        return UsageError;
    }

    if (options_.show_help)
    {
        printUsage();
        return Success;
    }

    if (!initializeLogging())
        std::cerr << "replicate-chat: logging disabled, see error reports with --verbose\n";

    if (!initializeConfig())
    {
        std::cerr << "replicate-chat: " << config_error_ << "\n";
        flushErrorReports();
        return UsageError;
    }

    std::signal(SIGINT, handle_interrupt);

    const int code = options_.latest_version_model ? runLatestVersion() : runPrompt();
    flushErrorReports();
    return code;
}

bool Application::parseCommandLineArgs(std::string& error)
{
    std::string prompt;
    for (std::size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        auto next_value = [&](const char* flag) -> std::optional<std::string>
        {
            if (i + 1 >= args_.size())
            {
                error = std::string("missing value for ") + flag;
                return std::nullopt;
            }
            return args_[++i];
        };

        if (arg == "-h" || arg == "--help")
        {
            options_.show_help = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options_.verbose = true;
        }
        else if (arg == "--config")
        {
            auto value = next_value("--config");
            if (!value)
                return false;
            options_.config_path = *value;
        }
        else if (arg == "--system")
        {
            auto value = next_value("--system");
            if (!value)
                return false;
            options_.system_prompt = *value;
        }
        else if (arg == "--latest-version")
        {
            auto value = next_value("--latest-version");
            if (!value)
                return false;
            options_.latest_version_model = *value;
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg != "-")
        {
            error = "unknown option " + arg;
            return false;
        }
        else
        {
            if (!prompt.empty())
                prompt.push_back(' ');
            prompt += arg;
        }
    }

    options_.prompt = std::move(prompt);
    if (!options_.show_help && !options_.latest_version_model && options_.prompt.empty())
    {
        error = "no prompt given";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(options_.config_path))
        return false;

    if (options_.verbose)
        utils::LogManager::SetDefaultLogLevel(plog::debug);

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = "logs/replicate-chat.log",
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = options_.verbose });
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);

    chat::Result<replicate::ReplicateConfig> loaded =
        chat::Result<replicate::ReplicateConfig>::failure(chat::ErrorKind::Configuration, "[replicate] not loaded");

    config_->registerTable("replicate",
                           { [&loaded](const toml::table& section)
                             { loaded = replicate::ReplicateConfig::fromToml(section); } },
                           { "endpoint", "model", "version", "api_token", "temperature", "top_p", "top_k",
                             "receive_timeout", "stream", "poll" });

    if (!config_->load())
    {
        config_error_ = config_->lastError();
        return false;
    }

    if (!loaded)
    {
        config_error_ = "invalid [replicate] settings in " + options_.config_path + ": " + loaded.error->message;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid Replicate configuration",
                                          loaded.error->message);
        return false;
    }

    replicate_cfg_ = std::make_unique<replicate::ReplicateConfig>(std::move(*loaded.value));
    return true;
}

int Application::runLatestVersion()
{
    // No version is needed to look one up, so the config is not validated here.
    utils::CprHttpClient http;
    auto version = replicate::fetch_latest_version(http, *replicate_cfg_, *options_.latest_version_model);
    if (!version)
    {
        std::cerr << "replicate-chat: " << version.error->message << "\n";
        return CallFailed;
    }

    std::cout << *version.value << "\n";
    return Success;
}

int Application::runPrompt()
{
    auto client = replicate::ChatReplicate::create(*replicate_cfg_);
    if (!client)
    {
        std::cerr << "replicate-chat: " << client.error->message << "\n";
        return UsageError;
    }

    std::vector<chat::Message> messages;
    messages.push_back(options_.system_prompt ? chat::Message::system(*options_.system_prompt)
                                              : chat::Message::system());
    messages.push_back(chat::Message::user(options_.prompt));

    PLOG_INFO << "Sending prompt to " << replicate_cfg_->model << " (version " << replicate_cfg_->version << ")";
    auto result = client.value->call(messages, {}, {}, &g_cancel_requested);
    if (!result)
    {
        std::cerr << "replicate-chat: " << chat::errorKindName(result.error->kind) << ": " << result.error->message
                  << "\n";
        return CallFailed;
    }

    std::cout << result.value->content << "\n";
    return Success;
}

void Application::printUsage() const
{
    std::cout << "usage: replicate-chat [--config FILE] [--system TEXT] [--verbose] PROMPT...\n"
                 "       replicate-chat [--config FILE] --latest-version MODEL\n"
                 "\n"
                 "Settings are read from the [replicate] table of the config file (default config.toml).\n"
                 "The API token falls back to the "
              << replicate::ReplicateConfig::kTokenEnvVar << " environment variable.\n";
}

void Application::flushErrorReports() const
{
    if (!options_.verbose)
        return;

    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << "[" << report.timestamp << "] [" << utils::ErrorReporter::CategoryToString(report.category)
                  << "] [" << utils::ErrorReporter::SeverityToString(report.severity) << "] "
                  << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " | " << report.technical_details;
        std::cerr << "\n";
    }
}
