#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        plog::Severity level = config.level_override.value_or(s_default_level);

        if (config.filepath.empty())
        {
            // Console-only logger
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::init<InstanceId>(level, console_appender.get());
            s_appenders.push_back(std::move(console_appender));
            return true;
        }

        if (!PrepareLogDirectory(config.filepath))
            return false;

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::SetDefaultLogLevel(plog::Severity level) { s_default_level = level; }

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unable to prepare log directory", ec.message());
        return false;
    }
    return true;
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append_logs"].value<bool>())
            {
                s_append_logs = *append;
            }

            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
        }
    }
    catch (const toml::parse_error& pe)
    {
        // ConfigManager reports the parse error when it loads the same file.
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()));
    }
}

} // namespace utils
