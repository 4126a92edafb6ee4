#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

namespace replicate
{
struct ReplicateConfig;
}

// Command-line front end: one prompt in, one assistant reply out.
class Application
{
public:
    enum ExitCode
    {
        Success = 0,
        CallFailed = 1,
        UsageError = 2
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string config_path = "config.toml";
        std::optional<std::string> system_prompt;
        std::optional<std::string> latest_version_model;
        std::string prompt;
        bool verbose = false;
        bool show_help = false;
    };

    bool parseCommandLineArgs(std::string& error);
    bool initializeLogging();
    bool initializeConfig();
    int runLatestVersion();
    int runPrompt();
    void printUsage() const;
    void flushErrorReports() const;

    std::vector<std::string> args_;
    Options options_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<replicate::ReplicateConfig> replicate_cfg_;
    std::string config_error_;
};
