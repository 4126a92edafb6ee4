#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Owns the parsed TOML document and hands each registered section to its loader.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // path is dotted ("replicate", "replicate.poll"). Keys may only be owned by one handler per path.
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error: every loader receives an empty table.
    bool load();

    const toml::table& root() const;

    const std::string& path() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
