#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

enum class ConfigLoadStatus
{
    Loaded,
    Missing, // No file; handlers keep their defaults
    Invalid  // Parse error, reported through ErrorReporter; handlers keep their defaults
};

// Owns storeup.toml. Each top-level table ([feed], [download], ...) is bound to one
// handler that declares the keys it owns; keys nobody owns are reported as likely typos.
class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath = "storeup.toml");
    ~ConfigManager();

    bool registerTable(const std::string& name, TableCallbacks cb, std::vector<std::string> ownedKeys);

    ConfigLoadStatus load();

    // Writes owned keys back, keeps everything else in the file, replaces it atomically
    bool save();

    const toml::table& root() const;
    const std::string& configPath() const { return config_path_; }
    bool fileExists() const;

    // "table.key" for every key inside a registered table that no handler owns
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    struct HandlerEntry
    {
        std::string name;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;

        bool owns(const std::string& key) const;
    };

    void dispatchLoad();
    void collectUnknownKeys();

    std::string config_path_;
    std::string last_error_;
    std::vector<HandlerEntry> handlers_;
    std::vector<std::string> unknown_keys_;
    toml::table root_;
};
