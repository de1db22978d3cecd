#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

bool ConfigManager::HandlerEntry::owns(const std::string& key) const
{
    return std::find(ownedKeys.begin(), ownedKeys.end(), key) != ownedKeys.end();
}

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::fileExists() const
{
    std::error_code ec;
    return fs::is_regular_file(config_path_, ec);
}

const toml::table& ConfigManager::root() const { return root_; }

bool ConfigManager::registerTable(const std::string& name, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    if (name.empty() || name.find('.') != std::string::npos)
    {
        last_error_ = "Invalid table name '" + name + "'";
        PLOG_ERROR << last_error_;
        return false;
    }

    for (const auto& handler : handlers_)
    {
        if (handler.name != name)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (handler.owns(key))
            {
                last_error_ = "Duplicate ownership: key '" + key + "' in [" + name + "] already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ name, std::move(cb), std::move(ownedKeys) });
    return true;
}

ConfigLoadStatus ConfigManager::load()
{
    last_error_.clear();
    unknown_keys_.clear();
    root_ = toml::table{};

    if (!fileExists())
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        dispatchLoad();
        return ConfigLoadStatus::Missing;
    }

    try
    {
        root_ = toml::parse_file(config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string details(pe.description());
        if (pe.source().begin.line > 0)
        {
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;
        }
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            details + "\nFile: " + config_path_);
        root_ = toml::table{};
        dispatchLoad();
        return ConfigLoadStatus::Invalid;
    }

    collectUnknownKeys();
    for (const auto& key : unknown_keys_)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Unknown configuration key '" + key + "' is ignored", config_path_);
    }

    dispatchLoad();
    PLOG_INFO << "Loaded config from " << config_path_;
    return ConfigLoadStatus::Loaded;
}

void ConfigManager::dispatchLoad()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = root_[handler.name].as_table();
        if (!section && root_.contains(handler.name))
        {
            PLOG_WARNING << "'" << handler.name << "' is not a table, using defaults";
        }
        handler.callbacks.load(section ? *section : empty);
    }
}

void ConfigManager::collectUnknownKeys()
{
    for (const auto& [tableName, node] : root_)
    {
        const auto* table = node.as_table();
        if (!table)
            continue;

        const std::string name(tableName.str());
        bool registered = false;
        for (const auto& handler : handlers_)
        {
            registered = registered || handler.name == name;
        }
        if (!registered)
            continue;

        for (const auto& [key, value] : *table)
        {
            const std::string keyName(key.str());
            bool owned = std::any_of(handlers_.begin(), handlers_.end(), [&](const HandlerEntry& h)
                                     { return h.name == name && h.owns(keyName); });
            if (!owned)
            {
                unknown_keys_.push_back(name + "." + keyName);
            }
        }
    }
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table output = root_;
    for (const auto& handler : handlers_)
    {
        if (!output[handler.name].as_table())
        {
            output.insert_or_assign(handler.name, toml::table{});
        }
        auto& target = *output[handler.name].as_table();

        toml::table values = handler.callbacks.save();
        for (const auto& key : handler.ownedKeys)
        {
            if (values.contains(key))
            {
                target.insert_or_assign(key, values[key]);
            }
            else
            {
                target.erase(key);
            }
        }
        for (const auto& [key, value] : values)
        {
            if (!handler.owns(std::string(key.str())))
            {
                PLOG_WARNING << "[" << handler.name << "] handler produced unowned key '" << key.str() << "', dropped";
            }
        }
    }

    std::error_code ec;
    auto parent = fs::path(config_path_).parent_path();
    if (!parent.empty())
    {
        fs::create_directories(parent, ec);
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Cannot write " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
        ofs << output << '\n';
    }

    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "Cannot replace " + config_path_ + ": " + ec.message();
        fs::remove(tmp, ec);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        return false;
    }

    root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}
