#pragma once

#include "ConfigManager.hpp"

#include <cstdint>
#include <string>

struct FeedSettings
{
    std::string url; // Repository API root, e.g. https://api.github.com/repos/owner/storefront
    std::string user_agent = "storeup-updater";
    std::string auth_token;
    int timeout_ms = 15000;
    int connect_timeout_ms = 5000;
    bool include_prereleases = false;
    std::string selection = "newest_published";
    std::string pinned_version;
};

struct DownloadSettings
{
    std::string asset_pattern = "*.zip";
    std::string directory = "downloads";
    int timeout_ms = 0;
    int low_speed_limit_seconds = 30;
    int progress_interval_ms = 100;
    bool verify_checksum = true;
};

struct StateSettings
{
    std::string file = "state/installation.toml";
};

struct InstallSettings
{
    std::string path;
    std::string site_name = "Storefront";
    std::string database_server;
    std::string database_name;
    std::string upgrader_path;
};

struct LoggingSettings
{
    int level = 4; // plog::info
    bool append = true;
    bool console = false;
    std::string file = "logs/storeup.log";
};

struct StoreupConfig
{
    FeedSettings feed;
    DownloadSettings download;
    StateSettings state;
    InstallSettings install;
    LoggingSettings logging;
};

// Registers [feed], [download], [state], [install] and [logging] with the manager.
// config must outlive the manager's load/save calls.
bool bindStoreupConfig(ConfigManager& manager, StoreupConfig& config);
