#include "StoreupConfig.hpp"

#include <plog/Log.h>

namespace
{

void readString(const toml::table& t, const char* key, std::string& out)
{
    if (auto v = t[key].value<std::string>())
        out = *v;
}

void readBool(const toml::table& t, const char* key, bool& out)
{
    if (auto v = t[key].value<bool>())
        out = *v;
}

// Negative numbers are configuration mistakes; keep the default
void readInt(const toml::table& t, const char* key, int& out)
{
    if (auto v = t[key].value<int64_t>())
    {
        if (*v < 0)
        {
            PLOG_WARNING << "Ignoring negative value for '" << key << "'";
            return;
        }
        out = static_cast<int>(*v);
    }
}

} // namespace

bool bindStoreupConfig(ConfigManager& manager, StoreupConfig& config)
{
    bool ok = true;

    ok &= manager.registerTable(
        "feed",
        { [&config](const toml::table& t)
          {
              auto& f = config.feed;
              readString(t, "url", f.url);
              readString(t, "user_agent", f.user_agent);
              readString(t, "auth_token", f.auth_token);
              readInt(t, "timeout_ms", f.timeout_ms);
              readInt(t, "connect_timeout_ms", f.connect_timeout_ms);
              readBool(t, "include_prereleases", f.include_prereleases);
              readString(t, "selection", f.selection);
              readString(t, "pinned_version", f.pinned_version);
          },
          [&config]()
          {
              const auto& f = config.feed;
              toml::table t;
              t.insert_or_assign("url", f.url);
              t.insert_or_assign("user_agent", f.user_agent);
              if (!f.auth_token.empty())
                  t.insert_or_assign("auth_token", f.auth_token);
              t.insert_or_assign("timeout_ms", static_cast<int64_t>(f.timeout_ms));
              t.insert_or_assign("connect_timeout_ms", static_cast<int64_t>(f.connect_timeout_ms));
              t.insert_or_assign("include_prereleases", f.include_prereleases);
              t.insert_or_assign("selection", f.selection);
              if (!f.pinned_version.empty())
                  t.insert_or_assign("pinned_version", f.pinned_version);
              return t;
          } },
        { "url", "user_agent", "auth_token", "timeout_ms", "connect_timeout_ms", "include_prereleases", "selection",
          "pinned_version" });

    ok &= manager.registerTable(
        "download",
        { [&config](const toml::table& t)
          {
              auto& d = config.download;
              readString(t, "asset_pattern", d.asset_pattern);
              readString(t, "directory", d.directory);
              readInt(t, "timeout_ms", d.timeout_ms);
              readInt(t, "low_speed_limit_seconds", d.low_speed_limit_seconds);
              readInt(t, "progress_interval_ms", d.progress_interval_ms);
              readBool(t, "verify_checksum", d.verify_checksum);
          },
          [&config]()
          {
              const auto& d = config.download;
              toml::table t;
              t.insert_or_assign("asset_pattern", d.asset_pattern);
              t.insert_or_assign("directory", d.directory);
              t.insert_or_assign("timeout_ms", static_cast<int64_t>(d.timeout_ms));
              t.insert_or_assign("low_speed_limit_seconds", static_cast<int64_t>(d.low_speed_limit_seconds));
              t.insert_or_assign("progress_interval_ms", static_cast<int64_t>(d.progress_interval_ms));
              t.insert_or_assign("verify_checksum", d.verify_checksum);
              return t;
          } },
        { "asset_pattern", "directory", "timeout_ms", "low_speed_limit_seconds", "progress_interval_ms",
          "verify_checksum" });

    ok &= manager.registerTable(
        "state",
        { [&config](const toml::table& t) { readString(t, "file", config.state.file); },
          [&config]()
          {
              toml::table t;
              t.insert_or_assign("file", config.state.file);
              return t;
          } },
        { "file" });

    ok &= manager.registerTable(
        "install",
        { [&config](const toml::table& t)
          {
              auto& i = config.install;
              readString(t, "path", i.path);
              readString(t, "site_name", i.site_name);
              readString(t, "database_server", i.database_server);
              readString(t, "database_name", i.database_name);
              readString(t, "upgrader_path", i.upgrader_path);
          },
          [&config]()
          {
              const auto& i = config.install;
              toml::table t;
              t.insert_or_assign("path", i.path);
              t.insert_or_assign("site_name", i.site_name);
              t.insert_or_assign("database_server", i.database_server);
              t.insert_or_assign("database_name", i.database_name);
              if (!i.upgrader_path.empty())
                  t.insert_or_assign("upgrader_path", i.upgrader_path);
              return t;
          } },
        { "path", "site_name", "database_server", "database_name", "upgrader_path" });

    ok &= manager.registerTable(
        "logging",
        { [&config](const toml::table& t)
          {
              auto& l = config.logging;
              readInt(t, "level", l.level);
              if (l.level > 6)
                  l.level = 6;
              readBool(t, "append", l.append);
              readBool(t, "console", l.console);
              readString(t, "file", l.file);
          },
          [&config]()
          {
              const auto& l = config.logging;
              toml::table t;
              t.insert_or_assign("level", static_cast<int64_t>(l.level));
              t.insert_or_assign("append", l.append);
              t.insert_or_assign("console", l.console);
              t.insert_or_assign("file", l.file);
              return t;
          } },
        { "level", "append", "console", "file" });

    return ok;
}
