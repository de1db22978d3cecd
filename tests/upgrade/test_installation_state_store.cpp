#include <catch2/catch_test_macros.hpp>
#include "upgrade/InstallationStateStore.hpp"
#include "upgrade/KeyValueStore.hpp"
#include "../utils/memory_store.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <regex>

using namespace upgrade;
using test_utils::MemoryKeyValueStore;
using test_utils::TempDir;

TEST_CASE("InstallationStateStore with an empty store", "[state]")
{
    auto backing = std::make_shared<MemoryKeyValueStore>();
    InstallationStateStore store(backing);

    REQUIRE_FALSE(store.isInstalled());
    REQUIRE_FALSE(store.getInstallationInfo().has_value());
    REQUIRE(store.removeInstallationInfo());
}

TEST_CASE("InstallationStateStore records an installation", "[state]")
{
    auto backing = std::make_shared<MemoryKeyValueStore>();
    InstallationStateStore store(backing);

    REQUIRE(store.saveInstallationInfo("2.0.0", "/srv/storefront"));
    REQUIRE(store.isInstalled());
    REQUIRE(backing->values.at("storeup/InstalledVersion") == "2.0.0");
    REQUIRE(backing->values.at("storeup/InstallPath") == "/srv/storefront");

    auto info = store.getInstallationInfo();
    REQUIRE(info.has_value());
    REQUIRE(info->version == "2.0.0");
    REQUIRE(info->installPath == "/srv/storefront");
    REQUIRE(std::regex_match(info->installDate, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));

    SECTION("Removal clears the namespace")
    {
        backing->values["other/Key"] = "kept";
        REQUIRE(store.removeInstallationInfo());
        REQUIRE_FALSE(store.isInstalled());
        REQUIRE(backing->values.size() == 1);
    }

    SECTION("Empty version is refused")
    {
        REQUIRE_FALSE(store.saveInstallationInfo("", "/srv/other"));
        REQUIRE(store.getInstallationInfo()->installPath == "/srv/storefront");
    }
}

TEST_CASE("InstallationStateStore fills missing fields", "[state]")
{
    auto backing = std::make_shared<MemoryKeyValueStore>();
    backing->values["storeup/InstalledVersion"] = "1.0.9";
    InstallationStateStore store(backing);

    auto info = store.getInstallationInfo();
    REQUIRE(info.has_value());
    REQUIRE(info->installPath == "Unknown");
    REQUIRE(info->installDate == "Unknown");
}

TEST_CASE("InstallationStateStore never throws", "[state][errors]")
{
    auto backing = std::make_shared<MemoryKeyValueStore>();
    backing->values["storeup/InstalledVersion"] = "1.0.9";
    backing->failing = true;
    InstallationStateStore store(backing);

    REQUIRE_NOTHROW(store.isInstalled());
    REQUIRE_FALSE(store.isInstalled());
    REQUIRE_FALSE(store.getInstallationInfo().has_value());
    REQUIRE_FALSE(store.saveInstallationInfo("2.0.0", "/srv/storefront"));
    REQUIRE_FALSE(store.removeInstallationInfo());

    InstallationStateStore detached(nullptr);
    REQUIRE_FALSE(detached.isInstalled());
    REQUIRE_FALSE(detached.saveInstallationInfo("2.0.0", "/srv/storefront"));
}

TEST_CASE("InstallationStateStore keeps the previous record when a commit fails", "[state][errors]")
{
    auto backing = std::make_shared<MemoryKeyValueStore>();
    InstallationStateStore store(backing);
    REQUIRE(store.saveInstallationInfo("1.0.9", "/srv/old"));
    const std::string oldDate = store.getInstallationInfo()->installDate;

    backing->failing_key = "storeup/InstalledVersion";
    REQUIRE_FALSE(store.saveInstallationInfo("2.0.0", "/srv/new"));

    auto info = store.getInstallationInfo();
    REQUIRE(info.has_value());
    REQUIRE(info->version == "1.0.9");
    REQUIRE(info->installPath == "/srv/old");
    REQUIRE(info->installDate == oldDate);
}

TEST_CASE("TomlKeyValueStore persists nested keys", "[state][toml]")
{
    TempDir dir("storeup_state");
    const std::string path = dir.file("state/installation.toml");

    {
        TomlKeyValueStore store(path);
        REQUIRE_FALSE(store.get("storeup/InstalledVersion").has_value());
        store.set("storeup/InstalledVersion", "2.0.0");
        store.set("storeup/InstallPath", "C:\\Sites\\Storefront");
        store.set("other/Value", "x");
    }

    TomlKeyValueStore reopened(path);
    REQUIRE(reopened.get("storeup/InstalledVersion") == std::optional<std::string>("2.0.0"));
    REQUIRE(reopened.get("storeup/InstallPath") == std::optional<std::string>("C:\\Sites\\Storefront"));
    REQUIRE_FALSE(reopened.get("missing/Key").has_value());

    reopened.deleteTree("storeup");
    REQUIRE_FALSE(reopened.get("storeup/InstalledVersion").has_value());
    REQUIRE(reopened.get("other/Value") == std::optional<std::string>("x"));
    REQUIRE_NOTHROW(reopened.deleteTree("storeup"));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("TomlKeyValueStore writes a batch in one save", "[state][toml]")
{
    TempDir dir("storeup_state");
    const std::string path = dir.file("installation.toml");

    TomlKeyValueStore store(path);
    store.set("other/Value", "x");
    store.setMany({ { "storeup/InstallPath", "/srv/new" }, { "storeup/InstalledVersion", "2.0.0" } });

    TomlKeyValueStore reopened(path);
    REQUIRE(reopened.get("storeup/InstallPath") == std::optional<std::string>("/srv/new"));
    REQUIRE(reopened.get("storeup/InstalledVersion") == std::optional<std::string>("2.0.0"));
    REQUIRE(reopened.get("other/Value") == std::optional<std::string>("x"));

    SECTION("An invalid key aborts the whole batch")
    {
        REQUIRE_THROWS_AS(reopened.setMany({ { "storeup/InstalledVersion", "3.0.0" }, { "", "oops" } }),
                          KeyValueStoreError);
        REQUIRE(reopened.get("storeup/InstalledVersion") == std::optional<std::string>("2.0.0"));
    }
}

TEST_CASE("TomlKeyValueStore reports a corrupted file", "[state][toml][errors]")
{
    TempDir dir("storeup_state");
    const std::string path = dir.file("installation.toml");
    {
        std::ofstream ofs(path);
        ofs << "[storeup\nInstalledVersion = ";
    }

    TomlKeyValueStore store(path);
    REQUIRE_THROWS_AS(store.get("storeup/InstalledVersion"), KeyValueStoreError);

    InstallationStateStore state(std::make_shared<TomlKeyValueStore>(path));
    REQUIRE_FALSE(state.isInstalled());
}
