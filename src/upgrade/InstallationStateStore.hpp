#pragma once

#include "KeyValueStore.hpp"
#include "UpgradeTypes.hpp"

#include <memory>
#include <optional>
#include <string>

namespace upgrade
{

// Reads and writes the installation record. Never throws: store failures are logged
// and reported as "not installed" / absent / false so callers can pick a safe path.
class InstallationStateStore
{
public:
    static constexpr const char* kNamespace = "storeup";
    static constexpr const char* kInstalledVersionKey = "InstalledVersion";
    static constexpr const char* kInstallPathKey = "InstallPath";
    static constexpr const char* kInstallDateKey = "InstallDate";

    explicit InstallationStateStore(std::shared_ptr<IKeyValueStore> store);

    bool isInstalled() const;

    std::optional<InstallationInfo> getInstallationInfo() const;

    // Commit point of every install/upgrade: stamps the current local time as install date
    bool saveInstallationInfo(const std::string& version, const std::string& installPath);

    bool removeInstallationInfo();

    static std::string currentTimestamp();

private:
    static std::string keyFor(const char* name);

    std::shared_ptr<IKeyValueStore> store_;
};

} // namespace upgrade
