#pragma once

#include "InstallationStateStore.hpp"
#include "UpgradeTypes.hpp"

#include <optional>
#include <string>

namespace upgrade
{

// Operator-supplied facts the state record does not carry
struct SiteSettings
{
    std::string siteName;
    std::string installPath; // Used when the record lacks one
    std::string databaseServer;
    std::string databaseName;
};

// Builds the ExistingInstallation handed to the upgrade path from the state record,
// the site settings and the application's own appsettings.json.
class InstallationDetector
{
public:
    static constexpr const char* kAppSettingsFile = "appsettings.json";

    InstallationDetector(const InstallationStateStore& stateStore, SiteSettings settings);

    // nullopt when nothing is installed. An installation whose files are gone is still
    // returned, flagged unhealthy with the reasons in issues.
    std::optional<ExistingInstallation> detect() const;

    // ConnectionStrings.DefaultConnection of an appsettings.json file
    static bool readConnectionString(const std::string& appSettingsPath, std::string& outConnectionString,
                                     std::string& outError);

    // "Server=...;Database=..." (also "Data Source" / "Initial Catalog"), keys case-insensitive
    static void parseConnectionString(const std::string& connectionString, std::string& outServer,
                                      std::string& outDatabase);

private:
    const InstallationStateStore& stateStore_;
    SiteSettings settings_;
};

} // namespace upgrade
