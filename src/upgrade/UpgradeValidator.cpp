#include "UpgradeValidator.hpp"

#include <plog/Log.h>

#include <filesystem>

namespace upgrade
{

const Version UpgradeValidator::kMinimumUpgradeableVersion(0, 9, 0);

UpgradeValidationResult UpgradeValidator::validate(const std::string& currentVersion, const ReleaseInfo& target) const
{
    PLOG_INFO << "Validating upgrade: " << currentVersion << " -> " << target.version;

    Version current;
    if (currentVersion.empty() || currentVersion == "Unknown" || !Version::tryParse(currentVersion, current))
    {
        PLOG_WARNING << "Installed version is unreadable: '" << currentVersion << "'";
        return UpgradeValidationResult::reject("Installed version '" + currentVersion + "' cannot be parsed");
    }

    Version targetVersion;
    if (!Version::tryParse(target.version, targetVersion))
    {
        PLOG_WARNING << "Release version is unreadable: '" << target.version << "'";
        return UpgradeValidationResult::reject("Release version '" + target.version + "' cannot be parsed");
    }

    if (current < kMinimumUpgradeableVersion)
    {
        return UpgradeValidationResult::reject("Cannot upgrade from version older than " +
                                               kMinimumUpgradeableVersion.toString() +
                                               ". Please perform manual migration.");
    }

    if (targetVersion == current)
    {
        return UpgradeValidationResult::reject("Version " + current.toString() + " is already up to date");
    }
    if (targetVersion < current)
    {
        return UpgradeValidationResult::reject("Cannot downgrade from " + current.toString() + " to " +
                                               targetVersion.toString());
    }

    UpgradeValidationResult result;
    result.canProceed = true;
    result.message = "Upgrade from " + current.toString() + " to " + targetVersion.toString() + " is ready";

    if (!target.breakingChanges.empty())
    {
        result.hasWarnings = true;
        result.warningMessage = "Version " + targetVersion.toString() + " contains " +
                                std::to_string(target.breakingChanges.size()) +
                                " breaking change(s). User confirmation required.";
        result.breakingChanges = target.breakingChanges;
        PLOG_WARNING << *result.warningMessage;
    }

    return result;
}

UpgradeValidationResult UpgradeValidator::validate(const ExistingInstallation& installation,
                                                   const ReleaseInfo& target) const
{
    auto result = validate(installation.version, target);
    if (!result.canProceed)
        return result;

    std::error_code ec;
    if (installation.installPath.empty() || !std::filesystem::is_directory(installation.installPath, ec))
    {
        return UpgradeValidationResult::reject("Installation path not found: " + installation.installPath);
    }

    return result;
}

} // namespace upgrade
