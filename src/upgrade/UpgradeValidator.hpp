#pragma once

#include "UpgradeTypes.hpp"
#include "Version.hpp"

#include <string>

namespace upgrade
{

// Decides whether an installed version may move to a target release.
// Pure apart from the install-path check of the ExistingInstallation overload.
class UpgradeValidator
{
public:
    // Installs older than this need a manual migration
    static const Version kMinimumUpgradeableVersion;

    UpgradeValidationResult validate(const std::string& currentVersion, const ReleaseInfo& target) const;

    // Same checks, plus the installation directory must still exist
    UpgradeValidationResult validate(const ExistingInstallation& installation, const ReleaseInfo& target) const;
};

} // namespace upgrade
