#pragma once

#include "UpgradeTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace upgrade
{

// Command-line encoding of an ExistingInstallation, the only channel between the
// installer and the upgrader process.
//
// Flags (long | short), each followed by one value token:
//   --sitename | -s      required
//   --installpath | -i   required
//   --dbserver | -ds     required
//   --dbname | -dn       required
//   --version | -v       defaults to "Unknown"
//   --productcount, --ordercount, --usercount   decimal, default 0
//   --companyname        defaults to the site name
//   --installdate
class HandoffProtocol
{
public:
    static std::vector<std::string> encode(const ExistingInstallation& installation);

    // Flags match case-insensitively; one layer of surrounding double quotes is stripped
    // from values; unknown tokens are skipped. nullopt when a required field is missing or empty.
    static std::optional<ExistingInstallation> decode(const std::vector<std::string>& tokens);

    // Convenience for main(): skips argv[0]
    static std::optional<ExistingInstallation> decode(int argc, char** argv);

    // Names of required fields absent from the tokens, for operator diagnostics
    static std::vector<std::string> missingRequired(const std::vector<std::string>& tokens);
};

} // namespace upgrade
