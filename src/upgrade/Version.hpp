#pragma once

#include <array>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace upgrade
{

// Release version: major.minor.patch with an optional fourth build revision.
// Missing trailing parts are zero, so "2.0" == "2.0.0" == "2.0.0.0".
class Version
{
public:
    // Unparseable input yields 0.0.0; use parse/tryParse to detect it
    explicit Version(const std::string& versionString);

    Version(int major, int minor, int patch, int revision = 0);

    Version() = default;

    int major() const { return parts_[0]; }
    int minor() const { return parts_[1]; }
    int patch() const { return parts_[2]; }
    int revision() const { return parts_[3]; }

    // "1.0.9", or "1.0.9.47" when a revision is present
    std::string toString() const;

    auto operator<=>(const Version& other) const = default;

    // Accepts an optional leading v/V and one to four numeric parts; nothing else
    static std::optional<Version> parse(std::string_view text);

    // Leaves outVersion untouched on failure
    static bool tryParse(const std::string& versionString, Version& outVersion);

    // Strips a leading 'v'/'V' from a release tag without reformatting the numbers
    static std::string normalizeTag(const std::string& tag);

private:
    std::array<int, 4> parts_{};
};

} // namespace upgrade
