#include "Version.hpp"

#include <charconv>

namespace upgrade
{

Version::Version(const std::string& versionString)
{
    if (auto parsed = parse(versionString))
    {
        parts_ = parsed->parts_;
    }
}

Version::Version(int major, int minor, int patch, int revision)
    : parts_{ major, minor, patch, revision }
{
}

std::string Version::toString() const
{
    std::string text = std::to_string(parts_[0]) + "." + std::to_string(parts_[1]) + "." + std::to_string(parts_[2]);
    if (parts_[3] != 0)
    {
        text += "." + std::to_string(parts_[3]);
    }
    return text;
}

std::optional<Version> Version::parse(std::string_view text)
{
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V'))
    {
        text.remove_prefix(1);
    }
    if (text.empty())
    {
        return std::nullopt;
    }

    Version version;
    size_t index = 0;
    const char* cursor = text.data();
    const char* end = text.data() + text.size();
    while (true)
    {
        if (index == version.parts_.size())
        {
            return std::nullopt;
        }

        // Digits only: from_chars would take a minus sign
        if (cursor == end || *cursor < '0' || *cursor > '9')
        {
            return std::nullopt;
        }

        int value = 0;
        auto [next, ec] = std::from_chars(cursor, end, value);
        if (ec != std::errc())
        {
            return std::nullopt;
        }
        version.parts_[index++] = value;

        if (next == end)
        {
            return version;
        }
        if (*next != '.')
        {
            return std::nullopt;
        }
        cursor = next + 1;
    }
}

bool Version::tryParse(const std::string& versionString, Version& outVersion)
{
    auto parsed = parse(versionString);
    if (!parsed)
    {
        return false;
    }
    outVersion = *parsed;
    return true;
}

std::string Version::normalizeTag(const std::string& tag)
{
    if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V'))
    {
        return tag.substr(1);
    }
    return tag;
}

} // namespace upgrade
