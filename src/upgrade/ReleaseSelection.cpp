#include "ReleaseSelection.hpp"

#include "Version.hpp"

#include <plog/Log.h>

namespace upgrade
{

SelectionPolicy parseSelectionPolicy(const std::string& name)
{
    if (name == "highest_version")
        return SelectionPolicy::HighestVersion;
    if (!name.empty() && name != "newest_published")
    {
        PLOG_WARNING << "Unknown release selection policy '" << name << "', using newest_published";
    }
    return SelectionPolicy::NewestPublished;
}

std::optional<ReleaseInfo> selectRelease(const std::vector<ReleaseInfo>& releases, const SelectionCriteria& criteria)
{
    std::optional<Version> pinned;
    if (!criteria.pinnedVersion.empty())
    {
        Version v;
        if (!Version::tryParse(criteria.pinnedVersion, v))
        {
            PLOG_ERROR << "Pinned version '" << criteria.pinnedVersion << "' is not a valid version";
            return std::nullopt;
        }
        pinned = v;
    }

    const ReleaseInfo* best = nullptr;
    Version bestVersion;

    for (const auto& release : releases)
    {
        if (release.isDraft)
            continue;
        if (release.isPreRelease && !criteria.includePrereleases && !pinned)
            continue;

        Version version;
        bool parsed = Version::tryParse(release.version, version);

        if (pinned)
        {
            if (parsed && version == *pinned)
                return release;
            continue;
        }

        if (criteria.policy == SelectionPolicy::HighestVersion)
        {
            if (!parsed)
            {
                PLOG_DEBUG << "Skipping release with unparseable tag: " << release.version;
                continue;
            }
            if (!best || version > bestVersion)
            {
                best = &release;
                bestVersion = version;
            }
        }
        else
        {
            // ISO 8601 UTC timestamps order lexicographically; ties keep feed order
            if (!best || release.publishedAt > best->publishedAt)
            {
                best = &release;
            }
        }
    }

    if (pinned)
    {
        PLOG_WARNING << "Pinned version " << criteria.pinnedVersion << " not found in the release feed";
        return std::nullopt;
    }
    if (!best)
        return std::nullopt;
    return *best;
}

} // namespace upgrade
