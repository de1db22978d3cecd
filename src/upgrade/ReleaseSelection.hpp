#pragma once

#include "UpgradeTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace upgrade
{

enum class SelectionPolicy
{
    NewestPublished, // Latest published_at wins
    HighestVersion // Largest parseable version tag wins
};

struct SelectionCriteria
{
    SelectionPolicy policy = SelectionPolicy::NewestPublished;
    bool includePrereleases = false;
    std::string pinnedVersion; // When set, only this version qualifies ("1.2.3" or "v1.2.3")
};

// "newest_published" / "highest_version"; unknown names fall back to NewestPublished
SelectionPolicy parseSelectionPolicy(const std::string& name);

// Picks the release to install from a feed listing. Drafts never qualify.
std::optional<ReleaseInfo> selectRelease(const std::vector<ReleaseInfo>& releases, const SelectionCriteria& criteria);

} // namespace upgrade
