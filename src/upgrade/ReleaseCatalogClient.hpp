#pragma once

#include "UpgradeTypes.hpp"
#include "../utils/HttpCommon.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace upgrade
{

struct FeedConfig
{
    // Repository API root, e.g. "https://api.github.com/repos/owner/storefront"
    std::string baseUrl;
    std::string userAgent = "storeup-updater";
    std::string authToken; // Sent as "Authorization: Bearer" when set
    int timeoutMs = 15000;
    int connectTimeoutMs = 5000;
};

struct CatalogResult
{
    bool success = false;
    std::vector<ReleaseInfo> releases;
    FailureKind failure = FailureKind::None;
    std::string error;
};

using CatalogCallback = std::function<void(const CatalogResult& result)>;

// Release feed client (GitHub releases API schema)
class ReleaseCatalogClient
{
public:
    ReleaseCatalogClient(std::shared_ptr<utils::IHttpClient> http, FeedConfig config);
    ~ReleaseCatalogClient();

    ReleaseCatalogClient(const ReleaseCatalogClient&) = delete;
    ReleaseCatalogClient& operator=(const ReleaseCatalogClient&) = delete;

    // Raw ordered list as the feed returns it; drafts and prereleases included
    CatalogResult fetchReleases(const utils::CancellationToken* cancel = nullptr, int perPage = 20, int page = 1);

    // Runs fetchReleases on a worker thread; the callback fires on that thread
    void fetchReleasesAsync(CatalogCallback callback, const utils::CancellationToken* cancel = nullptr);

    // "/releases/latest", falling back to the first listed release when that endpoint fails
    CatalogResult fetchLatestRelease(const utils::CancellationToken* cancel = nullptr);

    // Tag lookups accept "1.2.3" or "v1.2.3"
    CatalogResult fetchReleaseByTag(const std::string& tag, const utils::CancellationToken* cancel = nullptr);

    // API endpoint for an asset, used when the browser download URL is refused
    std::string assetApiUrl(std::int64_t assetId) const;

    // Headers every feed request carries (user agent, bearer token)
    std::vector<utils::Header> requestHeaders() const;

    int rateLimitRemaining() const;
    std::chrono::system_clock::time_point rateLimitReset() const;
    bool hasRateLimitAvailable() const;

    // Parses a release array or a single release object; false with outError on malformed JSON
    static bool parseReleases(const std::string& json, std::vector<ReleaseInfo>& outReleases, std::string& outError);

    // Case-insensitive exact name match
    static std::optional<ReleaseAsset> findAsset(const ReleaseInfo& release, const std::string& exactName);

    // Shell wildcards: '*' any run, '?' one character; case-insensitive, whole-name match
    static std::optional<ReleaseAsset> findAssetByPattern(const ReleaseInfo& release, const std::string& pattern);

    // Anchored regex source for a wildcard pattern, every other metacharacter escaped
    static std::string wildcardToRegex(const std::string& pattern);

    // Bullet items under a "Breaking Changes" heading of a markdown changelog
    static std::vector<std::string> extractBreakingChanges(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace upgrade
