#include "ReleaseCatalogClient.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <regex>
#include <thread>

using json = nlohmann::json;

namespace upgrade
{

namespace
{

std::string stringField(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

bool boolField(const json& obj, const char* key)
{
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<ReleaseAsset> parseAsset(const json& element)
{
    ReleaseAsset asset;
    asset.name = stringField(element, "name");
    asset.browserDownloadUrl = stringField(element, "browser_download_url");
    if (asset.name.empty() || asset.browserDownloadUrl.empty())
    {
        PLOG_DEBUG << "Skipping asset without name or download URL";
        return std::nullopt;
    }

    if (auto it = element.find("id"); it != element.end() && it->is_number_integer())
        asset.id = it->get<std::int64_t>();
    if (auto it = element.find("size"); it != element.end() && it->is_number_unsigned())
        asset.size = it->get<std::uint64_t>();
    asset.contentType = stringField(element, "content_type");
    asset.createdAt = stringField(element, "created_at");
    asset.updatedAt = stringField(element, "updated_at");

    PLOG_DEBUG << "Parsed asset: " << asset.name << " (ID=" << asset.id << ", Size=" << asset.size << ")";
    return asset;
}

std::optional<ReleaseInfo> parseRelease(const json& element)
{
    if (!element.is_object())
        return std::nullopt;

    ReleaseInfo release;
    release.version = stringField(element, "tag_name");
    if (release.version.empty())
    {
        PLOG_DEBUG << "Skipping release without tag_name";
        return std::nullopt;
    }

    release.name = stringField(element, "name");
    release.description = stringField(element, "body");
    release.publishedAt = stringField(element, "published_at");
    release.isPreRelease = boolField(element, "prerelease");
    release.isDraft = boolField(element, "draft");
    release.htmlUrl = stringField(element, "html_url");
    release.apiUrl = stringField(element, "url");

    if (auto it = element.find("assets"); it != element.end() && it->is_array())
    {
        for (const auto& assetElement : *it)
        {
            if (auto asset = parseAsset(assetElement))
                release.assets.push_back(std::move(*asset));
        }
    }

    // Explicit list wins over whatever the changelog text says
    if (auto it = element.find("breaking_changes"); it != element.end() && it->is_array())
    {
        for (const auto& item : *it)
        {
            if (item.is_string())
                release.breakingChanges.push_back(item.get<std::string>());
        }
    }
    else
    {
        release.breakingChanges = ReleaseCatalogClient::extractBreakingChanges(release.description);
    }

    return release;
}

} // namespace

struct ReleaseCatalogClient::Impl
{
    std::shared_ptr<utils::IHttpClient> http;
    FeedConfig config;

    mutable std::mutex rateMutex;
    int rateLimitRemaining = 60;
    std::chrono::system_clock::time_point rateLimitReset = std::chrono::system_clock::now();

    std::thread fetchThread;

    Impl(std::shared_ptr<utils::IHttpClient> h, FeedConfig c)
        : http(std::move(h))
        , config(std::move(c))
    {
    }

    ~Impl()
    {
        if (fetchThread.joinable())
        {
            fetchThread.join();
        }
    }

    utils::SessionConfig sessionConfig(const utils::CancellationToken* cancel) const
    {
        utils::SessionConfig cfg;
        cfg.connect_timeout_ms = config.connectTimeoutMs;
        cfg.timeout_ms = config.timeoutMs;
        cfg.cancel = cancel;
        return cfg;
    }

    void updateRateLimit(const utils::HttpResponse& response)
    {
        std::lock_guard<std::mutex> lock(rateMutex);
        try
        {
            auto remaining = response.header("X-RateLimit-Remaining");
            if (!remaining.empty())
                rateLimitRemaining = std::stoi(remaining);

            auto reset = response.header("X-RateLimit-Reset");
            if (!reset.empty())
                rateLimitReset = std::chrono::system_clock::time_point(std::chrono::seconds(std::stoll(reset)));
        }
        catch (const std::exception& e)
        {
            PLOG_DEBUG << "Ignoring malformed rate limit header: " << e.what();
        }
    }

    // Single GET + parse; every outcome becomes a CatalogResult
    CatalogResult query(const std::string& url, const utils::CancellationToken* cancel, const std::vector<utils::Header>& headers)
    {
        CatalogResult result;
        if (utils::isCancelled(cancel))
        {
            result.failure = FailureKind::Cancelled;
            result.error = "Release query cancelled";
            return result;
        }

        PLOG_DEBUG << "Querying release feed: " << url;
        auto response = http->get(url, headers, sessionConfig(cancel));
        updateRateLimit(response);

        if (response.cancelled)
        {
            result.failure = FailureKind::Cancelled;
            result.error = "Release query cancelled";
            return result;
        }
        if (!response.error.empty())
        {
            result.failure = FailureKind::Transient;
            result.error = "Release feed unreachable: " + response.error;
            PLOG_WARNING << result.error;
            return result;
        }
        if (response.status_code < 200 || response.status_code >= 300)
        {
            // 5xx and rate limiting are worth retrying, anything else needs an operator
            bool retryable = response.status_code >= 500 || response.status_code == 403 || response.status_code == 429;
            result.failure = retryable ? FailureKind::Transient : FailureKind::Data;
            result.error = "Release feed returned status " + std::to_string(response.status_code);
            if (response.status_code == 404)
                result.error += " (not found)";
            PLOG_WARNING << result.error;
            return result;
        }

        std::string parseError;
        if (!parseReleases(response.text, result.releases, parseError))
        {
            result.failure = FailureKind::Data;
            result.error = parseError;
            PLOG_ERROR << result.error;
            return result;
        }

        result.success = true;
        return result;
    }
};

ReleaseCatalogClient::ReleaseCatalogClient(std::shared_ptr<utils::IHttpClient> http, FeedConfig config)
    : impl_(std::make_unique<Impl>(std::move(http), std::move(config)))
{
}

ReleaseCatalogClient::~ReleaseCatalogClient() = default;

std::vector<utils::Header> ReleaseCatalogClient::requestHeaders() const
{
    std::vector<utils::Header> headers{ { "User-Agent", impl_->config.userAgent },
                                        { "Accept", "application/vnd.github+json" } };
    if (!impl_->config.authToken.empty())
    {
        headers.push_back({ "Authorization", "Bearer " + impl_->config.authToken });
    }
    return headers;
}

CatalogResult ReleaseCatalogClient::fetchReleases(const utils::CancellationToken* cancel, int perPage, int page)
{
    PLOG_INFO << "Listing releases from " << impl_->config.baseUrl;
    const std::string url = impl_->config.baseUrl + "/releases?per_page=" + std::to_string(perPage) +
                            "&page=" + std::to_string(page);
    auto result = impl_->query(url, cancel, requestHeaders());
    if (result.success)
    {
        PLOG_INFO << "Release feed returned " << result.releases.size() << " releases";
    }
    return result;
}

void ReleaseCatalogClient::fetchReleasesAsync(CatalogCallback callback, const utils::CancellationToken* cancel)
{
    if (!callback)
    {
        PLOG_ERROR << "ReleaseCatalogClient: callback is null";
        return;
    }

    if (impl_->fetchThread.joinable())
    {
        impl_->fetchThread.join();
    }

    impl_->fetchThread = std::thread(
        [this, callback, cancel]()
        {
            callback(fetchReleases(cancel));
        });
}

CatalogResult ReleaseCatalogClient::fetchLatestRelease(const utils::CancellationToken* cancel)
{
    // Cache-busting parameter forces fresh data through intermediate caches
    auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
    const std::string url = impl_->config.baseUrl + "/releases/latest?t=" + std::to_string(ticks);

    auto result = impl_->query(url, cancel, requestHeaders());
    if (result.success || result.failure == FailureKind::Cancelled)
    {
        return result;
    }

    PLOG_INFO << "/releases/latest failed (" << result.error << "), falling back to the release list";
    auto listed = fetchReleases(cancel, 1, 1);
    if (listed.success && !listed.releases.empty())
    {
        listed.releases.resize(1);
        return listed;
    }
    return result;
}

CatalogResult ReleaseCatalogClient::fetchReleaseByTag(const std::string& tag, const utils::CancellationToken* cancel)
{
    std::string versionTag = tag;
    if (versionTag.empty() || (versionTag[0] != 'v' && versionTag[0] != 'V'))
    {
        versionTag = "v" + versionTag;
    }

    return impl_->query(impl_->config.baseUrl + "/releases/tags/" + versionTag, cancel, requestHeaders());
}

std::string ReleaseCatalogClient::assetApiUrl(std::int64_t assetId) const
{
    return impl_->config.baseUrl + "/releases/assets/" + std::to_string(assetId);
}

int ReleaseCatalogClient::rateLimitRemaining() const
{
    std::lock_guard<std::mutex> lock(impl_->rateMutex);
    return impl_->rateLimitRemaining;
}

std::chrono::system_clock::time_point ReleaseCatalogClient::rateLimitReset() const
{
    std::lock_guard<std::mutex> lock(impl_->rateMutex);
    return impl_->rateLimitReset;
}

bool ReleaseCatalogClient::hasRateLimitAvailable() const
{
    std::lock_guard<std::mutex> lock(impl_->rateMutex);
    if (std::chrono::system_clock::now() >= impl_->rateLimitReset)
    {
        return true;
    }
    return impl_->rateLimitRemaining > 0;
}

bool ReleaseCatalogClient::parseReleases(const std::string& text, std::vector<ReleaseInfo>& outReleases,
                                         std::string& outError)
{
    try
    {
        json doc = json::parse(text);
        outReleases.clear();

        if (doc.is_array())
        {
            for (const auto& element : doc)
            {
                if (auto release = parseRelease(element))
                    outReleases.push_back(std::move(*release));
            }
            return true;
        }

        if (doc.is_object())
        {
            auto release = parseRelease(doc);
            if (!release)
            {
                outError = "Release payload missing 'tag_name'";
                return false;
            }
            outReleases.push_back(std::move(*release));
            return true;
        }

        outError = "Release payload is neither an array nor an object";
        return false;
    }
    catch (const json::exception& e)
    {
        outError = std::string("Release feed parse error: ") + e.what();
        return false;
    }
}

std::optional<ReleaseAsset> ReleaseCatalogClient::findAsset(const ReleaseInfo& release, const std::string& exactName)
{
    for (const auto& asset : release.assets)
    {
        if (utils::iequals(asset.name, exactName))
            return asset;
    }
    return std::nullopt;
}

std::optional<ReleaseAsset> ReleaseCatalogClient::findAssetByPattern(const ReleaseInfo& release,
                                                                     const std::string& pattern)
{
    try
    {
        std::regex regex(wildcardToRegex(pattern), std::regex::ECMAScript | std::regex::icase);
        for (const auto& asset : release.assets)
        {
            if (std::regex_match(asset.name, regex))
                return asset;
        }
    }
    catch (const std::regex_error& e)
    {
        PLOG_ERROR << "Invalid asset pattern '" << pattern << "': " << e.what();
    }
    return std::nullopt;
}

std::string ReleaseCatalogClient::wildcardToRegex(const std::string& pattern)
{
    static const std::string kMeta = R"(\^$.|+()[]{})";

    std::string out = "^";
    out.reserve(pattern.size() * 2 + 2);
    for (char c : pattern)
    {
        if (c == '*')
        {
            out += ".*";
        }
        else if (c == '?')
        {
            out += '.';
        }
        else
        {
            if (kMeta.find(c) != std::string::npos)
                out += '\\';
            out += c;
        }
    }
    out += '$';
    return out;
}

std::vector<std::string> ReleaseCatalogClient::extractBreakingChanges(const std::string& body)
{
    std::vector<std::string> changes;
    bool inSection = false;

    std::size_t start = 0;
    while (start <= body.size())
    {
        std::size_t end = body.find('\n', start);
        if (end == std::string::npos)
            end = body.size();

        std::string line = body.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::size_t first = line.find_first_not_of(" \t");
        if (first != std::string::npos)
        {
            std::string trimmed = line.substr(first);
            if (trimmed[0] == '#')
            {
                inSection = toLower(trimmed).find("breaking") != std::string::npos;
            }
            else if (inSection && trimmed.size() > 2 && (trimmed[0] == '-' || trimmed[0] == '*') && trimmed[1] == ' ')
            {
                std::string item = trimmed.substr(2);
                item.erase(item.find_last_not_of(" \t") + 1);
                if (!item.empty())
                    changes.push_back(item);
            }
        }

        if (end == body.size())
            break;
        start = end + 1;
    }

    return changes;
}

} // namespace upgrade
