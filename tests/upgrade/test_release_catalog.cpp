#include <catch2/catch_test_macros.hpp>
#include "upgrade/ReleaseCatalogClient.hpp"
#include "../utils/mock_http.hpp"

#include <condition_variable>
#include <mutex>

using namespace upgrade;
using test_utils::MockHttpClient;
using test_utils::MockResponse;
using test_utils::MockResponses;

namespace
{

const std::string kBaseUrl = "https://api.example.com/repos/acme/storefront";

FeedConfig feedConfig(const std::string& token = "")
{
    FeedConfig config;
    config.baseUrl = kBaseUrl;
    config.authToken = token;
    return config;
}

ReleaseInfo releaseWithAssets(const std::vector<std::string>& names)
{
    ReleaseInfo release;
    release.version = "v1.2.3";
    for (const auto& name : names)
    {
        ReleaseAsset asset;
        asset.name = name;
        asset.browserDownloadUrl = "https://dl.example.com/" + name;
        release.assets.push_back(asset);
    }
    return release;
}

} // namespace

TEST_CASE("ReleaseCatalogClient parses feed payloads", "[catalog]")
{
    SECTION("Release array with assets")
    {
        std::string json = R"([
            {
                "tag_name": "v2.0.0",
                "name": "Storefront 2.0",
                "body": "Changes",
                "published_at": "2024-05-01T10:00:00Z",
                "prerelease": false,
                "draft": false,
                "html_url": "https://example.com/acme/storefront/releases/tag/v2.0.0",
                "assets": [
                    {
                        "id": 42,
                        "name": "App-2.0.0.zip",
                        "browser_download_url": "https://dl.example.com/App-2.0.0.zip",
                        "size": 1000000,
                        "content_type": "application/zip"
                    }
                ]
            },
            {
                "tag_name": "v1.9.0-rc1",
                "body": null,
                "prerelease": true,
                "assets": []
            }
        ])";

        std::vector<ReleaseInfo> releases;
        std::string error;
        REQUIRE(ReleaseCatalogClient::parseReleases(json, releases, error));
        REQUIRE(releases.size() == 2);

        const auto& first = releases[0];
        REQUIRE(first.version == "v2.0.0");
        REQUIRE(first.name == "Storefront 2.0");
        REQUIRE(first.publishedAt == "2024-05-01T10:00:00Z");
        REQUIRE_FALSE(first.isPreRelease);
        REQUIRE(first.assets.size() == 1);
        REQUIRE(first.assets[0].id == 42);
        REQUIRE(first.assets[0].size == 1000000);
        REQUIRE(first.assets[0].contentType == "application/zip");

        REQUIRE(releases[1].isPreRelease);
        REQUIRE(releases[1].description.empty());
    }

    SECTION("Single release object")
    {
        std::vector<ReleaseInfo> releases;
        std::string error;
        REQUIRE(ReleaseCatalogClient::parseReleases(
            MockResponses::release_json("v1.0.0", "2024-01-01T00:00:00Z", { "App-1.0.0.zip" }), releases, error));
        REQUIRE(releases.size() == 1);
        REQUIRE(releases[0].assets[0].browserDownloadUrl == "https://dl.example.com/v1.0.0/App-1.0.0.zip");
    }

    SECTION("Entries without tag or download URL are skipped")
    {
        std::string json = R"([
            { "name": "untagged" },
            { "tag_name": "v1.0.0", "assets": [ { "name": "App.zip" }, { "name": "App2.zip", "browser_download_url": "https://x/App2.zip" } ] }
        ])";
        std::vector<ReleaseInfo> releases;
        std::string error;
        REQUIRE(ReleaseCatalogClient::parseReleases(json, releases, error));
        REQUIRE(releases.size() == 1);
        REQUIRE(releases[0].assets.size() == 1);
        REQUIRE(releases[0].assets[0].name == "App2.zip");
    }

    SECTION("Malformed JSON is a parse failure")
    {
        std::vector<ReleaseInfo> releases;
        std::string error;
        REQUIRE_FALSE(ReleaseCatalogClient::parseReleases("{ not json", releases, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(ReleaseCatalogClient::parseReleases("42", releases, error));
    }
}

TEST_CASE("ReleaseCatalogClient asset lookup", "[catalog][assets]")
{
    auto release = releaseWithAssets({ "OtherApp-1.2.3.zip", "App-1.2.3.ZIP", "App-1.2.3.zip.sha256" });

    SECTION("Wildcard pattern matches case-insensitively on the whole name")
    {
        auto asset = ReleaseCatalogClient::findAssetByPattern(release, "App-*.zip");
        REQUIRE(asset.has_value());
        REQUIRE(asset->name == "App-1.2.3.ZIP");
    }

    SECTION("Pattern without a match")
    {
        REQUIRE_FALSE(ReleaseCatalogClient::findAssetByPattern(release, "Setup-*.exe").has_value());
    }

    SECTION("Question mark matches one character")
    {
        auto asset = ReleaseCatalogClient::findAssetByPattern(release, "App-?.?.?.zip");
        REQUIRE(asset.has_value());
        REQUIRE(asset->name == "App-1.2.3.ZIP");
    }

    SECTION("Regex metacharacters in the pattern are literal")
    {
        auto dotted = releaseWithAssets({ "AppX1-2-3.zip", "App.1.zip" });
        auto asset = ReleaseCatalogClient::findAssetByPattern(dotted, "App.*.zip");
        REQUIRE(asset.has_value());
        REQUIRE(asset->name == "App.1.zip");
    }

    SECTION("Exact lookup ignores case")
    {
        auto asset = ReleaseCatalogClient::findAsset(release, "app-1.2.3.zip");
        REQUIRE(asset.has_value());
        REQUIRE(asset->name == "App-1.2.3.ZIP");
        REQUIRE_FALSE(ReleaseCatalogClient::findAsset(release, "App-1.2.zip").has_value());
    }

    SECTION("Regex source")
    {
        REQUIRE(ReleaseCatalogClient::wildcardToRegex("a*.zip") == "^a.*\\.zip$");
        REQUIRE(ReleaseCatalogClient::wildcardToRegex("x(1)?") == "^x\\(1\\).$");
    }
}

TEST_CASE("ReleaseCatalogClient extracts breaking changes", "[catalog][changelog]")
{
    SECTION("Bullets under a breaking heading")
    {
        std::string body = "## Features\n"
                           "- New checkout\n"
                           "## Breaking Changes\r\n"
                           "- Removed legacy API\n"
                           "* Config moved to appsettings.json  \n"
                           "\n"
                           "### Fixes\n"
                           "- Typo\n";
        auto changes = ReleaseCatalogClient::extractBreakingChanges(body);
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[0] == "Removed legacy API");
        REQUIRE(changes[1] == "Config moved to appsettings.json");
    }

    SECTION("No section, no changes")
    {
        REQUIRE(ReleaseCatalogClient::extractBreakingChanges("- Just a fix").empty());
        REQUIRE(ReleaseCatalogClient::extractBreakingChanges("").empty());
    }

    SECTION("Explicit list in the payload wins over the body")
    {
        std::string json = R"({
            "tag_name": "v3.0.0",
            "body": "## BREAKING\n- From body",
            "breaking_changes": ["From list A", "From list B"]
        })";
        std::vector<ReleaseInfo> releases;
        std::string error;
        REQUIRE(ReleaseCatalogClient::parseReleases(json, releases, error));
        REQUIRE(releases[0].breakingChanges == std::vector<std::string>{ "From list A", "From list B" });
    }

    SECTION("Body is scanned when no list is given")
    {
        std::vector<ReleaseInfo> releases;
        std::string error;
        REQUIRE(ReleaseCatalogClient::parseReleases(
            MockResponses::release_json("v3.0.0", "2024-01-01T00:00:00Z", {}, false, "# Breaking\n- Dropped IE"),
            releases, error));
        REQUIRE(releases[0].breakingChanges == std::vector<std::string>{ "Dropped IE" });
    }
}

TEST_CASE("ReleaseCatalogClient queries the feed", "[catalog][http]")
{
    auto http = std::make_shared<MockHttpClient>();

    SECTION("Listing uses paging parameters and feed headers")
    {
        http->setResponse(kBaseUrl + "/releases?per_page=20&page=1",
                          MockResponses::releases({ MockResponses::release_json("v1.0.0", "2024-01-01T00:00:00Z",
                                                                                { "App-1.0.0.zip" }) }));
        ReleaseCatalogClient client(http, feedConfig("secret"));
        auto result = client.fetchReleases();
        REQUIRE(result.success);
        REQUIRE(result.releases.size() == 1);

        auto requests = http->requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].header("User-Agent") == "storeup-updater");
        REQUIRE(requests[0].header("Accept") == "application/vnd.github+json");
        REQUIRE(requests[0].header("Authorization") == "Bearer secret");
    }

    SECTION("No token, no Authorization header")
    {
        ReleaseCatalogClient client(http, feedConfig());
        for (const auto& header : client.requestHeaders())
        {
            REQUIRE(header.name != "Authorization");
        }
    }

    SECTION("Server errors are transient")
    {
        http->setPatternResponse("/releases\\?", MockResponses::status(503));
        ReleaseCatalogClient client(http, feedConfig());
        auto result = client.fetchReleases();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.failure == FailureKind::Transient);
    }

    SECTION("Missing repository is a data failure")
    {
        ReleaseCatalogClient client(http, feedConfig());
        auto result = client.fetchReleases();
        REQUIRE(result.failure == FailureKind::Data);
        REQUIRE(result.error.find("404") != std::string::npos);
    }

    SECTION("Unreachable feed is transient")
    {
        http->simulateNetworkError("Could not resolve host");
        ReleaseCatalogClient client(http, feedConfig());
        auto result = client.fetchReleases();
        REQUIRE(result.failure == FailureKind::Transient);
        REQUIRE(result.error.find("Could not resolve host") != std::string::npos);
    }

    SECTION("Garbage payload is a data failure")
    {
        MockResponse garbage;
        garbage.body = "<html>maintenance</html>";
        http->setPatternResponse("/releases\\?", garbage);
        ReleaseCatalogClient client(http, feedConfig());
        REQUIRE(client.fetchReleases().failure == FailureKind::Data);
    }

    SECTION("Cancelled before the request")
    {
        utils::CancellationToken cancel;
        cancel.cancel();
        ReleaseCatalogClient client(http, feedConfig());
        auto result = client.fetchReleases(&cancel);
        REQUIRE(result.failure == FailureKind::Cancelled);
        REQUIRE(http->requestCount() == 0);
    }

    SECTION("Latest falls back to the first listed release")
    {
        http->setPatternResponse("/releases/latest", MockResponses::status(500));
        http->setResponse(kBaseUrl + "/releases?per_page=1&page=1",
                          MockResponses::releases({ MockResponses::release_json("v1.4.0", "2024-03-01T00:00:00Z", {}) }));
        ReleaseCatalogClient client(http, feedConfig());
        auto result = client.fetchLatestRelease();
        REQUIRE(result.success);
        REQUIRE(result.releases.size() == 1);
        REQUIRE(result.releases[0].version == "v1.4.0");
        REQUIRE(http->requestCount() == 2);
    }

    SECTION("Latest served directly")
    {
        http->setPatternResponse("/releases/latest\\?t=",
                                 MockResponses::single_release(
                                     MockResponses::release_json("v1.5.0", "2024-04-01T00:00:00Z", {})));
        ReleaseCatalogClient client(http, feedConfig());
        auto result = client.fetchLatestRelease();
        REQUIRE(result.success);
        REQUIRE(result.releases[0].version == "v1.5.0");
        REQUIRE(http->requestCount() == 1);
    }

    SECTION("Tag lookup adds the v prefix")
    {
        http->setResponse(kBaseUrl + "/releases/tags/v1.2.3",
                          MockResponses::single_release(
                              MockResponses::release_json("v1.2.3", "2024-02-01T00:00:00Z", {})));
        ReleaseCatalogClient client(http, feedConfig());
        REQUIRE(client.fetchReleaseByTag("1.2.3").success);
        REQUIRE(client.fetchReleaseByTag("v1.2.3").success);
    }

    SECTION("Asset API URL")
    {
        ReleaseCatalogClient client(http, feedConfig());
        REQUIRE(client.assetApiUrl(77) == kBaseUrl + "/releases/assets/77");
    }
}

TEST_CASE("ReleaseCatalogClient tracks rate limits", "[catalog][ratelimit]")
{
    auto http = std::make_shared<MockHttpClient>();
    auto response = MockResponses::releases({});
    response.headers = { { "x-ratelimit-remaining", "0" }, { "X-RateLimit-Reset", "4102444800" } };
    http->setPatternResponse("/releases\\?", response);

    ReleaseCatalogClient client(http, feedConfig());
    REQUIRE(client.hasRateLimitAvailable());

    REQUIRE(client.fetchReleases().success);
    REQUIRE(client.rateLimitRemaining() == 0);
    REQUIRE_FALSE(client.hasRateLimitAvailable());
}

TEST_CASE("ReleaseCatalogClient async listing", "[catalog][async]")
{
    auto http = std::make_shared<MockHttpClient>();
    http->setPatternResponse("/releases\\?",
                             MockResponses::releases({ MockResponses::release_json("v1.0.0", "2024-01-01T00:00:00Z", {}) }));

    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    CatalogResult received;

    {
        ReleaseCatalogClient client(http, feedConfig());
        client.fetchReleasesAsync(
            [&](const CatalogResult& result)
            {
                std::lock_guard<std::mutex> lock(mutex);
                received = result;
                done = true;
                cv.notify_one();
            });

        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return done; }));
    }

    REQUIRE(received.success);
    REQUIRE(received.releases.size() == 1);
}
