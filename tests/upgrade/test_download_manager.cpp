#include <catch2/catch_test_macros.hpp>
#include "upgrade/DownloadManager.hpp"
#include "../utils/mock_http.hpp"
#include "../utils/temp_dir.hpp"

#include <picosha2.h>

#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>

using namespace upgrade;
using test_utils::MockHttpClient;
using test_utils::MockResponses;
using test_utils::TempDir;

namespace fs = std::filesystem;

namespace
{

const std::string kAssetUrl = "https://dl.example.com/v2.0.0/App-2.0.0.zip";

DownloadOptions testOptions()
{
    DownloadOptions options;
    options.progressIntervalMs = 0;
    return options;
}

std::string readFile(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("DownloadManager streams to disk", "[download]")
{
    TempDir dir("storeup_download");
    auto http = std::make_shared<MockHttpClient>();
    http->setResponse(kAssetUrl, MockResponses::payload(100000, 10000));
    DownloadManager manager(http, testOptions());

    std::vector<DownloadProgress> reports;
    auto dest = dir.file("nested/App-2.0.0.zip");
    auto result = manager.download(kAssetUrl, dest, [&](const DownloadProgress& p) { reports.push_back(p); });

    REQUIRE(result.success);
    REQUIRE(result.bytesWritten == 100000);
    REQUIRE(result.statusCode == 200);
    REQUIRE(fs::file_size(dest) == 100000);
    REQUIRE_FALSE(fs::exists(dest + ".part"));

    REQUIRE_FALSE(reports.empty());
    REQUIRE(reports.front().bytesReceived == 10000);
    REQUIRE(reports.back().percentComplete() == 100);
    for (size_t i = 1; i < reports.size(); ++i)
    {
        REQUIRE(reports[i].bytesReceived >= reports[i - 1].bytesReceived);
    }

    auto requests = http->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].streamed);
    REQUIRE(requests[0].header("User-Agent") == "storeup-updater");
}

TEST_CASE("DownloadManager cancellation leaves no file", "[download][cancel]")
{
    TempDir dir("storeup_download");
    auto http = std::make_shared<MockHttpClient>();
    http->setResponse(kAssetUrl, MockResponses::payload(1000000, 100000));
    DownloadManager manager(http, testOptions());

    utils::CancellationToken cancel;
    auto dest = dir.file("App-2.0.0.zip");
    int lastPercent = 0;
    auto result = manager.download(
        kAssetUrl, dest,
        [&](const DownloadProgress& p)
        {
            lastPercent = p.percentComplete();
            if (lastPercent >= 40)
                cancel.cancel();
        },
        &cancel);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.failure == FailureKind::Cancelled);
    REQUIRE(lastPercent == 40);
    REQUIRE_FALSE(fs::exists(dest));
    REQUIRE_FALSE(fs::exists(dest + ".part"));
}

TEST_CASE("DownloadManager reports failures", "[download][errors]")
{
    TempDir dir("storeup_download");
    auto http = std::make_shared<MockHttpClient>();
    DownloadManager manager(http, testOptions());
    auto dest = dir.file("App-2.0.0.zip");

    SECTION("Not found")
    {
        auto result = manager.download(kAssetUrl, dest);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.statusCode == 404);
        REQUIRE(result.failure == FailureKind::Data);
        REQUIRE(result.error == "HTTP error 404");
        REQUIRE_FALSE(fs::exists(dest));
        REQUIRE_FALSE(fs::exists(dest + ".part"));
    }

    SECTION("Server error is transient")
    {
        http->setResponse(kAssetUrl, MockResponses::status(502));
        auto result = manager.download(kAssetUrl, dest);
        REQUIRE(result.failure == FailureKind::Transient);
    }

    SECTION("Network error")
    {
        http->setResponse(kAssetUrl, MockResponses::network_error());
        auto result = manager.download(kAssetUrl, dest);
        REQUIRE(result.failure == FailureKind::Transient);
        REQUIRE(result.error.find("Network error") != std::string::npos);
        REQUIRE_FALSE(fs::exists(dest + ".part"));
    }

    SECTION("Truncated body")
    {
        auto truncated = MockResponses::payload(5000, 1000);
        truncated.content_length = 8000;
        http->setResponse(kAssetUrl, truncated);
        auto result = manager.download(kAssetUrl, dest);
        REQUIRE(result.failure == FailureKind::Transient);
        REQUIRE(result.error.find("Incomplete download") != std::string::npos);
        REQUIRE_FALSE(fs::exists(dest));
    }

    SECTION("Stale file from an earlier run is replaced")
    {
        {
            std::ofstream stale(dest);
            stale << "old package";
        }
        http->setResponse(kAssetUrl, MockResponses::payload(300));
        auto result = manager.download(kAssetUrl, dest);
        REQUIRE(result.success);
        REQUIRE(fs::file_size(dest) == 300);
    }
}

TEST_CASE("DownloadManager falls back to the asset API", "[download][assets]")
{
    TempDir dir("storeup_download");
    auto http = std::make_shared<MockHttpClient>();
    const std::string apiUrl = "https://api.example.com/repos/acme/storefront/releases/assets/42";
    http->setResponse(kAssetUrl, MockResponses::status(403));
    http->setResponse(apiUrl, MockResponses::payload(2048));

    auto options = testOptions();
    options.apiHeaders = { { "Authorization", "Bearer secret" } };
    DownloadManager manager(http, options);

    ReleaseAsset asset;
    asset.id = 42;
    asset.name = "App-2.0.0.zip";
    asset.browserDownloadUrl = kAssetUrl;

    SECTION("Refused browser URL retries through the API")
    {
        auto result = manager.downloadAsset(asset, apiUrl, dir.file(asset.name));
        REQUIRE(result.success);
        REQUIRE(result.bytesWritten == 2048);

        auto requests = http->requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[0].header("Authorization").empty());
        REQUIRE(requests[1].url == apiUrl);
        REQUIRE(requests[1].header("Accept") == "application/octet-stream");
        REQUIRE(requests[1].header("Authorization") == "Bearer secret");
    }

    SECTION("No asset id, no fallback")
    {
        asset.id = 0;
        auto result = manager.downloadAsset(asset, apiUrl, dir.file(asset.name));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.statusCode == 403);
        REQUIRE(http->requestCount() == 1);
    }

    SECTION("Network errors are not retried")
    {
        http->setResponse(kAssetUrl, MockResponses::network_error());
        auto result = manager.downloadAsset(asset, apiUrl, dir.file(asset.name));
        REQUIRE_FALSE(result.success);
        REQUIRE(http->requestCount() == 1);
    }
}

TEST_CASE("DownloadManager async download", "[download][async]")
{
    TempDir dir("storeup_download");
    auto http = std::make_shared<MockHttpClient>();
    http->setResponse(kAssetUrl, MockResponses::payload(4096, 1024));

    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    DownloadResult completed;

    {
        DownloadManager manager(http, testOptions());
        manager.downloadAsync(kAssetUrl, dir.file("App.zip"), nullptr,
                              [&](const DownloadResult& result)
                              {
                                  std::lock_guard<std::mutex> lock(mutex);
                                  completed = result;
                                  done = true;
                                  cv.notify_one();
                              });

        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return done; }));
    }

    REQUIRE(completed.success);
    REQUIRE(completed.bytesWritten == 4096);
}

TEST_CASE("DownloadManager checksum helpers", "[download][checksum]")
{
    TempDir dir("storeup_download");
    const std::string content = "storefront package";
    const std::string path = dir.file("pkg.zip");
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << content;
    }
    const std::string digest = picosha2::hash256_hex_string(content);

    SECTION("Matching digest, any case")
    {
        std::string error;
        REQUIRE(DownloadManager::verifyChecksum(path, digest, error));
        std::string upper = digest;
        for (auto& c : upper)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        REQUIRE(DownloadManager::verifyChecksum(path, upper, error));
    }

    SECTION("Mismatch")
    {
        std::string error;
        REQUIRE_FALSE(DownloadManager::verifyChecksum(path, std::string(64, '0'), error));
        REQUIRE(error.find("Checksum mismatch") != std::string::npos);
    }

    SECTION("Missing file")
    {
        std::string error;
        REQUIRE_FALSE(DownloadManager::verifyChecksum(dir.file("absent.zip"), digest, error));
    }

    SECTION("Checksum listings")
    {
        const std::string other(64, 'a');
        std::string listing = other + "  Other.zip\n" + digest + " *pkg.zip\n";
        REQUIRE(DownloadManager::parseChecksumText(listing, "pkg.zip") == digest);
        REQUIRE(DownloadManager::parseChecksumText(digest + "\n", "pkg.zip") == digest);
        REQUIRE(DownloadManager::parseChecksumText("not a digest", "pkg.zip").empty());
        REQUIRE(DownloadManager::parseChecksumText(other + "  Other.zip\n", "pkg.zip").empty());
    }

    REQUIRE(readFile(path) == content);
}
