#pragma once

#include "UpgradeTypes.hpp"
#include "../utils/HttpCommon.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace upgrade
{

struct DownloadOptions
{
    int connectTimeoutMs = 10000;
    int timeoutMs = 0; // Overall limit; 0 lets large packages take as long as they need
    int lowSpeedLimitSeconds = 30; // A read stalled this long fails the transfer
    int progressIntervalMs = 100; // Minimum gap between progress callbacks
    std::string userAgent = "storeup-updater";
    std::vector<utils::Header> extraHeaders; // Sent with every request
    std::vector<utils::Header> apiHeaders; // Only for the asset API fallback (e.g. Authorization)
};

struct DownloadResult
{
    bool success = false;
    std::string filePath;
    std::uint64_t bytesWritten = 0;
    int statusCode = 0;
    FailureKind failure = FailureKind::None;
    std::string error;
};

using DownloadProgressCallback = std::function<void(const DownloadProgress& progress)>;
using DownloadCompleteCallback = std::function<void(const DownloadResult& result)>;

// Streams a release asset to disk. The body lands in "<dest>.part" and is renamed
// over the destination only once complete, so the destination never holds a partial file.
class DownloadManager
{
public:
    explicit DownloadManager(std::shared_ptr<utils::IHttpClient> http, DownloadOptions options = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Blocking. Progress callbacks run on the calling thread.
    DownloadResult download(const std::string& url, const std::string& destPath,
                            DownloadProgressCallback onProgress = nullptr,
                            const utils::CancellationToken* cancel = nullptr,
                            const std::vector<utils::Header>& headers = {});

    // Tries the browser URL first; when the server refuses it and the asset id is known,
    // retries through the API endpoint with "Accept: application/octet-stream".
    DownloadResult downloadAsset(const ReleaseAsset& asset, const std::string& assetApiUrl,
                                 const std::string& destPath, DownloadProgressCallback onProgress = nullptr,
                                 const utils::CancellationToken* cancel = nullptr);

    // Runs download() on a worker thread; both callbacks fire on that thread
    void downloadAsync(const std::string& url, const std::string& destPath, DownloadProgressCallback onProgress,
                       DownloadCompleteCallback onComplete, const utils::CancellationToken* cancel = nullptr);

    bool isDownloading() const;

    // Verify SHA-256 checksum of downloaded file (hex, case-insensitive)
    static bool verifyChecksum(const std::string& filePath, const std::string& expectedSha256, std::string& outError);

    // Extracts the digest from a "<hex>  <file>" checksum listing (or a bare digest)
    static std::string parseChecksumText(const std::string& text, const std::string& assetName);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace upgrade
