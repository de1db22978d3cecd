#include "DownloadManager.hpp"

#include <plog/Log.h>

#include <picosha2.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace upgrade
{

namespace
{

bool isSuccessStatus(int status) { return status >= 200 && status < 300; }

// Server-side trouble is worth another attempt; 4xx means the URL itself is wrong
FailureKind classifyStatus(int status)
{
    if (status >= 500 || status == 408 || status == 429)
        return FailureKind::Transient;
    return FailureKind::Data;
}

void removeQuietly(const fs::path& path)
{
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove " << path.string() << ": " << ec.message();
    }
}

bool isHexDigest(const std::string& s)
{
    return s.size() == picosha2::k_digest_size * 2 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

struct DownloadManager::Impl
{
    std::shared_ptr<utils::IHttpClient> http;
    DownloadOptions options;
    std::atomic<bool> downloading{ false };
    std::thread downloadThread;

    Impl(std::shared_ptr<utils::IHttpClient> h, DownloadOptions o)
        : http(std::move(h))
        , options(std::move(o))
    {
    }

    ~Impl()
    {
        if (downloadThread.joinable())
        {
            downloadThread.join();
        }
    }

    DownloadResult run(const std::string& url, const std::string& destPath, const DownloadProgressCallback& onProgress,
                       const utils::CancellationToken* cancel, const std::vector<utils::Header>& requestHeaders);
};

DownloadResult DownloadManager::Impl::run(const std::string& url, const std::string& destPath,
                                          const DownloadProgressCallback& onProgress,
                                          const utils::CancellationToken* cancel,
                                          const std::vector<utils::Header>& requestHeaders)
{
    DownloadResult result;
    result.filePath = destPath;

    if (utils::isCancelled(cancel))
    {
        result.failure = FailureKind::Cancelled;
        result.error = "Download cancelled";
        return result;
    }

    const fs::path target(destPath);
    fs::path partial = target;
    partial += ".part";

    std::error_code ec;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            result.failure = FailureKind::Configuration;
            result.error = "Cannot create download directory: " + ec.message();
            PLOG_ERROR << result.error;
            return result;
        }
    }
    // A leftover from an earlier run must not be mistaken for this download
    removeQuietly(target);
    removeQuietly(partial);

    std::ofstream outputFile(partial, std::ios::binary | std::ios::trunc);
    if (!outputFile.is_open())
    {
        result.failure = FailureKind::Configuration;
        result.error = "Failed to create output file: " + partial.string();
        PLOG_ERROR << result.error;
        return result;
    }

    PLOG_INFO << "Starting download: " << url;

    int status = 0;
    std::uint64_t total = 0;
    std::uint64_t received = 0;
    std::uint64_t lastReportedBytes = 0;
    bool reportedAny = false;
    bool rejected = false;
    bool writeFailed = false;
    auto startTime = std::chrono::steady_clock::now();
    auto lastProgressTime = startTime;

    auto report = [&](std::chrono::steady_clock::time_point now)
    {
        if (!onProgress)
            return;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime);
        onProgress(DownloadProgress::compute(received, total, elapsed));
        lastReportedBytes = received;
        lastProgressTime = now;
        reportedAny = true;
    };

    utils::StreamHandlers handlers;
    handlers.on_start = [&](int statusCode, std::uint64_t contentLength)
    {
        status = statusCode;
        total = contentLength;
        startTime = std::chrono::steady_clock::now();
        lastProgressTime = startTime;
    };
    handlers.on_chunk = [&](std::string_view chunk) -> bool
    {
        if (!isSuccessStatus(status))
        {
            rejected = true;
            return false;
        }
        if (utils::isCancelled(cancel))
        {
            return false;
        }

        outputFile.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!outputFile)
        {
            writeFailed = true;
            return false;
        }
        received += chunk.size();

        auto now = std::chrono::steady_clock::now();
        auto sinceLast = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressTime).count();
        bool finalChunk = total > 0 && received >= total;
        if (!reportedAny || finalChunk || sinceLast >= options.progressIntervalMs)
        {
            report(now);
        }
        return true;
    };

    utils::SessionConfig cfg;
    cfg.connect_timeout_ms = options.connectTimeoutMs;
    cfg.timeout_ms = options.timeoutMs;
    cfg.low_speed_time_s = options.lowSpeedLimitSeconds;
    cfg.cancel = cancel;

    std::vector<utils::Header> headers{ { "User-Agent", options.userAgent } };
    headers.insert(headers.end(), options.extraHeaders.begin(), options.extraHeaders.end());
    headers.insert(headers.end(), requestHeaders.begin(), requestHeaders.end());

    auto response = http->stream(url, headers, cfg, handlers);
    outputFile.close();

    if (status == 0)
        status = response.status_code;
    result.statusCode = status;

    auto fail = [&](FailureKind kind, const std::string& message)
    {
        removeQuietly(partial);
        result.failure = kind;
        result.error = message;
        result.bytesWritten = 0;
        return result;
    };

    if (rejected || (response.error.empty() && !response.cancelled && !isSuccessStatus(status)))
    {
        PLOG_ERROR << "Download failed with status: " << status;
        return fail(classifyStatus(status), "HTTP error " + std::to_string(status));
    }
    if (writeFailed)
    {
        PLOG_ERROR << "Failed writing to " << partial.string();
        return fail(FailureKind::Transient, "Failed to write downloaded data to disk");
    }
    if (response.cancelled || utils::isCancelled(cancel))
    {
        PLOG_INFO << "Download cancelled after " << received << " bytes";
        return fail(FailureKind::Cancelled, "Download cancelled");
    }
    if (!response.error.empty())
    {
        PLOG_ERROR << "Download failed: " << response.error;
        return fail(FailureKind::Transient, "Network error: " + response.error);
    }
    if (total > 0 && received != total)
    {
        PLOG_ERROR << "Incomplete download: " << received << " of " << total << " bytes";
        return fail(FailureKind::Transient, "Incomplete download: received " + std::to_string(received) + " of " +
                                                std::to_string(total) + " bytes");
    }

    if (!reportedAny || lastReportedBytes != received)
    {
        report(std::chrono::steady_clock::now());
    }

    fs::rename(partial, target, ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to move " << partial.string() << " into place: " << ec.message();
        return fail(FailureKind::Transient, "Failed to finalize download: " + ec.message());
    }

    result.success = true;
    result.bytesWritten = received;
    PLOG_INFO << "Download completed: " << destPath << " (" << DownloadProgress::formatBytes(received) << ")";
    return result;
}

DownloadManager::DownloadManager(std::shared_ptr<utils::IHttpClient> http, DownloadOptions options)
    : impl_(std::make_unique<Impl>(std::move(http), std::move(options)))
{
}

DownloadManager::~DownloadManager() = default;

DownloadResult DownloadManager::download(const std::string& url, const std::string& destPath,
                                         DownloadProgressCallback onProgress,
                                         const utils::CancellationToken* cancel,
                                         const std::vector<utils::Header>& headers)
{
    bool expected = false;
    if (!impl_->downloading.compare_exchange_strong(expected, true))
    {
        PLOG_WARNING << "Download already in progress";
        DownloadResult busy;
        busy.filePath = destPath;
        busy.failure = FailureKind::Transient;
        busy.error = "Download already in progress";
        return busy;
    }

    DownloadResult result;
    try
    {
        result = impl_->run(url, destPath, onProgress, cancel, headers);
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Download aborted: " << e.what();
        std::error_code ec;
        fs::remove(fs::path(destPath + ".part"), ec);
        result.filePath = destPath;
        result.failure = FailureKind::Transient;
        result.error = std::string("Download aborted: ") + e.what();
    }

    impl_->downloading = false;
    return result;
}

DownloadResult DownloadManager::downloadAsset(const ReleaseAsset& asset, const std::string& assetApiUrl,
                                              const std::string& destPath, DownloadProgressCallback onProgress,
                                              const utils::CancellationToken* cancel)
{
    auto result = download(asset.browserDownloadUrl, destPath, onProgress, cancel);
    if (result.success || result.statusCode == 0 || isSuccessStatus(result.statusCode))
    {
        return result;
    }
    if (asset.id == 0 || assetApiUrl.empty())
    {
        return result;
    }

    PLOG_INFO << "Browser download refused (HTTP " << result.statusCode << "), retrying via asset API: "
              << assetApiUrl;
    std::vector<utils::Header> headers = impl_->options.apiHeaders;
    headers.push_back({ "Accept", "application/octet-stream" });
    return download(assetApiUrl, destPath, onProgress, cancel, headers);
}

void DownloadManager::downloadAsync(const std::string& url, const std::string& destPath,
                                    DownloadProgressCallback onProgress, DownloadCompleteCallback onComplete,
                                    const utils::CancellationToken* cancel)
{
    if (impl_->downloading)
    {
        PLOG_WARNING << "Download already in progress";
        if (onComplete)
        {
            DownloadResult busy;
            busy.filePath = destPath;
            busy.failure = FailureKind::Transient;
            busy.error = "Download already in progress";
            onComplete(busy);
        }
        return;
    }

    if (impl_->downloadThread.joinable())
    {
        impl_->downloadThread.join();
    }

    impl_->downloadThread = std::thread(
        [this, url, destPath, onProgress, onComplete, cancel]()
        {
            auto result = download(url, destPath, onProgress, cancel);
            if (onComplete)
            {
                onComplete(result);
            }
        });
}

bool DownloadManager::isDownloading() const { return impl_->downloading.load(); }

bool DownloadManager::verifyChecksum(const std::string& filePath, const std::string& expectedSha256,
                                     std::string& outError)
{
    try
    {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open())
        {
            outError = "Failed to open file for checksum verification";
            return false;
        }

        std::vector<unsigned char> hash(picosha2::k_digest_size);
        picosha2::hash256(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>(), hash.begin(),
                          hash.end());

        std::string actualSha256 = picosha2::bytes_to_hex_string(hash.begin(), hash.end());
        std::string expected = toLower(expectedSha256);

        if (actualSha256 != expected)
        {
            outError = "Checksum mismatch: expected " + expected + ", got " + actualSha256;
            return false;
        }

        return true;
    }
    catch (const std::exception& e)
    {
        outError = std::string("Checksum verification error: ") + e.what();
        return false;
    }
}

std::string DownloadManager::parseChecksumText(const std::string& text, const std::string& assetName)
{
    std::istringstream lines(text);
    std::string line;
    std::string bare;
    while (std::getline(lines, line))
    {
        std::istringstream fields(line);
        std::string digest;
        std::string name;
        fields >> digest >> name;
        if (!isHexDigest(digest))
            continue;

        // sha256sum marks binary mode with a leading '*'
        if (!name.empty() && name[0] == '*')
            name.erase(0, 1);

        if (name.empty())
        {
            if (bare.empty())
                bare = toLower(digest);
        }
        else if (utils::iequals(name, assetName))
        {
            return toLower(digest);
        }
    }
    return bare;
}

} // namespace upgrade
