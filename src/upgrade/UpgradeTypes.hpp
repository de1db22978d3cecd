#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upgrade
{

// Orchestrator state machine
enum class PipelineState
{
    Idle,
    DetectingState, // Reading the installation record
    FreshInstall, // Nothing installed, install from scratch
    Upgrading, // Installed, moving to a newer release
    Reconfiguring, // Installed, settings-only change
    ResolvingRelease, // Querying the release feed
    Validating, // Checking the upgrade may proceed
    Downloading, // Streaming the release asset
    HandingOff, // Launching the upgrader process
    Applying, // Unpacking the package into the install path
    Committing, // Writing the new installation record
    Succeeded,
    HandedOff, // Upgrader process owns the rest of the run
    Failed
};

// Why a step failed; decides whether a retry makes sense
enum class FailureKind
{
    None,
    Transient, // Feed unreachable, download interrupted; safe to retry
    Data, // Malformed feed payload, asset not found
    StateStore, // Installation record unreadable or unwritable
    Protocol, // Handoff arguments missing or malformed
    Rejected, // Validator refused (downgrade, already current)
    Integrity, // Package does not match its published checksum
    Install, // Package could not be placed in the install path; previous files restored
    Cancelled,
    Configuration
};

struct ReleaseAsset
{
    std::int64_t id; // Feed-assigned asset id
    std::string name;
    std::string browserDownloadUrl;
    std::uint64_t size; // Size in bytes
    std::string contentType;
    std::string createdAt; // ISO 8601
    std::string updatedAt; // ISO 8601

    ReleaseAsset()
        : id(0)
        , size(0)
    {
    }
};

struct ReleaseInfo
{
    std::string version; // Tag, e.g. "v1.0.9"
    std::string name; // Release title
    std::string description; // Changelog body
    std::string publishedAt; // ISO 8601 UTC, sortable
    std::vector<ReleaseAsset> assets;
    std::vector<std::string> breakingChanges;
    bool isPreRelease;
    bool isDraft;
    std::string apiUrl;
    std::string htmlUrl;

    ReleaseInfo()
        : isPreRelease(false)
        , isDraft(false)
    {
    }
};

// Snapshot of an in-flight transfer. Never persisted.
struct DownloadProgress
{
    std::uint64_t bytesReceived;
    std::uint64_t totalBytes; // 0 when the server did not declare a length
    double speedBytesPerSecond; // Average since transfer start
    std::chrono::milliseconds eta;
    std::chrono::milliseconds elapsed;

    DownloadProgress()
        : bytesReceived(0)
        , totalBytes(0)
        , speedBytesPerSecond(0.0)
        , eta(0)
        , elapsed(0)
    {
    }

    // floor(received * 100 / total), clamped to [0, 100]; 0 while total is unknown
    int percentComplete() const;

    double speedMBps() const { return speedBytesPerSecond / (1024.0 * 1024.0); }

    // Derives speed and ETA from the cumulative counters
    static DownloadProgress compute(std::uint64_t received, std::uint64_t total, std::chrono::milliseconds elapsed);

    static std::string formatBytes(std::uint64_t bytes);

    // e.g. "40% - 400 KB / 1000 KB (1.25 MB/s, ETA: 3s)"
    std::string toString() const;
};

// The installation record as persisted in the state store
struct InstallationInfo
{
    std::string version;
    std::string installPath;
    std::string installDate; // "YYYY-MM-DD HH:MM:SS"
};

// Everything known about an installed site; what the installer hands to the upgrader
struct ExistingInstallation
{
    std::string siteName;
    std::string installPath;
    std::string version;
    std::string installDate;
    std::string databaseServer;
    std::string databaseName;
    bool hasDatabase;
    int productCount;
    int orderCount;
    int userCount;
    std::string companyName;
    bool isHealthy;
    std::optional<std::vector<std::string>> issues;

    ExistingInstallation()
        : hasDatabase(false)
        , productCount(0)
        , orderCount(0)
        , userCount(0)
        , isHealthy(true)
    {
    }
};

struct UpgradeValidationResult
{
    bool canProceed;
    std::optional<std::string> errorMessage; // Set iff !canProceed
    std::optional<std::string> message;
    bool hasWarnings;
    std::optional<std::string> warningMessage; // Set iff hasWarnings
    std::optional<std::vector<std::string>> breakingChanges;

    UpgradeValidationResult()
        : canProceed(false)
        , hasWarnings(false)
    {
    }

    static UpgradeValidationResult reject(const std::string& error)
    {
        UpgradeValidationResult r;
        r.canProceed = false;
        r.errorMessage = error;
        return r;
    }
};

const char* toString(PipelineState state);
const char* toString(FailureKind kind);

} // namespace upgrade
