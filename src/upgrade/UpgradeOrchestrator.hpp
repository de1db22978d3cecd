#pragma once

#include "DownloadManager.hpp"
#include "InstallationDetector.hpp"
#include "InstallationStateStore.hpp"
#include "PackageApplier.hpp"
#include "ProcessLauncher.hpp"
#include "ReleaseCatalogClient.hpp"
#include "ReleaseSelection.hpp"
#include "UpgradeTypes.hpp"
#include "UpgradeValidator.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace upgrade
{

struct OrchestratorConfig
{
    SelectionCriteria selection;
    // Exact asset name, or a wildcard pattern when it contains '*' or '?'
    std::string assetPattern = "*.zip";
    std::string downloadDirectory = "downloads";
    bool verifyChecksum = true;
    SiteSettings site;
    // Upgrader executable; when empty (or no launcher is wired) upgrades apply in-process
    std::string upgraderPath;
    // Forwarded to the upgrader as --config so both processes share one configuration
    std::string configPath;
};

// Collaborators, shared so the CLI can keep using them after a run
struct OrchestratorServices
{
    std::shared_ptr<ReleaseCatalogClient> catalog;
    std::shared_ptr<DownloadManager> downloader;
    std::shared_ptr<InstallationStateStore> stateStore;
    std::shared_ptr<IPackageApplier> applier;
    std::shared_ptr<IProcessLauncher> launcher; // Optional
};

struct ResolvedRelease
{
    bool success = false;
    ReleaseInfo release;
    ReleaseAsset asset;
    FailureKind failure = FailureKind::None;
    std::string error;
};

struct RunResult
{
    PipelineState finalState = PipelineState::Idle;
    FailureKind failure = FailureKind::None;
    std::string message;
    std::optional<std::string> committedVersion;
    std::vector<std::string> warnings;
    std::string packagePath;

    bool succeeded() const
    {
        return finalState == PipelineState::Succeeded || finalState == PipelineState::HandedOff;
    }
};

using StateCallback = std::function<void(PipelineState state)>;
// Asked once when a validated upgrade carries breaking changes; false halts the run
using ConfirmCallback = std::function<bool(const UpgradeValidationResult& validation)>;

// Drives one install, upgrade or reconfigure run:
// detect -> resolve -> validate -> download -> hand off / apply -> commit.
// The state store is read once when detecting and written once when committing.
class UpgradeOrchestrator
{
public:
    static constexpr const char* kUpgraderFlag = "--upgrade-internal";
    static constexpr const char* kPackageFlag = "--package";
    static constexpr const char* kTargetVersionFlag = "--targetversion";

    UpgradeOrchestrator(OrchestratorServices services, OrchestratorConfig config);
    ~UpgradeOrchestrator();

    UpgradeOrchestrator(const UpgradeOrchestrator&) = delete;
    UpgradeOrchestrator& operator=(const UpgradeOrchestrator&) = delete;

    void setStateCallback(StateCallback callback);
    void setProgressCallback(DownloadProgressCallback callback);
    void setConfirmCallback(ConfirmCallback callback);

    // Installer entry: fresh install when nothing is recorded, upgrade otherwise
    RunResult run(const utils::CancellationToken* cancel = nullptr);

    // Settings-only change: re-records the installed version under a new install path
    RunResult reconfigure(const std::string& newInstallPath, const utils::CancellationToken* cancel = nullptr);

    // Upgrader entry, after a handoff. packagePath may name an already downloaded package;
    // it must be the asset of targetVersion. An empty targetVersion falls back to the
    // configured selection.
    RunResult runUpgrader(const ExistingInstallation& handoff, const std::string& packagePath,
                          const std::string& targetVersion, const utils::CancellationToken* cancel = nullptr);

    // Feed query + selection + asset lookup, no side effects
    ResolvedRelease resolveRelease(const utils::CancellationToken* cancel = nullptr);

    PipelineState state() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace upgrade
