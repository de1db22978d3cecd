#include "UpgradeOrchestrator.hpp"

#include "HandoffProtocol.hpp"
#include "Version.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace upgrade
{

namespace
{

bool isWildcard(const std::string& pattern) { return pattern.find_first_of("*?") != std::string::npos; }

} // namespace

struct UpgradeOrchestrator::Impl
{
    OrchestratorServices services;
    OrchestratorConfig config;
    UpgradeValidator validator;

    std::atomic<PipelineState> state{ PipelineState::Idle };
    StateCallback stateCallback;
    DownloadProgressCallback progressCallback;
    ConfirmCallback confirmCallback;

    Impl(OrchestratorServices s, OrchestratorConfig c)
        : services(std::move(s))
        , config(std::move(c))
    {
    }

    void transition(PipelineState next)
    {
        state = next;
        PLOG_INFO << "Pipeline state: " << toString(next);
        if (stateCallback)
        {
            stateCallback(next);
        }
    }

    RunResult fail(FailureKind kind, const std::string& message, RunResult result = {})
    {
        result.failure = kind;
        result.message = message;
        return halt(std::move(result));
    }

    // Terminal failure for a result whose failure and message are already filled in
    RunResult halt(RunResult result)
    {
        const FailureKind kind = result.failure;
        const std::string& message = result.message;
        result.committedVersion.reset();
        transition(PipelineState::Failed);
        if (kind == FailureKind::Rejected || kind == FailureKind::Cancelled)
        {
            PLOG_WARNING << "Run halted (" << toString(kind) << "): " << message;
        }
        else
        {
            PLOG_ERROR << "Run failed (" << toString(kind) << "): " << message;
        }
        result.finalState = PipelineState::Failed;
        return result;
    }

    bool cancelled(const utils::CancellationToken* cancel) const { return utils::isCancelled(cancel); }

    std::optional<InstallationDetector> detector() const
    {
        if (!services.stateStore)
            return std::nullopt;
        return InstallationDetector(*services.stateStore, config.site);
    }

    // targetTag overrides the configured selection with one specific release
    ResolvedRelease resolve(const utils::CancellationToken* cancel, const std::string& targetTag = "");
    bool download(const ResolvedRelease& resolved, const utils::CancellationToken* cancel, RunResult& result);
    bool verifyChecksum(const ResolvedRelease& resolved, const std::string& packagePath,
                        const utils::CancellationToken* cancel, RunResult& result);
    RunResult applyAndCommit(const ResolvedRelease& resolved, const std::string& installPath,
                             const utils::CancellationToken* cancel, RunResult result);
    RunResult freshInstall(const utils::CancellationToken* cancel);
    RunResult upgrade(const ExistingInstallation& installation, const utils::CancellationToken* cancel);
};

ResolvedRelease UpgradeOrchestrator::Impl::resolve(const utils::CancellationToken* cancel, const std::string& targetTag)
{
    ResolvedRelease resolved;
    if (!services.catalog)
    {
        resolved.failure = FailureKind::Configuration;
        resolved.error = "No release feed configured";
        return resolved;
    }

    if (!services.catalog->hasRateLimitAvailable())
    {
        const auto wait = std::chrono::duration_cast<std::chrono::seconds>(services.catalog->rateLimitReset() -
                                                                           std::chrono::system_clock::now());
        resolved.failure = FailureKind::Transient;
        resolved.error = "Release feed rate limit exhausted; try again in " + std::to_string(wait.count()) + "s";
        PLOG_WARNING << resolved.error;
        return resolved;
    }

    SelectionCriteria selection = config.selection;
    if (!targetTag.empty())
        selection.pinnedVersion = targetTag;

    CatalogResult catalog = selection.pinnedVersion.empty()
                                ? services.catalog->fetchReleases(cancel)
                                : services.catalog->fetchReleaseByTag(selection.pinnedVersion, cancel);
    if (!catalog.success)
    {
        resolved.failure = catalog.failure;
        resolved.error = catalog.error;
        return resolved;
    }

    auto release = selectRelease(catalog.releases, selection);
    if (!release)
    {
        resolved.failure = FailureKind::Data;
        resolved.error = selection.pinnedVersion.empty()
                             ? "No eligible release found in the feed"
                             : "Pinned release " + selection.pinnedVersion + " is not available";
        return resolved;
    }

    const auto& pattern = config.assetPattern;
    auto asset = isWildcard(pattern) ? ReleaseCatalogClient::findAssetByPattern(*release, pattern)
                                     : ReleaseCatalogClient::findAsset(*release, pattern);
    if (!asset)
    {
        resolved.failure = FailureKind::Data;
        resolved.error = "Release " + release->version + " has no asset matching '" + pattern + "'";
        return resolved;
    }

    PLOG_INFO << "Selected release " << release->version << ", asset " << asset->name << " ("
              << DownloadProgress::formatBytes(asset->size) << ")";
    resolved.success = true;
    resolved.release = std::move(*release);
    resolved.asset = std::move(*asset);
    return resolved;
}

bool UpgradeOrchestrator::Impl::download(const ResolvedRelease& resolved, const utils::CancellationToken* cancel,
                                         RunResult& result)
{
    if (!services.downloader)
    {
        result.failure = FailureKind::Configuration;
        result.message = "No downloader configured";
        return false;
    }

    const std::string packagePath = (fs::path(config.downloadDirectory) / resolved.asset.name).string();
    auto downloaded = services.downloader->downloadAsset(resolved.asset, services.catalog->assetApiUrl(resolved.asset.id),
                                                        packagePath, progressCallback, cancel);
    if (!downloaded.success)
    {
        result.failure = downloaded.failure;
        result.message = downloaded.error;
        return false;
    }

    if (config.verifyChecksum && !verifyChecksum(resolved, packagePath, cancel, result))
    {
        std::error_code ec;
        fs::remove(packagePath, ec);
        return false;
    }

    result.packagePath = packagePath;
    return true;
}

bool UpgradeOrchestrator::Impl::verifyChecksum(const ResolvedRelease& resolved, const std::string& packagePath,
                                               const utils::CancellationToken* cancel, RunResult& result)
{
    auto checksumAsset = ReleaseCatalogClient::findAsset(resolved.release, resolved.asset.name + ".sha256");
    if (!checksumAsset)
    {
        PLOG_DEBUG << "No checksum published for " << resolved.asset.name;
        return true;
    }

    const std::string checksumPath = packagePath + ".sha256";
    auto downloaded = services.downloader->downloadAsset(
        *checksumAsset, services.catalog->assetApiUrl(checksumAsset->id), checksumPath, nullptr, cancel);
    if (!downloaded.success)
    {
        result.failure = downloaded.failure;
        result.message = "Checksum download failed: " + downloaded.error;
        return false;
    }

    std::string text;
    {
        std::ifstream ifs(checksumPath);
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        text = buffer.str();
    }
    std::error_code ec;
    fs::remove(checksumPath, ec);

    const std::string expected = DownloadManager::parseChecksumText(text, resolved.asset.name);
    if (expected.empty())
    {
        result.failure = FailureKind::Data;
        result.message = "Checksum file for " + resolved.asset.name + " is malformed";
        return false;
    }

    std::string error;
    if (!DownloadManager::verifyChecksum(packagePath, expected, error))
    {
        result.failure = FailureKind::Integrity;
        result.message = error;
        return false;
    }

    PLOG_INFO << "Checksum verified for " << resolved.asset.name;
    return true;
}

RunResult UpgradeOrchestrator::Impl::applyAndCommit(const ResolvedRelease& resolved, const std::string& installPath,
                                                    const utils::CancellationToken* cancel, RunResult result)
{
    if (cancelled(cancel))
        return fail(FailureKind::Cancelled, "Run cancelled before applying the package", std::move(result));

    transition(PipelineState::Applying);
    if (!services.applier)
        return fail(FailureKind::Configuration, "No package applier configured", std::move(result));

    auto applied = services.applier->apply(result.packagePath, installPath);
    if (!applied.success)
        return fail(FailureKind::Install, applied.error, std::move(result));

    transition(PipelineState::Committing);
    const std::string version = Version::normalizeTag(resolved.release.version);
    if (!services.stateStore->saveInstallationInfo(version, installPath))
    {
        // The record still names the previous version, so the files must match it
        std::string rollbackError;
        std::string message = "Installation record could not be written; ";
        if (services.applier->rollback(rollbackError))
            message += "previous files restored";
        else
            message += "previous files could not be restored: " + rollbackError;
        return fail(FailureKind::StateStore, message, std::move(result));
    }
    services.applier->finalize();

    result.committedVersion = version;
    result.message = "Installed " + version + " at " + installPath;
    result.finalState = PipelineState::Succeeded;
    transition(PipelineState::Succeeded);
    return result;
}

RunResult UpgradeOrchestrator::Impl::freshInstall(const utils::CancellationToken* cancel)
{
    transition(PipelineState::FreshInstall);
    const std::string installPath = config.site.installPath;
    if (installPath.empty())
        return fail(FailureKind::Configuration, "No install path configured for a fresh install");

    if (cancelled(cancel))
        return fail(FailureKind::Cancelled, "Run cancelled");

    transition(PipelineState::ResolvingRelease);
    auto resolved = resolve(cancel);
    if (!resolved.success)
        return fail(resolved.failure, resolved.error);

    transition(PipelineState::Downloading);
    RunResult result;
    if (!download(resolved, cancel, result))
        return halt(std::move(result));

    return applyAndCommit(resolved, installPath, cancel, std::move(result));
}

RunResult UpgradeOrchestrator::Impl::upgrade(const ExistingInstallation& installation,
                                             const utils::CancellationToken* cancel)
{
    transition(PipelineState::Upgrading);
    if (cancelled(cancel))
        return fail(FailureKind::Cancelled, "Run cancelled");

    transition(PipelineState::ResolvingRelease);
    auto resolved = resolve(cancel);
    if (!resolved.success)
        return fail(resolved.failure, resolved.error);

    transition(PipelineState::Validating);
    auto validation = validator.validate(installation, resolved.release);
    if (!validation.canProceed)
        return fail(FailureKind::Rejected, validation.errorMessage.value_or("Upgrade rejected"));

    RunResult result;
    if (validation.hasWarnings)
    {
        result.warnings.push_back(validation.warningMessage.value_or(""));
        if (validation.breakingChanges)
        {
            result.warnings.insert(result.warnings.end(), validation.breakingChanges->begin(),
                                   validation.breakingChanges->end());
        }
        if (confirmCallback && !confirmCallback(validation))
            return fail(FailureKind::Cancelled, "Upgrade declined by operator", std::move(result));
    }
    PLOG_INFO << validation.message.value_or("Upgrade validated");

    if (cancelled(cancel))
        return fail(FailureKind::Cancelled, "Run cancelled", std::move(result));

    const bool handOff = services.launcher && !config.upgraderPath.empty();
    std::vector<std::string> tokens;
    if (handOff)
    {
        // Missing handoff details are refused before anything is downloaded
        tokens = HandoffProtocol::encode(installation);
        auto missing = HandoffProtocol::missingRequired(tokens);
        if (!missing.empty())
        {
            std::string fields;
            for (const auto& field : missing)
                fields += (fields.empty() ? "" : ", ") + field;
            return fail(FailureKind::Protocol, "Installation details required by the upgrader are missing: " + fields,
                        std::move(result));
        }
    }

    transition(PipelineState::Downloading);
    if (!download(resolved, cancel, result))
        return halt(std::move(result));

    if (handOff)
    {
        transition(PipelineState::HandingOff);
        std::vector<std::string> args{ kUpgraderFlag };
        args.insert(args.end(), tokens.begin(), tokens.end());
        args.push_back(kPackageFlag);
        args.push_back(result.packagePath);
        args.push_back(kTargetVersionFlag);
        args.push_back(resolved.release.version);
        if (!config.configPath.empty())
        {
            args.push_back("--config");
            args.push_back(config.configPath);
        }

        std::string error;
        if (!services.launcher->launch(config.upgraderPath, args, error))
            return fail(FailureKind::Configuration, "Failed to launch upgrader: " + error, std::move(result));

        result.message = "Upgrade to " + Version::normalizeTag(resolved.release.version) +
                         " handed off to the upgrader";
        result.finalState = PipelineState::HandedOff;
        transition(PipelineState::HandedOff);
        return result;
    }

    return applyAndCommit(resolved, installation.installPath, cancel, std::move(result));
}

UpgradeOrchestrator::UpgradeOrchestrator(OrchestratorServices services, OrchestratorConfig config)
    : impl_(std::make_unique<Impl>(std::move(services), std::move(config)))
{
}

UpgradeOrchestrator::~UpgradeOrchestrator() = default;

void UpgradeOrchestrator::setStateCallback(StateCallback callback) { impl_->stateCallback = std::move(callback); }

void UpgradeOrchestrator::setProgressCallback(DownloadProgressCallback callback)
{
    impl_->progressCallback = std::move(callback);
}

void UpgradeOrchestrator::setConfirmCallback(ConfirmCallback callback) { impl_->confirmCallback = std::move(callback); }

PipelineState UpgradeOrchestrator::state() const { return impl_->state.load(); }

ResolvedRelease UpgradeOrchestrator::resolveRelease(const utils::CancellationToken* cancel)
{
    return impl_->resolve(cancel);
}

RunResult UpgradeOrchestrator::run(const utils::CancellationToken* cancel)
{
    impl_->transition(PipelineState::DetectingState);
    auto detector = impl_->detector();
    if (!detector)
        return impl_->fail(FailureKind::Configuration, "No state store configured");

    auto installation = detector->detect();
    if (!installation)
        return impl_->freshInstall(cancel);

    PLOG_INFO << "Existing installation " << installation->version << " at " << installation->installPath;
    return impl_->upgrade(*installation, cancel);
}

RunResult UpgradeOrchestrator::reconfigure(const std::string& newInstallPath, const utils::CancellationToken* cancel)
{
    impl_->transition(PipelineState::DetectingState);
    if (!impl_->services.stateStore)
        return impl_->fail(FailureKind::Configuration, "No state store configured");

    auto info = impl_->services.stateStore->getInstallationInfo();
    if (!info)
        return impl_->fail(FailureKind::Configuration, "Nothing is installed; run an install first");

    impl_->transition(PipelineState::Reconfiguring);
    if (impl_->cancelled(cancel))
        return impl_->fail(FailureKind::Cancelled, "Run cancelled");

    const std::string installPath = newInstallPath.empty() ? info->installPath : newInstallPath;
    impl_->transition(PipelineState::Committing);
    if (!impl_->services.stateStore->saveInstallationInfo(info->version, installPath))
        return impl_->fail(FailureKind::StateStore, "Failed to record the new configuration");

    RunResult result;
    result.committedVersion = info->version;
    result.message = "Reconfigured " + info->version + " at " + installPath;
    result.finalState = PipelineState::Succeeded;
    impl_->transition(PipelineState::Succeeded);
    return result;
}

RunResult UpgradeOrchestrator::runUpgrader(const ExistingInstallation& handoff, const std::string& packagePath,
                                           const std::string& targetVersion, const utils::CancellationToken* cancel)
{
    impl_->transition(PipelineState::DetectingState);
    auto detector = impl_->detector();
    if (!detector)
        return impl_->fail(FailureKind::Configuration, "No state store configured");

    auto recorded = detector->detect();
    if (!recorded)
        return impl_->fail(FailureKind::StateStore, "No installation record found; nothing to upgrade");

    // The record is authoritative for the version; the installer's view supplies the rest
    ExistingInstallation installation = handoff;
    if (installation.version != recorded->version)
    {
        PLOG_WARNING << "Handoff version " << installation.version << " differs from recorded "
                     << recorded->version << ", using the record";
        installation.version = recorded->version;
    }
    installation.installDate = recorded->installDate;

    impl_->transition(PipelineState::Upgrading);
    if (impl_->cancelled(cancel))
        return impl_->fail(FailureKind::Cancelled, "Run cancelled");

    // Pinned to the release the installer downloaded, so the record names what was applied
    impl_->transition(PipelineState::ResolvingRelease);
    auto resolved = impl_->resolve(cancel, targetVersion);
    if (!resolved.success)
        return impl_->fail(resolved.failure, resolved.error);

    impl_->transition(PipelineState::Validating);
    auto validation = impl_->validator.validate(installation, resolved.release);
    if (!validation.canProceed)
        return impl_->fail(FailureKind::Rejected, validation.errorMessage.value_or("Upgrade rejected"));

    RunResult result;
    if (validation.hasWarnings)
    {
        result.warnings.push_back(validation.warningMessage.value_or(""));
    }

    std::error_code ec;
    if (!packagePath.empty() && fs::is_regular_file(packagePath, ec))
    {
        const std::string handedName = fs::path(packagePath).filename().string();
        if (!utils::iequals(handedName, resolved.asset.name))
        {
            return impl_->fail(FailureKind::Protocol,
                               "Handed package " + handedName + " is not the asset of release " +
                                   resolved.release.version + " (" + resolved.asset.name + ")",
                               std::move(result));
        }
        PLOG_INFO << "Using package handed over by the installer: " << packagePath;
        result.packagePath = packagePath;
    }
    else
    {
        impl_->transition(PipelineState::Downloading);
        if (!impl_->download(resolved, cancel, result))
            return impl_->halt(std::move(result));
    }

    return impl_->applyAndCommit(resolved, installation.installPath, cancel, std::move(result));
}

} // namespace upgrade
