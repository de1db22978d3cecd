#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "platform/ProcessUtils.hpp"
#include "upgrade/DownloadManager.hpp"
#include "upgrade/HandoffProtocol.hpp"
#include "upgrade/InstallationDetector.hpp"
#include "upgrade/InstallationStateStore.hpp"
#include "upgrade/KeyValueStore.hpp"
#include "upgrade/PackageApplier.hpp"
#include "upgrade/ProcessLauncher.hpp"
#include "upgrade/ReleaseCatalogClient.hpp"
#include "upgrade/UpgradeOrchestrator.hpp"
#include "upgrade/UpgradeValidator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/HttpCommon.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <csignal>
#include <cstring>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <clocale>
#endif

#ifndef STOREUP_VERSION_STRING
#define STOREUP_VERSION_STRING "0.0.0"
#endif

namespace
{

Application* g_active_app = nullptr;

extern "C" void handleInterrupt(int)
{
    if (g_active_app)
        g_active_app->requestCancel();
}

// Upgrader mode passes its own flags among the handoff tokens; pull out the value that follows flag
std::string takeFlagValue(const std::vector<std::string>& tokens, const char* flag)
{
    for (size_t i = 0; i + 1 < tokens.size(); ++i)
    {
        if (tokens[i] == flag)
            return tokens[i + 1];
    }
    return {};
}

const char* commandName(Application::Command command)
{
    switch (command)
    {
    case Application::Command::Check:
        return "check";
    case Application::Command::Install:
        return "install";
    case Application::Command::Upgrade:
        return "upgrade";
    case Application::Command::Reconfigure:
        return "reconfigure";
    case Application::Command::Status:
        return "status";
    case Application::Command::Uninstall:
        return "uninstall";
    case Application::Command::Upgrader:
        return "upgrader";
    default:
        return "none";
    }
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        std::cerr << "storeup: " << usage_error_ << "\n\n";
        printUsage();
        return ExitUsage;
    }

    switch (command_)
    {
    case Command::PrintVersion:
        std::cout << "storeup " << STOREUP_VERSION_STRING << "\n";
        return ExitSuccess;
    case Command::Help:
    case Command::None:
        printUsage();
        return command_ == Command::Help ? ExitSuccess : ExitUsage;
    default:
        break;
    }

    if (!initialize())
    {
        printPendingErrors();
        return ExitFailure;
    }

    g_active_app = this;
    std::signal(SIGINT, handleInterrupt);

    int code = ExitFailure;
    switch (command_)
    {
    case Command::Check:
        code = runCheck();
        break;
    case Command::Install:
        code = runInstall(false);
        break;
    case Command::Upgrade:
        code = runInstall(true);
        break;
    case Command::Reconfigure:
        code = runReconfigure();
        break;
    case Command::Status:
        code = runStatus();
        break;
    case Command::Uninstall:
        code = runUninstall();
        break;
    case Command::Upgrader:
        code = runUpgrader();
        break;
    default:
        break;
    }

    std::signal(SIGINT, SIG_DFL);
    g_active_app = nullptr;

    printPendingErrors();
    PLOG_INFO << "Command '" << commandName(command_) << "' finished with exit code " << code;
    return code;
}

void Application::requestCancel() { cancel_.cancel(); }

bool Application::initialize()
{
    initializeConsole();

    // Config first: it names the log file. Config problems are queued in ErrorReporter
    if (!initializeConfig())
        return false;

    if (!initializeLogging())
        return false;

    setupServices();
    return true;
}

bool Application::initializeLogging()
{
    utils::LogSettings settings;
    settings.level = utils::LogManager::SeverityFromLevel(config_.logging.level);
    settings.append = config_.logging.append;
    settings.console = config_.logging.console;
    settings.file = config_.logging.file;

    if (!utils::LogManager::Initialize(settings, command_ == Command::Upgrader ? "upgrader" : "installer"))
        return false;

    PLOG_INFO << "storeup " << STOREUP_VERSION_STRING << " starting (" << commandName(command_) << "), config "
              << config_path_;
    return true;
}

void Application::initializeConsole()
{
#ifdef _WIN32
    // Set Windows console to UTF-8 so paths and release notes display correctly
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);

    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut && hOut != INVALID_HANDLE_VALUE)
    {
        DWORD mode = 0;
        if (GetConsoleMode(hOut, &mode))
        {
            SetConsoleMode(hOut, mode | ENABLE_PROCESSED_OUTPUT | ENABLE_WRAP_AT_EOL_OUTPUT);
        }
    }

    std::setlocale(LC_ALL, ".UTF-8");
#endif
}

bool Application::initializeConfig()
{
    config_manager_ = std::make_unique<ConfigManager>(config_path_);
    if (!bindStoreupConfig(*config_manager_, config_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Internal configuration error",
                                          config_manager_->lastError());
        return false;
    }

    // A broken file must not silently turn into an install with default paths
    switch (config_manager_->load())
    {
    case ConfigLoadStatus::Invalid:
        return false;
    case ConfigLoadStatus::Missing:
        if (command_ != Command::Status)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "No configuration file found, using defaults", config_path_);
        }
        break;
    case ConfigLoadStatus::Loaded:
        break;
    }

    if (config_.feed.url.empty() && command_ != Command::Status && command_ != Command::Uninstall &&
        command_ != Command::Reconfigure)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                          "No release feed configured. Set [feed] url in " + config_path_);
        return false;
    }
    return true;
}

void Application::setupServices()
{
    auto http = std::make_shared<utils::CprHttpClient>();

    upgrade::FeedConfig feed;
    feed.baseUrl = config_.feed.url;
    feed.userAgent = config_.feed.user_agent;
    feed.authToken = config_.feed.auth_token;
    feed.timeoutMs = config_.feed.timeout_ms;
    feed.connectTimeoutMs = config_.feed.connect_timeout_ms;

    upgrade::DownloadOptions download;
    download.timeoutMs = config_.download.timeout_ms;
    download.lowSpeedLimitSeconds = config_.download.low_speed_limit_seconds;
    download.progressIntervalMs = config_.download.progress_interval_ms;
    download.userAgent = config_.feed.user_agent;
    if (!config_.feed.auth_token.empty())
    {
        download.apiHeaders.push_back({ "Authorization", "Bearer " + config_.feed.auth_token });
    }

    state_store_ = std::make_shared<upgrade::InstallationStateStore>(
        std::make_shared<upgrade::TomlKeyValueStore>(config_.state.file));

    upgrade::OrchestratorServices services;
    services.catalog = std::make_shared<upgrade::ReleaseCatalogClient>(http, feed);
    services.downloader = std::make_shared<upgrade::DownloadManager>(http, download);
    services.stateStore = state_store_;
    services.applier = std::make_shared<upgrade::ZipPackageApplier>();

    upgrade::OrchestratorConfig orchestration;
    orchestration.selection.policy = upgrade::parseSelectionPolicy(config_.feed.selection);
    orchestration.selection.includePrereleases = config_.feed.include_prereleases;
    orchestration.selection.pinnedVersion = config_.feed.pinned_version;
    orchestration.assetPattern = config_.download.asset_pattern;
    orchestration.downloadDirectory = config_.download.directory;
    orchestration.verifyChecksum = config_.download.verify_checksum;
    orchestration.site.siteName = config_.install.site_name;
    orchestration.site.installPath = config_.install.path;
    orchestration.site.databaseServer = config_.install.database_server;
    orchestration.site.databaseName = config_.install.database_name;
    orchestration.configPath = config_path_;

    // The upgrader itself never hands off again
    if (command_ != Command::Upgrader && !config_.install.upgrader_path.empty())
    {
        orchestration.upgraderPath = config_.install.upgrader_path == "self"
                                         ? utils::ProcessUtils::GetExecutablePath().string()
                                         : config_.install.upgrader_path;
        services.launcher = std::make_shared<upgrade::DetachedProcessLauncher>();
    }

    orchestrator_ = std::make_unique<upgrade::UpgradeOrchestrator>(std::move(services), std::move(orchestration));
    orchestrator_->setStateCallback([](upgrade::PipelineState state)
                                    { PLOG_DEBUG << "Pipeline state: " << upgrade::toString(state); });
    orchestrator_->setProgressCallback([this](const upgrade::DownloadProgress& progress) { onProgress(progress); });
    orchestrator_->setConfirmCallback([this](const upgrade::UpgradeValidationResult& validation)
                                      { return confirmBreakingChanges(validation); });
}

bool Application::parseCommandLineArgs()
{
    std::vector<std::string> args;
    for (int i = 1; i < argc_; ++i)
    {
        args.emplace_back(argv_[i]);
    }

    // Handoff tokens reuse flags such as --version, so this mode is decided before anything else
    if (!args.empty() && args[0] == upgrade::UpgradeOrchestrator::kUpgraderFlag)
    {
        command_ = Command::Upgrader;
        handoff_tokens_.assign(args.begin() + 1, args.end());
        package_path_ = takeFlagValue(handoff_tokens_, upgrade::UpgradeOrchestrator::kPackageFlag);
        target_version_ = takeFlagValue(handoff_tokens_, upgrade::UpgradeOrchestrator::kTargetVersionFlag);
        std::string config = takeFlagValue(handoff_tokens_, "--config");
        if (!config.empty())
            config_path_ = config;
        return true;
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= args.size())
            {
                usage_error_ = "--config requires a path";
                return false;
            }
            config_path_ = args[++i];
        }
        else if (arg == "--yes" || arg == "-y")
        {
            assume_yes_ = true;
        }
        else if (arg == "--version" || arg == "-V")
        {
            command_ = Command::PrintVersion;
            return true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            command_ = Command::Help;
            return true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            usage_error_ = "unknown option '" + arg + "'";
            return false;
        }
        else if (command_ == Command::None)
        {
            if (arg == "check")
                command_ = Command::Check;
            else if (arg == "install")
                command_ = Command::Install;
            else if (arg == "upgrade")
                command_ = Command::Upgrade;
            else if (arg == "reconfigure")
                command_ = Command::Reconfigure;
            else if (arg == "status")
                command_ = Command::Status;
            else if (arg == "uninstall")
                command_ = Command::Uninstall;
            else
            {
                usage_error_ = "unknown command '" + arg + "'";
                return false;
            }
        }
        else if (command_ == Command::Reconfigure && reconfigure_path_.empty())
        {
            reconfigure_path_ = arg;
        }
        else
        {
            usage_error_ = "unexpected argument '" + arg + "'";
            return false;
        }
    }

    if (command_ == Command::Reconfigure && reconfigure_path_.empty())
    {
        usage_error_ = "reconfigure requires the new install path";
        return false;
    }
    return true;
}

void Application::printUsage() const
{
    std::cout << "Usage: storeup [options] <command>\n"
                 "\n"
                 "Commands:\n"
                 "  check                  Show the release that would be installed\n"
                 "  install                Install, or upgrade an existing installation\n"
                 "  upgrade                Upgrade an existing installation\n"
                 "  reconfigure <path>     Record a new install path for the installed version\n"
                 "  status                 Show the installation record and its health\n"
                 "  uninstall              Remove the installation record\n"
                 "\n"
                 "Options:\n"
                 "  -c, --config <path>    Configuration file (default: storeup.toml)\n"
                 "  -y, --yes              Accept breaking changes and confirmations\n"
                 "  -V, --version          Print the version and exit\n"
                 "  -h, --help             Print this help\n";
}

int Application::runCheck()
{
    auto resolved = orchestrator_->resolveRelease(&cancel_);
    if (!resolved.success)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::ReleaseFeed, "Could not resolve a release",
                                          resolved.error);
        return resolved.failure == upgrade::FailureKind::Cancelled ? ExitCancelled : ExitFailure;
    }

    std::cout << "Release: " << resolved.release.version;
    if (!resolved.release.name.empty())
        std::cout << " (" << resolved.release.name << ")";
    std::cout << "\nPublished: " << resolved.release.publishedAt << "\n"
              << "Asset: " << resolved.asset.name << " ("
              << upgrade::DownloadProgress::formatBytes(resolved.asset.size) << ")\n";

    auto installed = state_store_->getInstallationInfo();
    if (!installed)
    {
        std::cout << "Nothing installed; 'storeup install' performs a fresh install\n";
        return ExitSuccess;
    }

    upgrade::UpgradeValidator validator;
    auto validation = validator.validate(installed->version, resolved.release);
    if (!validation.canProceed)
    {
        std::cout << "Installed: " << installed->version << " - " << validation.errorMessage.value_or("") << "\n";
        return ExitSuccess;
    }

    std::cout << "Installed: " << installed->version << " - " << validation.message.value_or("") << "\n";
    if (validation.hasWarnings)
    {
        std::cout << validation.warningMessage.value_or("") << "\n";
        for (const auto& change : validation.breakingChanges.value_or(std::vector<std::string>{}))
        {
            std::cout << "  - " << change << "\n";
        }
    }
    return ExitSuccess;
}

int Application::runInstall(bool requireInstalled)
{
    if (requireInstalled && !state_store_->isInstalled())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Validation, "Nothing is installed to upgrade",
                                          "Use 'storeup install' for a fresh install");
        return ExitFailure;
    }
    return finish(orchestrator_->run(&cancel_));
}

int Application::runReconfigure() { return finish(orchestrator_->reconfigure(reconfigure_path_, &cancel_)); }

int Application::runStatus()
{
    upgrade::SiteSettings site;
    site.siteName = config_.install.site_name;
    site.installPath = config_.install.path;
    site.databaseServer = config_.install.database_server;
    site.databaseName = config_.install.database_name;

    upgrade::InstallationDetector detector(*state_store_, site);
    auto installation = detector.detect();
    if (!installation)
    {
        std::cout << "Not installed\n";
        return ExitSuccess;
    }

    std::cout << "Site: " << installation->siteName << "\n"
              << "Version: " << installation->version << "\n"
              << "Install path: " << installation->installPath << "\n"
              << "Installed: " << installation->installDate << "\n";
    if (installation->hasDatabase)
    {
        std::cout << "Database: " << installation->databaseName << " on " << installation->databaseServer << "\n";
    }
    std::cout << "Health: " << (installation->isHealthy ? "ok" : "degraded") << "\n";
    for (const auto& issue : installation->issues.value_or(std::vector<std::string>{}))
    {
        std::cout << "  - " << issue << "\n";
    }
    return installation->isHealthy ? ExitSuccess : ExitFailure;
}

int Application::runUninstall()
{
    auto installed = state_store_->getInstallationInfo();
    if (!installed)
    {
        std::cout << "Not installed\n";
        return ExitSuccess;
    }

    if (!assume_yes_ && !askYesNo("Remove the installation record for version " + installed->version + "?"))
    {
        std::cout << "Uninstall cancelled\n";
        return ExitCancelled;
    }

    if (!state_store_->removeInstallationInfo())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::StateStore,
                                          "The installation record could not be removed");
        return ExitFailure;
    }

    PLOG_INFO << "Installation record removed (version " << installed->version << ")";
    std::cout << "Installation record removed. Files under " << installed->installPath << " were left in place.\n";
    return ExitSuccess;
}

int Application::runUpgrader()
{
    auto handoff = upgrade::HandoffProtocol::decode(handoff_tokens_);
    if (!handoff)
    {
        std::string missing;
        for (const auto& name : upgrade::HandoffProtocol::missingRequired(handoff_tokens_))
        {
            missing += (missing.empty() ? "" : ", ") + name;
        }
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Handoff,
                                          "The upgrader was started with incomplete installation details",
                                          "Missing or empty: " + missing);
        return ExitUsage;
    }

    PLOG_INFO << "Upgrader taking over for " << handoff->siteName << " at " << handoff->installPath;
    return finish(orchestrator_->runUpgrader(*handoff, package_path_, target_version_, &cancel_));
}

void Application::onProgress(const upgrade::DownloadProgress& progress)
{
    std::cout << "\r" << progress.toString() << "    " << std::flush;
    progress_line_open_ = true;
    if (progress.totalBytes > 0 && progress.bytesReceived >= progress.totalBytes)
    {
        std::cout << "\n";
        progress_line_open_ = false;
    }
}

bool Application::confirmBreakingChanges(const upgrade::UpgradeValidationResult& validation)
{
    std::cout << validation.warningMessage.value_or("This release contains breaking changes.") << "\n";
    for (const auto& change : validation.breakingChanges.value_or(std::vector<std::string>{}))
    {
        std::cout << "  - " << change << "\n";
    }

    if (assume_yes_)
    {
        PLOG_INFO << "Breaking changes accepted by --yes";
        return true;
    }
    return askYesNo("Continue with the upgrade?");
}

bool Application::askYesNo(const std::string& question) const
{
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

int Application::finish(const upgrade::RunResult& result)
{
    if (progress_line_open_)
    {
        std::cout << "\n";
        progress_line_open_ = false;
    }

    for (const auto& warning : result.warnings)
    {
        std::cout << "warning: " << warning << "\n";
    }

    if (result.succeeded())
    {
        std::cout << result.message << "\n";
        return ExitSuccess;
    }

    switch (result.failure)
    {
    case upgrade::FailureKind::Rejected:
        std::cout << result.message << "\n";
        return ExitRejected;
    case upgrade::FailureKind::Cancelled:
        std::cout << result.message << "\n";
        return ExitCancelled;
    case upgrade::FailureKind::Transient:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Download,
                                          "The run was interrupted; it is safe to try again", result.message);
        return ExitFailure;
    case upgrade::FailureKind::Data:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::ReleaseFeed, "The release feed returned unusable data",
                                          result.message);
        return ExitFailure;
    case upgrade::FailureKind::Integrity:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Download,
                                          "The downloaded package failed verification and was discarded",
                                          result.message);
        return ExitFailure;
    case upgrade::FailureKind::Install:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Install,
                                          "The package could not be installed; the previous files were kept",
                                          result.message);
        return ExitFailure;
    case upgrade::FailureKind::StateStore:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::StateStore,
                                          "The installation record could not be read or written", result.message);
        return ExitFailure;
    case upgrade::FailureKind::Protocol:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Handoff, "The upgrader could not be started",
                                          result.message);
        return ExitFailure;
    case upgrade::FailureKind::Configuration:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Check the configuration file",
                                          result.message);
        return ExitFailure;
    default:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "The run failed", result.message);
        return ExitFailure;
    }
}

void Application::printPendingErrors() const { utils::ErrorReporter::PrintPending(std::cerr); }

void Application::cleanup()
{
    orchestrator_.reset();
    state_store_.reset();
    config_manager_.reset();
    utils::LogManager::Shutdown();
}
