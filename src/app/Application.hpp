#pragma once

#include "config/StoreupConfig.hpp"
#include "utils/CancellationToken.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

namespace upgrade
{
class UpgradeOrchestrator;
class InstallationStateStore;
struct DownloadProgress;
struct RunResult;
struct UpgradeValidationResult;
} // namespace upgrade

// Command-line front end of the installer and the upgrader
class Application
{
public:
    enum class Command
    {
        None,
        Check,
        Install,
        Upgrade,
        Reconfigure,
        Status,
        Uninstall,
        Upgrader, // --upgrade-internal, launched by a handoff
        PrintVersion,
        Help
    };

    enum ExitCode
    {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitUsage = 2,
        ExitRejected = 3,
        ExitCancelled = 4
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

    // Cancels the running pipeline at its next safe point (Ctrl+C)
    void requestCancel();

private:
    bool initialize();
    bool initializeLogging();
    void initializeConsole();
    bool initializeConfig();
    void setupServices();

    bool parseCommandLineArgs();
    void printUsage() const;

    int runCheck();
    int runInstall(bool requireInstalled);
    int runReconfigure();
    int runStatus();
    int runUninstall();
    int runUpgrader();

    void onProgress(const upgrade::DownloadProgress& progress);
    bool confirmBreakingChanges(const upgrade::UpgradeValidationResult& validation);
    bool askYesNo(const std::string& question) const;
    int finish(const upgrade::RunResult& result);
    void printPendingErrors() const;
    void cleanup();

    std::unique_ptr<ConfigManager> config_manager_;
    StoreupConfig config_;

    std::shared_ptr<upgrade::InstallationStateStore> state_store_;
    std::unique_ptr<upgrade::UpgradeOrchestrator> orchestrator_;
    utils::CancellationToken cancel_;

    Command command_ = Command::None;
    std::string config_path_ = "storeup.toml";
    std::string reconfigure_path_;
    std::string package_path_;
    std::string target_version_;
    std::vector<std::string> handoff_tokens_;
    bool assume_yes_ = false;
    bool progress_line_open_ = false;
    std::string usage_error_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
