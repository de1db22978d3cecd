#pragma once

#include <cstddef>
#include <string>
#include <plog/Severity.h>

namespace utils
{

struct LogSettings
{
    plog::Severity level = plog::info;
    bool append = true;
    bool console = false;
    std::string file = "logs/storeup.log";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t backup_count = 3;
};

// Process-wide plog setup. The installer and the upgrader it launches may run at the
// same time, so each role writes its own rolling file.
class LogManager
{
public:
    static bool Initialize(const LogSettings& settings, const std::string& role);

    static void Shutdown();

    static bool IsInitialized();
    static const std::string& GetLogFilePath();

    // "logs/storeup.log" + "upgrader" -> "logs/storeup-upgrader.log"; the installer keeps the configured name
    static std::string LogFileForRole(const std::string& file, const std::string& role);

    // Config levels are plog severities (0 = none .. 6 = verbose); out of range falls back to info
    static plog::Severity SeverityFromLevel(int level);

private:
    LogManager() = default;

    static bool PrepareLogFile(const std::string& filepath, bool append);

    static bool s_initialized;
    static std::string s_log_file;
};

} // namespace utils
