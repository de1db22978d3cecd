#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logging, startup, command line
    Configuration,  // TOML parsing, invalid config
    StateStore,     // Installation record unreadable or unwritable
    ReleaseFeed,    // Feed unreachable, malformed release data
    Download,       // Transfer failures, checksum mismatch
    Validation,     // Upgrade refused
    Handoff,        // Upgrader arguments missing or malformed
    Install,        // Package extraction, process launch
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Run continues with defaults or reduced function
    Error,   // Command failed
    Fatal    // Process cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // What the operator should read
    std::string technical_details; // Raw cause for logs and bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Operator-facing error queue
 *
 * Components report problems here instead of printing; every report is logged through
 * plog immediately and queued until the command line prints the queue before exit.
 * Reports raised before logging is up (config parse errors) are not lost.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Download,
 *                              "The release package could not be downloaded",
 *                              "HTTP error 404");
 *   ...
 *   ErrorReporter::PrintPending(std::cerr);
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Takes the queue, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    // Writes and drains the queue; returns the number of reports written
    static size_t PrintPending(std::ostream& out);

    static void ClearErrors();

    // "Error [Download]: message" with technical details indented on following lines
    static std::string FormatForConsole(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // Local time, "YYYY-MM-DD HH:MM:SS"
    static std::string GetTimestamp();

    static constexpr size_t MAX_QUEUE_SIZE = 100;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static size_t s_dropped;
};

} // namespace utils
