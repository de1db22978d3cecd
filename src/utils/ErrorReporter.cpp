#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;
size_t ErrorReporter::s_dropped = 0;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    std::string line = "[" + CategoryToString(category) + "] " + user_message;
    if (!technical_details.empty())
        line += " | " + technical_details;

    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.emplace_back(category, severity, user_message, technical_details);
    while (s_queue.size() > MAX_QUEUE_SIZE)
    {
        s_queue.pop_front();
        ++s_dropped;
    }
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    s_dropped = 0;
    return errors;
}

size_t ErrorReporter::PrintPending(std::ostream& out)
{
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        dropped = s_dropped;
    }
    auto errors = GetPendingErrors();

    if (dropped > 0)
        out << "(" << dropped << " earlier reports omitted, see the log)\n";
    for (const auto& error : errors)
    {
        out << FormatForConsole(error) << '\n';
    }
    return errors.size();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_dropped = 0;
}

std::string ErrorReporter::FormatForConsole(const ErrorReport& report)
{
    std::string text = SeverityToString(report.severity) + " [" + CategoryToString(report.category) + "]: " +
                       report.user_message;

    std::istringstream details(report.technical_details);
    std::string line;
    while (std::getline(details, line))
    {
        if (!line.empty())
            text += "\n    " + line;
    }
    return text;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::StateStore:
        return "State Store";
    case ErrorCategory::ReleaseFeed:
        return "Release Feed";
    case ErrorCategory::Download:
        return "Download";
    case ErrorCategory::Validation:
        return "Validation";
    case ErrorCategory::Handoff:
        return "Handoff";
    case ErrorCategory::Install:
        return "Install";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
