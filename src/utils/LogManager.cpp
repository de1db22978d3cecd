#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

namespace
{

// plog keeps raw appender pointers and cannot detach them, so appenders live until exit
std::vector<std::unique_ptr<plog::IAppender>>& appenders()
{
    static std::vector<std::unique_ptr<plog::IAppender>> storage;
    return storage;
}

} // namespace

bool LogManager::s_initialized = false;
std::string LogManager::s_log_file;

bool LogManager::Initialize(const LogSettings& settings, const std::string& role)
{
    if (s_initialized)
        return true;

    const std::string filepath = LogFileForRole(settings.file, role);
    if (!PrepareLogFile(filepath, settings.append))
        return false;

    try
    {
        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            filepath.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));
        auto& logger = plog::init(settings.level, file_appender.get());
        logger.setMaxSeverity(settings.level);
        appenders().push_back(std::move(file_appender));

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            appenders().push_back(std::move(console_appender));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Logging could not be started", ex.what());
        return false;
    }

    s_log_file = filepath;
    s_initialized = true;
    return true;
}

void LogManager::Shutdown()
{
    if (!s_initialized)
        return;

    if (auto* logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const std::string& LogManager::GetLogFilePath() { return s_log_file; }

std::string LogManager::LogFileForRole(const std::string& file, const std::string& role)
{
    if (role.empty() || role == "installer")
        return file;

    std::filesystem::path path(file);
    auto renamed = path.stem().string() + "-" + role + path.extension().string();
    return (path.parent_path() / renamed).string();
}

plog::Severity LogManager::SeverityFromLevel(int level)
{
    if (level < plog::none || level > plog::verbose)
        return plog::info;
    return static_cast<plog::Severity>(level);
}

bool LogManager::PrepareLogFile(const std::string& filepath, bool append)
{
    auto dir = std::filesystem::path(filepath).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to create the log directory",
                                         dir.string() + ": " + ec.message());
            return false;
        }
    }

    if (!append)
    {
        std::ofstream truncate(filepath, std::ios::trunc);
        if (!truncate)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to reset the log file", filepath);
            return false;
        }
    }
    return true;
}

} // namespace utils
