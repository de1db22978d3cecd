#include "InstallationDetector.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace upgrade
{

namespace
{

std::string trim(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

InstallationDetector::InstallationDetector(const InstallationStateStore& stateStore, SiteSettings settings)
    : stateStore_(stateStore)
    , settings_(std::move(settings))
{
}

std::optional<ExistingInstallation> InstallationDetector::detect() const
{
    auto info = stateStore_.getInstallationInfo();
    if (!info)
    {
        PLOG_INFO << "No existing installation found";
        return std::nullopt;
    }

    ExistingInstallation installation;
    installation.siteName = settings_.siteName;
    installation.companyName = settings_.siteName;
    installation.version = info->version;
    installation.installDate = info->installDate;
    installation.installPath =
        (info->installPath.empty() || info->installPath == "Unknown") ? settings_.installPath : info->installPath;
    installation.databaseServer = settings_.databaseServer;
    installation.databaseName = settings_.databaseName;

    PLOG_INFO << "Analyzing installation " << installation.version << " at " << installation.installPath;

    std::vector<std::string> issues;
    std::error_code ec;
    if (installation.installPath.empty() || !fs::is_directory(installation.installPath, ec))
    {
        issues.push_back("Installation directory not found");
    }
    else
    {
        const auto appSettings = (fs::path(installation.installPath) / kAppSettingsFile).string();
        if (!fs::exists(appSettings, ec))
        {
            issues.push_back(std::string(kAppSettingsFile) + " not found");
        }
        else if (installation.databaseServer.empty() || installation.databaseName.empty())
        {
            std::string connectionString;
            std::string error;
            if (readConnectionString(appSettings, connectionString, error))
            {
                std::string server = installation.databaseServer;
                std::string database = installation.databaseName;
                parseConnectionString(connectionString, server, database);
                installation.databaseServer = server;
                installation.databaseName = database;
            }
            else
            {
                PLOG_WARNING << "Connection string unavailable: " << error;
            }
        }
    }

    installation.hasDatabase = !installation.databaseName.empty();
    if (!issues.empty())
    {
        installation.isHealthy = false;
        for (const auto& issue : issues)
            PLOG_WARNING << "Installation issue: " << issue;
        installation.issues = std::move(issues);
    }

    return installation;
}

bool InstallationDetector::readConnectionString(const std::string& appSettingsPath, std::string& outConnectionString,
                                                std::string& outError)
{
    std::ifstream ifs(appSettingsPath);
    if (!ifs.is_open())
    {
        outError = "Cannot open " + appSettingsPath;
        return false;
    }

    try
    {
        nlohmann::json doc = nlohmann::json::parse(ifs);
        auto strings = doc.find("ConnectionStrings");
        if (strings == doc.end() || !strings->is_object())
        {
            outError = "No ConnectionStrings section";
            return false;
        }
        auto value = strings->find("DefaultConnection");
        if (value == strings->end() || !value->is_string())
        {
            outError = "No DefaultConnection entry";
            return false;
        }
        outConnectionString = value->get<std::string>();
        return true;
    }
    catch (const nlohmann::json::exception& e)
    {
        outError = std::string("Invalid ") + kAppSettingsFile + ": " + e.what();
        return false;
    }
}

void InstallationDetector::parseConnectionString(const std::string& connectionString, std::string& outServer,
                                                 std::string& outDatabase)
{
    size_t start = 0;
    while (start <= connectionString.size())
    {
        size_t end = connectionString.find(';', start);
        if (end == std::string::npos)
            end = connectionString.size();

        std::string part = connectionString.substr(start, end - start);
        size_t eq = part.find('=');
        if (eq != std::string::npos)
        {
            std::string key = toLower(trim(part.substr(0, eq)));
            std::string value = trim(part.substr(eq + 1));
            if (key == "server" || key == "data source")
                outServer = value;
            else if (key == "database" || key == "initial catalog")
                outDatabase = value;
        }

        if (end == connectionString.size())
            break;
        start = end + 1;
    }
}

} // namespace upgrade
