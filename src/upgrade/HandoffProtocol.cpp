#include "HandoffProtocol.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace upgrade
{

namespace
{

struct HandoffFields
{
    std::optional<std::string> siteName;
    std::optional<std::string> installPath;
    std::optional<std::string> dbServer;
    std::optional<std::string> dbName;
    std::optional<std::string> version;
    std::optional<std::string> companyName;
    std::optional<std::string> installDate;
    int productCount = 0;
    int orderCount = 0;
    int userCount = 0;
};

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string quoted(const std::string& value) { return "\"" + value + "\""; }

std::string unquote(const std::string& value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

int parseCount(const std::string& value)
{
    try
    {
        return std::stoi(unquote(value));
    }
    catch (const std::exception&)
    {
        PLOG_WARNING << "Ignoring non-numeric handoff count '" << value << "'";
        return 0;
    }
}

bool isMissing(const std::optional<std::string>& field) { return !field || field->empty(); }

HandoffFields parseTokens(const std::vector<std::string>& tokens)
{
    HandoffFields fields;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        const std::string flag = toLower(tokens[i]);
        const bool hasValue = i + 1 < tokens.size();
        if (!hasValue)
            break;

        if (flag == "--sitename" || flag == "-s")
            fields.siteName = unquote(tokens[++i]);
        else if (flag == "--installpath" || flag == "-i")
            fields.installPath = unquote(tokens[++i]);
        else if (flag == "--dbserver" || flag == "-ds")
            fields.dbServer = unquote(tokens[++i]);
        else if (flag == "--dbname" || flag == "-dn")
            fields.dbName = unquote(tokens[++i]);
        else if (flag == "--version" || flag == "-v")
            fields.version = unquote(tokens[++i]);
        else if (flag == "--companyname")
            fields.companyName = unquote(tokens[++i]);
        else if (flag == "--installdate")
            fields.installDate = unquote(tokens[++i]);
        else if (flag == "--productcount")
            fields.productCount = parseCount(tokens[++i]);
        else if (flag == "--ordercount")
            fields.orderCount = parseCount(tokens[++i]);
        else if (flag == "--usercount")
            fields.userCount = parseCount(tokens[++i]);
    }
    return fields;
}

} // namespace

std::vector<std::string> HandoffProtocol::encode(const ExistingInstallation& installation)
{
    std::vector<std::string> tokens{ "--sitename",    quoted(installation.siteName),
                                     "--installpath", quoted(installation.installPath),
                                     "--dbserver",    quoted(installation.databaseServer),
                                     "--dbname",      quoted(installation.databaseName),
                                     "--version",     quoted(installation.version),
                                     "--productcount", std::to_string(installation.productCount),
                                     "--ordercount",  std::to_string(installation.orderCount),
                                     "--usercount",   std::to_string(installation.userCount) };

    if (!installation.companyName.empty() && installation.companyName != installation.siteName)
    {
        tokens.push_back("--companyname");
        tokens.push_back(quoted(installation.companyName));
    }
    if (!installation.installDate.empty())
    {
        tokens.push_back("--installdate");
        tokens.push_back(quoted(installation.installDate));
    }
    return tokens;
}

std::optional<ExistingInstallation> HandoffProtocol::decode(const std::vector<std::string>& tokens)
{
    HandoffFields fields = parseTokens(tokens);

    if (isMissing(fields.siteName) || isMissing(fields.installPath) || isMissing(fields.dbServer) ||
        isMissing(fields.dbName))
    {
        PLOG_ERROR << "Handoff arguments incomplete:"
                   << " siteName='" << fields.siteName.value_or("NULL") << "'"
                   << " installPath='" << fields.installPath.value_or("NULL") << "'"
                   << " dbServer='" << fields.dbServer.value_or("NULL") << "'"
                   << " dbName='" << fields.dbName.value_or("NULL") << "'";
        return std::nullopt;
    }

    ExistingInstallation installation;
    installation.siteName = *fields.siteName;
    installation.installPath = *fields.installPath;
    installation.databaseServer = *fields.dbServer;
    installation.databaseName = *fields.dbName;
    installation.hasDatabase = true;
    installation.version = isMissing(fields.version) ? "Unknown" : *fields.version;
    installation.companyName = isMissing(fields.companyName) ? installation.siteName : *fields.companyName;
    installation.installDate = fields.installDate.value_or("");
    installation.productCount = fields.productCount;
    installation.orderCount = fields.orderCount;
    installation.userCount = fields.userCount;
    // The installer only hands off installations it has already checked
    installation.isHealthy = true;
    installation.issues = std::nullopt;
    return installation;
}

std::optional<ExistingInstallation> HandoffProtocol::decode(int argc, char** argv)
{
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i)
    {
        tokens.emplace_back(argv[i]);
    }
    return decode(tokens);
}

std::vector<std::string> HandoffProtocol::missingRequired(const std::vector<std::string>& tokens)
{
    HandoffFields fields = parseTokens(tokens);
    std::vector<std::string> missing;
    if (isMissing(fields.siteName))
        missing.push_back("--sitename");
    if (isMissing(fields.installPath))
        missing.push_back("--installpath");
    if (isMissing(fields.dbServer))
        missing.push_back("--dbserver");
    if (isMissing(fields.dbName))
        missing.push_back("--dbname");
    return missing;
}

} // namespace upgrade
