#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

struct LaunchResult
{
    bool started = false;
    long pid = 0;
    std::string error;
};

class ProcessUtils
{
public:
    // Absolute path of the running executable; empty on failure
    static std::filesystem::path GetExecutablePath();

    // Starts exePath in its own session so it keeps running after the caller exits.
    // On POSIX a failing exec in the child is reported back through LaunchResult::error.
    static LaunchResult LaunchDetached(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                       const std::filesystem::path& workingDirectory = {});

    // CreateProcess command line; every argument survives CommandLineToArgvW unchanged
    static std::string BuildCommandLine(const std::filesystem::path& exePath, const std::vector<std::string>& args);

    static std::string QuoteArgument(const std::string& arg);
};

} // namespace utils
