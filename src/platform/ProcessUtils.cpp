#include "ProcessUtils.hpp"

#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace utils
{

std::filesystem::path ProcessUtils::GetExecutablePath()
{
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    for (;;)
    {
        DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (size == 0)
        {
            PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
            return {};
        }
        if (size < buffer.size())
        {
            buffer.resize(size);
            return std::filesystem::path(buffer);
        }
        buffer.resize(buffer.size() * 2, L'\0');
    }
#else
    std::error_code ec;
    auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Cannot resolve /proc/self/exe: " << ec.message();
        return {};
    }
    return exePath;
#endif
}

std::string ProcessUtils::QuoteArgument(const std::string& arg)
{
    // Backslashes only need doubling when they end up in front of a quote
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg)
    {
        if (c == '\\')
        {
            ++backslashes;
            continue;
        }
        if (c == '"')
        {
            quoted.append(backslashes * 2 + 1, '\\');
        }
        else
        {
            quoted.append(backslashes, '\\');
        }
        quoted += c;
        backslashes = 0;
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

std::string ProcessUtils::BuildCommandLine(const std::filesystem::path& exePath, const std::vector<std::string>& args)
{
    std::string cmdLine = QuoteArgument(exePath.string());
    for (const auto& arg : args)
    {
        cmdLine += ' ';
        cmdLine += QuoteArgument(arg);
    }
    return cmdLine;
}

LaunchResult ProcessUtils::LaunchDetached(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                          const std::filesystem::path& workingDirectory)
{
    LaunchResult result;

    std::error_code ec;
    if (exePath.empty() || !std::filesystem::is_regular_file(exePath, ec))
    {
        result.error = "Executable not found: " + exePath.string();
        PLOG_ERROR << result.error;
        return result;
    }

#ifdef _WIN32
    std::string cmdLine = BuildCommandLine(exePath, args);
    std::string cwd = workingDirectory.string();

    STARTUPINFOA si = { sizeof(si) };
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(nullptr, cmdLine.data(), nullptr, nullptr, FALSE,
                        DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr, cwd.empty() ? nullptr : cwd.c_str(),
                        &si, &pi))
    {
        result.error = "CreateProcess failed with error " + std::to_string(GetLastError());
        PLOG_ERROR << result.error;
        return result;
    }

    result.started = true;
    result.pid = static_cast<long>(pi.dwProcessId);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
#else
    // The child writes errno here if exec fails; a successful exec closes it
    int errPipe[2];
    if (pipe(errPipe) != 0)
    {
        result.error = std::string("pipe() failed: ") + std::strerror(errno);
        PLOG_ERROR << result.error;
        return result;
    }
    fcntl(errPipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(exePath.c_str()));
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        result.error = std::string("fork() failed: ") + std::strerror(errno);
        close(errPipe[0]);
        close(errPipe[1]);
        PLOG_ERROR << result.error;
        return result;
    }

    if (pid == 0)
    {
        // Only async-signal-safe calls until exec
        close(errPipe[0]);
        setsid();
        if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) != 0)
        {
            int err = errno;
            [[maybe_unused]] auto written = write(errPipe[1], &err, sizeof(err));
            _exit(127);
        }
        execv(exePath.c_str(), argv.data());
        int err = errno;
        [[maybe_unused]] auto written = write(errPipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(errPipe[1]);
    int childErrno = 0;
    ssize_t n;
    do
    {
        n = read(errPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno)))
    {
        waitpid(pid, nullptr, 0);
        result.error = "Cannot start " + exePath.string() + ": " + std::strerror(childErrno);
        PLOG_ERROR << result.error;
        return result;
    }

    result.started = true;
    result.pid = static_cast<long>(pid);
#endif

    PLOG_INFO << "Started " << exePath.string() << " (pid " << result.pid << ")";
    return result;
}

} // namespace utils
