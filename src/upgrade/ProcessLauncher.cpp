#include "ProcessLauncher.hpp"

#include "../platform/ProcessUtils.hpp"

#include <plog/Log.h>

namespace upgrade
{

bool DetachedProcessLauncher::launch(const std::string& executable, const std::vector<std::string>& args,
                                     std::string& outError)
{
    PLOG_INFO << "Launching upgrader: " << executable << " (" << args.size() << " arguments)";
    auto started = utils::ProcessUtils::LaunchDetached(executable, args);
    if (!started.started)
    {
        outError = started.error;
        return false;
    }
    PLOG_DEBUG << "Upgrader pid " << started.pid;
    return true;
}

} // namespace upgrade
