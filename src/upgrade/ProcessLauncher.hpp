#pragma once

#include <string>
#include <vector>

namespace upgrade
{

// Starts the upgrader process that takes over an upgrade run
class IProcessLauncher
{
public:
    virtual ~IProcessLauncher() = default;

    virtual bool launch(const std::string& executable, const std::vector<std::string>& args,
                        std::string& outError) = 0;
};

// Launches detached so the upgrader outlives the installer
class DetachedProcessLauncher : public IProcessLauncher
{
public:
    bool launch(const std::string& executable, const std::vector<std::string>& args, std::string& outError) override;
};

} // namespace upgrade
