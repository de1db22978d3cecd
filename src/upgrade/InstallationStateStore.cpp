#include "InstallationStateStore.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace upgrade
{

InstallationStateStore::InstallationStateStore(std::shared_ptr<IKeyValueStore> store)
    : store_(std::move(store))
{
}

std::string InstallationStateStore::keyFor(const char* name) { return std::string(kNamespace) + "/" + name; }

bool InstallationStateStore::isInstalled() const
{
    if (!store_)
        return false;

    try
    {
        auto version = store_->get(keyFor(kInstalledVersionKey));
        return version.has_value() && !version->empty();
    }
    catch (const std::exception& e)
    {
        PLOG_WARNING << "Installation state unreadable, treating as not installed: " << e.what();
        return false;
    }
}

std::optional<InstallationInfo> InstallationStateStore::getInstallationInfo() const
{
    if (!store_)
        return std::nullopt;

    try
    {
        auto version = store_->get(keyFor(kInstalledVersionKey));
        if (!version || version->empty())
            return std::nullopt;

        InstallationInfo info;
        info.version = *version;
        info.installPath = store_->get(keyFor(kInstallPathKey)).value_or("Unknown");
        info.installDate = store_->get(keyFor(kInstallDateKey)).value_or("Unknown");
        return info;
    }
    catch (const std::exception& e)
    {
        PLOG_WARNING << "Failed to read installation record: " << e.what();
        return std::nullopt;
    }
}

bool InstallationStateStore::saveInstallationInfo(const std::string& version, const std::string& installPath)
{
    if (!store_)
        return false;

    if (version.empty())
    {
        PLOG_ERROR << "Refusing to record an installation without a version";
        return false;
    }

    try
    {
        // One write: the previous record stays whole until the new one lands
        store_->setMany({ { keyFor(kInstallPathKey), installPath },
                          { keyFor(kInstallDateKey), currentTimestamp() },
                          { keyFor(kInstalledVersionKey), version } });
        PLOG_INFO << "Recorded installation " << version << " at " << installPath;
        return true;
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Failed to save installation record: " << e.what();
        return false;
    }
}

bool InstallationStateStore::removeInstallationInfo()
{
    if (!store_)
        return false;

    try
    {
        store_->deleteTree(kNamespace);
        PLOG_INFO << "Removed installation record";
        return true;
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Failed to remove installation record: " << e.what();
        return false;
    }
}

std::string InstallationStateStore::currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace upgrade
