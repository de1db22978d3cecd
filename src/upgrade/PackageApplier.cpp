#include "PackageApplier.hpp"

#include "BackupManager.hpp"
#include "InstallationDetector.hpp"
#include "../utils/ZipExtractor.hpp"

#include <plog/Log.h>

namespace upgrade
{

ZipPackageApplier::ZipPackageApplier()
    : preservedFiles_{ InstallationDetector::kAppSettingsFile }
{
}

ZipPackageApplier::ZipPackageApplier(std::set<std::string> preservedFiles)
    : preservedFiles_(std::move(preservedFiles))
{
}

ZipPackageApplier::~ZipPackageApplier() = default;

ApplyResult ZipPackageApplier::apply(const std::string& packagePath, const std::string& installPath)
{
    ApplyResult result;
    if (installPath.empty())
    {
        result.error = "No install path configured";
        return result;
    }

    // A backup left by an apply nobody finalized is superseded
    finalize();

    auto backup = std::make_unique<BackupManager>(installPath);
    std::string error;
    if (!backup->createBackup(error))
    {
        result.error = "Could not back up the installation: " + error;
        return result;
    }

    PLOG_INFO << "Applying package " << packagePath << " to " << installPath;
    bool extracted = false;
    try
    {
        extracted = utils::ZipExtractor::ExtractZip(packagePath, installPath, preservedFiles_, error);
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }

    if (!extracted)
    {
        result.error = "Package extraction failed: " + error;
        PLOG_ERROR << result.error;

        std::string restoreError;
        if (!backup->restoreFromBackup(restoreError))
            result.error += " (" + restoreError + ")";
        return result;
    }

    backup_ = std::move(backup);
    result.success = true;
    return result;
}

bool ZipPackageApplier::rollback(std::string& outError)
{
    if (!backup_)
    {
        outError = "No applied package to roll back";
        return false;
    }

    const bool restored = backup_->restoreFromBackup(outError);
    if (restored)
        backup_.reset();
    return restored;
}

void ZipPackageApplier::finalize()
{
    if (!backup_)
        return;
    backup_->cleanupBackup();
    backup_.reset();
}

} // namespace upgrade
