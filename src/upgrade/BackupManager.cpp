#include "BackupManager.hpp"

#include <plog/Log.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace upgrade
{

std::string BackupManager::backupDirFor(const std::string& installDir)
{
    fs::path install(installDir);
    if (!install.has_filename())
        install = install.parent_path();
    return install.string() + ".storeup-backup";
}

BackupManager::BackupManager(std::string installDir)
    : installDir_(std::move(installDir))
    , backupDir_(backupDirFor(installDir_))
{
}

bool BackupManager::createBackup(std::string& outError)
{
    try
    {
        if (fs::exists(backupDir_))
        {
            PLOG_INFO << "Removing stale backup " << backupDir_;
            fs::remove_all(backupDir_);
        }

        installExisted_ = fs::exists(installDir_);
        if (installExisted_)
        {
            if (!fs::is_directory(installDir_))
            {
                outError = "Install path is not a directory: " + installDir_;
                PLOG_ERROR << outError;
                return false;
            }
            fs::copy(installDir_, backupDir_, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
            PLOG_INFO << "Backed up " << installDir_ << " to " << backupDir_;
        }
        else
        {
            PLOG_INFO << "Nothing installed at " << installDir_ << ", no backup needed";
        }

        created_ = true;
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Backup failed: ") + e.what();
        PLOG_ERROR << outError;
        std::error_code ec;
        fs::remove_all(backupDir_, ec);
        return false;
    }
}

bool BackupManager::restoreFromBackup(std::string& outError)
{
    if (!created_)
    {
        outError = "No backup was taken for " + installDir_;
        PLOG_ERROR << outError;
        return false;
    }

    try
    {
        PLOG_WARNING << "Rolling back " << installDir_;
        fs::remove_all(installDir_);

        if (installExisted_)
        {
            std::error_code ec;
            fs::rename(backupDir_, installDir_, ec);
            if (ec)
            {
                // Different volume or locked entry; fall back to a copy
                PLOG_DEBUG << "Rename failed (" << ec.message() << "), copying backup back";
                fs::copy(backupDir_, installDir_, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
                fs::remove_all(backupDir_);
            }
        }

        created_ = false;
        PLOG_INFO << "Rollback of " << installDir_ << " completed";
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Rollback failed, backup kept at ") + backupDir_ + ": " + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool BackupManager::hasBackup() const { return created_; }

void BackupManager::cleanupBackup()
{
    std::error_code ec;
    fs::remove_all(backupDir_, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove backup " << backupDir_ << ": " << ec.message();
    }
    created_ = false;
}

} // namespace upgrade
