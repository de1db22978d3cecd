#pragma once

#include <string>

namespace upgrade
{

// Snapshot of an install directory taken before a package is applied over it.
// The copy lives beside the install ("<installDir>.storeup-backup") so extraction
// into the install never touches it.
class BackupManager
{
public:
    explicit BackupManager(std::string installDir);

    // Copies the whole install. A missing install directory is recorded so a restore
    // removes whatever a failed fresh install left behind.
    bool createBackup(std::string& outError);

    // Puts the install back exactly as it was when createBackup ran
    bool restoreFromBackup(std::string& outError);

    bool hasBackup() const;
    void cleanupBackup();

    const std::string& getBackupDir() const { return backupDir_; }

    static std::string backupDirFor(const std::string& installDir);

private:
    std::string installDir_;
    std::string backupDir_;
    bool installExisted_ = false;
    bool created_ = false;
};

} // namespace upgrade
