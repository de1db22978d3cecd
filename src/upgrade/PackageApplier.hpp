#pragma once

#include <memory>
#include <set>
#include <string>

namespace upgrade
{

struct ApplyResult
{
    bool success = false;
    std::string error;
};

// Places a downloaded package's contents into the install path
class IPackageApplier
{
public:
    virtual ~IPackageApplier() = default;

    virtual ApplyResult apply(const std::string& packagePath, const std::string& installPath) = 0;

    // Undo the last successful apply. Appliers that keep no backup cannot.
    virtual bool rollback(std::string& outError)
    {
        outError = "This applier keeps no backup";
        return false;
    }

    // The last apply is final; drop anything kept for rollback
    virtual void finalize() {}
};

class BackupManager;

// Unpacks a ZIP release package. Site configuration already present in the install
// path (appsettings.json by default) is left untouched. The install is backed up
// before extraction and restored when extraction fails; after a successful apply the
// backup is kept until finalize() or rollback().
class ZipPackageApplier : public IPackageApplier
{
public:
    ZipPackageApplier();
    explicit ZipPackageApplier(std::set<std::string> preservedFiles);
    ~ZipPackageApplier() override;

    ApplyResult apply(const std::string& packagePath, const std::string& installPath) override;
    bool rollback(std::string& outError) override;
    void finalize() override;

private:
    std::set<std::string> preservedFiles_;
    std::unique_ptr<BackupManager> backup_;
};

} // namespace upgrade
