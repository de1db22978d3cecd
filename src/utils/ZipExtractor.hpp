#pragma once

#include <set>
#include <string>

namespace utils
{

// Cross-platform ZIP extraction using miniz library
class ZipExtractor
{
public:
    // Extract ZIP archive to target directory.
    // A single top-level folder wrapping every entry is stripped. Paths listed in
    // preserveFiles (relative, '/'-separated) are not overwritten when they already exist.
    // Returns true on success, false on failure with error message in outError
    static bool ExtractZip(const std::string& zipPath, const std::string& targetDir,
                           const std::set<std::string>& preserveFiles, std::string& outError);

    // Number of file entries (directories excluded), -1 when the archive cannot be opened
    static int CountFiles(const std::string& zipPath);
};

} // namespace utils
