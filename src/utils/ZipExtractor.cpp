#include "ZipExtractor.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#define MINIZ_NO_ARCHIVE_WRITING_APIS
#include <miniz.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace utils
{

namespace
{

// Closes the archive on every exit path
struct ZipReader
{
    mz_zip_archive zip{};
    bool open = false;

    explicit ZipReader(const std::string& path) { open = mz_zip_reader_init_file(&zip, path.c_str(), 0) != 0; }

    ~ZipReader()
    {
        if (open)
            mz_zip_reader_end(&zip);
    }

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;
};

std::string normalizeEntry(std::string name)
{
    std::replace(name.begin(), name.end(), '\\', '/');
    return name;
}

// Entry names that would land outside the target directory
bool escapesTarget(const std::string& relativePath)
{
    if (relativePath.empty() || relativePath[0] == '/')
        return true;
    if (relativePath.size() > 1 && relativePath[1] == ':')
        return true;
    for (const auto& part : fs::path(relativePath))
    {
        if (part == "..")
            return true;
    }
    return false;
}

// "Package-2.0.0/" when every entry lives under that one folder, empty otherwise
std::string commonRootDir(const std::vector<std::string>& names)
{
    std::string root;
    for (const auto& name : names)
    {
        auto slash = name.find('/');
        if (slash == std::string::npos)
            return {};
        std::string first = name.substr(0, slash + 1);
        if (root.empty())
            root = first;
        else if (root != first)
            return {};
    }
    return root;
}

} // namespace

bool ZipExtractor::ExtractZip(const std::string& zipPath, const std::string& targetDir,
                              const std::set<std::string>& preserveFiles, std::string& outError)
{
    std::error_code ec;
    if (!fs::exists(zipPath, ec))
    {
        outError = "ZIP file does not exist: " + zipPath;
        PLOG_ERROR << outError;
        return false;
    }

    ZipReader reader(zipPath);
    if (!reader.open)
    {
        outError = "Failed to open ZIP archive: " + zipPath;
        PLOG_ERROR << outError;
        return false;
    }

    const int fileCount = static_cast<int>(mz_zip_reader_get_num_files(&reader.zip));
    std::vector<std::string> names(fileCount);
    for (int i = 0; i < fileCount; ++i)
    {
        mz_zip_archive_file_stat fileStat{};
        if (!mz_zip_reader_file_stat(&reader.zip, i, &fileStat))
        {
            outError = "Failed to read file stat from ZIP";
            PLOG_ERROR << outError;
            return false;
        }
        names[i] = normalizeEntry(fileStat.m_filename);
    }

    const std::string zipRootDir = commonRootDir(names);
    if (!zipRootDir.empty())
    {
        PLOG_INFO << "ZIP root directory: '" << zipRootDir << "'";
    }

    // Every entry is checked before the first write so a refused archive leaves the target untouched
    for (int i = 0; i < fileCount; ++i)
    {
        if (mz_zip_reader_is_file_a_directory(&reader.zip, i))
            continue;
        if (escapesTarget(names[i].substr(zipRootDir.length())))
        {
            outError = "Refusing unsafe ZIP entry: " + names[i];
            PLOG_ERROR << outError;
            return false;
        }
    }
    PLOG_INFO << "Extracting " << fileCount << " entries from " << zipPath << " to " << targetDir;

    fs::create_directories(targetDir, ec);
    if (ec)
    {
        outError = "Failed to create target directory: " + ec.message();
        PLOG_ERROR << outError;
        return false;
    }

    int extracted = 0;
    for (int i = 0; i < fileCount; ++i)
    {
        if (mz_zip_reader_is_file_a_directory(&reader.zip, i))
            continue;

        const std::string relativePath = names[i].substr(zipRootDir.length());
        fs::path destPath = fs::path(targetDir) / relativePath;
        if (preserveFiles.count(relativePath) > 0 && fs::exists(destPath, ec))
        {
            PLOG_INFO << "Skipping preserved: " << relativePath;
            continue;
        }

        fs::create_directories(destPath.parent_path(), ec);

        size_t size = 0;
        void* fileData = mz_zip_reader_extract_to_heap(&reader.zip, i, &size, 0);
        if (!fileData)
        {
            outError = "Failed to extract file: " + names[i];
            PLOG_ERROR << outError;
            return false;
        }

        std::ofstream outFile(destPath, std::ios::binary | std::ios::trunc);
        if (outFile)
        {
            outFile.write(static_cast<const char*>(fileData), static_cast<std::streamsize>(size));
        }
        mz_free(fileData);

        if (!outFile)
        {
            outError = "Failed to write file: " + destPath.string();
            PLOG_ERROR << outError;
            return false;
        }
        PLOG_DEBUG << "Extracted: '" << names[i] << "' -> '" << destPath.string() << "'";
        ++extracted;
    }

    PLOG_INFO << "ZIP extraction completed (" << extracted << " files)";
    return true;
}

int ZipExtractor::CountFiles(const std::string& zipPath)
{
    ZipReader reader(zipPath);
    if (!reader.open)
        return -1;

    int count = 0;
    const int total = static_cast<int>(mz_zip_reader_get_num_files(&reader.zip));
    for (int i = 0; i < total; ++i)
    {
        if (!mz_zip_reader_is_file_a_directory(&reader.zip, i))
            ++count;
    }
    return count;
}

} // namespace utils
