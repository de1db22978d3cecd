#pragma once

#include <filesystem>
#include <random>
#include <string>

namespace test_utils {

// Scratch directory under the system temp dir, removed with everything in it
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "storeup_test") {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(rd()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

}  // namespace test_utils
