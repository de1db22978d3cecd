#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace upgrade
{

// Raised by store implementations when the backing medium cannot be read or written
class KeyValueStoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Host-wide key-value hierarchy (registry, config file, keychain...).
// Keys are '/'-separated paths, e.g. "storeup/InstalledVersion".
class IKeyValueStore
{
public:
    virtual ~IKeyValueStore() = default;

    // std::nullopt when the key or any parent is absent; throws KeyValueStoreError on I/O failure
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // Creates intermediate namespaces as needed; durable once it returns
    virtual void set(const std::string& key, const std::string& value) = 0;

    // Writes every entry or none of them
    virtual void setMany(const std::vector<std::pair<std::string, std::string>>& entries) = 0;

    // Removes a namespace and everything below it; absent namespaces are not an error
    virtual void deleteTree(const std::string& ns) = 0;
};

// File-backed store: the hierarchy is kept as nested TOML tables
class TomlKeyValueStore : public IKeyValueStore
{
public:
    explicit TomlKeyValueStore(std::string filePath);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void setMany(const std::vector<std::pair<std::string, std::string>>& entries) override;
    void deleteTree(const std::string& ns) override;

    const std::string& filePath() const { return filePath_; }

private:
    std::string filePath_;
};

} // namespace upgrade
