#include "KeyValueStore.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace upgrade
{

namespace
{

std::vector<std::string> splitPath(const std::string& key)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : key)
    {
        if (c == '/')
        {
            if (!current.empty())
                parts.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }
    if (!current.empty())
        parts.push_back(std::move(current));
    return parts;
}

toml::table loadTable(const std::string& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (ec)
            throw KeyValueStoreError("Cannot access state file " + path + ": " + ec.message());
        return toml::table{};
    }

    try
    {
        return toml::parse_file(path);
    }
    catch (const toml::parse_error& pe)
    {
        throw KeyValueStoreError("Corrupted state file " + path + ": " + std::string(pe.description()));
    }
}

// Write-then-rename so a crash never leaves a half-written record behind
void saveTable(const std::string& path, const toml::table& table)
{
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
            throw KeyValueStoreError("Cannot create state directory: " + ec.message());
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream ofs(temp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw KeyValueStoreError("Cannot open state file for writing: " + temp.string());
        ofs << table << '\n';
        ofs.flush();
        if (!ofs)
            throw KeyValueStoreError("Failed to write state file: " + temp.string());
    }

    fs::rename(temp, target, ec);
    if (ec)
    {
        fs::remove(temp, ec);
        throw KeyValueStoreError("Failed to replace state file " + path);
    }
}

void assignPath(toml::table& root, const std::string& key, const std::string& value)
{
    auto parts = splitPath(key);
    if (parts.empty())
        throw KeyValueStoreError("Empty state key");

    toml::table* table = &root;
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        toml::table* child = table->get_as<toml::table>(parts[i]);
        if (!child)
        {
            table->insert_or_assign(parts[i], toml::table{});
            child = table->get_as<toml::table>(parts[i]);
        }
        table = child;
    }
    table->insert_or_assign(parts.back(), value);
}

} // namespace

TomlKeyValueStore::TomlKeyValueStore(std::string filePath)
    : filePath_(std::move(filePath))
{
}

std::optional<std::string> TomlKeyValueStore::get(const std::string& key)
{
    auto parts = splitPath(key);
    if (parts.empty())
        return std::nullopt;

    toml::table root = loadTable(filePath_);
    const toml::table* table = &root;
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        table = table->get_as<toml::table>(parts[i]);
        if (!table)
            return std::nullopt;
    }

    const toml::node* node = table->get(parts.back());
    if (!node)
        return std::nullopt;

    if (auto value = node->value<std::string>())
        return *value;

    throw KeyValueStoreError("State entry '" + key + "' is not a string");
}

void TomlKeyValueStore::set(const std::string& key, const std::string& value)
{
    toml::table root = loadTable(filePath_);
    assignPath(root, key, value);
    saveTable(filePath_, root);
}

void TomlKeyValueStore::setMany(const std::vector<std::pair<std::string, std::string>>& entries)
{
    toml::table root = loadTable(filePath_);
    for (const auto& [key, value] : entries)
        assignPath(root, key, value);
    saveTable(filePath_, root);
}

void TomlKeyValueStore::deleteTree(const std::string& ns)
{
    auto parts = splitPath(ns);
    if (parts.empty())
        throw KeyValueStoreError("Empty state namespace");

    toml::table root = loadTable(filePath_);
    toml::table* table = &root;
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        table = table->get_as<toml::table>(parts[i]);
        if (!table)
            return;
    }

    if (table->erase(parts.back()) == 0)
        return;

    PLOG_DEBUG << "Removed state namespace '" << ns << "' from " << filePath_;
    saveTable(filePath_, root);
}

} // namespace upgrade
