#include "SettingsStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{

std::vector<std::string> splitKey(const std::string& key)
{
    std::vector<std::string> segments;
    std::istringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '.'))
    {
        segments.push_back(segment);
    }
    return segments;
}

bool validKey(const std::vector<std::string>& segments)
{
    if (segments.empty())
        return false;
    for (const auto& segment : segments)
    {
        if (segment.empty())
            return false;
    }
    return true;
}

} // namespace

namespace config
{

SettingsStore::SettingsStore(std::string path)
    : path_(std::move(path))
    , root_(std::make_unique<toml::table>())
{
    load();
}

SettingsStore::~SettingsStore() = default;

bool SettingsStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_.clear();

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
    {
        root_ = std::make_unique<toml::table>();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, path_));
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Settings file has errors. Falling back to defaults.",
                                            error_details + "\nFile: " + path_);
        root_ = std::make_unique<toml::table>();
        return false;
    }
}

bool SettingsStore::save()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool SettingsStore::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return findLocked(key) != nullptr;
}

template <typename T>
T SettingsStore::getOrHeal(const std::string& key, const T& defaultValue)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (const toml::node* node = findLocked(key))
    {
        if (auto value = node->value<T>())
        {
            return *value;
        }
        PLOG_WARNING << "Setting '" << key << "' has the wrong type; restoring default";
    }
    else
    {
        PLOG_DEBUG << "Setting '" << key << "' missing; writing default";
    }

    std::string leaf;
    if (toml::table* parent = parentTableLocked(key, leaf))
    {
        parent->insert_or_assign(leaf, defaultValue);
        saveLocked();
    }
    return defaultValue;
}

template <typename T>
bool SettingsStore::setAndSave(const std::string& key, const T& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string leaf;
    toml::table* parent = parentTableLocked(key, leaf);
    if (!parent)
        return false;

    parent->insert_or_assign(leaf, value);
    return saveLocked();
}

bool SettingsStore::getBool(const std::string& key, bool defaultValue) { return getOrHeal<bool>(key, defaultValue); }

std::int64_t SettingsStore::getInt(const std::string& key, std::int64_t defaultValue)
{
    return getOrHeal<std::int64_t>(key, defaultValue);
}

double SettingsStore::getDouble(const std::string& key, double defaultValue)
{
    return getOrHeal<double>(key, defaultValue);
}

std::string SettingsStore::getString(const std::string& key, const std::string& defaultValue)
{
    return getOrHeal<std::string>(key, defaultValue);
}

bool SettingsStore::setBool(const std::string& key, bool value) { return setAndSave(key, value); }

bool SettingsStore::setInt(const std::string& key, std::int64_t value) { return setAndSave(key, value); }

bool SettingsStore::setDouble(const std::string& key, double value) { return setAndSave(key, value); }

bool SettingsStore::setString(const std::string& key, const std::string& value) { return setAndSave(key, value); }

const toml::node* SettingsStore::findLocked(const std::string& key) const
{
    const auto segments = splitKey(key);
    if (!validKey(segments) || !root_)
        return nullptr;

    const toml::table* current = root_.get();
    for (std::size_t i = 0; i + 1 < segments.size(); ++i)
    {
        const toml::node* next = current->get(segments[i]);
        if (!next || !next->is_table())
            return nullptr;
        current = next->as_table();
    }
    return current->get(segments.back());
}

toml::table* SettingsStore::parentTableLocked(const std::string& key, std::string& outLeaf)
{
    const auto segments = splitKey(key);
    if (!validKey(segments))
    {
        last_error_ = "Invalid settings key: '" + key + "'";
        PLOG_WARNING << last_error_;
        return nullptr;
    }

    if (!root_)
    {
        root_ = std::make_unique<toml::table>();
    }

    toml::table* current = root_.get();
    for (std::size_t i = 0; i + 1 < segments.size(); ++i)
    {
        toml::node* next = current->get(segments[i]);
        if (!next || !next->is_table())
        {
            // A scalar in the way of a table path is replaced
            next = &current->insert_or_assign(segments[i], toml::table{}).first->second;
        }
        current = next->as_table();
    }

    outLeaf = segments.back();
    return current;
}

bool SettingsStore::saveLocked()
{
    last_error_.clear();

    std::error_code ec;
    const fs::path target(path_);
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save settings",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << *root_;
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save settings",
                                          "Could not rename temporary file: " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    return true;
}

} // namespace config
