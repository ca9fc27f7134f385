#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <toml++/toml.h>

namespace config
{

// TOML file of dotted keys ("sync.worker_count"). Missing or mistyped keys are
// healed by writing the caller's default back to disk.
class SettingsStore
{
public:
    explicit SettingsStore(std::string path = "config.toml");
    ~SettingsStore();

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    // Re-reads the file. A parse error resets to an empty table and returns false.
    bool load();
    bool save();

    bool getBool(const std::string& key, bool defaultValue);
    std::int64_t getInt(const std::string& key, std::int64_t defaultValue);
    double getDouble(const std::string& key, double defaultValue);
    std::string getString(const std::string& key, const std::string& defaultValue);

    bool setBool(const std::string& key, bool value);
    bool setInt(const std::string& key, std::int64_t value);
    bool setDouble(const std::string& key, double value);
    bool setString(const std::string& key, const std::string& value);

    bool contains(const std::string& key) const;

    const std::string& path() const { return path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    template <typename T>
    T getOrHeal(const std::string& key, const T& defaultValue);

    template <typename T>
    bool setAndSave(const std::string& key, const T& value);

    const toml::node* findLocked(const std::string& key) const;
    toml::table* parentTableLocked(const std::string& key, std::string& outLeaf);
    bool saveLocked();

    std::string path_;
    std::string last_error_;
    std::unique_ptr<toml::table> root_;
    mutable std::mutex mutex_;
};

} // namespace config
