#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace config
{
class SettingsStore;
}

namespace plog
{
class IAppender;
}

namespace utils
{

// Values of the [logging] table, with the defaults written back for a fresh file
struct LogSettings
{
    std::string directory = "logs";
    std::string file_name = "cachesync.log";
    bool append = true;
    plog::Severity level = plog::info;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
    bool console = false;
};

/**
 * @brief Owns the process-wide plog logger and its appenders
 *
 * Usage:
 *   auto settings = LogManager::ReadSettings(store);
 *   settings.console = verbose;
 *   LogManager::Initialize(settings);
 *
 * The logger keeps raw pointers to the appenders, so they stay alive until exit.
 * Shutdown() only silences the logger; a later Initialize() turns it back on.
 */
class LogManager
{
public:
    static LogSettings ReadSettings(config::SettingsStore& store);

    static bool Initialize(const LogSettings& settings);
    static void Shutdown();

    static bool IsInitialized();
    static const std::string& LogDirectory();
    static std::string LogFilePath();

    // Creates the directory and truncates the log file unless appending
    static bool PrepareLogFile(const LogSettings& settings, std::string& outError);

    // "none", "fatal", "error", "warning", "info", "debug", "verbose"
    static plog::Severity ParseSeverity(const std::string& name, plog::Severity fallback);

private:
    LogManager() = default;

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
