#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../config/SettingsStore.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <utility>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

constexpr std::size_t kMegabyte = 1024 * 1024;

constexpr std::pair<const char*, plog::Severity> kSeverityNames[] = {
    { "none", plog::none },       { "fatal", plog::fatal }, { "error", plog::error },
    { "warning", plog::warning }, { "info", plog::info },   { "debug", plog::debug },
    { "verbose", plog::verbose },
};

std::string severityName(plog::Severity severity)
{
    for (const auto& [text, value] : kSeverityNames)
    {
        if (value == severity)
            return text;
    }
    return "info";
}

std::size_t positiveOr(std::int64_t value, std::size_t fallback)
{
    return value > 0 ? static_cast<std::size_t>(value) : fallback;
}

} // namespace

LogSettings LogManager::ReadSettings(config::SettingsStore& store)
{
    LogSettings defaults;
    LogSettings settings;

    settings.directory = store.getString("logging.directory", defaults.directory);
    if (settings.directory.empty())
        settings.directory = defaults.directory;

    settings.append = store.getBool("logging.append", defaults.append);

    const std::string level = store.getString("logging.level", severityName(defaults.level));
    settings.level = ParseSeverity(level, defaults.level);

    settings.max_file_size =
        positiveOr(store.getInt("logging.max_file_size_mb", static_cast<std::int64_t>(defaults.max_file_size / kMegabyte)),
                   defaults.max_file_size / kMegabyte) *
        kMegabyte;
    settings.backup_count =
        positiveOr(store.getInt("logging.backup_count", static_cast<std::int64_t>(defaults.backup_count)),
                   defaults.backup_count);

    return settings;
}

plog::Severity LogManager::ParseSeverity(const std::string& name, plog::Severity fallback)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // plog::severityFromString() only looks at the first letter, which accepts too much
    for (const auto& [text, severity] : kSeverityNames)
    {
        if (lowered == text)
            return severity;
    }
    if (lowered == "warn")
        return plog::warning;

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown logging level, using default",
                                 name + " -> " + severityName(fallback));
    return fallback;
}

bool LogManager::PrepareLogFile(const LogSettings& settings, std::string& outError)
{
    std::error_code ec;
    std::filesystem::create_directories(settings.directory, ec);
    if (ec)
    {
        outError = "Unable to create " + settings.directory + ": " + ec.message();
        return false;
    }

    if (!settings.append)
    {
        const auto path = std::filesystem::path(settings.directory) / settings.file_name;
        std::ofstream truncate(path, std::ios::trunc);
        if (!truncate)
        {
            outError = "Unable to truncate " + path.string();
            return false;
        }
    }

    return true;
}

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    // Appenders from an earlier Initialize() are still attached to the logger
    if (!s_appenders.empty())
    {
        plog::get<0>()->setMaxSeverity(settings.level);
        s_initialized = true;
        return true;
    }

    std::string error;
    if (!PrepareLogFile(settings, error))
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to prepare log file", error);
        return false;
    }

    s_settings = settings;
    const std::string filepath = LogFilePath();

    try
    {
        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            filepath.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));
        plog::init<0>(settings.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::get<0>()->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file " + filepath, ex.what());
        return false;
    }

    s_initialized = true;
    return true;
}

void LogManager::Shutdown()
{
    if (!s_initialized)
        return;

    if (auto* logger = plog::get<0>())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const std::string& LogManager::LogDirectory() { return s_settings.directory; }

std::string LogManager::LogFilePath()
{
    return (std::filesystem::path(s_settings.directory) / s_settings.file_name).string();
}

} // namespace utils
