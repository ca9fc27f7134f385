#pragma once

#include "mirror/SyncTypes.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace config
{
class SettingsStore;
}

namespace mirror
{
class SyncEngine;
}

namespace net
{
class IFileFetcher;
}

struct CliOptions
{
    std::string manifest_path;
    std::string root;
    std::optional<long long> workers;
    std::optional<mirror::SyncMode> mode;
    std::string config_path = "config.toml";
    std::string post_sync;
    bool verbose = false;
    bool help = false;
};

class Application
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitSyncFailed = 1;
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

    // Exposed for tests; returns false with outError set on bad usage
    static bool ParseArguments(const std::vector<std::string>& args, CliOptions& outOptions, std::string& outError);
    static void PrintUsage(const char* program_name);

private:
    bool initializeLogging();
    void initializeConfig();
    std::shared_ptr<net::IFileFetcher> createFetcher();

    int runBatch();
    void onProgress(const std::string& title, const std::string& detail, double progress);
    void printPendingErrors();
    int runPostSync();

    std::vector<std::string> args_;
    std::string program_name_;
    CliOptions options_;

    std::unique_ptr<config::SettingsStore> settings_;
    std::unique_ptr<mirror::SyncEngine> engine_;
    std::mutex console_mutex_;
};
