#include "Application.hpp"
#include "config/SettingsStore.hpp"
#include "mirror/ManifestParser.hpp"
#include "mirror/SyncEngine.hpp"
#include "net/CprFetcher.hpp"
#include "platform/ProcessUtils.hpp"
#include "platform/SystemInfo.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

#ifndef CACHESYNC_VERSION_STRING
#define CACHESYNC_VERSION_STRING "0.0.0-dev"
#endif

namespace
{

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        g_interrupted = 1;
    }
}

bool parseCount(const std::string& text, long long& out)
{
    try
    {
        std::size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0)
            return false;
        out = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

} // namespace

Application::Application(int argc, char** argv)
    : program_name_(argc > 0 ? argv[0] : "cachesync")
{
    for (int i = 1; i < argc; ++i)
    {
        args_.emplace_back(argv[i]);
    }
}

Application::~Application()
{
    engine_.reset();
    utils::LogManager::Shutdown();
}

void Application::PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS] <manifest.json>\n";
    std::cout << "cachesync " << CACHESYNC_VERSION_STRING << " - verify and mirror files listed in a manifest\n\n";
    std::cout << "Options:\n";
    std::cout << "  --root DIR           Local cache root (overrides manifest and config)\n";
    std::cout << "  --workers N          Worker threads, 0 detects the core count\n";
    std::cout << "  --audit              Verify only, never write local files\n";
    std::cout << "  --repair             Verify and replace bad files\n";
    std::cout << "  --config FILE        Settings file (default: config.toml)\n";
    std::cout << "  --post-sync CMD      Run CMD after a batch with no failures\n";
    std::cout << "  --verbose            Debug output on the console\n";
    std::cout << "  --help               Show this help message\n";
    std::cout << "\nExit codes: 0 success, 1 sync failures, 2 usage or configuration error.\n";
}

bool Application::ParseArguments(const std::vector<std::string>& args, CliOptions& outOptions, std::string& outError)
{
    auto needValue = [&](std::size_t& i, const std::string& flag, std::string& out) -> bool
    {
        if (i + 1 >= args.size())
        {
            outError = flag + " requires a value";
            return false;
        }
        out = args[++i];
        return true;
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h")
        {
            outOptions.help = true;
            return true;
        }
        else if (arg == "--root")
        {
            if (!needValue(i, arg, outOptions.root))
                return false;
        }
        else if (arg == "--workers")
        {
            std::string value;
            if (!needValue(i, arg, value))
                return false;
            long long count = 0;
            if (!parseCount(value, count))
            {
                outError = "--workers expects a non-negative integer, got '" + value + "'";
                return false;
            }
            outOptions.workers = count;
        }
        else if (arg == "--audit" || arg == "--repair")
        {
            const auto mode = arg == "--audit" ? mirror::SyncMode::Audit : mirror::SyncMode::Repair;
            if (outOptions.mode && *outOptions.mode != mode)
            {
                outError = "--audit and --repair are mutually exclusive";
                return false;
            }
            outOptions.mode = mode;
        }
        else if (arg == "--config")
        {
            if (!needValue(i, arg, outOptions.config_path))
                return false;
        }
        else if (arg == "--post-sync")
        {
            if (!needValue(i, arg, outOptions.post_sync))
                return false;
        }
        else if (arg == "--verbose")
        {
            outOptions.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            outError = "Unknown option: " + arg;
            return false;
        }
        else if (outOptions.manifest_path.empty())
        {
            outOptions.manifest_path = arg;
        }
        else
        {
            outError = "Unexpected argument: " + arg;
            return false;
        }
    }

    if (outOptions.manifest_path.empty())
    {
        outError = "Missing manifest path";
        return false;
    }

    return true;
}

int Application::run()
{
    std::string error;
    if (!ParseArguments(args_, options_, error))
    {
        std::cerr << "ERROR: " << error << "\n\n";
        PrintUsage(program_name_.c_str());
        return kExitUsage;
    }

    if (options_.help)
    {
        PrintUsage(program_name_.c_str());
        return kExitOk;
    }

    initializeConfig();

    if (!initializeLogging())
    {
        printPendingErrors();
        return kExitUsage;
    }

    int code = runBatch();
    if (code == kExitOk && !options_.post_sync.empty())
    {
        // Reported errors skip the hook even when the summary is clean
        if (utils::ErrorReporter::HasPendingAtLeast(utils::ErrorSeverity::Error))
        {
            PLOG_WARNING << "Skipping post-sync command because errors were reported";
        }
        else
        {
            code = runPostSync();
        }
    }

    printPendingErrors();
    return code;
}

void Application::initializeConfig()
{
    settings_ = std::make_unique<config::SettingsStore>(options_.config_path);
}

bool Application::initializeLogging()
{
    utils::LogSettings logSettings = utils::LogManager::ReadSettings(*settings_);
    logSettings.console = options_.verbose;
    if (options_.verbose)
    {
        logSettings.level = plog::debug;
    }

    if (!utils::LogManager::Initialize(logSettings))
    {
        return false;
    }

    utils::ErrorReporter::InitializeLogFile(utils::LogManager::LogDirectory() + "/errors.log");
    PLOG_INFO << "cachesync " << CACHESYNC_VERSION_STRING << " starting";
    if (settings_->lastError()[0] != '\0')
    {
        PLOG_WARNING << "Settings loaded with errors: " << settings_->lastError();
    }
    return true;
}

std::shared_ptr<net::IFileFetcher> Application::createFetcher()
{
    net::SessionConfig session;
    session.connect_timeout_ms = static_cast<int>(settings_->getInt("net.connect_timeout_ms", 10000));
    session.timeout_ms = static_cast<int>(settings_->getInt("net.timeout_ms", 300000));
    return std::make_shared<net::CprFetcher>(session);
}

int Application::runBatch()
{
    mirror::ManifestParser parser;
    mirror::SyncManifest manifest;
    std::string error;
    if (!parser.parseFile(options_.manifest_path, manifest, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to load manifest", error);
        return kExitUsage;
    }

    std::string root = options_.root;
    if (root.empty())
    {
        root = settings_->getString("sync.cache_root", "");
    }
    else
    {
        // keep the key present even when overridden
        settings_->getString("sync.cache_root", "");
    }

    if (!root.empty())
    {
        for (auto& descriptor : manifest.files)
        {
            descriptor.setLocalRootOverride(root);
        }
    }

    const long long configuredWorkers =
        options_.workers ? *options_.workers : settings_->getInt("sync.worker_count", 0);
    const bool replaceBad = settings_->getBool("sync.replace_bad", true);

    mirror::SyncEngineOptions engineOptions;
    engineOptions.worker_count = platform::ResolveWorkerCount(configuredWorkers);
    engineOptions.mode = options_.mode.value_or(replaceBad ? mirror::SyncMode::Ensure : mirror::SyncMode::Audit);
    engineOptions.title = manifest.version.empty() ? "Synchronizing files" : "Synchronizing " + manifest.version;
    engineOptions.observer = [this](const std::string& title, const std::string& detail, double progress)
    { onProgress(title, detail, progress); };

    try
    {
        engine_ = std::make_unique<mirror::SyncEngine>(createFetcher(), std::move(engineOptions));
    }
    catch (const std::exception& e)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to create sync engine",
                                          e.what());
        return kExitUsage;
    }

    g_interrupted = 0;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::atomic<bool> batchDone{ false };
    std::thread interruptWatcher(
        [this, &batchDone]()
        {
            while (!batchDone.load(std::memory_order_acquire))
            {
                if (g_interrupted)
                {
                    PLOG_WARNING << "Interrupt received, stopping batch";
                    engine_->stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

    std::vector<mirror::SyncItemReport> reports;
    try
    {
        reports = engine_->runCollecting(manifest.files);
    }
    catch (const std::exception& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Scheduling, "Sync batch aborted", e.what());
    }

    batchDone.store(true, std::memory_order_release);
    interruptWatcher.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    const mirror::SyncSummary summary = mirror::SyncEngine::summarize(reports);
    {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::cout << "\n" << summary.total << " files: " << summary.good << " good, " << summary.bad << " bad, "
                  << summary.replacedGood << " replaced, " << summary.replacedBad << " replaced but still bad, "
                  << summary.failed << " failed\n";
    }
    PLOG_INFO << "Summary: total=" << summary.total << " good=" << summary.good << " bad=" << summary.bad
              << " replacedGood=" << summary.replacedGood << " replacedBad=" << summary.replacedBad
              << " failed=" << summary.failed;

    if (reports.size() != manifest.files.size() || !summary.clean())
        return kExitSyncFailed;
    return kExitOk;
}

void Application::onProgress(const std::string& title, const std::string& detail, double progress)
{
    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cout << "[" << title << "] " << std::fixed << std::setprecision(1) << std::setw(5) << progress * 100.0
              << "% " << detail << "\n";
}

void Application::printPendingErrors()
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    const std::size_t dropped = utils::ErrorReporter::DroppedCount();
    const auto reports = utils::ErrorReporter::GetPendingErrors();

    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cerr << "\nErrors:\n";
    for (const auto& report : reports)
    {
        std::cerr << "  " << utils::ErrorReporter::Format(report, options_.verbose) << "\n";
    }
    if (dropped > 0)
    {
        std::cerr << "  ... and " << dropped << " earlier reports, see " << utils::LogManager::LogFilePath() << "\n";
    }
}

int Application::runPostSync()
{
    const int code = utils::ProcessUtils::RunCommand(options_.post_sync);
    if (code != 0)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Process, "Post-sync command failed",
                                          options_.post_sync + " exited with " + std::to_string(code));
        return kExitSyncFailed;
    }
    return kExitOk;
}
