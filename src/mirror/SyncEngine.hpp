#pragma once

#include "SyncDescriptor.hpp"
#include "SyncTypes.hpp"
#include "../net/FileFetcher.hpp"
#include "../tasks/TaskManager.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mirror
{

struct SyncEngineOptions
{
    std::size_t worker_count = tasks::kDefaultWorkerCount;
    SyncMode mode = SyncMode::Ensure;
    std::string title = "Synchronizing files";
    tasks::ProgressObserver observer;
};

// Wraps descriptors as SyncTasks and runs one batch at a time through a TaskManager
class SyncEngine
{
public:
    SyncEngine(std::shared_ptr<net::IFileFetcher> fetcher, SyncEngineOptions options);
    ~SyncEngine() = default;

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // All-or-error: the first failing item rethrows once its handle is awaited
    SyncSummary run(const std::vector<SyncDescriptor>& descriptors);

    // Awaits every item and records per-item errors instead of rethrowing
    std::vector<SyncItemReport> runCollecting(const std::vector<SyncDescriptor>& descriptors);

    // Stops the batch in progress, if any
    void stop();

    // Aggregated progress of the batch in progress, 0 when idle
    double progress() const;

    const SyncEngineOptions& options() const { return options_; }

    static SyncSummary summarize(const std::vector<SyncItemReport>& reports);

private:
    using Manager = tasks::TaskManager<SyncResult>;

    std::shared_ptr<Manager> makeManager(const std::vector<SyncDescriptor>& descriptors);
    void setActive(std::shared_ptr<Manager> manager);

    std::shared_ptr<net::IFileFetcher> fetcher_;
    SyncEngineOptions options_;

    mutable std::mutex activeMutex_;
    std::shared_ptr<Manager> active_;
};

} // namespace mirror
