#include "SyncEngine.hpp"
#include "../utils/SyncErrors.hpp"
#include "SyncTask.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <future>
#include <stdexcept>
#include <utility>

namespace mirror
{

SyncEngine::SyncEngine(std::shared_ptr<net::IFileFetcher> fetcher, SyncEngineOptions options)
    : fetcher_(std::move(fetcher))
    , options_(std::move(options))
{
    if (!fetcher_)
        throw std::invalid_argument("SyncEngine requires a fetcher");
}

SyncSummary SyncEngine::run(const std::vector<SyncDescriptor>& descriptors)
{
    auto manager = makeManager(descriptors);
    setActive(manager);

    SyncSummary summary;
    try
    {
        for (const auto& result : manager->startAndAwait())
        {
            summary.add(result);
        }
    }
    catch (...)
    {
        setActive(nullptr);
        throw;
    }

    setActive(nullptr);
    PLOG_INFO << "Batch '" << options_.title << "' finished: " << summary.total << " items, " << summary.changed
              << " fetched";
    return summary;
}

std::vector<SyncItemReport> SyncEngine::runCollecting(const std::vector<SyncDescriptor>& descriptors)
{
    auto manager = makeManager(descriptors);
    setActive(manager);

    std::vector<SyncItemReport> reports;
    reports.reserve(descriptors.size());

    auto handles = manager->start();
    for (std::size_t i = 0; i < handles.size(); ++i)
    {
        SyncItemReport report;
        report.remoteLocation = descriptors[i].remoteLocation();
        report.localPath = descriptors[i].absoluteLocalPath();

        try
        {
            report.result = handles[i].get();
            report.succeeded = true;
        }
        catch (const utils::SyncError& e)
        {
            report.error = e.what();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Transfer, "Failed to sync " + report.localPath,
                                              std::string(e.what()) + " | " + e.technicalInfo());
        }
        catch (const std::future_error& e)
        {
            report.error = "Task discarded before it ran";
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Scheduling,
                                                "Sync task for " + report.localPath + " was cancelled", e.what());
        }
        catch (const std::exception& e)
        {
            report.error = e.what();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "Failed to sync " + report.localPath,
                                              e.what());
        }

        reports.push_back(std::move(report));
    }

    setActive(nullptr);
    return reports;
}

void SyncEngine::stop()
{
    std::shared_ptr<Manager> manager;
    {
        std::lock_guard<std::mutex> lock(activeMutex_);
        manager = active_;
    }

    if (manager)
    {
        manager->stop();
    }
}

double SyncEngine::progress() const
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    return active_ ? active_->progress() : 0.0;
}

SyncSummary SyncEngine::summarize(const std::vector<SyncItemReport>& reports)
{
    SyncSummary summary;
    for (const auto& report : reports)
    {
        if (report.succeeded)
        {
            summary.add(report.result);
        }
        else
        {
            ++summary.total;
            ++summary.failed;
        }
    }
    return summary;
}

std::shared_ptr<SyncEngine::Manager> SyncEngine::makeManager(const std::vector<SyncDescriptor>& descriptors)
{
    std::vector<Manager::TaskPtr> taskList;
    taskList.reserve(descriptors.size());
    for (const auto& descriptor : descriptors)
    {
        SyncUnit unit(std::make_shared<SyncDescriptor>(descriptor), fetcher_);
        taskList.push_back(std::make_shared<SyncTask>(std::move(unit), options_.mode));
    }

    PLOG_INFO << "Starting batch '" << options_.title << "' (" << syncModeName(options_.mode) << ") with "
              << taskList.size() << " items";
    return std::make_shared<Manager>(std::move(taskList), options_.title, options_.observer, options_.worker_count);
}

void SyncEngine::setActive(std::shared_ptr<Manager> manager)
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    active_ = std::move(manager);
}

} // namespace mirror
