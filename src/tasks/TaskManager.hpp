#pragma once

#include "AtomicDouble.hpp"
#include "Task.hpp"
#include "WorkerPool.hpp"

#include <plog/Log.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tasks
{

using ProgressObserver = std::function<void(const std::string& title, const std::string& detail, double progress)>;

/**
 * @brief Fans a fixed task list out over a worker pool and aggregates their progress
 *
 * Every task contributes at most 1/N of the total, so the emitted progress reaches 1.0 only
 * once every task has reported 1.0. The observer is called from worker threads.
 *
 * Usage:
 *   TaskManager<Result> manager(std::move(taskList), "Syncing", observer, 4);
 *   auto results = manager.startAndAwait();
 */
template <typename V>
class TaskManager
{
public:
    using TaskPtr = std::shared_ptr<Task<V>>;

    TaskManager(std::vector<TaskPtr> taskList, std::string title, ProgressObserver observer = nullptr,
                std::size_t workerCount = kDefaultWorkerCount)
        : tasks_(validated(std::move(taskList)))
        , title_(std::move(title))
        , observer_(std::move(observer))
        , pool_(workerCount == 0 ? kDefaultWorkerCount : workerCount)
    {
    }

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Attaches and submits every task. Handles come back in task-list order.
    std::vector<std::future<V>> start()
    {
        bool expected = false;
        if (!started_.compare_exchange_strong(expected, true))
        {
            throw std::logic_error("TaskManager '" + title_ + "' has already been started");
        }

        for (const auto& task : tasks_)
        {
            task->attach(this);
        }

        std::vector<std::future<V>> handles;
        handles.reserve(tasks_.size());
        for (const auto& task : tasks_)
        {
            handles.push_back(pool_.submit([task]() { return task->execute(); }));
        }

        PLOG_DEBUG << "TaskManager '" << title_ << "' submitted " << tasks_.size() << " tasks to "
                   << pool_.threadCount() << " workers";
        return handles;
    }

    // Awaits handles in list order; the first failure is rethrown when its handle is reached.
    std::vector<V> startAndAwait()
    {
        auto handles = start();

        std::vector<V> results;
        results.reserve(handles.size());
        for (auto& handle : handles)
        {
            results.push_back(handle.get());
        }
        return results;
    }

    // Discards queued tasks and interrupts in-flight transfers without waiting for them.
    void stop()
    {
        const std::size_t dropped = pool_.shutdownNow();
        PLOG_WARNING << "TaskManager '" << title_ << "' stopped, " << dropped
                     << " queued tasks discarded; local state must be re-verified";
    }

    double progress() const { return totalProgress_.get(); }

    const std::string& title() const { return title_; }

    std::size_t taskCount() const { return tasks_.size(); }

    std::size_t workerCount() const { return pool_.threadCount(); }

    bool isStopped() const { return pool_.isShutdown(); }

private:
    friend class Task<V>;

    static std::vector<TaskPtr> validated(std::vector<TaskPtr> taskList)
    {
        for (const auto& task : taskList)
        {
            if (!task)
                throw std::invalid_argument("TaskManager task list contains a null task");
        }
        return taskList;
    }

    void receiveProgress(const std::string& detail, double delta)
    {
        const double contribution = delta / static_cast<double>(tasks_.size());
        const double total = totalProgress_.addAndGet(contribution);

        if (!observer_)
            return;

        try
        {
            observer_(title_, detail, total);
        }
        catch (const std::exception& e)
        {
            PLOG_WARNING << "Progress observer for '" << title_ << "' threw: " << e.what();
        }
    }

    std::atomic<bool>& cancellationFlag() { return pool_.cancelFlag(); }

    const std::vector<TaskPtr> tasks_;
    const std::string title_;
    const ProgressObserver observer_;
    AtomicDouble totalProgress_;
    std::atomic<bool> started_{ false };

    // Declared last so workers are joined before the members they touch go away.
    WorkerPool pool_;
};

} // namespace tasks
