#pragma once

#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>

namespace tasks
{

template <typename V>
class TaskManager;

enum class TaskState
{
    Unattached, // No parent yet, progress cannot be forwarded
    Attached, // Parent set, waiting for a worker
    Running, // Executing on a worker
    Done // Finished with a result or a failure
};

inline const char* taskStateName(TaskState state)
{
    switch (state)
    {
    case TaskState::Unattached:
        return "unattached";
    case TaskState::Attached:
        return "attached";
    case TaskState::Running:
        return "running";
    case TaskState::Done:
        return "done";
    }
    return "unknown";
}

/**
 * @brief Unit of work run by a TaskManager that reports progress as it goes
 *
 * Subclasses implement run() and call submitProgress() with absolute values in [0, 1].
 * Each call is turned into the non-negative increase since the highest value seen so far,
 * so repeated or regressing reports never add to the parent's total twice.
 */
template <typename V>
class Task
{
public:
    virtual ~Task() = default;

    TaskState state() const { return state_.load(); }

    // Highest absolute progress reported so far
    double lastProgress() const { return lastProgress_; }

protected:
    virtual V run() = 0;

    /**
     * @brief Forward progress to the parent manager
     * @param label Detail text shown next to the aggregated total
     * @param progress Absolute progress of this task in [0, 1]
     * @return false when no parent is attached; nothing is forwarded in that case
     */
    bool submitProgress(const std::string& label, double progress)
    {
        if (state_.load() == TaskState::Unattached || parent_ == nullptr)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Scheduling,
                                                "Task progress submitted without an attached task manager", label);
            return false;
        }

        progress = std::clamp(progress, 0.0, 1.0);
        const double delta = std::max(0.0, progress - lastProgress_);
        lastProgress_ = std::max(lastProgress_, progress);
        parent_->receiveProgress(label, delta);
        return true;
    }

    // Shared cancel flag of the parent's pool, null while unattached
    std::atomic<bool>* cancellationFlag() const { return parent_ ? &parent_->cancellationFlag() : nullptr; }

private:
    friend class TaskManager<V>;

    void attach(TaskManager<V>* parent)
    {
        if (parent_ == parent)
            return;
        if (parent_ != nullptr)
            throw std::logic_error("Task is already attached to another task manager");

        parent_ = parent;
        state_.store(TaskState::Attached);
    }

    V execute()
    {
        TaskState expected = TaskState::Attached;
        if (!state_.compare_exchange_strong(expected, TaskState::Running))
        {
            throw std::logic_error(std::string("Task cannot start from state ") + taskStateName(expected));
        }

        try
        {
            V result = run();
            state_.store(TaskState::Done);
            return result;
        }
        catch (...)
        {
            state_.store(TaskState::Done);
            throw;
        }
    }

    std::atomic<TaskState> state_{ TaskState::Unattached };
    TaskManager<V>* parent_ = nullptr;
    double lastProgress_ = 0.0;
};

} // namespace tasks

// Task's progress forwarding needs the complete TaskManager
#include "TaskManager.hpp"
