#include "WorkerPool.hpp"

#include <plog/Log.h>

namespace tasks
{

WorkerPool::WorkerPool(std::size_t threadCount)
{
    if (threadCount == 0)
        threadCount = 1;

    workers_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i)
    {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }

    PLOG_DEBUG << "WorkerPool started with " << threadCount << " threads";
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
}

std::size_t WorkerPool::shutdownNow()
{
    std::queue<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
        cancelled_.store(true);
        std::swap(queue_, dropped);
    }
    condition_.notify_all();

    const std::size_t droppedCount = dropped.size();
    PLOG_INFO << "WorkerPool shutdown requested, discarded " << droppedCount << " queued jobs";
    return droppedCount;
}

bool WorkerPool::isShutdown() const
{
    std::lock_guard<std::mutex> lock(queueMutex_);
    return stopping_;
}

void WorkerPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });

            if (queue_.empty())
                return;

            job = std::move(queue_.front());
            queue_.pop();
        }

        job();
    }
}

} // namespace tasks
