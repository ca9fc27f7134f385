#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace tasks
{

// Pool size used when a caller passes 0 or cannot determine one
inline constexpr std::size_t kDefaultWorkerCount = 3;

// Fixed-size pool of worker threads fed from one FIFO queue. Sized once, never resized.
class WorkerPool
{
public:
    explicit WorkerPool(std::size_t threadCount);

    // Runs whatever is still queued, then joins every worker.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Drops queued work (its futures complete with broken_promise), raises the cancel flag for
    // in-flight work and returns immediately. Returns the number of dropped jobs.
    std::size_t shutdownNow();

    bool isShutdown() const;

    // Raised by shutdownNow(); long-running jobs poll it to abort early.
    std::atomic<bool>& cancelFlag() { return cancelled_; }

    std::size_t threadCount() const { return workers_.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
    std::atomic<bool> cancelled_{ false };
};

template <typename F>
auto WorkerPool::submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>>;

    auto job = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(fn));
    std::future<ReturnType> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_)
            throw std::runtime_error("submit on stopped WorkerPool");

        queue_.emplace([job]() { (*job)(); });
    }
    condition_.notify_one();
    return result;
}

} // namespace tasks
