#include <catch2/catch_test_macros.hpp>
#include "tasks/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using tasks::WorkerPool;

TEST_CASE("WorkerPool - Runs submitted jobs", "[tasks][pool]")
{
    WorkerPool pool(3);
    REQUIRE(pool.threadCount() == 3);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i)
    {
        results.push_back(pool.submit([i]() { return i * i; }));
    }

    for (int i = 0; i < 10; ++i)
    {
        REQUIRE(results[i].get() == i * i);
    }
}

TEST_CASE("WorkerPool - Never exceeds its thread count", "[tasks][pool]")
{
    WorkerPool pool(2);
    std::atomic<int> running{ 0 };
    std::atomic<int> peak{ 0 };

    std::vector<std::future<void>> results;
    for (int i = 0; i < 8; ++i)
    {
        results.push_back(pool.submit(
            [&]()
            {
                const int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now))
                {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                --running;
            }));
    }
    for (auto& result : results)
    {
        result.get();
    }

    REQUIRE(peak.load() <= 2);
}

TEST_CASE("WorkerPool - shutdownNow", "[tasks][pool]")
{
    WorkerPool pool(1);
    std::atomic<bool> release{ false };

    auto first = pool.submit(
        [&]()
        {
            while (!release)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return 1;
        });
    auto second = pool.submit([]() { return 2; });
    auto third = pool.submit([]() { return 3; });

    // Give the worker time to pick up the first job
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const std::size_t dropped = pool.shutdownNow();
    release = true;

    REQUIRE(dropped == 2);
    REQUIRE(pool.isShutdown());
    REQUIRE(pool.cancelFlag().load());
    REQUIRE(first.get() == 1);
    REQUIRE_THROWS_AS(second.get(), std::future_error);
    REQUIRE_THROWS_AS(third.get(), std::future_error);
    REQUIRE_THROWS_AS(pool.submit([]() { return 0; }), std::runtime_error);
}

TEST_CASE("WorkerPool - Destructor drains queued work", "[tasks][pool]")
{
    std::atomic<int> completed{ 0 };
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i)
        {
            pool.submit([&]() { ++completed; });
        }
    }
    REQUIRE(completed.load() == 5);
}
