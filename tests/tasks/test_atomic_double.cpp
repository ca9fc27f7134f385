#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "tasks/AtomicDouble.hpp"

#include <thread>
#include <vector>

using Catch::Matchers::WithinAbs;
using tasks::AtomicDouble;

TEST_CASE("AtomicDouble - Basic operations", "[tasks][atomic]")
{
    AtomicDouble value(0.25);
    REQUIRE_THAT(value.get(), WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(value.addAndGet(0.5), WithinAbs(0.75, 1e-12));

    value.set(2.0);
    REQUIRE_THAT(value.get(), WithinAbs(2.0, 1e-12));
}

TEST_CASE("AtomicDouble - Concurrent adds lose nothing", "[tasks][atomic]")
{
    AtomicDouble value;
    constexpr int kThreads = 8;
    constexpr int kAddsPerThread = 10000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&value]()
            {
                for (int i = 0; i < kAddsPerThread; ++i)
                {
                    value.addAndGet(1.0);
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE_THAT(value.get(), WithinAbs(static_cast<double>(kThreads * kAddsPerThread), 1e-9));
}
