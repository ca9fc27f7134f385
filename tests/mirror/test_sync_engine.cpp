#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "mirror/SyncEngine.hpp"
#include "utils/SyncErrors.hpp"
#include "../utils/FixtureFetcher.hpp"
#include "../utils/TempDir.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

using Catch::Matchers::WithinAbs;
using mirror::ExpectedDigest;
using mirror::SyncDescriptor;
using mirror::SyncEngine;
using mirror::SyncEngineOptions;
using mirror::SyncMode;
using mirror::VerificationOutcome;
using test_utils::FixtureFetcher;
using test_utils::TempDir;

namespace {

const std::string kBodySha1 = "a9993e364706816aba3e25717850c26c9cd0d89d"; // "abc"

std::vector<SyncDescriptor> makeBatch(const TempDir& dir, FixtureFetcher& fetcher, int count)
{
    std::vector<SyncDescriptor> batch;
    for (int i = 0; i < count; ++i)
    {
        const std::string url = "https://mirror.test/f" + std::to_string(i);
        fetcher.setBody(url, "abc");
        batch.emplace_back(url, "f" + std::to_string(i) + ".txt",
                           ExpectedDigest{ digest::Algorithm::SHA1, kBodySha1 });
        batch.back().setLocalRootOverride(dir.path().string());
    }
    return batch;
}

}  // namespace

TEST_CASE("SyncEngine - Ensure mode fetches missing files", "[mirror][engine]")
{
    TempDir dir;
    auto fetcher = std::make_shared<FixtureFetcher>();
    auto batch = makeBatch(dir, *fetcher, 5);

    std::mutex observedMutex;
    double lastObserved = 0.0;

    SyncEngineOptions options;
    options.worker_count = 2;
    options.observer = [&](const std::string&, const std::string&, double progress)
    {
        std::lock_guard<std::mutex> lock(observedMutex);
        lastObserved = std::max(lastObserved, progress);
    };

    SyncEngine engine(fetcher, options);
    const auto summary = engine.run(batch);

    REQUIRE(summary.total == 5);
    REQUIRE(summary.replacedGood == 5);
    REQUIRE(summary.changed == 5);
    REQUIRE(summary.clean());
    REQUIRE(fetcher->fetchCount() == 5);
    REQUIRE_THAT(lastObserved, WithinAbs(1.0, 1e-9));

    SECTION("Running again fetches nothing")
    {
        const auto second = engine.run(batch);
        REQUIRE(second.good == 5);
        REQUIRE(second.changed == 0);
        REQUIRE(fetcher->fetchCount() == 5);
    }
}

TEST_CASE("SyncEngine - Audit mode never writes", "[mirror][engine]")
{
    TempDir dir;
    auto fetcher = std::make_shared<FixtureFetcher>();
    auto batch = makeBatch(dir, *fetcher, 3);
    dir.write("f0.txt", "abc");
    dir.write("f1.txt", "corrupt");

    SyncEngineOptions options;
    options.mode = SyncMode::Audit;
    SyncEngine engine(fetcher, options);
    const auto summary = engine.run(batch);

    REQUIRE(summary.good == 1);
    REQUIRE(summary.bad == 2);
    REQUIRE_FALSE(summary.clean());
    REQUIRE(fetcher->fetchCount() == 0);
    REQUIRE(TempDir::read(dir.file("f1.txt")) == "corrupt");
}

TEST_CASE("SyncEngine - Repair mode reports ReplacedBad", "[mirror][engine]")
{
    TempDir dir;
    auto fetcher = std::make_shared<FixtureFetcher>();
    auto batch = makeBatch(dir, *fetcher, 2);
    fetcher->setBody("https://mirror.test/f1", "stale remote");

    SyncEngineOptions options;
    options.mode = SyncMode::Repair;
    SyncEngine engine(fetcher, options);
    const auto summary = engine.run(batch);

    REQUIRE(summary.replacedGood == 1);
    REQUIRE(summary.replacedBad == 1);
    REQUIRE_FALSE(summary.clean());
}

TEST_CASE("SyncEngine - Failures", "[mirror][engine]")
{
    TempDir dir;
    auto fetcher = std::make_shared<FixtureFetcher>();
    auto batch = makeBatch(dir, *fetcher, 3);
    // Unknown URL answers like a 404
    batch.emplace_back("https://mirror.test/missing", "missing.txt");
    batch.back().setLocalRootOverride(dir.path().string());

    SyncEngine engine(fetcher, SyncEngineOptions{});

    SECTION("run rethrows the failure")
    {
        REQUIRE_THROWS_AS(engine.run(batch), utils::SyncFailure);
    }

    SECTION("runCollecting reports every item")
    {
        const auto reports = engine.runCollecting(batch);
        REQUIRE(reports.size() == 4);
        REQUIRE(reports[0].succeeded);
        REQUIRE_FALSE(reports[3].succeeded);
        REQUIRE(reports[3].error.find("missing") != std::string::npos);

        const auto summary = SyncEngine::summarize(reports);
        REQUIRE(summary.total == 4);
        REQUIRE(summary.failed == 1);
        REQUIRE(summary.replacedGood == 3);
    }
}

TEST_CASE("SyncEngine - Stop interrupts a running batch", "[mirror][engine]")
{
    TempDir dir;
    auto fetcher = std::make_shared<FixtureFetcher>();

    std::vector<SyncDescriptor> batch;
    for (int i = 0; i < 20; ++i)
    {
        const std::string url = "https://mirror.test/slow" + std::to_string(i);
        test_utils::FixtureResponse slow;
        slow.body = "abc";
        slow.delay = std::chrono::milliseconds(200);
        fetcher->setResponse(url, slow);
        batch.emplace_back(url, "slow" + std::to_string(i) + ".txt");
        batch.back().setLocalRootOverride(dir.path().string());
    }

    SyncEngineOptions options;
    options.worker_count = 2;
    SyncEngine engine(fetcher, options);

    auto pending = std::async(std::launch::async, [&]() { return engine.runCollecting(batch); });

    // Wait until the first transfers are in flight
    while (fetcher->fetchCount() == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine.stop();

    const auto reports = pending.get();
    const auto summary = SyncEngine::summarize(reports);
    REQUIRE(reports.size() == 20);
    REQUIRE(summary.failed > 0);
    REQUIRE(fetcher->fetchCount() < 20);
}

TEST_CASE("SyncEngine - Requires a fetcher", "[mirror][engine]")
{
    REQUIRE_THROWS_AS(SyncEngine(nullptr, SyncEngineOptions{}), std::invalid_argument);
}

TEST_CASE("SyncEngine - Default options use the pool's default size", "[mirror][engine]")
{
    REQUIRE(SyncEngineOptions{}.worker_count == tasks::kDefaultWorkerCount);
    REQUIRE(tasks::kDefaultWorkerCount == 3);
}
