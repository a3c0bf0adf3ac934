#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "infrastructure/monitoring/MetricsAggregator.hpp"

#include <thread>
#include <vector>

using namespace migengine::core;
using namespace migengine::infra;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("MetricsAggregator operation stats", "[MetricsAggregator]") {
    MetricsAggregator metrics;

    SECTION("Two executions of 100 ms and 300 ms, the second failing") {
        metrics.recordOperation("copy", 100ms, true);
        metrics.recordOperation("copy", 300ms, false);

        auto stats = metrics.operationStats("copy");
        REQUIRE(stats.has_value());
        REQUIRE(stats->name == "copy");
        REQUIRE(stats->count == 2);
        REQUIRE(stats->totalDuration == 400ms);
        REQUIRE(stats->averageDuration == 200ms);
        REQUIRE(stats->minDuration == 100ms);
        REQUIRE(stats->maxDuration == 300ms);
        REQUIRE(stats->errorCount == 1);
    }

    SECTION("Failures are counted") {
        metrics.recordOperation("ping", 5ms, true);
        metrics.recordOperation("ping", 7ms, false);

        REQUIRE(metrics.operationStats("ping")->errorCount == 1);

        auto summary = metrics.summary();
        REQUIRE(summary.distinctOperations == 1);
        REQUIRE(summary.totalOperationCount == 2);
        REQUIRE(summary.totalErrorCount == 1);
        REQUIRE_THAT(summary.errorRatePercent, WithinAbs(50.0, 1e-9));
    }

    SECTION("Unknown operation") {
        REQUIRE_FALSE(metrics.operationStats("nothing").has_value());
    }

    SECTION("Concurrent recording loses nothing") {
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&metrics]() {
                for (int i = 0; i < 250; ++i) {
                    metrics.recordOperation("hash", 1ms, true);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(metrics.operationStats("hash")->count == 2000);
    }
}

TEST_CASE("MetricsAggregator transfer stats", "[MetricsAggregator]") {
    MetricsAggregator metrics;

    SECTION("No transfer reported") {
        REQUIRE_FALSE(metrics.transferStats().has_value());
        REQUIRE(metrics.transferProgress() == 0.0);
        REQUIRE_FALSE(metrics.summary().transferActive);
    }

    SECTION("Progress and ETA") {
        metrics.updateTransferStats(1000, 0, 0, 4);
        std::this_thread::sleep_for(20ms);
        metrics.updateTransferStats(1000, 250, 1, 4);

        auto transfer = metrics.transferStats();
        REQUIRE(transfer.has_value());
        REQUIRE_THAT(metrics.transferProgress(), WithinAbs(25.0, 1e-9));
        REQUIRE(transfer->filesProcessed == 1);
        REQUIRE(transfer->filesTotal == 4);
        REQUIRE(transfer->transferRateMBps > 0.0);

        metrics.updateTransferStats(1000, 1000, 4, 4);
        REQUIRE(metrics.transferStats()->estimatedEta == 0s);
        REQUIRE_THAT(metrics.summary().transferProgressPercent, WithinAbs(100.0, 1e-9));
    }

    SECTION("Errors start a transfer record") {
        metrics.recordTransferError();
        metrics.recordTransferError();
        REQUIRE(metrics.transferStats()->errorCount == 2);
    }
}

TEST_CASE("MetricsAggregator snapshot and reset", "[MetricsAggregator]") {
    MetricsAggregator metrics;
    metrics.recordOperation("copy", 10ms, true);
    metrics.updateTransferStats(10, 5, 1, 2);

    SystemStats system;
    system.memory.total = 1024;
    metrics.updateSystemStats(system);

    auto snapshot = metrics.snapshot();
    REQUIRE(snapshot.operations.size() == 1);
    REQUIRE(snapshot.transfer.has_value());
    REQUIRE(snapshot.system.has_value());
    REQUIRE(snapshot.system->memory.total == 1024);
    REQUIRE(snapshot.lastUpdated >= snapshot.startTime);

    metrics.reset();
    auto cleared = metrics.snapshot();
    REQUIRE(cleared.operations.empty());
    REQUIRE_FALSE(cleared.transfer.has_value());
    REQUIRE_FALSE(cleared.system.has_value());
    REQUIRE(metrics.summary().totalOperationCount == 0);
}
