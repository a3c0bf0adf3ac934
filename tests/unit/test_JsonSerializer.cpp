#include <catch2/catch_test_macros.hpp>

#include "app/JsonSerializer.hpp"

using namespace migengine::core;
using namespace migengine::app;
using namespace std::chrono_literals;

TEST_CASE("Timestamps are ISO-8601 UTC with milliseconds", "[JsonSerializer]") {
    std::chrono::system_clock::time_point epoch{};
    REQUIRE(formatTimestamp(epoch) == "1970-01-01T00:00:00.000Z");
    REQUIRE(formatTimestamp(epoch + 86400s + 1500ms) == "1970-01-02T00:00:01.500Z");
}

TEST_CASE("File operation results", "[JsonSerializer]") {
    SECTION("Checksum error only when present") {
        ChecksumResult ok;
        ok.file = "a.txt";
        ok.size = 3;
        REQUIRE_FALSE(toJson(ok).contains("error"));

        ChecksumResult failed;
        failed.file = "b.txt";
        failed.error = "no such file";
        auto j = toJson(failed);
        REQUIRE(j["error"] == "no such file");
        REQUIRE(j["md5"] == "");
    }

    SECTION("Copy result") {
        CopyResult result;
        result.bytesCopied = 2048;
        result.duration = 1500us;
        result.success = true;

        auto j = toJson(result);
        REQUIRE(j["bytes_copied"] == 2048);
        REQUIRE(j["duration_ms"] == 1.5);
        REQUIRE(j["success"] == true);
        REQUIRE_FALSE(j.contains("checksum"));
    }

    SECTION("Compression result uses method names") {
        CompressionResult result;
        result.method = CompressionMethod::TarZstd;
        result.fileCount = 3;

        auto j = toJson(result);
        REQUIRE(j["method"] == "tar.zst");
        REQUIRE(j["file_count"] == 3);
    }
}

TEST_CASE("Concurrent results", "[JsonSerializer]") {
    ConcurrentOperationResult<PingResult> batch;
    batch.results.resize(2);
    batch.errors = {"", "dial tcp 10.0.0.1:80: i/o timeout"};
    batch.concurrency = 5;
    batch.success = true;

    PingResult ping;
    ping.host = "127.0.0.1:22";
    ping.port = 22;
    ping.connected = true;
    ping.responseTime = 250us;
    batch.results[0] = ping;

    auto j = toJson(batch);
    REQUIRE(j["results"].size() == 2);
    REQUIRE(j["results"][0]["connected"] == true);
    REQUIRE(j["results"][0]["response_time_ms"] == 0.25);
    REQUIRE(j["results"][1].is_null());
    REQUIRE(j["errors"][1] == "dial tcp 10.0.0.1:80: i/o timeout");
    REQUIRE(j["concurrency"] == 5);
    REQUIRE(j["success"] == true);
}

TEST_CASE("System stats", "[JsonSerializer]") {
    SystemStats stats;
    stats.cpu.usagePercent = {10.0, 30.0};
    stats.cpu.count = 2;
    DiskStats disk;
    disk.mountpoint = "/";
    stats.disks.push_back(disk);
    stats.process.threadCount = 4;

    auto j = toJson(stats);
    REQUIRE(j["cpu"]["average_percent"] == 20.0);
    REQUIRE(j["disks"].size() == 1);
    REQUIRE(j["disks"][0]["mountpoint"] == "/");
    REQUIRE(j["runtime"]["thread_count"] == 4);
    REQUIRE(j.contains("timestamp"));
}

TEST_CASE("Metrics summary", "[JsonSerializer]") {
    MetricsSummary summary;
    summary.distinctOperations = 2;
    summary.totalOperationCount = 5;
    summary.totalErrorCount = 1;
    summary.errorRatePercent = 20.0;

    auto j = toJson(summary);
    REQUIRE(j["total_operations"] == 2);
    REQUIRE(j["total_operation_count"] == 5);
    REQUIRE(j["error_rate"] == 20.0);
    REQUIRE_FALSE(j.contains("transfer_progress"));

    summary.transferActive = true;
    summary.transferProgressPercent = 50.0;
    REQUIRE(toJson(summary)["transfer_progress"] == 50.0);
}
