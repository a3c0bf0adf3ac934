#include "app/JsonSerializer.hpp"

#include <ctime>
#include <cstdio>

namespace migengine::app {

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) %
                  1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis.count()));
    return result;
}

nlohmann::json toJson(const core::ChecksumResult& result) {
    nlohmann::json j = {{"file", result.file},
                        {"md5", result.md5},
                        {"sha1", result.sha1},
                        {"sha256", result.sha256},
                        {"size", result.size}};
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    return j;
}

nlohmann::json toJson(const core::ChecksumBatch& batch) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : batch.results) {
        results.push_back(toJson(result));
    }
    return {{"results", results}, {"success", batch.success}};
}

nlohmann::json toJson(const core::CopyResult& result) {
    nlohmann::json j = {{"bytes_copied", result.bytesCopied},
                        {"duration_ms", result.durationMs()},
                        {"transfer_rate_mbps", result.transferRateMBps},
                        {"success", result.success}};
    if (!result.checksum.empty()) {
        j["checksum"] = result.checksum;
    }
    return j;
}

nlohmann::json toJson(const core::CompressionResult& result) {
    return {{"original_size", result.originalSize},
            {"compressed_size", result.compressedSize},
            {"compression_ratio", result.compressionRatio},
            {"duration_ms", result.durationMs()},
            {"method", result.methodName()},
            {"file_count", result.fileCount},
            {"success", result.success}};
}

nlohmann::json toJson(const core::TransferResult& result) {
    nlohmann::json j = {{"bytes_transferred", result.bytesTransferred},
                        {"duration_ms", result.durationMs()},
                        {"transfer_rate_mbps", result.transferRateMBps},
                        {"method", result.method},
                        {"success", result.success}};
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    return j;
}

nlohmann::json toJson(const core::PingResult& result) {
    nlohmann::json j = {{"host", result.host},
                        {"port", result.port},
                        {"connected", result.connected},
                        {"response_time_ms", result.responseTimeMs()}};
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    return j;
}

nlohmann::json toJson(const core::PortScanResult& result) {
    return {{"host", result.host},
            {"port", result.port},
            {"open", result.open},
            {"response_time_ms", toMilliseconds(result.responseTime)},
            {"service", result.service}};
}

nlohmann::json toJson(const core::DnsLookupResult& result) {
    nlohmann::json j = {{"domain", result.domain},
                        {"ips", result.ips},
                        {"mx", result.mx},
                        {"txt", result.txt}};
    if (!result.cname.empty()) {
        j["cname"] = result.cname;
    }
    return j;
}

nlohmann::json toJson(const core::CpuStats& stats) {
    return {{"usage_percent", stats.usagePercent},
            {"average_percent", stats.averagePercent()},
            {"count", stats.count},
            {"model_name", stats.modelName}};
}

nlohmann::json toJson(const core::MemoryStats& stats) {
    return {{"total", stats.total},
            {"available", stats.available},
            {"used", stats.used},
            {"used_percent", stats.usedPercent},
            {"free", stats.free}};
}

nlohmann::json toJson(const core::DiskStats& stats) {
    return {{"device", stats.device},
            {"mountpoint", stats.mountpoint},
            {"fstype", stats.fstype},
            {"total", stats.total},
            {"free", stats.free},
            {"used", stats.used},
            {"used_percent", stats.usedPercent}};
}

nlohmann::json toJson(const core::NetworkStats& stats) {
    return {{"bytes_sent", stats.bytesSent},
            {"bytes_recv", stats.bytesRecv},
            {"packets_sent", stats.packetsSent},
            {"packets_recv", stats.packetsRecv}};
}

nlohmann::json toJson(const core::ProcessStats& stats) {
    return {{"thread_count", stats.threadCount},
            {"hardware_threads", stats.hardwareThreads},
            {"resident_bytes", stats.residentBytes},
            {"virtual_bytes", stats.virtualBytes},
            {"heap_allocated_bytes", stats.heapAllocatedBytes},
            {"heap_total_bytes", stats.heapTotalBytes}};
}

nlohmann::json toJson(const core::SystemStats& stats) {
    nlohmann::json disks = nlohmann::json::array();
    for (const auto& disk : stats.disks) {
        disks.push_back(toJson(disk));
    }

    return {{"timestamp", formatTimestamp(stats.timestamp)},
            {"cpu", toJson(stats.cpu)},
            {"memory", toJson(stats.memory)},
            {"disks", disks},
            {"network", toJson(stats.network)},
            {"runtime", toJson(stats.process)}};
}

nlohmann::json toJson(const core::OperationStats& stats) {
    return {{"name", stats.name},
            {"count", stats.count},
            {"total_duration_ms", toMilliseconds(stats.totalDuration)},
            {"average_duration_ms", toMilliseconds(stats.averageDuration)},
            {"min_duration_ms", toMilliseconds(stats.minDuration)},
            {"max_duration_ms", toMilliseconds(stats.maxDuration)},
            {"error_count", stats.errorCount},
            {"last_execution", formatTimestamp(stats.lastExecution)}};
}

nlohmann::json toJson(const core::TransferStats& stats) {
    return {{"total_bytes", stats.totalBytes},
            {"transferred_bytes", stats.transferredBytes},
            {"transfer_rate_mbps", stats.transferRateMBps},
            {"duration_ms", toMilliseconds(stats.duration)},
            {"files_processed", stats.filesProcessed},
            {"files_total", stats.filesTotal},
            {"error_count", stats.errorCount},
            {"start_time", formatTimestamp(stats.startTime)},
            {"estimated_eta_ms", toMilliseconds(stats.estimatedEta)},
            {"progress_percent", stats.progressPercent()}};
}

nlohmann::json toJson(const core::MetricsSnapshot& snapshot) {
    nlohmann::json operations = nlohmann::json::object();
    for (const auto& [name, stats] : snapshot.operations) {
        operations[name] = toJson(stats);
    }

    nlohmann::json j = {{"operations", operations},
                        {"start_time", formatTimestamp(snapshot.startTime)},
                        {"last_updated", formatTimestamp(snapshot.lastUpdated)}};
    if (snapshot.transfer) {
        j["transfer"] = toJson(*snapshot.transfer);
    }
    if (snapshot.system) {
        j["system"] = toJson(*snapshot.system);
    }
    return j;
}

nlohmann::json toJson(const core::MetricsSummary& summary) {
    nlohmann::json j = {{"uptime_ms", toMilliseconds(summary.uptime)},
                        {"last_updated", formatTimestamp(summary.lastUpdated)},
                        {"total_operations", summary.distinctOperations},
                        {"total_operation_count", summary.totalOperationCount},
                        {"total_error_count", summary.totalErrorCount},
                        {"error_rate", summary.errorRatePercent}};
    if (summary.transferActive) {
        j["transfer_progress"] = summary.transferProgressPercent;
        j["transfer_rate"] = summary.transferRateMBps;
        j["files_processed"] = summary.filesProcessed;
        j["files_total"] = summary.filesTotal;
        j["estimated_eta_ms"] = toMilliseconds(summary.estimatedEta);
    }
    return j;
}

} // namespace migengine::app
