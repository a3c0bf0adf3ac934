#pragma once

#include "core/types/ChecksumResult.hpp"
#include "core/types/CompressionResult.hpp"
#include "core/types/ConcurrentOperationResult.hpp"
#include "core/types/CopyResult.hpp"
#include "core/types/DnsLookupResult.hpp"
#include "core/types/OperationStats.hpp"
#include "core/types/PingResult.hpp"
#include "core/types/PortScanResult.hpp"
#include "core/types/SystemStats.hpp"
#include "core/types/TransferResult.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

namespace migengine::app {

/**
 * @brief JSON encodings of engine results for the command envelope.
 *
 * Keys are snake_case. Durations are emitted as fractional milliseconds
 * under a *_ms key and time points as UTC ISO-8601 strings.
 */
nlohmann::json toJson(const core::ChecksumResult& result);
nlohmann::json toJson(const core::ChecksumBatch& batch);
nlohmann::json toJson(const core::CopyResult& result);
nlohmann::json toJson(const core::CompressionResult& result);
nlohmann::json toJson(const core::TransferResult& result);
nlohmann::json toJson(const core::PingResult& result);
nlohmann::json toJson(const core::PortScanResult& result);
nlohmann::json toJson(const core::DnsLookupResult& result);
nlohmann::json toJson(const core::CpuStats& stats);
nlohmann::json toJson(const core::MemoryStats& stats);
nlohmann::json toJson(const core::DiskStats& stats);
nlohmann::json toJson(const core::NetworkStats& stats);
nlohmann::json toJson(const core::ProcessStats& stats);
nlohmann::json toJson(const core::SystemStats& stats);
nlohmann::json toJson(const core::OperationStats& stats);
nlohmann::json toJson(const core::TransferStats& stats);
nlohmann::json toJson(const core::MetricsSnapshot& snapshot);
nlohmann::json toJson(const core::MetricsSummary& summary);

/**
 * @brief Formats a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Converts any duration to fractional milliseconds.
 */
template <typename Rep, typename Period>
double toMilliseconds(std::chrono::duration<Rep, Period> duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

/**
 * @brief Encodes a probe batch. Empty result slots become null.
 */
template <typename T>
nlohmann::json toJson(const core::ConcurrentOperationResult<T>& batch) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& item : batch.results) {
        results.push_back(item ? toJson(*item) : nlohmann::json(nullptr));
    }

    return {{"results", results},
            {"errors", batch.errors},
            {"duration_ms", batch.durationMs()},
            {"concurrency", batch.concurrency},
            {"success", batch.success}};
}

} // namespace migengine::app
