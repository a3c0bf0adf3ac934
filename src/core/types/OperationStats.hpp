/**
 * @file OperationStats.hpp
 * @brief Accumulated operation timings, transfer progress and metric summaries.
 */

#pragma once

#include "core/types/SystemStats.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace migengine::core {

/**
 * @brief Running statistics for one named operation.
 */
struct OperationStats {
    std::string name;                             ///< Operation name
    int64_t count{0};                             ///< Number of recorded executions
    std::chrono::nanoseconds totalDuration{0};    ///< Sum of all durations
    std::chrono::nanoseconds averageDuration{0};  ///< totalDuration / count
    std::chrono::nanoseconds minDuration{0};      ///< Shortest recorded duration
    std::chrono::nanoseconds maxDuration{0};      ///< Longest recorded duration
    int64_t errorCount{0};                        ///< Executions recorded as failed
    std::chrono::system_clock::time_point lastExecution; ///< Time of the latest record

    bool operator==(const OperationStats& other) const = default;
};

/**
 * @brief Progress of the current transfer.
 */
struct TransferStats {
    int64_t totalBytes{0};              ///< Bytes expected in total
    int64_t transferredBytes{0};        ///< Bytes transferred so far
    double transferRateMBps{0.0};       ///< Average rate since startTime
    std::chrono::nanoseconds duration{0}; ///< Elapsed time since startTime
    int64_t filesProcessed{0};          ///< Files completed so far
    int64_t filesTotal{0};              ///< Files expected in total
    int64_t errorCount{0};              ///< Recorded transfer errors
    std::chrono::system_clock::time_point startTime; ///< First update or error
    std::chrono::seconds estimatedEta{0}; ///< Remaining time, zero until a rate is known

    /**
     * @brief Completion percentage by bytes.
     * @return transferred / total * 100, or 0 when total is unknown.
     */
    [[nodiscard]] double progressPercent() const {
        return totalBytes > 0
                   ? static_cast<double>(transferredBytes) / static_cast<double>(totalBytes) * 100.0
                   : 0.0;
    }
};

/**
 * @brief Deep copy of everything the metrics aggregator holds.
 */
struct MetricsSnapshot {
    std::map<std::string, OperationStats> operations; ///< Stats keyed by operation name
    std::optional<TransferStats> transfer;            ///< Present once a transfer was reported
    std::optional<SystemStats> system;                ///< Latest recorded system snapshot
    std::chrono::system_clock::time_point startTime;  ///< Creation or last reset
    std::chrono::system_clock::time_point lastUpdated; ///< Latest mutation
};

/**
 * @brief Aggregate view for reporting.
 */
struct MetricsSummary {
    std::chrono::milliseconds uptime{0};              ///< Time since start or reset
    std::chrono::system_clock::time_point lastUpdated; ///< Latest mutation
    int64_t distinctOperations{0};                    ///< Number of operation names seen
    int64_t totalOperationCount{0};                   ///< Sum of counts
    int64_t totalErrorCount{0};                       ///< Sum of error counts
    double errorRatePercent{0.0};                     ///< errors / operations * 100

    bool transferActive{false};            ///< Whether transfer fields below are meaningful
    double transferProgressPercent{0.0};
    double transferRateMBps{0.0};
    int64_t filesProcessed{0};
    int64_t filesTotal{0};
    std::chrono::seconds estimatedEta{0};
};

} // namespace migengine::core
