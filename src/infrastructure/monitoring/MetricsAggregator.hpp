#pragma once

#include "core/types/OperationStats.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace migengine::infra {

/**
 * @brief Thread-safe accumulator for operation timings and transfer progress.
 *
 * All state is guarded by one reader/writer lock. Every getter returns a
 * copy, so callers never observe a partially updated record. Instances are
 * created by the application and passed to whoever records metrics.
 */
class MetricsAggregator {
public:
    MetricsAggregator();

    MetricsAggregator(const MetricsAggregator&) = delete;
    MetricsAggregator& operator=(const MetricsAggregator&) = delete;

    /**
     * @brief Records one execution of a named operation.
     * @param name Operation name.
     * @param duration Execution time.
     * @param success False increments the error count.
     */
    void recordOperation(const std::string& name, std::chrono::nanoseconds duration, bool success);

    /**
     * @brief Updates progress of the current transfer.
     *
     * The first update (or error) fixes the transfer start time. The rate is
     * averaged over the time since then. The ETA stays zero until a positive
     * rate is known and returns to zero once the transfer is complete.
     */
    void updateTransferStats(int64_t totalBytes, int64_t transferredBytes, int64_t filesProcessed,
                             int64_t filesTotal);

    void recordTransferError();

    /**
     * @brief Stores the latest system snapshot.
     */
    void updateSystemStats(const core::SystemStats& stats);

    core::MetricsSnapshot snapshot() const;
    std::optional<core::OperationStats> operationStats(const std::string& name) const;
    std::optional<core::TransferStats> transferStats() const;

    /**
     * @brief Returns transfer completion by bytes, 0 without a transfer.
     */
    double transferProgress() const;

    /**
     * @brief Clears all statistics and restarts the uptime clock.
     */
    void reset();

    core::MetricsSummary summary() const;

private:
    core::TransferStats& ensureTransfer();

    std::map<std::string, core::OperationStats> operations_;
    std::optional<core::TransferStats> transfer_;
    std::chrono::steady_clock::time_point transferStart_;
    std::optional<core::SystemStats> system_;
    std::chrono::system_clock::time_point startTime_;
    std::chrono::steady_clock::time_point startSteady_;
    std::chrono::system_clock::time_point lastUpdated_;
    mutable std::shared_mutex mutex_;
};

} // namespace migengine::infra
