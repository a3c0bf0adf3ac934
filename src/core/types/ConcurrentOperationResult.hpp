/**
 * @file ConcurrentOperationResult.hpp
 * @brief Aggregate result of a bounded-concurrency batch of network probes.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Per-target results of a concurrent probe batch.
 *
 * results and errors are index-aligned with the input targets. A target
 * that failed has a non-empty entry in errors; its slot in results may be
 * empty (DNS) or hold a self-describing failure record (ping).
 *
 * success is true when at least one target succeeded, answering "was
 * anything reachable" rather than "did everything succeed".
 *
 * @tparam T Per-target result type.
 */
template <typename T>
struct ConcurrentOperationResult {
    std::vector<std::optional<T>> results; ///< Per-target results in input order
    std::vector<std::string> errors;       ///< Per-target error text, empty on success
    std::chrono::microseconds duration{0}; ///< Wall-clock duration of the batch
    int concurrency{0};                    ///< Concurrency limit that was applied
    bool success{false};                   ///< At least one target succeeded

    /**
     * @brief Converts the duration to milliseconds.
     */
    [[nodiscard]] double durationMs() const {
        return static_cast<double>(duration.count()) / 1000.0;
    }

    /**
     * @brief Counts targets that have no error.
     * @return Number of successful targets.
     */
    [[nodiscard]] size_t successCount() const {
        return static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
                                                 [](const std::string& e) { return e.empty(); }));
    }
};

} // namespace migengine::core
