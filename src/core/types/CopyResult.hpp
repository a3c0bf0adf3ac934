/**
 * @file CopyResult.hpp
 * @brief Result of a file or directory copy.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace migengine::core {

/**
 * @brief Outcome of a single-file or directory copy.
 *
 * For a single file, checksum holds the SHA-256 of the bytes written. A
 * directory copy sums bytes over the whole tree and leaves checksum empty.
 */
struct CopyResult {
    int64_t bytesCopied{0};                   ///< Total bytes written
    std::chrono::microseconds duration{0};    ///< Wall-clock duration of the copy
    std::string checksum;                     ///< Lowercase hex SHA-256 of the copied stream
    double transferRateMBps{0.0};             ///< Throughput in MiB per second
    bool success{false};                      ///< Whether the copy completed

    /**
     * @brief Converts the duration to milliseconds.
     * @return Duration as a floating-point number of milliseconds.
     */
    [[nodiscard]] double durationMs() const {
        return static_cast<double>(duration.count()) / 1000.0;
    }

    bool operator==(const CopyResult& other) const = default;
};

/**
 * @brief Computes throughput in MiB/s, guarding against a zero duration.
 * @param bytes Number of bytes moved.
 * @param duration Time taken.
 * @return Rate in MiB per second, or 0 when duration is zero.
 */
[[nodiscard]] inline double transferRateMBps(int64_t bytes, std::chrono::microseconds duration) {
    if (duration.count() <= 0) {
        return 0.0;
    }
    double seconds = static_cast<double>(duration.count()) / 1'000'000.0;
    return static_cast<double>(bytes) / (1024.0 * 1024.0) / seconds;
}

} // namespace migengine::core
