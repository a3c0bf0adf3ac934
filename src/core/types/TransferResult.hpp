/**
 * @file TransferResult.hpp
 * @brief Network transfer results and transfer tuning parameters.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace migengine::core {

/**
 * @brief Outcome of a transfer (HTTP download/upload, chunked or concurrent copy).
 */
struct TransferResult {
    int64_t bytesTransferred{0};           ///< Bytes moved to the destination
    std::chrono::microseconds duration{0}; ///< Wall-clock duration
    double transferRateMBps{0.0};          ///< Throughput in MiB per second
    std::string method;                    ///< Transfer method identifier ("http", "chunked", ...)
    bool success{false};                   ///< Whether the transfer completed
    std::string error;                     ///< Error text when success is false

    /**
     * @brief Converts the duration to milliseconds.
     */
    [[nodiscard]] double durationMs() const {
        return static_cast<double>(duration.count()) / 1000.0;
    }

    bool operator==(const TransferResult& other) const = default;
};

/**
 * @brief Tuning parameters for transfers.
 */
struct TransferConfig {
    size_t chunkSize{1024 * 1024};                   ///< Read/write chunk size in bytes
    int maxConcurrency{4};                           ///< Parallel files or downloads
    std::chrono::milliseconds timeout{30000};        ///< Per-request timeout
    int retryAttempts{3};                            ///< Extra attempts after the first failure
    std::chrono::milliseconds retryDelay{1000};      ///< Base delay, multiplied by attempt number
};

/**
 * @brief Progress callback: bytes transferred so far and total bytes.
 */
using TransferProgressCallback = std::function<void(int64_t transferred, int64_t total)>;

} // namespace migengine::core
