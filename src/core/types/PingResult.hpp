/**
 * @file PingResult.hpp
 * @brief TCP reachability result.
 *
 * This file defines the result of a single TCP "ping": a connection attempt
 * to host:port with a dial timeout.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace migengine::core {

/**
 * @brief Result of a single TCP reachability check.
 *
 * Contains the target, whether the handshake completed and how long the
 * connection took to establish (or to fail).
 */
struct PingResult {
    std::string host;                          ///< Target as supplied by the caller
    uint16_t port{80};                         ///< Port that was dialed
    bool connected{false};                     ///< Whether the TCP handshake succeeded
    std::chrono::microseconds responseTime{0}; ///< Time to establish (or fail) the connection
    std::string error;                         ///< Error message if the dial failed

    /**
     * @brief Converts the response time to milliseconds.
     * @return Response time as a floating-point number of milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    bool operator==(const PingResult& other) const = default;
};

} // namespace migengine::core
