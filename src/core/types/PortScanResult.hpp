/**
 * @file PortScanResult.hpp
 * @brief Port scanning results and well-known service detection.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace migengine::core {

/**
 * @brief Result of scanning a single TCP port.
 *
 * A port is open when the TCP handshake completes within the timeout. The
 * service name is informational only and never affects the open flag.
 */
struct PortScanResult {
    std::string host;                          ///< Address that was scanned
    uint16_t port{0};                          ///< Port number that was scanned
    bool open{false};                          ///< Whether the port accepted a connection
    std::chrono::microseconds responseTime{0}; ///< Time until connect succeeded or failed
    std::string service;                       ///< Well-known service name, "Unknown" otherwise

    /**
     * @brief Converts the response time to milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    bool operator==(const PortScanResult& other) const = default;
};

/**
 * @brief Parses port specifications such as "22", "80,443" or "8000-8010".
 * @param specs Port specifications.
 * @return Ports in the order given, ranges expanded.
 * @throws std::invalid_argument on malformed input or ports outside 1-65535.
 */
std::vector<uint16_t> parsePortList(const std::vector<std::string>& specs);

/**
 * @brief Utility class for naming services by well-known port number.
 */
class ServiceDetector {
public:
    /**
     * @brief Returns the service name for a port.
     * @param port The port number to look up.
     * @return Service name if known, "Unknown" otherwise.
     */
    static std::string detectService(uint16_t port);

    /**
     * @brief Gets the map of known port-to-service mappings.
     * @return Reference to the map of port numbers to service names.
     */
    static const std::unordered_map<uint16_t, std::string>& getKnownServices();
};

} // namespace migengine::core
