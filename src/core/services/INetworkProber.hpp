/**
 * @file INetworkProber.hpp
 * @brief Interface for bounded-concurrency network probes.
 */

#pragma once

#include "core/types/ConcurrentOperationResult.hpp"
#include "core/types/DnsLookupResult.hpp"
#include "core/types/PingResult.hpp"
#include "core/types/PortScanResult.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Interface for TCP reachability checks, port scans and DNS lookups.
 *
 * Every call blocks until all targets have completed. At most `concurrency`
 * targets are in flight at any time.
 */
class INetworkProber {
public:
    virtual ~INetworkProber() = default;

    /**
     * @brief Checks TCP reachability of each host.
     * @param hosts Targets as "host" or "host:port" (port defaults to 80).
     * @param timeout Dial timeout per target.
     * @param concurrency Maximum dials in flight.
     * @return One PingResult per host; success if any host connected.
     */
    virtual ConcurrentOperationResult<PingResult> ping(const std::vector<std::string>& hosts,
                                                       std::chrono::milliseconds timeout,
                                                       int concurrency) = 0;

    /**
     * @brief Scans TCP ports on a single host.
     * @param host Target host name or address.
     * @param ports Ports to dial.
     * @param timeout Dial timeout per port.
     * @param concurrency Maximum dials in flight.
     * @return One PortScanResult per port; success if any port is open.
     */
    virtual ConcurrentOperationResult<PortScanResult> scanPorts(const std::string& host,
                                                                const std::vector<uint16_t>& ports,
                                                                std::chrono::milliseconds timeout,
                                                                int concurrency) = 0;

    /**
     * @brief Resolves address, CNAME, MX and TXT records of each domain.
     * @param domains Domains to resolve.
     * @param concurrency Maximum lookups in flight.
     * @return One DnsLookupResult per domain, empty where the address lookup failed.
     */
    virtual ConcurrentOperationResult<DnsLookupResult> lookupDns(
        const std::vector<std::string>& domains, int concurrency) = 0;
};

} // namespace migengine::core
