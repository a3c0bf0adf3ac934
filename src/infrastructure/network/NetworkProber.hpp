#pragma once

#include "core/services/INetworkProber.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/TcpDialer.hpp"

#include <cstdint>
#include <string>

namespace migengine::infra {

/**
 * @brief Bounded-concurrency TCP and DNS prober.
 *
 * Ping and port scan dials run asynchronously on the shared AsioContext.
 * A counting semaphore, acquired before each dial is started and released
 * from its completion handler, caps the number of dials in flight. DNS
 * lookups block in the system resolver and run on a capped set of tasks.
 * Implements the core::INetworkProber interface.
 */
class NetworkProber : public core::INetworkProber {
public:
    explicit NetworkProber(AsioContext& context);

    core::ConcurrentOperationResult<core::PingResult> ping(const std::vector<std::string>& hosts,
                                                           std::chrono::milliseconds timeout,
                                                           int concurrency) override;

    core::ConcurrentOperationResult<core::PortScanResult> scanPorts(
        const std::string& host, const std::vector<uint16_t>& ports,
        std::chrono::milliseconds timeout, int concurrency) override;

    core::ConcurrentOperationResult<core::DnsLookupResult> lookupDns(
        const std::vector<std::string>& domains, int concurrency) override;

private:
    TcpDialer dialer_;
};

} // namespace migengine::infra
