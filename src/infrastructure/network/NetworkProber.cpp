#include "infrastructure/network/NetworkProber.hpp"

#include "infrastructure/concurrency/ParallelFor.hpp"
#include "infrastructure/network/DnsResolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <latch>
#include <memory>
#include <mutex>
#include <semaphore>
#include <stdexcept>

namespace migengine::infra {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

/// Completion bookkeeping shared with dial handlers.
struct ProbeBatch {
    ProbeBatch(size_t count, int limit) : pending(static_cast<std::ptrdiff_t>(count)), slots(limit) {}

    std::latch pending;
    std::counting_semaphore<> slots;
    std::mutex mutex;
};

} // namespace

NetworkProber::NetworkProber(AsioContext& context) : dialer_(context) {}

core::ConcurrentOperationResult<core::PingResult> NetworkProber::ping(
    const std::vector<std::string>& hosts, std::chrono::milliseconds timeout, int concurrency) {
    auto start = Clock::now();
    int limit = std::max(concurrency, 1);

    core::ConcurrentOperationResult<core::PingResult> result;
    result.results.resize(hosts.size());
    result.errors.resize(hosts.size());
    result.concurrency = limit;

    dialer_.requireRunning();
    spdlog::info("Pinging {} hosts (concurrency {}, timeout {} ms)", hosts.size(), limit,
                 timeout.count());

    auto batch = std::make_shared<ProbeBatch>(hosts.size(), limit);

    for (size_t i = 0; i < hosts.size(); ++i) {
        core::PingResult ping;
        ping.host = hosts[i];

        try {
            auto [host, port] = splitHostPort(hosts[i]);
            ping.port = port;

            batch->slots.acquire();
            dialer_.dialAsync(host, port, timeout, false,
                              [&result, batch, i, ping](DialOutcome outcome) mutable {
                                  ping.connected = outcome.connected;
                                  ping.responseTime = outcome.elapsed;
                                  ping.error = outcome.error;
                                  {
                                      std::lock_guard lock(batch->mutex);
                                      result.errors[i] = outcome.error;
                                      result.results[i] = std::move(ping);
                                  }
                                  batch->slots.release();
                                  batch->pending.count_down();
                              });
        } catch (const std::invalid_argument& e) {
            spdlog::debug("Skipping ping target {}: {}", hosts[i], e.what());
            ping.error = e.what();
            {
                std::lock_guard lock(batch->mutex);
                result.errors[i] = ping.error;
                result.results[i] = std::move(ping);
            }
            batch->pending.count_down();
        }
    }

    batch->pending.wait();

    result.duration = elapsedSince(start);
    result.success = std::any_of(result.results.begin(), result.results.end(),
                                 [](const auto& r) { return r && r->connected; });

    spdlog::info("Ping complete: {}/{} reachable in {:.1f} ms", result.successCount(),
                 hosts.size(), result.durationMs());
    return result;
}

core::ConcurrentOperationResult<core::PortScanResult> NetworkProber::scanPorts(
    const std::string& host, const std::vector<uint16_t>& ports,
    std::chrono::milliseconds timeout, int concurrency) {
    auto start = Clock::now();
    int limit = std::max(concurrency, 1);

    core::ConcurrentOperationResult<core::PortScanResult> result;
    result.results.resize(ports.size());
    result.errors.resize(ports.size());
    result.concurrency = limit;

    dialer_.requireRunning();
    spdlog::info("Scanning {} ports on {} (concurrency {})", ports.size(), host, limit);

    auto batch = std::make_shared<ProbeBatch>(ports.size(), limit);

    for (size_t i = 0; i < ports.size(); ++i) {
        core::PortScanResult scan;
        scan.host = host;
        scan.port = ports[i];
        scan.service = core::ServiceDetector::detectService(ports[i]);

        batch->slots.acquire();
        dialer_.dialAsync(host, ports[i], timeout, false,
                          [&result, batch, i, scan](DialOutcome outcome) mutable {
                              scan.open = outcome.connected;
                              scan.responseTime = outcome.elapsed;
                              {
                                  std::lock_guard lock(batch->mutex);
                                  result.results[i] = std::move(scan);
                              }
                              batch->slots.release();
                              batch->pending.count_down();
                          });
    }

    batch->pending.wait();

    result.duration = elapsedSince(start);
    size_t openCount = static_cast<size_t>(
        std::count_if(result.results.begin(), result.results.end(),
                      [](const auto& r) { return r && r->open; }));
    result.success = openCount > 0;

    spdlog::info("Port scan of {} complete: {} open ports found", host, openCount);
    return result;
}

core::ConcurrentOperationResult<core::DnsLookupResult> NetworkProber::lookupDns(
    const std::vector<std::string>& domains, int concurrency) {
    auto start = Clock::now();
    int limit = std::max(concurrency, 1);

    core::ConcurrentOperationResult<core::DnsLookupResult> result;
    result.results.resize(domains.size());
    result.errors.resize(domains.size());
    result.concurrency = limit;

    spdlog::info("Resolving {} domains (concurrency {})", domains.size(), limit);

    std::mutex mutex;
    parallelFor(domains.size(), limit, [&](size_t i) {
        const auto& domain = domains[i];
        core::DnsLookupResult lookup;
        lookup.domain = domain;

        try {
            lookup.ips = DnsResolver::resolveAddresses(domain);
        } catch (const std::runtime_error& e) {
            spdlog::debug("DNS lookup failed for {}: {}", domain, e.what());
            std::lock_guard lock(mutex);
            result.errors[i] = e.what();
            return;
        }

        auto cname = DnsResolver::canonicalName(domain);
        std::string query = domain;
        if (!query.empty() && query.back() == '.') {
            query.pop_back();
        }
        if (!cname.empty() && cname != query) {
            lookup.cname = std::move(cname);
        }
        lookup.mx = DnsResolver::mailExchangers(domain);
        lookup.txt = DnsResolver::textRecords(domain);

        std::lock_guard lock(mutex);
        result.results[i] = std::move(lookup);
    });

    result.duration = elapsedSince(start);
    result.success = std::any_of(result.results.begin(), result.results.end(),
                                 [](const auto& r) { return r.has_value(); });

    spdlog::info("DNS lookups complete: {}/{} resolved", result.successCount(), domains.size());
    return result;
}

} // namespace migengine::infra
