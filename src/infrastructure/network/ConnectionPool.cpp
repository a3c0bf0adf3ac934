#include "infrastructure/network/ConnectionPool.hpp"

#include "infrastructure/network/TcpDialer.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace migengine::infra {

namespace {

void closeQuietly(const ConnectionPool::Connection& connection) {
    if (!connection) {
        return;
    }
    asio::error_code ec;
    connection->close(ec);
    if (ec) {
        spdlog::debug("Error closing pooled connection: {}", ec.message());
    }
}

} // namespace

ConnectionPool::ConnectionPool(AsioContext& context, size_t maxConnections,
                               std::chrono::milliseconds staleTimeout)
    : dialer_(context), maxConnections_(maxConnections), staleTimeout_(staleTimeout) {}

ConnectionPool::~ConnectionPool() {
    close();
}

ConnectionPool::Connection ConnectionPool::acquire(const std::string& address) {
    auto [host, port] = splitHostPort(address, 0);
    if (port == 0) {
        throw std::invalid_argument("address must be host:port: " + address);
    }

    {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(address);
        if (it != connections_.end() && !it->second.inUse) {
            if (Clock::now() - it->second.lastUsed < staleTimeout_) {
                it->second.inUse = true;
                it->second.lastUsed = Clock::now();
                return it->second.connection;
            }
            spdlog::debug("Replacing stale connection to {}", address);
            closeQuietly(it->second.connection);
            connections_.erase(it);
        }
    }

    auto connection = dialer_.dial(host, port, staleTimeout_);

    std::lock_guard lock(mutex_);
    if (connections_.size() < maxConnections_ && !connections_.contains(address)) {
        connections_[address] = PooledConnection{connection, Clock::now(), true};
    }
    return connection;
}

void ConnectionPool::release(const std::string& address, const Connection& connection) {
    std::lock_guard lock(mutex_);
    auto it = connections_.find(address);
    if (it != connections_.end() && it->second.connection == connection) {
        it->second.inUse = false;
        it->second.lastUsed = Clock::now();
    }
}

size_t ConnectionPool::size() const {
    std::lock_guard lock(mutex_);
    return connections_.size();
}

void ConnectionPool::close() {
    std::lock_guard lock(mutex_);
    for (auto& [address, pooled] : connections_) {
        closeQuietly(pooled.connection);
    }
    connections_.clear();
}

} // namespace migengine::infra
