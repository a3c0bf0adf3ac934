#pragma once

#include "infrastructure/network/TcpDialer.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace migengine::infra {

/**
 * @brief Reuses idle TCP connections keyed by "host:port".
 *
 * At most one connection per address is pooled, and at most maxConnections
 * addresses. An idle pooled connection older than the stale timeout is
 * closed and replaced on the next acquire. Connections dialed while the
 * pool is full are returned to the caller unpooled.
 */
class ConnectionPool {
public:
    using Connection = std::shared_ptr<asio::ip::tcp::socket>;

    /**
     * @brief Constructs a pool.
     * @param context I/O context used to dial.
     * @param maxConnections Maximum pooled addresses.
     * @param staleTimeout Idle age after which a pooled connection is replaced; also the dial timeout.
     */
    ConnectionPool(AsioContext& context, size_t maxConnections,
                   std::chrono::milliseconds staleTimeout);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Returns an idle pooled connection or dials a new one.
     * @param address Target as "host:port".
     * @throws std::invalid_argument if the address has no port.
     * @throws std::runtime_error if the dial fails.
     */
    Connection acquire(const std::string& address);

    /**
     * @brief Marks a pooled connection idle. Unpooled connections are ignored.
     */
    void release(const std::string& address, const Connection& connection);

    /**
     * @brief Returns the number of pooled connections.
     */
    size_t size() const;

    /**
     * @brief Closes every pooled connection and empties the pool.
     */
    void close();

private:
    using Clock = std::chrono::steady_clock;

    struct PooledConnection {
        Connection connection;
        Clock::time_point lastUsed;
        bool inUse{false};
    };

    TcpDialer dialer_;
    size_t maxConnections_;
    std::chrono::milliseconds staleTimeout_;
    std::unordered_map<std::string, PooledConnection> connections_;
    mutable std::mutex mutex_;
};

} // namespace migengine::infra
