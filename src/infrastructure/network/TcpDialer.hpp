#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace migengine::infra {

/**
 * @brief Outcome of a single TCP connection attempt.
 */
struct DialOutcome {
    bool connected{false};                          ///< Handshake completed in time
    std::chrono::microseconds elapsed{0};           ///< Time until success, failure or timeout
    std::string error;                              ///< Failure text, empty when connected
    std::shared_ptr<asio::ip::tcp::socket> socket;  ///< Open socket when requested and connected
};

/**
 * @brief Splits "host", "host:port" or "[v6]:port" into host and port.
 * @param target Target text. A bare IPv6 literal is accepted without a port.
 * @param defaultPort Port used when none is given.
 * @return Host (without brackets) and port.
 * @throws std::invalid_argument for an empty host or an invalid port.
 */
std::pair<std::string, uint16_t> splitHostPort(const std::string& target,
                                               uint16_t defaultPort = 80);

/**
 * @brief Resolves and connects TCP endpoints on the shared I/O context.
 *
 * Each attempt owns a resolver, a socket and a deadline timer bound to one
 * strand, so completion and timeout never race. Whichever fires first wins
 * and the handler is invoked exactly once.
 */
class TcpDialer {
public:
    using Handler = std::function<void(DialOutcome)>;

    explicit TcpDialer(AsioContext& context);

    /**
     * @brief Starts a connection attempt and returns immediately.
     * @param host Host name or address literal.
     * @param port TCP port.
     * @param timeout Deadline covering resolution and handshake.
     * @param keepOpen Hand the connected socket to the handler instead of closing it.
     * @param handler Invoked once on an I/O thread with the outcome.
     * @throws std::runtime_error if the context is not running.
     */
    void dialAsync(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                   bool keepOpen, Handler handler);

    /**
     * @brief Connects synchronously.
     * @return The connected socket.
     * @throws std::runtime_error if the context is stopped or the dial fails.
     */
    std::shared_ptr<asio::ip::tcp::socket> dial(const std::string& host, uint16_t port,
                                                std::chrono::milliseconds timeout);

    /**
     * @brief Throws std::runtime_error unless the context has running I/O threads.
     */
    void requireRunning() const;

private:
    AsioContext& context_;
};

} // namespace migengine::infra
