#include "infrastructure/network/TcpDialer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <stdexcept>

namespace migengine::infra {

namespace {

using Clock = std::chrono::steady_clock;
using tcp = asio::ip::tcp;

struct DialState {
    explicit DialState(asio::io_context& io)
        : strand(asio::make_strand(io)), resolver(strand), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    tcp::resolver resolver;
    tcp::socket socket;
    asio::steady_timer timer;
    Clock::time_point start{Clock::now()};
    std::atomic<bool> completed{false};
    bool keepOpen{false};
    TcpDialer::Handler handler;
};

void finishDial(const std::shared_ptr<DialState>& state, std::string error) {
    if (state->completed.exchange(true)) {
        return;
    }

    state->timer.cancel();
    state->resolver.cancel();

    DialOutcome outcome;
    outcome.connected = error.empty();
    outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() -
                                                                            state->start);
    outcome.error = std::move(error);

    if (outcome.connected && state->keepOpen) {
        outcome.socket = std::make_shared<tcp::socket>(std::move(state->socket));
    } else {
        asio::error_code ignored;
        state->socket.close(ignored);
    }

    state->handler(std::move(outcome));
}

uint16_t parsePort(const std::string& text, const std::string& target) {
    bool numeric = std::all_of(text.begin(), text.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
    if (text.empty() || text.size() > 5 || !numeric) {
        throw std::invalid_argument("invalid port in target: " + target);
    }
    int value = std::stoi(text);
    if (value < 1 || value > 65535) {
        throw std::invalid_argument("port out of range in target: " + target);
    }
    return static_cast<uint16_t>(value);
}

} // namespace

std::pair<std::string, uint16_t> splitHostPort(const std::string& target, uint16_t defaultPort) {
    if (target.empty()) {
        throw std::invalid_argument("empty target");
    }

    if (target.front() == '[') {
        auto close = target.find(']');
        if (close == std::string::npos || close == 1) {
            throw std::invalid_argument("malformed IPv6 target: " + target);
        }
        std::string host = target.substr(1, close - 1);
        if (close + 1 == target.size()) {
            return {host, defaultPort};
        }
        if (target[close + 1] != ':') {
            throw std::invalid_argument("malformed IPv6 target: " + target);
        }
        return {host, parsePort(target.substr(close + 2), target)};
    }

    auto colon = target.find(':');
    if (colon == std::string::npos) {
        return {target, defaultPort};
    }
    if (target.find(':', colon + 1) != std::string::npos) {
        // Bare IPv6 literal without a port
        return {target, defaultPort};
    }
    if (colon == 0) {
        throw std::invalid_argument("missing host in target: " + target);
    }
    return {target.substr(0, colon), parsePort(target.substr(colon + 1), target)};
}

TcpDialer::TcpDialer(AsioContext& context) : context_(context) {}

void TcpDialer::dialAsync(const std::string& host, uint16_t port,
                          std::chrono::milliseconds timeout, bool keepOpen, Handler handler) {
    requireRunning();

    auto state = std::make_shared<DialState>(context_.getContext());
    state->keepOpen = keepOpen;
    state->handler = std::move(handler);

    std::string target = host + ":" + std::to_string(port);

    asio::dispatch(state->strand, [state, host, port, timeout, target]() {
        state->timer.expires_after(timeout);
        state->timer.async_wait([state, target](const asio::error_code& ec) {
            if (ec) {
                return; // cancelled by completion
            }
            finishDial(state, "dial tcp " + target + ": i/o timeout");
        });

        state->resolver.async_resolve(
            host, std::to_string(port),
            [state, target](const asio::error_code& ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    finishDial(state, "lookup " + target + ": " + ec.message());
                    return;
                }
                if (state->completed) {
                    return;
                }
                asio::async_connect(state->socket, endpoints,
                                    [state, target](const asio::error_code& ec, const tcp::endpoint&) {
                                        if (ec) {
                                            finishDial(state, "dial tcp " + target + ": " +
                                                                  ec.message());
                                            return;
                                        }
                                        finishDial(state, {});
                                    });
            });
    });
}

void TcpDialer::requireRunning() const {
    if (!context_.isRunning()) {
        throw std::runtime_error("I/O context is not running");
    }
}

std::shared_ptr<asio::ip::tcp::socket> TcpDialer::dial(const std::string& host, uint16_t port,
                                                       std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<DialOutcome>>();
    auto future = promise->get_future();
    dialAsync(host, port, timeout, true,
              [promise](DialOutcome outcome) { promise->set_value(std::move(outcome)); });

    auto outcome = future.get();
    if (!outcome.connected) {
        spdlog::debug("Dial failed: {}", outcome.error);
        throw std::runtime_error(outcome.error);
    }
    return outcome.socket;
}

} // namespace migengine::infra
