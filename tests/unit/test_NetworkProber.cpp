#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/NetworkProber.hpp"
#include "infrastructure/network/TcpDialer.hpp"

#include <stdexcept>
#include <string>

using namespace migengine::core;
using namespace migengine::infra;

namespace {

/// Listening socket on 127.0.0.1 with an ephemeral port; never accepts.
class LocalListener {
public:
    LocalListener()
        : acceptor_(context_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context context_;
    asio::ip::tcp::acceptor acceptor_;
};

/// Port that had a listener a moment ago and has none now.
uint16_t closedPort() {
    LocalListener listener;
    return listener.port();
}

} // namespace

TEST_CASE("splitHostPort", "[NetworkProber]") {
    SECTION("Host with port") {
        auto [host, port] = splitHostPort("example.com:8080");
        REQUIRE(host == "example.com");
        REQUIRE(port == 8080);
    }

    SECTION("Default port") {
        auto [host, port] = splitHostPort("example.com");
        REQUIRE(host == "example.com");
        REQUIRE(port == 80);

        REQUIRE(splitHostPort("db.local", 5432).second == 5432);
    }

    SECTION("IPv6 forms") {
        auto [bracketed, port] = splitHostPort("[::1]:22");
        REQUIRE(bracketed == "::1");
        REQUIRE(port == 22);

        REQUIRE(splitHostPort("fe80::1").first == "fe80::1");
    }

    SECTION("Invalid ports") {
        REQUIRE_THROWS_AS(splitHostPort("host:0"), std::invalid_argument);
        REQUIRE_THROWS_AS(splitHostPort("host:99999"), std::invalid_argument);
        REQUIRE_THROWS_AS(splitHostPort("host:http"), std::invalid_argument);
    }
}

TEST_CASE("NetworkProber ping", "[NetworkProber]") {
    AsioContext context(2);
    context.start();
    NetworkProber prober(context);

    LocalListener listener;
    auto closed = closedPort();

    SECTION("Results follow input order, closed before open") {
        std::vector<std::string> hosts{"127.0.0.1:" + std::to_string(closed),
                                       "127.0.0.1:" + std::to_string(listener.port())};

        auto result = prober.ping(hosts, std::chrono::milliseconds(2000), 2);

        REQUIRE(result.results.size() == 2);
        REQUIRE(result.errors.size() == 2);
        REQUIRE(result.concurrency == 2);
        REQUIRE(result.success);

        REQUIRE(result.results[0].has_value());
        REQUIRE_FALSE(result.results[0]->connected);
        REQUIRE_FALSE(result.errors[0].empty());
        REQUIRE(result.results[0]->error == result.errors[0]);

        REQUIRE(result.results[1].has_value());
        REQUIRE(result.results[1]->connected);
        REQUIRE(result.results[1]->port == listener.port());
        REQUIRE(result.errors[1].empty());
        REQUIRE(result.successCount() == 1);
    }

    SECTION("Nothing reachable") {
        auto result = prober.ping({"127.0.0.1:" + std::to_string(closed)},
                                  std::chrono::milliseconds(1000), 1);
        REQUIRE_FALSE(result.success);
    }

    SECTION("Malformed target is reported in its slot") {
        auto result = prober.ping({"127.0.0.1:notaport"}, std::chrono::milliseconds(500), 1);
        REQUIRE(result.results[0].has_value());
        REQUIRE_FALSE(result.errors[0].empty());
    }

    SECTION("Concurrency below one is clamped") {
        auto result = prober.ping({"127.0.0.1:" + std::to_string(listener.port())},
                                  std::chrono::milliseconds(1000), 0);
        REQUIRE(result.concurrency == 1);
        REQUIRE(result.success);
    }

    SECTION("Empty input") {
        auto result = prober.ping({}, std::chrono::milliseconds(100), 4);
        REQUIRE(result.results.empty());
        REQUIRE_FALSE(result.success);
    }

    context.stop();
}

TEST_CASE("NetworkProber port scan", "[NetworkProber]") {
    AsioContext context(2);
    context.start();
    NetworkProber prober(context);

    LocalListener listener;
    auto closed = closedPort();

    auto result = prober.scanPorts("127.0.0.1", {listener.port(), closed},
                                   std::chrono::milliseconds(2000), 8);

    REQUIRE(result.success);
    REQUIRE(result.results.size() == 2);
    REQUIRE(result.results[0]->open);
    REQUIRE(result.results[0]->port == listener.port());
    REQUIRE_FALSE(result.results[1]->open);
    REQUIRE_FALSE(result.results[1]->service.empty());
    for (const auto& error : result.errors) {
        REQUIRE(error.empty());
    }

    context.stop();
}

TEST_CASE("NetworkProber DNS lookup", "[NetworkProber]") {
    AsioContext context(1);
    context.start();
    NetworkProber prober(context);

    auto result = prober.lookupDns({"localhost"}, 2);

    REQUIRE(result.results.size() == 1);
    REQUIRE(result.results[0].has_value());
    REQUIRE(result.results[0]->domain == "localhost");
    REQUIRE_FALSE(result.results[0]->ips.empty());
    REQUIRE(result.success);

    context.stop();
}

TEST_CASE("TcpDialer blocking dial", "[NetworkProber]") {
    AsioContext context(1);
    TcpDialer dialer(context);
    LocalListener listener;

    SECTION("Requires a running context") {
        REQUIRE_THROWS_AS(dialer.dial("127.0.0.1", listener.port(), std::chrono::milliseconds(500)),
                          std::runtime_error);
    }

    SECTION("Returns an open socket") {
        context.start();
        auto socket = dialer.dial("127.0.0.1", listener.port(), std::chrono::milliseconds(1000));
        REQUIRE(socket);
        REQUIRE(socket->is_open());
        context.stop();
    }
}

TEST_CASE("Batch operations without running I/O threads", "[NetworkProber]") {
    AsioContext context(1);
    NetworkProber prober(context);
    LocalListener listener;
    std::string target = "127.0.0.1:" + std::to_string(listener.port());

    SECTION("Ping fails fast") {
        REQUIRE_THROWS_AS(prober.ping({target}, std::chrono::milliseconds(200), 1),
                          std::runtime_error);
    }

    SECTION("Port scan fails fast") {
        REQUIRE_THROWS_AS(
            prober.scanPorts("127.0.0.1", {listener.port()}, std::chrono::milliseconds(200), 1),
            std::runtime_error);
    }

    SECTION("Asynchronous dial refuses to queue") {
        TcpDialer dialer(context);
        bool called = false;
        REQUIRE_THROWS_AS(dialer.dialAsync("127.0.0.1", listener.port(),
                                           std::chrono::milliseconds(200), false,
                                           [&called](DialOutcome) { called = true; }),
                          std::runtime_error);
        REQUIRE_FALSE(called);
    }

    SECTION("A stopped context is refused as well") {
        context.start();
        context.stop();
        REQUIRE_THROWS_AS(prober.ping({target}, std::chrono::milliseconds(200), 1),
                          std::runtime_error);
    }
}
