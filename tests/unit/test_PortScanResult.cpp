#include <catch2/catch_test_macros.hpp>

#include "core/types/PortScanResult.hpp"

#include <stdexcept>

using namespace migengine::core;

TEST_CASE("parsePortList", "[PortScanResult]") {
    SECTION("Single ports and ranges") {
        auto ports = parsePortList({"22", "80-82", "443"});
        REQUIRE(ports == std::vector<uint16_t>{22, 80, 81, 82, 443});
    }

    SECTION("Comma separated values") {
        auto ports = parsePortList({"22,8080", "5432"});
        REQUIRE(ports == std::vector<uint16_t>{22, 8080, 5432});
    }

    SECTION("Invalid values") {
        REQUIRE_THROWS_AS(parsePortList({"0"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parsePortList({"70000"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parsePortList({"http"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parsePortList({"90-80"}), std::invalid_argument);
    }
}

TEST_CASE("ServiceDetector", "[PortScanResult]") {
    REQUIRE(ServiceDetector::detectService(22) == "SSH");
    REQUIRE(ServiceDetector::detectService(443) == "HTTPS");
    REQUIRE(ServiceDetector::detectService(5432) == "PostgreSQL");
    REQUIRE(ServiceDetector::detectService(12345) == "Unknown");
}

TEST_CASE("PortScanResult response time", "[PortScanResult]") {
    PortScanResult result;
    result.responseTime = std::chrono::microseconds(1500);
    REQUIRE(result.responseTimeMs() == 1.5);
}
