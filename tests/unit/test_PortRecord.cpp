#include <catch2/catch_test_macros.hpp>

#include "core/types/PortRecord.hpp"

using namespace dockports::core;

TEST_CASE("PortRecord default values", "[PortRecord]") {
    PortRecord record;

    REQUIRE(record.port == 0);
    REQUIRE(record.protocol == Protocol::Tcp);
    REQUIRE(record.state == PortState::Used);
    REQUIRE(record.source == PortSource::None);
    REQUIRE(record.detectionMethod == DetectionMethod::SystemScan);
    REQUIRE_FALSE(record.containerName.has_value());
    REQUIRE_FALSE(record.processName.has_value());
    REQUIRE(record.serviceName.empty());
    REQUIRE_FALSE(record.hostNetwork);
}

TEST_CASE("Detection method confidence ordering", "[PortRecord]") {
    REQUIRE(confidenceOf(DetectionMethod::ExplicitBinding) == 6);
    REQUIRE(confidenceOf(DetectionMethod::ExposedPortsConfig) == 5);
    REQUIRE(confidenceOf(DetectionMethod::HealthcheckParse) == 4);
    REQUIRE(confidenceOf(DetectionMethod::EntrypointParse) == 3);
    REQUIRE(confidenceOf(DetectionMethod::EnvVarScan) == 2);
    REQUIRE(confidenceOf(DetectionMethod::SystemScan) == 1);

    PortRecord record;
    record.detectionMethod = DetectionMethod::HealthcheckParse;
    REQUIRE(record.confidence() == 4);
}

TEST_CASE("PortRecord string conversion", "[PortRecord]") {
    SECTION("protocolToString") {
        REQUIRE(protocolToString(Protocol::Tcp) == "tcp");
        REQUIRE(protocolToString(Protocol::Udp) == "udp");
    }

    SECTION("protocolFromString") {
        REQUIRE(protocolFromString("tcp") == Protocol::Tcp);
        REQUIRE(protocolFromString("UDP") == Protocol::Udp);
        REQUIRE(protocolFromString("tcp6") == Protocol::Tcp);
        REQUIRE(protocolFromString("udp6") == Protocol::Udp);
        REQUIRE_FALSE(protocolFromString("sctp").has_value());
        REQUIRE_FALSE(protocolFromString("").has_value());
    }

    SECTION("portStateToString") {
        REQUIRE(portStateToString(PortState::Used) == "used");
        REQUIRE(portStateToString(PortState::Available) == "available");
        REQUIRE(portStateToString(PortState::Hidden) == "hidden");
        REQUIRE(portStateToString(PortState::VirtualHidden) == "virtual-hidden");
    }

    SECTION("portSourceToString") {
        REQUIRE(portSourceToString(PortSource::Container) == "container");
        REQUIRE(portSourceToString(PortSource::System) == "system");
        REQUIRE(portSourceToString(PortSource::None) == "none");
    }

    SECTION("detectionMethodToString") {
        REQUIRE(detectionMethodToString(DetectionMethod::ExplicitBinding) == "explicit-binding");
        REQUIRE(detectionMethodToString(DetectionMethod::ExposedPortsConfig) ==
                "exposed-ports-config");
        REQUIRE(detectionMethodToString(DetectionMethod::HealthcheckParse) == "healthcheck-parse");
        REQUIRE(detectionMethodToString(DetectionMethod::EntrypointParse) == "entrypoint-parse");
        REQUIRE(detectionMethodToString(DetectionMethod::EnvVarScan) == "env-var-scan");
        REQUIRE(detectionMethodToString(DetectionMethod::SystemScan) == "system-scan");
    }
}

TEST_CASE("Port number validation", "[PortRecord]") {
    REQUIRE(isValidPort(1));
    REQUIRE(isValidPort(65535));
    REQUIRE_FALSE(isValidPort(0));
    REQUIRE_FALSE(isValidPort(-1));
    REQUIRE_FALSE(isValidPort(65536));
    REQUIRE_FALSE(isValidPort(70000));
}
