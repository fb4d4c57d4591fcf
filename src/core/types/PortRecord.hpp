/**
 * @file PortRecord.hpp
 * @brief Port record types shared by the collection, aggregation and classification stages.
 *
 * This file defines the PortRecord structure which represents a single
 * (port, protocol) entry of the merged view, along with the enumerations
 * describing its protocol, state, source and provenance.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dockports::core {

/**
 * @brief Transport protocol of a port.
 */
enum class Protocol : int {
    Tcp = 0, ///< Transmission Control Protocol
    Udp = 1  ///< User Datagram Protocol
};

/**
 * @brief Final classification of a port.
 */
enum class PortState : int {
    Used = 0,         ///< Port is in use and visible
    Available = 1,    ///< Port is not in use
    Hidden = 2,       ///< Port is in use but hidden by the operator
    VirtualHidden = 3 ///< Port is not in use and hidden by the operator
};

/**
 * @brief Origin of a port record.
 */
enum class PortSource : int {
    None = 0,      ///< Synthetic record (available port or gap)
    Container = 1, ///< Reported by the container runtime
    System = 2     ///< Observed in the host socket tables
};

/**
 * @brief How a port record was detected.
 *
 * Declared in ascending confidence order; see confidenceOf().
 */
enum class DetectionMethod : int {
    SystemScan = 0,         ///< Host socket table scan
    EnvVarScan = 1,         ///< Container environment variable
    EntrypointParse = 2,    ///< Container entrypoint/cmd argument
    HealthcheckParse = 3,   ///< Container healthcheck command
    ExposedPortsConfig = 4, ///< Container ExposedPorts configuration
    ExplicitBinding = 5     ///< Declared host port binding
};

/**
 * @brief A single (port, protocol) entry of the merged port view.
 */
struct PortRecord {
    uint16_t port{0};                                     ///< Port number (1-65535)
    Protocol protocol{Protocol::Tcp};                     ///< Transport protocol
    PortState state{PortState::Used};                     ///< Classification of the port
    PortSource source{PortSource::None};                  ///< Where the record came from
    DetectionMethod detectionMethod{DetectionMethod::SystemScan}; ///< Provenance of the record
    std::optional<std::string> containerName;             ///< Owning container (container source only)
    std::optional<std::string> containerInternalPort;     ///< Port inside the container, e.g. "80/tcp"
    std::optional<std::string> containerId;               ///< Short container id
    std::optional<std::string> image;                     ///< Container image
    std::optional<std::string> processName;               ///< Owning process, when the OS scan knows it
    std::string serviceName;                              ///< Resolved service name
    bool hostNetwork{false};                              ///< Container runs in host-network mode

    /**
     * @brief Returns the confidence of this record's detection method.
     * @return Ordinal confidence, higher wins.
     */
    [[nodiscard]] int confidence() const;

    bool operator==(const PortRecord& other) const = default;
};

/**
 * @brief Returns the confidence rank of a detection method.
 * @param method The detection method.
 * @return 6 for explicit bindings down to 1 for the system scan.
 */
int confidenceOf(DetectionMethod method);

std::string protocolToString(Protocol protocol);

/**
 * @brief Parses a protocol name.
 * @param str Protocol name, case-insensitive ("tcp", "udp", "TCP6", ...).
 * @return The protocol, or nullopt if the name is not recognized.
 */
std::optional<Protocol> protocolFromString(const std::string& str);

std::string portStateToString(PortState state);
std::string portSourceToString(PortSource source);
std::string detectionMethodToString(DetectionMethod method);

/**
 * @brief Checks whether a value is a valid port number.
 * @param value Candidate value.
 * @return True if value is within 1-65535.
 */
constexpr bool isValidPort(long long value) {
    return value >= 1 && value <= 65535;
}

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

} // namespace dockports::core
