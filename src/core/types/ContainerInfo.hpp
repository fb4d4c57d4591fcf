/**
 * @file ContainerInfo.hpp
 * @brief Container metadata reported by the container runtime.
 */

#pragma once

#include "core/types/PortRecord.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dockports::core {

/**
 * @brief A host port published by a container.
 */
struct PortBinding {
    uint16_t hostPort{0};             ///< Port on the host
    uint16_t containerPort{0};        ///< Port inside the container
    Protocol protocol{Protocol::Tcp}; ///< Transport protocol
    std::string hostIp;               ///< Bound host address ("0.0.0.0", "::", ...)

    bool operator==(const PortBinding& other) const = default;
};

/**
 * @brief A running container with the fields needed for port inference.
 */
struct ContainerInfo {
    std::string id;                       ///< Short container id (12 characters)
    std::string name;                     ///< Container name without leading slash
    std::string image;                    ///< Image reference
    std::string networkMode;              ///< HostConfig.NetworkMode ("bridge", "host", ...)
    std::vector<PortBinding> bindings;    ///< Declared host port bindings
    std::vector<std::string> exposedPorts; ///< Config.ExposedPorts keys, e.g. "80/tcp"
    std::vector<std::string> healthcheck; ///< Config.Healthcheck.Test
    std::vector<std::string> entrypoint;  ///< Config.Entrypoint
    std::vector<std::string> cmd;         ///< Config.Cmd
    std::vector<std::string> env;         ///< Config.Env, "NAME=value"

    /**
     * @brief Checks whether the container shares the host network namespace.
     * @return True if the network mode is "host".
     */
    [[nodiscard]] bool isHostNetwork() const { return networkMode == "host"; }
};

} // namespace dockports::core
