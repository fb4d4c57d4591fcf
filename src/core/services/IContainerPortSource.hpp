/**
 * @file IContainerPortSource.hpp
 * @brief Interface for querying running containers and their port configuration.
 */

#pragma once

#include "core/types/ContainerInfo.hpp"

#include <vector>

namespace dockports::core {

/**
 * @brief Source of running containers and their declared port bindings.
 */
class IContainerPortSource {
public:
    virtual ~IContainerPortSource() = default;

    /**
     * @brief Lists the currently running containers.
     * @return Containers with bindings, network mode and raw configuration fields.
     * @throws RuntimeUnavailable if the container runtime cannot be reached.
     */
    virtual std::vector<ContainerInfo> listRunningContainers() = 0;
};

} // namespace dockports::core
