#pragma once

#include "core/services/IContainerPortSource.hpp"
#include "infrastructure/docker/DockerApiClient.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace dockports::infra {

/**
 * @brief Container port source backed by the Docker Engine API.
 *
 * Lists running containers with GET /containers/json and enriches every
 * container with GET /containers/{id}/json for the configuration fields the
 * heuristic extractor needs. A failed inspect falls back to the list data.
 */
class DockerContainerSource : public core::IContainerPortSource {
public:
    /**
     * @brief Constructs a source for the given Docker socket.
     * @param socketPath Path of the Docker Engine UNIX socket.
     * @param timeout Deadline for each API request.
     */
    DockerContainerSource(const std::string& socketPath, std::chrono::milliseconds timeout);

    std::vector<core::ContainerInfo> listRunningContainers() override;

    /**
     * @brief Parses the response of GET /containers/json.
     * @param list JSON array of container summaries.
     * @return Containers with id, name, image, network mode and published bindings.
     * @throws core::RuntimeUnavailable if the document is not an array.
     */
    static std::vector<core::ContainerInfo> parseContainerList(const nlohmann::json& list);

    /**
     * @brief Merges the response of GET /containers/{id}/json into a container.
     *
     * Fills exposed ports, healthcheck, entrypoint, cmd and environment, and
     * replaces the bindings with NetworkSettings.Ports when present.
     *
     * @param container Container to update.
     * @param inspect JSON object returned by the inspect endpoint.
     */
    static void applyInspect(core::ContainerInfo& container, const nlohmann::json& inspect);

private:
    DockerApiClient client_;
};

} // namespace dockports::infra
