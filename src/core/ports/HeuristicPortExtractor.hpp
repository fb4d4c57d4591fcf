/**
 * @file HeuristicPortExtractor.hpp
 * @brief Infers listening ports of containers that publish no port bindings.
 *
 * Containers in host-network mode share the host's network namespace, so the
 * runtime reports no port mappings for them. The extractor recovers candidate
 * ports from their configuration using an ordered chain of pure functions.
 */

#pragma once

#include "core/types/ContainerInfo.hpp"
#include "core/types/PortRecord.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dockports::core {

/**
 * @brief One stage of the inference chain.
 */
struct ExtractorStep {
    DetectionMethod method;                                     ///< Tag given to every match
    std::vector<PortRecord> (*extract)(const ContainerInfo&);   ///< Pure extraction function
};

/**
 * @brief Runs the port inference chain over container metadata.
 *
 * Steps run in fixed priority order, highest confidence first:
 * ExposedPorts, healthcheck, entrypoint/cmd, environment. Several steps may
 * report the same port; the aggregator keeps the highest-confidence tag.
 */
class HeuristicPortExtractor {
public:
    HeuristicPortExtractor();

    /**
     * @brief Infers candidate ports for a container.
     * @param container Container metadata.
     * @return Candidates in step order, each tagged with its detection method.
     */
    [[nodiscard]] std::vector<PortRecord> extract(const ContainerInfo& container) const;

    /**
     * @brief Returns the chain in execution order.
     * @return Extractor steps.
     */
    const std::vector<ExtractorStep>& steps() const { return steps_; }

    /**
     * @brief Parses Config.ExposedPorts entries of the form "<port>/<protocol>".
     */
    static std::vector<PortRecord> fromExposedPorts(const ContainerInfo& container);

    /**
     * @brief Finds localhost:N, 127.0.0.1:N and bare :N in the healthcheck command.
     */
    static std::vector<PortRecord> fromHealthcheck(const ContainerInfo& container);

    /**
     * @brief Finds --port, -p, --listen, --bind style flags and bare :N in entrypoint and cmd.
     */
    static std::vector<PortRecord> fromEntrypoint(const ContainerInfo& container);

    /**
     * @brief Reads integer values of environment variables whose name contains PORT.
     */
    static std::vector<PortRecord> fromEnvironment(const ContainerInfo& container);

    /**
     * @brief Parses a decimal port number.
     * @param text Text to parse, surrounding whitespace allowed.
     * @return The port, or nullopt if text is not an integer in 1-65535.
     */
    static std::optional<uint16_t> parsePort(const std::string& text);

private:
    std::vector<ExtractorStep> steps_;
};

} // namespace dockports::core
