/**
 * @file PortAggregator.hpp
 * @brief Merges container and system port candidates into one sorted record set.
 */

#pragma once

#include "core/ports/HeuristicPortExtractor.hpp"
#include "core/types/ContainerInfo.hpp"
#include "core/types/GapRange.hpp"
#include "core/types/ListeningSocket.hpp"
#include "core/types/PortRecord.hpp"

#include <vector>

namespace dockports::core {

/**
 * @brief An element of the merged sequence: a used record or a gap marker.
 */
struct AggregatedEntry {
    enum class Kind { Used, Gap };

    Kind kind{Kind::Used}; ///< Which member is meaningful
    PortRecord record;     ///< Used record (Kind::Used)
    GapRange gap;          ///< Gap marker (Kind::Gap)

    /**
     * @brief Returns the first port covered by this entry.
     * @return Record port or gap start.
     */
    [[nodiscard]] uint16_t firstPort() const { return kind == Kind::Used ? record.port : gap.start; }
};

/**
 * @brief Output of one aggregation pass.
 */
struct AggregationResult {
    std::vector<PortRecord> used; ///< One record per (port, protocol), ascending by port then protocol
    std::vector<GapRange> gaps;   ///< Unused runs strictly between the lowest and highest used port

    /**
     * @brief Interleaves used records and gap markers in port order.
     * @return The merged sequence.
     */
    [[nodiscard]] std::vector<AggregatedEntry> sequence() const;

    /**
     * @brief Counts distinct port numbers in use on any protocol.
     * @return Number of distinct used port numbers.
     */
    [[nodiscard]] size_t distinctUsedPorts() const;
};

/**
 * @brief Produces the canonical, deduplicated and sorted port record set.
 *
 * Candidates come from explicit container bindings, heuristic inference for
 * host-network containers and the host socket scan. Collisions on the same
 * (port, protocol) keep the highest-confidence candidate; at equal confidence
 * a container record wins over a system record.
 */
class PortAggregator {
public:
    PortAggregator() = default;

    /**
     * @brief Turns containers into candidates.
     *
     * Every declared binding yields an explicit-binding candidate. Host-network
     * containers are additionally run through the heuristic extractor.
     *
     * @param containers Running containers.
     * @return Container-sourced candidates.
     */
    [[nodiscard]] std::vector<PortRecord> collectContainerCandidates(
        const std::vector<ContainerInfo>& containers) const;

    /**
     * @brief Turns listening sockets into system-scan candidates.
     * @param sockets Host listening sockets.
     * @return System-sourced candidates.
     */
    static std::vector<PortRecord> collectSystemCandidates(
        const std::vector<ListeningSocket>& sockets);

    /**
     * @brief Groups candidates by (port, protocol) and keeps one winner per key.
     * @param candidates Candidates in any order.
     * @return Winners sorted by port, then protocol.
     */
    static std::vector<PortRecord> mergeCandidates(const std::vector<PortRecord>& candidates);

    /**
     * @brief Computes gaps between used port numbers.
     * @param sortedUsed Used records sorted by port.
     * @return Maximal unused runs between consecutive used port numbers.
     */
    static std::vector<GapRange> computeGaps(const std::vector<PortRecord>& sortedUsed);

    /**
     * @brief Runs a full aggregation pass over raw source data.
     * @param containers Containers from the container source (may be empty).
     * @param sockets Listening sockets from the system source (may be empty).
     * @return Merged records and gaps.
     */
    [[nodiscard]] AggregationResult aggregate(const std::vector<ContainerInfo>& containers,
                                              const std::vector<ListeningSocket>& sockets) const;

    /**
     * @brief Runs merge and gap computation over prepared candidates.
     * @param candidates Candidates from any source.
     * @return Merged records and gaps.
     */
    static AggregationResult aggregate(const std::vector<PortRecord>& candidates);

    /**
     * @brief Decides whether a candidate should replace the current winner.
     * @param candidate Challenger.
     * @param current Current winner for the same key.
     * @return True if candidate ranks strictly higher.
     */
    static bool outranks(const PortRecord& candidate, const PortRecord& current);

private:
    HeuristicPortExtractor extractor_;
};

} // namespace dockports::core
