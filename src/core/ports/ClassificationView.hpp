/**
 * @file ClassificationView.hpp
 * @brief Overlays the hidden port set onto an aggregation result.
 *
 * The view assigns the final used/available/hidden/virtual-hidden state to
 * every (port, protocol) pair without enumerating the port space. It is a
 * pure function of one aggregation result and one hidden set snapshot.
 */

#pragma once

#include "core/ports/HiddenPortSet.hpp"
#include "core/ports/PortAggregator.hpp"
#include "core/types/GapRange.hpp"
#include "core/types/HiddenPortEntry.hpp"
#include "core/types/PortRecord.hpp"

#include <memory>
#include <vector>

namespace dockports::core {

/**
 * @brief An element of the default listing.
 *
 * Either a visible used record or an unused segment. Unused segments are
 * split at hidden range boundaries so that each segment has a uniform state
 * per protocol.
 */
struct ViewEntry {
    enum class Kind { Port, Gap };

    Kind kind{Kind::Port};  ///< Which member is meaningful
    PortRecord record;      ///< Visible used record (Kind::Port)
    GapRange range;         ///< Unused segment (Kind::Gap)
    bool tcpHidden{false};  ///< Segment is hidden on tcp (Kind::Gap)
    bool udpHidden{false};  ///< Segment is hidden on udp (Kind::Gap)

    /**
     * @brief State of the segment for one protocol.
     * @param protocol Protocol.
     * @return VirtualHidden or Available for gaps, the record state for ports.
     */
    [[nodiscard]] PortState stateFor(Protocol protocol) const;

    /**
     * @brief State shown for the entry as a whole.
     *
     * A gap counts as virtual-hidden only if it is hidden on both protocols.
     */
    [[nodiscard]] PortState displayState() const;
};

/**
 * @brief Per-protocol partition counts over the full 1-65535 space.
 */
struct ProtocolSummary {
    uint32_t used{0};          ///< Visible used ports
    uint32_t available{0};     ///< Unused, not hidden
    uint32_t hidden{0};        ///< Used and hidden
    uint32_t virtualHidden{0}; ///< Unused and hidden
};

/**
 * @brief Final classified port view.
 */
class ClassificationView {
public:
    /**
     * @brief Classifies an aggregation result against a hidden set snapshot.
     * @param aggregation Output of PortAggregator.
     * @param hidden Committed hidden set snapshot, may be null for "nothing hidden".
     * @return The classified view.
     */
    static ClassificationView classify(const AggregationResult& aggregation,
                                       std::shared_ptr<const HiddenPortSet> hidden);

    /**
     * @brief Default listing: visible used records and unused segments in port order.
     */
    const std::vector<ViewEntry>& entries() const { return entries_; }

    /**
     * @brief Used records whose (port, protocol) is hidden, ascending.
     */
    const std::vector<PortRecord>& hiddenRecords() const { return hiddenRecords_; }

    /**
     * @brief Hidden ranges that cover no used record, per protocol.
     */
    const std::vector<HiddenPortEntry>& virtualHidden() const { return virtualHidden_; }

    /**
     * @brief All used records, hidden or not, with their final state.
     */
    const std::vector<PortRecord>& records() const { return records_; }

    /**
     * @brief Classifies any port on demand.
     * @param port Port number (1-65535).
     * @param protocol Protocol.
     * @return Exactly one of Used, Available, Hidden, VirtualHidden.
     */
    [[nodiscard]] PortState stateOf(uint16_t port, Protocol protocol) const;

    /**
     * @brief Returns partition counts for one protocol.
     * @param protocol Protocol.
     * @return Counts whose sum is 65535.
     */
    [[nodiscard]] ProtocolSummary summary(Protocol protocol) const;

    /**
     * @brief Counts distinct port numbers used on any protocol, hidden included.
     */
    [[nodiscard]] size_t distinctUsedPorts() const { return distinctUsedPorts_; }

    /**
     * @brief Counts distinct containers owning at least one used record.
     */
    [[nodiscard]] size_t containerCount() const;

private:
    ClassificationView() = default;

    std::vector<ViewEntry> entries_;
    std::vector<PortRecord> records_;
    std::vector<PortRecord> hiddenRecords_;
    std::vector<HiddenPortEntry> virtualHidden_;
    std::shared_ptr<const HiddenPortSet> hidden_;
    size_t distinctUsedPorts_{0};
};

} // namespace dockports::core
