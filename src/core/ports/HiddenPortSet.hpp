/**
 * @file HiddenPortSet.hpp
 * @brief Normalized set of hidden ports and port ranges per protocol.
 */

#pragma once

#include "core/types/GapRange.hpp"
#include "core/types/HiddenPortEntry.hpp"
#include "core/types/PortRecord.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <vector>

namespace dockports::core {

/**
 * @brief Value type holding hidden (port range, protocol) entries.
 *
 * The set is always normalized: per protocol, ranges are disjoint and never
 * adjacent. Every mutation coalesces or splits ranges so that the entry count
 * stays minimal.
 */
class HiddenPortSet {
public:
    HiddenPortSet() = default;

    /**
     * @brief Builds a normalized set from arbitrary entries.
     * @param entries Entries that may overlap or touch.
     */
    explicit HiddenPortSet(const std::vector<HiddenPortEntry>& entries);

    /**
     * @brief Hides an inclusive port range.
     * @param protocol Target protocol.
     * @param start First port.
     * @param end Last port.
     * @return Number of ports that were not hidden before.
     */
    uint32_t add(Protocol protocol, uint16_t start, uint16_t end);

    /**
     * @brief Unhides an inclusive port range, splitting ranges as needed.
     * @param protocol Target protocol.
     * @param start First port.
     * @param end Last port.
     * @return Number of ports that were hidden before.
     */
    uint32_t remove(Protocol protocol, uint16_t start, uint16_t end);

    /**
     * @brief Checks whether a port is hidden.
     * @param port Port number.
     * @param protocol Protocol.
     * @return True if the port is covered by an entry.
     */
    [[nodiscard]] bool contains(uint16_t port, Protocol protocol) const;

    /**
     * @brief Returns the hidden sub-ranges that fall within [start, end].
     * @param protocol Protocol.
     * @param start First port of the window.
     * @param end Last port of the window.
     * @return Clipped hidden ranges in ascending order.
     */
    [[nodiscard]] std::vector<GapRange> hiddenWithin(Protocol protocol, uint16_t start,
                                                     uint16_t end) const;

    /**
     * @brief Returns all entries ordered by start port, then protocol.
     * @return Normalized entries.
     */
    [[nodiscard]] std::vector<HiddenPortEntry> entries() const;

    /**
     * @brief Returns the entries of one protocol in ascending order.
     * @param protocol Protocol.
     * @return Normalized entries.
     */
    [[nodiscard]] std::vector<HiddenPortEntry> entries(Protocol protocol) const;

    /**
     * @brief Counts hidden ports of one protocol.
     * @param protocol Protocol.
     * @return Number of hidden ports.
     */
    [[nodiscard]] uint32_t portCount(Protocol protocol) const;

    [[nodiscard]] size_t size() const { return ranges_[0].size() + ranges_[1].size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

    bool operator==(const HiddenPortSet& other) const = default;

private:
    using RangeMap = std::map<uint16_t, uint16_t>; // start -> inclusive end

    RangeMap& rangesFor(Protocol protocol) { return ranges_[static_cast<size_t>(protocol)]; }
    const RangeMap& rangesFor(Protocol protocol) const {
        return ranges_[static_cast<size_t>(protocol)];
    }

    std::array<RangeMap, 2> ranges_;
};

} // namespace dockports::core
