/**
 * @file GapRange.hpp
 * @brief A run of unused ports between two used ports.
 */

#pragma once

#include <cstdint>

namespace dockports::core {

/**
 * @brief A maximal contiguous run of unused port numbers.
 *
 * Derived on every aggregation pass and never persisted.
 */
struct GapRange {
    uint16_t start{0}; ///< First unused port
    uint16_t end{0};   ///< Last unused port (inclusive)

    [[nodiscard]] uint32_t count() const { return static_cast<uint32_t>(end) - start + 1; }
    [[nodiscard]] bool contains(uint16_t port) const { return port >= start && port <= end; }

    bool operator==(const GapRange& other) const = default;
};

} // namespace dockports::core
