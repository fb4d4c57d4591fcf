/**
 * @file HiddenPortEntry.hpp
 * @brief Persisted hidden port entries and hide/unhide request targets.
 */

#pragma once

#include "core/types/PortRecord.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dockports::core {

/**
 * @brief A hidden single port or inclusive port range for one protocol.
 *
 * A single port is stored as a range with start == end.
 */
struct HiddenPortEntry {
    Protocol protocol{Protocol::Tcp}; ///< Protocol the entry applies to
    uint16_t start{0};                ///< First hidden port
    uint16_t end{0};                  ///< Last hidden port (inclusive)

    [[nodiscard]] bool isRange() const { return end > start; }
    [[nodiscard]] uint32_t count() const { return static_cast<uint32_t>(end) - start + 1; }
    [[nodiscard]] bool contains(uint16_t port) const { return port >= start && port <= end; }

    bool operator==(const HiddenPortEntry& other) const = default;
};

/**
 * @brief An unvalidated hide/unhide target as received from a caller.
 *
 * Values are kept wide so that out-of-range input can be reported rather
 * than silently truncated.
 */
struct PortSpec {
    long long start{0};                 ///< First port
    long long end{0};                   ///< Last port (inclusive)
    std::optional<Protocol> protocol;   ///< Target protocol, nullopt means tcp and udp
    std::string raw;                    ///< Original input, used in error reports

    /**
     * @brief Creates a spec for a single port.
     * @param port Port number.
     * @param protocol Optional protocol, both when omitted.
     * @return The port spec.
     */
    static PortSpec single(long long port, std::optional<Protocol> protocol = std::nullopt) {
        return PortSpec{port, port, protocol, std::to_string(port)};
    }

    /**
     * @brief Creates a spec for an inclusive range.
     * @param first First port.
     * @param last Last port.
     * @param protocol Optional protocol, both when omitted.
     * @return The port spec.
     */
    static PortSpec range(long long first, long long last,
                          std::optional<Protocol> protocol = std::nullopt) {
        return PortSpec{first, last, protocol,
                        std::to_string(first) + "-" + std::to_string(last)};
    }

    /**
     * @brief Checks both bounds are valid ports and in order.
     * @return True if the port range can be applied.
     */
    [[nodiscard]] bool isValid() const {
        return isValidPort(start) && isValidPort(end) && start <= end;
    }
};

} // namespace dockports::core
