/**
 * @file ListeningSocket.hpp
 * @brief A listening endpoint observed in the host socket tables.
 */

#pragma once

#include "core/types/PortRecord.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dockports::core {

struct ListeningSocket {
    uint16_t port{0};                        ///< Local port
    Protocol protocol{Protocol::Tcp};        ///< Transport protocol
    std::string address;                     ///< Local address in textual form
    bool ipv6{false};                        ///< Read from an IPv6 table
    std::optional<std::string> processName;  ///< Owning process, if resolved

    bool operator==(const ListeningSocket& other) const = default;
};

} // namespace dockports::core
