/**
 * @file ISystemPortSource.hpp
 * @brief Interface for enumerating listening sockets on the host.
 */

#pragma once

#include "core/types/ListeningSocket.hpp"

#include <vector>

namespace dockports::core {

/**
 * @brief Source of listening TCP/UDP endpoints on the host.
 */
class ISystemPortSource {
public:
    virtual ~ISystemPortSource() = default;

    /**
     * @brief Lists the listening (port, protocol) pairs on the host.
     * @return One entry per distinct (port, protocol), optionally with process name.
     * @throws ScanUnavailable if the OS introspection facility is absent or denied.
     */
    virtual std::vector<ListeningSocket> listListeningSockets() = 0;
};

} // namespace dockports::core
