#pragma once

#include "core/services/ISystemPortSource.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dockports::infra {

/**
 * @brief A parsed row of a /proc/net socket table.
 */
struct ProcNetEntry {
    std::string localAddress; ///< Local address in textual form
    uint16_t localPort{0};    ///< Local port
    uint16_t remotePort{0};   ///< Remote port, 0 for unconnected sockets
    int state{0};             ///< Kernel socket state (0x0A is TCP_LISTEN)
    unsigned long inode{0};   ///< Socket inode
};

/**
 * @brief System port source reading the kernel socket tables under /proc/net.
 *
 * TCP sockets count when they are in LISTEN state; UDP sockets count when
 * they are unconnected (remote port 0). IPv4 and IPv6 entries of the same
 * (port, protocol) are reported once.
 */
class ProcNetPortSource : public core::ISystemPortSource {
public:
    static constexpr int kTcpListen = 0x0A;

    /**
     * @brief Constructs a source for the given proc root.
     * @param procRoot Root of the proc filesystem, normally "/proc".
     * @param resolveProcessNames Map socket inodes to process names.
     */
    explicit ProcNetPortSource(std::filesystem::path procRoot = "/proc",
                               bool resolveProcessNames = true);

    std::vector<core::ListeningSocket> listListeningSockets() override;

    /**
     * @brief Parses one /proc/net/{tcp,tcp6,udp,udp6} line.
     * @param line Table row; the header row yields nullopt.
     * @param ipv6 True if the line comes from an IPv6 table.
     * @return The parsed entry, or nullopt if the line is malformed.
     */
    static std::optional<ProcNetEntry> parseLine(const std::string& line, bool ipv6);

    /**
     * @brief Converts a kernel hex address to text.
     * @param hex Address as printed in /proc/net (host byte order words).
     * @param ipv6 True for a 32 character IPv6 address.
     * @return Textual address, or nullopt if hex is malformed.
     */
    static std::optional<std::string> decodeAddress(const std::string& hex, bool ipv6);

private:
    std::unordered_map<unsigned long, std::string> mapInodesToProcesses() const;

    std::filesystem::path procRoot_;
    bool resolveProcessNames_;
};

} // namespace dockports::infra
