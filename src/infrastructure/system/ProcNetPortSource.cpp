#include "infrastructure/system/ProcNetPortSource.hpp"

#include "core/types/Errors.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>

namespace dockports::infra {

namespace {

struct SocketTable {
    const char* file;
    core::Protocol protocol;
    bool ipv6;
};

constexpr std::array<SocketTable, 4> kTables = {{
    {"tcp", core::Protocol::Tcp, false},
    {"tcp6", core::Protocol::Tcp, true},
    {"udp", core::Protocol::Udp, false},
    {"udp6", core::Protocol::Udp, true},
}};

bool isHex(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

bool isNumeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

// Splits "0100007F:1F90" into address and port.
bool splitEndpoint(const std::string& endpoint, std::string& address, uint16_t& port) {
    auto colon = endpoint.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    address = endpoint.substr(0, colon);
    auto portHex = endpoint.substr(colon + 1);
    if (!isHex(address) || !isHex(portHex) || portHex.size() > 4) {
        return false;
    }
    port = static_cast<uint16_t>(std::stoul(portHex, nullptr, 16));
    return true;
}

} // namespace

ProcNetPortSource::ProcNetPortSource(std::filesystem::path procRoot, bool resolveProcessNames)
    : procRoot_(std::move(procRoot)), resolveProcessNames_(resolveProcessNames) {}

std::vector<core::ListeningSocket> ProcNetPortSource::listListeningSockets() {
    std::map<std::pair<uint16_t, core::Protocol>, core::ListeningSocket> sockets;
    std::map<std::pair<uint16_t, core::Protocol>, unsigned long> inodes;
    int tablesRead = 0;

    for (const auto& table : kTables) {
        auto path = procRoot_ / "net" / table.file;
        std::ifstream file(path);
        if (!file) {
            spdlog::debug("Socket table {} not readable", path.string());
            continue;
        }
        ++tablesRead;

        std::string line;
        std::getline(file, line); // header
        while (std::getline(file, line)) {
            auto entry = parseLine(line, table.ipv6);
            if (!entry || entry->localPort == 0) {
                continue;
            }

            bool listening = table.protocol == core::Protocol::Tcp ? entry->state == kTcpListen
                                                                   : entry->remotePort == 0;
            if (!listening) {
                continue;
            }

            auto key = std::make_pair(entry->localPort, table.protocol);
            if (sockets.contains(key)) {
                continue;
            }

            core::ListeningSocket socket;
            socket.port = entry->localPort;
            socket.protocol = table.protocol;
            socket.address = entry->localAddress;
            socket.ipv6 = table.ipv6;
            sockets.emplace(key, std::move(socket));
            inodes.emplace(key, entry->inode);
        }
    }

    if (tablesRead == 0) {
        throw core::ScanUnavailable("no socket table readable under " +
                                    (procRoot_ / "net").string());
    }

    if (resolveProcessNames_ && !sockets.empty()) {
        auto processes = mapInodesToProcesses();
        for (auto& [key, socket] : sockets) {
            auto it = processes.find(inodes[key]);
            if (it != processes.end()) {
                socket.processName = it->second;
            }
        }
    }

    std::vector<core::ListeningSocket> result;
    result.reserve(sockets.size());
    for (auto& [key, socket] : sockets) {
        result.push_back(std::move(socket));
    }

    spdlog::debug("Socket scan found {} listening endpoints in {} tables", result.size(),
                  tablesRead);
    return result;
}

std::optional<ProcNetEntry> ProcNetPortSource::parseLine(const std::string& line, bool ipv6) {
    // sl local_address rem_address st tx_queue:rx_queue tr:tm->when retrnsmt uid timeout inode
    std::istringstream stream(line);
    std::string slot, local, remote, state, queues, timer, retransmits, uid, timeout, inode;
    if (!(stream >> slot >> local >> remote >> state >> queues >> timer >> retransmits >> uid >>
          timeout >> inode)) {
        return std::nullopt;
    }
    if (slot.empty() || slot.back() != ':') {
        return std::nullopt;
    }

    ProcNetEntry entry;
    std::string localHex, remoteHex;
    if (!splitEndpoint(local, localHex, entry.localPort) ||
        !splitEndpoint(remote, remoteHex, entry.remotePort) || !isHex(state) || !isNumeric(inode)) {
        return std::nullopt;
    }

    auto address = decodeAddress(localHex, ipv6);
    if (!address) {
        return std::nullopt;
    }
    entry.localAddress = *address;
    entry.state = static_cast<int>(std::stoul(state, nullptr, 16));
    entry.inode = std::stoul(inode);
    return entry;
}

std::optional<std::string> ProcNetPortSource::decodeAddress(const std::string& hex, bool ipv6) {
    size_t expected = ipv6 ? 32 : 8;
    if (hex.size() != expected || !isHex(hex)) {
        return std::nullopt;
    }

    // The kernel prints each 32-bit word in host byte order
    std::array<uint32_t, 4> words{};
    for (size_t i = 0; i < expected / 8; ++i) {
        words[i] = static_cast<uint32_t>(std::stoul(hex.substr(i * 8, 8), nullptr, 16));
    }

    char buffer[INET6_ADDRSTRLEN] = {};
    if (ipv6) {
        in6_addr addr{};
        std::memcpy(&addr, words.data(), sizeof(addr));
        if (!inet_ntop(AF_INET6, &addr, buffer, sizeof(buffer))) {
            return std::nullopt;
        }
    } else {
        in_addr addr{};
        addr.s_addr = words[0];
        if (!inet_ntop(AF_INET, &addr, buffer, sizeof(buffer))) {
            return std::nullopt;
        }
    }
    return std::string(buffer);
}

std::unordered_map<unsigned long, std::string> ProcNetPortSource::mapInodesToProcesses() const {
    std::unordered_map<unsigned long, std::string> processes;
    std::error_code ec;

    // Processes may exit during the walk
    std::filesystem::directory_iterator pids(procRoot_, ec);
    for (; !ec && pids != std::filesystem::directory_iterator(); pids.increment(ec)) {
        auto pid = pids->path().filename().string();
        if (!isNumeric(pid)) {
            continue;
        }

        std::string comm;
        {
            std::ifstream commFile(pids->path() / "comm");
            if (!commFile || !std::getline(commFile, comm) || comm.empty()) {
                continue;
            }
        }

        std::error_code fdEc;
        std::filesystem::directory_iterator fds(pids->path() / "fd", fdEc);
        for (; !fdEc && fds != std::filesystem::directory_iterator(); fds.increment(fdEc)) {
            std::error_code linkEc;
            auto target = std::filesystem::read_symlink(fds->path(), linkEc).string();
            if (linkEc || target.rfind("socket:[", 0) != 0 || target.back() != ']') {
                continue;
            }
            auto inode = target.substr(8, target.size() - 9);
            if (isNumeric(inode)) {
                processes.emplace(std::stoul(inode), comm);
            }
        }
    }

    if (ec) {
        spdlog::debug("Cannot enumerate processes under {}: {}", procRoot_.string(), ec.message());
    }
    return processes;
}

} // namespace dockports::infra
