#include "core/ports/HeuristicPortExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <set>
#include <utility>

namespace dockports::core {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& parts, size_t from = 0) {
    std::string result;
    for (size_t i = from; i < parts.size(); ++i) {
        if (!result.empty())
            result += ' ';
        result += parts[i];
    }
    return result;
}

// host:port forms: localhost:N, 127.0.0.1:N, 0.0.0.0:N, [::1]:N and bare :N.
// The leading class keeps IPv6 fragments such as "::1" and remote hosts out.
const std::regex& hostPortPattern() {
    static const std::regex pattern(
        R"((?:^|[^:\w\[\.])(?:localhost|127\.0\.0\.1|0\.0\.0\.0|\[::1?\])?:(\d{1,5})(?!\d))",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::vector<std::regex>& flagPatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"((?:^|\s)(?:--port|-p)(?:=|\s+)(\d{1,5})(?!\d))"),
        std::regex(R"((?:^|\s)--listen(?:=|\s+)(?:[\w\.\-]*:)?(\d{1,5})(?!\d))"),
        std::regex(R"((?:^|\s)--bind(?:=|\s+)[\w\.\-\[\]:]*:(\d{1,5})(?!\d))"),
    };
    return patterns;
}

PortRecord makeCandidate(const ContainerInfo& container, uint16_t port, Protocol protocol,
                         DetectionMethod method) {
    PortRecord record;
    record.port = port;
    record.protocol = protocol;
    record.state = PortState::Used;
    record.source = PortSource::Container;
    record.detectionMethod = method;
    record.containerName = container.name;
    record.containerId = container.id;
    record.image = container.image;
    record.containerInternalPort = std::to_string(port) + "/" + protocolToString(protocol);
    record.hostNetwork = container.isHostNetwork();
    return record;
}

// Adds a candidate unless the same (port, protocol) was already found by this step.
void addUnique(std::vector<PortRecord>& out, std::set<std::pair<uint16_t, Protocol>>& seen,
               PortRecord record) {
    if (seen.emplace(record.port, record.protocol).second) {
        out.push_back(std::move(record));
    }
}

void collectMatches(const std::string& text, const std::regex& pattern,
                    const ContainerInfo& container, DetectionMethod method,
                    std::vector<PortRecord>& out, std::set<std::pair<uint16_t, Protocol>>& seen) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        auto port = HeuristicPortExtractor::parsePort((*it)[1].str());
        if (port) {
            addUnique(out, seen, makeCandidate(container, *port, Protocol::Tcp, method));
        }
    }
}

} // namespace

HeuristicPortExtractor::HeuristicPortExtractor()
    : steps_{{DetectionMethod::ExposedPortsConfig, &HeuristicPortExtractor::fromExposedPorts},
             {DetectionMethod::HealthcheckParse, &HeuristicPortExtractor::fromHealthcheck},
             {DetectionMethod::EntrypointParse, &HeuristicPortExtractor::fromEntrypoint},
             {DetectionMethod::EnvVarScan, &HeuristicPortExtractor::fromEnvironment}} {}

std::vector<PortRecord> HeuristicPortExtractor::extract(const ContainerInfo& container) const {
    std::vector<PortRecord> candidates;
    for (const auto& step : steps_) {
        auto found = step.extract(container);
        candidates.insert(candidates.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }
    return candidates;
}

std::vector<PortRecord> HeuristicPortExtractor::fromExposedPorts(const ContainerInfo& container) {
    std::vector<PortRecord> result;
    std::set<std::pair<uint16_t, Protocol>> seen;

    for (const auto& spec : container.exposedPorts) {
        auto slash = spec.find('/');
        auto port = parsePort(spec.substr(0, slash));
        if (!port) {
            continue;
        }

        Protocol protocol = Protocol::Tcp;
        if (slash != std::string::npos) {
            auto parsed = protocolFromString(spec.substr(slash + 1));
            if (!parsed) {
                continue; // sctp and friends
            }
            protocol = *parsed;
        }

        addUnique(result, seen,
                  makeCandidate(container, *port, protocol, DetectionMethod::ExposedPortsConfig));
    }
    return result;
}

std::vector<PortRecord> HeuristicPortExtractor::fromHealthcheck(const ContainerInfo& container) {
    std::vector<PortRecord> result;
    if (container.healthcheck.empty()) {
        return result;
    }

    const auto& kind = container.healthcheck.front();
    if (kind == "NONE") {
        return result;
    }
    size_t from = (kind == "CMD" || kind == "CMD-SHELL") ? 1 : 0;
    std::string text = join(container.healthcheck, from);

    std::set<std::pair<uint16_t, Protocol>> seen;
    collectMatches(text, hostPortPattern(), container, DetectionMethod::HealthcheckParse, result,
                   seen);
    return result;
}

std::vector<PortRecord> HeuristicPortExtractor::fromEntrypoint(const ContainerInfo& container) {
    std::vector<PortRecord> result;

    std::vector<std::string> args = container.entrypoint;
    args.insert(args.end(), container.cmd.begin(), container.cmd.end());
    if (args.empty()) {
        return result;
    }
    std::string text = join(args);

    std::set<std::pair<uint16_t, Protocol>> seen;
    for (const auto& pattern : flagPatterns()) {
        collectMatches(text, pattern, container, DetectionMethod::EntrypointParse, result, seen);
    }
    collectMatches(text, hostPortPattern(), container, DetectionMethod::EntrypointParse, result,
                   seen);
    return result;
}

std::vector<PortRecord> HeuristicPortExtractor::fromEnvironment(const ContainerInfo& container) {
    std::vector<PortRecord> result;
    std::set<std::pair<uint16_t, Protocol>> seen;

    for (const auto& variable : container.env) {
        auto eq = variable.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string name = variable.substr(0, eq);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        // HTTP_PORT and LISTEN_PORT are covered by the PORT substring
        if (name.find("PORT") == std::string::npos) {
            continue;
        }

        auto port = parsePort(variable.substr(eq + 1));
        if (port) {
            addUnique(result, seen,
                      makeCandidate(container, *port, Protocol::Tcp, DetectionMethod::EnvVarScan));
        }
    }
    return result;
}

std::optional<uint16_t> HeuristicPortExtractor::parsePort(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    long long port = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (ec != std::errc() || ptr != value.data() + value.size() || !isValidPort(port)) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

} // namespace dockports::core
