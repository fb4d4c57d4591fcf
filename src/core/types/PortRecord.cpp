#include "core/types/PortRecord.hpp"

#include <algorithm>
#include <cctype>

namespace dockports::core {

int PortRecord::confidence() const {
    return confidenceOf(detectionMethod);
}

int confidenceOf(DetectionMethod method) {
    return static_cast<int>(method) + 1;
}

std::string protocolToString(Protocol protocol) {
    switch (protocol) {
    case Protocol::Tcp:
        return "tcp";
    case Protocol::Udp:
        return "udp";
    }
    return "tcp";
}

std::optional<Protocol> protocolFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "tcp" || lower == "tcp6")
        return Protocol::Tcp;
    if (lower == "udp" || lower == "udp6")
        return Protocol::Udp;
    return std::nullopt;
}

std::string portStateToString(PortState state) {
    switch (state) {
    case PortState::Used:
        return "used";
    case PortState::Available:
        return "available";
    case PortState::Hidden:
        return "hidden";
    case PortState::VirtualHidden:
        return "virtual-hidden";
    }
    return "available";
}

std::string portSourceToString(PortSource source) {
    switch (source) {
    case PortSource::None:
        return "none";
    case PortSource::Container:
        return "container";
    case PortSource::System:
        return "system";
    }
    return "none";
}

std::string detectionMethodToString(DetectionMethod method) {
    switch (method) {
    case DetectionMethod::SystemScan:
        return "system-scan";
    case DetectionMethod::EnvVarScan:
        return "env-var-scan";
    case DetectionMethod::EntrypointParse:
        return "entrypoint-parse";
    case DetectionMethod::HealthcheckParse:
        return "healthcheck-parse";
    case DetectionMethod::ExposedPortsConfig:
        return "exposed-ports-config";
    case DetectionMethod::ExplicitBinding:
        return "explicit-binding";
    }
    return "system-scan";
}

} // namespace dockports::core
