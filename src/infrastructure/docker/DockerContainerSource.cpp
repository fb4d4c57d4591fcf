#include "infrastructure/docker/DockerContainerSource.hpp"

#include "core/ports/HeuristicPortExtractor.hpp"
#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>

namespace dockports::infra {

namespace {

constexpr size_t kShortIdLength = 12;

std::string stripSlash(const std::string& name) {
    return !name.empty() && name.front() == '/' ? name.substr(1) : name;
}

// Docker reports Entrypoint/Cmd/Test as an array, a plain string or null.
std::vector<std::string> stringList(const nlohmann::json& j) {
    std::vector<std::string> result;
    if (j.is_string()) {
        result.push_back(j.get<std::string>());
    } else if (j.is_array()) {
        for (const auto& item : j) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

void addBinding(std::vector<core::PortBinding>& bindings, const core::PortBinding& binding) {
    // The daemon lists IPv4 and IPv6 bindings of the same host port separately
    auto duplicate = std::find_if(bindings.begin(), bindings.end(), [&](const auto& existing) {
        return existing.hostPort == binding.hostPort && existing.protocol == binding.protocol;
    });
    if (duplicate == bindings.end()) {
        bindings.push_back(binding);
    }
}

// Parses NetworkSettings.Ports: {"80/tcp": [{"HostIp": "0.0.0.0", "HostPort": "8080"}]}
std::vector<core::PortBinding> parsePortMap(const nlohmann::json& ports) {
    std::vector<core::PortBinding> bindings;
    if (!ports.is_object()) {
        return bindings;
    }

    for (const auto& [key, hostBindings] : ports.items()) {
        if (!hostBindings.is_array()) {
            continue;
        }

        auto slash = key.find('/');
        auto containerPort = core::HeuristicPortExtractor::parsePort(key.substr(0, slash));
        auto protocol = slash == std::string::npos
                            ? std::optional<core::Protocol>(core::Protocol::Tcp)
                            : core::protocolFromString(key.substr(slash + 1));
        if (!containerPort || !protocol) {
            continue;
        }

        for (const auto& hostBinding : hostBindings) {
            if (!hostBinding.is_object()) {
                continue;
            }
            auto hostPort = core::HeuristicPortExtractor::parsePort(hostBinding.value("HostPort", ""));
            if (!hostPort) {
                continue;
            }
            addBinding(bindings,
                       {*hostPort, *containerPort, *protocol, hostBinding.value("HostIp", "")});
        }
    }

    std::sort(bindings.begin(), bindings.end(), [](const auto& a, const auto& b) {
        return std::tie(a.hostPort, a.protocol) < std::tie(b.hostPort, b.protocol);
    });
    return bindings;
}

} // namespace

DockerContainerSource::DockerContainerSource(const std::string& socketPath,
                                             std::chrono::milliseconds timeout)
    : client_(socketPath, timeout) {}

std::vector<core::ContainerInfo> DockerContainerSource::listRunningContainers() {
    auto response = client_.get("/containers/json");
    if (!response.success) {
        throw core::RuntimeUnavailable(response.errorMessage);
    }

    std::vector<core::ContainerInfo> containers;
    try {
        containers = parseContainerList(nlohmann::json::parse(response.body));
    } catch (const nlohmann::json::exception& e) {
        throw core::RuntimeUnavailable(std::string("invalid container list: ") + e.what());
    }

    for (auto& container : containers) {
        auto inspect = client_.get("/containers/" + container.id + "/json");
        if (!inspect.success) {
            spdlog::warn("Failed to inspect container {}: {}", container.name, inspect.errorMessage);
            continue;
        }

        try {
            applyInspect(container, nlohmann::json::parse(inspect.body));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Invalid inspect data for container {}: {}", container.name, e.what());
        }
    }

    spdlog::debug("Docker reported {} running containers", containers.size());
    return containers;
}

std::vector<core::ContainerInfo> DockerContainerSource::parseContainerList(
    const nlohmann::json& list) {
    if (!list.is_array()) {
        throw core::RuntimeUnavailable("container list is not an array");
    }

    std::vector<core::ContainerInfo> containers;
    containers.reserve(list.size());

    for (const auto& item : list) {
        if (!item.is_object()) {
            continue;
        }

        core::ContainerInfo container;
        container.id = item.value("Id", "").substr(0, kShortIdLength);
        container.image = item.value("Image", "");

        if (item.contains("Names") && item["Names"].is_array() && !item["Names"].empty() &&
            item["Names"][0].is_string()) {
            container.name = stripSlash(item["Names"][0].get<std::string>());
        } else {
            container.name = container.id;
        }

        if (item.contains("HostConfig") && item["HostConfig"].is_object()) {
            container.networkMode = item["HostConfig"].value("NetworkMode", "");
        }

        if (item.contains("Ports") && item["Ports"].is_array()) {
            for (const auto& port : item["Ports"]) {
                if (!port.is_object() || !port.contains("PublicPort") ||
                    !port["PublicPort"].is_number_integer()) {
                    continue;
                }
                auto hostPort = port["PublicPort"].get<long long>();
                auto containerPort = port.value("PrivatePort", 0LL);
                auto protocol = core::protocolFromString(port.value("Type", "tcp"));
                if (!core::isValidPort(hostPort) || !core::isValidPort(containerPort) || !protocol) {
                    continue;
                }
                addBinding(container.bindings,
                           {static_cast<uint16_t>(hostPort), static_cast<uint16_t>(containerPort),
                            *protocol, port.value("IP", "")});
            }
        }

        containers.push_back(std::move(container));
    }

    return containers;
}

void DockerContainerSource::applyInspect(core::ContainerInfo& container,
                                         const nlohmann::json& inspect) {
    if (!inspect.is_object()) {
        return;
    }

    if (inspect.contains("Name") && inspect["Name"].is_string()) {
        container.name = stripSlash(inspect["Name"].get<std::string>());
    }

    if (inspect.contains("HostConfig") && inspect["HostConfig"].is_object()) {
        container.networkMode = inspect["HostConfig"].value("NetworkMode", container.networkMode);
    }

    if (inspect.contains("NetworkSettings") && inspect["NetworkSettings"].is_object() &&
        inspect["NetworkSettings"].contains("Ports") &&
        inspect["NetworkSettings"]["Ports"].is_object()) {
        container.bindings = parsePortMap(inspect["NetworkSettings"]["Ports"]);
    }

    if (!inspect.contains("Config") || !inspect["Config"].is_object()) {
        return;
    }
    const auto& config = inspect["Config"];

    container.image = config.value("Image", container.image);

    container.exposedPorts.clear();
    if (config.contains("ExposedPorts") && config["ExposedPorts"].is_object()) {
        for (const auto& [key, value] : config["ExposedPorts"].items()) {
            container.exposedPorts.push_back(key);
        }
    }

    container.healthcheck.clear();
    if (config.contains("Healthcheck") && config["Healthcheck"].is_object() &&
        config["Healthcheck"].contains("Test")) {
        container.healthcheck = stringList(config["Healthcheck"]["Test"]);
    }

    container.entrypoint = config.contains("Entrypoint") ? stringList(config["Entrypoint"])
                                                         : std::vector<std::string>{};
    container.cmd = config.contains("Cmd") ? stringList(config["Cmd"]) : std::vector<std::string>{};
    container.env = config.contains("Env") ? stringList(config["Env"]) : std::vector<std::string>{};
}

} // namespace dockports::infra
