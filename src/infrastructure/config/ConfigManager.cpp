#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace dockports::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Server
    j["server"]["host"] = config_.listenAddress;
    j["server"]["port"] = config_.listenPort;
    j["server"]["api_key"] = config_.apiKey;
    j["server"]["worker_threads"] = config_.workerThreads;
    j["server"]["api_threads"] = config_.apiThreads;

    // Docker
    j["docker"]["enabled"] = config_.dockerEnabled;
    j["docker"]["socket"] = config_.dockerSocket;
    j["docker"]["timeout_ms"] = config_.dockerTimeoutMs;

    // System scan
    j["system"]["proc_root"] = config_.procRoot;
    j["system"]["timeout_ms"] = config_.systemTimeoutMs;
    j["system"]["resolve_process_names"] = config_.resolveProcessNames;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file_enabled"] = config_.logToFile;

    // Storage
    j["storage"]["hidden_ports_file"] = config_.hiddenPortsFile;

    // Service names, keyed by port
    j["services"] = nlohmann::json::object();
    for (const auto& [port, name] : config_.serviceNames) {
        j["services"][std::to_string(port)] = name;
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // Server
    if (j.contains("server")) {
        const auto& s = j["server"];
        config_.listenAddress = s.value("host", "0.0.0.0");
        config_.listenPort = s.value("port", static_cast<uint16_t>(7577));
        config_.apiKey = s.value("api_key", "");
        config_.workerThreads = s.value("worker_threads", 4);
        config_.apiThreads = s.value("api_threads", 4);
    }

    // Docker
    if (j.contains("docker")) {
        const auto& d = j["docker"];
        config_.dockerEnabled = d.value("enabled", true);
        config_.dockerSocket = d.value("socket", "/var/run/docker.sock");
        config_.dockerTimeoutMs = d.value("timeout_ms", 3000);
    }

    // System scan
    if (j.contains("system")) {
        const auto& s = j["system"];
        config_.procRoot = s.value("proc_root", "/proc");
        config_.systemTimeoutMs = s.value("timeout_ms", 3000);
        config_.resolveProcessNames = s.value("resolve_process_names", true);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", "info");
        config_.logToFile = l.value("file_enabled", true);
    }

    // Storage
    if (j.contains("storage")) {
        config_.hiddenPortsFile = j["storage"].value("hidden_ports_file", "hidden_ports.json");
    }

    // Service names
    config_.serviceNames.clear();
    if (j.contains("services") && j["services"].is_object()) {
        for (const auto& [key, value] : j["services"].items()) {
            if (!value.is_string()) {
                continue;
            }
            try {
                int port = std::stoi(key);
                if (port >= 1 && port <= 65535) {
                    config_.serviceNames[static_cast<uint16_t>(port)] = value.get<std::string>();
                }
            } catch (const std::exception&) {
                spdlog::warn("Ignoring service mapping with invalid port '{}'", key);
            }
        }
    }

    // Flat "name": port pairs as written by earlier releases
    for (const auto& [key, value] : j.items()) {
        if (value.is_number_integer()) {
            int port = value.get<int>();
            if (port >= 1 && port <= 65535 && !config_.serviceNames.contains(port)) {
                config_.serviceNames[static_cast<uint16_t>(port)] = key;
            }
        }
    }
}

std::filesystem::path ConfigManager::hiddenPortsPath() const {
    std::filesystem::path path(config_.hiddenPortsFile);
    return path.is_absolute() ? path : configDir_ / path;
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "dockports.log";
}

} // namespace dockports::infra
