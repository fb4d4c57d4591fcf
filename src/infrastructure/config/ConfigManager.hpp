#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace dockports::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the HTTP server settings, port source settings, logging options
 * and operator-defined service names.
 */
struct AppConfig {
    // HTTP server
    std::string listenAddress{"0.0.0.0"}; ///< Address the REST API binds to.
    uint16_t listenPort{7577};            ///< REST API port.
    std::string apiKey;                   ///< Optional API key, empty disables authentication.
    int workerThreads{4};                 ///< Asio threads running source queries.
    int apiThreads{4};                    ///< Asio threads serving HTTP requests.

    // Container runtime
    bool dockerEnabled{true};                          ///< Query the container runtime.
    std::string dockerSocket{"/var/run/docker.sock"};  ///< Docker Engine UNIX socket.
    int dockerTimeoutMs{3000};                         ///< Container query timeout in milliseconds.

    // Host socket scan
    std::string procRoot{"/proc"};   ///< Root of the proc filesystem.
    int systemTimeoutMs{3000};       ///< Socket scan timeout in milliseconds.
    bool resolveProcessNames{true};  ///< Resolve owning process names.

    // Logging
    std::string logLevel{"info"}; ///< spdlog level name.
    bool logToFile{true};         ///< Also log to a rotating file in the config directory.

    // Storage
    std::string hiddenPortsFile{"hidden_ports.json"}; ///< Hidden port file, relative to the config directory.

    // Service names
    std::map<uint16_t, std::string> serviceNames; ///< Port to service name overrides.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of application configuration from JSON files.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    /**
     * @brief Returns a mutable reference to the configuration.
     * @return Reference to AppConfig.
     */
    AppConfig& config() { return config_; }

    /**
     * @brief Returns a const reference to the configuration.
     * @return Const reference to AppConfig.
     */
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the hidden port state file.
     * @return Absolute or config-relative path of the hidden port file.
     */
    std::filesystem::path hiddenPortsPath() const;

    /**
     * @brief Returns the path to the log file.
     * @return Path to dockports.log.
     */
    std::filesystem::path logPath() const;

    /**
     * @brief Returns the configuration directory path as a string.
     * @return Configuration directory path.
     */
    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace dockports::infra
