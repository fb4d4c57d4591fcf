#pragma once

#include "core/ports/ServiceCatalog.hpp"
#include "infrastructure/api/RestApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/inventory/PortInventoryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/storage/HiddenPortStore.hpp"

#include <filesystem>
#include <memory>

namespace dockports::app {

/**
 * @brief Wires the configuration, port sources, hidden store and REST API together.
 */
class Application {
public:
    /**
     * @brief Builds all components from the configuration in configDir.
     * @param configDir Directory holding config.json, the hidden port file and the log.
     * @throws std::exception if a component cannot be initialized.
     */
    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Serves requests until SIGINT or SIGTERM.
     * @return Process exit code.
     */
    int run();

    /**
     * @brief Resolves the configuration directory.
     *
     * Uses "--config-dir <path>" when given, else DOCKPORTS_CONFIG_DIR, else /app/config.
     *
     * @param argc Argument count.
     * @param argv Arguments.
     * @return Configuration directory.
     */
    static std::filesystem::path resolveConfigDir(int argc, char** argv);

    infra::ConfigManager& config() { return *config_; }
    infra::HiddenPortStore& hiddenPorts() { return *hiddenPorts_; }
    infra::PortInventoryService& inventory() { return *inventory_; }

private:
    void initializeLogging();
    void initializeComponents();

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> workerContext_;
    std::unique_ptr<infra::AsioContext> serverContext_;
    std::unique_ptr<infra::HiddenPortStore> hiddenPorts_;
    std::unique_ptr<core::ServiceCatalog> catalog_;
    std::unique_ptr<infra::PortInventoryService> inventory_;
    std::shared_ptr<infra::RestApiServer> restApiServer_;
};

} // namespace dockports::app
