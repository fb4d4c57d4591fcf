#include "app/Application.hpp"

#include "infrastructure/docker/DockerContainerSource.hpp"
#include "infrastructure/system/ProcNetPortSource.hpp"

#include <asio.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <string>
#include <vector>

namespace dockports::app {

namespace {

constexpr const char* kVersion = "1.0.0";
constexpr const char* kDefaultConfigDir = "/app/config";

} // namespace

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (restApiServer_) {
        restApiServer_->stop();
    }

    if (serverContext_) {
        serverContext_->stop();
    }

    if (workerContext_) {
        workerContext_->stop();
    }
}

std::filesystem::path Application::resolveConfigDir(int argc, char** argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config-dir") {
            return argv[i + 1];
        }
    }

    if (const char* env = std::getenv("DOCKPORTS_CONFIG_DIR"); env && *env) {
        return env;
    }
    return kDefaultConfigDir;
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    auto level = spdlog::level::from_str(cfg.logLevel);

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (cfg.logToFile) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config_->logPath().string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("dockports", sinks.begin(), sinks.end());
    logger->set_level(std::min(level, spdlog::level::debug));
    spdlog::set_default_logger(logger);

    spdlog::info("DockPorts {} starting...", kVersion);
    spdlog::info("Configuration directory: {}", config_->configDir());
    if (cfg.logToFile) {
        spdlog::info("Log file: {}", config_->logPath().string());
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Source queries block, so they get a pool of their own
    workerContext_ =
        std::make_unique<infra::AsioContext>(static_cast<size_t>(cfg.workerThreads), "workers");
    workerContext_->start();

    // HTTP handlers; listings block on source queries
    serverContext_ =
        std::make_unique<infra::AsioContext>(static_cast<size_t>(cfg.apiThreads), "api");
    serverContext_->start();

    // Hidden ports
    hiddenPorts_ = std::make_unique<infra::HiddenPortStore>(config_->hiddenPortsPath());

    // Service names
    catalog_ = std::make_unique<core::ServiceCatalog>(cfg.serviceNames);

    // Port sources
    std::shared_ptr<core::IContainerPortSource> containers;
    if (cfg.dockerEnabled) {
        containers = std::make_shared<infra::DockerContainerSource>(
            cfg.dockerSocket, std::chrono::milliseconds(cfg.dockerTimeoutMs));
        spdlog::info("Container runtime: {}", cfg.dockerSocket);
    } else {
        spdlog::info("Container runtime disabled");
    }

    auto system = std::make_shared<infra::ProcNetPortSource>(cfg.procRoot, cfg.resolveProcessNames);

    infra::InventoryOptions options;
    options.containerTimeout = std::chrono::milliseconds(cfg.dockerTimeoutMs);
    options.systemTimeout = std::chrono::milliseconds(cfg.systemTimeoutMs);
    inventory_ = std::make_unique<infra::PortInventoryService>(
        *workerContext_, std::move(containers), std::move(system), *hiddenPorts_, *catalog_, options);

    // REST API server
    restApiServer_ = std::make_shared<infra::RestApiServer>(*serverContext_, *inventory_,
                                                            *hiddenPorts_, *catalog_, *config_,
                                                            cfg.listenAddress, cfg.listenPort);
    restApiServer_->setApiKey(cfg.apiKey);
    restApiServer_->start();

    spdlog::info("Application components initialized");
}

int Application::run() {
    asio::io_context signalContext;
    asio::signal_set signals(signalContext, SIGINT, SIGTERM);

    signals.async_wait([](const asio::error_code& ec, int signal) {
        if (!ec) {
            spdlog::info("Received signal {}, stopping", signal);
        }
    });

    signalContext.run();
    return 0;
}

} // namespace dockports::app
