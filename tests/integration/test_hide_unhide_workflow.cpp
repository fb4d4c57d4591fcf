#include <catch2/catch_test_macros.hpp>

#include "core/ports/ServiceCatalog.hpp"
#include "infrastructure/api/RestApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/inventory/PortInventoryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/storage/HiddenPortStore.hpp"
#include "infrastructure/system/ProcNetPortSource.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace dockports::core;
using namespace dockports::infra;

namespace {

// Home Assistant style container sharing the host network namespace.
class HostNetworkContainerSource : public IContainerPortSource {
public:
    std::vector<ContainerInfo> listRunningContainers() override {
        ContainerInfo ha;
        ha.id = "c0ffee000001";
        ha.name = "homeassistant";
        ha.image = "ghcr.io/home-assistant/home-assistant:stable";
        ha.networkMode = "host";
        ha.exposedPorts = {"8123/tcp"};
        ha.env = {"TZ=UTC", "MQTT_PORT=1883"};
        return {ha};
    }
};

class WorkflowEnvironment {
public:
    WorkflowEnvironment()
        : root_(std::filesystem::temp_directory_path() / "dockports_workflow_test") {
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "proc" / "net");
        std::filesystem::create_directories(root_ / "config");

        std::ofstream tcp(root_ / "proc" / "net" / "tcp");
        tcp << "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  "
               "timeout inode\n";
        tcp << row(0, "00000000:0016", 2001) << "\n";
        tcp << row(1, "00000000:1FBB", 2002) << "\n";
        tcp << row(2, "00000000:0CEA", 2003) << "\n";

        auto pid = root_ / "proc" / "4242";
        std::filesystem::create_directories(pid / "fd");
        std::ofstream(pid / "comm") << "python3\n";
        std::filesystem::create_symlink("socket:[2002]", pid / "fd" / "7");
    }

    ~WorkflowEnvironment() { std::filesystem::remove_all(root_); }

    std::filesystem::path procRoot() const { return root_ / "proc"; }
    std::filesystem::path configDir() const { return root_ / "config"; }

private:
    static std::string row(int slot, const std::string& local, unsigned long inode) {
        return "   " + std::to_string(slot) + ": " + local +
               " 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 " +
               std::to_string(inode) + " 1 0000000000000000 100 0 0 10 0";
    }

    std::filesystem::path root_;
};

// One running instance of the service on top of the environment.
struct Service {
    explicit Service(const WorkflowEnvironment& env)
        : config(env.configDir()), workers(2), serverContext(2) {
        config.load();
        store = std::make_unique<HiddenPortStore>(config.hiddenPortsPath());
        catalog = std::make_unique<ServiceCatalog>(config.config().serviceNames);
        workers.start();
        serverContext.start();

        inventory = std::make_unique<PortInventoryService>(
            workers, std::make_shared<HostNetworkContainerSource>(),
            std::make_shared<ProcNetPortSource>(env.procRoot(), true), *store, *catalog);
        server = std::make_shared<RestApiServer>(serverContext, *inventory, *store, *catalog, config,
                                                 "127.0.0.1", 0);
    }

    ~Service() {
        server->stop();
        serverContext.stop();
        workers.stop();
    }

    nlohmann::json call(HttpMethod method, const std::string& path, const std::string& body = "") {
        ApiRequest request;
        request.method = method;
        request.path = path;
        request.body = body;
        auto response = server->dispatch(request);
        REQUIRE(response.statusCode == 200);
        return nlohmann::json::parse(response.body)["data"];
    }

    ConfigManager config;
    AsioContext workers;
    AsioContext serverContext;
    std::unique_ptr<HiddenPortStore> store;
    std::unique_ptr<ServiceCatalog> catalog;
    std::unique_ptr<PortInventoryService> inventory;
    std::shared_ptr<RestApiServer> server;
};

const nlohmann::json* findPort(const nlohmann::json& entries, int port) {
    for (const auto& entry : entries) {
        if (entry["type"] == "port" && entry["port"] == port) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

TEST_CASE("Host-network container ports are attributed", "[Integration]") {
    WorkflowEnvironment env;
    Service service(env);

    auto data = service.call(HttpMethod::GET, "/api/ports");
    const auto& ports = data["ports"];

    const auto* ssh = findPort(ports, 22);
    REQUIRE(ssh != nullptr);
    REQUIRE((*ssh)["source"] == "system");

    const auto* ha = findPort(ports, 8123);
    REQUIRE(ha != nullptr);
    REQUIRE((*ha)["source"] == "container");
    REQUIRE((*ha)["container_name"] == "homeassistant");
    REQUIRE((*ha)["detection_method"] == "exposed-ports-config");
    REQUIRE((*ha)["host_network"] == true);
    REQUIRE((*ha)["process_name"] == "python3");

    const auto* mqtt = findPort(ports, 1883);
    REQUIRE(mqtt != nullptr);
    REQUIRE((*mqtt)["detection_method"] == "env-var-scan");

    REQUIRE(findPort(ports, 3306) != nullptr);
    REQUIRE(data["degraded"] == false);
}

TEST_CASE("Hidden ports survive a restart", "[Integration]") {
    WorkflowEnvironment env;

    {
        Service service(env);
        service.call(HttpMethod::POST, "/api/hidden-ports", R"({"port": 3306, "protocol": "tcp"})");
        service.call(HttpMethod::POST, "/api/hidden-ports/batch",
                     R"({"ports": [{"start": 20000, "end": 20099}]})");

        auto data = service.call(HttpMethod::GET, "/api/ports");
        REQUIRE(findPort(data["ports"], 3306) == nullptr);
        REQUIRE(data["hidden_ports"].size() == 1);
        REQUIRE(data["summary"]["total_virtual_hidden"] == 200);
    }

    {
        Service service(env);
        auto hidden = service.call(HttpMethod::GET, "/api/hidden-ports");
        REQUIRE(hidden["entries"].size() == 3);

        auto data = service.call(HttpMethod::GET, "/api/ports");
        REQUIRE(findPort(data["ports"], 3306) == nullptr);
        REQUIRE(data["hidden_ports"][0]["port"] == 3306);

        service.call(HttpMethod::DELETE, "/api/hidden-ports", R"({"port": 3306})");
        service.call(HttpMethod::DELETE, "/api/hidden-ports/batch",
                     R"({"ports": [{"start": 20000, "end": 20099}]})");

        data = service.call(HttpMethod::GET, "/api/ports");
        REQUIRE(findPort(data["ports"], 3306) != nullptr);
        REQUIRE(data["hidden_ports"].empty());
        REQUIRE(data["summary"]["total_virtual_hidden"] == 0);
    }

    Service restarted(env);
    REQUIRE(restarted.store->list().empty());
}

TEST_CASE("Service names apply to the listing", "[Integration]") {
    WorkflowEnvironment env;

    {
        Service service(env);
        service.call(HttpMethod::POST, "/api/config", R"({"port": 3306, "service_name": "MariaDB"})");
    }

    Service restarted(env);
    auto data = restarted.call(HttpMethod::GET, "/api/ports");
    const auto* db = findPort(data["ports"], 3306);
    REQUIRE(db != nullptr);
    REQUIRE((*db)["service_name"] == "MariaDB");
}
