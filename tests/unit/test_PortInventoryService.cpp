#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/inventory/PortInventoryService.hpp"

#include <filesystem>
#include <thread>

using namespace dockports::core;
using namespace dockports::infra;

namespace {

class FakeContainerSource : public IContainerPortSource {
public:
    std::vector<ContainerInfo> containers;
    bool fail{false};
    std::chrono::milliseconds delay{0};

    std::vector<ContainerInfo> listRunningContainers() override {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            throw RuntimeUnavailable("cannot connect to /var/run/docker.sock");
        }
        return containers;
    }
};

class FakeSystemSource : public ISystemPortSource {
public:
    std::vector<ListeningSocket> sockets;
    bool fail{false};

    std::vector<ListeningSocket> listListeningSockets() override {
        if (fail) {
            throw ScanUnavailable("no socket table readable under /proc/net");
        }
        return sockets;
    }
};

ContainerInfo webContainer() {
    ContainerInfo container;
    container.id = "a1b2c3d4e5f6";
    container.name = "web";
    container.image = "nginx:latest";
    container.networkMode = "bridge";
    container.bindings.push_back({8080, 80, Protocol::Tcp, "0.0.0.0"});
    return container;
}

struct InventoryFixture {
    InventoryFixture()
        : storePath(std::filesystem::temp_directory_path() / "dockports_inventory_test.json"),
          context(2) {
        std::filesystem::remove(storePath);
        store = std::make_unique<HiddenPortStore>(storePath);
        context.start();

        containers->containers.push_back(webContainer());
        system->sockets.push_back({22, Protocol::Tcp, "0.0.0.0", false, std::string("sshd")});
        system->sockets.push_back({8080, Protocol::Tcp, "0.0.0.0", false, std::string("docker-proxy")});
    }

    ~InventoryFixture() {
        context.stop();
        std::filesystem::remove(storePath);
    }

    PortInventoryService service(InventoryOptions options = {}) {
        return PortInventoryService(context, containers, system, *store, catalog, options);
    }

    std::filesystem::path storePath;
    AsioContext context;
    std::unique_ptr<HiddenPortStore> store;
    ServiceCatalog catalog{std::map<uint16_t, std::string>{{8080, "Web UI"}}};
    std::shared_ptr<FakeContainerSource> containers = std::make_shared<FakeContainerSource>();
    std::shared_ptr<FakeSystemSource> system = std::make_shared<FakeSystemSource>();
};

const PortRecord* findRecord(const ClassificationView& view, uint16_t port, Protocol protocol) {
    for (const auto& record : view.records()) {
        if (record.port == port && record.protocol == protocol) {
            return &record;
        }
    }
    return nullptr;
}

} // namespace

TEST_CASE("PortInventoryService merges both sources", "[PortInventoryService]") {
    InventoryFixture fixture;
    auto report = fixture.service().collect();

    REQUIRE_FALSE(report.degraded);
    REQUIRE(report.warnings.empty());
    REQUIRE(report.containersSeen == 1);
    REQUIRE(report.view.records().size() == 2);

    const auto* ssh = findRecord(report.view, 22, Protocol::Tcp);
    REQUIRE(ssh != nullptr);
    REQUIRE(ssh->source == PortSource::System);
    REQUIRE(ssh->serviceName == "SSH");
    REQUIRE(ssh->processName == "sshd");

    const auto* web = findRecord(report.view, 8080, Protocol::Tcp);
    REQUIRE(web != nullptr);
    REQUIRE(web->source == PortSource::Container);
    REQUIRE(web->containerName == "web");
    REQUIRE(web->serviceName == "Web UI");
}

TEST_CASE("PortInventoryService names container ports after the container",
          "[PortInventoryService]") {
    InventoryFixture fixture;
    fixture.catalog.replaceMappings({});

    auto report = fixture.service().collect();

    const auto* web = findRecord(report.view, 8080, Protocol::Tcp);
    REQUIRE(web != nullptr);
    REQUIRE(web->serviceName == "web");

    const auto* ssh = findRecord(report.view, 22, Protocol::Tcp);
    REQUIRE(ssh != nullptr);
    REQUIRE(ssh->serviceName == "SSH");
}

TEST_CASE("PortInventoryService applies the hidden set", "[PortInventoryService]") {
    InventoryFixture fixture;
    fixture.store->hide(22, Protocol::Tcp);
    fixture.store->hideBatch({PortSpec::range(9000, 9010, Protocol::Tcp)});

    auto report = fixture.service().collect();

    REQUIRE(report.view.stateOf(22, Protocol::Tcp) == PortState::Hidden);
    REQUIRE(report.view.stateOf(22, Protocol::Udp) == PortState::Available);
    REQUIRE(report.view.stateOf(8080, Protocol::Tcp) == PortState::Used);
    REQUIRE(report.view.stateOf(9005, Protocol::Tcp) == PortState::VirtualHidden);
    REQUIRE(report.view.hiddenRecords().size() == 1);
}

TEST_CASE("PortInventoryService degrades on source failures", "[PortInventoryService]") {
    InventoryFixture fixture;

    SECTION("Container runtime unavailable") {
        fixture.containers->fail = true;
        auto report = fixture.service().collect();

        REQUIRE(report.degraded);
        REQUIRE(report.warnings.size() == 1);
        REQUIRE(report.warnings[0].find("Container runtime unavailable") != std::string::npos);
        REQUIRE(report.containersSeen == 0);
        REQUIRE(report.view.records().size() == 2);

        const auto* proxy = findRecord(report.view, 8080, Protocol::Tcp);
        REQUIRE(proxy != nullptr);
        REQUIRE(proxy->source == PortSource::System);
    }

    SECTION("System scan unavailable") {
        fixture.system->fail = true;
        auto report = fixture.service().collect();

        REQUIRE(report.degraded);
        REQUIRE(report.warnings[0].find("System port scan unavailable") != std::string::npos);
        REQUIRE(report.view.records().size() == 1);
    }

    SECTION("Both sources unavailable") {
        fixture.containers->fail = true;
        fixture.system->fail = true;
        auto report = fixture.service().collect();

        REQUIRE(report.degraded);
        REQUIRE(report.warnings.size() == 2);
        REQUIRE(report.view.records().empty());
        REQUIRE(report.view.summary(Protocol::Tcp).available == 65535);
    }

    SECTION("Container runtime too slow") {
        fixture.containers->delay = std::chrono::milliseconds(500);
        auto start = std::chrono::steady_clock::now();
        auto report = fixture.service({std::chrono::milliseconds(50), std::chrono::milliseconds(1000)})
                          .collect();
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(report.degraded);
        REQUIRE(report.warnings[0].find("timed out after 50 ms") != std::string::npos);
        REQUIRE(report.view.records().size() == 2);
        REQUIRE(elapsed < std::chrono::milliseconds(450));
    }
}

TEST_CASE("PortInventoryService without sources", "[PortInventoryService]") {
    InventoryFixture fixture;
    PortInventoryService service(fixture.context, nullptr, nullptr, *fixture.store,
                                 fixture.catalog);

    auto report = service.collect();

    REQUIRE_FALSE(report.degraded);
    REQUIRE(report.view.records().empty());
    REQUIRE(report.view.entries().empty());
}

TEST_CASE("PortInventoryService search matching", "[PortInventoryService]") {
    PortRecord record;
    record.port = 8443;
    record.protocol = Protocol::Tcp;
    record.serviceName = "HTTPS Alt";
    record.containerName = std::string("Traefik");
    record.image = std::string("traefik:v3");

    SECTION("Records") {
        REQUIRE(PortInventoryService::matchesSearch(record, ""));
        REQUIRE(PortInventoryService::matchesSearch(record, "844"));
        REQUIRE(PortInventoryService::matchesSearch(record, "TCP"));
        REQUIRE(PortInventoryService::matchesSearch(record, "https"));
        REQUIRE(PortInventoryService::matchesSearch(record, "traefik"));
        REQUIRE(PortInventoryService::matchesSearch(record, "v3"));
        REQUIRE_FALSE(PortInventoryService::matchesSearch(record, "udp"));
        REQUIRE_FALSE(PortInventoryService::matchesSearch(record, "postgres"));
    }

    SECTION("Gaps") {
        ViewEntry gap;
        gap.kind = ViewEntry::Kind::Gap;
        gap.range = GapRange{3001, 4999};

        REQUIRE(PortInventoryService::matchesSearch(gap, "3001-4999"));
        REQUIRE(PortInventoryService::matchesSearch(gap, "available"));
        REQUIRE(PortInventoryService::matchesSearch(gap, "unused"));
        REQUIRE(PortInventoryService::matchesSearch(gap, "4000"));
        REQUIRE_FALSE(PortInventoryService::matchesSearch(gap, "5000"));
        REQUIRE_FALSE(PortInventoryService::matchesSearch(gap, "nginx"));
    }
}
