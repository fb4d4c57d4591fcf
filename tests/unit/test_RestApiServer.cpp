#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/api/RestApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/inventory/PortInventoryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/storage/HiddenPortStore.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace dockports;

namespace {

class StaticContainerSource : public core::IContainerPortSource {
public:
    std::vector<core::ContainerInfo> listRunningContainers() override {
        core::ContainerInfo web;
        web.id = "0123456789ab";
        web.name = "web";
        web.image = "nginx:latest";
        web.networkMode = "bridge";
        web.bindings.push_back({8080, 80, core::Protocol::Tcp, "0.0.0.0"});
        return {web};
    }
};

class StaticSystemSource : public core::ISystemPortSource {
public:
    std::vector<core::ListeningSocket> listListeningSockets() override {
        return {{22, core::Protocol::Tcp, "0.0.0.0", false, std::string("sshd")},
                {53, core::Protocol::Udp, "127.0.0.53", false, std::string("systemd-resolve")}};
    }
};

// Simple HTTP client for testing
class TestHttpClient {
public:
    explicit TestHttpClient(uint16_t port) : port_(port) {}

    std::pair<int, std::string> request(const std::string& method, const std::string& path,
                                        const std::string& body = "",
                                        const std::map<std::string, std::string>& headers = {}) {
        try {
            asio::io_context io;
            asio::ip::tcp::socket socket(io);
            socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_));

            std::ostringstream request;
            request << method << " " << path << " HTTP/1.1\r\n";
            request << "Host: localhost\r\n";
            for (const auto& [key, value] : headers) {
                request << key << ": " << value << "\r\n";
            }
            if (!body.empty()) {
                request << "Content-Length: " << body.size() << "\r\n";
                request << "Content-Type: application/json\r\n";
            }
            request << "Connection: close\r\n\r\n";
            request << body;

            asio::write(socket, asio::buffer(request.str()));

            // The server closes the connection after the response
            std::string response;
            asio::error_code ec;
            asio::read(socket, asio::dynamic_buffer(response), ec);
            if (ec && ec != asio::error::eof) {
                return {0, std::string("Error: ") + ec.message()};
            }

            int statusCode = 0;
            auto statusLine = response.substr(0, response.find("\r\n"));
            auto space1 = statusLine.find(' ');
            auto space2 = statusLine.find(' ', space1 + 1);
            if (space1 != std::string::npos && space2 != std::string::npos) {
                statusCode = std::stoi(statusLine.substr(space1 + 1, space2 - space1 - 1));
            }

            auto bodyStart = response.find("\r\n\r\n");
            std::string responseBody;
            if (bodyStart != std::string::npos) {
                responseBody = response.substr(bodyStart + 4);
            }

            return {statusCode, responseBody};
        } catch (const std::exception& e) {
            return {0, std::string("Error: ") + e.what()};
        }
    }

private:
    uint16_t port_;
};

struct ServerFixture {
    explicit ServerFixture(std::filesystem::path storeFile = {})
        : configDir(std::filesystem::temp_directory_path() / "dockports_api_test"),
          workers(2), serverContext(2) {
        std::filesystem::remove_all(configDir);
        config = std::make_unique<infra::ConfigManager>(configDir);
        config->load();

        store = std::make_unique<infra::HiddenPortStore>(
            storeFile.empty() ? config->hiddenPortsPath() : storeFile);
        catalog = std::make_unique<core::ServiceCatalog>(config->config().serviceNames);

        workers.start();
        serverContext.start();

        inventory = std::make_unique<infra::PortInventoryService>(
            workers, std::make_shared<StaticContainerSource>(), std::make_shared<StaticSystemSource>(),
            *store, *catalog);
        server = std::make_shared<infra::RestApiServer>(serverContext, *inventory, *store, *catalog,
                                                        *config, "127.0.0.1", 0);
    }

    ~ServerFixture() {
        server->stop();
        serverContext.stop();
        workers.stop();
        std::filesystem::remove_all(configDir);
    }

    infra::ApiResponse call(infra::HttpMethod method, const std::string& path,
                            const std::string& body = "",
                            std::map<std::string, std::string> query = {}) {
        infra::ApiRequest request;
        request.method = method;
        request.path = path;
        request.body = body;
        request.queryParams = std::move(query);
        return server->dispatch(std::move(request));
    }

    static nlohmann::json json(const infra::ApiResponse& response) {
        return nlohmann::json::parse(response.body);
    }

    std::filesystem::path configDir;
    infra::AsioContext workers;
    infra::AsioContext serverContext;
    std::unique_ptr<infra::ConfigManager> config;
    std::unique_ptr<infra::HiddenPortStore> store;
    std::unique_ptr<core::ServiceCatalog> catalog;
    std::unique_ptr<infra::PortInventoryService> inventory;
    std::shared_ptr<infra::RestApiServer> server;
};

} // namespace

TEST_CASE("ApiResponse formatting", "[RestApi]") {
    SECTION("setData wraps the payload") {
        infra::ApiResponse response;
        response.setData({{"key", "value"}});

        REQUIRE(response.headers["Content-Type"] == "application/json");
        auto json = nlohmann::json::parse(response.body);
        REQUIRE(json["success"] == true);
        REQUIRE(json["data"]["key"] == "value");
    }

    SECTION("setError sets correct status and body") {
        infra::ApiResponse response;
        response.setError(400, "Bad port", {"70000"});

        REQUIRE(response.statusCode == 400);
        REQUIRE(response.statusText == "Bad Request");

        auto json = nlohmann::json::parse(response.body);
        REQUIRE(json["success"] == false);
        REQUIRE(json["error"] == "Bad port");
        REQUIRE(json["invalid"] == nlohmann::json::array({"70000"}));
    }

    SECTION("setError without invalid inputs omits the field") {
        infra::ApiResponse response;
        response.setError(404, "Resource not found");

        REQUIRE(response.statusText == "Not Found");
        REQUIRE_FALSE(nlohmann::json::parse(response.body).contains("invalid"));
    }

    SECTION("toString produces valid HTTP response") {
        infra::ApiResponse response;
        response.statusCode = 200;
        response.statusText = "OK";
        response.body = R"({"message":"hello"})";
        response.headers["Content-Type"] = "application/json";

        std::string httpResponse = response.toString();

        REQUIRE(httpResponse.find("HTTP/1.1 200 OK") != std::string::npos);
        REQUIRE(httpResponse.find("Content-Type: application/json") != std::string::npos);
        REQUIRE(httpResponse.find("Content-Length: 19") != std::string::npos);
        REQUIRE(httpResponse.find(R"({"message":"hello"})") != std::string::npos);
    }
}

TEST_CASE("RestApiServer routing", "[RestApi]") {
    ServerFixture fixture;

    SECTION("Health check") {
        auto response = fixture.call(infra::HttpMethod::GET, "/api/health");
        REQUIRE(response.statusCode == 200);

        auto json = ServerFixture::json(response);
        REQUIRE(json["data"]["status"] == "healthy");
        REQUIRE(json["data"]["hidden_entries"] == 0);
    }

    SECTION("Unknown endpoint") {
        auto response = fixture.call(infra::HttpMethod::GET, "/api/nothing");
        REQUIRE(response.statusCode == 404);
    }

    SECTION("Wrong method") {
        auto response = fixture.call(infra::HttpMethod::PUT, "/api/hidden-ports");
        REQUIRE(response.statusCode == 405);
    }

    SECTION("CORS preflight") {
        auto response = fixture.call(infra::HttpMethod::OPTIONS, "/api/hidden-ports");
        REQUIRE(response.statusCode == 204);
        REQUIRE(response.headers["Access-Control-Allow-Origin"] == "*");
    }
}

TEST_CASE("RestApiServer API key", "[RestApi]") {
    ServerFixture fixture;
    fixture.server->setApiKey("s3cret");

    SECTION("Health needs no key") {
        REQUIRE(fixture.call(infra::HttpMethod::GET, "/api/health").statusCode == 200);
    }

    SECTION("Missing key is rejected") {
        REQUIRE(fixture.call(infra::HttpMethod::GET, "/api/hidden-ports").statusCode == 401);
    }

    SECTION("Header and query keys are accepted") {
        infra::ApiRequest request;
        request.method = infra::HttpMethod::GET;
        request.path = "/api/hidden-ports";
        request.headers["x-api-key"] = "s3cret";
        REQUIRE(fixture.server->dispatch(request).statusCode == 200);

        request.headers.clear();
        request.headers["authorization"] = "Bearer s3cret";
        REQUIRE(fixture.server->dispatch(request).statusCode == 200);

        REQUIRE(fixture.call(infra::HttpMethod::GET, "/api/hidden-ports", "",
                             {{"api_key", "s3cret"}})
                    .statusCode == 200);
    }
}

TEST_CASE("RestApiServer port listing", "[RestApi]") {
    ServerFixture fixture;

    SECTION("Lists used ports and gaps") {
        auto response = fixture.call(infra::HttpMethod::GET, "/api/ports");
        REQUIRE(response.statusCode == 200);

        auto data = ServerFixture::json(response)["data"];
        const auto& ports = data["ports"];
        REQUIRE(ports.size() == 5);
        REQUIRE(ports[0]["type"] == "port");
        REQUIRE(ports[0]["port"] == 22);
        REQUIRE(ports[0]["service_name"] == "SSH");
        REQUIRE(ports[0]["process_name"] == "sshd");
        REQUIRE(ports[1]["type"] == "gap");
        REQUIRE(ports[1]["start"] == 23);
        REQUIRE(ports[1]["end"] == 52);
        REQUIRE(ports[1]["state"] == "available");
        REQUIRE(ports[2]["protocol"] == "udp");
        REQUIRE(ports[4]["container_name"] == "web");
        REQUIRE(ports[4]["source"] == "container");

        const auto& summary = data["summary"];
        REQUIRE(summary["total_used"] == 3);
        REQUIRE(summary["total_available"] == 65532);
        REQUIRE(summary["total_hidden"] == 0);
        REQUIRE(summary["docker_containers"] == 1);
        REQUIRE(summary["by_protocol"]["tcp"]["used"] == 2);
        REQUIRE(summary["by_protocol"]["udp"]["available"] == 65534);
        REQUIRE(data["degraded"] == false);
        REQUIRE(data["containers_seen"] == 1);
    }

    SECTION("Search filters the listing") {
        auto response =
            fixture.call(infra::HttpMethod::GET, "/api/ports", "", {{"search", "nginx"}});
        auto data = ServerFixture::json(response)["data"];

        REQUIRE(data["ports"].size() == 1);
        REQUIRE(data["ports"][0]["port"] == 8080);
        REQUIRE(data["summary"]["total_used"] == 1);
        REQUIRE(data["search"] == "nginx");
    }

    SECTION("Hidden ports move out of the listing") {
        fixture.store->hide(22, core::Protocol::Tcp);
        fixture.store->hideBatch({core::PortSpec::range(9000, 9009, core::Protocol::Tcp)});

        auto data = ServerFixture::json(fixture.call(infra::HttpMethod::GET, "/api/refresh"))["data"];

        for (const auto& entry : data["ports"]) {
            REQUIRE_FALSE((entry["type"] == "port" && entry["port"] == 22));
        }
        REQUIRE(data["hidden_ports"].size() == 1);
        REQUIRE(data["hidden_ports"][0]["state"] == "hidden");
        REQUIRE(data["virtual_hidden"].size() == 1);
        REQUIRE(data["summary"]["total_hidden"] == 1);
        REQUIRE(data["summary"]["total_virtual_hidden"] == 10);
        REQUIRE(data["summary"]["by_protocol"]["tcp"]["virtual_hidden"] == 10);
    }
}

TEST_CASE("RestApiServer hidden port operations", "[RestApi]") {
    ServerFixture fixture;

    SECTION("Hide and unhide a single port") {
        auto hide = fixture.call(infra::HttpMethod::POST, "/api/hidden-ports",
                                 R"({"port": 8080, "protocol": "tcp"})");
        REQUIRE(hide.statusCode == 200);
        auto data = ServerFixture::json(hide)["data"];
        REQUIRE(data["changed"] == 1);
        REQUIRE(data["entries"].size() == 1);
        REQUIRE(data["entries"][0]["protocol"] == "tcp");

        auto unhide = fixture.call(infra::HttpMethod::DELETE, "/api/hidden-ports",
                                   R"({"port": 8080})");
        REQUIRE(unhide.statusCode == 200);
        REQUIRE(ServerFixture::json(unhide)["data"]["entries"].empty());
    }

    SECTION("Out of range port is rejected") {
        fixture.store->hide(22);

        auto response =
            fixture.call(infra::HttpMethod::POST, "/api/hidden-ports", R"({"port": 70000})");
        REQUIRE(response.statusCode == 400);

        auto json = ServerFixture::json(response);
        REQUIRE(json["success"] == false);
        REQUIRE(json["invalid"] == nlohmann::json::array({"70000"}));
        REQUIRE(fixture.store->list().size() == 2);
    }

    SECTION("Missing port field") {
        auto response = fixture.call(infra::HttpMethod::POST, "/api/hidden-ports", R"({"p": 1})");
        REQUIRE(response.statusCode == 400);
    }

    SECTION("Malformed body") {
        auto response = fixture.call(infra::HttpMethod::POST, "/api/hidden-ports", "{port:");
        REQUIRE(response.statusCode == 400);
    }

    SECTION("Unknown protocol") {
        auto response = fixture.call(infra::HttpMethod::POST, "/api/hidden-ports",
                                     R"({"port": 80, "protocol": "sctp"})");
        REQUIRE(response.statusCode == 400);
    }

    SECTION("Batch hide applies every item") {
        auto response = fixture.call(
            infra::HttpMethod::POST, "/api/hidden-ports/batch",
            R"({"ports": [3000, {"port": 3001, "protocol": "udp"}, {"start": 4000, "end": 4010}]})");
        REQUIRE(response.statusCode == 200);

        auto data = ServerFixture::json(response)["data"];
        REQUIRE(data["changed"] == 2 + 1 + 22);

        auto list = ServerFixture::json(fixture.call(infra::HttpMethod::GET, "/api/hidden-ports"));
        REQUIRE(list["data"]["entries"].size() == 4);
    }

    SECTION("Batch with invalid items changes nothing") {
        auto response = fixture.call(infra::HttpMethod::POST, "/api/hidden-ports/batch",
                                     R"({"ports": [3000, 0, "abc", {"start": 10, "end": 5}]})");
        REQUIRE(response.statusCode == 400);

        auto json = ServerFixture::json(response);
        REQUIRE(json["invalid"] == nlohmann::json::array({"0", "\"abc\"", "10-5"}));
        REQUIRE(fixture.store->list().empty());
    }

    SECTION("Batch needs a ports array") {
        auto response = fixture.call(infra::HttpMethod::DELETE, "/api/hidden-ports/batch",
                                     R"({"ports": 80})");
        REQUIRE(response.statusCode == 400);
    }

    SECTION("Batch unhide splits ranges") {
        fixture.store->hideBatch({core::PortSpec::range(100, 200, core::Protocol::Tcp)});

        auto response = fixture.call(infra::HttpMethod::DELETE, "/api/hidden-ports/batch",
                                     R"({"ports": [{"start": 150, "end": 159, "protocol": "tcp"}]})");
        REQUIRE(response.statusCode == 200);

        auto entries = ServerFixture::json(response)["data"]["entries"];
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0]["end"] == 149);
        REQUIRE(entries[1]["start"] == 160);
    }
}

TEST_CASE("RestApiServer persistence failures", "[RestApi]") {
    auto blocker = std::filesystem::temp_directory_path() / "dockports_api_blocker";
    std::filesystem::remove_all(blocker);
    {
        std::ofstream out(blocker);
        out << "file";
    }

    {
        ServerFixture fixture(blocker / "hidden_ports.json");

        auto response =
            fixture.call(infra::HttpMethod::POST, "/api/hidden-ports", R"({"port": 8080})");
        REQUIRE(response.statusCode == 500);
        REQUIRE(ServerFixture::json(response)["error"].get<std::string>().find(
                    "Failed to persist hidden ports") != std::string::npos);
        REQUIRE(fixture.store->list().empty());
    }

    std::filesystem::remove(blocker);
}

TEST_CASE("RestApiServer service names", "[RestApi]") {
    ServerFixture fixture;

    SECTION("Saves a mapping and persists it") {
        auto response = fixture.call(infra::HttpMethod::POST, "/api/config",
                                     R"({"port": 8080, "service_name": "Nextcloud"})");
        REQUIRE(response.statusCode == 200);
        REQUIRE(fixture.catalog->lookup(8080) == "Nextcloud");

        infra::ConfigManager reloaded(fixture.configDir);
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().serviceNames.at(8080) == "Nextcloud");

        auto config = ServerFixture::json(fixture.call(infra::HttpMethod::GET, "/api/config"));
        REQUIRE(config["data"]["services"]["8080"] == "Nextcloud");
        REQUIRE(config["data"]["known_services"]["22"] == "SSH");

        auto ports = ServerFixture::json(fixture.call(infra::HttpMethod::GET, "/api/ports"));
        REQUIRE(ports["data"]["ports"][4]["service_name"] == "Nextcloud");
    }

    SECTION("Rejects invalid input") {
        REQUIRE(fixture.call(infra::HttpMethod::POST, "/api/config",
                             R"({"port": 0, "service_name": "x"})")
                    .statusCode == 400);
        REQUIRE(fixture.call(infra::HttpMethod::POST, "/api/config",
                             R"({"port": 80, "service_name": "  "})")
                    .statusCode == 400);
        REQUIRE(fixture.call(infra::HttpMethod::POST, "/api/config", R"({"port": 80})")
                    .statusCode == 400);
    }
}

TEST_CASE("RestApiServer over HTTP", "[RestApi]") {
    ServerFixture fixture;
    fixture.server->start();
    REQUIRE(fixture.server->isRunning());
    REQUIRE(fixture.server->port() != 0);

    TestHttpClient client(fixture.server->port());

    SECTION("Health check") {
        auto [status, body] = client.request("GET", "/api/health");
        REQUIRE(status == 200);
        REQUIRE(nlohmann::json::parse(body)["data"]["status"] == "healthy");
    }

    SECTION("Hide through a request body") {
        auto [status, body] =
            client.request("POST", "/api/hidden-ports", R"({"port": 5432, "protocol": "tcp"})");
        REQUIRE(status == 200);
        REQUIRE(fixture.store->snapshot()->contains(5432, core::Protocol::Tcp));
    }

    SECTION("Search through the query string") {
        auto [status, body] = client.request("GET", "/api/ports?search=%73sh");
        REQUIRE(status == 200);

        auto data = nlohmann::json::parse(body)["data"];
        REQUIRE(data["search"] == "ssh");
        REQUIRE(data["ports"].size() == 1);
    }

    SECTION("Search with non-ASCII bytes") {
        auto [status, body] = client.request("GET", "/api/ports?search=caf\xC3\xA9%C3%A9");
        REQUIRE(status == 200);

        auto data = nlohmann::json::parse(body)["data"];
        REQUIRE(data["ports"].empty());
    }
}
