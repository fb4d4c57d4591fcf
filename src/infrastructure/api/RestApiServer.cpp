#include "infrastructure/api/RestApiServer.hpp"

#include "core/types/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>

namespace dockports::infra {

namespace {

constexpr const char* kVersion = "1.0.0";

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string urlDecode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            result += ' ';
        } else if (str[i] == '%' && i + 2 < str.size() &&
                   std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            result += static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += str[i];
        }
    }
    return result;
}

int64_t epochSeconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json recordToJson(const core::PortRecord& record) {
    nlohmann::json j;
    j["type"] = "port";
    j["port"] = record.port;
    j["protocol"] = core::protocolToString(record.protocol);
    j["state"] = core::portStateToString(record.state);
    j["source"] = core::portSourceToString(record.source);
    j["detection_method"] = core::detectionMethodToString(record.detectionMethod);
    j["confidence"] = record.confidence();
    j["service_name"] = record.serviceName;
    j["container_name"] = optionalToJson(record.containerName);
    j["container_internal_port"] = optionalToJson(record.containerInternalPort);
    j["container_id"] = optionalToJson(record.containerId);
    j["image"] = optionalToJson(record.image);
    j["process_name"] = optionalToJson(record.processName);
    j["host_network"] = record.hostNetwork;
    return j;
}

nlohmann::json gapToJson(const core::ViewEntry& entry) {
    nlohmann::json j;
    j["type"] = "gap";
    j["start"] = entry.range.start;
    j["end"] = entry.range.end;
    j["count"] = entry.range.count();
    j["state"] = core::portStateToString(entry.displayState());
    j["tcp_state"] = core::portStateToString(entry.stateFor(core::Protocol::Tcp));
    j["udp_state"] = core::portStateToString(entry.stateFor(core::Protocol::Udp));
    return j;
}

nlohmann::json hiddenEntryToJson(const core::HiddenPortEntry& entry) {
    nlohmann::json j;
    j["protocol"] = core::protocolToString(entry.protocol);
    j["start"] = entry.start;
    j["end"] = entry.end;
    j["count"] = entry.count();
    return j;
}

nlohmann::json hiddenEntriesToJson(const std::vector<core::HiddenPortEntry>& entries) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& entry : entries) {
        result.push_back(hiddenEntryToJson(entry));
    }
    return result;
}

nlohmann::json summaryToJson(const core::ProtocolSummary& summary) {
    nlohmann::json j;
    j["used"] = summary.used;
    j["available"] = summary.available;
    j["hidden"] = summary.hidden;
    j["virtual_hidden"] = summary.virtualHidden;
    return j;
}

nlohmann::json mutationToJson(const MutationResult& result) {
    nlohmann::json j;
    j["entries"] = hiddenEntriesToJson(result.entries);
    j["changed"] = result.changed;
    return j;
}

// Parses one hide/unhide target: 80, {"port": 80}, {"start": 80, "end": 90, "protocol": "udp"}.
std::optional<core::PortSpec> parsePortSpec(const nlohmann::json& item,
                                            std::vector<std::string>& invalid) {
    if (item.is_number_integer()) {
        return core::PortSpec::single(item.get<long long>());
    }

    if (!item.is_object()) {
        invalid.push_back(item.dump());
        return std::nullopt;
    }

    std::optional<core::Protocol> protocol;
    if (item.contains("protocol") && !item["protocol"].is_null()) {
        if (!item["protocol"].is_string()) {
            invalid.push_back(item.dump());
            return std::nullopt;
        }
        protocol = core::protocolFromString(item["protocol"].get<std::string>());
        if (!protocol) {
            invalid.push_back(item.dump());
            return std::nullopt;
        }
    }

    if (item.contains("port")) {
        if (!item["port"].is_number_integer()) {
            invalid.push_back(item["port"].dump());
            return std::nullopt;
        }
        return core::PortSpec::single(item["port"].get<long long>(), protocol);
    }

    if (item.contains("start")) {
        const auto& end = item.contains("end") ? item["end"] : item["start"];
        if (!item["start"].is_number_integer() || !end.is_number_integer()) {
            invalid.push_back(item.dump());
            return std::nullopt;
        }
        return core::PortSpec::range(item["start"].get<long long>(), end.get<long long>(),
                                     protocol);
    }

    invalid.push_back(item.dump());
    return std::nullopt;
}

// Parses the body of a batch request and throws InvalidPort listing every bad item.
std::vector<core::PortSpec> parseBatch(const nlohmann::json& ports) {
    std::vector<core::PortSpec> specs;
    std::vector<std::string> invalid;

    for (const auto& item : ports) {
        if (auto spec = parsePortSpec(item, invalid)) {
            if (spec->isValid()) {
                specs.push_back(std::move(*spec));
            } else {
                invalid.push_back(spec->raw);
            }
        }
    }

    if (!invalid.empty()) {
        throw core::InvalidPort(std::move(invalid));
    }
    return specs;
}

} // namespace

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setData(const nlohmann::json& data) {
    nlohmann::json envelope;
    envelope["success"] = true;
    envelope["data"] = data;
    setJson(envelope);
}

void ApiResponse::setError(int code, const std::string& message,
                           const std::vector<std::string>& invalid) {
    statusCode = code;
    switch (code) {
    case 400:
        statusText = "Bad Request";
        break;
    case 401:
        statusText = "Unauthorized";
        break;
    case 404:
        statusText = "Not Found";
        break;
    case 405:
        statusText = "Method Not Allowed";
        break;
    case 500:
        statusText = "Internal Server Error";
        break;
    default:
        statusText = "Error";
    }
    nlohmann::json error;
    error["success"] = false;
    error["error"] = message;
    if (!invalid.empty()) {
        error["invalid"] = invalid;
    }
    setJson(error);
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

RestApiServer::RestApiServer(AsioContext& asioContext, PortInventoryService& inventory,
                             HiddenPortStore& store, core::ServiceCatalog& catalog,
                             ConfigManager& config, std::string address, uint16_t port)
    : asioContext_(asioContext), inventory_(inventory), store_(store), catalog_(catalog),
      config_(config), address_(std::move(address)), port_(port) {
    registerRoutes();
}

RestApiServer::~RestApiServer() {
    stop();
}

void RestApiServer::registerRoutes() {
    // Health endpoint (no auth required)
    routes_.push_back(
        {HttpMethod::GET, "/api/health", [this](auto& req, auto& res) { handleHealth(req, res); },
         false});

    // Port listing
    routes_.push_back(
        {HttpMethod::GET, "/api/ports", [this](auto& req, auto& res) { handleGetPorts(req, res); }});
    routes_.push_back({HttpMethod::GET, "/api/refresh",
                       [this](auto& req, auto& res) { handleGetPorts(req, res); }});

    // Hidden ports
    routes_.push_back({HttpMethod::GET, "/api/hidden-ports",
                       [this](auto& req, auto& res) { handleGetHiddenPorts(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/hidden-ports",
                       [this](auto& req, auto& res) { handleHidePort(req, res); }});
    routes_.push_back({HttpMethod::DELETE, "/api/hidden-ports",
                       [this](auto& req, auto& res) { handleUnhidePort(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/hidden-ports/batch",
                       [this](auto& req, auto& res) { handleHideBatch(req, res); }});
    routes_.push_back({HttpMethod::DELETE, "/api/hidden-ports/batch",
                       [this](auto& req, auto& res) { handleUnhideBatch(req, res); }});

    // Service names
    routes_.push_back({HttpMethod::GET, "/api/config",
                       [this](auto& req, auto& res) { handleGetConfig(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/config",
                       [this](auto& req, auto& res) { handleSaveConfig(req, res); }});
}

void RestApiServer::start() {
    if (running_.load()) {
        return;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(address_), port_);
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(asioContext_.getContext(), endpoint);
        port_ = acceptor_->local_endpoint().port();

        running_ = true;
        startAccept();
        spdlog::info("REST API server listening on {}:{}", address_, port_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start REST API server: {}", e.what());
        throw;
    }
}

void RestApiServer::stop() {
    if (!running_.load()) {
        return;
    }

    running_ = false;
    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
    }
    spdlog::info("REST API server stopped");
}

void RestApiServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void RestApiServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>();
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t /*bytesTransferred*/) {
            if (ec) {
                return;
            }

            std::string headerData((std::istreambuf_iterator<char>(&*buffer)),
                                   std::istreambuf_iterator<char>());

            size_t contentLength = 0;
            std::istringstream iss(headerData);
            std::string line;
            while (std::getline(iss, line) && line != "\r") {
                auto pos = line.find(':');
                if (pos == std::string::npos) {
                    continue;
                }
                auto name = line.substr(0, pos);
                std::transform(name.begin(), name.end(), name.begin(), ::tolower);
                if (name == "content-length") {
                    try {
                        contentLength = std::stoull(trim(line.substr(pos + 1)));
                    } catch (const std::exception&) {
                        contentLength = 0;
                    }
                }
            }

            if (contentLength > 0) {
                auto headerEnd = headerData.find("\r\n\r\n");
                size_t bodyInBuffer = (headerEnd != std::string::npos)
                                          ? headerData.size() - headerEnd - 4
                                          : 0;
                size_t remaining = contentLength > bodyInBuffer ? contentLength - bodyInBuffer : 0;

                if (remaining > 0) {
                    auto bodyBuffer = std::make_shared<std::vector<char>>(remaining);
                    asio::async_read(
                        *socket, asio::buffer(*bodyBuffer),
                        [this, self, socket, headerData, bodyBuffer](const asio::error_code& ec2,
                                                                     std::size_t /*bytes*/) {
                            if (!ec2) {
                                std::string fullRequest =
                                    headerData + std::string(bodyBuffer->begin(), bodyBuffer->end());
                                processRequest(socket, fullRequest);
                            }
                        });
                    return;
                }
            }

            processRequest(socket, headerData);
        });
}

void RestApiServer::processRequest(std::shared_ptr<asio::ip::tcp::socket> socket,
                                   const std::string& rawRequest) {
    sendResponse(socket, dispatch(parseRequest(rawRequest)));
}

ApiResponse RestApiServer::dispatch(ApiRequest request) {
    ApiResponse response;
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, DELETE, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type, X-API-Key, Authorization";

    // Handle CORS preflight
    if (request.method == HttpMethod::OPTIONS) {
        response.statusCode = 204;
        response.statusText = "No Content";
        return response;
    }

    spdlog::debug("REST API request: {} {}", static_cast<int>(request.method), request.path);

    bool pathFound = false;
    for (auto& route : routes_) {
        if (!matchRoute(route.pattern, request.path, request.pathParams)) {
            continue;
        }
        pathFound = true;
        if (route.method != request.method) {
            continue;
        }

        if (route.requiresAuth && !apiKey_.empty() && !validateApiKey(request)) {
            response.setError(401, "Invalid or missing API key");
            return response;
        }

        try {
            route.handler(request, response);
        } catch (const core::InvalidPort& e) {
            response.setError(400, e.what(), e.invalidInputs());
        } catch (const nlohmann::json::exception& e) {
            response.setError(400, std::string("Invalid request body: ") + e.what());
        } catch (const core::PersistenceError& e) {
            spdlog::error("REST API error: {}", e.what());
            response.setError(500, e.what());
        } catch (const std::exception& e) {
            spdlog::error("REST API error: {}", e.what());
            response.setError(500, "Internal server error");
        }
        return response;
    }

    if (pathFound) {
        response.setError(405, "Method not allowed");
    } else {
        response.setError(404, "Endpoint not found");
    }
    return response;
}

void RestApiServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                                 const ApiResponse& response) {
    auto responseStr = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*responseStr),
                      [socket, responseStr](const asio::error_code& /*ec*/, std::size_t /*bytes*/) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

ApiRequest RestApiServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    // Parse request line
    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = parseMethod(method);

        auto queryPos = path.find('?');
        if (queryPos != std::string::npos) {
            request.queryParams = parseQueryString(path.substr(queryPos + 1));
            path = path.substr(0, queryPos);
        }
        request.path = path;
    }

    // Parse headers
    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::string value = trim(line.substr(colonPos + 1));
            std::transform(key.begin(), key.end(), key.begin(), ::tolower);
            request.headers[key] = value;
        }
    }

    auto bodyStart = rawRequest.find("\r\n\r\n");
    if (bodyStart != std::string::npos) {
        request.body = rawRequest.substr(bodyStart + 4);
    }

    return request;
}

HttpMethod RestApiServer::parseMethod(const std::string& method) {
    if (method == "GET")
        return HttpMethod::GET;
    if (method == "POST")
        return HttpMethod::POST;
    if (method == "PUT")
        return HttpMethod::PUT;
    if (method == "DELETE")
        return HttpMethod::DELETE;
    if (method == "OPTIONS")
        return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::map<std::string, std::string> RestApiServer::parseQueryString(const std::string& queryString) {
    std::map<std::string, std::string> params;
    std::istringstream iss(queryString);
    std::string pair;

    while (std::getline(iss, pair, '&')) {
        auto eqPos = pair.find('=');
        if (eqPos != std::string::npos) {
            params[urlDecode(pair.substr(0, eqPos))] = urlDecode(pair.substr(eqPos + 1));
        }
    }

    return params;
}

bool RestApiServer::matchRoute(const std::string& pattern, const std::string& path,
                               std::map<std::string, std::string>& pathParams) {
    pathParams.clear();

    std::vector<std::string> patternParts, pathParts;
    std::istringstream patternStream(pattern), pathStream(path);
    std::string part;

    while (std::getline(patternStream, part, '/')) {
        if (!part.empty())
            patternParts.push_back(part);
    }
    while (std::getline(pathStream, part, '/')) {
        if (!part.empty())
            pathParts.push_back(part);
    }

    if (patternParts.size() != pathParts.size()) {
        return false;
    }

    for (size_t i = 0; i < patternParts.size(); ++i) {
        if (patternParts[i].front() == ':') {
            pathParams[patternParts[i].substr(1)] = pathParts[i];
        } else if (patternParts[i] != pathParts[i]) {
            return false;
        }
    }

    return true;
}

bool RestApiServer::validateApiKey(const ApiRequest& request) {
    // Check X-API-Key header
    auto it = request.headers.find("x-api-key");
    if (it != request.headers.end() && it->second == apiKey_) {
        return true;
    }

    // Check Authorization header (Bearer token)
    it = request.headers.find("authorization");
    if (it != request.headers.end()) {
        std::string auth = it->second;
        if (auth.find("Bearer ") == 0 && auth.substr(7) == apiKey_) {
            return true;
        }
    }

    // Check query parameter
    auto qit = request.queryParams.find("api_key");
    return qit != request.queryParams.end() && qit->second == apiKey_;
}

// Port listing
void RestApiServer::handleGetPorts(const ApiRequest& req, ApiResponse& res) {
    auto report = inventory_.collect();
    const auto& view = report.view;

    std::string search;
    if (auto it = req.queryParams.find("search"); it != req.queryParams.end()) {
        search = trim(it->second);
    }

    nlohmann::json ports = nlohmann::json::array();
    size_t matchedUsed = 0;
    for (const auto& entry : view.entries()) {
        if (!PortInventoryService::matchesSearch(entry, search)) {
            continue;
        }
        if (entry.kind == core::ViewEntry::Kind::Port) {
            ports.push_back(recordToJson(entry.record));
            ++matchedUsed;
        } else {
            ports.push_back(gapToJson(entry));
        }
    }

    nlohmann::json hidden = nlohmann::json::array();
    for (const auto& record : view.hiddenRecords()) {
        if (PortInventoryService::matchesSearch(record, search)) {
            hidden.push_back(recordToJson(record));
        }
    }

    uint32_t virtualHiddenCount = 0;
    for (const auto& entry : view.virtualHidden()) {
        virtualHiddenCount += entry.count();
    }

    nlohmann::json summary;
    summary["total_used"] = search.empty() ? view.distinctUsedPorts() : matchedUsed;
    summary["total_available"] = static_cast<size_t>(core::kMaxPort) - view.distinctUsedPorts();
    summary["total_hidden"] = view.hiddenRecords().size();
    summary["total_virtual_hidden"] = virtualHiddenCount;
    summary["docker_containers"] = view.containerCount();
    summary["by_protocol"]["tcp"] = summaryToJson(view.summary(core::Protocol::Tcp));
    summary["by_protocol"]["udp"] = summaryToJson(view.summary(core::Protocol::Udp));

    nlohmann::json data;
    data["ports"] = ports;
    data["hidden_ports"] = hidden;
    data["virtual_hidden"] = hiddenEntriesToJson(view.virtualHidden());
    data["summary"] = summary;
    data["degraded"] = report.degraded;
    data["warnings"] = report.warnings;
    data["containers_seen"] = report.containersSeen;
    data["generated_at"] = epochSeconds(report.generatedAt);
    if (!search.empty()) {
        data["search"] = search;
    }
    res.setData(data);
}

// Hidden ports
void RestApiServer::handleGetHiddenPorts(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json data;
    data["entries"] = hiddenEntriesToJson(store_.list());
    res.setData(data);
}

void RestApiServer::handleHidePort(const ApiRequest& req, ApiResponse& res) {
    auto body = nlohmann::json::parse(req.body);
    if (!body.is_object() || !body.contains("port")) {
        res.setError(400, "Missing 'port' field");
        return;
    }

    std::vector<std::string> invalid;
    auto spec = parsePortSpec(body, invalid);
    if (!spec) {
        throw core::InvalidPort(std::move(invalid));
    }

    res.setData(mutationToJson(store_.hide(spec->start, spec->protocol)));
}

void RestApiServer::handleUnhidePort(const ApiRequest& req, ApiResponse& res) {
    auto body = nlohmann::json::parse(req.body);
    if (!body.is_object() || !body.contains("port")) {
        res.setError(400, "Missing 'port' field");
        return;
    }

    std::vector<std::string> invalid;
    auto spec = parsePortSpec(body, invalid);
    if (!spec) {
        throw core::InvalidPort(std::move(invalid));
    }

    res.setData(mutationToJson(store_.unhide(spec->start, spec->protocol)));
}

void RestApiServer::handleHideBatch(const ApiRequest& req, ApiResponse& res) {
    auto body = nlohmann::json::parse(req.body);
    if (!body.is_object() || !body.contains("ports") || !body["ports"].is_array()) {
        res.setError(400, "Field 'ports' must be an array");
        return;
    }

    res.setData(mutationToJson(store_.hideBatch(parseBatch(body["ports"]))));
}

void RestApiServer::handleUnhideBatch(const ApiRequest& req, ApiResponse& res) {
    auto body = nlohmann::json::parse(req.body);
    if (!body.is_object() || !body.contains("ports") || !body["ports"].is_array()) {
        res.setError(400, "Field 'ports' must be an array");
        return;
    }

    res.setData(mutationToJson(store_.unhideBatch(parseBatch(body["ports"]))));
}

// Service names
void RestApiServer::handleGetConfig(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json services = nlohmann::json::object();
    for (const auto& [port, name] : catalog_.userMappings()) {
        services[std::to_string(port)] = name;
    }

    nlohmann::json known = nlohmann::json::object();
    for (const auto& [port, name] : core::ServiceCatalog::getKnownServices()) {
        known[std::to_string(port)] = name;
    }

    nlohmann::json data;
    data["services"] = services;
    data["known_services"] = known;
    res.setData(data);
}

void RestApiServer::handleSaveConfig(const ApiRequest& req, ApiResponse& res) {
    auto body = nlohmann::json::parse(req.body);
    if (!body.is_object() || !body.contains("port") || !body.contains("service_name")) {
        res.setError(400, "Fields 'port' and 'service_name' are required");
        return;
    }

    const auto& port = body["port"];
    if (!port.is_number_integer() || !core::isValidPort(port.get<long long>())) {
        throw core::InvalidPort({port.dump()});
    }
    if (!body["service_name"].is_string() || trim(body["service_name"].get<std::string>()).empty()) {
        res.setError(400, "Field 'service_name' must be a non-empty string");
        return;
    }

    auto portNumber = port.get<uint16_t>();
    auto serviceName = trim(body["service_name"].get<std::string>());

    std::lock_guard lock(configMutex_);
    auto previous = catalog_.userMappings();
    catalog_.setMapping(portNumber, serviceName);
    config_.config().serviceNames = catalog_.userMappings();
    if (!config_.save()) {
        catalog_.replaceMappings(previous);
        config_.config().serviceNames = previous;
        res.setError(500, "Failed to save configuration");
        return;
    }

    spdlog::info("Service name for port {} set to '{}'", portNumber, serviceName);
    nlohmann::json data;
    data["port"] = portNumber;
    data["service_name"] = serviceName;
    res.setData(data);
}

// Health endpoint
void RestApiServer::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json health;
    health["status"] = "healthy";
    health["timestamp"] = epochSeconds(std::chrono::system_clock::now());
    health["version"] = kVersion;
    health["hidden_entries"] = store_.list().size();
    res.setData(health);
}

} // namespace dockports::infra
