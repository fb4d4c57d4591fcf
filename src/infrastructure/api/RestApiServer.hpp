#pragma once

#include "core/ports/ServiceCatalog.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/inventory/PortInventoryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/storage/HiddenPortStore.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dockports::infra {

/**
 * @brief HTTP method enumeration.
 */
enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, UNKNOWN };

/**
 * @brief Represents an incoming API request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNKNOWN};         ///< HTTP method of the request.
    std::string path;                               ///< Request path.
    std::string body;                               ///< Request body content.
    std::map<std::string, std::string> headers;     ///< HTTP headers, keys lower-cased.
    std::map<std::string, std::string> queryParams; ///< Decoded query string parameters.
    std::map<std::string, std::string> pathParams;  ///< Path parameters from route matching.
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};                            ///< HTTP status code.
    std::string statusText{"OK"};                   ///< HTTP status text.
    std::string body;                               ///< Response body content.
    std::map<std::string, std::string> headers;     ///< Response headers.

    /**
     * @brief Sets the response body as JSON.
     * @param json JSON object to serialize as body.
     */
    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets a successful response {"success": true, "data": data}.
     * @param data Payload.
     */
    void setData(const nlohmann::json& data);

    /**
     * @brief Sets an error response {"success": false, "error": message}.
     * @param code HTTP status code for the error.
     * @param message Error message.
     * @param invalid Offending inputs, added as "invalid" when not empty.
     */
    void setError(int code, const std::string& message,
                  const std::vector<std::string>& invalid = {});

    /**
     * @brief Converts the response to an HTTP response string.
     * @return Complete HTTP response string.
     */
    std::string toString() const;
};

/**
 * @brief Handler function type for route endpoints.
 */
using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

/**
 * @brief Route definition for API endpoints.
 */
struct Route {
    HttpMethod method;         ///< HTTP method this route handles.
    std::string pattern;       ///< URL pattern (may include path parameters).
    RouteHandler handler;      ///< Handler function for this route.
    bool requiresAuth{true};   ///< Whether API key authentication is required.
};

/**
 * @brief REST API server exposing the port inventory.
 *
 * Serves the classified port listing and the hidden port operations as JSON.
 * Every response uses the {"success", "data" | "error"} envelope. Supports an
 * optional API key and CORS.
 *
 * @note This class is non-copyable. Handlers block on the inventory service,
 *       so the server context must not be the pool the source queries run on.
 */
class RestApiServer : public std::enable_shared_from_this<RestApiServer> {
public:
    /**
     * @brief Constructs a RestApiServer.
     * @param asioContext Context the acceptor and connections run on.
     * @param inventory Port inventory service.
     * @param store Hidden port store.
     * @param catalog Service name catalog.
     * @param config Configuration, updated when service names change.
     * @param address Address to bind.
     * @param port TCP port to listen on, 0 for an ephemeral port.
     */
    RestApiServer(AsioContext& asioContext, PortInventoryService& inventory, HiddenPortStore& store,
                  core::ServiceCatalog& catalog, ConfigManager& config,
                  std::string address = "0.0.0.0", uint16_t port = 7577);

    /**
     * @brief Destructor. Stops the server if running.
     */
    ~RestApiServer();

    RestApiServer(const RestApiServer&) = delete;
    RestApiServer& operator=(const RestApiServer&) = delete;

    /**
     * @brief Starts the API server and begins accepting connections.
     * @throws std::system_error if the address cannot be bound.
     */
    void start();

    /**
     * @brief Stops the API server and closes the acceptor.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Sets the API key for authentication.
     * @param apiKey The API key required for authenticated endpoints, empty disables it.
     */
    void setApiKey(const std::string& apiKey) { apiKey_ = apiKey; }

    /**
     * @brief Returns the port the server is listening on.
     * @return Bound TCP port once started, the configured port before.
     */
    uint16_t port() const { return port_; }

    /**
     * @brief Dispatches a parsed request to its route.
     * @param request Request.
     * @return The response, including CORS headers.
     */
    ApiResponse dispatch(ApiRequest request);

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);

    ApiRequest parseRequest(const std::string& rawRequest);
    HttpMethod parseMethod(const std::string& method);
    std::map<std::string, std::string> parseQueryString(const std::string& queryString);
    bool matchRoute(const std::string& pattern, const std::string& path,
                    std::map<std::string, std::string>& pathParams);
    bool validateApiKey(const ApiRequest& request);

    void registerRoutes();

    // Port listing endpoints
    void handleGetPorts(const ApiRequest& req, ApiResponse& res);

    // Hidden port endpoints
    void handleGetHiddenPorts(const ApiRequest& req, ApiResponse& res);
    void handleHidePort(const ApiRequest& req, ApiResponse& res);
    void handleUnhidePort(const ApiRequest& req, ApiResponse& res);
    void handleHideBatch(const ApiRequest& req, ApiResponse& res);
    void handleUnhideBatch(const ApiRequest& req, ApiResponse& res);

    // Service name endpoints
    void handleGetConfig(const ApiRequest& req, ApiResponse& res);
    void handleSaveConfig(const ApiRequest& req, ApiResponse& res);

    // Health endpoint
    void handleHealth(const ApiRequest& req, ApiResponse& res);

    AsioContext& asioContext_;
    PortInventoryService& inventory_;
    HiddenPortStore& store_;
    core::ServiceCatalog& catalog_;
    ConfigManager& config_;
    std::mutex configMutex_;
    std::string address_;
    uint16_t port_;
    std::string apiKey_;
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;
};

} // namespace dockports::infra
