#pragma once

#include <chrono>
#include <string>

namespace dockports::infra {

/**
 * @brief Response data from a Docker Engine API request.
 */
struct HttpResponse {
    int statusCode{0};        ///< HTTP status code (e.g., 200, 404).
    std::string body;         ///< Response body, chunked encoding removed.
    std::string errorMessage; ///< Error message if the request failed.
    bool success{false};      ///< True if the request completed with a 2xx status.
};

/**
 * @brief Minimal blocking HTTP client for the Docker Engine UNIX socket.
 *
 * Each request opens a fresh connection, sends an HTTP/1.1 request with
 * "Connection: close" and reads until the daemon closes the stream. The
 * whole exchange is bounded by the configured timeout.
 */
class DockerApiClient {
public:
    /**
     * @brief Constructs a client for the given socket.
     * @param socketPath Path of the Docker Engine UNIX socket.
     * @param timeout Deadline for one complete request.
     */
    DockerApiClient(std::string socketPath, std::chrono::milliseconds timeout);

    /**
     * @brief Performs a GET request.
     * @param target Request target, e.g. "/containers/json".
     * @return Response; success is false on transport errors, timeouts or non-2xx status.
     */
    HttpResponse get(const std::string& target) const;

    const std::string& socketPath() const { return socketPath_; }

    /**
     * @brief Parses a raw HTTP/1.x response.
     * @param raw Status line, headers and body as read from the socket.
     * @return Parsed response. A malformed status line yields success == false.
     */
    static HttpResponse parseResponse(const std::string& raw);

    /**
     * @brief Removes chunked transfer encoding from a body.
     * @param body Chunked body.
     * @return Decoded body, or the input unchanged if it is not valid chunked data.
     */
    static std::string decodeChunked(const std::string& body);

private:
    std::string socketPath_;
    std::chrono::milliseconds timeout_;
};

} // namespace dockports::infra
