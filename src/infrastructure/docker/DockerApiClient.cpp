#include "infrastructure/docker/DockerApiClient.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <sstream>

namespace dockports::infra {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

DockerApiClient::DockerApiClient(std::string socketPath, std::chrono::milliseconds timeout)
    : socketPath_(std::move(socketPath)), timeout_(timeout) {}

HttpResponse DockerApiClient::get(const std::string& target) const {
    HttpResponse response;

    asio::io_context io;
    asio::local::stream_protocol::socket socket(io);
    asio::local::stream_protocol::endpoint endpoint(socketPath_);

    std::string request = "GET " + target + " HTTP/1.1\r\n"
                          "Host: docker\r\n"
                          "Accept: application/json\r\n"
                          "Connection: close\r\n\r\n";
    std::string raw;
    std::array<char, 8192> buffer{};
    asio::error_code result = asio::error::would_block;

    std::function<void(const asio::error_code&, size_t)> onRead =
        [&](const asio::error_code& ec, size_t bytes) {
            raw.append(buffer.data(), bytes);
            if (ec) {
                result = ec == asio::error::eof ? asio::error_code{} : ec;
                return;
            }
            socket.async_read_some(asio::buffer(buffer), onRead);
        };

    socket.async_connect(endpoint, [&](const asio::error_code& ec) {
        if (ec) {
            result = ec;
            return;
        }
        asio::async_write(socket, asio::buffer(request),
                          [&](const asio::error_code& writeEc, size_t) {
                              if (writeEc) {
                                  result = writeEc;
                                  return;
                              }
                              socket.async_read_some(asio::buffer(buffer), onRead);
                          });
    });

    io.run_for(timeout_);

    if (result == asio::error::would_block) {
        asio::error_code ignored;
        socket.close(ignored);
        response.errorMessage = "request to " + socketPath_ + target + " timed out after " +
                                std::to_string(timeout_.count()) + " ms";
        spdlog::warn("Docker API {}", response.errorMessage);
        return response;
    }

    if (result) {
        response.errorMessage = result.message();
        spdlog::debug("Docker API request {} failed: {}", target, response.errorMessage);
        return response;
    }

    response = parseResponse(raw);
    if (!response.success && response.errorMessage.empty()) {
        response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
    }
    return response;
}

HttpResponse DockerApiClient::parseResponse(const std::string& raw) {
    HttpResponse response;

    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        response.errorMessage = "Malformed HTTP response";
        return response;
    }

    std::istringstream headers(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(headers, statusLine);

    std::istringstream status(statusLine);
    std::string version;
    status >> version >> response.statusCode;
    if (version.rfind("HTTP/", 0) != 0 || response.statusCode == 0) {
        response.errorMessage = "Malformed HTTP status line";
        return response;
    }

    bool chunked = false;
    std::string line;
    while (std::getline(headers, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto name = toLower(line.substr(0, colon));
        auto value = toLower(line.substr(colon + 1));
        if (name == "transfer-encoding" && value.find("chunked") != std::string::npos) {
            chunked = true;
        }
    }

    response.body = raw.substr(headerEnd + 4);
    if (chunked) {
        response.body = decodeChunked(response.body);
    }
    response.success = response.statusCode >= 200 && response.statusCode < 300;
    return response;
}

std::string DockerApiClient::decodeChunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;

    while (pos < body.size()) {
        auto lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return body;
        }

        size_t chunkSize = 0;
        try {
            chunkSize = std::stoul(body.substr(pos, lineEnd - pos), nullptr, 16);
        } catch (const std::exception&) {
            return body;
        }

        if (chunkSize == 0) {
            return decoded;
        }

        pos = lineEnd + 2;
        if (pos + chunkSize > body.size()) {
            return body;
        }
        decoded.append(body, pos, chunkSize);
        pos += chunkSize + 2;
    }

    return decoded;
}

} // namespace dockports::infra
