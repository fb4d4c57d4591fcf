/**
 * @file ServiceCatalog.hpp
 * @brief Resolves service names for port numbers.
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace dockports::core {

/**
 * @brief Maps port numbers to human-readable service names.
 *
 * Operator-defined mappings take precedence over the built-in table of
 * well-known services. Thread-safe.
 */
class ServiceCatalog {
public:
    static constexpr const char* kUnknownService = "unknown";

    ServiceCatalog() = default;

    /**
     * @brief Constructs a catalog with operator-defined mappings.
     * @param userMappings Port to service name overrides.
     */
    explicit ServiceCatalog(std::map<uint16_t, std::string> userMappings);

    /**
     * @brief Resolves the service name of a port.
     * @param port Port number.
     * @return User mapping, else well-known name, else "unknown".
     */
    std::string lookup(uint16_t port) const;

    /**
     * @brief Returns the operator-defined name of a port, if any.
     */
    std::optional<std::string> userMapping(uint16_t port) const;

    /**
     * @brief Sets or replaces the user mapping of a port.
     * @param port Port number.
     * @param serviceName Service name.
     */
    void setMapping(uint16_t port, const std::string& serviceName);

    /**
     * @brief Replaces all user mappings.
     * @param userMappings New mappings.
     */
    void replaceMappings(std::map<uint16_t, std::string> userMappings);

    /**
     * @brief Returns a copy of the user mappings.
     */
    std::map<uint16_t, std::string> userMappings() const;

    /**
     * @brief Gets the built-in map of well-known services.
     * @return Reference to the map of port numbers to service names.
     */
    static const std::unordered_map<uint16_t, std::string>& getKnownServices();

private:
    mutable std::mutex mutex_;
    std::map<uint16_t, std::string> userMappings_;
};

} // namespace dockports::core
