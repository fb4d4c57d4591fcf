/**
 * @file Errors.hpp
 * @brief Exception types raised by the port sources and the hidden port store.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dockports::core {

/**
 * @brief The container runtime could not be reached or answered with garbage.
 */
class RuntimeUnavailable : public std::runtime_error {
public:
    explicit RuntimeUnavailable(const std::string& message)
        : std::runtime_error("Container runtime unavailable: " + message) {}
};

/**
 * @brief The host socket tables could not be read.
 */
class ScanUnavailable : public std::runtime_error {
public:
    explicit ScanUnavailable(const std::string& message)
        : std::runtime_error("System port scan unavailable: " + message) {}
};

/**
 * @brief One or more requested ports are not valid port numbers.
 *
 * Carries the offending inputs in their original textual form.
 */
class InvalidPort : public std::runtime_error {
public:
    explicit InvalidPort(std::vector<std::string> invalidInputs)
        : std::runtime_error(buildMessage(invalidInputs)), invalid_(std::move(invalidInputs)) {}

    /**
     * @brief Returns the inputs that failed validation.
     * @return Offending values, e.g. {"70000", "\"abc\""}.
     */
    const std::vector<std::string>& invalidInputs() const { return invalid_; }

private:
    static std::string buildMessage(const std::vector<std::string>& inputs) {
        std::string message = "Port must be an integer between 1 and 65535";
        if (!inputs.empty()) {
            message += ", invalid: ";
            for (size_t i = 0; i < inputs.size(); ++i) {
                if (i > 0)
                    message += ", ";
                message += inputs[i];
            }
        }
        return message;
    }

    std::vector<std::string> invalid_;
};

/**
 * @brief The hidden port state could not be durably written.
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error("Failed to persist hidden ports: " + message) {}
};

} // namespace dockports::core
