#pragma once

#include "core/ports/HiddenPortSet.hpp"
#include "core/types/HiddenPortEntry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace dockports::infra {

/**
 * @brief Outcome of a hide or unhide operation.
 */
struct MutationResult {
    std::vector<core::HiddenPortEntry> entries; ///< Full normalized set after the mutation
    uint32_t changed{0};                        ///< (port, protocol) pairs whose state changed
};

/**
 * @brief Durable, thread-safe store of hidden ports.
 *
 * Mutations are serialized and written to disk before they become visible:
 * the new set is persisted through a temporary file that is fsynced and
 * renamed over the target, then published as the current snapshot. Readers
 * take the last committed snapshot and never wait for a write in progress.
 */
class HiddenPortStore {
public:
    /**
     * @brief Opens the store backed by the given file.
     *
     * A missing file means nothing is hidden. An unreadable or corrupt file is
     * logged and treated as empty; it is replaced on the next mutation.
     *
     * @param path Path of the hidden port file.
     */
    explicit HiddenPortStore(std::filesystem::path path);

    /**
     * @brief Returns the current normalized entry set.
     */
    std::vector<core::HiddenPortEntry> list() const;

    /**
     * @brief Returns the last committed set.
     *
     * Picks up changes made to the file by other processes.
     */
    std::shared_ptr<const core::HiddenPortSet> snapshot() const;

    /**
     * @brief Hides a single port.
     * @param port Port number.
     * @param protocol Target protocol, both when omitted.
     * @return The full set after the mutation.
     * @throws core::InvalidPort if port is outside 1-65535.
     * @throws core::PersistenceError if the new set could not be written.
     */
    MutationResult hide(long long port, std::optional<core::Protocol> protocol = std::nullopt);

    /**
     * @brief Unhides a single port, splitting a range if needed.
     * @see hide()
     */
    MutationResult unhide(long long port, std::optional<core::Protocol> protocol = std::nullopt);

    /**
     * @brief Hides every spec of a batch, or none.
     * @param specs Single ports or inclusive ranges.
     * @return The full set after the mutation.
     * @throws core::InvalidPort listing every invalid spec; nothing is applied.
     * @throws core::PersistenceError if the new set could not be written.
     */
    MutationResult hideBatch(const std::vector<core::PortSpec>& specs);

    /**
     * @brief Unhides every spec of a batch, or none.
     * @see hideBatch()
     */
    MutationResult unhideBatch(const std::vector<core::PortSpec>& specs);

    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Serializes a set to the persisted document format.
     * @param set Hidden set.
     * @return {"version": 1, "entries": [...]}.
     */
    static nlohmann::json toJson(const core::HiddenPortSet& set);

    /**
     * @brief Parses a persisted document.
     *
     * Accepts the versioned format and the legacy bare array of port
     * numbers, which hides each port on both protocols.
     *
     * @param j Parsed document.
     * @return The normalized set.
     * @throws std::runtime_error if the document has neither format.
     */
    static core::HiddenPortSet fromJson(const nlohmann::json& j);

private:
    enum class Operation { Hide, Unhide };

    MutationResult mutate(Operation operation, const std::vector<core::PortSpec>& specs);
    std::shared_ptr<const core::HiddenPortSet> readFile() const; // nullptr on unreadable file
    void writeFile(const core::HiddenPortSet& set) const;
    std::optional<std::filesystem::file_time_type> fileTime() const;

    std::filesystem::path path_;

    mutable std::mutex writeMutex_;
    mutable std::mutex snapshotMutex_;
    mutable std::shared_ptr<const core::HiddenPortSet> current_;
    mutable std::optional<std::filesystem::file_time_type> loadedTime_;
};

} // namespace dockports::infra
