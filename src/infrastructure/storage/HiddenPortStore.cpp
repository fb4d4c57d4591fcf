#include "infrastructure/storage/HiddenPortStore.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace dockports::infra {

namespace {

constexpr int kFormatVersion = 1;
constexpr core::Protocol kBothProtocols[] = {core::Protocol::Tcp, core::Protocol::Udp};

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

HiddenPortStore::HiddenPortStore(std::filesystem::path path) : path_(std::move(path)) {
    loadedTime_ = fileTime();
    current_ = readFile();
    if (!current_) {
        current_ = std::make_shared<const core::HiddenPortSet>();
    }
    spdlog::info("Loaded {} hidden port entries from {}", current_->size(), path_.string());
}

std::vector<core::HiddenPortEntry> HiddenPortStore::list() const {
    return snapshot()->entries();
}

std::shared_ptr<const core::HiddenPortSet> HiddenPortStore::snapshot() const {
    auto time = fileTime();
    {
        std::lock_guard lock(snapshotMutex_);
        if (time == loadedTime_) {
            return current_;
        }
    }

    // A writer in progress will publish a fresh snapshot itself
    std::unique_lock writeLock(writeMutex_, std::try_to_lock);
    if (!writeLock.owns_lock()) {
        std::lock_guard lock(snapshotMutex_);
        return current_;
    }

    auto reloaded = time ? readFile() : std::make_shared<const core::HiddenPortSet>();
    std::lock_guard lock(snapshotMutex_);
    loadedTime_ = time;
    if (reloaded) {
        spdlog::info("Hidden port file changed on disk, reloaded {} entries", reloaded->size());
        current_ = std::move(reloaded);
    }
    return current_;
}

MutationResult HiddenPortStore::hide(long long port, std::optional<core::Protocol> protocol) {
    return mutate(Operation::Hide, {core::PortSpec::single(port, protocol)});
}

MutationResult HiddenPortStore::unhide(long long port, std::optional<core::Protocol> protocol) {
    return mutate(Operation::Unhide, {core::PortSpec::single(port, protocol)});
}

MutationResult HiddenPortStore::hideBatch(const std::vector<core::PortSpec>& specs) {
    return mutate(Operation::Hide, specs);
}

MutationResult HiddenPortStore::unhideBatch(const std::vector<core::PortSpec>& specs) {
    return mutate(Operation::Unhide, specs);
}

MutationResult HiddenPortStore::mutate(Operation operation,
                                       const std::vector<core::PortSpec>& specs) {
    std::vector<std::string> invalid;
    for (const auto& spec : specs) {
        if (!spec.isValid()) {
            invalid.push_back(spec.raw);
        }
    }
    if (!invalid.empty()) {
        throw core::InvalidPort(std::move(invalid));
    }

    std::lock_guard writeLock(writeMutex_);

    // Start from the file on disk if another process changed it
    auto time = fileTime();
    std::shared_ptr<const core::HiddenPortSet> base;
    bool stale = false;
    {
        std::lock_guard lock(snapshotMutex_);
        base = current_;
        stale = time != loadedTime_;
    }
    if (stale) {
        auto reloaded = time ? readFile() : std::make_shared<const core::HiddenPortSet>();
        std::lock_guard lock(snapshotMutex_);
        loadedTime_ = time;
        if (reloaded) {
            spdlog::info("Hidden port file changed on disk, reloaded {} entries", reloaded->size());
            current_ = reloaded;
            base = std::move(reloaded);
        }
    }

    auto next = std::make_shared<core::HiddenPortSet>(*base);
    MutationResult result;
    for (const auto& spec : specs) {
        auto start = static_cast<uint16_t>(spec.start);
        auto end = static_cast<uint16_t>(spec.end);
        for (auto protocol : kBothProtocols) {
            if (spec.protocol && *spec.protocol != protocol) {
                continue;
            }
            result.changed += operation == Operation::Hide ? next->add(protocol, start, end)
                                                           : next->remove(protocol, start, end);
        }
    }

    if (result.changed > 0) {
        writeFile(*next);
        auto written = fileTime();

        std::lock_guard lock(snapshotMutex_);
        current_ = next;
        loadedTime_ = written;
    }

    spdlog::info("{} {} spec(s): {} port/protocol pairs changed, {} entries stored",
                 operation == Operation::Hide ? "Hid" : "Unhid", specs.size(), result.changed,
                 next->size());

    result.entries = next->entries();
    return result;
}

nlohmann::json HiddenPortStore::toJson(const core::HiddenPortSet& set) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : set.entries()) {
        entries.push_back({{"protocol", core::protocolToString(entry.protocol)},
                           {"start", entry.start},
                           {"end", entry.end}});
    }
    return {{"version", kFormatVersion}, {"entries", entries}};
}

core::HiddenPortSet HiddenPortStore::fromJson(const nlohmann::json& j) {
    std::vector<core::HiddenPortEntry> entries;

    if (j.is_array()) {
        for (const auto& item : j) {
            if (!item.is_number_integer() || !core::isValidPort(item.get<long long>())) {
                spdlog::warn("Ignoring invalid hidden port {}", item.dump());
                continue;
            }
            auto port = item.get<uint16_t>();
            for (auto protocol : kBothProtocols) {
                entries.push_back({protocol, port, port});
            }
        }
        return core::HiddenPortSet(entries);
    }

    if (!j.is_object() || !j.contains("entries") || !j["entries"].is_array()) {
        throw std::runtime_error("unrecognized hidden port document");
    }

    int version = j.value("version", kFormatVersion);
    if (version > kFormatVersion) {
        spdlog::warn("Hidden port file has newer format version {}", version);
    }

    for (const auto& item : j["entries"]) {
        if (!item.is_object()) {
            continue;
        }
        auto protocol = core::protocolFromString(item.value("protocol", ""));
        long long start = item.value("start", 0LL);
        long long end = item.value("end", start);
        if (!protocol || !core::isValidPort(start) || !core::isValidPort(end) || start > end) {
            spdlog::warn("Ignoring invalid hidden port entry {}", item.dump());
            continue;
        }
        entries.push_back({*protocol, static_cast<uint16_t>(start), static_cast<uint16_t>(end)});
    }

    return core::HiddenPortSet(entries);
}

std::shared_ptr<const core::HiddenPortSet> HiddenPortStore::readFile() const {
    if (!std::filesystem::exists(path_)) {
        return std::make_shared<const core::HiddenPortSet>();
    }

    try {
        std::ifstream file(path_);
        if (!file) {
            spdlog::error("Failed to open hidden port file: {}", path_.string());
            return nullptr;
        }

        nlohmann::json j;
        file >> j;
        return std::make_shared<const core::HiddenPortSet>(fromJson(j));
    } catch (const std::exception& e) {
        spdlog::error("Failed to load hidden ports from {}: {}", path_.string(), e.what());
        return nullptr;
    }
}

void HiddenPortStore::writeFile(const core::HiddenPortSet& set) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    auto tempPath = path_;
    tempPath += ".tmp";
    auto data = toJson(set).dump(2);

    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw core::PersistenceError(errnoMessage("open(" + tempPath.string() + ")"));
    }

    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = errnoMessage("write(" + tempPath.string() + ")");
            ::close(fd);
            ::unlink(tempPath.c_str());
            throw core::PersistenceError(message);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        auto message = errnoMessage("fsync(" + tempPath.string() + ")");
        ::close(fd);
        ::unlink(tempPath.c_str());
        throw core::PersistenceError(message);
    }

    if (::close(fd) != 0) {
        auto message = errnoMessage("close(" + tempPath.string() + ")");
        ::unlink(tempPath.c_str());
        throw core::PersistenceError(message);
    }

    if (std::rename(tempPath.c_str(), path_.c_str()) != 0) {
        auto message = errnoMessage("rename(" + tempPath.string() + ", " + path_.string() + ")");
        ::unlink(tempPath.c_str());
        throw core::PersistenceError(message);
    }

    // Make the rename itself durable
    auto dir = path_.has_parent_path() ? path_.parent_path() : std::filesystem::path(".");
    int dirFd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        throw core::PersistenceError(errnoMessage("open(" + dir.string() + ")"));
    }
    if (::fsync(dirFd) != 0) {
        auto message = errnoMessage("fsync(" + dir.string() + ")");
        ::close(dirFd);
        throw core::PersistenceError(message);
    }
    ::close(dirFd);

    spdlog::debug("Saved {} hidden port entries to {}", set.size(), path_.string());
}

std::optional<std::filesystem::file_time_type> HiddenPortStore::fileTime() const {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

} // namespace dockports::infra
