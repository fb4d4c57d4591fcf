#include "infrastructure/inventory/PortInventoryService.hpp"

#include "core/ports/HeuristicPortExtractor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>

namespace dockports::infra {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool containsText(const std::optional<std::string>& field, const std::string& needle) {
    return field && toLower(*field).find(needle) != std::string::npos;
}

// Waits for a source query and turns failures into a warning.
template <typename T>
std::vector<T> awaitSource(std::future<std::vector<T>>& future, std::chrono::milliseconds timeout,
                           const char* sourceName, std::vector<std::string>& warnings) {
    if (future.wait_for(timeout) != std::future_status::ready) {
        auto message = std::string(sourceName) + " query timed out after " +
                       std::to_string(timeout.count()) + " ms";
        spdlog::warn("{}", message);
        warnings.push_back(std::move(message));
        return {};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        spdlog::warn("{}", e.what());
        warnings.emplace_back(e.what());
        return {};
    }
}

} // namespace

PortInventoryService::PortInventoryService(AsioContext& context,
                                           std::shared_ptr<core::IContainerPortSource> containers,
                                           std::shared_ptr<core::ISystemPortSource> system,
                                           HiddenPortStore& store, core::ServiceCatalog& catalog,
                                           InventoryOptions options)
    : context_(context), containers_(std::move(containers)), system_(std::move(system)),
      store_(store), catalog_(catalog), options_(options) {}

InventoryReport PortInventoryService::collect() const {
    std::future<std::vector<core::ContainerInfo>> containerFuture;
    std::future<std::vector<core::ListeningSocket>> socketFuture;

    if (containers_) {
        containerFuture = context_.submit(
            [source = containers_]() { return source->listRunningContainers(); });
    }
    if (system_) {
        socketFuture = context_.submit([source = system_]() { return source->listListeningSockets(); });
    }

    std::vector<std::string> warnings;
    std::vector<core::ContainerInfo> containers;
    std::vector<core::ListeningSocket> sockets;

    if (containerFuture.valid()) {
        containers = awaitSource(containerFuture, options_.containerTimeout, "Container runtime",
                                 warnings);
    }
    if (socketFuture.valid()) {
        sockets = awaitSource(socketFuture, options_.systemTimeout, "System port scan", warnings);
    }

    auto aggregation = aggregator_.aggregate(containers, sockets);
    // Operator names first, then the container owning the port
    for (auto& record : aggregation.used) {
        if (record.containerName.empty()) {
            record.serviceName = catalog_.lookup(record.port);
        } else {
            record.serviceName = catalog_.userMapping(record.port).value_or(record.containerName);
        }
    }

    InventoryReport report{core::ClassificationView::classify(aggregation, store_.snapshot()),
                           !warnings.empty(), std::move(warnings), containers.size(),
                           std::chrono::system_clock::now()};

    spdlog::debug("Inventory: {} containers, {} sockets, {} used records{}", containers.size(),
                  sockets.size(), aggregation.used.size(), report.degraded ? " (degraded)" : "");
    return report;
}

bool PortInventoryService::matchesSearch(const core::PortRecord& record, const std::string& search) {
    if (search.empty()) {
        return true;
    }

    auto needle = toLower(search);
    return std::to_string(record.port).find(needle) != std::string::npos ||
           core::protocolToString(record.protocol) == needle ||
           toLower(record.serviceName).find(needle) != std::string::npos ||
           containsText(record.containerName, needle) || containsText(record.image, needle) ||
           containsText(record.processName, needle);
}

bool PortInventoryService::matchesSearch(const core::ViewEntry& entry, const std::string& search) {
    if (search.empty()) {
        return true;
    }

    if (entry.kind == core::ViewEntry::Kind::Port) {
        return matchesSearch(entry.record, search);
    }

    auto needle = toLower(search);
    auto rangeText = std::to_string(entry.range.start) + "-" + std::to_string(entry.range.end);
    if (rangeText.find(needle) != std::string::npos ||
        std::string("available unused").find(needle) != std::string::npos) {
        return true;
    }

    auto port = core::HeuristicPortExtractor::parsePort(search);
    return port && entry.range.contains(*port);
}

} // namespace dockports::infra
