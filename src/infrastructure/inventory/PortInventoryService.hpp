#pragma once

#include "core/ports/ClassificationView.hpp"
#include "core/ports/PortAggregator.hpp"
#include "core/ports/ServiceCatalog.hpp"
#include "core/services/IContainerPortSource.hpp"
#include "core/services/ISystemPortSource.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/storage/HiddenPortStore.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace dockports::infra {

/**
 * @brief Per-source query deadlines.
 */
struct InventoryOptions {
    std::chrono::milliseconds containerTimeout{3000}; ///< Container runtime deadline
    std::chrono::milliseconds systemTimeout{3000};    ///< Socket scan deadline
};

/**
 * @brief Result of one inventory pass.
 */
struct InventoryReport {
    core::ClassificationView view;                 ///< Classified ports
    bool degraded{false};                          ///< At least one source failed
    std::vector<std::string> warnings;             ///< One message per failed source
    size_t containersSeen{0};                      ///< Running containers reported by the runtime
    std::chrono::system_clock::time_point generatedAt; ///< When the pass finished
};

/**
 * @brief Builds the classified port view on request.
 *
 * Queries the container runtime and the host socket tables concurrently on
 * the shared worker pool, waits for each up to its deadline, aggregates
 * whatever arrived and overlays the current hidden set. A failed or late
 * source degrades the report instead of failing it.
 */
class PortInventoryService {
public:
    /**
     * @brief Constructs the service.
     * @param context Worker pool the source queries run on; must be started.
     * @param containers Container source, or nullptr when the runtime is disabled.
     * @param system Host socket source, or nullptr when the scan is disabled.
     * @param store Hidden port store.
     * @param catalog Service name catalog.
     * @param options Source deadlines.
     */
    PortInventoryService(AsioContext& context, std::shared_ptr<core::IContainerPortSource> containers,
                         std::shared_ptr<core::ISystemPortSource> system, HiddenPortStore& store,
                         core::ServiceCatalog& catalog, InventoryOptions options = {});

    /**
     * @brief Runs one full collection, aggregation and classification pass.
     * @return The report.
     */
    InventoryReport collect() const;

    /**
     * @brief Checks whether a listing entry matches a search text.
     *
     * Port records match on port number, protocol, service, container, image
     * or process name (case-insensitive substring). Gap segments match their
     * "start-end" text, the words "available" and "unused", and a numeric
     * search for a port inside them.
     *
     * @param entry Listing entry.
     * @param search Search text; empty matches everything.
     * @return True if the entry should be listed.
     */
    static bool matchesSearch(const core::ViewEntry& entry, const std::string& search);

    /**
     * @brief Same as matchesSearch() for a plain record.
     */
    static bool matchesSearch(const core::PortRecord& record, const std::string& search);

private:
    AsioContext& context_;
    std::shared_ptr<core::IContainerPortSource> containers_;
    std::shared_ptr<core::ISystemPortSource> system_;
    HiddenPortStore& store_;
    core::ServiceCatalog& catalog_;
    InventoryOptions options_;
    core::PortAggregator aggregator_;
};

} // namespace dockports::infra
