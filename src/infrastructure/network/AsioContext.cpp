#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace dockports::infra {

AsioContext::AsioContext(size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {
    spdlog::debug("AsioContext '{}' created with {} threads", name_, threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { runWorker(i); });
    }

    spdlog::info("AsioContext '{}' started with {} worker threads", name_, threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::info("AsioContext '{}' stopped", name_);
}

void AsioContext::runWorker(size_t index) {
    spdlog::debug("{} worker {} started", name_, index);

    // Keep serving after a handler throws
    while (true) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("{} worker {}: unhandled exception in handler: {}", name_, index,
                          e.what());
        }
    }

    spdlog::debug("{} worker {} stopped", name_, index);
}

} // namespace dockports::infra
