#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace dockports::infra {

/**
 * @brief Owns an Asio I/O context and the worker threads that run it.
 *
 * The port sources are blocking calls; the inventory service submits them
 * here so that both run concurrently and each can be abandoned after its
 * deadline without blocking the caller.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads.
     * @param name Pool name used in log messages.
     */
    explicit AsioContext(size_t threadCount = 2, std::string name = "asio");

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     */
    void stop();

    bool isRunning() const { return running_; }
    const std::string& name() const { return name_; }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on the worker pool.
     * @tparam Handler Callable type.
     * @param handler The handler to execute.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a callable on the worker pool and returns its result as a future.
     *
     * Exceptions thrown by the callable are rethrown from future::get(). The
     * returned future does not block on destruction.
     *
     * @tparam Fn Callable type.
     * @param fn The callable to execute.
     * @return Future holding the callable's result.
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();

        post([promise, task = std::forward<Fn>(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<Result>) {
                    task();
                    promise->set_value();
                } else {
                    promise->set_value(task());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        return future;
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
    std::string name_;
};

} // namespace dockports::infra
