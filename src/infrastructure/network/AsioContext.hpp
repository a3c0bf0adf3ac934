#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace migengine::infra {

/**
 * @brief Owns the asio::io_context shared by network probes and monitors.
 *
 * A fixed pool of worker threads runs the context. An executor_work_guard
 * keeps the threads alive while no operation is pending. The application
 * constructs one instance and passes it by reference to every component
 * that performs asynchronous I/O.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext.
     * @param threadCount Number of worker threads, at least 1.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Stops the context and joins all worker threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the threads.
     *
     * Pending handlers are abandoned. A later start() resets the context
     * before running it again.
     */
    void stop();

    bool isRunning() const { return running_.load(); }
    size_t threadCount() const { return threadCount_; }

    asio::io_context& getContext() { return ioContext_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace migengine::infra
