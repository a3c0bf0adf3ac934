#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace migengine::infra {

/**
 * @brief Fixed set of long-lived worker threads fed from a bounded queue.
 *
 * submit() blocks while the queue is full, which throttles producers to the
 * pace of the workers. stop() lets the workers drain every queued job
 * before they exit.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @brief Constructs a pool.
     * @param workers Number of worker threads, at least 1.
     * @param queueCapacity Maximum queued jobs; 0 selects workers * 2.
     */
    explicit WorkerPool(size_t workers, size_t queueCapacity = 0);

    /**
     * @brief Stops the pool if still running.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already started.
     */
    void start();

    /**
     * @brief Queues a job, blocking while the queue is full.
     * @return False if the pool has been stopped.
     */
    bool submit(Job job);

    /**
     * @brief Rejects further submissions, drains the queue and joins the workers.
     */
    void stop();

    size_t workerCount() const { return workerCount_; }
    size_t queueCapacity() const { return queueCapacity_; }

    /**
     * @brief Returns the number of jobs that threw.
     */
    size_t failedJobs() const { return failedJobs_.load(); }

private:
    void workerLoop();

    size_t workerCount_;
    size_t queueCapacity_;
    std::deque<Job> queue_;
    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    bool started_{false};
    bool stopping_{false};
    std::atomic<size_t> failedJobs_{0};
};

} // namespace migengine::infra
