#include "infrastructure/concurrency/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace migengine::infra {

WorkerPool::WorkerPool(size_t workers, size_t queueCapacity)
    : workerCount_(workers > 0 ? workers : 1),
      queueCapacity_(queueCapacity > 0 ? queueCapacity : workerCount_ * 2) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard lock(mutex_);
    if (started_ || stopping_) {
        return;
    }
    started_ = true;

    threads_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        threads_.emplace_back([this]() { workerLoop(); });
    }
    spdlog::debug("Worker pool started with {} workers (queue capacity {})", workerCount_,
                  queueCapacity_);
}

bool WorkerPool::submit(Job job) {
    std::unique_lock lock(mutex_);
    notFull_.wait(lock, [this]() { return stopping_ || queue_.size() < queueCapacity_; });
    if (stopping_) {
        return false;
    }

    queue_.push_back(std::move(job));
    lock.unlock();
    notEmpty_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;

        // Jobs queued before start() still run
        if (!started_ && !queue_.empty()) {
            started_ = true;
            for (size_t i = 0; i < workerCount_; ++i) {
                threads_.emplace_back([this]() { workerLoop(); });
            }
        }
    }
    notEmpty_.notify_all();
    notFull_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    spdlog::debug("Worker pool stopped ({} failed jobs)", failedJobs_.load());
}

void WorkerPool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            notEmpty_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return; // stopping and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        notFull_.notify_one();

        try {
            job();
        } catch (const std::exception& e) {
            ++failedJobs_;
            spdlog::error("Worker job failed: {}", e.what());
        }
    }
}

} // namespace migengine::infra
