#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <pthread.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <string>

namespace migengine::infra {

namespace {

/// Runs the context until it is stopped, surviving exceptions that escape handlers.
void runWorker(asio::io_context& context, size_t index) {
    auto name = "migengine-io-" + std::to_string(index);
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());

    while (!context.stopped()) {
        try {
            context.run();
        } catch (const std::exception& e) {
            spdlog::error("Unhandled exception in I/O worker {}: {}", index, e.what());
        }
    }
}

} // namespace

AsioContext::AsioContext(size_t threadCount) : threadCount_(std::max<size_t>(threadCount, 1)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    // A context stopped earlier must be reset before it runs again
    if (ioContext_.stopped()) {
        ioContext_.restart();
    }
    workGuard_.emplace(ioContext_.get_executor());

    threads_.reserve(threadCount_);
    for (size_t index = 0; index < threadCount_; ++index) {
        threads_.emplace_back(runWorker, std::ref(ioContext_), index);
    }
    spdlog::debug("I/O context started with {} worker threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& worker : threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    threads_.clear();
    spdlog::debug("I/O context stopped");
}

} // namespace migengine::infra
