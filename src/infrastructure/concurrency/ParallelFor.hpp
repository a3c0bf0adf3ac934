#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <semaphore>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace migengine::infra {

/**
 * @brief Default cap for per-file parallelism: four tasks per hardware thread.
 */
inline int defaultFileConcurrency() {
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()) * 4);
}

namespace detail {

/**
 * @brief parallelFor with the task launcher supplied by the caller.
 *
 * launch(body) must return a future for body run on another thread, or throw
 * std::system_error with resource_unavailable_try_again when no thread can be
 * started. On that error the oldest unfinished task is awaited and the launch
 * retried; with nothing left to wait for, the item runs on the calling thread.
 */
template <typename Launch, typename Fn>
void runParallel(Launch&& launch, size_t count, int concurrency, Fn&& fn) {
    std::unique_ptr<std::counting_semaphore<>> limiter;
    if (concurrency > 0) {
        limiter = std::make_unique<std::counting_semaphore<>>(concurrency);
    }

    std::vector<std::future<void>> tasks;
    tasks.reserve(count);
    size_t settled = 0; // tasks[0, settled) are known to be finished

    for (size_t i = 0; i < count; ++i) {
        if (limiter) {
            limiter->acquire();
        }

        auto body = [&fn, sem = limiter.get(), i]() {
            struct Release {
                std::counting_semaphore<>* sem;
                ~Release() {
                    if (sem) {
                        sem->release();
                    }
                }
            } release{sem};

            fn(i);
        };

        while (true) {
            try {
                tasks.push_back(launch(body));
                break;
            } catch (const std::system_error& e) {
                if (e.code() != std::errc::resource_unavailable_try_again) {
                    throw;
                }
            }

            if (settled == tasks.size()) {
                std::packaged_task<void()> task(body);
                tasks.push_back(task.get_future());
                task();
                break;
            }
            tasks[settled++].wait();
        }
    }

    std::exception_ptr firstError;
    for (auto& task : tasks) {
        try {
            task.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace detail

/**
 * @brief Runs fn(i) for every i in [0, count) with one task per index.
 *
 * With concurrency <= 0 every task is launched immediately and the scheduler
 * alone limits parallelism. A positive concurrency caps the number of tasks
 * in flight with a counting semaphore acquired before each launch. When the
 * system refuses another thread, the call waits for earlier tasks instead of
 * failing.
 *
 * Blocks until every task has finished. If any task threw, the first
 * exception (in index order) is rethrown after all tasks have drained.
 *
 * @param count Number of work items.
 * @param concurrency Maximum tasks in flight, or 0 for unbounded.
 * @param fn Callable taking the item index.
 */
template <typename Fn>
void parallelFor(size_t count, int concurrency, Fn&& fn) {
    detail::runParallel(
        [](auto& body) { return std::async(std::launch::async, body); }, count, concurrency,
        std::forward<Fn>(fn));
}

} // namespace migengine::infra
