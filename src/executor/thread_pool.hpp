/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 *
 * A pool of one thread doubles as a serial executor: the instance manager
 * uses it so that commands for a node apply in arrival order.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace grid_deploy {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0, std::string name = "pool");
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts the worker's stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /// Fire-and-forget. Returns false once shutdown has begun.
    bool post(std::function<void()> func);

    /// Block until the queue is empty and no task runs, or the timeout expires.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Stop accepting work, run what is queued, join workers.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void worker_loop(std::stop_token stop);
    bool enqueue(std::function<void(std::stop_token)> task);

    std::string name_;
    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_{true};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = promise, f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("ThreadPool " + name_ + " is shut down")));
    }
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = promise, f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("ThreadPool " + name_ + " is shut down")));
    }
    return future;
}

}  // namespace grid_deploy
