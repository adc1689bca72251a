/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <stdexcept>

namespace grid_deploy {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_ && workers_.empty()) return;
        accepting_ = false;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
    idle_cv_.notify_all();
}

bool ThreadPool::enqueue(std::function<void(std::stop_token)> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

bool ThreadPool::post(std::function<void()> func) {
    return enqueue([f = std::move(func)](std::stop_token) { f(); });
}

bool ThreadPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && active_tasks_.load() == 0;
    });
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Drain queued work before honoring a stop request.
            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            ++active_tasks_;
        }

        task(stop);

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace grid_deploy
