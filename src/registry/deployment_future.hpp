/**
 * @file deployment_future.hpp
 * @brief Completion handle for deploy/undeploy requests.
 *
 * Supports both blocking waits and callbacks. A deploy future completes once
 * the initial fan-out has been issued, not once instances are running.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace grid_deploy {

using CompletionCallback = std::function<void(const Result<void>&)>;

class DeploymentPromise;

class DeploymentFuture {
public:
    /// An already-completed future.
    static DeploymentFuture ready(Result<void> result = {});

    [[nodiscard]] bool is_ready() const;

    /// Block until completion.
    [[nodiscard]] Result<void> get() const;

    /// Block up to `timeout`; nullopt if still pending.
    [[nodiscard]] std::optional<Result<void>> wait_for(std::chrono::milliseconds timeout) const;

    /// Run `callback` on completion (immediately, on this thread, if already complete).
    void then(CompletionCallback callback) const;

    /// Completes when every input completes; fails with the first error.
    static DeploymentFuture all(const std::vector<DeploymentFuture>& futures);

private:
    friend class DeploymentPromise;

    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::optional<Result<void>> result;
        std::vector<CompletionCallback> callbacks;
    };

    explicit DeploymentFuture(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class DeploymentPromise {
public:
    DeploymentPromise();

    [[nodiscard]] DeploymentFuture future() const;

    /// Complete the future. Only the first call has an effect.
    bool set(Result<void> result) const;

private:
    std::shared_ptr<DeploymentFuture::State> state_;
};

}  // namespace grid_deploy
