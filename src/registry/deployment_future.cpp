/**
 * @file deployment_future.cpp
 * @brief DeploymentFuture / DeploymentPromise implementation.
 */

#include "registry/deployment_future.hpp"

#include <atomic>

namespace grid_deploy {

// ── DeploymentPromise ────────────────────────

DeploymentPromise::DeploymentPromise()
    : state_(std::make_shared<DeploymentFuture::State>()) {}

DeploymentFuture DeploymentPromise::future() const {
    return DeploymentFuture(state_);
}

bool DeploymentPromise::set(Result<void> result) const {
    std::vector<CompletionCallback> callbacks;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->result) return false;
        state_->result = std::move(result);
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    for (const auto& cb : callbacks) cb(*state_->result);
    return true;
}

// ── DeploymentFuture ─────────────────────────

DeploymentFuture DeploymentFuture::ready(Result<void> result) {
    DeploymentPromise promise;
    promise.set(std::move(result));
    return promise.future();
}

bool DeploymentFuture::is_ready() const {
    std::lock_guard lock(state_->mutex);
    return state_->result.has_value();
}

Result<void> DeploymentFuture::get() const {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->result.has_value(); });
    return *state_->result;
}

std::optional<Result<void>> DeploymentFuture::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(state_->mutex);
    if (!state_->cv.wait_for(lock, timeout, [this] { return state_->result.has_value(); })) {
        return std::nullopt;
    }
    return *state_->result;
}

void DeploymentFuture::then(CompletionCallback callback) const {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->result) {
            state_->callbacks.push_back(std::move(callback));
            return;
        }
    }
    // The result never changes once set, so reading it unlocked is safe.
    callback(*state_->result);
}

DeploymentFuture DeploymentFuture::all(const std::vector<DeploymentFuture>& futures) {
    if (futures.empty()) return ready();

    DeploymentPromise promise;
    auto remaining = std::make_shared<std::atomic<size_t>>(futures.size());

    for (const auto& f : futures) {
        f.then([promise, remaining](const Result<void>& result) {
            if (!result) {
                promise.set(result);
                return;
            }
            if (remaining->fetch_sub(1) == 1) promise.set(Result<void>{});
        });
    }
    return promise.future();
}

}  // namespace grid_deploy
