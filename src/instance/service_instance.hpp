/**
 * @file service_instance.hpp
 * @brief One running unit of service logic on one node.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "service/service.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace grid_deploy {

/**
 * @brief Owns an IService object and the thread executing it.
 *
 * States: Created -> Initialized -> Executing -> Cancelled, or
 * Created -> Failed when init() fails. cancel() releases the thread and the
 * service object before returning, and the destructor cancels.
 */
class ServiceInstance {
public:
    ServiceInstance(InstanceId id, ServiceName name, NodeId node,
                    std::unique_ptr<IService> service);
    ~ServiceInstance();

    ServiceInstance(const ServiceInstance&) = delete;
    ServiceInstance& operator=(const ServiceInstance&) = delete;

    /// Created -> Initialized. Exceptions from init() become InstanceInit errors.
    Result<void> initialize();

    /// Initialized -> Executing: execute() runs on a dedicated thread.
    Result<void> start();

    /// Executing -> Cancelled. Returns true if this call performed the cancel.
    bool cancel();

    /// Route a call to the service. Only valid while Executing.
    Result<Bytes> invoke(std::string_view method, const Bytes& args);

    [[nodiscard]] InstanceState state() const noexcept { return state_.load(); }
    [[nodiscard]] InstanceId id() const noexcept { return id_; }
    [[nodiscard]] bool execute_returned() const noexcept { return execute_returned_.load(); }

    /// Last exception escaping execute() or cancel(), if any.
    [[nodiscard]] std::optional<Error> failure() const;

private:
    [[nodiscard]] ServiceContext context() const;
    void record_failure(std::string message);

    InstanceId id_;
    ServiceName name_;
    NodeId node_;
    std::unique_ptr<IService> service_;
    std::stop_source stop_;
    std::jthread thread_;
    std::atomic<InstanceState> state_{InstanceState::Created};
    std::atomic<bool> execute_returned_{false};

    // Shared by invoke(), exclusive for cancel() so calls finish before release.
    mutable std::shared_mutex mutex_;

    mutable std::mutex failure_mutex_;
    std::optional<Error> failure_;
};

}  // namespace grid_deploy
