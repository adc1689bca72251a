/**
 * @file local_instance_manager.hpp
 * @brief Per-node owner of running service instances.
 *
 * Receives this node's slice of every assignment as commands, starts and
 * cancels local instances to match, and reports monotonic started/cancelled
 * counters back through the message bus.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "instance/service_instance.hpp"
#include "network/message_bus.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace grid_deploy {

/**
 * @brief Observable state of one deployment on this node.
 */
struct LocalServiceStatus {
    ServiceName name;
    DeploymentId deployment_id{0};
    uint32_t target{0};
    size_t live{0};
    uint64_t started{0};
    uint64_t cancelled{0};
    uint64_t init_failures{0};
};

class LocalInstanceManager : public INodeEndpoint {
public:
    LocalInstanceManager(NodeId node, IMessageBus& bus, Logger logger,
                         MetricsCollector* metrics = nullptr);
    ~LocalInstanceManager() override;

    LocalInstanceManager(const LocalInstanceManager&) = delete;
    LocalInstanceManager& operator=(const LocalInstanceManager&) = delete;

    // ── INodeEndpoint ────────────────────────
    /// Queues the command; it is applied asynchronously, in arrival order.
    void on_command(const AssignmentCommand& command) override;
    Bytes on_request(const Bytes& request) override;

    /// Cancel every instance (reporting the cancellations) and stop the executor.
    void stop();

    /// Wait until every queued command has been applied.
    bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] const NodeId& node_id() const noexcept { return node_; }
    [[nodiscard]] std::optional<LocalServiceStatus> status(const ServiceName& name) const;
    [[nodiscard]] std::vector<LocalServiceStatus> statuses() const;
    [[nodiscard]] size_t live_count(const ServiceName& name) const;

    /// Ids of live instances of `name`, oldest first.
    [[nodiscard]] std::vector<InstanceId> instance_ids(const ServiceName& name) const;

private:
    struct Slot {
        DeploymentId deployment_id{0};
        ConfigurationPtr configuration;
        uint32_t target{0};
        std::vector<std::shared_ptr<ServiceInstance>> instances;   // oldest first
        uint64_t started{0};
        uint64_t cancelled{0};
        uint64_t init_failures{0};
    };

    void apply(const AssignmentCommand& command);
    void reset_slot(const ServiceName& name, const AssignmentCommand& command);
    void start_instances(const ServiceName& name, int64_t count);
    void cancel_instances(const ServiceName& name, int64_t count);
    void report(const ServiceName& name);

    NodeId node_;
    IMessageBus& bus_;
    Logger logger_;
    MetricsCollector* metrics_;

    mutable std::shared_mutex mutex_;
    std::map<ServiceName, Slot> slots_;

    std::atomic<InstanceId> next_instance_id_{1};
    std::atomic<uint64_t> round_robin_{0};
    std::atomic<bool> stopped_{false};

    // Declared last: destroyed first, so queued commands never outlive the slots.
    ThreadPool executor_;
};

}  // namespace grid_deploy
