/**
 * @file deployment_coordinator.hpp
 * @brief Cluster-wide deployment state machine and redeployment protocol.
 *
 * On every deploy or topology change the coordinator recomputes the full
 * assignment of each affected deployment, diffs it against what it last
 * published, and pushes per-node commands. Work on one deployment name is
 * serialized by that deployment's record lock; different names proceed
 * concurrently.
 */

#pragma once

#include "assignment/assignment.hpp"
#include "cluster/affinity.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "network/message_bus.hpp"
#include "registry/deployment_future.hpp"
#include "registry/deployment_registry.hpp"
#include "service/service_configuration.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace grid_deploy {

struct CoordinatorOptions {
    std::chrono::milliseconds undeploy_timeout{10'000};
    std::chrono::milliseconds reconcile_interval{0};   ///< 0 = no periodic reconciliation
    size_t thread_count{2};
};

class DeploymentCoordinator {
public:
    DeploymentCoordinator(IMessageBus& bus,
                          DeploymentRegistry& registry,
                          const IAffinityResolver* affinity,
                          Logger logger,
                          MetricsCollector* metrics = nullptr,
                          CoordinatorOptions options = {});
    ~DeploymentCoordinator();

    DeploymentCoordinator(const DeploymentCoordinator&) = delete;
    DeploymentCoordinator& operator=(const DeploymentCoordinator&) = delete;

    /**
     * @brief Register a deployment and fan out its initial assignment.
     *
     * Validation and name conflicts are reported synchronously through an
     * already-completed future. Otherwise the future completes once start
     * commands have been issued to every target node.
     */
    DeploymentFuture deploy(ServiceConfiguration config);

    /**
     * @brief Cancel every instance of `name` and drop its descriptor.
     *
     * Completes once all nodes report zero live instances or the undeploy
     * timeout expires. Undeploying an unknown name completes immediately.
     */
    DeploymentFuture undeploy(const ServiceName& name);
    DeploymentFuture undeploy_all();

    /// Topology feed callback. Snapshots not newer than the current one are ignored.
    void on_topology_change(const TopologyPtr& snapshot);

    /// Report handler for the message bus.
    void on_report(const CountReport& report);

    /**
     * @brief Recompute every live deployment and resend absolute targets to
     *        nodes that missed a command or run a different count than assigned.
     *
     * Also retries CancelAll on nodes that were unreachable or still running
     * instances when an undeploy finished.
     */
    void reconcile();

    /// Start the periodic reconciliation timer (if configured).
    void start();

    /// Stop the timer and drain background work.
    void stop();

    [[nodiscard]] TopologyPtr topology() const;
    [[nodiscard]] std::optional<Assignment> published_assignment(const ServiceName& name) const;
    [[nodiscard]] std::optional<DeploymentState> state(const ServiceName& name) const;
    [[nodiscard]] std::vector<ServiceName> deployment_names() const;

    /// Nodes still owed a CancelAll for an undeployed `name`.
    [[nodiscard]] std::set<NodeId> pending_cancels(const ServiceName& name) const;

    [[nodiscard]] DeploymentRegistry& registry() noexcept { return registry_; }

private:
    struct Record {
        std::mutex mutex;
        ConfigurationPtr config;
        DeploymentId id{0};
        DeploymentState state{DeploymentState::Pending};
        Assignment published;
        std::set<NodeId> synced;                    ///< Nodes known to hold the published target
        std::optional<DeploymentFuture> undeploy_future;
    };
    using RecordPtr = std::shared_ptr<Record>;

    /// CancelAll commands that could not be confirmed when an undeploy finished.
    struct OwedCancel {
        DeploymentId id{0};
        std::set<NodeId> nodes;
    };

    // Callers hold record.mutex.
    Result<void> publish(Record& record);
    void send_absolute_targets(Record& record, const TopologySnapshot& topology);
    bool send(Record& record, const NodeId& node, CommandKind kind, int64_t count);
    void transition(Record& record, DeploymentState state);

    Result<void> fan_out(const RecordPtr& record);
    void finish_undeploy(const RecordPtr& record, std::set<NodeId> nodes);
    void owe_cancel(const ServiceName& name, DeploymentId id, const std::set<NodeId>& nodes);
    void retry_cancels(const TopologySnapshot& topology, bool forget_departed);

    [[nodiscard]] RecordPtr find(const ServiceName& name) const;
    [[nodiscard]] std::vector<RecordPtr> records() const;

    void reconcile_loop(std::stop_token stop);

    IMessageBus& bus_;
    DeploymentRegistry& registry_;
    const IAffinityResolver* affinity_;
    Logger logger_;
    MetricsCollector* metrics_;
    CoordinatorOptions options_;

    mutable std::shared_mutex topology_mutex_;
    TopologyPtr topology_;

    mutable std::shared_mutex records_mutex_;
    std::map<ServiceName, RecordPtr> records_;
    std::atomic<DeploymentId> next_deployment_id_{1};

    mutable std::mutex owed_mutex_;
    std::map<ServiceName, OwedCancel> owed_cancels_;

    std::mutex timer_mutex_;
    std::condition_variable_any timer_cv_;
    std::jthread reconcile_thread_;

    // Declared last: joined before the records it touches are destroyed.
    ThreadPool workers_;
};

}  // namespace grid_deploy
