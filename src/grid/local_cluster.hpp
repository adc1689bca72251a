/**
 * @file local_cluster.hpp
 * @brief In-process cluster: topology feed, message bus, one coordinator and
 *        a LocalInstanceManager plus ServiceGrid per node.
 *
 * Used by the daemon and by the multi-node tests. Nodes start and stop at
 * runtime; every change flows through the topology feed exactly as an
 * external membership service would deliver it.
 */

#pragma once

#include "cluster/affinity.hpp"
#include "cluster/topology.hpp"
#include "coordinator/deployment_coordinator.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "grid/service_grid.hpp"
#include "instance/local_instance_manager.hpp"
#include "network/message_bus.hpp"
#include "registry/deployment_registry.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace grid_deploy {

struct LocalClusterOptions {
    CoordinatorOptions coordinator;
    std::chrono::milliseconds proxy_timeout{2000};
};

class LocalCluster {
public:
    /// Uses RendezvousAffinity when `affinity` is null.
    explicit LocalCluster(Logger logger,
                          LocalClusterOptions options = {},
                          std::shared_ptr<IAffinityResolver> affinity = nullptr,
                          MetricsCollector* metrics = nullptr);
    ~LocalCluster();

    LocalCluster(const LocalCluster&) = delete;
    LocalCluster& operator=(const LocalCluster&) = delete;

    /// Bring a node up and publish the new topology.
    Result<TopologyPtr> start_node(NodeDescriptor node);
    Result<TopologyPtr> start_server(const NodeId& id);
    Result<TopologyPtr> start_client(const NodeId& id);

    /// Remove a node from the topology, then cancel its instances.
    Result<void> stop_node(const NodeId& id);

    /// Stop every node and the coordinator.
    void shutdown();

    [[nodiscard]] ServiceGrid* grid(const NodeId& id);
    [[nodiscard]] LocalInstanceManager* instances(const NodeId& id);
    [[nodiscard]] std::vector<NodeId> node_ids() const;
    [[nodiscard]] size_t node_count() const;

    /// Wait for every node to apply its queued commands.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Wait until the registry reports `expected` live instances of `name`.
    bool wait_for_live_count(const ServiceName& name, uint64_t expected,
                             std::chrono::milliseconds timeout);

    [[nodiscard]] TopologyFeed& topology() noexcept { return feed_; }
    [[nodiscard]] LocalBus& bus() noexcept { return bus_; }
    [[nodiscard]] DeploymentRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] DeploymentCoordinator& coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] IAffinityResolver& affinity() noexcept { return *affinity_; }

private:
    struct Node {
        std::shared_ptr<LocalInstanceManager> manager;
        std::unique_ptr<ServiceGrid> grid;
    };

    Logger logger_;
    LocalClusterOptions options_;
    MetricsCollector* metrics_;

    DeploymentRegistry registry_;
    LocalBus bus_;
    TopologyFeed feed_;
    std::shared_ptr<IAffinityResolver> affinity_;
    std::unique_ptr<DeploymentCoordinator> coordinator_;
    uint64_t subscription_{0};

    mutable std::mutex nodes_mutex_;
    std::map<NodeId, Node> nodes_;
    bool shut_down_{false};
};

}  // namespace grid_deploy
