/**
 * @file local_cluster.cpp
 * @brief LocalCluster implementation.
 */

#include "grid/local_cluster.hpp"

namespace grid_deploy {

LocalCluster::LocalCluster(Logger logger,
                           LocalClusterOptions options,
                           std::shared_ptr<IAffinityResolver> affinity,
                           MetricsCollector* metrics)
    : logger_(std::move(logger))
    , options_(options)
    , metrics_(metrics)
    , affinity_(affinity ? std::move(affinity) : std::make_shared<RendezvousAffinity>()) {
    coordinator_ = std::make_unique<DeploymentCoordinator>(
        bus_, registry_, affinity_.get(), logger_.with_component("coordinator"),
        metrics_, options_.coordinator);

    bus_.set_report_handler([this](const CountReport& report) { coordinator_->on_report(report); });
    subscription_ = feed_.subscribe([this](const TopologyPtr& snapshot) {
        coordinator_->on_topology_change(snapshot);
    });
    coordinator_->start();
}

LocalCluster::~LocalCluster() {
    shutdown();
}

Result<TopologyPtr> LocalCluster::start_node(NodeDescriptor node) {
    const auto id = node.id;
    {
        std::lock_guard lock(nodes_mutex_);
        if (shut_down_) return Error{ErrorCode::Internal, "Cluster is shut down"};
        if (nodes_.contains(id)) {
            return Error{ErrorCode::DuplicateName, "Node already started: " + id};
        }

        auto manager = std::make_shared<LocalInstanceManager>(
            id, bus_, logger_.with_component("instances"), metrics_);
        auto grid = std::make_unique<ServiceGrid>(
            id, *coordinator_, bus_, logger_.with_component("grid"), metrics_,
            options_.proxy_timeout);

        bus_.register_node(id, manager);
        nodes_.emplace(id, Node{std::move(manager), std::move(grid)});
    }

    // Joined only once the endpoint can receive commands.
    auto joined = feed_.join(std::move(node));
    if (!joined) {
        bus_.unregister_node(id);
        std::lock_guard lock(nodes_mutex_);
        nodes_.erase(id);
        return joined.error();
    }
    logger_.info("Node " + id + " started (topology version "
                 + std::to_string((*joined)->version) + ")");
    return joined;
}

Result<TopologyPtr> LocalCluster::start_server(const NodeId& id) {
    return start_node(NodeDescriptor{.id = id, .order = 0, .client = false, .attributes = {}});
}

Result<TopologyPtr> LocalCluster::start_client(const NodeId& id) {
    return start_node(NodeDescriptor{.id = id, .order = 0, .client = true, .attributes = {}});
}

Result<void> LocalCluster::stop_node(const NodeId& id) {
    Node node;
    {
        std::lock_guard lock(nodes_mutex_);
        auto it = nodes_.find(id);
        if (it == nodes_.end()) return Error{ErrorCode::NotFound, "Node not running: " + id};
        node = std::move(it->second);
        nodes_.erase(it);
    }

    if (auto left = feed_.leave(id); !left) {
        logger_.warn("Node " + id + " was not in the topology: " + left.error().message);
    }
    bus_.unregister_node(id);
    node.manager->stop();
    logger_.info("Node " + id + " stopped");
    return Result<void>{};
}

void LocalCluster::shutdown() {
    std::map<NodeId, Node> nodes;
    {
        std::lock_guard lock(nodes_mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        nodes.swap(nodes_);
    }

    feed_.unsubscribe(subscription_);
    coordinator_->stop();
    bus_.set_report_handler({});

    for (auto& [id, node] : nodes) {
        bus_.unregister_node(id);
        node.manager->stop();
    }
    logger_.info("Cluster shut down");
}

ServiceGrid* LocalCluster::grid(const NodeId& id) {
    std::lock_guard lock(nodes_mutex_);
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.grid.get();
}

LocalInstanceManager* LocalCluster::instances(const NodeId& id) {
    std::lock_guard lock(nodes_mutex_);
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.manager.get();
}

std::vector<NodeId> LocalCluster::node_ids() const {
    std::lock_guard lock(nodes_mutex_);
    std::vector<NodeId> ids;
    for (const auto& [id, node] : nodes_) ids.push_back(id);
    return ids;
}

size_t LocalCluster::node_count() const {
    std::lock_guard lock(nodes_mutex_);
    return nodes_.size();
}

bool LocalCluster::wait_idle(std::chrono::milliseconds timeout) {
    std::vector<std::shared_ptr<LocalInstanceManager>> managers;
    {
        std::lock_guard lock(nodes_mutex_);
        for (const auto& [id, node] : nodes_) managers.push_back(node.manager);
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const auto& manager : managers) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() < 0 || !manager->wait_idle(left)) return false;
    }
    return true;
}

bool LocalCluster::wait_for_live_count(const ServiceName& name, uint64_t expected,
                                       std::chrono::milliseconds timeout) {
    return registry_.wait_for_live_count(name, expected, timeout);
}

}  // namespace grid_deploy
