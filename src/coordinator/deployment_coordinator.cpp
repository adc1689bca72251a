/**
 * @file deployment_coordinator.cpp
 * @brief DeploymentCoordinator implementation.
 *
 * Lock order: records_mutex_ before any Record::mutex. Commands are sent while
 * holding the record lock; the bus only enqueues them on the target node.
 * owed_mutex_ is never held together with either.
 */

#include "coordinator/deployment_coordinator.hpp"

#include "assignment/assignment_engine.hpp"

#include <algorithm>
#include <iterator>

namespace grid_deploy {

DeploymentCoordinator::DeploymentCoordinator(IMessageBus& bus,
                                             DeploymentRegistry& registry,
                                             const IAffinityResolver* affinity,
                                             Logger logger,
                                             MetricsCollector* metrics,
                                             CoordinatorOptions options)
    : bus_(bus)
    , registry_(registry)
    , affinity_(affinity)
    , logger_(std::move(logger))
    , metrics_(metrics)
    , options_(options)
    , topology_(std::make_shared<TopologySnapshot>())
    , workers_(std::max<size_t>(1, options.thread_count), "coordinator") {}

DeploymentCoordinator::~DeploymentCoordinator() {
    stop();
}

// ─────────────────────────────────────────────
// Deploy
// ─────────────────────────────────────────────

DeploymentFuture DeploymentCoordinator::deploy(ServiceConfiguration config) {
    if (auto valid = validate_configuration(config); !valid) {
        logger_.warn("Rejected deployment " + config.name + ": " + valid.error().message);
        return DeploymentFuture::ready(valid.error());
    }

    RecordPtr record;
    {
        std::unique_lock lock(records_mutex_);
        if (auto it = records_.find(config.name); it != records_.end()) {
            auto& existing = it->second;
            std::lock_guard record_lock(existing->mutex);
            if (existing->state == DeploymentState::Undeploying) {
                return DeploymentFuture::ready(Error{ErrorCode::DuplicateName,
                    "Service is being undeployed: " + config.name});
            }
            if (existing->state != DeploymentState::Gone) {
                if (same_deployment(*existing->config, config)) {
                    logger_.debug("Deployment " + config.name + " already exists, nothing to do");
                    return DeploymentFuture::ready();
                }
                return DeploymentFuture::ready(Error{ErrorCode::DuplicateName,
                    "Service already deployed with a different configuration: " + config.name});
            }
        }

        record = std::make_shared<Record>();
        record->id = next_deployment_id_.fetch_add(1);
        record->config = std::make_shared<const ServiceConfiguration>(std::move(config));
        record->published.name = record->config->name;
        for (const auto& node : topology()->nodes) record->synced.insert(node.id);

        registry_.add(record->config->settings(), record->id);
        records_[record->config->name] = record;
    }

    const auto& name = record->config->name;
    logger_.info("Deploying " + name + " (deployment " + std::to_string(record->id) + ")");
    if (metrics_) metrics_->record_deployment_state(name, DeploymentState::Pending);

    DeploymentPromise promise;
    if (!workers_.post([this, record, promise]() { promise.set(fan_out(record)); })) {
        promise.set(Error{ErrorCode::Internal, "Coordinator stopped"});
    }
    return promise.future();
}

Result<void> DeploymentCoordinator::fan_out(const RecordPtr& record) {
    std::lock_guard lock(record->mutex);
    if (record->state == DeploymentState::Undeploying || record->state == DeploymentState::Gone) {
        return Result<void>{};
    }
    return publish(*record);
}

// ─────────────────────────────────────────────
// Assignment publication
// ─────────────────────────────────────────────

Result<void> DeploymentCoordinator::publish(Record& record) {
    auto topo = topology();
    auto computed = AssignmentEngine::assign(*record.config, *topo, affinity_);
    if (!computed) {
        logger_.error("Assignment failed for " + record.config->name + ": " + computed.error().message);
        return computed.error();
    }
    auto next = std::move(computed).value();

    if (next.affinity_unresolved) {
        logger_.warn("Affinity key of " + record.config->name + " is not mapped at topology version "
                     + std::to_string(topo->version) + ", deployment stays pending");
    }

    auto delta = AssignmentEngine::diff(record.published, next, *topo);
    std::erase_if(record.synced, [&topo](const NodeId& id) { return !topo->contains(id); });

    for (const auto& node : topo->nodes) {
        if (!record.synced.contains(node.id)) {
            // Joined after registration, or missed a command: send the absolute target.
            if (send(record, node.id, CommandKind::FullTarget, next.count_on(node.id))) {
                record.synced.insert(node.id);
            }
        } else if (auto change = delta.change_for(node.id); change != 0) {
            if (!send(record, node.id, CommandKind::Delta, change)) {
                record.synced.erase(node.id);
            }
        }
    }

    if (!record.published.same_counts(next) && metrics_) {
        metrics_->record_assignment(next);
    }
    record.published = std::move(next);
    registry_.set_target(record.config->name, record.published);

    transition(record, record.published.affinity_unresolved ? DeploymentState::Pending
                                                            : DeploymentState::Active);
    return Result<void>{};
}

bool DeploymentCoordinator::send(Record& record, const NodeId& node, CommandKind kind, int64_t count) {
    AssignmentCommand command{
        .name = record.config->name,
        .deployment_id = record.id,
        .topology_version = topology()->version,
        .kind = kind,
        .count = count,
        .configuration = record.config
    };

    auto sent = bus_.send_command(node, command);
    if (metrics_) metrics_->record_command(node, command, sent.has_value());
    if (!sent) {
        logger_.warn("Failed to send " + std::string{to_string(kind)} + " for " + command.name
                     + " to " + node + ": " + sent.error().message);
        return false;
    }
    return true;
}

void DeploymentCoordinator::transition(Record& record, DeploymentState state) {
    if (record.state == state) return;
    logger_.info("Deployment " + record.config->name + ": " + std::string{to_string(record.state)}
                 + " -> " + std::string{to_string(state)});
    record.state = state;
    registry_.set_state(record.config->name, state);
    if (metrics_) metrics_->record_deployment_state(record.config->name, state);
}

// ─────────────────────────────────────────────
// Topology and reports
// ─────────────────────────────────────────────

void DeploymentCoordinator::on_topology_change(const TopologyPtr& snapshot) {
    if (!snapshot) return;
    {
        std::unique_lock lock(topology_mutex_);
        if (snapshot->version <= topology_->version) {
            logger_.debug("Ignoring stale topology version " + std::to_string(snapshot->version));
            return;
        }
        topology_ = snapshot;
    }

    logger_.info("Topology changed: version " + std::to_string(snapshot->version) + ", "
                 + std::to_string(snapshot->size()) + " nodes");
    if (metrics_) metrics_->record_topology_change(snapshot->version, snapshot->size());

    registry_.retain_nodes(*snapshot);
    retry_cancels(*snapshot, true);

    for (const auto& record : records()) {
        std::lock_guard lock(record->mutex);
        if (record->state != DeploymentState::Pending && record->state != DeploymentState::Active) {
            continue;
        }
        if (auto published = publish(*record); !published) {
            logger_.error("Redeployment of " + record->config->name + " failed: "
                          + published.error().message);
        }
    }
}

void DeploymentCoordinator::on_report(const CountReport& report) {
    if (!topology()->contains(report.node)) {
        logger_.debug("Ignoring report for " + report.name + " from departed node " + report.node);
        return;
    }
    if (!registry_.apply_report(report)) {
        logger_.debug("Ignoring report for " + report.name + " (deployment "
                      + std::to_string(report.deployment_id) + ") from " + report.node);
    }
}

// ─────────────────────────────────────────────
// Reconciliation
// ─────────────────────────────────────────────

void DeploymentCoordinator::reconcile() {
    retry_cancels(*topology(), false);

    for (const auto& record : records()) {
        std::lock_guard lock(record->mutex);
        if (record->state != DeploymentState::Pending && record->state != DeploymentState::Active) {
            continue;
        }
        if (auto published = publish(*record); !published) {
            logger_.error("Reconciliation of " + record->config->name + " failed: "
                          + published.error().message);
            continue;
        }
        send_absolute_targets(*record, *topology());
    }
}

void DeploymentCoordinator::send_absolute_targets(Record& record, const TopologySnapshot& topology) {
    const auto& name = record.config->name;
    for (const auto& node : topology.nodes) {
        auto target = record.published.count_on(node.id);
        auto live = registry_.live_count_on(name, node.id);
        if (live == target) continue;

        logger_.debug("Node " + node.id + " runs " + std::to_string(live) + " of " + name
                      + ", target " + std::to_string(target));
        if (send(record, node.id, CommandKind::FullTarget, target)) {
            record.synced.insert(node.id);
        } else {
            record.synced.erase(node.id);
        }
    }
}

void DeploymentCoordinator::start() {
    if (options_.reconcile_interval.count() <= 0 || reconcile_thread_.joinable()) return;
    reconcile_thread_ = std::jthread([this](std::stop_token stop) { reconcile_loop(stop); });
    logger_.info("Periodic reconciliation every "
                 + std::to_string(options_.reconcile_interval.count()) + "ms");
}

void DeploymentCoordinator::reconcile_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(timer_mutex_);
            timer_cv_.wait_for(lock, stop, options_.reconcile_interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        reconcile();
    }
}

void DeploymentCoordinator::stop() {
    if (reconcile_thread_.joinable()) {
        reconcile_thread_.request_stop();
        reconcile_thread_.join();
    }
    workers_.shutdown();
}

// ─────────────────────────────────────────────
// Undeploy
// ─────────────────────────────────────────────

DeploymentFuture DeploymentCoordinator::undeploy(const ServiceName& name) {
    auto record = find(name);
    if (!record) {
        logger_.debug("Undeploy of unknown service " + name);
        return DeploymentFuture::ready();
    }

    std::set<NodeId> nodes;
    std::set<NodeId> missed;
    DeploymentPromise promise;
    {
        std::lock_guard lock(record->mutex);
        if (record->undeploy_future) return *record->undeploy_future;
        if (record->state == DeploymentState::Gone) return DeploymentFuture::ready();

        transition(*record, DeploymentState::Undeploying);
        record->undeploy_future = promise.future();

        for (const auto& [node, count] : record->published.counts) nodes.insert(node);
        for (const auto& node : registry_.nodes_with_instances(name)) nodes.insert(node);

        for (const auto& node : nodes) {
            if (!send(*record, node, CommandKind::CancelAll, 0)) missed.insert(node);
        }
    }
    owe_cancel(name, record->id, missed);

    if (!workers_.post([this, record, nodes, promise]() {
            finish_undeploy(record, nodes);
            promise.set(Result<void>{});
        })) {
        finish_undeploy(record, nodes);
        promise.set(Result<void>{});
    }
    return promise.future();
}

void DeploymentCoordinator::finish_undeploy(const RecordPtr& record, std::set<NodeId> nodes) {
    const auto& name = record->config->name;
    bool drained = registry_.wait_until([&] {
        auto topo = topology();
        return std::all_of(nodes.begin(), nodes.end(), [&](const NodeId& node) {
            return !topo->contains(node) || registry_.live_count_on(name, node) == 0;
        });
    }, options_.undeploy_timeout);

    if (!drained) {
        logger_.warn("Undeploy of " + name + " timed out after "
                     + std::to_string(options_.undeploy_timeout.count()) + "ms, "
                     + std::to_string(registry_.live_count(name)) + " instances still reported");

        auto topo = topology();
        std::set<NodeId> lingering;
        for (const auto& node : nodes) {
            if (topo->contains(node) && registry_.live_count_on(name, node) > 0) lingering.insert(node);
        }
        owe_cancel(name, record->id, lingering);
    }

    {
        std::lock_guard lock(record->mutex);
        transition(*record, DeploymentState::Gone);
    }
    registry_.remove(name, record->id);
    {
        std::unique_lock lock(records_mutex_);
        if (auto it = records_.find(name); it != records_.end() && it->second == record) {
            records_.erase(it);
        }
    }
    logger_.info("Undeployed " + name);
}

void DeploymentCoordinator::owe_cancel(const ServiceName& name, DeploymentId id,
                                       const std::set<NodeId>& nodes) {
    if (nodes.empty()) return;
    std::lock_guard lock(owed_mutex_);
    auto& owed = owed_cancels_[name];
    // A newer CancelAll also clears older deployments of the same name.
    owed.id = std::max(owed.id, id);
    owed.nodes.insert(nodes.begin(), nodes.end());
    logger_.info("CancelAll for " + name + " still owed to " + std::to_string(owed.nodes.size())
                 + " node(s)");
}

void DeploymentCoordinator::retry_cancels(const TopologySnapshot& topology, bool forget_departed) {
    std::lock_guard lock(owed_mutex_);
    for (auto it = owed_cancels_.begin(); it != owed_cancels_.end();) {
        const auto& name = it->first;
        auto& owed = it->second;
        std::erase_if(owed.nodes, [&](const NodeId& node) {
            if (!topology.contains(node)) return forget_departed;

            AssignmentCommand command{
                .name = name,
                .deployment_id = owed.id,
                .topology_version = topology.version,
                .kind = CommandKind::CancelAll,
                .count = 0,
                .configuration = nullptr
            };
            auto sent = bus_.send_command(node, command);
            if (metrics_) metrics_->record_command(node, command, sent.has_value());
            if (!sent) return false;
            logger_.info("Delivered owed CancelAll for " + name + " to " + node);
            return true;
        });
        it = owed.nodes.empty() ? owed_cancels_.erase(it) : std::next(it);
    }
}

DeploymentFuture DeploymentCoordinator::undeploy_all() {
    std::vector<DeploymentFuture> futures;
    for (const auto& name : deployment_names()) futures.push_back(undeploy(name));
    return DeploymentFuture::all(futures);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

TopologyPtr DeploymentCoordinator::topology() const {
    std::shared_lock lock(topology_mutex_);
    return topology_;
}

DeploymentCoordinator::RecordPtr DeploymentCoordinator::find(const ServiceName& name) const {
    std::shared_lock lock(records_mutex_);
    auto it = records_.find(name);
    return it == records_.end() ? nullptr : it->second;
}

std::vector<DeploymentCoordinator::RecordPtr> DeploymentCoordinator::records() const {
    std::shared_lock lock(records_mutex_);
    std::vector<RecordPtr> result;
    result.reserve(records_.size());
    for (const auto& [name, record] : records_) result.push_back(record);
    return result;
}

std::optional<Assignment> DeploymentCoordinator::published_assignment(const ServiceName& name) const {
    auto record = find(name);
    if (!record) return std::nullopt;
    std::lock_guard lock(record->mutex);
    return record->published;
}

std::optional<DeploymentState> DeploymentCoordinator::state(const ServiceName& name) const {
    auto record = find(name);
    if (!record) return std::nullopt;
    std::lock_guard lock(record->mutex);
    return record->state;
}

std::set<NodeId> DeploymentCoordinator::pending_cancels(const ServiceName& name) const {
    std::lock_guard lock(owed_mutex_);
    auto it = owed_cancels_.find(name);
    return it == owed_cancels_.end() ? std::set<NodeId>{} : it->second.nodes;
}

std::vector<ServiceName> DeploymentCoordinator::deployment_names() const {
    std::shared_lock lock(records_mutex_);
    std::vector<ServiceName> names;
    for (const auto& [name, record] : records_) names.push_back(name);
    return names;
}

}  // namespace grid_deploy
