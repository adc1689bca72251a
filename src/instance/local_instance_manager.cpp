/**
 * @file local_instance_manager.cpp
 * @brief LocalInstanceManager implementation.
 *
 * All mutations of a node's instances run on a single-threaded executor, so
 * commands apply strictly in the order the coordinator issued them. Slow
 * init() and cancel() calls run outside the slot lock; routed calls keep
 * flowing while instances start or stop.
 */

#include "instance/local_instance_manager.hpp"

#include "network/invocation_codec.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <mutex>

namespace grid_deploy {

LocalInstanceManager::LocalInstanceManager(NodeId node, IMessageBus& bus, Logger logger,
                                           MetricsCollector* metrics)
    : node_(std::move(node))
    , bus_(bus)
    , logger_(std::move(logger))
    , metrics_(metrics)
    , executor_(1, "node:" + node_) {}

LocalInstanceManager::~LocalInstanceManager() {
    stop();
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

void LocalInstanceManager::on_command(const AssignmentCommand& command) {
    if (stopped_.load()) return;
    auto task = [this, command]() {
        try {
            apply(command);
        } catch (const std::exception& e) {
            logger_.error("Failed to apply " + std::string{to_string(command.kind)} + " for "
                          + command.name + " on " + node_ + ": " + e.what());
        }
    };
    if (!executor_.post(std::move(task))) {
        logger_.debug("Dropped command for " + command.name + " on stopped node " + node_);
    }
}

void LocalInstanceManager::apply(const AssignmentCommand& command) {
    const auto& name = command.name;

    DeploymentId current_id = 0;
    bool known = false;
    {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(name);
        if (it != slots_.end()) {
            known = true;
            current_id = it->second.deployment_id;
        }
    }

    if (known && current_id > command.deployment_id) {
        logger_.debug("Ignoring stale " + std::string{to_string(command.kind)}
                      + " for " + name + " (deployment " + std::to_string(command.deployment_id) + ")");
        return;
    }

    if (command.kind == CommandKind::CancelAll) {
        if (!known) return;
        cancel_instances(name, std::numeric_limits<int64_t>::max());
        report(name);
        std::unique_lock lock(mutex_);
        slots_.erase(name);
        logger_.info("Undeployed " + name + " from " + node_);
        return;
    }

    if (!known && command.count <= 0) {
        // Nothing to run here and nothing to clean up.
        return;
    }

    if (!known || current_id < command.deployment_id) {
        if (!command.configuration) {
            logger_.error("Command for unknown service " + name + " carries no configuration");
            return;
        }
        reset_slot(name, command);
    }

    int64_t to_start = 0;
    int64_t to_cancel = 0;
    {
        std::unique_lock lock(mutex_);
        auto& slot = slots_[name];
        auto live = static_cast<int64_t>(slot.instances.size());

        if (command.kind == CommandKind::Delta) {
            auto target = static_cast<int64_t>(slot.target) + command.count;
            slot.target = static_cast<uint32_t>(std::max<int64_t>(0, target));
            if (command.count > 0) {
                to_start = command.count;
            } else {
                // Instances that never came up already count as missing.
                to_cancel = std::max<int64_t>(0, live - static_cast<int64_t>(slot.target));
            }
        } else {
            slot.target = static_cast<uint32_t>(std::max<int64_t>(0, command.count));
            auto gap = static_cast<int64_t>(slot.target) - live;
            if (gap > 0) to_start = gap;
            else to_cancel = -gap;
        }
    }

    if (to_start > 0) start_instances(name, to_start);
    if (to_cancel > 0) cancel_instances(name, to_cancel);
    report(name);
}

void LocalInstanceManager::reset_slot(const ServiceName& name, const AssignmentCommand& command) {
    // A newer deployment of the same name replaces whatever an earlier one left.
    cancel_instances(name, std::numeric_limits<int64_t>::max());

    std::unique_lock lock(mutex_);
    Slot slot;
    slot.deployment_id = command.deployment_id;
    slot.configuration = command.configuration;
    slots_[name] = std::move(slot);
}

void LocalInstanceManager::start_instances(const ServiceName& name, int64_t count) {
    ConfigurationPtr config;
    {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(name);
        if (it == slots_.end()) return;
        config = it->second.configuration;
    }

    for (int64_t i = 0; i < count; ++i) {
        auto id = next_instance_id_.fetch_add(1);

        std::unique_ptr<IService> service;
        try {
            service = config->factory.create();
        } catch (const std::exception& e) {
            logger_.warn("Factory for " + name + " threw on " + node_ + ": " + e.what());
        } catch (...) {
            logger_.warn("Factory for " + name + " threw a non-standard exception on " + node_);
        }

        if (!service) {
            std::unique_lock lock(mutex_);
            slots_[name].init_failures++;
            if (metrics_) metrics_->record_instance_event(name, node_, id, InstanceState::Failed);
            continue;
        }

        auto instance = std::make_shared<ServiceInstance>(id, name, node_, std::move(service));
        if (metrics_) metrics_->record_instance_event(name, node_, id, InstanceState::Created);

        if (auto init = instance->initialize(); !init) {
            logger_.warn("Instance " + std::to_string(id) + " of " + name + " failed to initialize on "
                         + node_ + " [" + std::string{to_string(init.error().code)} + "]: "
                         + init.error().message);
            if (metrics_) metrics_->record_instance_event(name, node_, id, InstanceState::Failed);
            std::unique_lock lock(mutex_);
            slots_[name].init_failures++;
            continue;
        }
        if (metrics_) metrics_->record_instance_event(name, node_, id, InstanceState::Initialized);

        if (auto started = instance->start(); !started) {
            logger_.error("Instance " + std::to_string(id) + " of " + name + " failed to start: "
                          + started.error().message);
            continue;
        }
        if (metrics_) metrics_->record_instance_event(name, node_, id, InstanceState::Executing);

        std::unique_lock lock(mutex_);
        auto& slot = slots_[name];
        slot.instances.push_back(std::move(instance));
        slot.started++;
    }
}

void LocalInstanceManager::cancel_instances(const ServiceName& name, int64_t count) {
    for (int64_t i = 0; i < count; ++i) {
        std::shared_ptr<ServiceInstance> victim;
        {
            std::unique_lock lock(mutex_);
            auto it = slots_.find(name);
            if (it == slots_.end() || it->second.instances.empty()) return;
            // Youngest first
            victim = std::move(it->second.instances.back());
            it->second.instances.pop_back();
        }

        bool cancelled = victim->cancel();
        auto id = victim->id();
        if (auto failure = victim->failure()) {
            logger_.warn("Instance " + std::to_string(id) + " of " + name + " on " + node_
                         + " failed: " + failure->message);
        }
        victim.reset();

        if (!cancelled) continue;
        if (metrics_) metrics_->record_instance_event(name, node_, id, InstanceState::Cancelled);

        std::unique_lock lock(mutex_);
        auto it = slots_.find(name);
        if (it != slots_.end()) it->second.cancelled++;
    }
}

void LocalInstanceManager::report(const ServiceName& name) {
    CountReport counts;
    {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(name);
        if (it == slots_.end()) return;
        counts = CountReport{
            .name = name,
            .deployment_id = it->second.deployment_id,
            .node = node_,
            .started = it->second.started,
            .cancelled = it->second.cancelled
        };
    }
    bus_.report(counts);
}

// ─────────────────────────────────────────────
// Routed calls
// ─────────────────────────────────────────────

Bytes LocalInstanceManager::on_request(const Bytes& request) {
    InvocationRequest call;
    if (!InvocationCodec::decode_request(request, call)) {
        return InvocationCodec::encode_response(
            Error{ErrorCode::Internal, "Failed to decode invocation"});
    }

    std::shared_ptr<ServiceInstance> target;
    {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(call.service);
        if (it != slots_.end() && !it->second.instances.empty()) {
            const auto& instances = it->second.instances;
            auto pick = round_robin_.fetch_add(1) % instances.size();
            target = instances[pick];
        }
    }

    if (!target) {
        return InvocationCodec::encode_response(
            Error{ErrorCode::ServiceUnavailable,
                  "No live instance of " + call.service + " on " + node_});
    }
    return InvocationCodec::encode_response(target->invoke(call.method, call.args));
}

// ─────────────────────────────────────────────
// Lifecycle and queries
// ─────────────────────────────────────────────

void LocalInstanceManager::stop() {
    if (stopped_.exchange(true)) return;

    executor_.shutdown();

    std::vector<ServiceName> names;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, slot] : slots_) names.push_back(name);
    }
    for (const auto& name : names) {
        cancel_instances(name, std::numeric_limits<int64_t>::max());
        report(name);
    }

    std::unique_lock lock(mutex_);
    slots_.clear();
    logger_.info("Instance manager stopped on " + node_);
}

bool LocalInstanceManager::wait_idle(std::chrono::milliseconds timeout) {
    return executor_.wait_idle(timeout);
}

std::optional<LocalServiceStatus> LocalInstanceManager::status(const ServiceName& name) const {
    std::shared_lock lock(mutex_);
    auto it = slots_.find(name);
    if (it == slots_.end()) return std::nullopt;
    const auto& slot = it->second;
    return LocalServiceStatus{
        .name = name,
        .deployment_id = slot.deployment_id,
        .target = slot.target,
        .live = slot.instances.size(),
        .started = slot.started,
        .cancelled = slot.cancelled,
        .init_failures = slot.init_failures
    };
}

std::vector<LocalServiceStatus> LocalInstanceManager::statuses() const {
    std::vector<ServiceName> names;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, slot] : slots_) names.push_back(name);
    }
    std::vector<LocalServiceStatus> result;
    for (const auto& name : names) {
        if (auto s = status(name)) result.push_back(std::move(*s));
    }
    return result;
}

size_t LocalInstanceManager::live_count(const ServiceName& name) const {
    std::shared_lock lock(mutex_);
    auto it = slots_.find(name);
    return it == slots_.end() ? 0 : it->second.instances.size();
}

std::vector<InstanceId> LocalInstanceManager::instance_ids(const ServiceName& name) const {
    std::shared_lock lock(mutex_);
    std::vector<InstanceId> ids;
    auto it = slots_.find(name);
    if (it == slots_.end()) return ids;
    for (const auto& instance : it->second.instances) ids.push_back(instance->id());
    return ids;
}

}  // namespace grid_deploy
