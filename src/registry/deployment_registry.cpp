/**
 * @file deployment_registry.cpp
 * @brief DeploymentRegistry implementation.
 */

#include "registry/deployment_registry.hpp"

#include <algorithm>

namespace grid_deploy {

namespace {

// Bounds how long a waiter can miss a change it raced with.
constexpr std::chrono::milliseconds WAIT_SLICE{50};

}  // anonymous namespace

void DeploymentRegistry::add(const ServiceSettings& settings, DeploymentId id) {
    {
        std::unique_lock lock(mutex_);
        Entry entry;
        entry.settings = settings;
        entry.deployment_id = id;
        entries_[settings.name] = std::move(entry);
    }
    notify_changed();
}

void DeploymentRegistry::remove(const ServiceName& name, DeploymentId id) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end() || it->second.deployment_id != id) return;
        entries_.erase(it);
    }
    notify_changed();
}

void DeploymentRegistry::set_state(const ServiceName& name, DeploymentState state) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return;
        it->second.state = state;
    }
    notify_changed();
}

void DeploymentRegistry::set_target(const ServiceName& name, const Assignment& assignment) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return;
        it->second.targets = assignment.counts;
        it->second.topology_version = assignment.topology_version;
    }
    notify_changed();
}

bool DeploymentRegistry::apply_report(const CountReport& report) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(report.name);
        if (it == entries_.end()) return false;
        auto& entry = it->second;
        if (entry.deployment_id != report.deployment_id) return false;
        if (entry.state == DeploymentState::Gone) return false;

        auto& counts = entry.counts[report.node];
        counts.started = std::max(counts.started, report.started);
        counts.cancelled = std::max(counts.cancelled, report.cancelled);
    }
    notify_changed();
    return true;
}

void DeploymentRegistry::retain_nodes(const TopologySnapshot& topology) {
    {
        std::unique_lock lock(mutex_);
        for (auto& [name, entry] : entries_) {
            std::erase_if(entry.counts, [&topology](const auto& kv) {
                return !topology.contains(kv.first);
            });
            std::erase_if(entry.targets, [&topology](const auto& kv) {
                return !topology.contains(kv.first);
            });
        }
    }
    notify_changed();
}

ServiceDescriptor DeploymentRegistry::to_descriptor(const ServiceName& name, const Entry& entry) {
    ServiceDescriptor desc;
    desc.name = name;
    desc.settings = entry.settings;
    desc.deployment_id = entry.deployment_id;
    desc.state = entry.state;
    desc.topology_version = entry.topology_version;
    desc.target_counts = entry.targets;
    for (const auto& [node, counts] : entry.counts) {
        desc.started += counts.started;
        desc.cancelled += counts.cancelled;
        if (counts.live() > 0) desc.instance_counts[node] = counts.live();
    }
    return desc;
}

std::optional<ServiceDescriptor> DeploymentRegistry::descriptor(const ServiceName& name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return to_descriptor(name, it->second);
}

std::vector<ServiceDescriptor> DeploymentRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<ServiceDescriptor> result;
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        result.push_back(to_descriptor(name, entry));
    }
    return result;
}

uint64_t DeploymentRegistry::live_count(const ServiceName& name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return 0;
    uint64_t total = 0;
    for (const auto& [node, counts] : it->second.counts) total += counts.live();
    return total;
}

uint64_t DeploymentRegistry::live_count_on(const ServiceName& name, const NodeId& node) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return 0;
    auto c = it->second.counts.find(node);
    return c == it->second.counts.end() ? 0 : c->second.live();
}

std::vector<NodeId> DeploymentRegistry::nodes_with_instances(const ServiceName& name) const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> nodes;
    auto it = entries_.find(name);
    if (it == entries_.end()) return nodes;
    for (const auto& [node, counts] : it->second.counts) {
        if (counts.live() > 0) nodes.push_back(node);
    }
    return nodes;
}

void DeploymentRegistry::notify_changed() {
    { std::lock_guard lock(wait_mutex_); }
    wait_cv_.notify_all();
}

bool DeploymentRegistry::wait_until(const std::function<bool()>& condition,
                                    std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock lock(wait_mutex_);
    while (!condition()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        wait_cv_.wait_until(lock, std::min(deadline, now + WAIT_SLICE));
    }
    return true;
}

bool DeploymentRegistry::wait_for_live_count(const ServiceName& name, uint64_t expected,
                                             std::chrono::milliseconds timeout) const {
    return wait_until([&] { return live_count(name) == expected; }, timeout);
}

}  // namespace grid_deploy
