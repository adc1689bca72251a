/**
 * @file deployment_registry.hpp
 * @brief Published deployment descriptors and observed per-node counts.
 *
 * The registry is the single source of truth for what is observed to run:
 * counts come only from node reports, never from the target assignment.
 */

#pragma once

#include "assignment/assignment.hpp"
#include "core/types.hpp"
#include "network/message_bus.hpp"
#include "service/service_configuration.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace grid_deploy {

struct NodeCounts {
    uint64_t started{0};
    uint64_t cancelled{0};

    [[nodiscard]] uint64_t live() const noexcept {
        return started >= cancelled ? started - cancelled : 0;
    }
};

/**
 * @brief Point-in-time view of one deployment.
 */
struct ServiceDescriptor {
    ServiceName name;
    ServiceSettings settings;
    DeploymentId deployment_id{0};
    DeploymentState state{DeploymentState::Pending};
    TopologyVersion topology_version{0};
    std::map<NodeId, uint64_t> instance_counts;    ///< Observed live, nonzero only
    std::map<NodeId, uint32_t> target_counts;      ///< Last published assignment
    uint64_t started{0};
    uint64_t cancelled{0};

    [[nodiscard]] uint64_t total_count() const noexcept {
        uint64_t sum = 0;
        for (const auto& [node, count] : instance_counts) sum += count;
        return sum;
    }

    [[nodiscard]] uint64_t count_on(const NodeId& node) const noexcept {
        auto it = instance_counts.find(node);
        return it == instance_counts.end() ? 0 : it->second;
    }
};

class DeploymentRegistry {
public:
    void add(const ServiceSettings& settings, DeploymentId id);
    /// Drop the descriptor if it still belongs to deployment `id`.
    void remove(const ServiceName& name, DeploymentId id);

    void set_state(const ServiceName& name, DeploymentState state);
    void set_target(const ServiceName& name, const Assignment& assignment);

    /**
     * @brief Merge a node report. Counters only grow, so reordered reports
     *        are harmless. Reports for another deployment id are ignored.
     */
    bool apply_report(const CountReport& report);

    /// Forget counts of nodes no longer in the topology.
    void retain_nodes(const TopologySnapshot& topology);

    [[nodiscard]] std::optional<ServiceDescriptor> descriptor(const ServiceName& name) const;

    /// All descriptors, read under one lock.
    [[nodiscard]] std::vector<ServiceDescriptor> snapshot() const;

    [[nodiscard]] uint64_t live_count(const ServiceName& name) const;
    [[nodiscard]] uint64_t live_count_on(const ServiceName& name, const NodeId& node) const;

    /// Nodes currently reporting at least one live instance.
    [[nodiscard]] std::vector<NodeId> nodes_with_instances(const ServiceName& name) const;

    /**
     * @brief Block until `condition` holds or the timeout expires.
     *
     * The condition is re-evaluated after every registry change; it may call
     * the registry's const accessors.
     */
    bool wait_until(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout) const;

    /// Wait until the observed live total of `name` equals `expected`.
    bool wait_for_live_count(const ServiceName& name, uint64_t expected,
                             std::chrono::milliseconds timeout) const;

private:
    struct Entry {
        ServiceSettings settings;
        DeploymentId deployment_id{0};
        DeploymentState state{DeploymentState::Pending};
        TopologyVersion topology_version{0};
        std::map<NodeId, uint32_t> targets;
        std::map<NodeId, NodeCounts> counts;
    };

    [[nodiscard]] static ServiceDescriptor to_descriptor(const ServiceName& name, const Entry& entry);
    void notify_changed();

    mutable std::shared_mutex mutex_;
    std::map<ServiceName, Entry> entries_;

    mutable std::mutex wait_mutex_;
    mutable std::condition_variable wait_cv_;
};

}  // namespace grid_deploy
