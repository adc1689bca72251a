/**
 * @file types.hpp
 * @brief Fundamental types used throughout GridDeploy.
 *
 * Defines NodeId, NodeDescriptor, TopologySnapshot, instance and deployment
 * states. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace grid_deploy {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using ServiceName = std::string;
using TopologyVersion = uint64_t;
using DeploymentId = uint64_t;
using InstanceId = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// ─────────────────────────────────────────────
// Node Descriptor
// ─────────────────────────────────────────────

/**
 * @brief Static description of one cluster node.
 *
 * `order` is assigned by the topology feed on join and strictly increases,
 * so older nodes always sort before newer ones.
 */
struct NodeDescriptor {
    NodeId id;
    uint64_t order{0};
    bool client{false};                              ///< Client nodes hold no data
    std::map<std::string, std::string> attributes;

    [[nodiscard]] bool is_server() const noexcept { return !client; }

    [[nodiscard]] std::string_view attribute(const std::string& key) const {
        auto it = attributes.find(key);
        return it == attributes.end() ? std::string_view{} : std::string_view{it->second};
    }
};

// ─────────────────────────────────────────────
// Topology Snapshot
// ─────────────────────────────────────────────

/**
 * @brief Immutable, versioned set of cluster nodes.
 *
 * Nodes are kept sorted by (order, id). Shared between components via
 * shared_ptr<const TopologySnapshot>.
 */
struct TopologySnapshot {
    TopologyVersion version{0};
    std::vector<NodeDescriptor> nodes;

    [[nodiscard]] bool contains(const NodeId& id) const noexcept;
    [[nodiscard]] const NodeDescriptor* find(const NodeId& id) const noexcept;
    [[nodiscard]] size_t server_count() const noexcept;
    [[nodiscard]] size_t size() const noexcept { return nodes.size(); }
};

using TopologyPtr = std::shared_ptr<const TopologySnapshot>;

/// Sort key used wherever a reproducible node order is required.
[[nodiscard]] bool node_order_less(const NodeDescriptor& a, const NodeDescriptor& b) noexcept;

// ─────────────────────────────────────────────
// Service Instance State
// ─────────────────────────────────────────────

enum class InstanceState : uint8_t {
    Created,       ///< Constructed by the factory
    Initialized,   ///< init() succeeded
    Executing,     ///< execute() running on its own thread
    Cancelled,     ///< Stopped and all resources released
    Failed         ///< init() failed; never counted as started
};

[[nodiscard]] constexpr std::string_view to_string(InstanceState state) noexcept {
    switch (state) {
        case InstanceState::Created:     return "created";
        case InstanceState::Initialized: return "initialized";
        case InstanceState::Executing:   return "executing";
        case InstanceState::Cancelled:   return "cancelled";
        case InstanceState::Failed:      return "failed";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Deployment State
// ─────────────────────────────────────────────

enum class DeploymentState : uint8_t {
    Pending,       ///< Accepted, no placement yet (e.g. affinity unresolved)
    Active,        ///< Assignment published
    Undeploying,   ///< Cancel-all broadcast, waiting for acknowledgments
    Gone           ///< Descriptor removed
};

[[nodiscard]] constexpr std::string_view to_string(DeploymentState state) noexcept {
    switch (state) {
        case DeploymentState::Pending:     return "pending";
        case DeploymentState::Active:      return "active";
        case DeploymentState::Undeploying: return "undeploying";
        case DeploymentState::Gone:        return "gone";
    }
    return "unknown";
}

}  // namespace grid_deploy
