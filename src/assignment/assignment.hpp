/**
 * @file assignment.hpp
 * @brief Assignment and delta types produced by the assignment engine.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>

namespace grid_deploy {

/**
 * @brief Target per-node instance counts for one deployment.
 *
 * Only nodes with a nonzero target appear in `counts`. Recomputed wholesale
 * on every trigger, never patched.
 */
struct Assignment {
    ServiceName name;
    TopologyVersion topology_version{0};
    std::map<NodeId, uint32_t> counts;
    bool affinity_unresolved{false};

    [[nodiscard]] uint32_t count_on(const NodeId& node) const noexcept {
        auto it = counts.find(node);
        return it == counts.end() ? 0 : it->second;
    }

    [[nodiscard]] uint64_t total() const noexcept {
        uint64_t sum = 0;
        for (const auto& [node, count] : counts) sum += count;
        return sum;
    }

    /// Same placement, regardless of the version it was computed for.
    [[nodiscard]] bool same_counts(const Assignment& other) const noexcept {
        return counts == other.counts;
    }
};

/**
 * @brief Signed per-node change between two assignments.
 *
 * Positive: start that many more. Negative: cancel that many.
 * Zero entries are omitted.
 */
struct AssignmentDelta {
    std::map<NodeId, int64_t> changes;

    [[nodiscard]] bool empty() const noexcept { return changes.empty(); }

    [[nodiscard]] int64_t change_for(const NodeId& node) const noexcept {
        auto it = changes.find(node);
        return it == changes.end() ? 0 : it->second;
    }
};

}  // namespace grid_deploy
