/**
 * @file assignment_engine.cpp
 * @brief AssignmentEngine: distributes a deployment's instances over the
 *        eligible nodes of a topology snapshot.
 *
 * Algorithm:
 *   eligible = nodes passing the filter, sorted by (join order, id)
 *   affinity set  -> the resolved owner gets 1, nothing else
 *   total unset   -> every eligible node gets max_per_node
 *   otherwise     -> deal `total` round-robin over eligible nodes, each
 *                    capped at max_per_node (when set)
 *
 * With a uniform cap, round-robin dealing gives node i exactly
 *   min(cap, total / n + (i < total % n ? 1 : 0))
 * which is computed directly.
 *
 * Complexity: O(N log N) for N nodes.
 */

#include "assignment/assignment_engine.hpp"

#include <algorithm>

namespace grid_deploy {

std::vector<const NodeDescriptor*> AssignmentEngine::eligible_nodes(
    const ServiceConfiguration& config,
    const TopologySnapshot& topology) {

    std::vector<const NodeDescriptor*> nodes;
    nodes.reserve(topology.nodes.size());
    for (const auto& node : topology.nodes) {
        if (config.node_filter.accepts(node)) nodes.push_back(&node);
    }
    std::sort(nodes.begin(), nodes.end(),
              [](const NodeDescriptor* a, const NodeDescriptor* b) {
                  return node_order_less(*a, *b);
              });
    return nodes;
}

Result<Assignment> AssignmentEngine::assign(const ServiceConfiguration& config,
                                            const TopologySnapshot& topology,
                                            const IAffinityResolver* affinity) {
    if (auto valid = validate_configuration(config); !valid) {
        return valid.error();
    }

    Assignment result;
    result.name = config.name;
    result.topology_version = topology.version;

    if (config.affinity) {
        if (affinity == nullptr) {
            result.affinity_unresolved = true;
            return result;
        }
        auto owner = affinity->resolve(config.affinity->cache_name,
                                       config.affinity->key, topology);
        if (!owner) {
            result.affinity_unresolved = true;
            return result;
        }
        const auto* node = topology.find(*owner);
        if (node != nullptr && config.node_filter.accepts(*node)) {
            result.counts[*owner] = 1;
        }
        return result;
    }

    auto eligible = eligible_nodes(config, topology);
    if (eligible.empty()) return result;

    const uint32_t cap = config.max_per_node_count;
    const uint32_t total = config.total_count;

    if (total == 0) {
        // Node-singleton family: fill every eligible node to its cap.
        for (const auto* node : eligible) {
            result.counts[node->id] = cap;
        }
        return result;
    }

    const auto n = static_cast<uint32_t>(eligible.size());
    const uint32_t base = total / n;
    const uint32_t extra = total % n;

    for (uint32_t i = 0; i < n; ++i) {
        uint32_t count = base + (i < extra ? 1 : 0);
        if (cap > 0) count = std::min(count, cap);
        if (count > 0) result.counts[eligible[i]->id] = count;
    }
    return result;
}

AssignmentDelta AssignmentEngine::diff(const Assignment& previous,
                                       const Assignment& next,
                                       const TopologySnapshot& topology) {
    AssignmentDelta delta;

    for (const auto& [node, count] : next.counts) {
        if (!topology.contains(node)) continue;
        auto change = static_cast<int64_t>(count) - static_cast<int64_t>(previous.count_on(node));
        if (change != 0) delta.changes[node] = change;
    }

    for (const auto& [node, count] : previous.counts) {
        if (next.counts.count(node) > 0) continue;
        if (!topology.contains(node)) continue;   // departed, instances gone with it
        delta.changes[node] = -static_cast<int64_t>(count);
    }
    return delta;
}

}  // namespace grid_deploy
