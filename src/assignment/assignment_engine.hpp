/**
 * @file assignment_engine.hpp
 * @brief Pure computation of (configuration, topology) -> per-node counts.
 */

#pragma once

#include "assignment/assignment.hpp"
#include "cluster/affinity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "service/service_configuration.hpp"

#include <vector>

namespace grid_deploy {

/**
 * @brief Stateless, deterministic assignment engine.
 *
 * Identical inputs always yield identical assignments, so independent
 * components recomputing the same deployment converge without coordination.
 */
class AssignmentEngine {
public:
    /**
     * @brief Compute the target assignment for a configuration.
     *
     * Fails only with ErrorCode::Configuration. An unresolved affinity key
     * yields an empty assignment flagged `affinity_unresolved`.
     */
    static Result<Assignment> assign(const ServiceConfiguration& config,
                                     const TopologySnapshot& topology,
                                     const IAffinityResolver* affinity);

    /**
     * @brief Per-node difference `next - previous`.
     *
     * Nodes missing from `topology` are dropped: their instances are presumed
     * gone with the node.
     */
    static AssignmentDelta diff(const Assignment& previous,
                                const Assignment& next,
                                const TopologySnapshot& topology);

    /// Nodes passing the filter, in reproducible (order, id) order.
    static std::vector<const NodeDescriptor*> eligible_nodes(const ServiceConfiguration& config,
                                                             const TopologySnapshot& topology);
};

}  // namespace grid_deploy
