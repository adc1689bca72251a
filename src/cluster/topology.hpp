/**
 * @file topology.hpp
 * @brief Versioned cluster topology feed.
 *
 * Stands in for the membership service: every join or leave produces a new
 * immutable TopologySnapshot with a strictly greater version, delivered to
 * all subscribers in version order.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace grid_deploy {

using TopologyCallback = std::function<void(const TopologyPtr&)>;

class TopologyFeed {
public:
    TopologyFeed();

    // Non-copyable
    TopologyFeed(const TopologyFeed&) = delete;
    TopologyFeed& operator=(const TopologyFeed&) = delete;

    /// Add a node. Its join order is assigned here; the given order is ignored.
    Result<TopologyPtr> join(NodeDescriptor node);
    Result<TopologyPtr> leave(const NodeId& id);

    /// Register a listener; returns an id for unsubscribe().
    uint64_t subscribe(TopologyCallback callback);
    void unsubscribe(uint64_t subscription);

    [[nodiscard]] TopologyPtr snapshot() const;
    [[nodiscard]] TopologyVersion version() const;

private:
    void publish(const TopologyPtr& snap);

    mutable std::shared_mutex mutex_;
    TopologyPtr current_;
    uint64_t next_order_{1};

    // Serializes publication so subscribers observe versions in order.
    std::mutex publish_mutex_;

    std::mutex callback_mutex_;
    uint64_t next_subscription_{1};
    std::vector<std::pair<uint64_t, TopologyCallback>> callbacks_;
};

}  // namespace grid_deploy
