/**
 * @file topology.cpp
 * @brief TopologyFeed implementation.
 */

#include "cluster/topology.hpp"

#include <algorithm>

namespace grid_deploy {

TopologyFeed::TopologyFeed()
    : current_(std::make_shared<TopologySnapshot>()) {}

Result<TopologyPtr> TopologyFeed::join(NodeDescriptor node) {
    std::lock_guard publish_lock(publish_mutex_);
    TopologyPtr next;
    {
        std::unique_lock lock(mutex_);
        if (current_->contains(node.id)) {
            return Error{ErrorCode::DuplicateName, "Node already in topology: " + node.id};
        }
        auto snap = std::make_shared<TopologySnapshot>(*current_);
        snap->version = current_->version + 1;
        node.order = next_order_++;
        snap->nodes.push_back(std::move(node));
        std::sort(snap->nodes.begin(), snap->nodes.end(), node_order_less);
        current_ = snap;
        next = snap;
    }
    publish(next);
    return next;
}

Result<TopologyPtr> TopologyFeed::leave(const NodeId& id) {
    std::lock_guard publish_lock(publish_mutex_);
    TopologyPtr next;
    {
        std::unique_lock lock(mutex_);
        if (!current_->contains(id)) {
            return Error{ErrorCode::NotFound, "Node not in topology: " + id};
        }
        auto snap = std::make_shared<TopologySnapshot>(*current_);
        snap->version = current_->version + 1;
        std::erase_if(snap->nodes, [&id](const NodeDescriptor& n) { return n.id == id; });
        current_ = snap;
        next = snap;
    }
    publish(next);
    return next;
}

uint64_t TopologyFeed::subscribe(TopologyCallback callback) {
    std::lock_guard lock(callback_mutex_);
    auto id = next_subscription_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

void TopologyFeed::unsubscribe(uint64_t subscription) {
    std::lock_guard lock(callback_mutex_);
    std::erase_if(callbacks_, [subscription](const auto& entry) {
        return entry.first == subscription;
    });
}

TopologyPtr TopologyFeed::snapshot() const {
    std::shared_lock lock(mutex_);
    return current_;
}

TopologyVersion TopologyFeed::version() const {
    std::shared_lock lock(mutex_);
    return current_->version;
}

void TopologyFeed::publish(const TopologyPtr& snap) {
    std::vector<TopologyCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks.reserve(callbacks_.size());
        for (const auto& [id, cb] : callbacks_) callbacks.push_back(cb);
    }
    for (const auto& cb : callbacks) cb(snap);
}

}  // namespace grid_deploy
