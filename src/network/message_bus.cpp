/**
 * @file message_bus.cpp
 * @brief LocalBus implementation.
 */

#include "network/message_bus.hpp"

namespace grid_deploy {

void LocalBus::register_node(const NodeId& node, std::shared_ptr<INodeEndpoint> endpoint) {
    std::unique_lock lock(mutex_);
    nodes_[node] = std::move(endpoint);
    unreachable_.erase(node);
}

void LocalBus::unregister_node(const NodeId& node) {
    std::unique_lock lock(mutex_);
    nodes_.erase(node);
    unreachable_.erase(node);
}

void LocalBus::set_reachable(const NodeId& node, bool reachable) {
    std::unique_lock lock(mutex_);
    if (reachable) {
        unreachable_.erase(node);
    } else {
        unreachable_.insert(node);
    }
}

bool LocalBus::is_reachable(const NodeId& node) const {
    return lookup(node) != nullptr;
}

void LocalBus::set_report_handler(ReportHandler handler) {
    std::unique_lock lock(report_mutex_);
    report_handler_ = std::move(handler);
}

std::shared_ptr<INodeEndpoint> LocalBus::lookup(const NodeId& node) const {
    std::shared_lock lock(mutex_);
    if (unreachable_.count(node) > 0) return nullptr;
    auto it = nodes_.find(node);
    return it == nodes_.end() ? nullptr : it->second;
}

Result<void> LocalBus::send_command(const NodeId& node, const AssignmentCommand& command) {
    auto endpoint = lookup(node);
    if (!endpoint) {
        return Error{ErrorCode::Unreachable, "Node unreachable: " + node};
    }
    endpoint->on_command(command);
    commands_sent_.fetch_add(1, std::memory_order_relaxed);
    return Result<void>{};
}

Result<Bytes> LocalBus::request(const NodeId& node, const Bytes& payload) {
    auto endpoint = lookup(node);
    if (!endpoint) {
        return Error{ErrorCode::Unreachable, "Node unreachable: " + node};
    }
    return endpoint->on_request(payload);
}

void LocalBus::report(const CountReport& report) {
    // Held shared during delivery so set_report_handler() waits for in-flight reports.
    std::shared_lock lock(report_mutex_);
    if (report_handler_) report_handler_(report);
}

uint64_t LocalBus::commands_sent() const noexcept {
    return commands_sent_.load(std::memory_order_relaxed);
}

}  // namespace grid_deploy
