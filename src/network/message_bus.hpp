/**
 * @file message_bus.hpp
 * @brief Coordinator <-> node messaging: assignment commands, count reports
 *        and routed service calls.
 *
 * IMessageBus is the seam to the transport layer. LocalBus delivers within
 * one process and can simulate unreachable nodes.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "service/service.hpp"
#include "service/service_configuration.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

namespace grid_deploy {

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

enum class CommandKind : uint8_t {
    Delta,        ///< Start (count > 0) or cancel (count < 0) instances
    FullTarget,   ///< Set the node's target to count and reconcile
    CancelAll     ///< Undeploy: cancel every instance and forget the name
};

[[nodiscard]] constexpr std::string_view to_string(CommandKind kind) noexcept {
    switch (kind) {
        case CommandKind::Delta:      return "delta";
        case CommandKind::FullTarget: return "full_target";
        case CommandKind::CancelAll:  return "cancel_all";
    }
    return "unknown";
}

struct AssignmentCommand {
    ServiceName name;
    DeploymentId deployment_id{0};
    TopologyVersion topology_version{0};
    CommandKind kind{CommandKind::Delta};
    int64_t count{0};
    ConfigurationPtr configuration;
};

/// Monotonic per-node counters; started - cancelled is the live count.
struct CountReport {
    ServiceName name;
    DeploymentId deployment_id{0};
    NodeId node;
    uint64_t started{0};
    uint64_t cancelled{0};
};

// ─────────────────────────────────────────────
// Endpoints
// ─────────────────────────────────────────────

class INodeEndpoint {
public:
    virtual ~INodeEndpoint() = default;

    virtual void on_command(const AssignmentCommand& command) = 0;
    virtual Bytes on_request(const Bytes& request) = 0;
};

using ReportHandler = std::function<void(const CountReport&)>;

class IMessageBus {
public:
    virtual ~IMessageBus() = default;

    /// Unicast a command. Fails with Unreachable if the node cannot be reached.
    virtual Result<void> send_command(const NodeId& node, const AssignmentCommand& command) = 0;

    /// Request/response call to a node (routed service invocations).
    virtual Result<Bytes> request(const NodeId& node, const Bytes& payload) = 0;

    /// Node -> coordinator report. Dropped when no coordinator listens.
    virtual void report(const CountReport& report) = 0;
};

// ─────────────────────────────────────────────
// LocalBus
// ─────────────────────────────────────────────

class LocalBus : public IMessageBus {
public:
    void register_node(const NodeId& node, std::shared_ptr<INodeEndpoint> endpoint);
    void unregister_node(const NodeId& node);

    /// Simulate a transient disconnect (false) and recovery (true).
    void set_reachable(const NodeId& node, bool reachable);
    [[nodiscard]] bool is_reachable(const NodeId& node) const;

    void set_report_handler(ReportHandler handler);

    Result<void> send_command(const NodeId& node, const AssignmentCommand& command) override;
    Result<Bytes> request(const NodeId& node, const Bytes& payload) override;
    void report(const CountReport& report) override;

    [[nodiscard]] uint64_t commands_sent() const noexcept;

private:
    std::shared_ptr<INodeEndpoint> lookup(const NodeId& node) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, std::shared_ptr<INodeEndpoint>> nodes_;
    std::set<NodeId> unreachable_;

    mutable std::shared_mutex report_mutex_;
    ReportHandler report_handler_;

    std::atomic<uint64_t> commands_sent_{0};
};

}  // namespace grid_deploy
