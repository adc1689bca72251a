/**
 * @file metrics_collector.hpp
 * @brief Structured deployment event collection for telemetry.
 */

#pragma once

#include "assignment/assignment.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "network/message_bus.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

namespace grid_deploy {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_topology_change(TopologyVersion version, size_t node_count);
    void record_assignment(const Assignment& assignment);
    void record_command(const NodeId& node, const AssignmentCommand& command, bool delivered);
    void record_instance_event(const ServiceName& name, const NodeId& node,
                               InstanceId instance, InstanceState state);
    void record_deployment_state(const ServiceName& name, DeploymentState state);
    void record_proxy_resolution(const ServiceName& name, const NodeId& node, bool found);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] uint64_t events_emitted() const noexcept { return events_.load(); }

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void emit(std::string_view json_line);
};

}  // namespace grid_deploy
