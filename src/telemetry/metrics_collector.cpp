/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace grid_deploy {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_topology_change(TopologyVersion version, size_t node_count) {
    std::ostringstream oss;
    oss << R"({"event":"topology_change")"
        << R"(,"version":)" << version
        << R"(,"nodes":)" << node_count
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_assignment(const Assignment& assignment) {
    std::ostringstream oss;
    oss << R"({"event":"assignment")"
        << R"(,"service":")" << json_escape(assignment.name) << "\""
        << R"(,"version":)" << assignment.topology_version
        << R"(,"total":)" << assignment.total()
        << R"(,"affinity_unresolved":)" << (assignment.affinity_unresolved ? "true" : "false")
        << R"(,"counts":{)";
    bool first = true;
    for (const auto& [node, count] : assignment.counts) {
        if (!first) oss << ',';
        oss << '"' << json_escape(node) << "\":" << count;
        first = false;
    }
    oss << "}}";
    emit(oss.str());
}

void MetricsCollector::record_command(const NodeId& node,
                                      const AssignmentCommand& command,
                                      bool delivered) {
    std::ostringstream oss;
    oss << R"({"event":"command")"
        << R"(,"service":")" << json_escape(command.name) << "\""
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"kind":")" << to_string(command.kind) << "\""
        << R"(,"count":)" << command.count
        << R"(,"version":)" << command.topology_version
        << R"(,"delivered":)" << (delivered ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_instance_event(const ServiceName& name, const NodeId& node,
                                             InstanceId instance, InstanceState state) {
    std::ostringstream oss;
    oss << R"({"event":"instance_state_change")"
        << R"(,"service":")" << json_escape(name) << "\""
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"instance":)" << instance
        << R"(,"state":")" << to_string(state) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_deployment_state(const ServiceName& name, DeploymentState state) {
    std::ostringstream oss;
    oss << R"({"event":"deployment_state_change")"
        << R"(,"service":")" << json_escape(name) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_proxy_resolution(const ServiceName& name, const NodeId& node,
                                               bool found) {
    std::ostringstream oss;
    oss << R"({"event":"proxy_resolution")"
        << R"(,"service":")" << json_escape(name) << "\""
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"found":)" << (found ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    events_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace grid_deploy
