/**
 * @file service_proxy.cpp
 * @brief ServiceProxyRouter / ServiceProxy implementation.
 */

#include "proxy/service_proxy.hpp"

#include "network/invocation_codec.hpp"

namespace grid_deploy {

// ─────────────────────────────────────────────
// ServiceProxyRouter
// ─────────────────────────────────────────────

ServiceProxyRouter::ServiceProxyRouter(NodeId local_node,
                                       IMessageBus& bus,
                                       const DeploymentRegistry& registry,
                                       Logger logger,
                                       MetricsCollector* metrics)
    : local_node_(std::move(local_node))
    , bus_(bus)
    , registry_(registry)
    , logger_(std::move(logger))
    , metrics_(metrics) {}

std::optional<NodeId> ServiceProxyRouter::pick(const ServiceName& name) const {
    if (registry_.live_count_on(name, local_node_) > 0) return local_node_;
    auto nodes = registry_.nodes_with_instances(name);
    if (nodes.empty()) return std::nullopt;
    return nodes.front();
}

Result<NodeId> ServiceProxyRouter::resolve(const ServiceName& name,
                                           std::chrono::milliseconds timeout) const {
    std::optional<NodeId> picked;
    registry_.wait_until([&] {
        picked = pick(name);
        return picked.has_value();
    }, timeout);

    if (metrics_) metrics_->record_proxy_resolution(name, picked.value_or(""), picked.has_value());
    if (!picked) {
        logger_.debug("No live instance of " + name + " after " + std::to_string(timeout.count()) + "ms");
        return Error{ErrorCode::ServiceUnavailable, "No live instance of service: " + name};
    }
    return *picked;
}

Result<Bytes> ServiceProxyRouter::call(const NodeId& node, const ServiceName& name,
                                       std::string_view method, const Bytes& args) const {
    auto payload = InvocationCodec::encode_request(InvocationRequest{
        .service = name,
        .method = std::string{method},
        .args = args
    });

    auto reply = bus_.request(node, payload);
    if (!reply) return reply.error();

    Result<Bytes> result = Error{ErrorCode::Internal, "Empty response"};
    if (!InvocationCodec::decode_response(*reply, result)) {
        return Error{ErrorCode::Internal, "Malformed response from " + node};
    }
    return result;
}

bool ServiceProxyRouter::is_live(const ServiceName& name, const NodeId& node) const {
    return registry_.live_count_on(name, node) > 0;
}

// ─────────────────────────────────────────────
// ServiceProxy
// ─────────────────────────────────────────────

ServiceProxy::ServiceProxy(const ServiceProxyRouter& router, ServiceName name,
                           bool sticky, std::chrono::milliseconds timeout)
    : router_(&router)
    , name_(std::move(name))
    , sticky_(sticky)
    , timeout_(timeout)
    , pin_(std::make_shared<Pin>()) {}

Result<NodeId> ServiceProxy::target() {
    if (!sticky_) return router_->resolve(name_, timeout_);

    std::lock_guard lock(pin_->mutex);
    if (pin_->node && router_->is_live(name_, *pin_->node)) return *pin_->node;

    auto resolved = router_->resolve(name_, timeout_);
    if (resolved) pin_->node = *resolved;
    else pin_->node.reset();
    return resolved;
}

void ServiceProxy::unpin(const NodeId& node) {
    std::lock_guard lock(pin_->mutex);
    if (pin_->node == node) pin_->node.reset();
}

Result<Bytes> ServiceProxy::invoke(std::string_view method, const Bytes& args) {
    auto node = target();
    if (!node) return node.error();

    auto result = router_->call(*node, name_, method, args);
    if (result || !sticky_) return result;

    const auto code = result.error().code;
    if (code != ErrorCode::ServiceUnavailable && code != ErrorCode::Unreachable) return result;

    // The pinned node lost its instance between resolution and the call.
    unpin(*node);
    auto retry = target();
    if (!retry) return retry.error();
    return router_->call(*retry, name_, method, args);
}

Result<std::string> ServiceProxy::invoke_text(std::string_view method, std::string_view args) {
    auto reply = invoke(method, Bytes(args.begin(), args.end()));
    if (!reply) return reply.error();
    return std::string(reply->begin(), reply->end());
}

std::optional<NodeId> ServiceProxy::pinned_node() const {
    std::lock_guard lock(pin_->mutex);
    return pin_->node;
}

}  // namespace grid_deploy
