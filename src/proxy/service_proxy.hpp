/**
 * @file service_proxy.hpp
 * @brief Resolves a service name to a node running it and routes calls there.
 *
 * Resolution reads observed counts from the deployment registry: a node is a
 * candidate only once it has reported a live instance. The local node is
 * preferred when it runs one.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/message_bus.hpp"
#include "registry/deployment_registry.hpp"
#include "service/service.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace grid_deploy {

class ServiceProxyRouter {
public:
    ServiceProxyRouter(NodeId local_node,
                       IMessageBus& bus,
                       const DeploymentRegistry& registry,
                       Logger logger,
                       MetricsCollector* metrics = nullptr);

    /**
     * @brief Pick a node currently reporting a live instance of `name`.
     *
     * Waits up to `timeout` for one to appear, then fails with
     * ServiceUnavailable.
     */
    [[nodiscard]] Result<NodeId> resolve(const ServiceName& name,
                                         std::chrono::milliseconds timeout) const;

    /// Forward one call to `node`.
    [[nodiscard]] Result<Bytes> call(const NodeId& node, const ServiceName& name,
                                     std::string_view method, const Bytes& args) const;

    /// True while `node` still reports a live instance of `name`.
    [[nodiscard]] bool is_live(const ServiceName& name, const NodeId& node) const;

    [[nodiscard]] const NodeId& local_node() const noexcept { return local_node_; }

private:
    [[nodiscard]] std::optional<NodeId> pick(const ServiceName& name) const;

    NodeId local_node_;
    IMessageBus& bus_;
    const DeploymentRegistry& registry_;
    mutable Logger logger_;
    MetricsCollector* metrics_;
};

/**
 * @brief Handle for invoking a deployed service by name.
 *
 * A non-sticky proxy resolves before every call. A sticky proxy keeps the
 * node it first resolved until that node stops reporting instances or a
 * call to it fails with ServiceUnavailable or Unreachable, in which case it
 * re-resolves once. Copies share the pinned node.
 */
class ServiceProxy {
public:
    ServiceProxy(const ServiceProxyRouter& router, ServiceName name,
                 bool sticky, std::chrono::milliseconds timeout);

    Result<Bytes> invoke(std::string_view method, const Bytes& args = {});

    /// Convenience overload for text payloads.
    Result<std::string> invoke_text(std::string_view method, std::string_view args = {});

    [[nodiscard]] const ServiceName& name() const noexcept { return name_; }
    [[nodiscard]] bool sticky() const noexcept { return sticky_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    [[nodiscard]] std::optional<NodeId> pinned_node() const;

private:
    struct Pin {
        std::mutex mutex;
        std::optional<NodeId> node;
    };

    Result<NodeId> target();
    void unpin(const NodeId& node);

    const ServiceProxyRouter* router_;
    ServiceName name_;
    bool sticky_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Pin> pin_;
};

}  // namespace grid_deploy
