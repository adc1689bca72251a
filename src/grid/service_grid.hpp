/**
 * @file service_grid.hpp
 * @brief Per-node entry point for deploying, inspecting and calling services.
 *
 * The singleton helpers build a configuration and delegate to deploy(). The
 * cluster and node singletons place instances on server nodes only.
 */

#pragma once

#include "coordinator/deployment_coordinator.hpp"
#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "proxy/service_proxy.hpp"
#include "registry/deployment_future.hpp"
#include "registry/deployment_registry.hpp"
#include "service/service.hpp"
#include "service/service_configuration.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace grid_deploy {

class ServiceGrid {
public:
    ServiceGrid(NodeId local_node,
                DeploymentCoordinator& coordinator,
                IMessageBus& bus,
                Logger logger,
                MetricsCollector* metrics = nullptr,
                std::chrono::milliseconds default_proxy_timeout = std::chrono::milliseconds{2000});

    ServiceGrid(const ServiceGrid&) = delete;
    ServiceGrid& operator=(const ServiceGrid&) = delete;

    // ── Deployment ───────────────────────────
    DeploymentFuture deploy(ServiceConfiguration config);

    /// One instance in the whole cluster.
    DeploymentFuture deploy_cluster_singleton(const ServiceName& name, ServiceFactory factory);

    /// One instance on every server node.
    DeploymentFuture deploy_node_singleton(const ServiceName& name, ServiceFactory factory);

    /// One instance on the node owning `key` in `cache_name`.
    DeploymentFuture deploy_key_affinity_singleton(const ServiceName& name, ServiceFactory factory,
                                                   const std::string& cache_name,
                                                   const std::string& key);

    /// `total_count` instances over server nodes, at most `max_per_node` each (0 = no cap).
    DeploymentFuture deploy_multiple(const ServiceName& name, ServiceFactory factory,
                                     uint32_t total_count, uint32_t max_per_node);

    DeploymentFuture undeploy(const ServiceName& name);
    DeploymentFuture undeploy_all();

    // ── Inspection ───────────────────────────
    [[nodiscard]] std::vector<ServiceDescriptor> service_descriptors() const;
    [[nodiscard]] std::optional<ServiceDescriptor> service_descriptor(const ServiceName& name) const;

    // ── Invocation ───────────────────────────
    [[nodiscard]] ServiceProxy service_proxy(const ServiceName& name, bool sticky = false,
                                             std::chrono::milliseconds timeout = {}) const;

    /// Typed proxy, e.g. service_proxy<EchoClient>("echo").
    template <ProxyClient Client>
    [[nodiscard]] Client service_proxy(const ServiceName& name, bool sticky = false,
                                       std::chrono::milliseconds timeout = {}) const {
        return Client(service_proxy(name, sticky, timeout));
    }

    [[nodiscard]] const NodeId& local_node() const noexcept { return local_node_; }
    [[nodiscard]] const ServiceProxyRouter& router() const noexcept { return router_; }

private:
    NodeId local_node_;
    DeploymentCoordinator& coordinator_;
    Logger logger_;
    std::chrono::milliseconds default_proxy_timeout_;
    ServiceProxyRouter router_;
};

}  // namespace grid_deploy
