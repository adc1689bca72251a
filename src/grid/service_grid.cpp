/**
 * @file service_grid.cpp
 * @brief ServiceGrid implementation.
 */

#include "grid/service_grid.hpp"

namespace grid_deploy {

ServiceGrid::ServiceGrid(NodeId local_node,
                         DeploymentCoordinator& coordinator,
                         IMessageBus& bus,
                         Logger logger,
                         MetricsCollector* metrics,
                         std::chrono::milliseconds default_proxy_timeout)
    : local_node_(std::move(local_node))
    , coordinator_(coordinator)
    , logger_(std::move(logger))
    , default_proxy_timeout_(default_proxy_timeout)
    , router_(local_node_, bus, coordinator.registry(), logger_.with_component("proxy"), metrics) {}

DeploymentFuture ServiceGrid::deploy(ServiceConfiguration config) {
    logger_.debug("deploy(" + config.name + ") requested on " + local_node_);
    return coordinator_.deploy(std::move(config));
}

DeploymentFuture ServiceGrid::deploy_cluster_singleton(const ServiceName& name, ServiceFactory factory) {
    return deploy(ServiceConfiguration{
        .name = name,
        .factory = std::move(factory),
        .node_filter = NodeFilter::servers(),
        .max_per_node_count = 1,
        .total_count = 1,
        .affinity = std::nullopt
    });
}

DeploymentFuture ServiceGrid::deploy_node_singleton(const ServiceName& name, ServiceFactory factory) {
    return deploy(ServiceConfiguration{
        .name = name,
        .factory = std::move(factory),
        .node_filter = NodeFilter::servers(),
        .max_per_node_count = 1,
        .total_count = 0,
        .affinity = std::nullopt
    });
}

DeploymentFuture ServiceGrid::deploy_key_affinity_singleton(const ServiceName& name,
                                                            ServiceFactory factory,
                                                            const std::string& cache_name,
                                                            const std::string& key) {
    return deploy(ServiceConfiguration{
        .name = name,
        .factory = std::move(factory),
        .node_filter = NodeFilter::all(),
        .max_per_node_count = 1,
        .total_count = 1,
        .affinity = AffinitySpec{cache_name, key}
    });
}

DeploymentFuture ServiceGrid::deploy_multiple(const ServiceName& name, ServiceFactory factory,
                                              uint32_t total_count, uint32_t max_per_node) {
    return deploy(ServiceConfiguration{
        .name = name,
        .factory = std::move(factory),
        .node_filter = NodeFilter::servers(),
        .max_per_node_count = max_per_node,
        .total_count = total_count,
        .affinity = std::nullopt
    });
}

DeploymentFuture ServiceGrid::undeploy(const ServiceName& name) {
    return coordinator_.undeploy(name);
}

DeploymentFuture ServiceGrid::undeploy_all() {
    return coordinator_.undeploy_all();
}

std::vector<ServiceDescriptor> ServiceGrid::service_descriptors() const {
    return coordinator_.registry().snapshot();
}

std::optional<ServiceDescriptor> ServiceGrid::service_descriptor(const ServiceName& name) const {
    return coordinator_.registry().descriptor(name);
}

ServiceProxy ServiceGrid::service_proxy(const ServiceName& name, bool sticky,
                                        std::chrono::milliseconds timeout) const {
    if (timeout.count() <= 0) timeout = default_proxy_timeout_;
    return ServiceProxy(router_, name, sticky, timeout);
}

}  // namespace grid_deploy
