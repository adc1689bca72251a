/**
 * @file service_configuration.cpp
 * @brief NodeFilter built-ins and configuration validation.
 */

#include "service/service_configuration.hpp"

namespace grid_deploy {

NodeFilter NodeFilter::all() {
    return NodeFilter{};
}

NodeFilter NodeFilter::servers() {
    return custom("servers", [](const NodeDescriptor& node) { return node.is_server(); });
}

NodeFilter NodeFilter::with_attribute(std::string key, std::string value) {
    auto tag = "attr:" + key + "=" + value;
    return custom(std::move(tag), [key = std::move(key), value = std::move(value)](
                                      const NodeDescriptor& node) {
        return node.attribute(key) == value;
    });
}

bool NodeFilter::accepts(const NodeDescriptor& node) const {
    return !predicate_ || predicate_(node);
}

ServiceSettings ServiceConfiguration::settings() const {
    return ServiceSettings{
        .name = name,
        .service_type = factory.type_name,
        .max_per_node_count = max_per_node_count,
        .total_count = total_count,
        .node_filter = node_filter.tag(),
        .affinity = affinity
    };
}

Result<void> validate_configuration(const ServiceConfiguration& config) {
    if (config.name.empty()) {
        return Error{ErrorCode::Configuration, "Service name must not be empty"};
    }
    if (!config.factory) {
        return Error{ErrorCode::Configuration, "Service factory missing: " + config.name};
    }

    if (config.affinity) {
        const auto& aff = *config.affinity;
        if (aff.cache_name.empty() || aff.key.empty()) {
            return Error{ErrorCode::Configuration,
                         "Affinity requires both cache name and key: " + config.name};
        }
        if (!config.node_filter.is_default()) {
            return Error{ErrorCode::Configuration,
                         "Affinity cannot be combined with a node filter: " + config.name};
        }
        if (config.total_count > 1 || config.max_per_node_count > 1) {
            return Error{ErrorCode::Configuration,
                         "Affinity deployments run exactly one instance: " + config.name};
        }
        return Result<void>{};
    }

    if (config.total_count == 0 && config.max_per_node_count == 0) {
        return Error{ErrorCode::Configuration,
                     "Either total count or max per-node count must be set: " + config.name};
    }
    return Result<void>{};
}

bool same_deployment(const ServiceConfiguration& a, const ServiceConfiguration& b) {
    return a.name == b.name
        && a.factory == b.factory
        && a.node_filter == b.node_filter
        && a.effective_total_count() == b.effective_total_count()
        && a.effective_max_per_node() == b.effective_max_per_node()
        && a.affinity == b.affinity;
}

}  // namespace grid_deploy
