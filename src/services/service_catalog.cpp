/**
 * @file service_catalog.cpp
 * @brief ServiceCatalog implementation.
 */

#include "services/service_catalog.hpp"

#include "services/builtin_services.hpp"

#include <chrono>

namespace grid_deploy {

ServiceCatalog ServiceCatalog::with_builtins(Logger logger) {
    ServiceCatalog catalog;
    catalog.register_kind("echo", make_named_factory<EchoService>("echo"));
    catalog.register_kind("heartbeat", make_named_factory<HeartbeatService>(
        "heartbeat", logger.with_component("heartbeat"), std::chrono::milliseconds{1000}));
    return catalog;
}

void ServiceCatalog::register_kind(const std::string& kind, ServiceFactory factory) {
    factories_[kind] = std::move(factory);
}

Result<ServiceFactory> ServiceCatalog::factory(const std::string& kind) const {
    auto it = factories_.find(kind);
    if (it == factories_.end()) {
        return Error{ErrorCode::Configuration, "Unknown service kind: " + kind};
    }
    return it->second;
}

std::vector<std::string> ServiceCatalog::kinds() const {
    std::vector<std::string> result;
    for (const auto& [kind, factory] : factories_) result.push_back(kind);
    return result;
}

Result<NodeFilter> ServiceCatalog::parse_filter(const std::string& text) {
    if (text.empty() || text == "all") return NodeFilter::all();
    if (text == "servers") return NodeFilter::servers();

    constexpr std::string_view prefix = "attr:";
    if (text.starts_with(prefix)) {
        auto body = text.substr(prefix.size());
        auto eq = body.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorCode::Configuration, "Malformed attribute filter: " + text};
        }
        return NodeFilter::with_attribute(body.substr(0, eq), body.substr(eq + 1));
    }
    return Error{ErrorCode::Configuration, "Unknown node filter: " + text};
}

Result<ServiceConfiguration> ServiceCatalog::to_configuration(const ServiceEntry& entry) const {
    auto made = factory(entry.kind);
    if (!made) return made.error();

    auto filter = parse_filter(entry.node_filter);
    if (!filter) return filter.error();

    ServiceConfiguration config{
        .name = entry.name,
        .factory = std::move(*made),
        .node_filter = std::move(*filter),
        .max_per_node_count = entry.max_per_node_count,
        .total_count = entry.total_count,
        .affinity = std::nullopt
    };
    if (!entry.affinity_cache.empty() || !entry.affinity_key.empty()) {
        config.affinity = AffinitySpec{entry.affinity_cache, entry.affinity_key};
    }

    if (auto valid = validate_configuration(config); !valid) return valid.error();
    return config;
}

}  // namespace grid_deploy
