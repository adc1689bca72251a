/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace grid_deploy {

namespace {

void read_attributes(const toml::node_view<toml::node>& node,
                     std::map<std::string, std::string>& attributes) {
    if (auto* table = node.as_table()) {
        for (const auto& [key, value] : *table) {
            if (auto text = value.value<std::string>()) {
                attributes[std::string{key.str()}] = *text;
            }
        }
    }
}

Result<NodeConfig> read_node(const toml::node_view<toml::node>& node, std::string_view where) {
    NodeConfig config;
    config.id = node["id"].value_or(std::string{});
    if (config.id.empty()) {
        return Error{ErrorCode::Configuration, std::string{where} + ": node id is required"};
    }
    config.client = node["client"].value_or(false);
    read_attributes(node["attributes"], config.attributes);
    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.id = node["id"].value_or(std::string{"node-01"});
            config.node.client = node["client"].value_or(false);
            read_attributes(node["attributes"], config.node.attributes);
        }

        // [cluster]
        if (auto cluster = tbl["cluster"]; cluster.is_table()) {
            if (auto* caches = cluster["caches"].as_array()) {
                for (const auto& cache : *caches) {
                    if (auto name = cache.value<std::string>()) config.cluster.caches.push_back(*name);
                }
            }

            // [[cluster.nodes]]
            if (auto* nodes = cluster["nodes"].as_array()) {
                for (size_t i = 0; i < nodes->size(); ++i) {
                    auto member = read_node(toml::node_view<toml::node>{nodes->get(i)},
                                            "cluster.nodes[" + std::to_string(i) + "]");
                    if (!member) return member.error();
                    config.cluster.nodes.push_back(std::move(*member));
                }
            }
        }

        // [coordinator]
        if (auto coordinator = tbl["coordinator"]; coordinator.is_table()) {
            config.coordinator.undeploy_timeout_ms = static_cast<uint32_t>(
                coordinator["undeploy_timeout_ms"].value_or(int64_t{10000}));
            config.coordinator.reconcile_interval_ms = static_cast<uint32_t>(
                coordinator["reconcile_interval_ms"].value_or(int64_t{0}));
            config.coordinator.thread_count = static_cast<uint32_t>(
                coordinator["thread_count"].value_or(int64_t{2}));
        }

        // [proxy]
        if (auto proxy = tbl["proxy"]; proxy.is_table()) {
            config.proxy.resolve_timeout_ms = static_cast<uint32_t>(
                proxy["resolve_timeout_ms"].value_or(int64_t{2000}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [[service]]
        if (auto* services = tbl["service"].as_array()) {
            for (size_t i = 0; i < services->size(); ++i) {
                toml::node_view<toml::node> svc{services->get(i)};
                ServiceEntry entry;
                entry.name = svc["name"].value_or(std::string{});
                entry.kind = svc["kind"].value_or(std::string{});
                if (entry.name.empty() || entry.kind.empty()) {
                    return Error{ErrorCode::Configuration,
                                 "service[" + std::to_string(i) + "]: name and kind are required"};
                }
                entry.total_count = static_cast<uint32_t>(svc["total_count"].value_or(int64_t{0}));
                entry.max_per_node_count = static_cast<uint32_t>(
                    svc["max_per_node_count"].value_or(int64_t{0}));
                entry.node_filter = svc["node_filter"].value_or(std::string{"all"});
                entry.affinity_cache = svc["affinity_cache"].value_or(std::string{});
                entry.affinity_key = svc["affinity_key"].value_or(std::string{});
                config.services.push_back(std::move(entry));
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Configuration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace grid_deploy
