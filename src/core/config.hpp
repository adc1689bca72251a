/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace grid_deploy {

struct NodeConfig {
    std::string id = "node-01";
    bool client = false;
    std::map<std::string, std::string> attributes;
};

/// Additional members of the in-process cluster, joined after the local node.
struct ClusterConfig {
    std::vector<NodeConfig> nodes;
    std::vector<std::string> caches;    ///< Caches the affinity resolver knows about
};

struct CoordinatorConfig {
    uint32_t undeploy_timeout_ms = 10000;
    uint32_t reconcile_interval_ms = 0;   ///< 0 = disabled
    uint32_t thread_count = 2;
};

struct ProxyConfig {
    uint32_t resolve_timeout_ms = 2000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief One statically configured deployment ([[service]] table).
 */
struct ServiceEntry {
    std::string name;
    std::string kind;                    ///< Catalog key, e.g. "echo"
    uint32_t total_count = 0;
    uint32_t max_per_node_count = 0;
    std::string node_filter = "all";     ///< "all", "servers" or "attr:key=value"
    std::string affinity_cache;
    std::string affinity_key;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    ClusterConfig cluster;
    CoordinatorConfig coordinator;
    ProxyConfig proxy;
    TelemetryConfig telemetry;
    std::vector<ServiceEntry> services;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace grid_deploy
