/**
 * @file main.cpp
 * @brief grid_deployd daemon entry point.
 *
 * Wires all modules into a running in-process cluster:
 *   Config → Logger → Telemetry → LocalCluster (feed, bus, coordinator, nodes) → configured services
 */

#include "cluster/affinity.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "grid/local_cluster.hpp"
#include "services/builtin_services.hpp"
#include "services/service_catalog.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace grid_deploy;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            GridDeploy v1.0.0              ║
  ║   Cluster Service Deployment Coordinator  ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string node_id;
    std::string log_dir;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--node-id" && i + 1 < argc) {
            args.node_id = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: grid_deployd [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --node-id <id>     Local node identifier\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --demo             Run a deployment demo on a simulated cluster, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

NodeDescriptor to_descriptor(const NodeConfig& node) {
    return NodeDescriptor{
        .id = node.id,
        .order = 0,
        .client = node.client,
        .attributes = node.attributes
    };
}

void log_descriptors(LocalCluster& cluster, Logger& logger) {
    for (const auto& desc : cluster.registry().snapshot()) {
        std::string counts;
        for (const auto& [node, count] : desc.instance_counts) {
            if (!counts.empty()) counts += ", ";
            counts += node + "=" + std::to_string(count);
        }
        logger.info("Service " + desc.name + " [" + std::string{to_string(desc.state)} + "] "
                    + std::to_string(desc.total_count()) + " live (started "
                    + std::to_string(desc.started) + ", cancelled "
                    + std::to_string(desc.cancelled) + ") {" + counts + "}");
    }
}

void settle(LocalCluster& cluster, Logger& logger) {
    if (!cluster.wait_idle(std::chrono::seconds{5})) {
        logger.warn("Nodes still applying commands after 5s");
    }
    log_descriptors(cluster, logger);
}

/**
 * @brief Run a demo: bring up a small cluster, deploy the built-in services,
 *        churn the topology and call through a proxy.
 */
void run_demo(const Config& config, Logger& logger, MetricsCollector& metrics) {
    logger.info("=== Demo Mode ===");

    auto affinity = std::make_shared<RendezvousAffinity>();
    affinity->add_cache("demo-cache");

    LocalClusterOptions options;
    options.coordinator.undeploy_timeout =
        std::chrono::milliseconds{config.coordinator.undeploy_timeout_ms};
    options.coordinator.thread_count = config.coordinator.thread_count;
    options.proxy_timeout = std::chrono::milliseconds{config.proxy.resolve_timeout_ms};

    LocalCluster cluster(logger, options, affinity, &metrics);
    for (int i = 1; i <= 4; ++i) {
        if (auto started = cluster.start_server("server-" + std::to_string(i)); !started) {
            logger.error("Failed to start node: " + started.error().message);
            return;
        }
    }
    if (auto started = cluster.start_client("client-1"); !started) {
        logger.error("Failed to start client: " + started.error().message);
        return;
    }

    auto* grid = cluster.grid("client-1");
    std::vector<DeploymentFuture> futures{
        grid->deploy_cluster_singleton("echo-singleton", make_named_factory<EchoService>("echo")),
        grid->deploy_node_singleton("echo-per-node", make_named_factory<EchoService>("echo")),
        grid->deploy_key_affinity_singleton("echo-affinity", make_named_factory<EchoService>("echo"),
                                            "demo-cache", "key-42"),
        grid->deploy_multiple("heartbeat", make_named_factory<HeartbeatService>(
            "heartbeat", logger.with_component("heartbeat"), std::chrono::milliseconds{200}), 6, 2)
    };
    if (auto done = DeploymentFuture::all(futures).get(); !done) {
        logger.error("Deployment failed: " + done.error().message);
    }
    settle(cluster, logger);

    auto echo = grid->service_proxy<EchoClient>("echo-singleton");
    if (auto pong = echo.ping(); pong) {
        logger.info("echo-singleton answered " + *pong + " from " + echo.node().value_or("?"));
    } else {
        logger.warn("echo-singleton call failed: " + pong.error().message);
    }

    logger.info("Adding two servers");
    for (const auto* id : {"server-5", "server-6"}) {
        if (auto started = cluster.start_server(id); !started) {
            logger.warn("Failed to start " + std::string{id} + ": " + started.error().message);
        }
    }
    settle(cluster, logger);

    logger.info("Stopping server-1");
    if (auto stopped = cluster.stop_node("server-1"); !stopped) {
        logger.warn("Failed to stop server-1: " + stopped.error().message);
    }
    settle(cluster, logger);

    if (auto done = grid->undeploy_all().get(); !done) {
        logger.warn("Undeploy failed: " + done.error().message);
    }
    logger.info("=== Demo Complete ===");
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.node_id.empty()) config.node.id = args.node_id;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "grid_deployd",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level), "daemon");
    logger.info("GridDeploy starting...");
    logger.info("Node ID: " + config.node.id);

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (!config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "grid_metrics",
                                                        config.telemetry.max_file_size_mb,
                                                        config.telemetry.rotate_count);
    } else {
        telemetry_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(telemetry_sink));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        run_demo(config, logger, metrics);
        return 0;
    }

    // ── Initialize Cluster ───────────────────
    auto affinity = std::make_shared<RendezvousAffinity>();
    for (const auto& cache : config.cluster.caches) affinity->add_cache(cache);

    LocalClusterOptions options;
    options.coordinator.undeploy_timeout =
        std::chrono::milliseconds{config.coordinator.undeploy_timeout_ms};
    options.coordinator.reconcile_interval =
        std::chrono::milliseconds{config.coordinator.reconcile_interval_ms};
    options.coordinator.thread_count = config.coordinator.thread_count;
    options.proxy_timeout = std::chrono::milliseconds{config.proxy.resolve_timeout_ms};

    LocalCluster cluster(logger, options, affinity, &metrics);

    if (auto started = cluster.start_node(to_descriptor(config.node)); !started) {
        logger.error("Failed to start local node: " + started.error().message);
        return 1;
    }
    for (const auto& member : config.cluster.nodes) {
        if (auto started = cluster.start_node(to_descriptor(member)); !started) {
            logger.warn("Skipping node " + member.id + ": " + started.error().message);
        }
    }
    logger.info("Cluster up: " + std::to_string(cluster.node_count()) + " nodes");

    // ── Deploy configured services ───────────
    auto catalog = ServiceCatalog::with_builtins(logger);
    auto* grid = cluster.grid(config.node.id);
    for (const auto& entry : config.services) {
        auto service = catalog.to_configuration(entry);
        if (!service) {
            logger.error("Invalid service " + entry.name + ": " + service.error().message);
            continue;
        }
        auto deployed = grid->deploy(std::move(*service)).get();
        if (!deployed) {
            logger.error("Deployment of " + entry.name + " failed: " + deployed.error().message);
        }
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            log_descriptors(cluster, logger);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    if (auto undeployed = grid->undeploy_all().get(); !undeployed) {
        logger.warn("Undeploy failed: " + undeployed.error().message);
    }
    cluster.shutdown();
    metrics.flush();

    logger.info("GridDeploy stopped.");
    logger.flush();
    return 0;
}
