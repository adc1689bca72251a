/**
 * @file bench_assignment.cpp
 * @brief Performance benchmarks for assignment computation and the
 *        deployment pipeline.
 *
 * Measures the cost of recomputing assignments on topology changes, the
 * registry and wire codec hot paths, and end-to-end deploy latency on an
 * in-process cluster.
 *
 * Usage: ./bench_assignment [--csv]
 */

#include "assignment/assignment_engine.hpp"
#include "cluster/affinity.hpp"
#include "grid/local_cluster.hpp"
#include "network/invocation_codec.hpp"
#include "registry/deployment_registry.hpp"
#include "services/builtin_services.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace grid_deploy;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

class IdleService : public IService {
public:
    Result<void> init(const ServiceContext&) override { return Result<void>{}; }
    void execute(const ServiceContext&) override {}
    void cancel(const ServiceContext&) override {}
};

TopologySnapshot make_topology(size_t servers, size_t clients = 0) {
    TopologySnapshot topo;
    topo.version = 1;
    uint64_t order = 1;
    for (size_t i = 0; i < servers; ++i) {
        topo.nodes.push_back(NodeDescriptor{.id = "server-" + std::to_string(i), .order = order++,
                                            .client = false, .attributes = {}});
    }
    for (size_t i = 0; i < clients; ++i) {
        topo.nodes.push_back(NodeDescriptor{.id = "client-" + std::to_string(i), .order = order++,
                                            .client = true, .attributes = {}});
    }
    return topo;
}

ServiceConfiguration make_config(uint32_t total, uint32_t per_node) {
    return ServiceConfiguration{
        .name = "bench",
        .factory = make_factory<IdleService>(),
        .node_filter = NodeFilter::servers(),
        .max_per_node_count = per_node,
        .total_count = total,
        .affinity = std::nullopt
    };
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_assignment() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    auto singleton = make_config(1, 1);
    auto per_node = make_config(0, 1);

    for (size_t n : {8, 64, 512}) {
        auto topo = make_topology(n, n / 4);
        auto label = std::to_string(n) + " servers";
        auto multiple = make_config(static_cast<uint32_t>(n * 3), 4);

        R.push_back(run_bench("cluster_singleton(" + std::to_string(n) + ")", "Assignment", N,
            [&]{ auto a = AssignmentEngine::assign(singleton, topo, nullptr); (void)a; }, label));
        R.push_back(run_bench("node_singleton(" + std::to_string(n) + ")", "Assignment", N,
            [&]{ auto a = AssignmentEngine::assign(per_node, topo, nullptr); (void)a; }, label));
        R.push_back(run_bench("multiple_3x(" + std::to_string(n) + ")", "Assignment", N,
            [&]{ auto a = AssignmentEngine::assign(multiple, topo, nullptr); (void)a; }, label));
    }

    RendezvousAffinity affinity;
    affinity.add_cache("accounts");
    auto pinned = make_config(1, 1);
    pinned.node_filter = NodeFilter::all();
    pinned.affinity = AffinitySpec{.cache_name = "accounts", .key = "42"};

    for (size_t n : {8, 64, 512}) {
        auto topo = make_topology(n);
        R.push_back(run_bench("key_affinity(" + std::to_string(n) + ")", "Assignment", N,
            [&]{ auto a = AssignmentEngine::assign(pinned, topo, &affinity); (void)a; },
            std::to_string(n) + " servers"));
    }

    // Topology change: one node joins a 64-node cluster.
    auto before = make_topology(64);
    auto after = make_topology(65);
    auto prev = AssignmentEngine::assign(per_node, before, nullptr);
    auto next = AssignmentEngine::assign(per_node, after, nullptr);
    if (prev && next) {
        R.push_back(run_bench("diff_join(64->65)", "Assignment", N,
            [&]{ auto d = AssignmentEngine::diff(*prev, *next, after); (void)d; }, "node singleton"));
    }

    return R;
}

std::vector<BenchResult> bench_registry() {
    std::vector<BenchResult> R;
    constexpr size_t N = 5000;

    DeploymentRegistry registry;
    auto config = make_config(0, 1);
    registry.add(config.settings(), 1);

    uint64_t started = 0;
    R.push_back(run_bench("apply_report", "Registry", N,
        [&]{
            ++started;
            auto ok = registry.apply_report(CountReport{.name = "bench", .deployment_id = 1,
                .node = "server-" + std::to_string(started % 64), .started = started, .cancelled = 0});
            (void)ok;
        }, "64 reporting nodes"));

    R.push_back(run_bench("descriptor", "Registry", N,
        [&]{ auto d = registry.descriptor("bench"); (void)d; }, "64 nodes"));
    R.push_back(run_bench("live_count", "Registry", N,
        [&]{ auto c = registry.live_count("bench"); (void)c; }, "64 nodes"));

    return R;
}

std::vector<BenchResult> bench_codec() {
    std::vector<BenchResult> R;
    constexpr size_t N = 10000;

    for (size_t size : {0, 256, 65536}) {
        InvocationRequest request{.service = "echo", .method = "echo", .args = Bytes(size, 0x5A)};
        auto encoded = InvocationCodec::encode_request(request);
        auto label = std::to_string(size) + " B args";

        R.push_back(run_bench("encode_request(" + std::to_string(size) + ")", "Codec", N,
            [&]{ auto b = InvocationCodec::encode_request(request); (void)b; }, label));
        R.push_back(run_bench("decode_request(" + std::to_string(size) + ")", "Codec", N,
            [&]{ InvocationRequest out; auto ok = InvocationCodec::decode_request(encoded, out); (void)ok; },
            label));
    }

    return R;
}

std::vector<BenchResult> bench_cluster() {
    std::vector<BenchResult> R;
    constexpr size_t N = 50;

    for (size_t n : {4, 16}) {
        LocalCluster cluster(Logger(std::make_unique<NullSink>(), LogLevel::Error));
        for (size_t i = 0; i < n; ++i) {
            if (!cluster.start_server("server-" + std::to_string(i))) {
                std::cerr << "failed to start server-" << i << "\n";
                return R;
            }
        }
        auto* grid = cluster.grid("server-0");
        auto label = std::to_string(n) + " nodes";

        R.push_back(run_bench("deploy_node_singleton(" + std::to_string(n) + ")", "Cluster", N,
            [&]{
                auto deployed = grid->deploy_node_singleton("bench", make_named_factory<EchoService>("echo")).get();
                auto live = cluster.wait_for_live_count("bench", n, std::chrono::seconds{5});
                auto undeployed = grid->undeploy("bench").get();
                (void)deployed; (void)live; (void)undeployed;
            }, label + ", deploy+undeploy"));

        auto deployed = grid->deploy_cluster_singleton("echo", make_named_factory<EchoService>("echo")).get();
        if (deployed && cluster.wait_for_live_count("echo", 1, std::chrono::seconds{5})) {
            auto proxy = grid->service_proxy("echo");
            R.push_back(run_bench("proxy_ping(" + std::to_string(n) + ")", "Cluster", 1000,
                [&]{ auto r = proxy.invoke("ping"); (void)r; }, label));
        }
        cluster.shutdown();
    }

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  GridDeploy Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_assignment());
    append(bench_registry());
    append(bench_codec());
    append(bench_cluster());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
