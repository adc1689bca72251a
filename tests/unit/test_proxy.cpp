/**
 * @file test_proxy.cpp
 * @brief Unit tests for ServiceProxyRouter, ServiceProxy and EchoClient.
 */

#include "instance/local_instance_manager.hpp"
#include "proxy/service_proxy.hpp"
#include "services/builtin_services.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <thread>

using namespace grid_deploy;
using namespace std::chrono_literals;

namespace {

constexpr DeploymentId ECHO_ID = 1;

class ProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = std::make_shared<const ServiceConfiguration>(ServiceConfiguration{
            .name = "echo",
            .factory = make_named_factory<EchoService>("echo"),
            .node_filter = NodeFilter::all(),
            .max_per_node_count = 1,
            .total_count = 0,
            .affinity = std::nullopt
        });
        registry_.add(config_->settings(), ECHO_ID);
        bus_.set_report_handler([this](const CountReport& r) {
            EXPECT_TRUE(registry_.apply_report(r));
        });

        for (const auto& id : {"n1", "n2", "n3"}) {
            auto manager = std::make_shared<LocalInstanceManager>(id, bus_, logger());
            bus_.register_node(id, manager);
            managers_[id] = manager;
        }
    }

    void TearDown() override {
        for (auto& [id, manager] : managers_) manager->stop();
        bus_.set_report_handler(nullptr);
    }

    static Logger logger() {
        return Logger(std::make_unique<NullSink>(), LogLevel::Error);
    }

    /// Apply a delta on one node and wait for its report.
    void change(const std::string& node, int64_t count) {
        AssignmentCommand cmd;
        cmd.name = "echo";
        cmd.deployment_id = ECHO_ID;
        cmd.kind = CommandKind::Delta;
        cmd.count = count;
        cmd.configuration = config_;
        ASSERT_TRUE(bus_.send_command(node, cmd));
        ASSERT_TRUE(managers_.at(node)->wait_idle(5s));
    }

    ServiceProxyRouter router(const std::string& local) {
        return ServiceProxyRouter(local, bus_, registry_, logger());
    }

    LocalBus bus_;
    DeploymentRegistry registry_;
    ConfigurationPtr config_;
    std::map<std::string, std::shared_ptr<LocalInstanceManager>> managers_;
};

}  // anonymous namespace

TEST_F(ProxyTest, PrefersLocalInstance) {
    change("n1", 1);
    change("n2", 1);

    auto local = router("n2");
    auto resolved = local.resolve("echo", 1s);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(*resolved, "n2");

    EchoClient client(ServiceProxy(local, "echo", false, 1s));
    auto node = client.node();
    ASSERT_TRUE(node) << node.error().message;
    EXPECT_EQ(*node, "n2");
}

TEST_F(ProxyTest, RoutesToRemoteNode) {
    change("n3", 1);

    auto r = router("n1");
    EchoClient client(ServiceProxy(r, "echo", false, 1s));

    auto pong = client.ping();
    ASSERT_TRUE(pong) << pong.error().message;
    EXPECT_EQ(*pong, "pong");

    auto echoed = client.echo("hello grid");
    ASSERT_TRUE(echoed);
    EXPECT_EQ(*echoed, "hello grid");
    EXPECT_EQ(*client.node(), "n3");
}

TEST_F(ProxyTest, RemoteChoiceIsLowestNodeId) {
    change("n3", 1);
    change("n2", 1);

    auto r = router("n1");
    auto resolved = r.resolve("echo", 1s);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(*resolved, "n2");
}

TEST_F(ProxyTest, UnavailableAfterTimeout) {
    auto r = router("n1");
    ServiceProxy proxy(r, "echo", false, 50ms);

    auto start = std::chrono::steady_clock::now();
    auto reply = proxy.invoke("ping");
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, ErrorCode::ServiceUnavailable);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(ProxyTest, FailedResolutionIsLogged) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    const ServiceProxyRouter r("n1", bus_, registry_, Logger(std::move(sink), LogLevel::Debug, "proxy"));

    auto resolved = r.resolve("echo", 20ms);
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(buffer->count_containing("No live instance of echo"), 1u);
}

TEST_F(ProxyTest, WaitsForInstanceToAppear) {
    auto r = router("n1");
    ServiceProxy proxy(r, "echo", false, 5s);

    std::thread starter([this] {
        std::this_thread::sleep_for(30ms);
        change("n2", 1);
    });

    auto reply = proxy.invoke_text("ping");
    starter.join();
    ASSERT_TRUE(reply) << reply.error().message;
    EXPECT_EQ(*reply, "pong");
}

TEST_F(ProxyTest, UnknownMethodReportedByService) {
    change("n1", 1);
    auto r = router("n1");
    ServiceProxy proxy(r, "echo", false, 1s);

    auto reply = proxy.invoke("dance");
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, ErrorCode::NotFound);
}

TEST_F(ProxyTest, StickyProxyKeepsItsNode) {
    change("n1", 1);
    change("n3", 1);

    auto r = router("n2");
    ServiceProxy sticky(r, "echo", true, 1s);
    ServiceProxy loose(r, "echo", false, 1s);

    EXPECT_EQ(*sticky.invoke_text("node"), "n1");
    ASSERT_TRUE(sticky.pinned_node().has_value());
    EXPECT_EQ(*sticky.pinned_node(), "n1");

    // A local instance appears: the plain proxy switches, the sticky one stays.
    change("n2", 1);
    EXPECT_EQ(*loose.invoke_text("node"), "n2");
    EXPECT_EQ(*sticky.invoke_text("node"), "n1");
    EXPECT_FALSE(loose.pinned_node().has_value());
}

TEST_F(ProxyTest, StickyProxyReResolvesWhenPinnedNodeStops) {
    change("n1", 1);
    change("n3", 1);

    auto r = router("n2");
    ServiceProxy sticky(r, "echo", true, 1s);
    ASSERT_EQ(*sticky.invoke_text("node"), "n1");

    change("n1", -1);

    auto node = sticky.invoke_text("node");
    ASSERT_TRUE(node) << node.error().message;
    EXPECT_EQ(*node, "n3");
    EXPECT_EQ(*sticky.pinned_node(), "n3");
}

TEST_F(ProxyTest, CopiesShareThePin) {
    change("n1", 1);
    auto r = router("n2");
    ServiceProxy original(r, "echo", true, 1s);
    ServiceProxy copy = original;

    ASSERT_TRUE(original.invoke("ping"));
    ASSERT_TRUE(copy.pinned_node().has_value());
    EXPECT_EQ(*copy.pinned_node(), "n1");
    EXPECT_TRUE(copy.sticky());
    EXPECT_EQ(copy.name(), "echo");
}

TEST_F(ProxyTest, CallToUnreachableNode) {
    change("n1", 1);
    bus_.set_reachable("n1", false);

    auto r = router("n2");
    auto reply = r.call("n1", "echo", "ping", {});
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, ErrorCode::Unreachable);
}
