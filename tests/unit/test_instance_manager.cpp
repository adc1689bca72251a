/**
 * @file test_instance_manager.cpp
 * @brief Unit tests for ServiceInstance and LocalInstanceManager.
 */

#include "instance/local_instance_manager.hpp"
#include "instance/service_instance.hpp"
#include "network/invocation_codec.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

using namespace grid_deploy;
using namespace std::chrono_literals;

namespace {

/// Counters shared by every instance a factory produces.
struct Tally {
    std::atomic<int> inits{0};
    std::atomic<int> executes{0};
    std::atomic<int> cancels{0};
    std::atomic<int> fail_next_inits{0};
    std::atomic<int> throw_next_inits{0};
    std::mutex mutex;
    std::vector<InstanceId> cancel_order;
};

class TallyService : public IService {
public:
    explicit TallyService(std::shared_ptr<Tally> tally) : tally_(std::move(tally)) {}

    Result<void> init(const ServiceContext&) override {
        tally_->inits.fetch_add(1);
        if (tally_->throw_next_inits.load() > 0) {
            tally_->throw_next_inits.fetch_sub(1);
            throw 42;
        }
        if (tally_->fail_next_inits.load() > 0) {
            tally_->fail_next_inits.fetch_sub(1);
            return Error{ErrorCode::InstanceInit, "refused to start"};
        }
        return Result<void>{};
    }

    void execute(const ServiceContext& ctx) override {
        tally_->executes.fetch_add(1);
        std::unique_lock lock(mutex_);
        cv_.wait(lock, ctx.stop, [] { return false; });
    }

    void cancel(const ServiceContext& ctx) override {
        tally_->cancels.fetch_add(1);
        std::lock_guard lock(tally_->mutex);
        tally_->cancel_order.push_back(ctx.instance_id);
    }

    Result<Bytes> invoke(std::string_view method, const Bytes& args) override {
        if (method == "echo") return args;
        return IService::invoke(method, args);
    }

private:
    std::shared_ptr<Tally> tally_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

/// Throws values that are not std::exception from execute() and cancel().
class UnrulyService : public IService {
public:
    Result<void> init(const ServiceContext&) override { return Result<void>{}; }

    void execute(const ServiceContext& ctx) override {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, ctx.stop, [] { return false; });
        throw 7;
    }

    void cancel(const ServiceContext&) override {
        throw std::string{"cancel refused"};
    }

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

Logger quiet_logger() {
    return Logger(std::make_unique<NullSink>(), LogLevel::Error);
}

ConfigurationPtr tally_config(const std::string& name, const std::shared_ptr<Tally>& tally) {
    return std::make_shared<const ServiceConfiguration>(ServiceConfiguration{
        .name = name,
        .factory = make_factory<TallyService>(tally),
        .node_filter = NodeFilter::all(),
        .max_per_node_count = 0,
        .total_count = 8,
        .affinity = std::nullopt
    });
}

AssignmentCommand command(const ConfigurationPtr& config, DeploymentId id,
                          CommandKind kind, int64_t count) {
    AssignmentCommand cmd;
    cmd.name = config->name;
    cmd.deployment_id = id;
    cmd.topology_version = 1;
    cmd.kind = kind;
    cmd.count = count;
    cmd.configuration = config;
    return cmd;
}

class InstanceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tally_ = std::make_shared<Tally>();
        config_ = tally_config("svc", tally_);
        bus_.set_report_handler([this](const CountReport& report) {
            std::lock_guard lock(reports_mutex_);
            reports_.push_back(report);
        });
        manager_ = std::make_shared<LocalInstanceManager>("n1", bus_, quiet_logger());
        bus_.register_node("n1", manager_);
    }

    void TearDown() override {
        manager_->stop();
        bus_.set_report_handler(nullptr);
    }

    void apply(const AssignmentCommand& cmd) {
        manager_->on_command(cmd);
        ASSERT_TRUE(manager_->wait_idle(5s));
    }

    std::vector<CountReport> reports() {
        std::lock_guard lock(reports_mutex_);
        return reports_;
    }

    LocalBus bus_;
    std::shared_ptr<Tally> tally_;
    ConfigurationPtr config_;
    std::shared_ptr<LocalInstanceManager> manager_;
    std::mutex reports_mutex_;
    std::vector<CountReport> reports_;
};

}  // anonymous namespace

// ═══════════════════════════════════════════════
// ServiceInstance
// ═══════════════════════════════════════════════

TEST(ServiceInstanceTest, Lifecycle) {
    auto tally = std::make_shared<Tally>();
    ServiceInstance instance(1, "svc", "n1", std::make_unique<TallyService>(tally));
    EXPECT_EQ(instance.state(), InstanceState::Created);

    ASSERT_TRUE(instance.initialize());
    EXPECT_EQ(instance.state(), InstanceState::Initialized);

    ASSERT_TRUE(instance.start());
    EXPECT_EQ(instance.state(), InstanceState::Executing);

    EXPECT_TRUE(instance.cancel());
    EXPECT_EQ(instance.state(), InstanceState::Cancelled);
    EXPECT_EQ(tally->cancels.load(), 1);

    // Second cancel is a no-op
    EXPECT_FALSE(instance.cancel());
    EXPECT_EQ(tally->cancels.load(), 1);
}

TEST(ServiceInstanceTest, FailedInitNeverExecutes) {
    auto tally = std::make_shared<Tally>();
    tally->fail_next_inits = 1;
    ServiceInstance instance(1, "svc", "n1", std::make_unique<TallyService>(tally));

    auto init = instance.initialize();
    ASSERT_FALSE(init);
    EXPECT_EQ(init.error().code, ErrorCode::InstanceInit);
    EXPECT_EQ(instance.state(), InstanceState::Failed);
    EXPECT_FALSE(instance.start());
    EXPECT_EQ(tally->executes.load(), 0);
}

TEST(ServiceInstanceTest, NonStandardInitThrowBecomesInstanceInit) {
    auto tally = std::make_shared<Tally>();
    tally->throw_next_inits = 1;
    ServiceInstance instance(1, "svc", "n1", std::make_unique<TallyService>(tally));

    auto init = instance.initialize();
    ASSERT_FALSE(init);
    EXPECT_EQ(init.error().code, ErrorCode::InstanceInit);
    EXPECT_EQ(instance.state(), InstanceState::Failed);
}

TEST(ServiceInstanceTest, NonStandardThrowsFromExecuteAndCancelAreContained) {
    ServiceInstance instance(1, "svc", "n1", std::make_unique<UnrulyService>());
    ASSERT_TRUE(instance.initialize());
    ASSERT_TRUE(instance.start());
    EXPECT_FALSE(instance.failure().has_value());

    EXPECT_TRUE(instance.cancel());
    EXPECT_EQ(instance.state(), InstanceState::Cancelled);
    EXPECT_TRUE(instance.execute_returned());
    ASSERT_TRUE(instance.failure().has_value());
    EXPECT_NE(instance.failure()->message.find("non-standard"), std::string::npos);
}

TEST(ServiceInstanceTest, InvokeOnlyWhileExecuting) {
    auto tally = std::make_shared<Tally>();
    ServiceInstance instance(1, "svc", "n1", std::make_unique<TallyService>(tally));
    ASSERT_TRUE(instance.initialize());
    EXPECT_FALSE(instance.invoke("echo", Bytes{1}));

    ASSERT_TRUE(instance.start());
    auto reply = instance.invoke("echo", Bytes{1, 2});
    ASSERT_TRUE(reply);
    EXPECT_EQ(*reply, (Bytes{1, 2}));

    instance.cancel();
    EXPECT_FALSE(instance.invoke("echo", Bytes{1}));
}

// ═══════════════════════════════════════════════
// LocalInstanceManager
// ═══════════════════════════════════════════════

TEST_F(InstanceManagerTest, DeltaStartsInstances) {
    apply(command(config_, 1, CommandKind::Delta, 3));

    EXPECT_EQ(manager_->live_count("svc"), 3u);
    auto status = manager_->status("svc");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->target, 3u);
    EXPECT_EQ(status->started, 3u);
    EXPECT_EQ(status->cancelled, 0u);

    auto sent = reports();
    ASSERT_FALSE(sent.empty());
    EXPECT_EQ(sent.back().started, 3u);
    EXPECT_EQ(sent.back().deployment_id, 1u);
    EXPECT_EQ(sent.back().node, "n1");
}

TEST_F(InstanceManagerTest, NegativeDeltaCancelsYoungestFirst) {
    apply(command(config_, 1, CommandKind::Delta, 3));
    auto ids = manager_->instance_ids("svc");
    ASSERT_EQ(ids.size(), 3u);

    apply(command(config_, 1, CommandKind::Delta, -2));

    EXPECT_EQ(manager_->live_count("svc"), 1u);
    EXPECT_EQ(manager_->instance_ids("svc"), (std::vector<InstanceId>{ids[0]}));
    {
        std::lock_guard lock(tally_->mutex);
        EXPECT_EQ(tally_->cancel_order, (std::vector<InstanceId>{ids[2], ids[1]}));
    }

    auto status = manager_->status("svc");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->cancelled, 2u);
    EXPECT_EQ(reports().back().cancelled, 2u);
}

TEST_F(InstanceManagerTest, FullTargetReconcilesBothWays) {
    apply(command(config_, 1, CommandKind::FullTarget, 2));
    EXPECT_EQ(manager_->live_count("svc"), 2u);

    // Re-sending the same target changes nothing.
    apply(command(config_, 1, CommandKind::FullTarget, 2));
    EXPECT_EQ(manager_->status("svc")->started, 2u);

    apply(command(config_, 1, CommandKind::FullTarget, 0));
    EXPECT_EQ(manager_->live_count("svc"), 0u);
    EXPECT_EQ(manager_->status("svc")->cancelled, 2u);
}

TEST_F(InstanceManagerTest, CancelAllForgetsService) {
    apply(command(config_, 1, CommandKind::Delta, 2));
    apply(command(config_, 1, CommandKind::CancelAll, 0));

    EXPECT_FALSE(manager_->status("svc").has_value());
    EXPECT_EQ(tally_->cancels.load(), 2);

    auto last = reports().back();
    EXPECT_EQ(last.started, 2u);
    EXPECT_EQ(last.cancelled, 2u);
}

TEST_F(InstanceManagerTest, CancelAllForUnknownServiceIgnored) {
    apply(command(config_, 1, CommandKind::CancelAll, 0));
    EXPECT_FALSE(manager_->status("svc").has_value());
    EXPECT_TRUE(reports().empty());
}

TEST_F(InstanceManagerTest, StaleDeploymentIgnored) {
    apply(command(config_, 5, CommandKind::Delta, 1));
    apply(command(config_, 4, CommandKind::Delta, 3));

    EXPECT_EQ(manager_->live_count("svc"), 1u);
    EXPECT_EQ(manager_->status("svc")->deployment_id, 5u);
}

TEST_F(InstanceManagerTest, NewerDeploymentReplacesSlot) {
    apply(command(config_, 1, CommandKind::Delta, 2));
    apply(command(config_, 2, CommandKind::Delta, 1));

    auto status = manager_->status("svc");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->deployment_id, 2u);
    EXPECT_EQ(status->live, 1u);
    EXPECT_EQ(status->started, 1u);
    EXPECT_EQ(tally_->cancels.load(), 2);
}

TEST_F(InstanceManagerTest, InitFailureDoesNotBlockSiblings) {
    tally_->fail_next_inits = 1;
    apply(command(config_, 1, CommandKind::Delta, 3));

    auto status = manager_->status("svc");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->live, 2u);
    EXPECT_EQ(status->started, 2u);
    EXPECT_EQ(status->init_failures, 1u);
    EXPECT_EQ(tally_->inits.load(), 3);
}

TEST_F(InstanceManagerTest, NonStandardInitThrowDoesNotBlockSiblings) {
    tally_->throw_next_inits = 1;
    apply(command(config_, 1, CommandKind::Delta, 3));

    auto status = manager_->status("svc");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->live, 2u);
    EXPECT_EQ(status->init_failures, 1u);
    EXPECT_EQ(reports().back().started, 2u);

    // The node keeps serving commands afterwards.
    apply(command(config_, 1, CommandKind::Delta, 1));
    EXPECT_EQ(manager_->live_count("svc"), 3u);
}

TEST_F(InstanceManagerTest, ScaleDownCountsFailedInitAsMissing) {
    tally_->fail_next_inits = 1;
    apply(command(config_, 1, CommandKind::Delta, 3));
    ASSERT_EQ(manager_->live_count("svc"), 2u);

    // Target 3 -> 2 while only two run: nothing to cancel.
    apply(command(config_, 1, CommandKind::Delta, -1));
    auto status = manager_->status("svc");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->target, 2u);
    EXPECT_EQ(status->live, 2u);
    EXPECT_EQ(status->cancelled, 0u);
    EXPECT_EQ(tally_->cancels.load(), 0);

    // Target 2 -> 1 cancels exactly one.
    apply(command(config_, 1, CommandKind::Delta, -1));
    EXPECT_EQ(manager_->live_count("svc"), 1u);
    EXPECT_EQ(manager_->status("svc")->cancelled, 1u);
}

TEST_F(InstanceManagerTest, FullTargetRetriesFailedInit) {
    tally_->fail_next_inits = 1;
    apply(command(config_, 1, CommandKind::FullTarget, 2));
    EXPECT_EQ(manager_->live_count("svc"), 1u);

    apply(command(config_, 1, CommandKind::FullTarget, 2));
    EXPECT_EQ(manager_->live_count("svc"), 2u);
}

TEST_F(InstanceManagerTest, NonPositiveCommandForUnknownServiceIgnored) {
    apply(command(config_, 1, CommandKind::Delta, -1));
    apply(command(config_, 1, CommandKind::FullTarget, 0));
    EXPECT_FALSE(manager_->status("svc").has_value());
}

TEST_F(InstanceManagerTest, RoutedCallsRoundRobin) {
    apply(command(config_, 1, CommandKind::Delta, 2));

    auto request = InvocationCodec::encode_request(
        InvocationRequest{.service = "svc", .method = "echo", .args = {42}});
    for (int i = 0; i < 4; ++i) {
        Result<Bytes> reply = Bytes{};
        ASSERT_TRUE(InvocationCodec::decode_response(manager_->on_request(request), reply));
        ASSERT_TRUE(reply) << reply.error().message;
        EXPECT_EQ(*reply, (Bytes{42}));
    }
}

TEST_F(InstanceManagerTest, RoutedCallWithoutInstance) {
    auto request = InvocationCodec::encode_request(
        InvocationRequest{.service = "svc", .method = "echo", .args = {}});
    Result<Bytes> reply = Bytes{};
    ASSERT_TRUE(InvocationCodec::decode_response(manager_->on_request(request), reply));
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, ErrorCode::ServiceUnavailable);
}

TEST_F(InstanceManagerTest, StopCancelsEverything) {
    apply(command(config_, 1, CommandKind::Delta, 2));
    manager_->stop();

    EXPECT_EQ(tally_->cancels.load(), 2);
    EXPECT_TRUE(manager_->statuses().empty());
    EXPECT_EQ(reports().back().cancelled, 2u);

    // Commands after stop are dropped.
    manager_->on_command(command(config_, 1, CommandKind::Delta, 1));
    EXPECT_EQ(manager_->live_count("svc"), 0u);
}
