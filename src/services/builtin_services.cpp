/**
 * @file builtin_services.cpp
 * @brief EchoService / HeartbeatService implementation.
 */

#include "services/builtin_services.hpp"

namespace grid_deploy {

namespace {

Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

}  // anonymous namespace

// ── EchoService ──────────────────────────────

Result<void> EchoService::init(const ServiceContext& ctx) {
    node_ = ctx.node_id;
    instance_ = ctx.instance_id;
    return Result<void>{};
}

void EchoService::execute(const ServiceContext& ctx) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, ctx.stop, [] { return false; });
}

void EchoService::cancel(const ServiceContext& /*ctx*/) {
    cv_.notify_all();
}

Result<Bytes> EchoService::invoke(std::string_view method, const Bytes& args) {
    if (method == "ping") return to_bytes("pong");
    if (method == "echo") return args;
    if (method == "node") return to_bytes(node_);
    if (method == "instance") return to_bytes(std::to_string(instance_));
    return Error{ErrorCode::NotFound, "EchoService has no method " + std::string{method}};
}

// ── HeartbeatService ─────────────────────────

HeartbeatService::HeartbeatService(Logger logger, std::chrono::milliseconds interval)
    : logger_(std::move(logger))
    , interval_(interval) {}

Result<void> HeartbeatService::init(const ServiceContext& /*ctx*/) {
    if (interval_.count() <= 0) {
        return Error{ErrorCode::InstanceInit, "Heartbeat interval must be positive"};
    }
    return Result<void>{};
}

void HeartbeatService::execute(const ServiceContext& ctx) {
    while (!ctx.is_cancelled()) {
        {
            std::unique_lock lock(mutex_);
            if (cv_.wait_for(lock, ctx.stop, interval_, [] { return false; })) break;
        }
        if (ctx.is_cancelled()) break;
        auto n = beats_.fetch_add(1) + 1;
        logger_.debug("Heartbeat " + std::to_string(n) + " from " + ctx.name
                      + "#" + std::to_string(ctx.instance_id) + " on " + ctx.node_id);
    }
}

void HeartbeatService::cancel(const ServiceContext& ctx) {
    logger_.info("Heartbeat " + ctx.name + "#" + std::to_string(ctx.instance_id)
                 + " stopped after " + std::to_string(beats_.load()) + " beats");
    cv_.notify_all();
}

Result<Bytes> HeartbeatService::invoke(std::string_view method, const Bytes& /*args*/) {
    if (method == "beats") return to_bytes(std::to_string(beats_.load()));
    return Error{ErrorCode::NotFound, "HeartbeatService has no method " + std::string{method}};
}

}  // namespace grid_deploy
