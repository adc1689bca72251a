/**
 * @file builtin_services.hpp
 * @brief Services shipped with the daemon, and their typed proxy clients.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "proxy/service_proxy.hpp"
#include "service/service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace grid_deploy {

/**
 * @brief Answers routed calls; idles while executing.
 *
 * Methods: "ping" -> "pong", "echo" -> args, "node" -> hosting node id,
 * "instance" -> instance id.
 */
class EchoService : public IService {
public:
    Result<void> init(const ServiceContext& ctx) override;
    void execute(const ServiceContext& ctx) override;
    void cancel(const ServiceContext& ctx) override;
    Result<Bytes> invoke(std::string_view method, const Bytes& args) override;

private:
    NodeId node_;
    InstanceId instance_{0};
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

/**
 * @brief Logs a heartbeat line at a fixed interval while executing.
 */
class HeartbeatService : public IService {
public:
    HeartbeatService(Logger logger, std::chrono::milliseconds interval);

    Result<void> init(const ServiceContext& ctx) override;
    void execute(const ServiceContext& ctx) override;
    void cancel(const ServiceContext& ctx) override;
    Result<Bytes> invoke(std::string_view method, const Bytes& args) override;

private:
    Logger logger_;
    std::chrono::milliseconds interval_;
    std::atomic<uint64_t> beats_{0};
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

/**
 * @brief Typed client for EchoService.
 */
class EchoClient {
public:
    explicit EchoClient(ServiceProxy proxy) : proxy_(std::move(proxy)) {}

    Result<std::string> ping() { return proxy_.invoke_text("ping"); }
    Result<std::string> echo(std::string_view text) { return proxy_.invoke_text("echo", text); }
    Result<NodeId> node() { return proxy_.invoke_text("node"); }

    [[nodiscard]] ServiceProxy& proxy() noexcept { return proxy_; }

private:
    ServiceProxy proxy_;
};

}  // namespace grid_deploy
