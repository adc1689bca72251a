/**
 * @file service.hpp
 * @brief The pluggable Service capability and its factory.
 *
 * The Local Instance Manager depends only on IService; concrete services are
 * supplied by callers through a ServiceFactory.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

namespace grid_deploy {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Per-instance execution context handed to every lifecycle hook.
 */
struct ServiceContext {
    ServiceName name;
    NodeId node_id;
    InstanceId instance_id{0};
    std::stop_token stop;

    [[nodiscard]] bool is_cancelled() const noexcept { return stop.stop_requested(); }
};

/**
 * @brief User service logic. One object per running instance.
 *
 * Lifecycle: init() once, then execute() on a dedicated thread until it
 * returns or the context's stop token fires, then cancel() exactly once if
 * the instance was executing.
 */
class IService {
public:
    virtual ~IService() = default;

    virtual Result<void> init(const ServiceContext& ctx) = 0;
    virtual void execute(const ServiceContext& ctx) = 0;
    virtual void cancel(const ServiceContext& ctx) = 0;

    /// Handle a routed call. Services without remote methods keep the default.
    virtual Result<Bytes> invoke(std::string_view method, const Bytes& /*args*/) {
        return Error{ErrorCode::NotFound,
                     "Method not supported: " + std::string{method}};
    }
};

/**
 * @brief Produces fresh IService objects for one deployment.
 *
 * Two factories are considered the same deployment payload when their
 * type names match.
 */
struct ServiceFactory {
    std::string type_name;
    std::function<std::unique_ptr<IService>()> create;

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(create); }

    friend bool operator==(const ServiceFactory& a, const ServiceFactory& b) {
        return a.type_name == b.type_name;
    }
};

/// Build a factory that copy-constructs T from the captured arguments.
template <typename T, typename... Args>
    requires ServiceType<T, Args...>
ServiceFactory make_factory(Args... args) {
    return ServiceFactory{
        .type_name = typeid(T).name(),
        .create = [... captured = std::move(args)]() -> std::unique_ptr<IService> {
            return std::make_unique<T>(captured...);
        }
    };
}

/// Like make_factory, with an explicit type name (used by the service catalog).
template <typename T, typename... Args>
    requires ServiceType<T, Args...>
ServiceFactory make_named_factory(std::string type_name, Args... args) {
    auto factory = make_factory<T>(std::move(args)...);
    factory.type_name = std::move(type_name);
    return factory;
}

}  // namespace grid_deploy
