/**
 * @file service_instance.cpp
 * @brief ServiceInstance lifecycle implementation.
 */

#include "instance/service_instance.hpp"

#include <exception>
#include <mutex>

namespace grid_deploy {

ServiceInstance::ServiceInstance(InstanceId id, ServiceName name, NodeId node,
                                 std::unique_ptr<IService> service)
    : id_(id)
    , name_(std::move(name))
    , node_(std::move(node))
    , service_(std::move(service)) {}

ServiceInstance::~ServiceInstance() {
    cancel();
    if (thread_.joinable()) thread_.join();
}

ServiceContext ServiceInstance::context() const {
    return ServiceContext{
        .name = name_,
        .node_id = node_,
        .instance_id = id_,
        .stop = stop_.get_token()
    };
}

Result<void> ServiceInstance::initialize() {
    std::unique_lock lock(mutex_);
    if (state_.load() != InstanceState::Created || !service_) {
        return Error{ErrorCode::Internal, "Instance not in created state: " + name_};
    }

    Result<void> result;
    try {
        result = service_->init(context());
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InstanceInit, std::string{"init threw: "} + e.what()};
    } catch (...) {
        result = Error{ErrorCode::InstanceInit, "init threw a non-standard exception"};
    }

    if (!result) {
        state_.store(InstanceState::Failed);
        service_.reset();
        auto err = result.error();
        err.code = ErrorCode::InstanceInit;
        return err;
    }

    state_.store(InstanceState::Initialized);
    return Result<void>{};
}

Result<void> ServiceInstance::start() {
    std::unique_lock lock(mutex_);
    if (state_.load() != InstanceState::Initialized) {
        return Error{ErrorCode::Internal, "Instance not initialized: " + name_};
    }

    state_.store(InstanceState::Executing);
    thread_ = std::jthread([this, ctx = context(), service = service_.get()]() {
        // A failed execute() leaves the instance deployed until cancelled.
        try {
            service->execute(ctx);
        } catch (const std::exception& e) {
            record_failure(std::string{"execute threw: "} + e.what());
        } catch (...) {
            record_failure("execute threw a non-standard exception");
        }
        execute_returned_.store(true);
    });
    return Result<void>{};
}

bool ServiceInstance::cancel() {
    std::unique_lock lock(mutex_);
    if (state_.load() != InstanceState::Executing) return false;

    stop_.request_stop();
    // Cancellation proceeds regardless; resources are released below.
    try {
        service_->cancel(context());
    } catch (const std::exception& e) {
        record_failure(std::string{"cancel threw: "} + e.what());
    } catch (...) {
        record_failure("cancel threw a non-standard exception");
    }
    if (thread_.joinable()) thread_.join();
    service_.reset();
    state_.store(InstanceState::Cancelled);
    return true;
}

Result<Bytes> ServiceInstance::invoke(std::string_view method, const Bytes& args) {
    std::shared_lock lock(mutex_);
    if (state_.load() != InstanceState::Executing || !service_) {
        return Error{ErrorCode::ServiceUnavailable, "Instance not executing: " + name_};
    }
    try {
        return service_->invoke(method, args);
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, std::string{"invoke threw: "} + e.what()};
    } catch (...) {
        return Error{ErrorCode::Internal, "invoke threw a non-standard exception"};
    }
}

std::optional<Error> ServiceInstance::failure() const {
    std::lock_guard lock(failure_mutex_);
    return failure_;
}

void ServiceInstance::record_failure(std::string message) {
    std::lock_guard lock(failure_mutex_);
    failure_ = Error{ErrorCode::Internal, std::move(message)};
}

}  // namespace grid_deploy
