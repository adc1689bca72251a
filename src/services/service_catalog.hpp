/**
 * @file service_catalog.hpp
 * @brief Maps service kind names to factories for configuration-driven deployment.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "service/service.hpp"
#include "service/service_configuration.hpp"

#include <map>
#include <string>
#include <vector>

namespace grid_deploy {

class ServiceCatalog {
public:
    /// Catalog with "echo" and "heartbeat" registered.
    static ServiceCatalog with_builtins(Logger logger);

    /// Register or replace a kind.
    void register_kind(const std::string& kind, ServiceFactory factory);

    [[nodiscard]] Result<ServiceFactory> factory(const std::string& kind) const;
    [[nodiscard]] std::vector<std::string> kinds() const;

    /**
     * @brief Build a deployable configuration from a [[service]] entry.
     *
     * Node filters: "all", "servers" or "attr:key=value".
     */
    [[nodiscard]] Result<ServiceConfiguration> to_configuration(const ServiceEntry& entry) const;

    [[nodiscard]] static Result<NodeFilter> parse_filter(const std::string& text);

private:
    std::map<std::string, ServiceFactory> factories_;
};

}  // namespace grid_deploy
