/**
 * @file service_configuration.hpp
 * @brief Declarative deployment configuration: what to run, how many, where.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "service/service.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace grid_deploy {

// ─────────────────────────────────────────────
// NodeFilter
// ─────────────────────────────────────────────

/**
 * @brief Tagged eligibility predicate over node descriptors.
 *
 * Predicates cannot be compared, so two filters are equal when their tags
 * are. An empty filter accepts every node.
 */
class NodeFilter {
public:
    NodeFilter() = default;

    static NodeFilter all();
    static NodeFilter servers();
    static NodeFilter with_attribute(std::string key, std::string value);

    template <NodePredicate F>
    static NodeFilter custom(std::string tag, F predicate) {
        NodeFilter filter;
        filter.tag_ = std::move(tag);
        filter.predicate_ = std::move(predicate);
        return filter;
    }

    [[nodiscard]] bool accepts(const NodeDescriptor& node) const;
    [[nodiscard]] bool is_default() const noexcept { return !predicate_; }
    [[nodiscard]] const std::string& tag() const noexcept { return tag_; }

    friend bool operator==(const NodeFilter& a, const NodeFilter& b) {
        return a.tag_ == b.tag_;
    }

private:
    std::string tag_ = "all";
    std::function<bool(const NodeDescriptor&)> predicate_;
};

// ─────────────────────────────────────────────
// Affinity
// ─────────────────────────────────────────────

struct AffinitySpec {
    std::string cache_name;
    std::string key;

    bool operator==(const AffinitySpec&) const = default;
};

// ─────────────────────────────────────────────
// ServiceSettings / ServiceConfiguration
// ─────────────────────────────────────────────

/**
 * @brief Configuration without the factory, as exposed by descriptors.
 */
struct ServiceSettings {
    ServiceName name;
    std::string service_type;
    uint32_t max_per_node_count{0};          ///< 0 = unbounded
    uint32_t total_count{0};                 ///< 0 = unbounded
    std::string node_filter = "all";
    std::optional<AffinitySpec> affinity;

    bool operator==(const ServiceSettings&) const = default;
};

struct ServiceConfiguration {
    ServiceName name;
    ServiceFactory factory;
    NodeFilter node_filter;
    uint32_t max_per_node_count{0};          ///< 0 = unbounded
    uint32_t total_count{0};                 ///< 0 = unbounded
    std::optional<AffinitySpec> affinity;

    [[nodiscard]] bool is_affinity_pinned() const noexcept { return affinity.has_value(); }

    /// Effective limits: affinity pins to exactly one instance on one node.
    [[nodiscard]] uint32_t effective_total_count() const noexcept {
        return affinity ? 1 : total_count;
    }
    [[nodiscard]] uint32_t effective_max_per_node() const noexcept {
        return affinity ? 1 : max_per_node_count;
    }

    [[nodiscard]] ServiceSettings settings() const;
};

using ConfigurationPtr = std::shared_ptr<const ServiceConfiguration>;

/**
 * @brief Reject invalid limit combinations before any fan-out.
 *
 * Under-provisioning (max_per_node * eligible < total) is legal and is not
 * reported here.
 */
Result<void> validate_configuration(const ServiceConfiguration& config);

/// True when both configurations describe the same deployment.
[[nodiscard]] bool same_deployment(const ServiceConfiguration& a, const ServiceConfiguration& b);

}  // namespace grid_deploy
