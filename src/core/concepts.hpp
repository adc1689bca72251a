/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for GridDeploy extension points.
 *
 * User services and node predicates are plugged in through templates
 * constrained by these concepts, so misuse fails at compile time with a
 * readable diagnostic instead of deep inside std::function.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <type_traits>

namespace grid_deploy {

// Forward declarations
class IService;
class ServiceProxy;

// ─────────────────────────────────────────────
// ServiceType
// ─────────────────────────────────────────────

/**
 * @concept ServiceType
 * @brief A concrete service implementation that a factory can construct
 *        from the captured arguments.
 */
template <typename T, typename... Args>
concept ServiceType = std::derived_from<T, IService>
    && !std::is_abstract_v<T>
    && std::constructible_from<T, const Args&...>;

// ─────────────────────────────────────────────
// NodePredicate
// ─────────────────────────────────────────────

/**
 * @concept NodePredicate
 * @brief Callable deciding whether a node is eligible for placement.
 */
template <typename F>
concept NodePredicate = std::copy_constructible<F>
    && std::predicate<const F&, const NodeDescriptor&>;

// ─────────────────────────────────────────────
// ProxyClient
// ─────────────────────────────────────────────

/**
 * @concept ProxyClient
 * @brief Typed client wrapper built on top of an untyped ServiceProxy.
 */
template <typename C>
concept ProxyClient = std::constructible_from<C, ServiceProxy>;

}  // namespace grid_deploy
