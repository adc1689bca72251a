/**
 * @file affinity.hpp
 * @brief Key-affinity resolution: which node owns a cache key.
 *
 * The engine only sees IAffinityResolver. RendezvousAffinity is the default
 * (highest-random-weight hashing over server nodes); StaticAffinity holds an
 * explicit ownership table pushed by an external partition map.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace grid_deploy {

class IAffinityResolver {
public:
    virtual ~IAffinityResolver() = default;

    /// Owner of (cache, key) for the given topology, or AffinityUnresolved.
    virtual Result<NodeId> resolve(const std::string& cache_name,
                                   const std::string& key,
                                   const TopologySnapshot& topology) const = 0;
};

/**
 * @brief Rendezvous hashing over the server nodes of a snapshot.
 *
 * Only registered caches resolve. Client nodes never own keys.
 */
class RendezvousAffinity : public IAffinityResolver {
public:
    void add_cache(const std::string& cache_name);
    void remove_cache(const std::string& cache_name);
    [[nodiscard]] bool has_cache(const std::string& cache_name) const;

    Result<NodeId> resolve(const std::string& cache_name,
                           const std::string& key,
                           const TopologySnapshot& topology) const override;

    /// FNV-1a 64-bit, stable across processes and platforms.
    [[nodiscard]] static uint64_t hash(std::string_view a, std::string_view b) noexcept;

private:
    mutable std::shared_mutex mutex_;
    std::set<std::string> caches_;
};

/**
 * @brief Explicit (cache, key) -> node ownership table.
 */
class StaticAffinity : public IAffinityResolver {
public:
    void assign(const std::string& cache_name, const std::string& key, NodeId owner);
    void clear(const std::string& cache_name, const std::string& key);

    Result<NodeId> resolve(const std::string& cache_name,
                           const std::string& key,
                           const TopologySnapshot& topology) const override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, std::string>, NodeId> owners_;
};

}  // namespace grid_deploy
