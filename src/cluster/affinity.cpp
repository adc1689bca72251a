/**
 * @file affinity.cpp
 * @brief Affinity resolver implementations.
 */

#include "cluster/affinity.hpp"

#include <mutex>

namespace grid_deploy {

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

void fnv_mix(uint64_t& h, std::string_view data) noexcept {
    for (char c : data) {
        h ^= static_cast<uint8_t>(c);
        h *= FNV_PRIME;
    }
}

}  // anonymous namespace

// ── RendezvousAffinity ───────────────────────

void RendezvousAffinity::add_cache(const std::string& cache_name) {
    std::unique_lock lock(mutex_);
    caches_.insert(cache_name);
}

void RendezvousAffinity::remove_cache(const std::string& cache_name) {
    std::unique_lock lock(mutex_);
    caches_.erase(cache_name);
}

bool RendezvousAffinity::has_cache(const std::string& cache_name) const {
    std::shared_lock lock(mutex_);
    return caches_.count(cache_name) > 0;
}

uint64_t RendezvousAffinity::hash(std::string_view a, std::string_view b) noexcept {
    uint64_t h = FNV_OFFSET;
    fnv_mix(h, a);
    fnv_mix(h, std::string_view{"\0", 1});
    fnv_mix(h, b);
    return h;
}

Result<NodeId> RendezvousAffinity::resolve(const std::string& cache_name,
                                           const std::string& key,
                                           const TopologySnapshot& topology) const {
    if (!has_cache(cache_name)) {
        return Error{ErrorCode::AffinityUnresolved, "Unknown cache: " + cache_name};
    }

    const NodeDescriptor* best = nullptr;
    uint64_t best_weight = 0;
    auto cache_key = cache_name + "/" + key;

    for (const auto& node : topology.nodes) {
        if (!node.is_server()) continue;
        auto weight = hash(node.id, cache_key);
        // Ties go to the node earlier in (order, id)
        if (best == nullptr || weight > best_weight) {
            best = &node;
            best_weight = weight;
        }
    }

    if (best == nullptr) {
        return Error{ErrorCode::AffinityUnresolved,
                     "No server node owns " + cache_name + "/" + key};
    }
    return best->id;
}

// ── StaticAffinity ───────────────────────────

void StaticAffinity::assign(const std::string& cache_name, const std::string& key, NodeId owner) {
    std::unique_lock lock(mutex_);
    owners_[{cache_name, key}] = std::move(owner);
}

void StaticAffinity::clear(const std::string& cache_name, const std::string& key) {
    std::unique_lock lock(mutex_);
    owners_.erase({cache_name, key});
}

Result<NodeId> StaticAffinity::resolve(const std::string& cache_name,
                                       const std::string& key,
                                       const TopologySnapshot& topology) const {
    std::shared_lock lock(mutex_);
    auto it = owners_.find({cache_name, key});
    if (it == owners_.end()) {
        return Error{ErrorCode::AffinityUnresolved,
                     "Key not mapped: " + cache_name + "/" + key};
    }
    if (!topology.contains(it->second)) {
        return Error{ErrorCode::AffinityUnresolved,
                     "Owner " + it->second + " not in topology " + std::to_string(topology.version)};
    }
    return it->second;
}

}  // namespace grid_deploy
