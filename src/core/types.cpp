/**
 * @file types.cpp
 * @brief TopologySnapshot helper method implementations.
 */

#include "core/types.hpp"

#include <algorithm>

namespace grid_deploy {

bool node_order_less(const NodeDescriptor& a, const NodeDescriptor& b) noexcept {
    if (a.order != b.order) return a.order < b.order;
    return a.id < b.id;
}

bool TopologySnapshot::contains(const NodeId& id) const noexcept {
    return find(id) != nullptr;
}

const NodeDescriptor* TopologySnapshot::find(const NodeId& id) const noexcept {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&id](const NodeDescriptor& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

size_t TopologySnapshot::server_count() const noexcept {
    return static_cast<size_t>(
        std::count_if(nodes.begin(), nodes.end(),
                      [](const NodeDescriptor& n) { return n.is_server(); }));
}

}  // namespace grid_deploy
