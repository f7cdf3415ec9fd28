#include "graph/adjacency_index.hpp"

namespace graphine {

const AdjacencyIndex::EdgeSet& AdjacencyIndex::outgoing(Uid node_id) const {
    static const EdgeSet empty;
    auto it = entries_.find(node_id);
    return it != entries_.end() ? it->second : empty;
}

void AdjacencyIndex::onEdgeAdded(Uid edge_id, Uid start) {
    entries_[start].insert(edge_id);
}

void AdjacencyIndex::onEdgeRelocated(Uid edge_id, Uid old_start, Uid new_start) {
    if (old_start == new_start) return;
    onEdgeRemoved(edge_id, old_start);
    onEdgeAdded(edge_id, new_start);
}

void AdjacencyIndex::onEdgeRemoved(Uid edge_id, Uid start) {
    auto it = entries_.find(start);
    if (it == entries_.end()) return;  // start node already removed
    it->second.erase(edge_id);
    if (it->second.empty()) entries_.erase(it);
}

AdjacencyIndex::EdgeSet AdjacencyIndex::onNodeRemoved(Uid node_id) {
    auto it = entries_.find(node_id);
    if (it == entries_.end()) return {};
    EdgeSet dropped = std::move(it->second);
    entries_.erase(it);
    return dropped;
}

} // namespace graphine
