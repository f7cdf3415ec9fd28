#pragma once

#include "graph/uid_allocator.hpp"

#include <cstddef>
#include <functional>
#include <set>
#include <unordered_map>

namespace graphine {

// ─── AdjacencyIndex ────────────────────────────────────────────
// node_id → set of outgoing edge_ids, i.e. the edges whose start is
// that node. Every edge mutation in Graph updates it in the same
// call. Reads of an unseen node yield the empty set.

class AdjacencyIndex {
public:
    /// Ordered so edges come out by ascending magnitude: -1, -2, ...
    using EdgeSet = std::set<Uid, std::greater<Uid>>;

    const EdgeSet& outgoing(Uid node_id) const;
    bool hasEntry(Uid node_id) const { return entries_.count(node_id) > 0; }
    size_t entryCount() const { return entries_.size(); }

    void onEdgeAdded(Uid edge_id, Uid start);
    void onEdgeRelocated(Uid edge_id, Uid old_start, Uid new_start);
    void onEdgeRemoved(Uid edge_id, Uid start);

    /// Drop the whole entry for `node_id` and return what it held.
    /// Edges elsewhere that reference the node are left alone.
    EdgeSet onNodeRemoved(Uid node_id);

private:
    std::unordered_map<Uid, EdgeSet> entries_;
};

} // namespace graphine
