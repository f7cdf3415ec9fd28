#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace graphine {

/// Identifier of a graph element. Positive values name nodes,
/// negative values name edges. Zero is never issued.
using Uid = int64_t;

inline bool isNodeUid(Uid uid) { return uid > 0; }
inline bool isEdgeUid(Uid uid) { return uid < 0; }

// ─── UidAllocator ──────────────────────────────────────────────
// Issues node and edge identifiers. Released identifiers go onto a
// per-kind LIFO free list and are handed out again before any fresh
// identifier. A fresh identifier is count + 1 in magnitude, which
// never collides with a live one as long as only identifiers taken
// from this allocator are released.

class UidAllocator {
public:
    /// Next node identifier given the current number of live nodes.
    Uid nextNodeUid(size_t live_nodes);

    /// Next edge identifier given the current number of live edges.
    Uid nextEdgeUid(size_t live_edges);

    /// Return an identifier to the free list of its kind.
    void release(Uid uid);

    size_t freeNodeCount() const { return free_nodes_.size(); }
    size_t freeEdgeCount() const { return free_edges_.size(); }

private:
    std::vector<Uid> free_nodes_;  // positive
    std::vector<Uid> free_edges_;  // negative
};

} // namespace graphine
