#include "graph/uid_allocator.hpp"
#include "graph/errors.hpp"

namespace graphine {

Uid UidAllocator::nextNodeUid(size_t live_nodes) {
    if (!free_nodes_.empty()) {
        Uid uid = free_nodes_.back();
        free_nodes_.pop_back();
        return uid;
    }
    return static_cast<Uid>(live_nodes) + 1;
}

Uid UidAllocator::nextEdgeUid(size_t live_edges) {
    if (!free_edges_.empty()) {
        Uid uid = free_edges_.back();
        free_edges_.pop_back();
        return uid;
    }
    return -static_cast<Uid>(live_edges) - 1;
}

void UidAllocator::release(Uid uid) {
    if (isNodeUid(uid)) {
        free_nodes_.push_back(uid);
    } else if (isEdgeUid(uid)) {
        free_edges_.push_back(uid);
    } else {
        throw UnknownIdentifier(uid);
    }
}

} // namespace graphine
