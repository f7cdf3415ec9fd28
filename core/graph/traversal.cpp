#include "graph/traversal.hpp"
#include "graph/graph.hpp"

namespace graphine {

Uid takeLast(Frontier& frontier) {
    Uid uid = frontier.back();
    frontier.pop_back();
    return uid;
}

Uid takeFirst(Frontier& frontier) {
    Uid uid = frontier.front();
    frontier.pop_front();
    return uid;
}

Traversal::Traversal(const Graph& graph, Uid root, Selector selector)
    : graph_(&graph), selector_(std::move(selector)) {
    if (!graph.hasNode(root)) throw UnknownIdentifier(root);
    frontier_.push_back(root);
    pending_.insert(root);
}

std::optional<Uid> Traversal::next() {
    if (unexpanded_) {
        expand(*unexpanded_);
        unexpanded_.reset();
    }
    if (frontier_.empty()) return std::nullopt;

    Uid current = selector_(frontier_);
    pending_.erase(current);
    visited_.insert(current);
    unexpanded_ = current;
    return current;
}

void Traversal::expand(Uid uid) {
    for (Uid neighbor : graph_->adjacentUids(uid)) {
        if (pending_.count(neighbor) || visited_.count(neighbor)) continue;
        frontier_.push_back(neighbor);
        pending_.insert(neighbor);
    }
}

} // namespace graphine
