#include "graph/graph.hpp"
#include "graph/errors.hpp"

#include <kj/debug.h>

#include <unordered_map>

namespace graphine {

Graph::Graph(const std::vector<std::string>& node_fields,
             const std::vector<std::string>& edge_fields,
             GraphOptions options)
    : options_(options),
      node_schema_(Schema::forNodes(node_fields)),
      edge_schema_(Schema::forEdges(edge_fields)) {}

// ─── Element access ────────────────────────────────────────────

const Record& Graph::get(Uid uid) const {
    if (isNodeUid(uid)) return nodes_.get(uid);
    if (isEdgeUid(uid)) return edges_.get(uid);
    throw UnknownIdentifier(uid);
}

void Graph::set(Uid uid, const Record& replacement) {
    if (isNodeUid(uid)) {
        if (!nodes_.contains(uid)) throw UnknownIdentifier(uid);
        checkSchema(replacement, *node_schema_);
        nodes_.insert(uid, Node(node_schema_, replacement.asAttributes()));
        return;
    }
    if (!isEdgeUid(uid)) throw UnknownIdentifier(uid);

    const Edge& old = edges_.get(uid);
    checkSchema(replacement, *edge_schema_);
    Edge updated(edge_schema_, replacement.asAttributes());
    if (updated.start() != old.start() || updated.end() != old.end()) {
        checkEndpoints(updated);
    }
    Uid old_start = old.start();
    Uid new_start = updated.start();
    edges_.insert(uid, std::move(updated));
    adjacency_.onEdgeRelocated(uid, old_start, new_start);
}

Record Graph::remove(Uid uid) {
    if (isNodeUid(uid)) return removeNode(uid);
    if (isEdgeUid(uid)) return removeEdge(uid);
    throw UnknownIdentifier(uid);
}

bool Graph::contains(const Node& node) const {
    for (const auto& [_, n] : nodes_) {
        if (n == node) return true;
    }
    return false;
}

bool Graph::contains(const Edge& edge) const {
    for (const auto& [_, e] : edges_) {
        if (e == edge) return true;
    }
    return false;
}

Node Graph::makeNode(const Attributes& attributes) const {
    return Node(node_schema_, attributes);
}

Edge Graph::makeEdge(Uid start, Uid end, const Attributes& attributes) const {
    Attributes all;
    all.reserve(attributes.size() + 2);
    all.emplace_back("start", start);
    all.emplace_back("end", end);
    all.insert(all.end(), attributes.begin(), attributes.end());
    return Edge(edge_schema_, all);
}

// ─── Mutation ──────────────────────────────────────────────────

Uid Graph::addNode(const Attributes& attributes) {
    Node node = makeNode(attributes);
    Uid uid = uids_.nextNodeUid(nodes_.size());
    nodes_.insert(uid, std::move(node));
    return uid;
}

Uid Graph::addEdge(Uid start, Uid end, const Attributes& attributes) {
    Edge edge = makeEdge(start, end, attributes);
    checkEndpoints(edge);
    Uid uid = uids_.nextEdgeUid(edges_.size());
    edges_.insert(uid, std::move(edge));
    adjacency_.onEdgeAdded(uid, start);
    return uid;
}

Uid Graph::modifyNode(Uid uid, const Attributes& changes) {
    Node updated = nodes_.get(uid).replace(changes);
    nodes_.insert(uid, std::move(updated));
    return uid;
}

Uid Graph::modifyEdge(Uid uid, const Attributes& changes) {
    const Edge& old = edges_.get(uid);
    Edge updated = old.replace(changes);
    if (updated.start() != old.start() || updated.end() != old.end()) {
        checkEndpoints(updated);
    }
    Uid old_start = old.start();
    Uid new_start = updated.start();
    edges_.insert(uid, std::move(updated));
    adjacency_.onEdgeRelocated(uid, old_start, new_start);
    return uid;
}

Node Graph::removeNode(Uid uid) {
    if (!nodes_.contains(uid)) throw UnknownIdentifier(uid);

    if (options_.cascade_node_removal) {
        std::vector<Uid> attached;
        for (const auto& [eid, edge] : edges_) {
            if (edge.start() == uid || edge.end() == uid) attached.push_back(eid);
        }
        for (Uid eid : attached) {
            removeEdge(eid);
        }
        if (!attached.empty()) {
            KJ_LOG(INFO, "cascaded edge removal", uid, attached.size());
        }
    }

    Node node = nodes_.erase(uid);
    AdjacencyIndex::EdgeSet orphaned = adjacency_.onNodeRemoved(uid);
    if (!orphaned.empty()) {
        KJ_LOG(INFO, "removed node leaves outgoing edges unindexed", uid, orphaned.size());
    }
    uids_.release(uid);
    return node;
}

Edge Graph::removeEdge(Uid uid) {
    Edge edge = edges_.erase(uid);
    adjacency_.onEdgeRemoved(uid, edge.start());
    uids_.release(uid);
    return edge;
}

// ─── Enumeration ───────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(Uid, const Node&)>& fn) const {
    for (const auto& [uid, node] : nodes_) {
        fn(uid, node);
    }
}

void Graph::forEachEdge(const std::function<void(Uid, const Edge&)>& fn) const {
    for (const auto& [uid, edge] : edges_) {
        fn(uid, edge);
    }
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<Uid> Graph::adjacentUids(Uid uid) const {
    const auto& outgoing = adjacency_.outgoing(uid);
    std::vector<Uid> out;
    out.reserve(outgoing.size() + 1);
    out.push_back(uid);
    for (Uid eid : outgoing) {
        out.push_back(edges_.get(eid).end());
    }
    return out;
}

std::vector<Node> Graph::adjacentNodes(Uid uid) const {
    std::vector<Node> out;
    for (Uid nid : adjacentUids(uid)) {
        out.push_back(nodes_.get(nid));
    }
    return out;
}

std::vector<Uid> Graph::outgoingUids(Uid uid) const {
    const auto& outgoing = adjacency_.outgoing(uid);
    return std::vector<Uid>(outgoing.begin(), outgoing.end());
}

std::vector<Edge> Graph::outgoingEdges(Uid uid) const {
    std::vector<Edge> out;
    for (Uid eid : adjacency_.outgoing(uid)) {
        out.push_back(edges_.get(eid));
    }
    return out;
}

// ─── Queries ───────────────────────────────────────────────────

SearchResults<Node> Graph::searchNodes(const Attributes& predicate) const {
    return SearchResults<Node>(nodes_, *node_schema_, predicate);
}

SearchResults<Edge> Graph::searchEdges(const Attributes& predicate) const {
    return SearchResults<Edge>(edges_, *edge_schema_, predicate);
}

// ─── Traversal ─────────────────────────────────────────────────

Traversal Graph::traverse(Uid root, Selector selector) const {
    return Traversal(*this, root, std::move(selector));
}

Traversal Graph::depthFirst(Uid root) const {
    return Traversal(*this, root, takeLast);
}

Traversal Graph::breadthFirst(Uid root) const {
    return Traversal(*this, root, takeFirst);
}

// ─── Subgraph extraction ──────────────────────────────────────

Graph Graph::generateSubgraph(const std::vector<Uid>& node_uids) const {
    for (Uid uid : node_uids) {
        if (!nodes_.contains(uid)) throw UnknownIdentifier(uid);
    }

    Graph sub(node_schema_->optionalFields(), edge_schema_->optionalFields(), options_);

    // source uid → subgraph uid
    std::unordered_map<Uid, Uid> mapping;
    for (Uid uid : node_uids) {
        if (mapping.count(uid)) continue;
        mapping[uid] = sub.addNode(nodes_.get(uid).optionalAttributes());
    }

    size_t excluded = 0;
    for (const auto& [_, edge] : edges_) {
        auto from = mapping.find(edge.start());
        auto to = mapping.find(edge.end());
        if (from != mapping.end() && to != mapping.end()) {
            sub.addEdge(from->second, to->second, edge.optionalAttributes());
        } else if (from != mapping.end() || to != mapping.end()) {
            excluded++;
        }
    }

    KJ_LOG(INFO, "generated subgraph", sub.nodeCount(), sub.edgeCount(), excluded);
    return sub;
}

// ─── Validation ────────────────────────────────────────────────

void Graph::checkEndpoints(const Edge& edge) const {
    bool start_live = nodes_.contains(edge.start());
    bool end_live = nodes_.contains(edge.end());
    if (start_live && end_live) return;
    if (options_.require_live_endpoints) {
        throw UnknownIdentifier(start_live ? edge.end() : edge.start());
    }
    KJ_LOG(INFO, "edge endpoint is not a live node", edge.start(), edge.end());
}

void Graph::checkSchema(const Record& record, const Schema& expected) const {
    if (record.schema() != expected) {
        throw SchemaMismatch("Replacement " + record.schema().kind() +
                             " does not match the graph's " + expected.kind() + " schema",
                             record.schema().fields());
    }
}

} // namespace graphine
