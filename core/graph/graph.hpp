#pragma once

#include "graph/adjacency_index.hpp"
#include "graph/edge.hpp"
#include "graph/entity_store.hpp"
#include "graph/graph_options.hpp"
#include "graph/node.hpp"
#include "graph/schema.hpp"
#include "graph/search.hpp"
#include "graph/traversal.hpp"
#include "graph/uid_allocator.hpp"
#include "graph/value.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace graphine {

// ─── Graph ─────────────────────────────────────────────────────
// Schema-flexible directed graph. Callers declare node and edge
// fields up front, then work through integer identifiers: positive
// for nodes, negative for edges. Records are immutable and replaced
// on modification. An adjacency index (start node → edges) backs
// traversal and is kept in sync by every mutation.
//
// Removing a node does not remove the edges that reference it unless
// GraphOptions::cascade_node_removal is set: such edges stay in the
// store, and those starting at the node drop out of the adjacency
// index.
//
// Not thread-safe; callers serialize access.

class Graph {
public:
    using NodeStore = EntityStore<Node>;
    using EdgeStore = EntityStore<Edge>;

    /// e.g. Graph({"name"}, {"weight"}) for named nodes, weighted edges.
    /// Throws SchemaMismatch on duplicate field names or an edge field
    /// named "start" or "end".
    Graph(const std::vector<std::string>& node_fields,
          const std::vector<std::string>& edge_fields,
          GraphOptions options = {});

    const Schema& nodeSchema() const { return *node_schema_; }
    const Schema& edgeSchema() const { return *edge_schema_; }
    const GraphOptions& options() const { return options_; }

    // ── Element access ──

    /// Node or edge record by identifier sign.
    /// Throws UnknownIdentifier if not live.
    const Record& get(Uid uid) const;
    const Record& operator[](Uid uid) const { return get(uid); }

    const Node& getNode(Uid uid) const { return nodes_.get(uid); }
    const Edge& getEdge(Uid uid) const { return edges_.get(uid); }
    const Node* findNode(Uid uid) const { return nodes_.find(uid); }
    const Edge* findEdge(Uid uid) const { return edges_.find(uid); }

    bool hasNode(Uid uid) const { return nodes_.contains(uid); }
    bool hasEdge(Uid uid) const { return edges_.contains(uid); }

    /// Install `replacement` under a live identifier. The replacement
    /// must have this graph's schema for that kind. Moving an edge's
    /// start updates the adjacency index.
    void set(Uid uid, const Record& replacement);

    /// Remove a node or edge by identifier sign; returns the record.
    Record remove(Uid uid);

    /// Membership by value among live records.
    bool contains(const Node& node) const;
    bool contains(const Edge& edge) const;

    /// Validated records carrying this graph's schemas, e.g. for set().
    Node makeNode(const Attributes& attributes) const;
    Edge makeEdge(Uid start, Uid end, const Attributes& attributes = {}) const;

    // ── Mutation ──

    /// Add a node with every declared node field. Returns its identifier.
    Uid addNode(const Attributes& attributes = {});

    /// Add an edge start → end with every declared edge field.
    /// Endpoints are not required to exist unless
    /// GraphOptions::require_live_endpoints is set.
    Uid addEdge(Uid start, Uid end, const Attributes& attributes = {});

    /// Overwrite the named fields of a node; the rest stay as they were.
    Uid modifyNode(Uid uid, const Attributes& changes);

    /// Overwrite the named fields of an edge, including start/end.
    Uid modifyEdge(Uid uid, const Attributes& changes);

    /// Remove a node and recycle its identifier. Edges referencing it
    /// are kept (see class comment) unless cascading is enabled.
    Node removeNode(Uid uid);

    /// Remove an edge and recycle its identifier.
    Edge removeEdge(Uid uid);

    // ── Enumeration ──

    std::vector<Uid> nodeUids() const { return nodes_.uids(); }
    std::vector<Uid> edgeUids() const { return edges_.uids(); }

    /// Insertion-ordered (uid, record) ranges.
    const NodeStore& nodes() const { return nodes_; }
    const EdgeStore& edges() const { return edges_; }

    void forEachNode(const std::function<void(Uid, const Node&)>& fn) const;
    void forEachEdge(const std::function<void(Uid, const Edge&)>& fn) const;

    /// Order and size of the graph.
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──

    /// The node itself, then the end of each indexed outgoing edge.
    std::vector<Uid> adjacentUids(Uid uid) const;

    /// Records of adjacentUids(). Throws UnknownIdentifier on a
    /// dangling edge end.
    std::vector<Node> adjacentNodes(Uid uid) const;

    std::vector<Uid> outgoingUids(Uid uid) const;
    std::vector<Edge> outgoingEdges(Uid uid) const;

    const AdjacencyIndex& adjacency() const { return adjacency_; }

    // ── Queries ──

    /// Lazy scan for records where any predicate field matches.
    /// Throws SchemaMismatch on an undeclared field.
    SearchResults<Node> searchNodes(const Attributes& predicate) const;
    SearchResults<Edge> searchEdges(const Attributes& predicate) const;

    // ── Traversal ──

    Traversal traverse(Uid root, Selector selector) const;
    Traversal depthFirst(Uid root) const;
    Traversal breadthFirst(Uid root) const;

    // ── Subgraph extraction ──

    /// New independent graph holding copies of the given nodes and of
    /// every edge with both endpoints among them. Identifiers are
    /// assigned afresh; required fields are not part of the new schema.
    Graph generateSubgraph(const std::vector<Uid>& node_uids) const;

private:
    void checkEndpoints(const Edge& edge) const;
    void checkSchema(const Record& record, const Schema& expected) const;

    GraphOptions options_;
    std::shared_ptr<const Schema> node_schema_;
    std::shared_ptr<const Schema> edge_schema_;

    NodeStore nodes_;
    EdgeStore edges_;
    AdjacencyIndex adjacency_;
    UidAllocator uids_;
};

} // namespace graphine
