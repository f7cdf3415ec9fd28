#pragma once

#include "graph/uid_allocator.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <optional>
#include <unordered_set>

namespace graphine {

class Graph;

/// Pending-to-visit worklist of a traversal.
using Frontier = std::deque<Uid>;

/// Removes one identifier from a non-empty frontier and returns it.
/// Its removal discipline decides the visiting order.
using Selector = std::function<Uid(Frontier&)>;

/// Stack discipline: depth-first.
Uid takeLast(Frontier& frontier);

/// Queue discipline: breadth-first.
Uid takeFirst(Frontier& frontier);

// ─── Traversal ─────────────────────────────────────────────────
// Generalized worklist walk from a root node. Each step the selector
// picks a frontier identifier, which is yielded and marked visited;
// its adjacent identifiers that are neither pending nor visited are
// appended to the frontier. Every reachable identifier is yielded
// exactly once. Pending and visited membership are hash lookups.
//
// Single pass and lazy: a yielded node is expanded only when the
// next element is pulled. The graph must outlive the traversal and
// should not be mutated while it runs.

class Traversal {
public:
    Traversal(const Graph& graph, Uid root, Selector selector);

    Traversal(const Traversal&) = delete;
    Traversal& operator=(const Traversal&) = delete;
    Traversal(Traversal&&) = default;  // not while an iterator is live
    Traversal& operator=(Traversal&&) = default;

    /// Next identifier, or nullopt once the reachable set is exhausted.
    std::optional<Uid> next();

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Uid;
        using difference_type = std::ptrdiff_t;
        using pointer = const Uid*;
        using reference = const Uid&;

        iterator() = default;

        reference operator*() const { return *current_; }
        iterator& operator++() {
            current_ = owner_->next();
            return *this;
        }
        void operator++(int) { ++(*this); }

        bool operator==(const iterator& other) const {
            return !current_ && !other.current_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class Traversal;
        explicit iterator(Traversal* owner) : owner_(owner), current_(owner->next()) {}

        Traversal* owner_ = nullptr;
        std::optional<Uid> current_;
    };

    /// Starts pulling; call once per traversal.
    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    size_t visitedCount() const { return visited_.size(); }
    size_t frontierSize() const { return frontier_.size(); }

private:
    void expand(Uid uid);

    const Graph* graph_;
    Selector selector_;
    Frontier frontier_;
    std::unordered_set<Uid> pending_;
    std::unordered_set<Uid> visited_;
    std::optional<Uid> unexpanded_;
};

} // namespace graphine
