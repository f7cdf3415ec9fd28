#pragma once

#include "graph/entity_store.hpp"
#include "graph/schema.hpp"
#include "graph/value.hpp"

#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace graphine {

// ─── SearchResults ─────────────────────────────────────────────
// Lazy linear scan over a store. A record matches when any one of
// the predicate fields equals the given value. Every begin() starts
// a fresh scan, so the results reflect the store at iteration time.
// The store must outlive the results and must not change while an
// iterator is in use.

template <typename R>
class SearchResults {
public:
    SearchResults(const EntityStore<R>& store, const Schema& schema, const Attributes& predicate)
        : store_(&store) {
        schema.checkFieldNames(predicate);
        for (const auto& [name, value] : predicate) {
            terms_.emplace_back(schema.indexOf(name), value);
        }
    }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = R;
        using difference_type = std::ptrdiff_t;
        using pointer = const R*;
        using reference = const R&;

        iterator() = default;

        reference operator*() const { return pos_->second; }
        pointer operator->() const { return &pos_->second; }

        /// Identifier of the current match.
        Uid uid() const { return pos_->first; }

        iterator& operator++() {
            ++pos_;
            skip();
            return *this;
        }

        iterator operator++(int) {
            iterator prev = *this;
            ++(*this);
            return prev;
        }

        bool operator==(const iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const iterator& other) const { return pos_ != other.pos_; }

    private:
        friend class SearchResults;

        using Pos = typename EntityStore<R>::const_iterator;

        iterator(const SearchResults* owner, Pos pos, Pos end)
            : owner_(owner), pos_(pos), end_(end) {
            skip();
        }

        void skip() {
            while (pos_ != end_ && !owner_->matches(pos_->second)) ++pos_;
        }

        const SearchResults* owner_ = nullptr;
        Pos pos_;
        Pos end_;
    };

    iterator begin() const { return iterator(this, store_->begin(), store_->end()); }
    iterator end() const { return iterator(this, store_->end(), store_->end()); }

    /// Drain into (uid, record) pairs.
    std::vector<std::pair<Uid, R>> collect() const {
        std::vector<std::pair<Uid, R>> out;
        for (auto it = begin(); it != end(); ++it) {
            out.emplace_back(it.uid(), *it);
        }
        return out;
    }

    std::vector<Uid> uids() const {
        std::vector<Uid> out;
        for (auto it = begin(); it != end(); ++it) {
            out.push_back(it.uid());
        }
        return out;
    }

    size_t count() const {
        size_t n = 0;
        for (auto it = begin(); it != end(); ++it) n++;
        return n;
    }

private:
    bool matches(const R& record) const {
        for (const auto& [index, value] : terms_) {
            if (record.at(index) == value) return true;
        }
        return false;
    }

    const EntityStore<R>* store_;
    std::vector<std::pair<size_t, Value>> terms_;
};

} // namespace graphine
