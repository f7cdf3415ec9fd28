#pragma once

#include "graph/errors.hpp"
#include "graph/uid_allocator.hpp"

#include <cstddef>
#include <list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graphine {

// ─── EntityStore ───────────────────────────────────────────────
// Identifier → record mapping for one element kind. Iterates in
// insertion order; overwriting an existing identifier keeps its
// position. Lookup, insert and erase are O(1).

template <typename R>
class EntityStore {
public:
    using Entry = std::pair<Uid, R>;
    using const_iterator = typename std::list<Entry>::const_iterator;

    EntityStore() = default;

    // The index holds iterators into entries_, so copies rebuild it.
    EntityStore(const EntityStore& other) : entries_(other.entries_) { reindex(); }
    EntityStore& operator=(const EntityStore& other) {
        if (this != &other) {
            entries_ = other.entries_;
            reindex();
        }
        return *this;
    }
    EntityStore(EntityStore&&) = default;
    EntityStore& operator=(EntityStore&&) = default;

    /// Record under `uid`. Throws UnknownIdentifier if absent.
    const R& get(Uid uid) const {
        const R* record = find(uid);
        if (!record) throw UnknownIdentifier(uid);
        return *record;
    }

    const R* find(Uid uid) const {
        auto it = index_.find(uid);
        return it != index_.end() ? &it->second->second : nullptr;
    }

    bool contains(Uid uid) const { return index_.count(uid) > 0; }

    /// Create or overwrite. The caller owns identifier allocation.
    void insert(Uid uid, R record) {
        auto it = index_.find(uid);
        if (it != index_.end()) {
            it->second->second = std::move(record);
            return;
        }
        entries_.emplace_back(uid, std::move(record));
        index_.emplace(uid, std::prev(entries_.end()));
    }

    /// Remove and return the record. Throws UnknownIdentifier if absent.
    R erase(Uid uid) {
        auto it = index_.find(uid);
        if (it == index_.end()) throw UnknownIdentifier(uid);
        R record = std::move(it->second->second);
        entries_.erase(it->second);
        index_.erase(it);
        return record;
    }

    std::vector<Uid> uids() const {
        std::vector<Uid> out;
        out.reserve(entries_.size());
        for (const auto& [uid, _] : entries_) {
            out.push_back(uid);
        }
        return out;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    void reindex() {
        index_.clear();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            index_.emplace(it->first, it);
        }
    }

    std::list<Entry> entries_;
    std::unordered_map<Uid, typename std::list<Entry>::iterator> index_;
};

} // namespace graphine
