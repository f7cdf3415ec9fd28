#pragma once

#include "graph/record.hpp"
#include "graph/uid_allocator.hpp"

namespace graphine {

/// A directed edge record: (start, end, <declared fields...>).
/// start and end are node identifiers; they are not checked against
/// the node store, so an edge may dangle.
class Edge : public Record {
public:
    Edge(std::shared_ptr<const Schema> schema, const Attributes& attributes)
        : Record(std::move(schema), attributes) {
        checkEndpoints();
    }

    Uid start() const { return values_[0].asInt(); }
    Uid end() const { return values_[1].asInt(); }

    /// New edge with only the named fields overwritten. Replacing
    /// "start" or "end" moves the edge.
    Edge replace(const Attributes& changes) const {
        return Edge(FromValues{}, schema_, replacedValues(changes));
    }

private:
    Edge(FromValues tag, std::shared_ptr<const Schema> schema, std::vector<Value> values)
        : Record(tag, std::move(schema), std::move(values)) {
        checkEndpoints();
    }

    void checkEndpoints() const;
};

} // namespace graphine
