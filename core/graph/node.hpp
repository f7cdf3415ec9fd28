#pragma once

#include "graph/record.hpp"

namespace graphine {

/// A node record. Carries exactly the graph's declared node fields
/// and is addressed only through its identifier.
class Node : public Record {
public:
    Node(std::shared_ptr<const Schema> schema, const Attributes& attributes)
        : Record(std::move(schema), attributes) {}

    /// New node with only the named fields overwritten.
    Node replace(const Attributes& changes) const {
        return Node(FromValues{}, schema_, replacedValues(changes));
    }

private:
    Node(FromValues tag, std::shared_ptr<const Schema> schema, std::vector<Value> values)
        : Record(tag, std::move(schema), std::move(values)) {}
};

} // namespace graphine
