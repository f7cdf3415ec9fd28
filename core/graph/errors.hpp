#pragma once

#include "graph/uid_allocator.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace graphine {

/// Base class of every error raised by the graph core.
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message)
        : std::runtime_error(message) {}
};

/// An attribute set does not match the declared schema: a field is
/// unexpected, duplicated, or missing.
class SchemaMismatch : public GraphError {
public:
    SchemaMismatch(const std::string& message, std::vector<std::string> fields = {})
        : GraphError(message), fields_(std::move(fields)) {}

    /// The offending field names.
    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;
};

/// Lookup, modification, or removal of an identifier that is not live.
class UnknownIdentifier : public GraphError {
public:
    explicit UnknownIdentifier(Uid uid)
        : GraphError(describe(uid)), uid_(uid) {}

    Uid uid() const { return uid_; }

private:
    static std::string describe(Uid uid) {
        const char* kind = isNodeUid(uid) ? "node" : isEdgeUid(uid) ? "edge" : "element";
        return std::string("Unknown ") + kind + " identifier: " + std::to_string(uid);
    }

    Uid uid_;
};

} // namespace graphine
