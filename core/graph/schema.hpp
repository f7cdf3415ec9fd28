#pragma once

#include "graph/value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphine {

// ─── Schema ────────────────────────────────────────────────────
// Fixed, ordered field layout shared by every record of one kind in
// one graph. Required fields come first: edges always lead with
// "start" and "end", nodes have none. Immutable once built.

class Schema {
public:
    /// Node layout: exactly the declared fields.
    static std::shared_ptr<const Schema> forNodes(const std::vector<std::string>& fields);

    /// Edge layout: "start", "end", then the declared fields.
    static std::shared_ptr<const Schema> forEdges(const std::vector<std::string>& fields);

    Schema(std::string kind, std::vector<std::string> fields, size_t required_count);

    /// Record kind name used in rendering and errors ("Node" / "Edge").
    const std::string& kind() const { return kind_; }

    const std::vector<std::string>& fields() const { return fields_; }
    size_t fieldCount() const { return fields_.size(); }
    size_t requiredCount() const { return required_count_; }

    /// Fields the caller declared, without the implicit required ones.
    std::vector<std::string> optionalFields() const;

    bool hasField(const std::string& name) const { return index_.count(name) > 0; }
    bool isRequired(const std::string& name) const;

    /// Position of a field. Throws SchemaMismatch if undeclared.
    size_t indexOf(const std::string& name) const;

    /// Check that `attributes` names every field exactly once and
    /// nothing else; returns the values in field order.
    /// Throws SchemaMismatch naming the offending fields.
    std::vector<Value> validate(const Attributes& attributes) const;

    /// Throws SchemaMismatch if any name is undeclared or repeated.
    void checkFieldNames(const Attributes& attributes) const;

    bool operator==(const Schema& other) const {
        return kind_ == other.kind_ && fields_ == other.fields_ &&
               required_count_ == other.required_count_;
    }
    bool operator!=(const Schema& other) const { return !(*this == other); }

private:
    std::string kind_;
    std::vector<std::string> fields_;
    size_t required_count_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace graphine
