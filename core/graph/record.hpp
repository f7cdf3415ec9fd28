#pragma once

#include "graph/schema.hpp"
#include "graph/value.hpp"

#include <memory>
#include <string>
#include <vector>

namespace graphine {

/// An immutable tuple of attribute values laid out by a Schema.
/// Records are never changed in place; replace() builds a new one.
/// Node and Edge add typed access on top of this.
class Record {
public:
    /// Build a record from a full attribute set. Throws SchemaMismatch
    /// unless `attributes` names every schema field exactly once.
    Record(std::shared_ptr<const Schema> schema, const Attributes& attributes);

    const Schema& schema() const { return *schema_; }
    const std::shared_ptr<const Schema>& schemaPtr() const { return schema_; }

    /// Field value by name. Throws SchemaMismatch if undeclared.
    const Value& get(const std::string& field) const;
    const Value& operator[](const std::string& field) const { return get(field); }

    const Value& at(size_t index) const { return values_.at(index); }
    const std::vector<Value>& values() const { return values_; }

    /// All fields as (name, value) pairs in schema order.
    Attributes asAttributes() const;

    /// Only the caller-declared fields, without "start"/"end".
    Attributes optionalAttributes() const;

    /// e.g. Edge(start=1, end=2, weight=5)
    std::string toString() const;

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

protected:
    /// Selects the constructor that adopts already-validated values, so it
    /// never competes with the Attributes constructor for braced arguments.
    struct FromValues {};

    Record(FromValues, std::shared_ptr<const Schema> schema, std::vector<Value> values);

    /// Copy of the values with `changes` applied. Throws SchemaMismatch
    /// if a change names an undeclared or repeated field.
    std::vector<Value> replacedValues(const Attributes& changes) const;

    std::shared_ptr<const Schema> schema_;
    std::vector<Value> values_;
};

} // namespace graphine
