#include "graph/edge.hpp"
#include "graph/errors.hpp"

namespace graphine {

void Edge::checkEndpoints() const {
    if (schema_->requiredCount() < 2) {
        throw SchemaMismatch(schema_->kind() + " schema lacks start/end fields",
                             {"start", "end"});
    }
    for (size_t i = 0; i < 2; i++) {
        if (!values_[i].isInt()) {
            const std::string& field = schema_->fields()[i];
            throw SchemaMismatch("Edge field '" + field + "' must hold a node identifier, got " +
                                 values_[i].toString(), {field});
        }
    }
}

} // namespace graphine
