#include "graph/record.hpp"

namespace graphine {

Record::Record(std::shared_ptr<const Schema> schema, const Attributes& attributes)
    : schema_(std::move(schema)), values_(schema_->validate(attributes)) {}

Record::Record(FromValues, std::shared_ptr<const Schema> schema, std::vector<Value> values)
    : schema_(std::move(schema)), values_(std::move(values)) {}

const Value& Record::get(const std::string& field) const {
    return values_[schema_->indexOf(field)];
}

Attributes Record::asAttributes() const {
    Attributes out;
    out.reserve(values_.size());
    for (size_t i = 0; i < values_.size(); i++) {
        out.emplace_back(schema_->fields()[i], values_[i]);
    }
    return out;
}

Attributes Record::optionalAttributes() const {
    Attributes out;
    for (size_t i = schema_->requiredCount(); i < values_.size(); i++) {
        out.emplace_back(schema_->fields()[i], values_[i]);
    }
    return out;
}

std::string Record::toString() const {
    std::string out = schema_->kind() + "(";
    for (size_t i = 0; i < values_.size(); i++) {
        if (i > 0) out += ", ";
        out += schema_->fields()[i] + "=" + values_[i].toString();
    }
    return out + ")";
}

bool Record::operator==(const Record& other) const {
    return schema_->fields() == other.schema_->fields() && values_ == other.values_;
}

std::vector<Value> Record::replacedValues(const Attributes& changes) const {
    schema_->checkFieldNames(changes);
    std::vector<Value> values = values_;
    for (const auto& [name, value] : changes) {
        values[schema_->indexOf(name)] = value;
    }
    return values;
}

} // namespace graphine
