#include "graph/schema.hpp"
#include "graph/errors.hpp"

#include <unordered_set>

namespace graphine {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

std::shared_ptr<const Schema> Schema::forNodes(const std::vector<std::string>& fields) {
    return std::make_shared<const Schema>("Node", fields, 0);
}

std::shared_ptr<const Schema> Schema::forEdges(const std::vector<std::string>& fields) {
    std::vector<std::string> all = {"start", "end"};
    all.insert(all.end(), fields.begin(), fields.end());
    return std::make_shared<const Schema>("Edge", std::move(all), 2);
}

Schema::Schema(std::string kind, std::vector<std::string> fields, size_t required_count)
    : kind_(std::move(kind)), fields_(std::move(fields)), required_count_(required_count) {
    std::vector<std::string> duplicates;
    for (size_t i = 0; i < fields_.size(); i++) {
        if (!index_.emplace(fields_[i], i).second) {
            duplicates.push_back(fields_[i]);
        }
    }
    if (!duplicates.empty()) {
        throw SchemaMismatch(kind_ + " schema declares duplicate fields: " +
                             joinNames(duplicates), duplicates);
    }
}

std::vector<std::string> Schema::optionalFields() const {
    return std::vector<std::string>(fields_.begin() + required_count_, fields_.end());
}

bool Schema::isRequired(const std::string& name) const {
    auto it = index_.find(name);
    return it != index_.end() && it->second < required_count_;
}

size_t Schema::indexOf(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw SchemaMismatch(kind_ + " has no field: " + name, {name});
    }
    return it->second;
}

void Schema::checkFieldNames(const Attributes& attributes) const {
    std::vector<std::string> unexpected;
    std::vector<std::string> duplicated;
    std::unordered_set<std::string> seen;
    for (const auto& [name, _] : attributes) {
        if (!hasField(name)) {
            unexpected.push_back(name);
        } else if (!seen.insert(name).second) {
            duplicated.push_back(name);
        }
    }
    if (unexpected.empty() && duplicated.empty()) return;

    std::string message = kind_ + ":";
    std::vector<std::string> offending;
    if (!unexpected.empty()) {
        message += " got unexpected field names: " + joinNames(unexpected) + ";";
        offending.insert(offending.end(), unexpected.begin(), unexpected.end());
    }
    if (!duplicated.empty()) {
        message += " got multiple values for: " + joinNames(duplicated) + ";";
        offending.insert(offending.end(), duplicated.begin(), duplicated.end());
    }
    message.pop_back();
    throw SchemaMismatch(message, offending);
}

std::vector<Value> Schema::validate(const Attributes& attributes) const {
    checkFieldNames(attributes);

    std::vector<Value> values(fields_.size());
    std::vector<bool> supplied(fields_.size(), false);
    for (const auto& [name, value] : attributes) {
        size_t i = index_.at(name);
        values[i] = value;
        supplied[i] = true;
    }

    std::vector<std::string> missing;
    for (size_t i = 0; i < fields_.size(); i++) {
        if (!supplied[i]) missing.push_back(fields_[i]);
    }
    if (!missing.empty()) {
        throw SchemaMismatch(kind_ + ": missing fields: " + joinNames(missing), missing);
    }
    return values;
}

} // namespace graphine
