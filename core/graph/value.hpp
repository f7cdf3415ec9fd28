#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace graphine {

/// A single attribute value carried by a node or edge field.
/// Holds null, bool, integer, double, or string.
class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string>;

    Value() = default;
    Value(bool v) : data_(v) {}
    /// Any integer type except bool. Unsigned values above INT64_MAX
    /// throw GraphError.
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
    Value(T v) : data_(checkedInt(v)) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(data_); }
    bool isBool() const { return std::holds_alternative<bool>(data_); }
    bool isInt() const { return std::holds_alternative<int64_t>(data_); }
    bool isDouble() const { return std::holds_alternative<double>(data_); }
    bool isString() const { return std::holds_alternative<std::string>(data_); }
    bool isNumber() const { return isInt() || isDouble(); }

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;  // widens integers
    const std::string& asString() const;

    /// Literal rendering: strings quoted, null as "None".
    std::string toString() const;

    const Storage& storage() const { return data_; }

    /// Same kind and payload. An integer equals a double only when the
    /// double holds exactly that integer.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    template <typename T>
    static int64_t checkedInt(T v) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (v > static_cast<T>(INT64_MAX)) throwOutOfRange(std::to_string(v));
        }
        return static_cast<int64_t>(v);
    }

    [[noreturn]] static void throwOutOfRange(const std::string& literal);

    Storage data_;
};

/// Ordered (field name, value) pairs supplied to create or modify a record.
using Attributes = std::vector<std::pair<std::string, Value>>;

} // namespace graphine
