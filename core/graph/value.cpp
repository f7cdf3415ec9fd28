#include "graph/value.hpp"
#include "graph/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace graphine {

namespace {

std::string printDouble(double d, int precision) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << d;
    return oss.str();
}

// Shortest decimal form that reads back as the same double; whole
// numbers keep a ".0" so they never read as integers.
std::string renderDouble(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    int precision = 1;
    while (precision < std::numeric_limits<double>::max_digits10 &&
           std::strtod(printDouble(d, precision).c_str(), nullptr) != d) {
        precision++;
    }
    // Positional form up to 1e16, as Python prints floats.
    if (d != 0) {
        int exponent = static_cast<int>(std::floor(std::log10(std::fabs(d))));
        if (exponent >= precision && exponent < 16) precision = exponent + 1;
    }
    std::string out = printDouble(d, precision);
    if (out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

bool sameNumber(int64_t i, double d) {
    // [-2^63, 2^63) is the range a double can hold and still convert to int64_t.
    if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) return false;
    if (std::trunc(d) != d) return false;
    return static_cast<int64_t>(d) == i;
}

} // namespace

void Value::throwOutOfRange(const std::string& literal) {
    throw GraphError("Integer out of range for an attribute value: " + literal);
}

bool Value::asBool() const {
    if (!isBool()) throw GraphError("Value is not a bool: " + toString());
    return std::get<bool>(data_);
}

int64_t Value::asInt() const {
    if (!isInt()) throw GraphError("Value is not an integer: " + toString());
    return std::get<int64_t>(data_);
}

double Value::asDouble() const {
    if (isInt()) return static_cast<double>(std::get<int64_t>(data_));
    if (!isDouble()) throw GraphError("Value is not a number: " + toString());
    return std::get<double>(data_);
}

const std::string& Value::asString() const {
    if (!isString()) throw GraphError("Value is not a string: " + toString());
    return std::get<std::string>(data_);
}

std::string Value::toString() const {
    if (isNull()) return "None";
    if (isBool()) return std::get<bool>(data_) ? "True" : "False";
    if (isInt()) return std::to_string(std::get<int64_t>(data_));
    if (isString()) return quote(std::get<std::string>(data_));
    return renderDouble(std::get<double>(data_));
}

bool Value::operator==(const Value& other) const {
    if (isInt() && other.isDouble()) {
        return sameNumber(std::get<int64_t>(data_), std::get<double>(other.data_));
    }
    if (isDouble() && other.isInt()) {
        return sameNumber(std::get<int64_t>(other.data_), std::get<double>(data_));
    }
    return data_ == other.data_;
}

} // namespace graphine
