/**
 * @file Value.cpp
 * @brief Implementation of the pyson value model
 */

#include "pyson/Value.hpp"
#include "pyson/Errors.hpp"
#include "pyson/Util.hpp"

#include <cmath>

namespace pyson {

namespace {
    // 2^63, exactly representable as a double
    constexpr double kInt64Bound = 9223372036854775808.0;

    /**
     * @brief Check if a double is a mathematical integer that fits in int64
     */
    bool is_integral_int64(double v) {
        return std::isfinite(v) && std::trunc(v) == v &&
               v >= -kInt64Bound && v < kInt64Bound;
    }

    std::string kind_name(const Value& v) {
        return v.type().to_string();
    }
}

Value::Value(double v) {
    if (is_integral_int64(v)) {
        payload_ = static_cast<std::int64_t>(v);
    } else {
        payload_ = v;
    }
}

Value Value::from_json(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        return Value(j.get<std::uint64_t>());
    }
    if (j.is_number_integer()) {
        return Value(j.get<std::int64_t>());
    }
    if (j.is_number_float()) {
        return Value(j.get<double>());
    }
    if (j.is_string()) {
        return Value(j.get<std::string>());
    }
    if (j.is_array()) {
        List items;
        items.reserve(j.size());
        for (std::size_t i = 0; i < j.size(); ++i) {
            if (!j[i].is_string()) {
                throw InvalidListElement(i, j[i].type_name());
            }
            items.push_back(j[i].get<std::string>());
        }
        return Value(std::move(items));
    }
    throw UnsupportedValueType(j.type_name());
}

nlohmann::json Value::to_json() const {
    if (is_int()) return nlohmann::json(std::get<std::int64_t>(payload_));
    if (is_float()) return nlohmann::json(std::get<double>(payload_));
    if (is_str()) return nlohmann::json(std::get<std::string>(payload_));
    return nlohmann::json(std::get<List>(payload_));
}

bool Value::operator==(const Value& other) const {
    const double* a = std::get_if<double>(&payload_);
    const double* b = std::get_if<double>(&other.payload_);
    if (a && b && std::isnan(*a) && std::isnan(*b)) {
        return true;
    }
    return payload_ == other.payload_;
}

Type Value::type() const noexcept {
    if (is_int()) return Type(Type::Kind::Int);
    if (is_float()) return Type(Type::Kind::Float);
    if (is_str()) return Type(Type::Kind::Str);
    return Type(Type::Kind::List);
}

std::int64_t Value::as_int() const {
    if (auto p = std::get_if<std::int64_t>(&payload_)) return *p;
    throw InvalidArgument("value is " + kind_name(*this) + ", not int");
}

double Value::as_float() const {
    if (auto p = std::get_if<double>(&payload_)) return *p;
    throw InvalidArgument("value is " + kind_name(*this) + ", not float");
}

const std::string& Value::as_str() const {
    if (auto p = std::get_if<std::string>(&payload_)) return *p;
    throw InvalidArgument("value is " + kind_name(*this) + ", not str");
}

const Value::List& Value::as_list() const {
    if (auto p = std::get_if<List>(&payload_)) return *p;
    throw InvalidArgument("value is " + kind_name(*this) + ", not list");
}

std::string Value::content() const {
    if (is_int()) return std::to_string(std::get<std::int64_t>(payload_));
    if (is_float()) return format_float(std::get<double>(payload_));
    if (is_str()) return std::get<std::string>(payload_);
    return join(std::get<List>(payload_), kListDelimiter);
}

std::string Value::encode() const {
    // The list prefix is added by the entry encoder
    if (is_list()) return content();
    return type().to_string() + ":" + content();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.encode();
}

std::string format_float(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v < 0 ? "-inf" : "inf";
    // nlohmann::json emits the shortest round-trip representation
    return nlohmann::json(v).dump();
}

} // namespace pyson
