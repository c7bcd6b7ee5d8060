/**
 * @file NamedValue.cpp
 * @brief Implementation of NamedValue
 */

#include "pyson/NamedValue.hpp"
#include "pyson/Errors.hpp"

namespace pyson {

NamedValue::NamedValue(std::string name, Value value)
    : name_(std::move(name))
    , value_(std::move(value))
{
    require_name(name_);
}

void NamedValue::require_name(const std::string& name) {
    if (name.empty()) {
        throw InvalidArgument("NamedValue name must not be empty");
    }
}

void NamedValue::change_name(std::string new_name) {
    require_name(new_name);
    name_ = std::move(new_name);
}

std::string NamedValue::swap_name(std::string new_name) {
    require_name(new_name);
    std::swap(name_, new_name);
    return new_name;
}

void NamedValue::change_value(Value new_value) {
    value_ = std::move(new_value);
}

Value NamedValue::swap_value(Value new_value) {
    std::swap(value_, new_value);
    return new_value;
}

std::pair<std::string, Value> NamedValue::to_tuple() const {
    return {name_, value_};
}

std::string NamedValue::encode() const {
    return name_ + ":" + value_.type().to_string() + ":" + value_.content();
}

std::ostream& operator<<(std::ostream& os, const NamedValue& nv) {
    return os << nv.encode();
}

} // namespace pyson
