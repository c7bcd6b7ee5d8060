/**
 * @file NamedValue.hpp
 * @brief A named pyson value (one document entry)
 */

#ifndef PYSON_NAMEDVALUE_HPP
#define PYSON_NAMEDVALUE_HPP

#include "pyson/Value.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace pyson {

/**
 * @brief (name, Value) pair with in-place rename/revalue
 *
 * The name is never empty. "change" mutators replace silently; "swap"
 * mutators replace and hand back what was there before. A Value is always
 * replaced wholesale, never modified in place.
 */
class NamedValue {
public:
    /**
     * @brief Construct a named value
     * @param name Entry name, must be non-empty
     * @param value Value owned by this entry
     * @throws InvalidArgument if name is empty
     */
    NamedValue(std::string name, Value value);

    const std::string& name() const noexcept { return name_; }
    const Value& value() const noexcept { return value_; }
    Type type() const noexcept { return value_.type(); }

    /**
     * @brief Rename in place
     * @throws InvalidArgument if new_name is empty
     */
    void change_name(std::string new_name);

    /**
     * @brief Rename in place, returning the previous name
     * @throws InvalidArgument if new_name is empty
     */
    std::string swap_name(std::string new_name);

    void change_value(Value new_value);

    /**
     * @brief Replace the value, returning the previous one
     */
    Value swap_value(Value new_value);

    /**
     * @brief Copy of (name, value)
     */
    std::pair<std::string, Value> to_tuple() const;

    /**
     * @brief Canonical document line: "<name>:<type>:<content>"
     *
     * Examples:
     * ```cpp
     * NamedValue("a", 42).encode();                              // "a:int:42"
     * NamedValue("l", Value::List{"x", "y"}).encode();           // "l:list:x(*)y"
     * ```
     */
    std::string encode() const;

    bool operator==(const NamedValue& other) const {
        return name_ == other.name_ && value_ == other.value_;
    }
    bool operator!=(const NamedValue& other) const { return !(*this == other); }

private:
    std::string name_;
    Value value_;

    static void require_name(const std::string& name);
};

std::ostream& operator<<(std::ostream& os, const NamedValue& nv);

} // namespace pyson

#endif // PYSON_NAMEDVALUE_HPP
