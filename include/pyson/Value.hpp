/**
 * @file Value.hpp
 * @brief Value type for pyson data
 *
 * A Value is a tagged union whose variant and payload are locked together:
 * - Int   (std::int64_t)
 * - Float (double, never a mathematical integer)
 * - Str   (std::string)
 * - List  (std::vector<std::string>)
 *
 * Booleans, nulls and nested lists are not representable. Values are
 * immutable once constructed.
 */

#ifndef PYSON_VALUE_HPP
#define PYSON_VALUE_HPP

#include "pyson/Type.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pyson {

/// Literal separator between the elements of a list value
inline constexpr const char* kListDelimiter = "(*)";

class Value {
public:
    using List = std::vector<std::string>;
    using Payload = std::variant<std::int64_t, double, std::string, List>;

    /**
     * @brief Integral input classifies as Int
     *
     * Accepts every integral type except bool. Unsigned values above the
     * int64 maximum cannot be held by Int and become Float.
     */
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Value(T v) : payload_(from_integral(v)) {}

    /**
     * @brief Numeric input, classified by value
     *
     * A number that is a mathematical integer within the int64 range
     * becomes Int; anything else (fractions, NaN, infinities, integral
     * magnitudes beyond int64) becomes Float.
     *
     * Examples:
     * ```cpp
     * Value(5.5).is_float();  // true
     * Value(5.0).is_int();    // true, holds 5
     * ```
     */
    Value(double v);

    Value(std::string v) : payload_(std::move(v)) {}
    Value(const char* v) : payload_(std::string(v)) {}
    Value(List v) : payload_(std::move(v)) {}

    Value(bool) = delete;
    Value(std::nullptr_t) = delete;

    /**
     * @brief Build a Value from a loosely typed JSON payload
     *
     * Classification rules:
     * - number           → Int or Float (same rule as Value(double))
     * - string           → Str
     * - array of strings → List
     * - array with any non-string element → throws InvalidListElement
     * - null, boolean, object, binary     → throws UnsupportedValueType
     *
     * @param j Payload to classify
     * @return Classified Value
     */
    static Value from_json(const nlohmann::json& j);

    /**
     * @brief Convert to the equivalent JSON value
     *
     * Int → integer, Float → float, Str → string, List → array of strings.
     */
    nlohmann::json to_json() const;

    Type type() const noexcept;

    bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(payload_); }
    bool is_float() const noexcept { return std::holds_alternative<double>(payload_); }
    bool is_str() const noexcept { return std::holds_alternative<std::string>(payload_); }
    bool is_list() const noexcept { return std::holds_alternative<List>(payload_); }

    // Typed access; throw InvalidArgument when the kind does not match
    std::int64_t as_int() const;
    double as_float() const;
    const std::string& as_str() const;
    const List& as_list() const;

    const Payload& payload() const noexcept { return payload_; }

    /**
     * @brief Bare content text, without a type prefix
     *
     * Scalars render as their textual form; lists as their elements joined
     * with "(*)".
     */
    std::string content() const;

    /**
     * @brief Pyson string form of a bare value
     *
     * - Scalars: "<type>:<value>" (e.g. "int:42", "str:hello")
     * - Lists:   elements joined with "(*)", no type prefix
     *
     * Known limitations (the format has no escaping):
     * - a string or list element containing "(*)" or a newline cannot be
     *   round-tripped;
     * - an empty List encodes to "" and reads back as [""], a list holding
     *   one empty string.
     */
    std::string encode() const;

    /**
     * @brief Payload equality; two NaN floats compare equal
     */
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Payload payload_;

    template <typename T>
    static Payload from_integral(T v) {
        if (std::is_unsigned<T>::value &&
            static_cast<std::uint64_t>(v) >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Payload(static_cast<double>(v));
        }
        return Payload(static_cast<std::int64_t>(v));
    }
};

std::ostream& operator<<(std::ostream& os, const Value& value);

/**
 * @brief Render a double in the shortest text that parses back to it
 *
 * Non-finite values render as "nan", "inf" and "-inf".
 */
std::string format_float(double v);

} // namespace pyson

#endif // PYSON_VALUE_HPP
