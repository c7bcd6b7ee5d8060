/**
 * @file Type.hpp
 * @brief Type tag of a pyson value
 *
 * A Type is one of four kinds, each with a canonical lowercase name
 * used verbatim in the wire format:
 * - Int   ("int")
 * - Float ("float")
 * - Str   ("str")
 * - List  ("list")
 */

#ifndef PYSON_TYPE_HPP
#define PYSON_TYPE_HPP

#include <ostream>
#include <string>

namespace pyson {

/**
 * @brief Closed enumeration of pyson value kinds
 *
 * Small immutable value type; copy it freely. Two Types compare equal
 * when their tags are equal.
 */
class Type {
public:
    enum class Kind {
        Int,
        Float,
        Str,
        List
    };

    explicit Type(Kind kind) noexcept : kind_(kind) {}

    /**
     * @brief Build a Type from its wire-format tag
     *
     * @param tag One of "int", "float", "str", "list" (case-sensitive)
     * @return The matching Type
     * @throws InvalidType for any other tag
     *
     * Examples:
     * ```cpp
     * Type::from_string("int");    // Type(Kind::Int)
     * Type::from_string("list");   // Type(Kind::List)
     * Type::from_string("INT");    // Throws InvalidType
     * ```
     */
    static Type from_string(const std::string& tag);

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief Canonical tag ("int", "float", "str" or "list")
     */
    std::string to_string() const;

    bool operator==(const Type& other) const noexcept { return kind_ == other.kind_; }
    bool operator!=(const Type& other) const noexcept { return kind_ != other.kind_; }

private:
    Kind kind_;
};

std::ostream& operator<<(std::ostream& os, const Type& type);

} // namespace pyson

#endif // PYSON_TYPE_HPP
