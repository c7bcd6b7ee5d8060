/**
 * @file Type.cpp
 * @brief Implementation of the pyson type tag
 */

#include "pyson/Type.hpp"
#include "pyson/Errors.hpp"

namespace pyson {

Type Type::from_string(const std::string& tag) {
    if (tag == "int") return Type(Kind::Int);
    if (tag == "float") return Type(Kind::Float);
    if (tag == "str") return Type(Kind::Str);
    if (tag == "list") return Type(Kind::List);
    throw InvalidType(tag);
}

std::string Type::to_string() const {
    switch (kind_) {
        case Kind::Int: return "int";
        case Kind::Float: return "float";
        case Kind::Str: return "str";
        case Kind::List: return "list";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Type& type) {
    return os << type.to_string();
}

} // namespace pyson
