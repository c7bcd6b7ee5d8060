/**
 * @file Parse.cpp
 * @brief Implementation of the entry codec
 */

#include "pyson/Parse.hpp"
#include "pyson/Errors.hpp"
#include "pyson/Util.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

namespace pyson {

std::int64_t parse_int(const std::string& text) {
    // from_chars rejects a leading '+' and whitespace
    std::int64_t result = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, result, 10);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw InvalidNumber(text, "int");
    }
    return result;
}

double parse_float(const std::string& text) {
    // The spellings format_float emits for non-finite values
    if (text == "nan") return std::numeric_limits<double>::quiet_NaN();
    if (text == "inf") return std::numeric_limits<double>::infinity();
    if (text == "-inf") return -std::numeric_limits<double>::infinity();

    // Decimal literals only: no whitespace, hex floats or other spellings
    if (text.empty() || text.find_first_not_of("0123456789+-.eE") != std::string::npos) {
        throw InvalidNumber(text, "float");
    }
    errno = 0;
    char* end = nullptr;
    double val = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        throw InvalidNumber(text, "float");
    }
    // Overflow is an error; underflow to a subnormal or zero is accepted
    if (errno == ERANGE && std::isinf(val)) {
        throw InvalidNumber(text, "float");
    }
    return val;
}

NamedValue parse_entry(const std::string& line) {
    // E1
    if (line.find('\n') != std::string::npos) {
        throw EmbeddedNewline();
    }

    // E2
    std::vector<std::string> fields = split_n(line, ':', 3);
    if (fields.size() < 3) {
        throw MalformedEntry(line);
    }
    const std::string& name = fields[0];
    const std::string& raw = fields[2];

    // E3
    Type type = Type::from_string(fields[1]);
    switch (type.kind()) {
        case Type::Kind::Int:
            return NamedValue(name, Value(parse_int(raw)));
        case Type::Kind::Float:
            return NamedValue(name, Value(parse_float(raw)));
        case Type::Kind::Str:
            return NamedValue(name, Value(raw));
        case Type::Kind::List:
            return NamedValue(name, Value(split(raw, kListDelimiter)));
    }
    throw InvalidType(fields[1]);
}

std::string encode_entry(const NamedValue& nv) {
    return nv.encode();
}

} // namespace pyson
