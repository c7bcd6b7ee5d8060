/**
 * @file Parse.hpp
 * @brief Entry codec: one pyson line <-> NamedValue
 *
 * Entry line format: <name>:<type>:<content>
 *
 * Parsing steps (first failure wins):
 * - E1: Reject lines containing '\n'             → EmbeddedNewline
 * - E2: Split on the first two ':' only          → MalformedEntry if < 3 fields
 * - E3: Dispatch on the type tag
 *       int   → strict base-10 int64             → InvalidNumber
 *       float → strict decimal literal, nan, inf → InvalidNumber
 *       str   → content verbatim
 *       list  → content split on "(*)"
 *       other                                    → InvalidType
 * - E4: Build Value and NamedValue               → InvalidArgument (empty name)
 *
 * The content field may itself contain ':'; only the first two colons
 * are structural.
 */

#ifndef PYSON_PARSE_HPP
#define PYSON_PARSE_HPP

#include "pyson/NamedValue.hpp"

#include <cstdint>
#include <string>

namespace pyson {

/**
 * @brief Parse one entry line
 *
 * @param line Entry text without trailing newline
 * @return Parsed NamedValue
 * @throws EmbeddedNewline, MalformedEntry, InvalidType, InvalidNumber,
 *         InvalidArgument
 *
 * Examples:
 * ```cpp
 * parse_entry("a:int:42");            // a = Int(42)
 * parse_entry("pi:float:3.14");       // pi = Float(3.14)
 * parse_entry("url:str:http://x:80"); // url = Str("http://x:80")
 * parse_entry("l:list:x(*)y(*)z");    // l = List(["x", "y", "z"])
 * parse_entry("h:float:2.0");         // h = Int(2), integral numbers are Int
 * parse_entry("noColonsHere");        // Throws MalformedEntry
 * parse_entry("a:bogus:1");           // Throws InvalidType
 * ```
 */
NamedValue parse_entry(const std::string& line);

/**
 * @brief Encode one entry line, the inverse of parse_entry
 *
 * Equivalent to nv.encode().
 */
std::string encode_entry(const NamedValue& nv);

/**
 * @brief Parse int content: optional '-', then decimal digits, nothing else
 * @throws InvalidNumber on any other text or on int64 overflow
 */
std::int64_t parse_int(const std::string& text);

/**
 * @brief Parse float content: a complete decimal floating literal
 *
 * Accepted: optional sign, digits with an optional '.', optional exponent
 * ("1.5", "-2", ".5", "3e-7"), plus exactly "nan", "inf" and "-inf".
 * Rejected: whitespace, trailing text, hex floats ("0x1p3"), and other
 * non-finite spellings ("NaN", "infinity", "nan(1)").
 *
 * @throws InvalidNumber, also when the value overflows to infinity
 */
double parse_float(const std::string& text);

} // namespace pyson

#endif // PYSON_PARSE_HPP
