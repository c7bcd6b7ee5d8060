/**
 * @file Convert.hpp
 * @brief Bridges between pyson documents and JSON/TOML
 *
 * Type mapping:
 *
 * | pyson | JSON             | TOML             |
 * |-------|------------------|------------------|
 * | int   | integer          | integer          |
 * | float | float            | float            |
 * | str   | string           | string           |
 * | list  | array of strings | array of strings |
 *
 * Only flat JSON objects can be imported; nested objects, booleans and
 * nulls have no pyson counterpart.
 */

#ifndef PYSON_CONVERT_HPP
#define PYSON_CONVERT_HPP

#include "pyson/Document.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <string>

namespace pyson {

/**
 * @brief Convert a document to a JSON object keyed by entry name
 * @throws DuplicateName if a name repeats
 */
nlohmann::json to_json(const Document& entries);

/**
 * @brief Convert a flat JSON object to a document
 *
 * Members become entries in key order. Each member value is classified
 * with Value::from_json.
 *
 * @param j JSON object
 * @param source Label used in error messages (usually a file path)
 * @throws ConversionError if j is not an object, or a key is empty or
 *         contains ':' or '\n'
 * @throws UnsupportedValueType, InvalidListElement for unmappable members
 */
Document from_json(const nlohmann::json& j, const std::string& source = "<json>");

/**
 * @brief Parse JSON text and convert it with from_json
 * @throws ConversionError on JSON syntax errors
 */
Document from_json_text(const std::string& text, const std::string& source = "<json>");

/**
 * @brief Build a TOML table from a document
 * @throws DuplicateName if a name repeats
 */
toml::table to_toml(const Document& entries);

/**
 * @brief Serialize a document as TOML text
 */
std::string to_toml_string(const Document& entries);

} // namespace pyson

#endif // PYSON_CONVERT_HPP
