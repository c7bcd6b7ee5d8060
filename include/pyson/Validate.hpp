/**
 * @file Validate.hpp
 * @brief Non-throwing well-formedness checks
 */

#ifndef PYSON_VALIDATE_HPP
#define PYSON_VALIDATE_HPP

#include <string>

namespace pyson {

/**
 * @brief True iff parse_entry(line) would succeed
 */
bool is_valid_entry(const std::string& line) noexcept;

/**
 * @brief True iff every line is empty or a valid entry
 *
 * Checks syntax line by line only. Duplicate names are NOT detected here,
 * so "a:int:1\na:int:2" is valid although parse_document rejects it.
 */
bool is_valid_document(const std::string& text) noexcept;

} // namespace pyson

#endif // PYSON_VALIDATE_HPP
