#ifndef PYSON_UTIL_HPP
#define PYSON_UTIL_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pyson {

// Split on every occurrence of delim, keeping empty pieces.
// split("a(*)(*)b", "(*)") -> ["a", "", "b"]; split("", "(*)") -> [""]
std::vector<std::string> split(const std::string& s, const std::string& delim);

// Split into at most max_parts pieces; the last piece keeps any further delimiters.
// split_n("a:b:c:d", ':', 3) -> ["a", "b", "c:d"]
std::vector<std::string> split_n(const std::string& s, char delim, std::size_t max_parts);

// Join parts with delim between each pair.
std::string join(const std::vector<std::string>& parts, const std::string& delim);

// Split text on '\n' keeping empty lines, so indices match input line numbers.
std::vector<std::string> split_lines(const std::string& text);

} // namespace pyson

#endif // PYSON_UTIL_HPP
