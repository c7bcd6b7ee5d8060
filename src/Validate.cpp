#include "pyson/Validate.hpp"
#include "pyson/Errors.hpp"
#include "pyson/Parse.hpp"
#include "pyson/Util.hpp"

#include <new>

namespace pyson {

bool is_valid_entry(const std::string& line) noexcept {
    try {
        parse_entry(line);
        return true;
    } catch (const PysonError&) {
        return false;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool is_valid_document(const std::string& text) noexcept {
    try {
        for (const auto& line : split_lines(text)) {
            if (!line.empty() && !is_valid_entry(line)) {
                return false;
            }
        }
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

} // namespace pyson
