#include "pyson/Util.hpp"

namespace pyson {

std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    if (delim.empty()) {
        parts.push_back(s);
        return parts;
    }
    std::size_t start = 0;
    std::size_t pos = s.find(delim);
    while (pos != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
        pos = s.find(delim, start);
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::vector<std::string> split_n(const std::string& s, char delim, std::size_t max_parts) {
    std::vector<std::string> parts;
    if (max_parts == 0) return parts;
    std::size_t start = 0;
    while (parts.size() + 1 < max_parts) {
        std::size_t pos = s.find(delim, start);
        if (pos == std::string::npos) break;
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delim) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delim;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    return split(text, "\n");
}

} // namespace pyson
