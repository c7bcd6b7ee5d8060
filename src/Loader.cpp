/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * RULE F1-F3: File behavior of the pyson loader.
 */

#include "pyson/Loader.hpp"
#include "pyson/Convert.hpp"
#include "pyson/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace pyson {

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

} // anonymous namespace

std::string read_text_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Document load_document_file(const std::string& path) {
    return parse_document(read_text_file(path));
}

DocumentMap load_document_file_as_map(const std::string& path) {
    return to_map(load_document_file(path));
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Document load_any_file(const std::string& path) {
    std::string text = read_text_file(path);
    if (get_file_extension(path) == ".json") {
        return from_json_text(text, path);
    }
    return parse_document(text);
}

void save_document_file(const std::string& path, const Document& entries) {
    // Encode first so a duplicate name leaves the file untouched
    std::string text = encode_document(entries);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("Failed to open for write: " + path);
    }
    ofs << text;
    if (!ofs) {
        throw std::runtime_error("Failed to write: " + path);
    }
}

bool set_entry_in_file(const std::string& path, const NamedValue& entry) {
    Document doc;
    if (file_exists(path)) {
        doc = load_document_file(path);
    }
    bool replaced = set_entry(doc, entry);
    save_document_file(path, doc);
    return replaced;
}

std::string rename_entry_in_file(const std::string& path, const std::string& old_name,
                                 const std::string& new_name) {
    Document doc = load_document_file(path);
    std::string previous = rename_entry(doc, old_name, new_name);
    save_document_file(path, doc);
    return previous;
}

} // namespace pyson
