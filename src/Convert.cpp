/**
 * @file Convert.cpp
 * @brief JSON/TOML conversion implementation
 */

#include "pyson/Convert.hpp"
#include "pyson/Errors.hpp"

#include <sstream>

namespace pyson {

namespace {
    void require_unique(const Document& entries) {
        if (auto dup = find_duplicate_name(entries)) {
            throw DuplicateName(*dup);
        }
    }

    toml::array make_toml_array(const Value::List& items) {
        toml::array out;
        for (const auto& item : items) {
            out.push_back(item);
        }
        return out;
    }
} // namespace

nlohmann::json to_json(const Document& entries) {
    require_unique(entries);
    nlohmann::json out = nlohmann::json::object();
    for (const auto& nv : entries) {
        out[nv.name()] = nv.value().to_json();
    }
    return out;
}

Document from_json(const nlohmann::json& j, const std::string& source) {
    if (!j.is_object()) {
        throw ConversionError(source, std::string("root must be an object, got ") + j.type_name());
    }
    Document entries;
    entries.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key.empty()) {
            throw ConversionError(source, "empty key");
        }
        if (key.find_first_of(":\n") != std::string::npos) {
            throw ConversionError(source, "key '" + key + "' contains ':' or a newline");
        }
        entries.emplace_back(key, Value::from_json(it.value()));
    }
    return entries;
}

Document from_json_text(const std::string& text, const std::string& source) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConversionError(source, e.what());
    }
    return from_json(j, source);
}

toml::table to_toml(const Document& entries) {
    require_unique(entries);
    toml::table tbl;
    for (const auto& nv : entries) {
        const Value& v = nv.value();
        if (v.is_int()) {
            tbl.insert(nv.name(), v.as_int());
        } else if (v.is_float()) {
            tbl.insert(nv.name(), v.as_float());
        } else if (v.is_str()) {
            tbl.insert(nv.name(), v.as_str());
        } else {
            tbl.insert(nv.name(), make_toml_array(v.as_list()));
        }
    }
    return tbl;
}

std::string to_toml_string(const Document& entries) {
    std::ostringstream oss;
    oss << to_toml(entries);
    return oss.str();
}

} // namespace pyson
