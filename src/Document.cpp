/**
 * @file Document.cpp
 * @brief Implementation of the collection builders
 */

#include "pyson/Document.hpp"
#include "pyson/Errors.hpp"
#include "pyson/Parse.hpp"
#include "pyson/Util.hpp"

#include <algorithm>
#include <unordered_set>

namespace pyson {

std::optional<std::string> find_duplicate_name(const Document& entries) {
    std::unordered_set<std::string> seen;
    for (const auto& nv : entries) {
        if (!seen.insert(nv.name()).second) {
            return nv.name();
        }
    }
    return std::nullopt;
}

Document parse_document(const std::string& text) {
    Document entries;
    std::vector<std::string> lines = split_lines(text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].empty()) continue;
        try {
            entries.push_back(parse_entry(lines[i]));
        } catch (const PysonError& e) {
            throw EntryError(i, e);
        }
    }

    if (auto dup = find_duplicate_name(entries)) {
        throw DuplicateName(*dup);
    }
    return entries;
}

DocumentMap to_map(const Document& entries) {
    DocumentMap out;
    out.reserve(entries.size());
    for (const auto& nv : entries) {
        if (!out.emplace(nv.name(), nv.value()).second) {
            throw DuplicateName(nv.name());
        }
    }
    return out;
}

DocumentMap parse_document_as_map(const std::string& text) {
    return to_map(parse_document(text));
}

NamedValue* find_entry(Document& entries, const std::string& name) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const NamedValue& nv) { return nv.name() == name; });
    return it == entries.end() ? nullptr : &*it;
}

const NamedValue* find_entry(const Document& entries, const std::string& name) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const NamedValue& nv) { return nv.name() == name; });
    return it == entries.end() ? nullptr : &*it;
}

bool set_entry(Document& entries, const NamedValue& entry) {
    if (NamedValue* existing = find_entry(entries, entry.name())) {
        existing->change_value(entry.value());
        return true;
    }
    entries.push_back(entry);
    return false;
}

std::string rename_entry(Document& entries, const std::string& old_name,
                         const std::string& new_name) {
    NamedValue* target = find_entry(entries, old_name);
    if (!target) {
        throw NameNotFound(old_name);
    }
    if (new_name != old_name && find_entry(entries, new_name)) {
        throw DuplicateName(new_name);
    }
    return target->swap_name(new_name);
}

std::string encode_document(const Document& entries) {
    if (auto dup = find_duplicate_name(entries)) {
        throw DuplicateName(*dup);
    }
    std::string out;
    for (const auto& nv : entries) {
        out += encode_entry(nv);
        out += '\n';
    }
    return out;
}

} // namespace pyson
