/**
 * @file Document.hpp
 * @brief Collection builders for whole pyson documents
 *
 * A document is a '\n'-separated sequence of entry lines. Blank lines are
 * ignored. Names must be unique across the whole document.
 *
 * Rules:
 * - D1: The first entry that fails to parse aborts with EntryError, carrying
 *       the 0-based line index and the underlying error code.
 * - D2: After all entries parse, a repeated name aborts with DuplicateName.
 * - D3: The list form preserves input order (minus blank lines).
 * - D4: The map form has no order guarantee.
 */

#ifndef PYSON_DOCUMENT_HPP
#define PYSON_DOCUMENT_HPP

#include "pyson/NamedValue.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pyson {

using Document = std::vector<NamedValue>;
using DocumentMap = std::unordered_map<std::string, Value>;

/**
 * @brief Parse a document into an ordered list of entries
 *
 * @param text Document text
 * @return Entries in input order
 * @throws EntryError on the first invalid line (RULE D1)
 * @throws DuplicateName if a name repeats (RULE D2)
 *
 * Examples:
 * ```cpp
 * parse_document("a:int:1\nb:int:2");   // [a=1, b=2]
 * parse_document("\n\n");               // []
 * parse_document("a:int:1\na:int:2");   // Throws DuplicateName
 * ```
 */
Document parse_document(const std::string& text);

/**
 * @brief Parse a document into a name -> Value mapping
 *
 * Same failure rules as parse_document.
 */
DocumentMap parse_document_as_map(const std::string& text);

/**
 * @brief Find the first name that occurs twice
 * @return The repeated name, or nullopt if all names are unique
 */
std::optional<std::string> find_duplicate_name(const Document& entries);

/**
 * @brief Encode entries as document text
 *
 * One encoded entry per line, each terminated by '\n'. An empty list
 * encodes to the empty string.
 *
 * @throws DuplicateName if a name repeats
 */
std::string encode_document(const Document& entries);

// ============================================================================
// Editing
// ============================================================================

/**
 * @brief Find an entry by name
 * @return Pointer into entries, or nullptr if no entry has that name
 */
NamedValue* find_entry(Document& entries, const std::string& name);
const NamedValue* find_entry(const Document& entries, const std::string& name);

/**
 * @brief Replace the value of an existing entry, or append a new one
 *
 * An existing entry keeps its position; only its Value is replaced.
 *
 * @return true if an entry was replaced, false if entry was appended
 */
bool set_entry(Document& entries, const NamedValue& entry);

/**
 * @brief Rename an entry in place
 *
 * Renaming an entry to its own name is a no-op.
 *
 * @return The previous name
 * @throws NameNotFound if no entry is called old_name
 * @throws DuplicateName if another entry is already called new_name
 * @throws InvalidArgument if new_name is empty
 *
 * entries is unchanged when any of these is thrown.
 */
std::string rename_entry(Document& entries, const std::string& old_name,
                         const std::string& new_name);

/**
 * @brief Fold an entry list into a name -> Value mapping
 * @throws DuplicateName if a name repeats
 */
DocumentMap to_map(const Document& entries);

} // namespace pyson

#endif // PYSON_DOCUMENT_HPP
