/**
 * @file Loader.hpp
 * @brief File loading and saving for pyson documents
 *
 * Rules:
 * - F1: A missing file throws FileNotFoundError.
 * - F2: Parse failures of the document surface unchanged (EntryError,
 *       DuplicateName).
 * - F3: load_any_file picks the reader by extension: ".json" imports a
 *       flat JSON object, anything else is read as pyson.
 */

#ifndef PYSON_LOADER_HPP
#define PYSON_LOADER_HPP

#include "pyson/Document.hpp"

#include <string>

namespace pyson {

/**
 * @brief Read the raw text of a file
 * @throws FileNotFoundError if the file does not exist or cannot be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Load a pyson file as an ordered entry list
 *
 * @param path Path to the document
 * @return Entries in file order
 * @throws FileNotFoundError if the file doesn't exist (RULE F1)
 * @throws EntryError, DuplicateName on invalid content (RULE F2)
 */
Document load_document_file(const std::string& path);

/**
 * @brief Load a pyson file as a name -> Value mapping
 */
DocumentMap load_document_file_as_map(const std::string& path);

/**
 * @brief Load a document from a pyson or JSON file (RULE F3)
 * @throws ConversionError if a .json file cannot be imported
 */
Document load_any_file(const std::string& path);

/**
 * @brief Write entries to path as a pyson document
 *
 * Replaces any existing file.
 *
 * @throws DuplicateName if a name repeats
 * @throws std::runtime_error if the file cannot be opened for writing
 */
void save_document_file(const std::string& path, const Document& entries);

/**
 * @brief Set one entry of a pyson file (see set_entry)
 *
 * Creates the file when it does not exist yet.
 *
 * @return true if an existing entry was replaced, false if appended
 * @throws EntryError, DuplicateName if the existing file is invalid
 */
bool set_entry_in_file(const std::string& path, const NamedValue& entry);

/**
 * @brief Rename one entry of a pyson file (see rename_entry)
 *
 * The file is rewritten only when the rename succeeds.
 *
 * @return The previous name
 * @throws FileNotFoundError, NameNotFound, DuplicateName, InvalidArgument
 */
std::string rename_entry_in_file(const std::string& path, const std::string& old_name,
                                 const std::string& new_name);

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

} // namespace pyson

#endif // PYSON_LOADER_HPP
