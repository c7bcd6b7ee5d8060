/**
 * @file Errors.hpp
 * @brief Exception types for pyson parsing and model errors
 *
 * Error taxonomy:
 * - PysonError: Base class
 * - InvalidType: Unknown type tag
 * - UnsupportedValueType: Payload matches no Value shape
 * - InvalidListElement: List payload with a non-string element
 * - InvalidArgument: Bad NamedValue construction/mutation input
 * - EmbeddedNewline: Entry line contains '\n'
 * - MalformedEntry: Entry line has fewer than three fields
 * - InvalidNumber: int/float content does not parse
 * - DuplicateName: Name repeated within a document
 * - NameNotFound: Edit targets a name the document does not have
 * - EntryError: Entry failure inside a document (line index + cause)
 * - FileNotFoundError: Document file not found
 * - ConversionError: Foreign (JSON) input cannot become a document
 */

#ifndef PYSON_ERRORS_HPP
#define PYSON_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace pyson {

/**
 * @brief Machine-readable kind of a PysonError
 */
enum class ErrorCode {
    InvalidType,
    UnsupportedValueType,
    InvalidListElement,
    InvalidArgument,
    EmbeddedNewline,
    MalformedEntry,
    InvalidNumber,
    DuplicateName,
    NameNotFound,
    EntryError,
    FileNotFound,
    Conversion
};

/**
 * @brief Get the name of an ErrorCode (e.g. "MalformedEntry")
 */
const char* error_code_name(ErrorCode code) noexcept;

/**
 * @brief Base class for all pyson exceptions
 */
class PysonError : public std::runtime_error {
public:
    PysonError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    ErrorCode code() const noexcept {
        return code_;
    }

private:
    ErrorCode code_;
};

/**
 * @brief Type tag is not one of int, float, str, list
 */
class InvalidType : public PysonError {
public:
    explicit InvalidType(std::string tag)
        : PysonError(ErrorCode::InvalidType, "Invalid pyson type: '" + tag + "'")
        , tag_(std::move(tag))
    {}

    /**
     * @brief Get the rejected type tag
     */
    const std::string& tag() const noexcept {
        return tag_;
    }

private:
    std::string tag_;
};

/**
 * @brief Payload does not match any Value shape (null, boolean, object, ...)
 */
class UnsupportedValueType : public PysonError {
public:
    explicit UnsupportedValueType(std::string kind)
        : PysonError(ErrorCode::UnsupportedValueType,
                     "Unsupported pyson value type: " + kind)
        , kind_(std::move(kind))
    {}

    const std::string& kind() const noexcept {
        return kind_;
    }

private:
    std::string kind_;
};

/**
 * @brief List payload contains an element that is not a string
 */
class InvalidListElement : public PysonError {
public:
    InvalidListElement(std::size_t index, std::string kind)
        : PysonError(ErrorCode::InvalidListElement,
                     "Lists in pyson must contain only strings (element " +
                     std::to_string(index) + " is " + kind + ")")
        , index_(index)
        , kind_(std::move(kind))
    {}

    /**
     * @brief Position of the first offending element
     */
    std::size_t index() const noexcept {
        return index_;
    }

    const std::string& kind() const noexcept {
        return kind_;
    }

private:
    std::size_t index_;
    std::string kind_;
};

/**
 * @brief Invalid argument to a NamedValue constructor or mutator
 */
class InvalidArgument : public PysonError {
public:
    explicit InvalidArgument(const std::string& details)
        : PysonError(ErrorCode::InvalidArgument, "Invalid argument: " + details)
    {}
};

/**
 * @brief Entry line contains a newline character
 */
class EmbeddedNewline : public PysonError {
public:
    EmbeddedNewline()
        : PysonError(ErrorCode::EmbeddedNewline, "Pyson entries cannot contain newlines")
    {}
};

/**
 * @brief Entry line does not have the name:type:value shape
 */
class MalformedEntry : public PysonError {
public:
    explicit MalformedEntry(std::string line)
        : PysonError(ErrorCode::MalformedEntry,
                     "Malformed pyson entry (expected name:type:value): '" + line + "'")
        , line_(std::move(line))
    {}

    const std::string& line() const noexcept {
        return line_;
    }

private:
    std::string line_;
};

/**
 * @brief int/float content is not a valid numeral
 */
class InvalidNumber : public PysonError {
public:
    InvalidNumber(std::string text, std::string type)
        : PysonError(ErrorCode::InvalidNumber,
                     "Invalid " + type + " literal: '" + text + "'")
        , text_(std::move(text))
        , type_(std::move(type))
    {}

    /**
     * @brief Get the content that failed to parse
     */
    const std::string& text() const noexcept {
        return text_;
    }

    /**
     * @brief Get the numeric type tag that was requested ("int" or "float")
     */
    const std::string& type() const noexcept {
        return type_;
    }

private:
    std::string text_;
    std::string type_;
};

/**
 * @brief A name occurs more than once in a document
 */
class DuplicateName : public PysonError {
public:
    explicit DuplicateName(std::string name)
        : PysonError(ErrorCode::DuplicateName, "Duplicate name in pyson document: '" + name + "'")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief A document has no entry with the requested name
 */
class NameNotFound : public PysonError {
public:
    explicit NameNotFound(std::string name)
        : PysonError(ErrorCode::NameNotFound, "Name not found in pyson document: '" + name + "'")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief An entry of a document failed to parse
 *
 * Wraps the entry-level failure with the 0-based index of the offending
 * line in the input text (blank lines included in the count).
 */
class EntryError : public PysonError {
public:
    EntryError(std::size_t line_index, const PysonError& cause)
        : PysonError(ErrorCode::EntryError,
                     "Error at line " + std::to_string(line_index + 1) + ": " + cause.what())
        , line_index_(line_index)
        , cause_(cause.code())
        , details_(cause.what())
    {}

    std::size_t line_index() const noexcept {
        return line_index_;
    }

    /**
     * @brief Get the code of the underlying entry error
     */
    ErrorCode cause() const noexcept {
        return cause_;
    }

    /**
     * @brief Get the message of the underlying entry error
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::size_t line_index_;
    ErrorCode cause_;
    std::string details_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public PysonError {
public:
    explicit FileNotFoundError(std::string path)
        : PysonError(ErrorCode::FileNotFound, "File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief JSON input cannot be converted into a pyson document
 */
class ConversionError : public PysonError {
public:
    ConversionError(std::string source, std::string details)
        : PysonError(ErrorCode::Conversion,
                     "Cannot convert '" + source + "' to pyson: " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path (or "<json>") that failed to convert
     */
    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

} // namespace pyson

#endif // PYSON_ERRORS_HPP
