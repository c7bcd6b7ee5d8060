/**
 * @file Errors.cpp
 * @brief Names for pyson error codes
 */

#include "pyson/Errors.hpp"

namespace pyson {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidType: return "InvalidType";
        case ErrorCode::UnsupportedValueType: return "UnsupportedValueType";
        case ErrorCode::InvalidListElement: return "InvalidListElement";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::EmbeddedNewline: return "EmbeddedNewline";
        case ErrorCode::MalformedEntry: return "MalformedEntry";
        case ErrorCode::InvalidNumber: return "InvalidNumber";
        case ErrorCode::DuplicateName: return "DuplicateName";
        case ErrorCode::NameNotFound: return "NameNotFound";
        case ErrorCode::EntryError: return "EntryError";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::Conversion: return "Conversion";
    }
    return "Unknown";
}

} // namespace pyson
