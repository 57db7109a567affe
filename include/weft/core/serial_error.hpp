//! # Serialization Errors
//!
//! The single error type returned by every fallible weft operation. An error
//! carries its kind, a human-readable message, the element path at which it
//! was raised (`$.items[2].name`) and, for text input, the source position.
//!
//! ## Example
//!
//! ```cpp
//! auto error = SerialError::make(ErrorKind::MalformedInput, "Expected ':'", 3, 7, 41);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "MalformedInput at line 3, column 7: Expected ':'"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace weft {

/// Categories of failure.
enum class ErrorKind {
    MalformedInput,         ///< Lexer or parser rejected the token stream
    UnexpectedStructure,    ///< Descriptor shape does not match the source shape
    MissingRequiredValue,   ///< Required element absent and not coercible
    TypeMismatch,           ///< Value present but of the wrong primitive shape
    PrecisionLoss,          ///< Numeral not exactly representable as the requested integer
    UnknownEnumValue,       ///< String does not name any enum entry
    InvalidDescriptor,      ///< Blank or duplicate name while building a descriptor
    UnknownKey,             ///< Unknown object key while unknown keys are rejected
    UnknownPolymorphicType, ///< Discriminator names no registered subclass
    InvalidConfiguration,   ///< Rejected `JsonConfiguration`
    InvalidValue            ///< Value cannot be written (e.g. NaN in strict mode)
};

/// Returns the name of an error kind (e.g. `"TypeMismatch"`).
inline auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::MalformedInput:
        return "MalformedInput";
    case ErrorKind::UnexpectedStructure:
        return "UnexpectedStructure";
    case ErrorKind::MissingRequiredValue:
        return "MissingRequiredValue";
    case ErrorKind::TypeMismatch:
        return "TypeMismatch";
    case ErrorKind::PrecisionLoss:
        return "PrecisionLoss";
    case ErrorKind::UnknownEnumValue:
        return "UnknownEnumValue";
    case ErrorKind::InvalidDescriptor:
        return "InvalidDescriptor";
    case ErrorKind::UnknownKey:
        return "UnknownKey";
    case ErrorKind::UnknownPolymorphicType:
        return "UnknownPolymorphicType";
    case ErrorKind::InvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorKind::InvalidValue:
        return "InvalidValue";
    }
    return "Unknown";
}

/// An error raised while building descriptors or while encoding/decoding.
///
/// # Fields
///
/// - `kind`: Failure category
/// - `message`: Description of what went wrong
/// - `path`: Element path (`$`, `$.a.b`, `$.list[3]`), empty when unknown
/// - `line`, `column`: 1-based text position (0 if unknown)
/// - `offset`: Byte offset from the start of the input (0 if unknown)
struct SerialError {
    ErrorKind kind = ErrorKind::MalformedInput;
    std::string message;
    std::string path;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    /// Creates an error without location information.
    static auto make(ErrorKind kind, std::string msg) -> SerialError {
        SerialError error;
        error.kind = kind;
        error.message = std::move(msg);
        return error;
    }

    /// Creates an error at an element path.
    static auto at_path(ErrorKind kind, std::string msg, std::string path) -> SerialError {
        auto error = make(kind, std::move(msg));
        error.path = std::move(path);
        return error;
    }

    /// Creates an error with a text position.
    static auto make(ErrorKind kind, std::string msg, size_t line, size_t column,
                     size_t offset = 0) -> SerialError {
        auto error = make(kind, std::move(msg));
        error.line = line;
        error.column = column;
        error.offset = offset;
        return error;
    }

    /// Formats the error for display.
    ///
    /// The format depends on the available information:
    /// `"<Kind> at line X, column Y: message (path $.a)"`, with the position
    /// and path parts omitted when unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = error_kind_name(kind);
        if (line > 0 && column > 0) {
            out += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        } else if (line > 0) {
            out += " at line " + std::to_string(line);
        }
        out += ": " + message;
        if (!path.empty()) {
            out += " (path " + path + ")";
        }
        return out;
    }
};

} // namespace weft
