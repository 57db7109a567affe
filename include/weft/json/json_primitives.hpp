//! # Primitive Conversions
//!
//! Conversions from primitive literal text (JSON tree and token stream) and
//! from host doubles (dynamic values) to the protocol's primitive types.
//! Errors carry no path; decoders locate them.
//!
//! ## Number Policy
//!
//! | Target | Accepts | Otherwise |
//! |--------|---------|-----------|
//! | byte, short, int | integral numerals within the type's range | `TypeMismatch` |
//! | long | integral numerals with magnitude <= `MAX_SAFE_INTEGER` | `PrecisionLoss` |
//! | float, double | any numeral, `NaN`, `Infinity`, `-Infinity` | `TypeMismatch` |
//! | char | a string of one UTF-16 code unit, or a number in `[0, 0xFFFF]` | `TypeMismatch` |
//!
//! Text that is not a numeral at all fails with `TypeMismatch` for every
//! numeric target.

#pragma once

#include "weft/common.hpp"
#include "weft/core/serial_error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace weft::json {

/// Largest integer `n` such that every integer in `[-n, n]` is exactly
/// representable as a double (2^53 - 1).
constexpr int64_t MAX_SAFE_INTEGER = 9007199254740991;

/// True for `-?[0-9]+`.
[[nodiscard]] auto is_integer_syntax(std::string_view text) -> bool;

/// Converts a double holding an integer to `int64_t`.
///
/// Fails with `PrecisionLoss` if `number` is not finite, has a fractional
/// part, or exceeds `MAX_SAFE_INTEGER` in magnitude.
[[nodiscard]] auto double_to_long(double number) -> Result<int64_t, SerialError>;

[[nodiscard]] auto parse_long(std::string_view content) -> Result<int64_t, SerialError>;

/// Parses an integral numeral in `[min, max]`; `type_name` names the target
/// in messages.
[[nodiscard]] auto parse_bounded_integer(std::string_view content, int64_t min, int64_t max,
                                         const char* type_name) -> Result<int64_t, SerialError>;

/// Converts a double holding an integer in `[min, max]`.
///
/// Fails with `TypeMismatch` if `number` is not integral or out of range.
[[nodiscard]] auto double_to_bounded_integer(double number, int64_t min, int64_t max,
                                             const char* type_name)
    -> Result<int64_t, SerialError>;

[[nodiscard]] auto parse_double(std::string_view content) -> Result<double, SerialError>;

/// Accepts `true` and `false`; in lenient mode in any letter case.
[[nodiscard]] auto parse_boolean(std::string_view content, bool lenient)
    -> Result<bool, SerialError>;

/// Reads a string holding exactly one UTF-16 code unit.
[[nodiscard]] auto parse_char(std::string_view content) -> Result<char16_t, SerialError>;

/// Converts a code point held in a double to a char.
[[nodiscard]] auto code_point_to_char(double number) -> Result<char16_t, SerialError>;

/// UTF-8 encoding of a UTF-16 code unit.
[[nodiscard]] auto char_to_utf8(char16_t c) -> std::string;

/// `MalformedInput` error for a non-finite value read while special floating
/// point values are disabled.
[[nodiscard]] auto special_float_error(double value) -> SerialError;

/// `InvalidValue` error for a non-finite value written while special floating
/// point values are disabled.
[[nodiscard]] auto special_float_output_error(double value) -> SerialError;

} // namespace weft::json
