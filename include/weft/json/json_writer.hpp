//! # JSON Writer
//!
//! Low-level JSON text output shared by `JsonValue::to_string` and the
//! streaming encoder: string escaping, number formatting, and `JsonWriter`,
//! which tracks nesting to lay out pretty-printed output.
//!
//! ## Number Formatting
//!
//! | Value | Output |
//! |-------|--------|
//! | `0.1` | `0.1` (shortest form that reads back as the same double) |
//! | `2.0` | `2.0` (integral doubles keep their fractional part) |
//! | `1e21` | `1e+21` |
//! | NaN, +inf, -inf | `NaN`, `Infinity`, `-Infinity` |
//!
//! Whether non-finite values may be written at all is decided by the encoder.

#pragma once

#include "weft/json/json_value.hpp"

#include <string>
#include <string_view>

namespace weft::json {

/// Escapes `s` for use inside a JSON string literal (without the quotes).
///
/// `"` and `\` are escaped, control characters use their short escapes or
/// `\u00XX`. Everything else, including multi-byte UTF-8, is copied as is.
[[nodiscard]] auto escape_string(std::string_view s) -> std::string;

/// Shortest round-trip representation of `value`.
[[nodiscard]] auto format_double(double value) -> std::string;

/// Shortest round-trip representation of `value` as a float.
[[nodiscard]] auto format_float(float value) -> std::string;

/// Accumulates JSON text.
///
/// In pretty mode every item of a structure starts on its own line,
/// indented once per nesting level; in compact mode no whitespace is written.
///
/// Non-string primitives are printed bare only when their text is a JSON
/// literal (`true`, `false`, `null`, a number, or `NaN` / `Infinity` when
/// `special_floats` is set). Anything else, such as a bare word from lenient
/// input, is written as a string.
class JsonWriter {
public:
    JsonWriter(bool pretty, std::string indent, bool special_floats = true)
        : pretty_(pretty), special_floats_(special_floats), indent_(std::move(indent)) {}

    /// Enters a structure.
    void indent() {
        writing_first_ = true;
        ++level_;
    }

    /// Leaves a structure.
    void unindent() {
        --level_;
    }

    /// Starts an item: a line break and indentation in pretty mode.
    void next_item();

    /// Like `next_item`, except for the first item after `indent()`.
    void next_item_if_not_first() {
        if (writing_first_) {
            writing_first_ = false;
        } else {
            next_item();
        }
    }

    /// A space in pretty mode, e.g. after `:`.
    void space() {
        if (pretty_) {
            out_ += ' ';
        }
    }

    void print(char c) {
        out_ += c;
    }

    void print(std::string_view s) {
        out_ += s;
    }

    /// Prints `s` as a quoted, escaped JSON string.
    void print_quoted(std::string_view s);

    /// Prints a non-string primitive, quoting it unless it is a JSON literal.
    void print_literal(std::string_view text);

    [[nodiscard]] auto writing_first() const -> bool {
        return writing_first_;
    }

    [[nodiscard]] auto str() const -> const std::string& {
        return out_;
    }

    [[nodiscard]] auto take() -> std::string {
        return std::move(out_);
    }

private:
    bool pretty_;
    bool special_floats_;
    std::string indent_;
    std::string out_;
    int level_ = 0;
    bool writing_first_ = false;
};

/// Writes `value` through `writer`.
void write_json_value(const JsonValue& value, JsonWriter& writer);

} // namespace weft::json
