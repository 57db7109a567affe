//! # JSON Writer Implementation
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace | `\b` |
//! | Form feed | `\f` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Other control (0x00-0x1F) | `\u00XX` |

#include "weft/json/json_writer.hpp"

#include "weft/json/json_lexer.hpp"

#include <charconv>
#include <cmath>
#include <ostream>

namespace weft::json {

namespace {

template <typename F> auto format_floating(F value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }

    char buffer[64];
    auto result_chars = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string result(buffer, result_chars.ptr);

    // Ensure there's a decimal point for integral values
    if (result.find('.') == std::string::npos && result.find('e') == std::string::npos) {
        result += ".0";
    }
    return result;
}

void write_value(const JsonValue& value, JsonWriter& writer) {
    if (value.is_null()) {
        writer.print("null");
        return;
    }

    if (value.is_primitive()) {
        const auto& primitive = value.as_primitive();
        if (primitive.is_string) {
            writer.print_quoted(primitive.content);
        } else {
            writer.print_literal(primitive.content);
        }
        return;
    }

    if (value.is_array()) {
        const auto& arr = value.as_array();
        writer.print('[');
        writer.indent();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                writer.print(',');
            }
            writer.next_item();
            write_value(arr[i], writer);
        }
        writer.unindent();
        if (!arr.empty()) {
            writer.next_item();
        }
        writer.print(']');
        return;
    }

    const auto& obj = value.as_object();
    writer.print('{');
    writer.indent();
    for (size_t i = 0; i < obj.size(); ++i) {
        if (i > 0) {
            writer.print(',');
        }
        writer.next_item();
        writer.print_quoted(obj.key_at(i));
        writer.print(':');
        writer.space();
        write_value(obj.value_at(i), writer);
    }
    writer.unindent();
    if (!obj.empty()) {
        writer.next_item();
    }
    writer.print('}');
}

} // namespace

auto escape_string(std::string_view s) -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";

    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                auto code = static_cast<unsigned char>(c);
                result += "\\u00";
                result += HEX[code >> 4];
                result += HEX[code & 0xF];
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

auto format_double(double value) -> std::string {
    return format_floating(value);
}

auto format_float(float value) -> std::string {
    return format_floating(value);
}

// ============================================================================
// JsonWriter
// ============================================================================

void JsonWriter::next_item() {
    writing_first_ = false;
    if (pretty_) {
        out_ += '\n';
        for (int i = 0; i < level_; ++i) {
            out_ += indent_;
        }
    }
}

void JsonWriter::print_quoted(std::string_view s) {
    out_ += '"';
    out_ += escape_string(s);
    out_ += '"';
}

void JsonWriter::print_literal(std::string_view text) {
    if (text == "true" || text == "false" || text == "null" || is_json_number(text) ||
        (special_floats_ && is_special_float_literal(text))) {
        out_ += text;
    } else {
        print_quoted(text);
    }
}

void write_json_value(const JsonValue& value, JsonWriter& writer) {
    write_value(value, writer);
}

// ============================================================================
// JsonValue Serialization
// ============================================================================

auto JsonValue::to_string() const -> std::string {
    JsonWriter writer(false, "");
    write_json_value(*this, writer);
    return writer.take();
}

auto JsonValue::to_string_pretty(const std::string& indent) const -> std::string {
    JsonWriter writer(true, indent);
    write_json_value(*this, writer);
    return writer.take();
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    return os << to_string();
}

} // namespace weft::json
