#include "weft/json/json_primitives.hpp"

#include "weft/json/json_writer.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>

namespace weft::json {

auto is_integer_syntax(std::string_view text) -> bool {
    size_t i = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (i == text.size()) {
        return false;
    }
    for (; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

namespace {

/// Characters of a decimal numeral; excludes the `inf` and `nan` spellings
/// `from_chars` would otherwise accept.
auto is_numeral_syntax(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-' && c != '+' && c != '.' &&
            c != 'e' && c != 'E') {
            return false;
        }
    }
    return true;
}

auto parse_numeral(std::string_view text) -> std::optional<double> {
    if (text == "NaN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (text == "Infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (text == "-Infinity") {
        return -std::numeric_limits<double>::infinity();
    }
    if (!is_numeral_syntax(text)) {
        return std::nullopt;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin == '+') {
        ++begin;
        // A single sign only: "+-1" and "++1" are not numerals.
        if (begin == end || *begin == '+' || *begin == '-') {
            return std::nullopt;
        }
    }
    double value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto literal_error(std::string_view content, const char* type_name) -> SerialError {
    return SerialError::make(ErrorKind::TypeMismatch, "Failed to parse literal '" +
                                                          std::string(content) + "' as " +
                                                          type_name + " value");
}

/// Decodes one UTF-8 code point from `s`; nullopt unless `s` holds exactly one.
auto single_code_point(std::string_view s) -> std::optional<uint32_t> {
    if (s.empty()) {
        return std::nullopt;
    }
    auto lead = static_cast<unsigned char>(s[0]);
    size_t length = 0;
    uint32_t cp = 0;
    if (lead < 0x80) {
        length = 1;
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        return std::nullopt;
    }
    if (s.size() != length) {
        return std::nullopt;
    }
    for (size_t i = 1; i < length; ++i) {
        auto next = static_cast<unsigned char>(s[i]);
        if ((next & 0xC0) != 0x80) {
            return std::nullopt;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    return cp;
}

} // namespace

auto double_to_long(double number) -> Result<int64_t, SerialError> {
    if (!std::isfinite(number) || std::floor(number) != number) {
        return SerialError::make(ErrorKind::PrecisionLoss,
                                 format_double(number) +
                                     " can't be represented as long because it is not finite or "
                                     "has non-zero fractional part");
    }
    if (std::fabs(number) > static_cast<double>(MAX_SAFE_INTEGER)) {
        return SerialError::make(ErrorKind::PrecisionLoss,
                                 format_double(number) +
                                     " can't be deserialized to long due to a potential "
                                     "precision loss");
    }
    return static_cast<int64_t>(number);
}

auto parse_long(std::string_view content) -> Result<int64_t, SerialError> {
    if (is_integer_syntax(content)) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(content.data(), content.data() + content.size(), value);
        if (ec != std::errc{} || value > MAX_SAFE_INTEGER || value < -MAX_SAFE_INTEGER) {
            return SerialError::make(ErrorKind::PrecisionLoss,
                                     std::string(content) +
                                         " can't be deserialized to long due to a potential "
                                         "precision loss");
        }
        return value;
    }
    auto number = parse_numeral(content);
    if (!number) {
        return literal_error(content, "long");
    }
    return double_to_long(*number);
}

auto parse_bounded_integer(std::string_view content, int64_t min, int64_t max,
                           const char* type_name) -> Result<int64_t, SerialError> {
    int64_t value = 0;
    if (is_integer_syntax(content)) {
        auto [ptr, ec] = std::from_chars(content.data(), content.data() + content.size(), value);
        if (ec != std::errc{}) {
            return literal_error(content, type_name);
        }
    } else {
        auto number = parse_numeral(content);
        if (!number || !std::isfinite(*number) || std::floor(*number) != *number ||
            std::fabs(*number) > static_cast<double>(MAX_SAFE_INTEGER)) {
            return literal_error(content, type_name);
        }
        value = static_cast<int64_t>(*number);
    }
    if (value < min || value > max) {
        return SerialError::make(ErrorKind::TypeMismatch, "Value " + std::string(content) +
                                                              " is out of range of " + type_name);
    }
    return value;
}

auto double_to_bounded_integer(double number, int64_t min, int64_t max, const char* type_name)
    -> Result<int64_t, SerialError> {
    if (!std::isfinite(number) || std::floor(number) != number) {
        return SerialError::make(ErrorKind::TypeMismatch,
                                 format_double(number) + " can't be represented as " + type_name +
                                     " because it is not finite or has non-zero fractional part");
    }
    if (number < static_cast<double>(min) || number > static_cast<double>(max)) {
        return SerialError::make(ErrorKind::TypeMismatch, "Value " + format_double(number) +
                                                              " is out of range of " + type_name);
    }
    return static_cast<int64_t>(number);
}

auto parse_double(std::string_view content) -> Result<double, SerialError> {
    auto number = parse_numeral(content);
    if (!number) {
        return literal_error(content, "double");
    }
    return *number;
}

auto parse_boolean(std::string_view content, bool lenient) -> Result<bool, SerialError> {
    auto equals = [&](std::string_view word) {
        if (content.size() != word.size()) {
            return false;
        }
        for (size_t i = 0; i < word.size(); ++i) {
            char c = content[i];
            if (lenient) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            if (c != word[i]) {
                return false;
            }
        }
        return true;
    };
    if (equals("true")) {
        return true;
    }
    if (equals("false")) {
        return false;
    }
    return literal_error(content, "boolean");
}

auto code_point_to_char(double number) -> Result<char16_t, SerialError> {
    if (!std::isfinite(number) || std::floor(number) != number || number < 0 || number > 0xFFFF) {
        return SerialError::make(ErrorKind::TypeMismatch,
                                 format_double(number) +
                                     " can't be represented as char because it is not in "
                                     "[0, 0xFFFF]");
    }
    return static_cast<char16_t>(number);
}

auto parse_char(std::string_view content) -> Result<char16_t, SerialError> {
    if (auto cp = single_code_point(content); cp && *cp <= 0xFFFF) {
        return static_cast<char16_t>(*cp);
    }
    return SerialError::make(ErrorKind::TypeMismatch,
                             "'" + std::string(content) + "' can't be represented as char");
}

auto char_to_utf8(char16_t c) -> std::string {
    auto cp = static_cast<uint32_t>(c);
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

auto special_float_error(double value) -> SerialError {
    return SerialError::make(ErrorKind::MalformedInput,
                             "Unexpected special floating-point value " + format_double(value) +
                                 ". By default, non-finite floating point values are prohibited "
                                 "because they do not conform JSON specification. Use "
                                 "'allow_special_floating_point_values = true' to enable them");
}

auto special_float_output_error(double value) -> SerialError {
    return SerialError::make(ErrorKind::InvalidValue,
                             "Unexpected special floating-point value " + format_double(value) +
                                 ". By default, non-finite floating point values are prohibited "
                                 "because they do not conform JSON specification. Use "
                                 "'allow_special_floating_point_values = true' to enable them");
}

} // namespace weft::json
