//! # JSON Lexer Implementation
//!
//! The lexer handles:
//! - Structural tokens: `{`, `}`, `[`, `]`, `:`, `,`
//! - String literals with escape sequences, including UTF-16 surrogate pairs
//! - Numbers, keywords and (lenient) bare words
//! - Whitespace skipping, and comments in `CommentJsonLexer`

#include "weft/json/json_lexer.hpp"

#include <cctype>
#include <charconv>
#include <vector>

namespace weft::json {

namespace {

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_alpha(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

/// Characters that end a bare word in lenient mode.
auto is_bare_delimiter(char c) -> bool {
    switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case ',':
    case ':':
    case '[':
    case ']':
    case '{':
    case '}':
    case '"':
    case '\'':
        return true;
    default:
        return false;
    }
}

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

auto parse_hex4(std::string_view hex) -> std::optional<uint32_t> {
    if (hex.size() != 4) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, value, 16);
    if (ec != std::errc{} || ptr != hex.data() + 4) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto token_description(JsonTokenKind kind) -> const char* {
    switch (kind) {
    case JsonTokenKind::LBrace:
        return "'{'";
    case JsonTokenKind::RBrace:
        return "'}'";
    case JsonTokenKind::LBracket:
        return "'['";
    case JsonTokenKind::RBracket:
        return "']'";
    case JsonTokenKind::Colon:
        return "':'";
    case JsonTokenKind::Comma:
        return "','";
    case JsonTokenKind::String:
        return "string";
    case JsonTokenKind::Number:
        return "number";
    case JsonTokenKind::True:
    case JsonTokenKind::False:
        return "boolean";
    case JsonTokenKind::Null:
        return "null";
    case JsonTokenKind::Unquoted:
        return "literal";
    case JsonTokenKind::Eof:
        return "end of input";
    case JsonTokenKind::Error:
        return "invalid token";
    }
    return "token";
}

auto is_json_number(std::string_view text) -> bool {
    size_t i = 0;
    auto digits = [&]() {
        size_t start = i;
        while (i < text.size() && is_digit(text[i])) {
            ++i;
        }
        return i > start;
    };

    if (i < text.size() && text[i] == '-') {
        ++i;
    }
    if (i < text.size() && text[i] == '0') {
        ++i;
    } else if (!digits()) {
        return false;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        if (!digits()) {
            return false;
        }
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            ++i;
        }
        if (!digits()) {
            return false;
        }
    }
    return i == text.size();
}

auto is_special_float_literal(std::string_view text) -> bool {
    return text == "NaN" || text == "Infinity" || text == "-Infinity";
}

// ============================================================================
// JsonLexer
// ============================================================================

JsonLexer::JsonLexer(std::string_view input, LexerOptions options)
    : input_(input), options_(options) {}

auto JsonLexer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonLexer::peek_next() const -> char {
    if (pos_ + 1 >= input_.size()) {
        return '\0';
    }
    return input_[pos_ + 1];
}

auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

auto JsonLexer::skip_whitespace() -> bool {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
    return true;
}

void JsonLexer::add_error(const std::string& msg, size_t line, size_t col, size_t offset) {
    errors_.push_back(SerialError::make(ErrorKind::MalformedInput, msg, line, col, offset));
}

auto JsonLexer::error_at(const JsonToken& token, const std::string& message) const
    -> SerialError {
    if (token.kind == JsonTokenKind::Error && !errors_.empty()) {
        return errors_.back();
    }
    return SerialError::make(ErrorKind::MalformedInput, message, token.line, token.column,
                             token.offset);
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                           size_t start_col) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(start_pos, pos_ - start_pos);
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

auto JsonLexer::error_token(const std::string& msg, size_t start_pos, size_t start_line,
                            size_t start_col) -> JsonToken {
    add_error(msg, start_line, start_col, start_pos);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    if (lookahead_) {
        JsonToken tok = std::move(*lookahead_);
        lookahead_.reset();
        return tok;
    }
    return scan();
}

auto JsonLexer::peek_token() -> const JsonToken& {
    if (!lookahead_) {
        lookahead_ = scan();
    }
    return *lookahead_;
}

auto JsonLexer::skip_value() -> Result<bool, SerialError> {
    JsonToken tok = next_token();
    if (tok.is_value()) {
        return true;
    }
    if (tok.kind != JsonTokenKind::LBrace && tok.kind != JsonTokenKind::LBracket) {
        return error_at(tok, std::string("Expected a value, but had ") +
                                 token_description(tok.kind));
    }

    // Each closer must match the innermost open bracket.
    std::vector<JsonTokenKind> open{tok.kind};
    while (!open.empty()) {
        tok = next_token();
        switch (tok.kind) {
        case JsonTokenKind::LBrace:
        case JsonTokenKind::LBracket:
            open.push_back(tok.kind);
            break;
        case JsonTokenKind::RBrace:
        case JsonTokenKind::RBracket: {
            auto expected = open.back() == JsonTokenKind::LBrace ? JsonTokenKind::RBrace
                                                                 : JsonTokenKind::RBracket;
            if (tok.kind != expected) {
                return error_at(tok, std::string("Expected '") +
                                         (expected == JsonTokenKind::RBrace ? "}" : "]") +
                                         "', but had " + token_description(tok.kind));
            }
            open.pop_back();
            break;
        }
        case JsonTokenKind::Error:
        case JsonTokenKind::Eof:
            return error_at(tok, "Unexpected end of input while skipping a value");
        default:
            break;
        }
    }
    return true;
}

auto JsonLexer::scan() -> JsonToken {
    if (!skip_whitespace()) {
        return make_token(JsonTokenKind::Error, pos_, line_, column_);
    }

    if (pos_ >= input_.size()) {
        JsonToken tok;
        tok.kind = JsonTokenKind::Eof;
        tok.line = line_;
        tok.column = column_;
        tok.offset = pos_;
        return tok;
    }

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;
    char c = peek();

    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start_line, start_col);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start_line, start_col);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start_line, start_col);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start_line, start_col);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start_line, start_col);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start_line, start_col);
    case '"':
        return scan_string('"');
    case '\'':
        if (options_.is_lenient) {
            return scan_string('\'');
        }
        advance();
        return error_token("Unexpected character: '. Use 'is_lenient = true' to accept "
                           "single-quoted strings",
                           start_pos, start_line, start_col);
    default:
        break;
    }

    if (options_.is_lenient) {
        return scan_bare();
    }
    if (c == '-' && peek_next() == 'I') {
        return scan_word();
    }
    if (c == '-' || is_digit(c)) {
        return scan_number();
    }
    if (is_alpha(c)) {
        return scan_word();
    }
    advance();
    return error_token("Unexpected character: " + std::string(1, c), start_pos, start_line,
                       start_col);
}

auto JsonLexer::append_unicode_escape(std::string& value) -> bool {
    size_t start_line = line_;
    size_t start_col = column_;
    auto codepoint = parse_hex4(input_.substr(pos_, 4));
    if (!codepoint) {
        add_error("Invalid unicode escape sequence", start_line, start_col, pos_);
        return false;
    }
    pos_ += 4;
    column_ += 4;

    if (*codepoint >= 0xD800 && *codepoint <= 0xDBFF && peek() == '\\' && peek_next() == 'u') {
        auto low = parse_hex4(input_.substr(pos_ + 2, 4));
        if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
            pos_ += 6;
            column_ += 6;
            append_utf8(value, 0x10000 + ((*codepoint - 0xD800) << 10) + (*low - 0xDC00));
            return true;
        }
    }
    append_utf8(value, *codepoint);
    return true;
}

auto JsonLexer::scan_string(char quote) -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // Skip opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = peek();

        if (c == quote) {
            advance(); // Skip closing quote
            JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.text = std::move(value);
            return tok;
        }

        if (c == '\\') {
            size_t escape_line = line_;
            size_t escape_col = column_;
            size_t escape_pos = pos_;
            advance(); // Skip backslash
            char escaped = advance();
            switch (escaped) {
            case '"':
            case '\\':
            case '/':
                value += escaped;
                break;
            case '\'':
                if (quote != '\'') {
                    return error_token("Invalid escape sequence: \\'", escape_pos, escape_line,
                                       escape_col);
                }
                value += '\'';
                break;
            case 'b':
                value += '\b';
                break;
            case 'f':
                value += '\f';
                break;
            case 'n':
                value += '\n';
                break;
            case 'r':
                value += '\r';
                break;
            case 't':
                value += '\t';
                break;
            case 'u':
                if (!append_unicode_escape(value)) {
                    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
                }
                break;
            default:
                return error_token("Invalid escape sequence: \\" + std::string(1, escaped),
                                   escape_pos, escape_line, escape_col);
            }
        } else if (static_cast<unsigned char>(c) < 0x20) {
            return error_token("Control character in string", pos_, line_, column_);
        } else {
            value += c;
            advance();
        }
    }

    return error_token("Unterminated string", start_pos, start_line, start_col);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    // Optional minus sign
    if (peek() == '-') {
        advance();
    }

    // Integer part
    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        return error_token("Invalid number", start_pos, start_line, start_col);
    }

    // Fractional part
    if (peek() == '.') {
        advance();
        if (!is_digit(peek())) {
            return error_token("Expected digit after decimal point", start_pos, start_line,
                               start_col);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    // Exponent part
    if (peek() == 'e' || peek() == 'E') {
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return error_token("Expected digit in exponent", start_pos, start_line, start_col);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    JsonToken tok = make_token(JsonTokenKind::Number, start_pos, start_line, start_col);
    tok.text = std::string(tok.lexeme);
    return tok;
}

auto JsonLexer::scan_word() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    if (peek() == '-') {
        advance();
    }
    while (is_alpha(peek())) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);
    JsonTokenKind kind = JsonTokenKind::Error;
    if (word == "true") {
        kind = JsonTokenKind::True;
    } else if (word == "false") {
        kind = JsonTokenKind::False;
    } else if (word == "null") {
        kind = JsonTokenKind::Null;
    } else if (is_special_float_literal(word)) {
        if (!options_.allow_special_floats) {
            return error_token("Unexpected special floating-point value " + std::string(word) +
                                   ". By default, non-finite floating point values are "
                                   "prohibited because they do not conform JSON "
                                   "specification. Use 'allow_special_floating_point_values "
                                   "= true' to enable them",
                               start_pos, start_line, start_col);
        }
        kind = JsonTokenKind::Number;
    } else {
        return error_token("Unexpected token '" + std::string(word) +
                               "'. Use 'is_lenient = true' to accept non-compliant JSON",
                           start_pos, start_line, start_col);
    }

    JsonToken tok = make_token(kind, start_pos, start_line, start_col);
    tok.text = std::string(word);
    return tok;
}

auto JsonLexer::scan_bare() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    while (pos_ < input_.size() && !is_bare_delimiter(peek())) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);
    JsonTokenKind kind = JsonTokenKind::Unquoted;
    if (word == "true") {
        kind = JsonTokenKind::True;
    } else if (word == "false") {
        kind = JsonTokenKind::False;
    } else if (word == "null") {
        kind = JsonTokenKind::Null;
    } else if (is_json_number(word) ||
               (options_.allow_special_floats && is_special_float_literal(word))) {
        kind = JsonTokenKind::Number;
    }

    JsonToken tok = make_token(kind, start_pos, start_line, start_col);
    tok.text = std::string(word);
    return tok;
}

// ============================================================================
// CommentJsonLexer
// ============================================================================

auto CommentJsonLexer::skip_whitespace() -> bool {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else if (c == '/' && peek_next() == '/') {
            while (!at_end() && peek() != '\n') {
                advance();
            }
        } else if (c == '/' && peek_next() == '*') {
            size_t start_line = line();
            size_t start_col = column();
            size_t start_pos = position();
            advance();
            advance();
            while (!(peek() == '*' && peek_next() == '/')) {
                if (at_end()) {
                    add_error("Expected end of the block comment: \"*/\", but had EOF instead",
                              start_line, start_col, start_pos);
                    return false;
                }
                advance();
            }
            advance();
            advance();
        } else {
            break;
        }
    }
    return true;
}

auto make_lexer(std::string_view input, const JsonConfiguration& config) -> Box<JsonLexer> {
    LexerOptions options{config.is_lenient, config.allow_special_floating_point_values};
    if (config.allow_comments) {
        return make_box<CommentJsonLexer>(input, options);
    }
    return make_box<JsonLexer>(input, options);
}

} // namespace weft::json
