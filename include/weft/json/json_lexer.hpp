//! # JSON Lexer
//!
//! Zero-copy tokenizer shared by the tree parser and the streaming decoder.
//! Literal tokens keep their text; nothing is converted to a number until a
//! serializer asks for one.
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBrace` / `RBrace` | Object delimiters | `{` `}` |
//! | `LBracket` / `RBracket` | Array delimiters | `[` `]` |
//! | `Colon`, `Comma` | Separators | `:` `,` |
//! | `String` | Quoted string, unescaped into `text` | `"hello"` |
//! | `Number` | Numeric literal | `42`, `-1.5e3`, `NaN` |
//! | `True`, `False`, `Null` | Keywords | `true` |
//! | `Unquoted` | Bare word (lenient mode only) | `hello`, `.5`, `True` |
//!
//! ## Modes
//!
//! - **Strict**: RFC 8259. `NaN`, `Infinity` and `-Infinity` are accepted as
//!   `Number` only with `allow_special_floats`.
//! - **Lenient**: additionally single-quoted strings and bare words. A bare
//!   word spelling a JSON number or keyword gets that token kind.
//! - **Comments**: `CommentJsonLexer` also skips `// ...` and `/* ... */`.

#pragma once

#include "weft/common.hpp"
#include "weft/core/serial_error.hpp"
#include "weft/json/json_configuration.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weft::json {

enum class JsonTokenKind : uint8_t {
    // Structural tokens
    LBrace,   ///< `{` - Start of object
    RBrace,   ///< `}` - End of object
    LBracket, ///< `[` - Start of array
    RBracket, ///< `]` - End of array
    Colon,    ///< `:` - Key-value separator
    Comma,    ///< `,` - Element separator

    // Value tokens
    String,   ///< Quoted string literal
    Number,   ///< Numeric literal
    True,     ///< `true`
    False,    ///< `false`
    Null,     ///< `null`
    Unquoted, ///< Bare word (lenient mode)

    // Special tokens
    Eof,  ///< End of input
    Error ///< Lexer error (see `JsonLexer::errors`)
};

/// Returns a short description of a token kind for messages.
[[nodiscard]] auto token_description(JsonTokenKind kind) -> const char*;

/// A token produced by the JSON lexer.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;

    /// The original text of this token (view into source).
    std::string_view lexeme;

    /// Position of the first character (1-based line and column).
    size_t line = 1;
    size_t column = 1;
    size_t offset = 0;

    /// Unescaped content for `String`, the literal text for other values.
    std::string text;

    /// True for tokens that carry a value (strings, numbers, keywords, bare words).
    [[nodiscard]] auto is_value() const -> bool {
        return kind == JsonTokenKind::String || kind == JsonTokenKind::Number ||
               kind == JsonTokenKind::True || kind == JsonTokenKind::False ||
               kind == JsonTokenKind::Null || kind == JsonTokenKind::Unquoted;
    }
};

struct LexerOptions {
    bool is_lenient = false;
    bool allow_special_floats = false;
};

/// Tokenizes JSON text with one token of lookahead.
///
/// # Example
///
/// ```cpp
/// JsonLexer lexer(R"({"key": 42})", {});
/// while (true) {
///     JsonToken tok = lexer.next_token();
///     if (tok.kind == JsonTokenKind::Eof) break;
///     // Process token...
/// }
/// ```
class JsonLexer {
public:
    JsonLexer(std::string_view input, LexerOptions options);
    virtual ~JsonLexer() = default;

    JsonLexer(const JsonLexer&) = delete;
    auto operator=(const JsonLexer&) -> JsonLexer& = delete;

    /// Consumes and returns the next token.
    auto next_token() -> JsonToken;

    /// Returns the next token without consuming it.
    auto peek_token() -> const JsonToken&;

    /// Consumes one complete value, including nested structures.
    auto skip_value() -> Result<bool, SerialError>;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

    [[nodiscard]] auto errors() const -> const std::vector<SerialError>& {
        return errors_;
    }

    [[nodiscard]] auto options() const -> const LexerOptions& {
        return options_;
    }

    /// A `MalformedInput` error located at `token`. For `Error` tokens the
    /// lexer's own message is used.
    [[nodiscard]] auto error_at(const JsonToken& token, const std::string& message) const
        -> SerialError;

protected:
    /// Skips insignificant characters before a token. Returns `false` after
    /// recording an error.
    virtual auto skip_whitespace() -> bool;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    auto advance() -> char;

    void add_error(const std::string& msg, size_t line, size_t col, size_t offset);

    [[nodiscard]] auto line() const -> size_t {
        return line_;
    }
    [[nodiscard]] auto column() const -> size_t {
        return column_;
    }
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

private:
    auto scan() -> JsonToken;
    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;
    auto error_token(const std::string& msg, size_t start_pos, size_t start_line,
                     size_t start_col) -> JsonToken;
    auto scan_string(char quote) -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_word() -> JsonToken;
    auto scan_bare() -> JsonToken;
    auto append_unicode_escape(std::string& value) -> bool;

    std::string_view input_;
    LexerOptions options_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::vector<SerialError> errors_;
    std::optional<JsonToken> lookahead_;
};

/// Lexer that also skips `// line` and `/* block */` comments.
class CommentJsonLexer final : public JsonLexer {
public:
    using JsonLexer::JsonLexer;

protected:
    auto skip_whitespace() -> bool override;
};

/// Creates the lexer selected by `config`.
[[nodiscard]] auto make_lexer(std::string_view input, const JsonConfiguration& config)
    -> Box<JsonLexer>;

/// True if `text` is a number per the JSON grammar.
[[nodiscard]] auto is_json_number(std::string_view text) -> bool;

/// True for `NaN`, `Infinity` and `-Infinity`.
[[nodiscard]] auto is_special_float_literal(std::string_view text) -> bool;

} // namespace weft::json
