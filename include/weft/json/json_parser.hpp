//! # JSON Parser
//!
//! Recursive descent parser building a `JsonValue` tree from a `JsonLexer`.
//!
//! - Duplicate object keys keep the last value at the first key's position.
//! - Nesting is limited to `MAX_DEPTH` structures.
//! - Lenient lexers may produce bare object keys; strict ones only strings.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "Alice", "age": 30})", JsonConfiguration{});
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     // json.get("age")->as_primitive().content == "30"
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "weft/json/json_lexer.hpp"
#include "weft/json/json_value.hpp"

namespace weft::json {

class JsonParser {
public:
    static constexpr size_t MAX_DEPTH = 1000;

    /// Parses from `lexer`, which must outlive the parser. `depth` is the
    /// nesting level the first value is found at.
    JsonParser(JsonLexer& lexer, bool allow_trailing_comma, size_t depth = 0)
        : lexer_(lexer), allow_trailing_comma_(allow_trailing_comma), depth_(depth) {}

    /// Parses one value and requires the end of input after it.
    [[nodiscard]] auto parse() -> Result<JsonValue, SerialError>;

    /// Parses one value and leaves the lexer after it.
    [[nodiscard]] auto parse_value() -> Result<JsonValue, SerialError>;

private:
    auto parse_object() -> Result<JsonValue, SerialError>;
    auto parse_array() -> Result<JsonValue, SerialError>;

    [[nodiscard]] auto make_error(const JsonToken& token, const std::string& msg) const
        -> SerialError {
        return lexer_.error_at(token, msg);
    }

    JsonLexer& lexer_;
    bool allow_trailing_comma_;
    size_t depth_;
};

/// Parses `input` with the lexer and trailing-comma policy of `config`.
[[nodiscard]] auto parse_json(std::string_view input, const JsonConfiguration& config)
    -> Result<JsonValue, SerialError>;

} // namespace weft::json
