//! # JSON Parser Implementation

#include "weft/json/json_parser.hpp"

#include "weft/log/log.hpp"

namespace weft::json {

auto JsonParser::parse() -> Result<JsonValue, SerialError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }

    JsonToken next = lexer_.next_token();
    if (next.kind != JsonTokenKind::Eof) {
        return make_error(next, "Unexpected content after JSON value");
    }

    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, SerialError> {
    const JsonToken& current = lexer_.peek_token();
    if (depth_ >= MAX_DEPTH &&
        (current.kind == JsonTokenKind::LBrace || current.kind == JsonTokenKind::LBracket)) {
        return make_error(current, "Maximum nesting depth exceeded");
    }

    switch (current.kind) {
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    default:
        break;
    }

    JsonToken token = lexer_.next_token();
    switch (token.kind) {
    case JsonTokenKind::Null:
        return JsonValue();

    case JsonTokenKind::String:
        return JsonValue(JsonPrimitive{std::move(token.text), true});

    case JsonTokenKind::Number:
    case JsonTokenKind::True:
    case JsonTokenKind::False:
    case JsonTokenKind::Unquoted:
        return JsonValue(JsonPrimitive{std::move(token.text), false});

    case JsonTokenKind::Error:
        return make_error(token, "");

    case JsonTokenKind::Eof:
        return make_error(token, "Unexpected end of input");

    default:
        return make_error(token, std::string("Unexpected token ") +
                                     token_description(token.kind));
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, SerialError> {
    ++depth_;
    (void)lexer_.next_token(); // Skip '{'

    JsonObject obj;

    if (lexer_.peek_token().kind == JsonTokenKind::RBrace) {
        (void)lexer_.next_token();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        JsonToken key = lexer_.next_token();
        bool bare_key = lexer_.options().is_lenient && key.is_value() &&
                        key.kind != JsonTokenKind::String;
        if (key.kind != JsonTokenKind::String && !bare_key) {
            --depth_;
            if (key.kind == JsonTokenKind::Error) {
                return make_error(key, "");
            }
            return make_error(key, "Expected string key in object");
        }

        JsonToken colon = lexer_.next_token();
        if (colon.kind != JsonTokenKind::Colon) {
            --depth_;
            return make_error(colon, "Expected ':' after object key");
        }

        auto value_result = parse_value();
        if (is_err(value_result)) {
            --depth_;
            return value_result;
        }

        if (obj.contains(key.text)) {
            WEFT_LOG_DEBUG("json", "Duplicate key '" << key.text << "' at line " << key.line
                                                     << ", keeping the last value");
        }
        obj.set(std::move(key.text), std::move(unwrap(value_result)));

        JsonToken separator = lexer_.next_token();
        if (separator.kind == JsonTokenKind::Comma) {
            if (lexer_.peek_token().kind == JsonTokenKind::RBrace) {
                if (!allow_trailing_comma_) {
                    --depth_;
                    return make_error(separator,
                                      "Trailing comma before the end of JSON object. Use "
                                      "'allow_trailing_comma = true' to accept it");
                }
                (void)lexer_.next_token();
                --depth_;
                return JsonValue(std::move(obj));
            }
        } else if (separator.kind == JsonTokenKind::RBrace) {
            --depth_;
            return JsonValue(std::move(obj));
        } else {
            --depth_;
            return make_error(separator, "Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, SerialError> {
    ++depth_;
    (void)lexer_.next_token(); // Skip '['

    JsonArray arr;

    if (lexer_.peek_token().kind == JsonTokenKind::RBracket) {
        (void)lexer_.next_token();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value_result = parse_value();
        if (is_err(value_result)) {
            --depth_;
            return value_result;
        }
        arr.push_back(std::move(unwrap(value_result)));

        JsonToken separator = lexer_.next_token();
        if (separator.kind == JsonTokenKind::Comma) {
            if (lexer_.peek_token().kind == JsonTokenKind::RBracket) {
                if (!allow_trailing_comma_) {
                    --depth_;
                    return make_error(separator,
                                      "Trailing comma before the end of JSON array. Use "
                                      "'allow_trailing_comma = true' to accept it");
                }
                (void)lexer_.next_token();
                --depth_;
                return JsonValue(std::move(arr));
            }
        } else if (separator.kind == JsonTokenKind::RBracket) {
            --depth_;
            return JsonValue(std::move(arr));
        } else {
            --depth_;
            return make_error(separator, "Expected ',' or ']' in array");
        }
    }
}

auto parse_json(std::string_view input, const JsonConfiguration& config)
    -> Result<JsonValue, SerialError> {
    auto lexer = make_lexer(input, config);
    JsonParser parser(*lexer, config.allow_trailing_comma);
    return parser.parse();
}

} // namespace weft::json
