#include "weft/json/streaming_json_decoder.hpp"

#include "weft/json/json_coercion.hpp"
#include "weft/json/json_primitives.hpp"
#include "weft/json/json_tree_decoder.hpp"
#include "weft/log/log.hpp"

#include <cmath>
#include <limits>

namespace weft::json {

StreamingJsonDecoder::StreamingJsonDecoder(const JsonConfiguration& config, JsonLexer& lexer,
                                           Mode mode, std::string path_prefix, size_t depth,
                                           Rc<const NamesMap> names)
    : config_(config), lexer_(lexer), mode_(mode), path_prefix_(std::move(path_prefix)),
      depth_(depth), names_(names ? std::move(names) : empty_names_map()) {}

auto StreamingJsonDecoder::current_path() const -> std::string {
    return path_prefix_ + segment_;
}

auto StreamingJsonDecoder::token_error(const JsonToken& token, ErrorKind kind,
                                       const std::string& message) const -> SerialError {
    SerialError error = lexer_.error_at(token, message);
    if (token.kind != JsonTokenKind::Error) {
        error.kind = kind;
    }
    error.path = current_path();
    return error;
}

// ============================================================================
// Structures
// ============================================================================

auto StreamingJsonDecoder::begin_structure(const DescriptorPtr& descriptor)
    -> Result<Box<CompositeDecoder>, SerialError> {
    if (depth_ + 1 > MAX_DEPTH) {
        return token_error(lexer_.peek_token(), ErrorKind::MalformedInput,
                           "Maximum nesting depth exceeded");
    }

    SerialKind kind = descriptor->kind();
    if (is_polymorphic_kind(kind)) {
        kind = config_.use_array_polymorphism ? SerialKind::List : SerialKind::Map;
    }
    Mode mode = Mode::Obj;
    if (kind == SerialKind::List) {
        mode = Mode::List;
    } else if (kind == SerialKind::Map) {
        mode = Mode::Map;
    }

    JsonTokenKind opening = mode == Mode::List ? JsonTokenKind::LBracket : JsonTokenKind::LBrace;
    JsonToken token = lexer_.next_token();
    if (token.kind != opening) {
        bool structural = token.is_value() || token.kind == JsonTokenKind::LBrace ||
                          token.kind == JsonTokenKind::LBracket;
        return token_error(token,
                           structural ? ErrorKind::UnexpectedStructure : ErrorKind::MalformedInput,
                           std::string("Expected ") + token_description(opening) + " for '" +
                               descriptor->serial_name() + "', but had " +
                               token_description(token.kind));
    }

    Rc<const NamesMap> names;
    if (mode == Mode::Obj && needs_names_map(config_, *descriptor)) {
        auto built = names_map_for(config_, *descriptor);
        if (is_err(built)) {
            return token_error(token, ErrorKind::InvalidDescriptor, unwrap_err(built).message);
        }
        names = std::move(unwrap(built));
    }
    return Box<CompositeDecoder>(make_box<StreamingJsonDecoder>(
        config_, lexer_, mode, current_path(), depth_ + 1, std::move(names)));
}

auto StreamingJsonDecoder::begin_polymorphic(const DescriptorPtr& base_descriptor)
    -> Result<std::optional<PolymorphicInput>, SerialError> {
    if (config_.use_array_polymorphism) {
        return std::optional<PolymorphicInput>{};
    }

    // The discriminator may follow other keys, so the object is read whole.
    JsonParser parser(lexer_, config_.allow_trailing_comma, depth_);
    auto parsed = parser.parse_value();
    if (is_err(parsed)) {
        SerialError error = std::move(unwrap_err(parsed));
        error.path = current_path();
        return error;
    }
    auto tree = make_rc<JsonValue>(std::move(unwrap(parsed)));
    auto root = make_tree_decoder(config_, *tree, current_path());
    auto input = root->begin_polymorphic(base_descriptor);
    if (is_ok(input) && unwrap(input)) {
        unwrap(input)->keep_alive = tree;
    }
    return input;
}

auto StreamingJsonDecoder::decode_json_element() -> Result<JsonValue, SerialError> {
    if (force_null_) {
        return JsonValue();
    }
    JsonParser parser(lexer_, config_.allow_trailing_comma, depth_);
    auto parsed = parser.parse_value();
    if (is_err(parsed)) {
        unwrap_err(parsed).path = current_path();
    }
    return parsed;
}

auto StreamingJsonDecoder::end_structure(const SerialDescriptor& descriptor)
    -> Result<bool, SerialError> {
    // Skip whatever the serializer did not read.
    while (!at_end_) {
        auto index = decode_element_index(descriptor);
        if (is_err(index)) {
            return unwrap_err(index);
        }
        if (unwrap(index) == DECODE_DONE) {
            break;
        }
        if (!force_null_) {
            auto skipped = lexer_.skip_value();
            if (is_err(skipped)) {
                unwrap_err(skipped).path = current_path();
                return skipped;
            }
        }
    }

    JsonTokenKind closing = mode_ == Mode::List ? JsonTokenKind::RBracket : JsonTokenKind::RBrace;
    JsonToken token = lexer_.next_token();
    if (token.kind != closing) {
        return token_error(token, ErrorKind::MalformedInput,
                           std::string("Expected ") + token_description(closing) +
                               ", but had " + token_description(token.kind));
    }
    return true;
}

auto StreamingJsonDecoder::expect_end_of_input() -> Result<bool, SerialError> {
    JsonToken token = lexer_.next_token();
    if (token.kind != JsonTokenKind::Eof) {
        return token_error(token, ErrorKind::MalformedInput,
                           std::string("Expected end of the input, but had ") +
                               token_description(token.kind));
    }
    return true;
}

// ============================================================================
// Element Indices
// ============================================================================

auto StreamingJsonDecoder::decode_element_index(const SerialDescriptor& descriptor)
    -> Result<int, SerialError> {
    force_null_ = false;
    switch (mode_) {
    case Mode::Obj:
        return object_element_index(descriptor);
    case Mode::List:
        return list_element_index();
    case Mode::Map:
        return map_element_index();
    }
    return DECODE_DONE;
}

auto StreamingJsonDecoder::next_item(JsonTokenKind closing, const char* structure)
    -> Result<bool, SerialError> {
    const JsonToken& token = lexer_.peek_token();
    if (token.kind == JsonTokenKind::Error) {
        return token_error(token, ErrorKind::MalformedInput, "");
    }
    if (token.kind == closing) {
        return false;
    }
    if (!expect_separator_) {
        return true;
    }
    if (token.kind != JsonTokenKind::Comma) {
        return token_error(token, ErrorKind::MalformedInput,
                           std::string("Expected ',' or ") + token_description(closing) +
                               " in " + structure + ", but had " +
                               token_description(token.kind));
    }
    JsonToken comma = lexer_.next_token();
    if (lexer_.peek_token().kind == closing) {
        if (!config_.allow_trailing_comma) {
            return token_error(comma, ErrorKind::MalformedInput,
                               std::string("Trailing comma before the end of JSON ") + structure +
                                   ". Use 'allow_trailing_comma = true' to accept it");
        }
        return false;
    }
    return true;
}

auto StreamingJsonDecoder::object_element_index(const SerialDescriptor& descriptor)
    -> Result<int, SerialError> {
    if (position_ < 0) {
        position_ = 0;
        seen_.assign(descriptor.elements_count(), false);
    }
    if (at_end_) {
        return absent_element_index(descriptor);
    }

    while (true) {
        auto more = next_item(JsonTokenKind::RBrace, "object");
        if (is_err(more)) {
            return unwrap_err(more);
        }
        if (!unwrap(more)) {
            at_end_ = true;
            segment_.clear();
            return absent_element_index(descriptor);
        }
        expect_separator_ = true;

        JsonToken key = lexer_.next_token();
        bool bare_key =
            config_.is_lenient && key.is_value() && key.kind != JsonTokenKind::String;
        if (key.kind != JsonTokenKind::String && !bare_key) {
            return token_error(key, ErrorKind::MalformedInput,
                               std::string("Expected a quoted object key, but had ") +
                                   token_description(key.kind));
        }
        JsonToken colon = lexer_.next_token();
        if (colon.kind != JsonTokenKind::Colon) {
            return token_error(colon, ErrorKind::MalformedInput,
                               std::string("Expected ':' after object key, but had ") +
                                   token_description(colon.kind));
        }
        segment_ = "." + key.text;

        auto index = get_json_name_index(config_, descriptor, key.text, *names_);
        if (!index) {
            if (!config_.ignore_unknown_keys) {
                return token_error(key, ErrorKind::UnknownKey,
                                   "Encountered an unknown key '" + key.text +
                                       "'. Use 'ignore_unknown_keys = true' to ignore unknown "
                                       "keys");
            }
            WEFT_LOG_DEBUG("json", "Skipping unknown key '" << key.text << "' of "
                                                            << descriptor.serial_name());
            auto skipped = lexer_.skip_value();
            if (is_err(skipped)) {
                unwrap_err(skipped).path = current_path();
                return unwrap_err(skipped);
            }
            continue;
        }

        size_t element = *index;
        seen_[element] = true;
        if (config_.coerce_input_values) {
            const JsonToken& value = lexer_.peek_token();
            std::optional<std::string> content;
            if (value.kind == JsonTokenKind::String || value.kind == JsonTokenKind::Unquoted) {
                content = value.text;
            }
            auto outcome = try_coerce_value(config_, descriptor, element,
                                            value.kind == JsonTokenKind::Null, content);
            if (outcome != CoercionOutcome::Decode) {
                auto skipped = lexer_.skip_value();
                if (is_err(skipped)) {
                    unwrap_err(skipped).path = current_path();
                    return unwrap_err(skipped);
                }
                if (outcome == CoercionOutcome::Skip) {
                    continue;
                }
                force_null_ = true;
            }
        }
        return static_cast<int>(element);
    }
}

auto StreamingJsonDecoder::absent_element_index(const SerialDescriptor& descriptor) -> int {
    while (absent_cursor_ < seen_.size()) {
        size_t element = absent_cursor_++;
        if (!seen_[element] && absence_is_null(config_, descriptor, element)) {
            WEFT_LOG_TRACE("json", "Absent '" << descriptor.get_element_name(element) << "' of "
                                              << descriptor.serial_name() << " read as null");
            force_null_ = true;
            segment_ = "." + descriptor.get_element_name(element);
            return static_cast<int>(element);
        }
    }
    return DECODE_DONE;
}

auto StreamingJsonDecoder::list_element_index() -> Result<int, SerialError> {
    auto more = next_item(JsonTokenKind::RBracket, "array");
    if (is_err(more)) {
        return unwrap_err(more);
    }
    if (!unwrap(more)) {
        at_end_ = true;
        return DECODE_DONE;
    }
    expect_separator_ = true;
    ++position_;
    segment_ = "[" + std::to_string(position_) + "]";
    return position_;
}

auto StreamingJsonDecoder::map_element_index() -> Result<int, SerialError> {
    if (position_ >= 0 && position_ % 2 == 0) {
        JsonToken colon = lexer_.next_token();
        if (colon.kind != JsonTokenKind::Colon) {
            return token_error(colon, ErrorKind::MalformedInput,
                               std::string("Expected ':' after map key, but had ") +
                                   token_description(colon.kind));
        }
        return ++position_;
    }

    auto more = next_item(JsonTokenKind::RBrace, "object");
    if (is_err(more)) {
        return unwrap_err(more);
    }
    if (!unwrap(more)) {
        at_end_ = true;
        segment_.clear();
        return DECODE_DONE;
    }
    expect_separator_ = true;

    const JsonToken& key = lexer_.peek_token();
    bool bare_key = config_.is_lenient && key.is_value() && key.kind != JsonTokenKind::String;
    if (key.kind != JsonTokenKind::String && !bare_key) {
        return token_error(key, ErrorKind::MalformedInput,
                           std::string("Expected a quoted map key, but had ") +
                               token_description(key.kind));
    }
    segment_ = "." + key.text;
    return ++position_;
}

// ============================================================================
// Primitives
// ============================================================================

auto StreamingJsonDecoder::decode_not_null_mark() -> Result<bool, SerialError> {
    if (force_null_) {
        return false;
    }
    return lexer_.peek_token().kind != JsonTokenKind::Null;
}

auto StreamingJsonDecoder::decode_null() -> Result<bool, SerialError> {
    if (force_null_) {
        return true;
    }
    JsonToken token = lexer_.next_token();
    if (token.kind != JsonTokenKind::Null) {
        return token_error(token, ErrorKind::TypeMismatch,
                           std::string("Expected null, but had ") + token_description(token.kind));
    }
    return true;
}

auto StreamingJsonDecoder::consume_literal(const char* type_name) -> Result<JsonToken, SerialError> {
    JsonToken token = lexer_.next_token();
    switch (token.kind) {
    case JsonTokenKind::String:
    case JsonTokenKind::Number:
    case JsonTokenKind::True:
    case JsonTokenKind::False:
    case JsonTokenKind::Unquoted:
        return token;
    case JsonTokenKind::Null:
        return token_error(token, ErrorKind::TypeMismatch,
                           std::string("Unexpected 'null' literal when non-nullable ") +
                               type_name + " was expected");
    case JsonTokenKind::LBrace:
    case JsonTokenKind::LBracket:
        return token_error(token, ErrorKind::UnexpectedStructure,
                           std::string("Expected ") + type_name + ", but had " +
                               token_description(token.kind));
    default:
        return token_error(token, ErrorKind::MalformedInput,
                           std::string("Expected ") + type_name + ", but had " +
                               token_description(token.kind));
    }
}

auto StreamingJsonDecoder::consume_bounded(int64_t min, int64_t max, const char* type_name)
    -> Result<int64_t, SerialError> {
    auto token = consume_literal(type_name);
    if (is_err(token)) {
        return unwrap_err(token);
    }
    auto value = parse_bounded_integer(unwrap(token).text, min, max, type_name);
    if (is_err(value)) {
        return located(unwrap(token), unwrap_err(value));
    }
    return unwrap(value);
}

auto StreamingJsonDecoder::decode_boolean() -> Result<bool, SerialError> {
    auto token = consume_literal("boolean");
    if (is_err(token)) {
        return unwrap_err(token);
    }
    auto value = parse_boolean(unwrap(token).text, config_.is_lenient);
    if (is_err(value)) {
        return located(unwrap(token), unwrap_err(value));
    }
    return unwrap(value);
}

auto StreamingJsonDecoder::decode_byte() -> Result<int8_t, SerialError> {
    auto value = consume_bounded(std::numeric_limits<int8_t>::min(),
                                 std::numeric_limits<int8_t>::max(), "byte");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int8_t>(unwrap(value));
}

auto StreamingJsonDecoder::decode_short() -> Result<int16_t, SerialError> {
    auto value = consume_bounded(std::numeric_limits<int16_t>::min(),
                                 std::numeric_limits<int16_t>::max(), "short");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int16_t>(unwrap(value));
}

auto StreamingJsonDecoder::decode_int() -> Result<int32_t, SerialError> {
    auto value = consume_bounded(std::numeric_limits<int32_t>::min(),
                                 std::numeric_limits<int32_t>::max(), "int");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int32_t>(unwrap(value));
}

auto StreamingJsonDecoder::decode_long() -> Result<int64_t, SerialError> {
    auto token = consume_literal("long");
    if (is_err(token)) {
        return unwrap_err(token);
    }
    auto value = parse_long(unwrap(token).text);
    if (is_err(value)) {
        return located(unwrap(token), unwrap_err(value));
    }
    return unwrap(value);
}

auto StreamingJsonDecoder::decode_float() -> Result<float, SerialError> {
    auto token = consume_literal("float");
    if (is_err(token)) {
        return unwrap_err(token);
    }
    auto value = parse_double(unwrap(token).text);
    if (is_err(value)) {
        return located(unwrap(token), unwrap_err(value));
    }
    auto result = static_cast<float>(unwrap(value));
    if (!std::isfinite(result) && !config_.allow_special_floating_point_values) {
        return located(unwrap(token), special_float_error(result));
    }
    return result;
}

auto StreamingJsonDecoder::decode_double() -> Result<double, SerialError> {
    auto token = consume_literal("double");
    if (is_err(token)) {
        return unwrap_err(token);
    }
    auto value = parse_double(unwrap(token).text);
    if (is_err(value)) {
        return located(unwrap(token), unwrap_err(value));
    }
    if (!std::isfinite(unwrap(value)) && !config_.allow_special_floating_point_values) {
        return located(unwrap(token), special_float_error(unwrap(value)));
    }
    return unwrap(value);
}

auto StreamingJsonDecoder::decode_char() -> Result<char16_t, SerialError> {
    auto token = consume_literal("char");
    if (is_err(token)) {
        return unwrap_err(token);
    }
    const JsonToken& literal = unwrap(token);
    Result<char16_t, SerialError> value = parse_char(literal.text);
    if (literal.kind == JsonTokenKind::Number) {
        auto number = parse_double(literal.text);
        if (is_err(number)) {
            return located(literal, unwrap_err(number));
        }
        value = code_point_to_char(unwrap(number));
    }
    if (is_err(value)) {
        return located(literal, unwrap_err(value));
    }
    return unwrap(value);
}

auto StreamingJsonDecoder::decode_string() -> Result<std::string, SerialError> {
    auto token = consume_literal("string");
    if (is_err(token)) {
        return unwrap_err(token);
    }
    JsonToken& literal = unwrap(token);
    if (literal.kind != JsonTokenKind::String && !config_.is_lenient) {
        return token_error(literal, ErrorKind::TypeMismatch,
                           "String literal should be quoted. Use 'is_lenient = true' to accept "
                           "non-compliant JSON");
    }
    return std::move(literal.text);
}

auto StreamingJsonDecoder::decode_enum(const SerialDescriptor& enum_descriptor)
    -> Result<size_t, SerialError> {
    const JsonToken start = lexer_.peek_token();
    auto name = decode_string();
    if (is_err(name)) {
        return unwrap_err(name);
    }
    auto index = get_enum_index(config_, enum_descriptor, unwrap(name));
    if (is_err(index)) {
        return located(start, unwrap_err(index));
    }
    return unwrap(index);
}

} // namespace weft::json
