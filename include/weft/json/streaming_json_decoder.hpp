//! # Streaming JSON Decoder
//!
//! Decodes JSON text directly from the token stream, without building a
//! tree. Every structure gets its own decoder sharing the lexer; the decoder
//! is in one of three modes:
//!
//! | Mode | Input | Element indices |
//! |------|-------|-----------------|
//! | `Obj` | `{"key": value, ...}` | resolved from each key through the naming policy |
//! | `List` | `[value, ...]` | positions |
//! | `Map` | `{"key": value, ...}` | `2k` for the key, `2k + 1` for the value |
//!
//! Object-shaped polymorphic values are the exception: the object is
//! materialized as a `JsonValue` so that the discriminator can be read
//! wherever it appears, and the payload is decoded from that tree.
//!
//! ## Object Keys
//!
//! - Unknown keys are skipped value-wise, or rejected with `UnknownKey` when
//!   `ignore_unknown_keys` is off.
//! - A repeated key is decoded again; the serializer sees both values in
//!   source order.
//! - Once the object ends, every nullable required element not seen is
//!   reported as present and null when `explicit_nulls` is off.

#pragma once

#include "weft/encoding/decoder.hpp"
#include "weft/json/json_element.hpp"
#include "weft/json/json_lexer.hpp"
#include "weft/json/json_names.hpp"
#include "weft/json/json_parser.hpp"

#include <string>
#include <vector>

namespace weft::json {

class StreamingJsonDecoder final : public Decoder, public CompositeDecoder, public JsonDecoder {
public:
    enum class Mode { Obj, List, Map };

    /// Nesting limit shared with the tree parser.
    static constexpr size_t MAX_DEPTH = JsonParser::MAX_DEPTH;

    StreamingJsonDecoder(const JsonConfiguration& config, JsonLexer& lexer, Mode mode,
                         std::string path_prefix, size_t depth, Rc<const NamesMap> names = nullptr);

    [[nodiscard]] auto configuration() const -> const JsonConfiguration& override {
        return config_;
    }

    // ========================================================================
    // Decoder
    // ========================================================================

    auto decode_not_null_mark() -> Result<bool, SerialError> override;
    auto decode_null() -> Result<bool, SerialError> override;
    auto decode_boolean() -> Result<bool, SerialError> override;
    auto decode_byte() -> Result<int8_t, SerialError> override;
    auto decode_short() -> Result<int16_t, SerialError> override;
    auto decode_int() -> Result<int32_t, SerialError> override;
    auto decode_long() -> Result<int64_t, SerialError> override;
    auto decode_float() -> Result<float, SerialError> override;
    auto decode_double() -> Result<double, SerialError> override;
    auto decode_char() -> Result<char16_t, SerialError> override;
    auto decode_string() -> Result<std::string, SerialError> override;
    auto decode_enum(const SerialDescriptor& enum_descriptor)
        -> Result<size_t, SerialError> override;

    auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeDecoder>, SerialError> override;

    auto begin_polymorphic(const DescriptorPtr& base_descriptor)
        -> Result<std::optional<PolymorphicInput>, SerialError> override;

    auto decode_json_element() -> Result<JsonValue, SerialError> override;

    // ========================================================================
    // CompositeDecoder
    // ========================================================================

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

    auto decode_boolean_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<bool, SerialError> override {
        return decode_boolean();
    }
    auto decode_byte_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<int8_t, SerialError> override {
        return decode_byte();
    }
    auto decode_short_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<int16_t, SerialError> override {
        return decode_short();
    }
    auto decode_int_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<int32_t, SerialError> override {
        return decode_int();
    }
    auto decode_long_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<int64_t, SerialError> override {
        return decode_long();
    }
    auto decode_float_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<float, SerialError> override {
        return decode_float();
    }
    auto decode_double_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<double, SerialError> override {
        return decode_double();
    }
    auto decode_char_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<char16_t, SerialError> override {
        return decode_char();
    }
    auto decode_string_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Result<std::string, SerialError> override {
        return decode_string();
    }

    auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> override;

    /// Requires that nothing but whitespace follows the decoded value.
    auto expect_end_of_input() -> Result<bool, SerialError>;

    /// Path of the element being decoded, e.g. `$.items[2]`.
    [[nodiscard]] auto current_path() const -> std::string;

protected:
    auto enter_element(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> Decoder& override {
        return *this;
    }

private:
    auto object_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError>;
    auto list_element_index() -> Result<int, SerialError>;
    auto map_element_index() -> Result<int, SerialError>;

    /// After the closing token was seen: the next absent element read as null.
    auto absent_element_index(const SerialDescriptor& descriptor) -> int;

    /// Consumes `,` between items. Returns false at the closing token.
    auto next_item(JsonTokenKind closing, const char* structure) -> Result<bool, SerialError>;

    /// Consumes a literal token for a primitive of `type_name`.
    auto consume_literal(const char* type_name) -> Result<JsonToken, SerialError>;

    auto consume_bounded(int64_t min, int64_t max, const char* type_name)
        -> Result<int64_t, SerialError>;

    [[nodiscard]] auto token_error(const JsonToken& token, ErrorKind kind,
                                   const std::string& message) const -> SerialError;

    /// Places a conversion error at `token`.
    [[nodiscard]] auto located(const JsonToken& token, const SerialError& error) const
        -> SerialError {
        return token_error(token, error.kind, error.message);
    }

    const JsonConfiguration& config_;
    JsonLexer& lexer_;
    Mode mode_;
    std::string path_prefix_;
    size_t depth_;
    Rc<const NamesMap> names_;

    std::string segment_;
    int position_ = -1;
    bool expect_separator_ = false;
    bool at_end_ = false;
    bool force_null_ = false;
    std::vector<bool> seen_;
    size_t absent_cursor_ = 0;
};

/// Decodes a `T` from JSON text.
template <typename T>
auto decode_json_text(const JsonConfiguration& config, const Serializer<T>& serializer,
                      std::string_view text) -> Result<T, SerialError> {
    auto lexer = make_lexer(text, config);
    StreamingJsonDecoder decoder(config, *lexer, StreamingJsonDecoder::Mode::Obj, "$", 0);
    auto value = decoder.decode_serializable_value(serializer);
    if (is_err(value)) {
        return value;
    }
    auto ended = decoder.expect_end_of_input();
    if (is_err(ended)) {
        return unwrap_err(ended);
    }
    return value;
}

} // namespace weft::json
