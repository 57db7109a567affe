//! # Streaming JSON Encoder
//!
//! Writes JSON text directly through a `JsonWriter`. Every structure gets its
//! own encoder sharing the writer, in one of three modes:
//!
//! | Mode | Output |
//! |------|--------|
//! | `Obj` | `{"name": value, ...}` with names from the naming policy |
//! | `List` | `[value, ...]` |
//! | `Map` | `{"key": value, ...}`; keys are primitives written as strings |
//!
//! Object polymorphism writes the class discriminator as the first key of
//! the subclass's object. With `explicit_nulls` off, null elements of
//! objects are left out; list and map entries are always written.

#pragma once

#include "weft/encoding/encoder.hpp"
#include "weft/json/json_element.hpp"
#include "weft/json/json_writer.hpp"

#include <optional>
#include <string>

namespace weft::json {

class StreamingJsonEncoder final : public Encoder, public CompositeEncoder, public JsonEncoder {
public:
    enum class Mode { Obj, List, Map };

    StreamingJsonEncoder(const JsonConfiguration& config, JsonWriter& writer, Mode mode)
        : config_(config), writer_(writer), mode_(mode) {}

    [[nodiscard]] auto configuration() const -> const JsonConfiguration& override {
        return config_;
    }

    // ========================================================================
    // Encoder
    // ========================================================================

    auto encode_null() -> Result<bool, SerialError> override;
    auto encode_boolean(bool value) -> Result<bool, SerialError> override;
    auto encode_byte(int8_t value) -> Result<bool, SerialError> override;
    auto encode_short(int16_t value) -> Result<bool, SerialError> override;
    auto encode_int(int32_t value) -> Result<bool, SerialError> override;
    auto encode_long(int64_t value) -> Result<bool, SerialError> override;
    auto encode_float(float value) -> Result<bool, SerialError> override;
    auto encode_double(double value) -> Result<bool, SerialError> override;
    auto encode_char(char16_t value) -> Result<bool, SerialError> override;
    auto encode_string(std::string_view value) -> Result<bool, SerialError> override;
    auto encode_enum(const SerialDescriptor& enum_descriptor, size_t index)
        -> Result<bool, SerialError> override;

    auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeEncoder>, SerialError> override;

    auto set_polymorphic_discriminator(std::string_view type_name) -> bool override;

    auto encode_json_element(const JsonValue& element) -> Result<bool, SerialError> override;

    // ========================================================================
    // CompositeEncoder
    // ========================================================================

    auto encode_boolean_element(const SerialDescriptor& descriptor, size_t index, bool value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_boolean(value);
    }
    auto encode_byte_element(const SerialDescriptor& descriptor, size_t index, int8_t value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_byte(value);
    }
    auto encode_short_element(const SerialDescriptor& descriptor, size_t index, int16_t value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_short(value);
    }
    auto encode_int_element(const SerialDescriptor& descriptor, size_t index, int32_t value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_int(value);
    }
    auto encode_long_element(const SerialDescriptor& descriptor, size_t index, int64_t value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_long(value);
    }
    auto encode_float_element(const SerialDescriptor& descriptor, size_t index, float value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_float(value);
    }
    auto encode_double_element(const SerialDescriptor& descriptor, size_t index, double value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_double(value);
    }
    auto encode_char_element(const SerialDescriptor& descriptor, size_t index, char16_t value)
        -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_char(value);
    }
    auto encode_string_element(const SerialDescriptor& descriptor, size_t index,
                               std::string_view value) -> Result<bool, SerialError> override {
        encode_element(descriptor, index);
        return encode_string(value);
    }

    auto should_encode_element_default(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> bool override {
        return config_.encode_defaults;
    }

    auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> override;

protected:
    auto enter_element(const SerialDescriptor& descriptor, size_t index) -> Encoder& override {
        encode_element(descriptor, index);
        return *this;
    }

    [[nodiscard]] auto writes_null_elements() const -> bool override {
        return mode_ != Mode::Obj || config_.explicit_nulls;
    }

private:
    /// Writes the separator and key that precede element `index`.
    void encode_element(const SerialDescriptor& descriptor, size_t index);

    /// Writes the discriminator as the first key of a new object.
    void write_discriminator(const std::string& type_name);

    /// Writes an unquoted literal; map keys are quoted.
    auto print_literal(std::string_view text) -> Result<bool, SerialError>;

    [[nodiscard]] auto primitive_discriminator_error() const -> SerialError;

    const JsonConfiguration& config_;
    JsonWriter& writer_;
    Mode mode_;
    size_t count_ = 0;
    bool key_mode_ = false;
    std::optional<std::string> pending_discriminator_;
};

/// Encodes `value` as JSON text.
template <typename T>
auto encode_json_text(const JsonConfiguration& config, const Serializer<T>& serializer,
                      const T& value) -> Result<std::string, SerialError> {
    JsonWriter writer(config.pretty_print, config.pretty_print_indent,
                      config.allow_special_floating_point_values);
    StreamingJsonEncoder encoder(config, writer, StreamingJsonEncoder::Mode::Obj);
    auto written = encoder.encode_serializable_value(serializer, value);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return writer.take();
}

} // namespace weft::json
