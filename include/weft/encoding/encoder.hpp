//! # Encoder Protocol
//!
//! The push side of the structural protocol, mirroring `Decoder`. Encoders
//! write every element they are given; leaving out elements that hold their
//! default value is the serializer's decision, informed by
//! `should_encode_element_default`.

#pragma once

#include "weft/encoding/serializer.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace weft {

class CompositeEncoder;

/// Encodes a single value.
class Encoder {
public:
    virtual ~Encoder() = default;

    /// Announces that a non-null value of a nullable type follows.
    virtual auto encode_not_null_mark() -> Result<bool, SerialError> {
        return true;
    }

    virtual auto encode_null() -> Result<bool, SerialError> = 0;

    virtual auto encode_boolean(bool value) -> Result<bool, SerialError> = 0;
    virtual auto encode_byte(int8_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_short(int16_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_int(int32_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_long(int64_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_float(float value) -> Result<bool, SerialError> = 0;
    virtual auto encode_double(double value) -> Result<bool, SerialError> = 0;
    virtual auto encode_char(char16_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_string(std::string_view value) -> Result<bool, SerialError> = 0;
    virtual auto encode_enum(const SerialDescriptor& enum_descriptor, size_t index)
        -> Result<bool, SerialError> = 0;

    virtual auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeEncoder>, SerialError> = 0;

    /// Asks the format to write `type_name` as a discriminator inside the next
    /// structure. Returns `false` when the format uses the array shape
    /// `[type, payload]` instead, which the caller then writes itself.
    virtual auto set_polymorphic_discriminator(std::string_view /*type_name*/) -> bool {
        return false;
    }

    template <typename T>
    auto encode_serializable_value(const Serializer<T>& serializer, const T& value)
        -> Result<bool, SerialError> {
        return serializer.serialize(*this, value);
    }

    template <typename T>
    auto encode_nullable_serializable_value(const Serializer<T>& serializer,
                                            const std::optional<T>& value)
        -> Result<bool, SerialError> {
        if (!value) {
            return encode_null();
        }
        auto marked = encode_not_null_mark();
        if (is_err(marked)) {
            return marked;
        }
        return serializer.serialize(*this, *value);
    }
};

/// Encodes the elements of one structure.
class CompositeEncoder {
public:
    virtual ~CompositeEncoder() = default;

    virtual auto encode_boolean_element(const SerialDescriptor& descriptor, size_t index,
                                        bool value) -> Result<bool, SerialError> = 0;
    virtual auto encode_byte_element(const SerialDescriptor& descriptor, size_t index,
                                     int8_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_short_element(const SerialDescriptor& descriptor, size_t index,
                                      int16_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_int_element(const SerialDescriptor& descriptor, size_t index,
                                    int32_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_long_element(const SerialDescriptor& descriptor, size_t index,
                                     int64_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_float_element(const SerialDescriptor& descriptor, size_t index,
                                      float value) -> Result<bool, SerialError> = 0;
    virtual auto encode_double_element(const SerialDescriptor& descriptor, size_t index,
                                       double value) -> Result<bool, SerialError> = 0;
    virtual auto encode_char_element(const SerialDescriptor& descriptor, size_t index,
                                     char16_t value) -> Result<bool, SerialError> = 0;
    virtual auto encode_string_element(const SerialDescriptor& descriptor, size_t index,
                                       std::string_view value) -> Result<bool, SerialError> = 0;

    /// Whether an element that holds its default value should be written.
    virtual auto should_encode_element_default(const SerialDescriptor& /*descriptor*/,
                                               size_t /*index*/) -> bool {
        return true;
    }

    template <typename T>
    auto encode_serializable_element(const SerialDescriptor& descriptor, size_t index,
                                     const Serializer<T>& serializer, const T& value)
        -> Result<bool, SerialError> {
        Encoder& encoder = enter_element(descriptor, index);
        auto result = serializer.serialize(encoder, value);
        leave_element();
        return result;
    }

    template <typename T>
    auto encode_nullable_serializable_element(const SerialDescriptor& descriptor, size_t index,
                                              const Serializer<T>& serializer,
                                              const std::optional<T>& value)
        -> Result<bool, SerialError> {
        if (!value && !writes_null_elements()) {
            return true;
        }
        Encoder& encoder = enter_element(descriptor, index);
        auto result = encoder.encode_nullable_serializable_value(serializer, value);
        leave_element();
        return result;
    }

    virtual auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> = 0;

protected:
    /// Positions an encoder on element `index` for a nested value.
    virtual auto enter_element(const SerialDescriptor& descriptor, size_t index) -> Encoder& = 0;

    virtual void leave_element() {}

    /// `false` if null elements are left out of the output entirely.
    [[nodiscard]] virtual auto writes_null_elements() const -> bool {
        return true;
    }
};

} // namespace weft
