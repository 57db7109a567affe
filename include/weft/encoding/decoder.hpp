//! # Decoder Protocol
//!
//! The pull side of the structural protocol. A serializer asks a `Decoder`
//! for a primitive, or opens a structure with `begin_structure` and then pulls
//! elements from the returned `CompositeDecoder`:
//!
//! ```cpp
//! auto opened = decoder.begin_structure(desc);
//! auto& in = *unwrap(opened);
//! while (true) {
//!     auto index = in.decode_element_index(*desc);
//!     if (unwrap(index) == CompositeDecoder::DECODE_DONE) break;
//!     // decode element unwrap(index)
//! }
//! in.end_structure(*desc);
//! ```
//!
//! Every `begin_structure` call returns a new composite decoder that owns its
//! own cursor, so decoding sibling structures never shares state.

#pragma once

#include "weft/encoding/serializer.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace weft {

class CompositeDecoder;

/// A polymorphic value split by the format into its subtype name and a
/// decoder positioned on the subtype's payload.
struct PolymorphicInput {
    /// Owns whatever the payload decoder reads from. Declared first so that it
    /// outlives `payload`.
    Rc<const void> keep_alive;
    std::string type_name;
    Box<Decoder> payload;
};

/// Decodes a single value.
class Decoder {
public:
    virtual ~Decoder() = default;

    /// Returns `false` if the next value is null.
    virtual auto decode_not_null_mark() -> Result<bool, SerialError> = 0;

    /// Consumes a null value.
    virtual auto decode_null() -> Result<bool, SerialError> = 0;

    virtual auto decode_boolean() -> Result<bool, SerialError> = 0;
    virtual auto decode_byte() -> Result<int8_t, SerialError> = 0;
    virtual auto decode_short() -> Result<int16_t, SerialError> = 0;
    virtual auto decode_int() -> Result<int32_t, SerialError> = 0;
    virtual auto decode_long() -> Result<int64_t, SerialError> = 0;
    virtual auto decode_float() -> Result<float, SerialError> = 0;
    virtual auto decode_double() -> Result<double, SerialError> = 0;
    virtual auto decode_char() -> Result<char16_t, SerialError> = 0;
    virtual auto decode_string() -> Result<std::string, SerialError> = 0;

    /// Returns the index of the enum entry named by the input.
    virtual auto decode_enum(const SerialDescriptor& enum_descriptor)
        -> Result<size_t, SerialError> = 0;

    virtual auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeDecoder>, SerialError> = 0;

    /// Lets a format read object-shaped polymorphic values.
    ///
    /// Returns `std::nullopt` when the format uses the array shape
    /// `[type, payload]`, which is decoded as a regular two-element structure.
    virtual auto begin_polymorphic(const DescriptorPtr& /*base_descriptor*/)
        -> Result<std::optional<PolymorphicInput>, SerialError> {
        return std::optional<PolymorphicInput>{};
    }

    template <typename T>
    auto decode_serializable_value(const Serializer<T>& serializer) -> Result<T, SerialError> {
        return serializer.deserialize(*this);
    }

    template <typename T>
    auto decode_nullable_serializable_value(const Serializer<T>& serializer)
        -> Result<std::optional<T>, SerialError> {
        auto not_null = decode_not_null_mark();
        if (is_err(not_null)) {
            return unwrap_err(not_null);
        }
        if (!unwrap(not_null)) {
            auto consumed = decode_null();
            if (is_err(consumed)) {
                return unwrap_err(consumed);
            }
            return std::optional<T>{};
        }
        auto value = serializer.deserialize(*this);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        return std::optional<T>(std::move(unwrap(value)));
    }
};

/// Decodes the elements of one structure.
class CompositeDecoder {
public:
    /// Returned by `decode_element_index` once no element remains.
    static constexpr int DECODE_DONE = -1;

    virtual ~CompositeDecoder() = default;

    /// Returns the index of the next element present in the input, or `DECODE_DONE`.
    virtual auto decode_element_index(const SerialDescriptor& descriptor)
        -> Result<int, SerialError> = 0;

    /// Number of elements of a collection, or -1 when unknown up front.
    virtual auto decode_collection_size(const SerialDescriptor& /*descriptor*/) -> int {
        return -1;
    }

    virtual auto decode_boolean_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<bool, SerialError> = 0;
    virtual auto decode_byte_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int8_t, SerialError> = 0;
    virtual auto decode_short_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int16_t, SerialError> = 0;
    virtual auto decode_int_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int32_t, SerialError> = 0;
    virtual auto decode_long_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int64_t, SerialError> = 0;
    virtual auto decode_float_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<float, SerialError> = 0;
    virtual auto decode_double_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<double, SerialError> = 0;
    virtual auto decode_char_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<char16_t, SerialError> = 0;
    virtual auto decode_string_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<std::string, SerialError> = 0;

    template <typename T>
    auto decode_serializable_element(const SerialDescriptor& descriptor, size_t index,
                                     const Serializer<T>& serializer) -> Result<T, SerialError> {
        Decoder& decoder = enter_element(descriptor, index);
        auto result = serializer.deserialize(decoder);
        leave_element();
        return result;
    }

    template <typename T>
    auto decode_nullable_serializable_element(const SerialDescriptor& descriptor, size_t index,
                                              const Serializer<T>& serializer)
        -> Result<std::optional<T>, SerialError> {
        Decoder& decoder = enter_element(descriptor, index);
        auto result = decoder.decode_nullable_serializable_value(serializer);
        leave_element();
        return result;
    }

    virtual auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> = 0;

protected:
    /// Positions a decoder on element `index` for a nested value.
    virtual auto enter_element(const SerialDescriptor& descriptor, size_t index) -> Decoder& = 0;

    /// Called after the nested value of `enter_element` was decoded.
    virtual void leave_element() {}
};

} // namespace weft
