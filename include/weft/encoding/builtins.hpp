//! # Builtin Serializers
//!
//! Serializers for primitives, strings and the standard containers.
//! Container serializers hold their element serializers by value, so they
//! compose without lifetime concerns:
//!
//! ```cpp
//! ListSerializer ints{IntSerializer{}};
//! MapSerializer table{StringSerializer{}, NullableSerializer{ints}};
//! // Serializer<std::map<std::string, std::optional<std::vector<int32_t>>>>
//! ```

#pragma once

#include "weft/descriptor/descriptors.hpp"
#include "weft/encoding/decoder.hpp"
#include "weft/encoding/encoder.hpp"

#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace weft {

// ============================================================================
// Primitive Serializers
// ============================================================================

class BooleanSerializer final : public Serializer<bool> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const bool& value) const -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<bool, SerialError> override;
};

class ByteSerializer final : public Serializer<int8_t> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const int8_t& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<int8_t, SerialError> override;
};

class ShortSerializer final : public Serializer<int16_t> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const int16_t& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<int16_t, SerialError> override;
};

class IntSerializer final : public Serializer<int32_t> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const int32_t& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<int32_t, SerialError> override;
};

class LongSerializer final : public Serializer<int64_t> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const int64_t& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<int64_t, SerialError> override;
};

class FloatSerializer final : public Serializer<float> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const float& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<float, SerialError> override;
};

class DoubleSerializer final : public Serializer<double> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const double& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<double, SerialError> override;
};

/// UTF-16 code unit.
class CharSerializer final : public Serializer<char16_t> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const char16_t& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<char16_t, SerialError> override;
};

class StringSerializer final : public Serializer<std::string> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override;
    auto serialize(Encoder& encoder, const std::string& value) const
        -> Result<bool, SerialError> override;
    auto deserialize(Decoder& decoder) const -> Result<std::string, SerialError> override;
};

// ============================================================================
// Nullable
// ============================================================================

/// `std::optional<T>` over the serializer `S` of `T`.
template <typename S>
class NullableSerializer final : public Serializer<std::optional<typename S::ValueType>> {
public:
    using Inner = typename S::ValueType;

    explicit NullableSerializer(S inner)
        : inner_(std::move(inner)), descriptor_(nullable(inner_.descriptor())) {}

    [[nodiscard]] auto descriptor() const -> DescriptorPtr override {
        return descriptor_;
    }

    auto serialize(Encoder& encoder, const std::optional<Inner>& value) const
        -> Result<bool, SerialError> override {
        return encoder.encode_nullable_serializable_value(inner_, value);
    }

    auto deserialize(Decoder& decoder) const -> Result<std::optional<Inner>, SerialError> override {
        return decoder.decode_nullable_serializable_value(inner_);
    }

private:
    S inner_;
    DescriptorPtr descriptor_;
};

// ============================================================================
// Collections
// ============================================================================

/// `std::vector<T>` as a List. Elements are appended in the order the decoder
/// reports them, so inputs with holes decode to a compacted vector.
template <typename S>
class ListSerializer final : public Serializer<std::vector<typename S::ValueType>> {
public:
    using Element = typename S::ValueType;

    explicit ListSerializer(S element, std::string serial_name = "vector")
        : element_(std::move(element)),
          descriptor_(list_descriptor(std::move(serial_name), element_.descriptor())) {}

    [[nodiscard]] auto descriptor() const -> DescriptorPtr override {
        return descriptor_;
    }

    auto serialize(Encoder& encoder, const std::vector<Element>& value) const
        -> Result<bool, SerialError> override {
        auto opened = encoder.begin_structure(descriptor_);
        if (is_err(opened)) {
            return unwrap_err(opened);
        }
        auto& out = *unwrap(opened);
        for (size_t i = 0; i < value.size(); ++i) {
            auto written = out.encode_serializable_element(*descriptor_, i, element_, value[i]);
            if (is_err(written)) {
                return written;
            }
        }
        return out.end_structure(*descriptor_);
    }

    auto deserialize(Decoder& decoder) const -> Result<std::vector<Element>, SerialError> override {
        auto opened = decoder.begin_structure(descriptor_);
        if (is_err(opened)) {
            return unwrap_err(opened);
        }
        auto& in = *unwrap(opened);
        std::vector<Element> result;
        if (int size = in.decode_collection_size(*descriptor_); size > 0) {
            result.reserve(static_cast<size_t>(size));
        }
        while (true) {
            auto index = in.decode_element_index(*descriptor_);
            if (is_err(index)) {
                return unwrap_err(index);
            }
            if (unwrap(index) == CompositeDecoder::DECODE_DONE) {
                break;
            }
            auto element = in.decode_serializable_element(
                *descriptor_, static_cast<size_t>(unwrap(index)), element_);
            if (is_err(element)) {
                return unwrap_err(element);
            }
            result.push_back(std::move(unwrap(element)));
        }
        auto ended = in.end_structure(*descriptor_);
        if (is_err(ended)) {
            return unwrap_err(ended);
        }
        return result;
    }

private:
    S element_;
    DescriptorPtr descriptor_;
};

/// `std::map<K, V>` as a Map: entry `k` is written as element `2k` (key)
/// followed by element `2k + 1` (value). A repeated key keeps the last value.
template <typename KS, typename VS>
class MapSerializer final
    : public Serializer<std::map<typename KS::ValueType, typename VS::ValueType>> {
public:
    using Key = typename KS::ValueType;
    using Value = typename VS::ValueType;

    MapSerializer(KS key, VS value, std::string serial_name = "map")
        : key_(std::move(key)), value_(std::move(value)),
          descriptor_(map_descriptor(std::move(serial_name), key_.descriptor(),
                                     value_.descriptor())) {}

    [[nodiscard]] auto descriptor() const -> DescriptorPtr override {
        return descriptor_;
    }

    auto serialize(Encoder& encoder, const std::map<Key, Value>& value) const
        -> Result<bool, SerialError> override {
        auto opened = encoder.begin_structure(descriptor_);
        if (is_err(opened)) {
            return unwrap_err(opened);
        }
        auto& out = *unwrap(opened);
        size_t index = 0;
        for (const auto& [k, v] : value) {
            auto key = out.encode_serializable_element(*descriptor_, index++, key_, k);
            if (is_err(key)) {
                return key;
            }
            auto written = out.encode_serializable_element(*descriptor_, index++, value_, v);
            if (is_err(written)) {
                return written;
            }
        }
        return out.end_structure(*descriptor_);
    }

    auto deserialize(Decoder& decoder) const -> Result<std::map<Key, Value>, SerialError> override {
        auto opened = decoder.begin_structure(descriptor_);
        if (is_err(opened)) {
            return unwrap_err(opened);
        }
        auto& in = *unwrap(opened);
        std::map<Key, Value> result;
        while (true) {
            auto index = in.decode_element_index(*descriptor_);
            if (is_err(index)) {
                return unwrap_err(index);
            }
            int key_index = unwrap(index);
            if (key_index == CompositeDecoder::DECODE_DONE) {
                break;
            }
            auto key = in.decode_serializable_element(*descriptor_,
                                                      static_cast<size_t>(key_index), key_);
            if (is_err(key)) {
                return unwrap_err(key);
            }
            auto value_index = in.decode_element_index(*descriptor_);
            if (is_err(value_index)) {
                return unwrap_err(value_index);
            }
            if (unwrap(value_index) != key_index + 1) {
                return SerialError::make(ErrorKind::UnexpectedStructure,
                                         "Value must follow key in a map, index for key: " +
                                             std::to_string(key_index) + ", returned index for value: " +
                                             std::to_string(unwrap(value_index)));
            }
            auto value = in.decode_serializable_element(
                *descriptor_, static_cast<size_t>(key_index + 1), value_);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            result.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));
        }
        auto ended = in.end_structure(*descriptor_);
        if (is_err(ended)) {
            return unwrap_err(ended);
        }
        return result;
    }

private:
    KS key_;
    VS value_;
    DescriptorPtr descriptor_;
};

// ============================================================================
// Enums
// ============================================================================

/// A C++ enum serialized by entry name.
///
/// # Example
///
/// ```cpp
/// enum class Color { Red, Green };
/// EnumSerializer<Color> colors("app.Color", {{"RED", Color::Red}, {"GREEN", Color::Green}});
/// ```
///
/// # Panics
///
/// Throws `std::invalid_argument` if the descriptor cannot be built (blank or
/// duplicate names), or if the descriptor and value list disagree in size.
template <typename E> class EnumSerializer final : public Serializer<E> {
public:
    EnumSerializer(std::string serial_name, const std::vector<std::pair<std::string, E>>& entries) {
        std::vector<std::string> names;
        for (const auto& [name, value] : entries) {
            names.push_back(name);
            values_.push_back(value);
        }
        auto built = enum_descriptor(std::move(serial_name), names);
        if (is_err(built)) {
            throw std::invalid_argument(unwrap_err(built).message);
        }
        descriptor_ = std::move(unwrap(built));
    }

    /// Uses a prebuilt Enum descriptor, e.g. one with alternative entry names.
    EnumSerializer(DescriptorPtr descriptor, std::vector<E> values)
        : descriptor_(std::move(descriptor)), values_(std::move(values)) {
        if (descriptor_->kind() != SerialKind::Enum ||
            descriptor_->elements_count() != values_.size()) {
            throw std::invalid_argument("Enum descriptor '" + descriptor_->serial_name() +
                                        "' does not match its value list");
        }
    }

    [[nodiscard]] auto descriptor() const -> DescriptorPtr override {
        return descriptor_;
    }

    auto serialize(Encoder& encoder, const E& value) const -> Result<bool, SerialError> override {
        for (size_t i = 0; i < values_.size(); ++i) {
            if (values_[i] == value) {
                return encoder.encode_enum(*descriptor_, i);
            }
        }
        return SerialError::make(ErrorKind::InvalidValue,
                                 "Value is not an entry of enum '" + descriptor_->serial_name() +
                                     "'");
    }

    auto deserialize(Decoder& decoder) const -> Result<E, SerialError> override {
        auto index = decoder.decode_enum(*descriptor_);
        if (is_err(index)) {
            return unwrap_err(index);
        }
        return values_.at(unwrap(index));
    }

private:
    DescriptorPtr descriptor_;
    std::vector<E> values_;
};

} // namespace weft
