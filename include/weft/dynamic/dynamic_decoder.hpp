//! # Dynamic Decoder
//!
//! Decodes a `DynamicValue` graph through the structural protocol, with the
//! naming, coercion and null policies of a `Json` instance.
//!
//! | Source | Decoder | Tags |
//! |--------|---------|------|
//! | Mapping read as a class | `DynamicInput` | element names through the naming policy |
//! | Mapping read as a map | `DynamicMapInput` | each key, used for the key and its value |
//! | Sequence | `DynamicListInput` | positions; holes are skipped |
//! | Scalar root | `PrimitiveDynamicInput` | the synthetic tag `primitive` |
//!
//! Presence is a key lookup: an undefined entry is absent, a null entry is
//! present and null. Numbers are doubles; integer targets require integral
//! values in range, and `long` also the safe-integer bound.
//!
//! Mapping keys are always strings on the host side, so a map decoder
//! converts a key to the requested primitive type from its text:
//!
//! ```cpp
//! // {"1": 2} decodes as map<int, int>; {"x": 2} fails with TypeMismatch
//! ```

#pragma once

#include "weft/dynamic/dynamic_value.hpp"
#include "weft/encoding/tagged_decoder.hpp"
#include "weft/json/json.hpp"
#include "weft/json/json_names.hpp"

#include <string>
#include <vector>

namespace weft::dynamic {

class DynamicInput : public TaggedDecoder, public json::JsonDecoder {
public:
    /// * `polymorphic_discriminator` - Key excluded from the unknown-key check
    DynamicInput(const json::JsonConfiguration& config, const DynamicValue& value,
                 std::string path_prefix, Rc<const json::NamesMap> names = nullptr,
                 std::string polymorphic_discriminator = {});

    [[nodiscard]] auto configuration() const -> const json::JsonConfiguration& override {
        return config_;
    }

    auto decode_json_element() -> Result<json::JsonValue, SerialError> override;

    auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeDecoder>, SerialError> override;

    auto begin_polymorphic(const DescriptorPtr& base_descriptor)
        -> Result<std::optional<PolymorphicInput>, SerialError> override;

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

    /// Fails on keys of a class mapping that match no element, unless
    /// `ignore_unknown_keys` is set. Undefined entries are not keys.
    auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> override;

protected:
    /// Value under `tag`, or nullptr if undefined.
    [[nodiscard]] virtual auto by_tag(const std::string& tag) const -> const DynamicValue*;

    /// The number under `tag`.
    virtual auto number_at(const std::string& tag, const char* type_name)
        -> Result<double, SerialError>;

    auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string override;

    auto decode_tagged_not_null_mark(const std::string& tag) -> Result<bool, SerialError> override;
    auto decode_tagged_boolean(const std::string& tag) -> Result<bool, SerialError> override;
    auto decode_tagged_byte(const std::string& tag) -> Result<int8_t, SerialError> override;
    auto decode_tagged_short(const std::string& tag) -> Result<int16_t, SerialError> override;
    auto decode_tagged_int(const std::string& tag) -> Result<int32_t, SerialError> override;
    auto decode_tagged_long(const std::string& tag) -> Result<int64_t, SerialError> override;
    auto decode_tagged_float(const std::string& tag) -> Result<float, SerialError> override;
    auto decode_tagged_double(const std::string& tag) -> Result<double, SerialError> override;
    auto decode_tagged_char(const std::string& tag) -> Result<char16_t, SerialError> override;
    auto decode_tagged_string(const std::string& tag) -> Result<std::string, SerialError> override;
    auto decode_tagged_enum(const std::string& tag, const SerialDescriptor& enum_descriptor)
        -> Result<size_t, SerialError> override;

    /// The value under `tag`, failing if it is undefined or null.
    auto defined_at(const std::string& tag, const char* type_name)
        -> Result<const DynamicValue*, SerialError>;

    [[nodiscard]] auto value() const -> const DynamicValue& {
        return value_;
    }

    /// The whole value as a JSON tree; nested values go through fresh decoders.
    auto convert_value() -> Result<json::JsonValue, SerialError>;

private:
    auto bounded_at(const std::string& tag, int64_t min, int64_t max, const char* type_name)
        -> Result<int64_t, SerialError>;

    const json::JsonConfiguration& config_;
    const DynamicValue& value_;
    Rc<const json::NamesMap> names_;
    std::string polymorphic_discriminator_;
    std::vector<std::string> object_keys_;
    size_t position_ = 0;
    bool force_null_ = false;
};

/// Mappings read as maps: entry `k` is element `2k` (its key) followed by
/// element `2k + 1` (its value). Undefined entries are skipped.
class DynamicMapInput final : public DynamicInput {
public:
    DynamicMapInput(const json::JsonConfiguration& config, const DynamicValue& value,
                    std::string path_prefix);

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

protected:
    [[nodiscard]] auto by_tag(const std::string& tag) const -> const DynamicValue* override;

    auto number_at(const std::string& tag, const char* type_name)
        -> Result<double, SerialError> override;

    auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string override;

    auto decode_tagged_boolean(const std::string& tag) -> Result<bool, SerialError> override;
    auto decode_tagged_byte(const std::string& tag) -> Result<int8_t, SerialError> override;
    auto decode_tagged_short(const std::string& tag) -> Result<int16_t, SerialError> override;
    auto decode_tagged_int(const std::string& tag) -> Result<int32_t, SerialError> override;

private:
    [[nodiscard]] auto is_key() const -> bool {
        return cursor_ >= 0 && cursor_ % 2 == 0;
    }

    /// Keys of byte, short and int maps must be integer literals; "1.0" and
    /// "1e0" are rejected.
    auto integer_key(const std::string& tag, int64_t min, int64_t max, const char* type_name)
        -> Result<int64_t, SerialError>;

    [[nodiscard]] auto illegal_key_type(const std::string& tag, const char* type_name) const
        -> SerialError;

    std::vector<std::string> keys_;
    std::vector<NativeValue> key_values_;
    int cursor_ = -1;
};

/// Sequences, addressed by position.
class DynamicListInput final : public DynamicInput {
public:
    DynamicListInput(const json::JsonConfiguration& config, const DynamicValue& value,
                     std::string path_prefix);

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

    auto decode_json_element() -> Result<json::JsonValue, SerialError> override;

protected:
    [[nodiscard]] auto by_tag(const std::string& tag) const -> const DynamicValue* override;

    auto element_name(const SerialDescriptor& /*descriptor*/, size_t index) -> std::string override {
        return std::to_string(index);
    }

    [[nodiscard]] auto render_segment(const std::string& tag) const -> std::string override {
        return "[" + tag + "]";
    }

private:
    int cursor_ = -1;
};

/// A scalar or null root value.
class PrimitiveDynamicInput final : public DynamicInput {
public:
    static constexpr const char* PRIMITIVE_TAG = "primitive";

    PrimitiveDynamicInput(const json::JsonConfiguration& config, const DynamicValue& value,
                          std::string path_prefix);

    auto decode_element_index(const SerialDescriptor& /*descriptor*/)
        -> Result<int, SerialError> override {
        return DECODE_DONE;
    }

    auto decode_json_element() -> Result<json::JsonValue, SerialError> override;

protected:
    [[nodiscard]] auto by_tag(const std::string& tag) const -> const DynamicValue* override {
        return tag == PRIMITIVE_TAG ? &value() : nullptr;
    }

    [[nodiscard]] auto render_segment(const std::string& tag) const -> std::string override {
        return tag == PRIMITIVE_TAG ? std::string() : "." + tag;
    }
};

/// Creates the root decoder for `value`.
[[nodiscard]] auto make_dynamic_decoder(const json::JsonConfiguration& config,
                                        const DynamicValue& value, std::string path_prefix = "$")
    -> Box<DynamicInput>;

/// Decodes a `T` from `value` with the configuration of `json`.
///
/// # Example
///
/// ```cpp
/// auto point = NativeValue::mapping();
/// point.set("x", NativeValue::number(1));
/// point.set("y", NativeValue::number(2));
/// auto decoded = decode_from_dynamic(Json::default_instance(), PointSerializer{}, point);
/// ```
template <typename T>
auto decode_from_dynamic(const json::Json& json, const Serializer<T>& serializer,
                         const DynamicValue& value) -> Result<T, SerialError> {
    auto decoder = make_dynamic_decoder(json.configuration(), value);
    return decoder->decode_serializable_value(serializer);
}

} // namespace weft::dynamic
