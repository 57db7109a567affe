//! # JSON Tree Decoder
//!
//! Decodes a `JsonValue` tree through the structural protocol. Each
//! `begin_structure` opens a decoder matching the requested kind:
//!
//! | Descriptor kind | Decoder | Tags |
//! |-----------------|---------|------|
//! | List (and array polymorphism) | `JsonTreeListDecoder` | `"0"`, `"1"`, ... |
//! | Map | `JsonTreeMapDecoder` | the object's keys, each used for key and value |
//! | anything else | `JsonTreeDecoder` | element names resolved through the naming policy |
//!
//! A scalar root is decoded by `JsonTreePrimitiveDecoder`, a one-element
//! structure addressed by the synthetic tag `primitive`.
//!
//! The decoders borrow the tree; it must outlive them.

#pragma once

#include "weft/encoding/tagged_decoder.hpp"
#include "weft/json/json_element.hpp"
#include "weft/json/json_names.hpp"

#include <string>

namespace weft::json {

/// Shared primitive decoding and structure dispatch of the tree decoders.
class AbstractJsonTreeDecoder : public TaggedDecoder, public JsonDecoder {
public:
    AbstractJsonTreeDecoder(const JsonConfiguration& config, const JsonValue& value,
                            std::string path_prefix, std::string polymorphic_discriminator = {});

    [[nodiscard]] auto configuration() const -> const JsonConfiguration& override {
        return config_;
    }

    auto decode_json_element() -> Result<JsonValue, SerialError> override;

    auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeDecoder>, SerialError> override;

    auto begin_polymorphic(const DescriptorPtr& base_descriptor)
        -> Result<std::optional<PolymorphicInput>, SerialError> override;

protected:
    /// Value stored under `tag`, or nullptr if the source has none.
    [[nodiscard]] virtual auto current_element(const std::string& tag) const
        -> const JsonValue* = 0;

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

    [[nodiscard]] auto value() const -> const JsonValue& {
        return value_;
    }

    /// Discriminator key of the polymorphic object this decoder reads, or empty.
    [[nodiscard]] auto polymorphic_discriminator() const -> const std::string& {
        return polymorphic_discriminator_;
    }

private:
    /// The value addressed by the current tag, or the whole value.
    auto current_object() -> Result<const JsonValue*, SerialError>;

    auto primitive_at(const std::string& tag, const char* type_name)
        -> Result<const JsonPrimitive*, SerialError>;

    auto bounded_at(const std::string& tag, int64_t min, int64_t max, const char* type_name)
        -> Result<int64_t, SerialError>;

    [[nodiscard]] auto located(const std::string& tag, const SerialError& error) const
        -> SerialError {
        return error_at(tag, error.kind, error.message);
    }

    const JsonConfiguration& config_;
    const JsonValue& value_;
    std::string polymorphic_discriminator_;
};

/// Object-shaped structures: classes, objects, and polymorphic payloads.
class JsonTreeDecoder final : public AbstractJsonTreeDecoder {
public:
    /// # Arguments
    ///
    /// * `value` - A JSON object
    /// * `names` - Deserialization names map of the decoded descriptor (null for none)
    /// * `polymorphic_discriminator` - Key excluded from the unknown-key check
    JsonTreeDecoder(const JsonConfiguration& config, const JsonValue& value, Rc<const NamesMap> names,
                    std::string path_prefix, std::string polymorphic_discriminator = {});

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

    auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> override;

protected:
    auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string override;

    [[nodiscard]] auto current_element(const std::string& tag) const -> const JsonValue* override;

    auto decode_tagged_not_null_mark(const std::string& tag) -> Result<bool, SerialError> override;

private:
    const JsonObject& object_;
    Rc<const NamesMap> names_;
    size_t position_ = 0;
    bool force_null_ = false;
};

/// Arrays, addressed by element position.
class JsonTreeListDecoder final : public AbstractJsonTreeDecoder {
public:
    JsonTreeListDecoder(const JsonConfiguration& config, const JsonValue& value,
                        std::string path_prefix);

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

    auto decode_collection_size(const SerialDescriptor& /*descriptor*/) -> int override {
        return static_cast<int>(array_.size());
    }

protected:
    auto element_name(const SerialDescriptor& /*descriptor*/, size_t index) -> std::string override {
        return std::to_string(index);
    }

    [[nodiscard]] auto render_segment(const std::string& tag) const -> std::string override {
        return "[" + tag + "]";
    }

    [[nodiscard]] auto current_element(const std::string& tag) const -> const JsonValue* override;

private:
    const JsonArray& array_;
    size_t next_ = 0;
};

/// Objects read as maps: entry `k` is element `2k` (its key, as a string
/// primitive) followed by element `2k + 1` (its value).
class JsonTreeMapDecoder final : public AbstractJsonTreeDecoder {
public:
    JsonTreeMapDecoder(const JsonConfiguration& config, const JsonValue& value,
                       std::string path_prefix);

    auto decode_element_index(const SerialDescriptor& descriptor) -> Result<int, SerialError> override;

    auto decode_collection_size(const SerialDescriptor& /*descriptor*/) -> int override {
        return static_cast<int>(object_.size());
    }

protected:
    auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string override;

    [[nodiscard]] auto current_element(const std::string& tag) const -> const JsonValue* override;

private:
    const JsonObject& object_;
    std::vector<JsonValue> keys_;
    int position_ = -1;
};

/// A scalar or null root value.
class JsonTreePrimitiveDecoder final : public AbstractJsonTreeDecoder {
public:
    static constexpr const char* PRIMITIVE_TAG = "primitive";

    JsonTreePrimitiveDecoder(const JsonConfiguration& config, const JsonValue& value,
                             std::string path_prefix);

    auto decode_element_index(const SerialDescriptor& /*descriptor*/)
        -> Result<int, SerialError> override {
        return DECODE_DONE;
    }

protected:
    [[nodiscard]] auto render_segment(const std::string& tag) const -> std::string override {
        return tag == PRIMITIVE_TAG ? std::string() : "." + tag;
    }

    [[nodiscard]] auto current_element(const std::string& tag) const -> const JsonValue* override;
};

/// Creates the root decoder for `value`.
[[nodiscard]] auto make_tree_decoder(const JsonConfiguration& config, const JsonValue& value,
                                     std::string path_prefix = "$")
    -> Box<AbstractJsonTreeDecoder>;

/// Decodes a `T` from `value`.
template <typename T>
auto decode_json_tree(const JsonConfiguration& config, const Serializer<T>& serializer,
                      const JsonValue& value) -> Result<T, SerialError> {
    auto decoder = make_tree_decoder(config, value);
    return decoder->decode_serializable_value(serializer);
}

} // namespace weft::json
