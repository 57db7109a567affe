//! # JSON Tree Encoder
//!
//! Encodes values into a `JsonValue` tree. Every structure is built by its
//! own encoder and handed to its parent through a consumer callback once
//! `end_structure` is reached; the root consumer stores the finished tree.
//!
//! Object polymorphism writes the class discriminator as the first key of
//! the subclass's object:
//!
//! ```json
//! {"type": "app.Circle", "radius": 1.0}
//! ```

#pragma once

#include "weft/encoding/tagged_encoder.hpp"
#include "weft/json/json_element.hpp"

#include <functional>
#include <optional>
#include <string>

namespace weft::json {

/// Receives a finished node.
using NodeConsumer = std::function<Result<bool, SerialError>(JsonValue)>;

class AbstractJsonTreeEncoder : public TaggedEncoder, public JsonEncoder {
public:
    AbstractJsonTreeEncoder(const JsonConfiguration& config, NodeConsumer consumer)
        : config_(config), consumer_(std::move(consumer)) {}

    [[nodiscard]] auto configuration() const -> const JsonConfiguration& override {
        return config_;
    }

    auto encode_json_element(const JsonValue& element) -> Result<bool, SerialError> override;

    auto begin_structure(const DescriptorPtr& descriptor)
        -> Result<Box<CompositeEncoder>, SerialError> override;

    auto set_polymorphic_discriminator(std::string_view type_name) -> bool override;

    auto should_encode_element_default(const SerialDescriptor& /*descriptor*/, size_t /*index*/)
        -> bool override {
        return config_.encode_defaults;
    }

    /// Stores `element` under `key` in the node being built.
    virtual auto put_element(const std::string& key, JsonValue element)
        -> Result<bool, SerialError> = 0;

protected:
    /// Takes the finished node.
    virtual auto take_current() -> JsonValue = 0;

    auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string override;

    auto encode_tagged_null(const std::string& tag) -> Result<bool, SerialError> override;
    auto encode_tagged_boolean(const std::string& tag, bool value)
        -> Result<bool, SerialError> override;
    auto encode_tagged_long(const std::string& tag, int64_t value)
        -> Result<bool, SerialError> override;
    auto encode_tagged_double(const std::string& tag, double value)
        -> Result<bool, SerialError> override;
    auto encode_tagged_float(const std::string& tag, float value)
        -> Result<bool, SerialError> override;
    auto encode_tagged_char(const std::string& tag, char16_t value)
        -> Result<bool, SerialError> override;
    auto encode_tagged_string(const std::string& tag, std::string_view value)
        -> Result<bool, SerialError> override;

    auto end_encode(const SerialDescriptor& descriptor) -> Result<bool, SerialError> override;

private:
    /// Stores a leaf value; leaves cannot carry a class discriminator.
    auto put_primitive(const std::string& tag, JsonValue element) -> Result<bool, SerialError>;

    const JsonConfiguration& config_;
    NodeConsumer consumer_;
    std::optional<std::string> pending_discriminator_;
};

/// Builds a JSON object.
class JsonTreeObjectEncoder final : public AbstractJsonTreeEncoder {
public:
    using AbstractJsonTreeEncoder::AbstractJsonTreeEncoder;

    auto put_element(const std::string& key, JsonValue element)
        -> Result<bool, SerialError> override;

protected:
    auto take_current() -> JsonValue override {
        return JsonValue(std::move(content_));
    }

    /// Null elements are left out unless `explicit_nulls` is set.
    [[nodiscard]] auto writes_null_elements() const -> bool override {
        return configuration().explicit_nulls;
    }

private:
    JsonObject content_;
};

/// Builds a JSON array.
class JsonTreeListEncoder final : public AbstractJsonTreeEncoder {
public:
    using AbstractJsonTreeEncoder::AbstractJsonTreeEncoder;

    auto put_element(const std::string& key, JsonValue element)
        -> Result<bool, SerialError> override;

protected:
    auto element_name(const SerialDescriptor& /*descriptor*/, size_t index) -> std::string override {
        return std::to_string(index);
    }

    auto take_current() -> JsonValue override {
        return JsonValue(std::move(content_));
    }

private:
    JsonArray content_;
};

/// Builds a JSON object from alternating key and value elements. Keys must
/// be primitives; their text becomes the object key.
class JsonTreeMapEncoder final : public AbstractJsonTreeEncoder {
public:
    using AbstractJsonTreeEncoder::AbstractJsonTreeEncoder;

    auto put_element(const std::string& key, JsonValue element)
        -> Result<bool, SerialError> override;

protected:
    auto element_name(const SerialDescriptor& /*descriptor*/, size_t index) -> std::string override {
        return std::to_string(index);
    }

    auto take_current() -> JsonValue override {
        return JsonValue(std::move(content_));
    }

private:
    JsonObject content_;
    std::string key_;
    bool expecting_key_ = true;
};

/// Root encoder. A scalar root is written under the synthetic tag `primitive`.
class JsonTreeRootEncoder final : public AbstractJsonTreeEncoder {
public:
    static constexpr const char* PRIMITIVE_TAG = "primitive";

    explicit JsonTreeRootEncoder(const JsonConfiguration& config);

    auto put_element(const std::string& key, JsonValue element)
        -> Result<bool, SerialError> override;

    /// The encoded tree; fails if nothing was written.
    auto result() -> Result<JsonValue, SerialError>;

protected:
    auto take_current() -> JsonValue override;

private:
    std::optional<JsonValue> result_;
};

/// Encodes `value` into a JSON tree.
template <typename T>
auto encode_json_tree(const JsonConfiguration& config, const Serializer<T>& serializer,
                      const T& value) -> Result<JsonValue, SerialError> {
    JsonTreeRootEncoder encoder(config);
    auto written = encoder.encode_serializable_value(serializer, value);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return encoder.result();
}

} // namespace weft::json
