//! # JSON-Aware Coders
//!
//! Decoders and encoders of the JSON formats also implement `JsonDecoder` or
//! `JsonEncoder`, which move a whole `JsonValue` in one call. Serializers
//! that need the raw tree discover them with `dynamic_cast`:
//!
//! ```cpp
//! if (auto* json_in = dynamic_cast<JsonDecoder*>(&decoder)) {
//!     auto element = json_in->decode_json_element();
//! }
//! ```

#pragma once

#include "weft/encoding/decoder.hpp"
#include "weft/encoding/encoder.hpp"
#include "weft/json/json_configuration.hpp"
#include "weft/json/json_value.hpp"

namespace weft::json {

/// A decoder reading JSON, or JSON-shaped data.
class JsonDecoder {
public:
    virtual ~JsonDecoder() = default;

    [[nodiscard]] virtual auto configuration() const -> const JsonConfiguration& = 0;

    /// Reads the value at the current position as a JSON tree.
    virtual auto decode_json_element() -> Result<JsonValue, SerialError> = 0;
};

/// An encoder producing JSON.
class JsonEncoder {
public:
    virtual ~JsonEncoder() = default;

    [[nodiscard]] virtual auto configuration() const -> const JsonConfiguration& = 0;

    /// Writes `element` at the current position.
    virtual auto encode_json_element(const JsonValue& element) -> Result<bool, SerialError> = 0;
};

/// Descriptor of `JsonValue`: a Sealed descriptor with one element per
/// variant of the tree.
[[nodiscard]] auto json_element_descriptor() -> DescriptorPtr;

/// Serializes any `JsonValue` as is. Works only with the JSON coders.
class JsonElementSerializer final : public Serializer<JsonValue> {
public:
    [[nodiscard]] auto descriptor() const -> DescriptorPtr override {
        return json_element_descriptor();
    }

    auto serialize(Encoder& encoder, const JsonValue& value) const
        -> Result<bool, SerialError> override;

    auto deserialize(Decoder& decoder) const -> Result<JsonValue, SerialError> override;
};

} // namespace weft::json
