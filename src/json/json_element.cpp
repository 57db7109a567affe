#include "weft/json/json_element.hpp"

#include "weft/descriptor/descriptors.hpp"

#include <stdexcept>

namespace weft::json {

namespace {

auto build_json_element_descriptor() -> DescriptorPtr {
    auto primitive = primitive_descriptor("weft.json.JsonPrimitive", SerialKind::String);
    auto null = primitive_descriptor("weft.json.JsonNull", SerialKind::String);
    if (is_err(primitive) || is_err(null)) {
        throw std::logic_error("Cannot build the JsonElement descriptor");
    }
    auto built =
        DescriptorBuilder("weft.json.JsonElement", SerialKind::Sealed)
            .element("JsonPrimitive", unwrap(primitive))
            .element("JsonNull", nullable(unwrap(null)))
            .lazy_element("JsonObject",
                          [] {
                              return map_descriptor("weft.json.JsonObject", string_descriptor(),
                                                    json_element_descriptor());
                          })
            .lazy_element("JsonArray",
                          [] {
                              return list_descriptor("weft.json.JsonArray",
                                                     json_element_descriptor());
                          })
            .build();
    if (is_err(built)) {
        throw std::logic_error(unwrap_err(built).message);
    }
    return unwrap(built);
}

} // namespace

auto json_element_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = build_json_element_descriptor();
    return desc;
}

auto JsonElementSerializer::serialize(Encoder& encoder, const JsonValue& value) const
    -> Result<bool, SerialError> {
    auto* json_out = dynamic_cast<JsonEncoder*>(&encoder);
    if (!json_out) {
        return SerialError::make(ErrorKind::InvalidValue,
                                 "JsonValue can be serialized only by the JSON format");
    }
    return json_out->encode_json_element(value);
}

auto JsonElementSerializer::deserialize(Decoder& decoder) const -> Result<JsonValue, SerialError> {
    auto* json_in = dynamic_cast<JsonDecoder*>(&decoder);
    if (!json_in) {
        return SerialError::make(ErrorKind::UnexpectedStructure,
                                 "JsonValue can be deserialized only by the JSON format");
    }
    return json_in->decode_json_element();
}

} // namespace weft::json
