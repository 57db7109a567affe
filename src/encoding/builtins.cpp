#include "weft/encoding/builtins.hpp"

namespace weft {

auto BooleanSerializer::descriptor() const -> DescriptorPtr {
    return boolean_descriptor();
}

auto BooleanSerializer::serialize(Encoder& encoder, const bool& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_boolean(value);
}

auto BooleanSerializer::deserialize(Decoder& decoder) const -> Result<bool, SerialError> {
    return decoder.decode_boolean();
}

auto ByteSerializer::descriptor() const -> DescriptorPtr {
    return byte_descriptor();
}

auto ByteSerializer::serialize(Encoder& encoder, const int8_t& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_byte(value);
}

auto ByteSerializer::deserialize(Decoder& decoder) const -> Result<int8_t, SerialError> {
    return decoder.decode_byte();
}

auto ShortSerializer::descriptor() const -> DescriptorPtr {
    return short_descriptor();
}

auto ShortSerializer::serialize(Encoder& encoder, const int16_t& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_short(value);
}

auto ShortSerializer::deserialize(Decoder& decoder) const -> Result<int16_t, SerialError> {
    return decoder.decode_short();
}

auto IntSerializer::descriptor() const -> DescriptorPtr {
    return int_descriptor();
}

auto IntSerializer::serialize(Encoder& encoder, const int32_t& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_int(value);
}

auto IntSerializer::deserialize(Decoder& decoder) const -> Result<int32_t, SerialError> {
    return decoder.decode_int();
}

auto LongSerializer::descriptor() const -> DescriptorPtr {
    return long_descriptor();
}

auto LongSerializer::serialize(Encoder& encoder, const int64_t& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_long(value);
}

auto LongSerializer::deserialize(Decoder& decoder) const -> Result<int64_t, SerialError> {
    return decoder.decode_long();
}

auto FloatSerializer::descriptor() const -> DescriptorPtr {
    return float_descriptor();
}

auto FloatSerializer::serialize(Encoder& encoder, const float& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_float(value);
}

auto FloatSerializer::deserialize(Decoder& decoder) const -> Result<float, SerialError> {
    return decoder.decode_float();
}

auto DoubleSerializer::descriptor() const -> DescriptorPtr {
    return double_descriptor();
}

auto DoubleSerializer::serialize(Encoder& encoder, const double& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_double(value);
}

auto DoubleSerializer::deserialize(Decoder& decoder) const -> Result<double, SerialError> {
    return decoder.decode_double();
}

auto CharSerializer::descriptor() const -> DescriptorPtr {
    return char_descriptor();
}

auto CharSerializer::serialize(Encoder& encoder, const char16_t& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_char(value);
}

auto CharSerializer::deserialize(Decoder& decoder) const -> Result<char16_t, SerialError> {
    return decoder.decode_char();
}

auto StringSerializer::descriptor() const -> DescriptorPtr {
    return string_descriptor();
}

auto StringSerializer::serialize(Encoder& encoder, const std::string& value) const
    -> Result<bool, SerialError> {
    return encoder.encode_string(value);
}

auto StringSerializer::deserialize(Decoder& decoder) const -> Result<std::string, SerialError> {
    return decoder.decode_string();
}

} // namespace weft
