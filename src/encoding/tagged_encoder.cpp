//! # Tagged Encoder Implementation
//!
//! Integer widths below 64 bits are widened and written through
//! `encode_tagged_long`; tree formats do not distinguish them.

#include "weft/encoding/tagged_encoder.hpp"

namespace weft {

auto TaggedEncoder::pop_tag() -> std::string {
    popped_ = true;
    if (tag_stack_.empty()) {
        return {};
    }
    std::string tag = std::move(tag_stack_.back());
    tag_stack_.pop_back();
    return tag;
}

auto TaggedEncoder::enter_element(const SerialDescriptor& descriptor, size_t index) -> Encoder& {
    push_tag(element_name(descriptor, index));
    popped_ = false;
    return *this;
}

void TaggedEncoder::leave_element() {
    if (!popped_ && !tag_stack_.empty()) {
        tag_stack_.pop_back();
    }
    popped_ = false;
}

auto TaggedEncoder::end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> {
    return end_encode(descriptor);
}

auto TaggedEncoder::encode_tagged_enum(const std::string& tag,
                                       const SerialDescriptor& enum_descriptor, size_t index)
    -> Result<bool, SerialError> {
    return encode_tagged_string(tag, enum_descriptor.get_element_name(index));
}

// ============================================================================
// Encoder
// ============================================================================

auto TaggedEncoder::encode_null() -> Result<bool, SerialError> {
    return encode_tagged_null(pop_tag());
}

auto TaggedEncoder::encode_boolean(bool value) -> Result<bool, SerialError> {
    return encode_tagged_boolean(pop_tag(), value);
}

auto TaggedEncoder::encode_byte(int8_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(pop_tag(), value);
}

auto TaggedEncoder::encode_short(int16_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(pop_tag(), value);
}

auto TaggedEncoder::encode_int(int32_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(pop_tag(), value);
}

auto TaggedEncoder::encode_long(int64_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(pop_tag(), value);
}

auto TaggedEncoder::encode_float(float value) -> Result<bool, SerialError> {
    return encode_tagged_float(pop_tag(), value);
}

auto TaggedEncoder::encode_double(double value) -> Result<bool, SerialError> {
    return encode_tagged_double(pop_tag(), value);
}

auto TaggedEncoder::encode_char(char16_t value) -> Result<bool, SerialError> {
    return encode_tagged_char(pop_tag(), value);
}

auto TaggedEncoder::encode_string(std::string_view value) -> Result<bool, SerialError> {
    return encode_tagged_string(pop_tag(), value);
}

auto TaggedEncoder::encode_enum(const SerialDescriptor& enum_descriptor, size_t index)
    -> Result<bool, SerialError> {
    return encode_tagged_enum(pop_tag(), enum_descriptor, index);
}

// ============================================================================
// CompositeEncoder
// ============================================================================

auto TaggedEncoder::encode_boolean_element(const SerialDescriptor& descriptor, size_t index,
                                           bool value) -> Result<bool, SerialError> {
    return encode_tagged_boolean(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_byte_element(const SerialDescriptor& descriptor, size_t index,
                                        int8_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_short_element(const SerialDescriptor& descriptor, size_t index,
                                         int16_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_int_element(const SerialDescriptor& descriptor, size_t index,
                                       int32_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_long_element(const SerialDescriptor& descriptor, size_t index,
                                        int64_t value) -> Result<bool, SerialError> {
    return encode_tagged_long(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_float_element(const SerialDescriptor& descriptor, size_t index,
                                         float value) -> Result<bool, SerialError> {
    return encode_tagged_float(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_double_element(const SerialDescriptor& descriptor, size_t index,
                                          double value) -> Result<bool, SerialError> {
    return encode_tagged_double(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_char_element(const SerialDescriptor& descriptor, size_t index,
                                        char16_t value) -> Result<bool, SerialError> {
    return encode_tagged_char(element_name(descriptor, index), value);
}

auto TaggedEncoder::encode_string_element(const SerialDescriptor& descriptor, size_t index,
                                          std::string_view value) -> Result<bool, SerialError> {
    return encode_tagged_string(element_name(descriptor, index), value);
}

} // namespace weft
