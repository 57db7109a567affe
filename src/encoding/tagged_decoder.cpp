//! # Tagged Decoder Implementation

#include "weft/encoding/tagged_decoder.hpp"

namespace weft {

// ============================================================================
// Tag Stack
// ============================================================================

auto TaggedDecoder::pop_tag() -> std::string {
    std::string tag = std::move(tag_stack_.back());
    tag_stack_.pop_back();
    popped_ = true;
    return tag;
}

auto TaggedDecoder::enter_element(const SerialDescriptor& descriptor, size_t index) -> Decoder& {
    push_tag(element_name(descriptor, index));
    popped_ = false;
    return *this;
}

void TaggedDecoder::leave_element() {
    if (!popped_ && !tag_stack_.empty()) {
        tag_stack_.pop_back();
    }
    popped_ = false;
}

auto TaggedDecoder::current_path() const -> std::string {
    std::string path = path_prefix_;
    for (const auto& tag : tag_stack_) {
        path += render_segment(tag);
    }
    return path;
}

auto TaggedDecoder::error(ErrorKind kind, std::string message) const -> SerialError {
    return SerialError::at_path(kind, std::move(message), current_path());
}

auto TaggedDecoder::error_at(const std::string& tag, ErrorKind kind, std::string message) const
    -> SerialError {
    return SerialError::at_path(kind, std::move(message), current_path() + render_segment(tag));
}

auto TaggedDecoder::root_value_error() const -> SerialError {
    return error(ErrorKind::UnexpectedStructure,
                 "Expected a primitive value, but the input is a structure");
}

// ============================================================================
// Decoder
// ============================================================================

auto TaggedDecoder::decode_not_null_mark() -> Result<bool, SerialError> {
    // A structure decoder addressing itself holds a non-null value.
    if (const auto* tag = current_tag()) {
        return decode_tagged_not_null_mark(*tag);
    }
    return true;
}

auto TaggedDecoder::decode_null() -> Result<bool, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_null(pop_tag());
}

auto TaggedDecoder::decode_boolean() -> Result<bool, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_boolean(pop_tag());
}

auto TaggedDecoder::decode_byte() -> Result<int8_t, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_byte(pop_tag());
}

auto TaggedDecoder::decode_short() -> Result<int16_t, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_short(pop_tag());
}

auto TaggedDecoder::decode_int() -> Result<int32_t, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_int(pop_tag());
}

auto TaggedDecoder::decode_long() -> Result<int64_t, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_long(pop_tag());
}

auto TaggedDecoder::decode_float() -> Result<float, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_float(pop_tag());
}

auto TaggedDecoder::decode_double() -> Result<double, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_double(pop_tag());
}

auto TaggedDecoder::decode_char() -> Result<char16_t, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_char(pop_tag());
}

auto TaggedDecoder::decode_string() -> Result<std::string, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_string(pop_tag());
}

auto TaggedDecoder::decode_enum(const SerialDescriptor& enum_descriptor)
    -> Result<size_t, SerialError> {
    if (tag_stack_.empty()) {
        return root_value_error();
    }
    return decode_tagged_enum(pop_tag(), enum_descriptor);
}

// ============================================================================
// CompositeDecoder
// ============================================================================

auto TaggedDecoder::decode_boolean_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<bool, SerialError> {
    return decode_tagged_boolean(element_name(descriptor, index));
}

auto TaggedDecoder::decode_byte_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<int8_t, SerialError> {
    return decode_tagged_byte(element_name(descriptor, index));
}

auto TaggedDecoder::decode_short_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<int16_t, SerialError> {
    return decode_tagged_short(element_name(descriptor, index));
}

auto TaggedDecoder::decode_int_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<int32_t, SerialError> {
    return decode_tagged_int(element_name(descriptor, index));
}

auto TaggedDecoder::decode_long_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<int64_t, SerialError> {
    return decode_tagged_long(element_name(descriptor, index));
}

auto TaggedDecoder::decode_float_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<float, SerialError> {
    return decode_tagged_float(element_name(descriptor, index));
}

auto TaggedDecoder::decode_double_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<double, SerialError> {
    return decode_tagged_double(element_name(descriptor, index));
}

auto TaggedDecoder::decode_char_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<char16_t, SerialError> {
    return decode_tagged_char(element_name(descriptor, index));
}

auto TaggedDecoder::decode_string_element(const SerialDescriptor& descriptor, size_t index)
    -> Result<std::string, SerialError> {
    return decode_tagged_string(element_name(descriptor, index));
}

} // namespace weft
