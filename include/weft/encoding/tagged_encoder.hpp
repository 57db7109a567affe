//! # Tagged Encoder
//!
//! Mirror of `TaggedDecoder`: element `i` is written under its tag through
//! `encode_tagged_xxx(tag, value)`. Used by encoders that build a tree rather
//! than a character stream.

#pragma once

#include "weft/encoding/encoder.hpp"

#include <string>
#include <vector>

namespace weft {

class TaggedEncoder : public Encoder, public CompositeEncoder {
public:
    auto encode_null() -> Result<bool, SerialError> override;
    auto encode_boolean(bool value) -> Result<bool, SerialError> override;
    auto encode_byte(int8_t value) -> Result<bool, SerialError> override;
    auto encode_short(int16_t value) -> Result<bool, SerialError> override;
    auto encode_int(int32_t value) -> Result<bool, SerialError> override;
    auto encode_long(int64_t value) -> Result<bool, SerialError> override;
    auto encode_float(float value) -> Result<bool, SerialError> override;
    auto encode_double(double value) -> Result<bool, SerialError> override;
    auto encode_char(char16_t value) -> Result<bool, SerialError> override;
    auto encode_string(std::string_view value) -> Result<bool, SerialError> override;
    auto encode_enum(const SerialDescriptor& enum_descriptor, size_t index)
        -> Result<bool, SerialError> override;

    auto encode_boolean_element(const SerialDescriptor& descriptor, size_t index, bool value)
        -> Result<bool, SerialError> override;
    auto encode_byte_element(const SerialDescriptor& descriptor, size_t index, int8_t value)
        -> Result<bool, SerialError> override;
    auto encode_short_element(const SerialDescriptor& descriptor, size_t index, int16_t value)
        -> Result<bool, SerialError> override;
    auto encode_int_element(const SerialDescriptor& descriptor, size_t index, int32_t value)
        -> Result<bool, SerialError> override;
    auto encode_long_element(const SerialDescriptor& descriptor, size_t index, int64_t value)
        -> Result<bool, SerialError> override;
    auto encode_float_element(const SerialDescriptor& descriptor, size_t index, float value)
        -> Result<bool, SerialError> override;
    auto encode_double_element(const SerialDescriptor& descriptor, size_t index, double value)
        -> Result<bool, SerialError> override;
    auto encode_char_element(const SerialDescriptor& descriptor, size_t index, char16_t value)
        -> Result<bool, SerialError> override;
    auto encode_string_element(const SerialDescriptor& descriptor, size_t index,
                               std::string_view value) -> Result<bool, SerialError> override;

    auto end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> override;

protected:
    virtual auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string {
        return descriptor.get_element_name(index);
    }

    virtual auto encode_tagged_null(const std::string& tag) -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_boolean(const std::string& tag, bool value)
        -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_long(const std::string& tag, int64_t value)
        -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_double(const std::string& tag, double value)
        -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_float(const std::string& tag, float value)
        -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_char(const std::string& tag, char16_t value)
        -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_string(const std::string& tag, std::string_view value)
        -> Result<bool, SerialError> = 0;
    virtual auto encode_tagged_enum(const std::string& tag, const SerialDescriptor& enum_descriptor,
                                    size_t index) -> Result<bool, SerialError>;

    /// Called once the structure is complete.
    virtual auto end_encode(const SerialDescriptor& /*descriptor*/) -> Result<bool, SerialError> {
        return true;
    }

    auto enter_element(const SerialDescriptor& descriptor, size_t index) -> Encoder& override;
    void leave_element() override;

    [[nodiscard]] auto current_tag() const -> const std::string* {
        return tag_stack_.empty() ? nullptr : &tag_stack_.back();
    }

    void push_tag(std::string tag) {
        tag_stack_.push_back(std::move(tag));
    }

    auto pop_tag() -> std::string;

private:
    std::vector<std::string> tag_stack_;
    bool popped_ = false;
};

} // namespace weft
