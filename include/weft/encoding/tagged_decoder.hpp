//! # Tagged Decoder
//!
//! Base for decoders that address elements by a *tag*, the element's resolved
//! serialized name. Subclasses only implement `decode_tagged_xxx(tag)` and
//! the structure-opening calls; the tag bookkeeping lives here.
//!
//! ## Tag Stack
//!
//! - `decode_xxx()` pops the current tag and decodes the value under it.
//! - `decode_xxx_element(desc, i)` decodes the value under element `i`'s tag
//!   without touching the stack.
//! - `decode_serializable_element(desc, i, s)` pushes element `i`'s tag for
//!   the duration of the nested decode. If the nested decode popped it (a
//!   primitive), it is not popped again.
//!
//! An empty stack means the decoder itself is the value being decoded.

#pragma once

#include "weft/encoding/decoder.hpp"

#include <string>
#include <vector>

namespace weft {

class TaggedDecoder : public Decoder, public CompositeDecoder {
public:
    explicit TaggedDecoder(std::string path_prefix) : path_prefix_(std::move(path_prefix)) {}

    auto decode_not_null_mark() -> Result<bool, SerialError> override;
    auto decode_null() -> Result<bool, SerialError> override;
    auto decode_boolean() -> Result<bool, SerialError> override;
    auto decode_byte() -> Result<int8_t, SerialError> override;
    auto decode_short() -> Result<int16_t, SerialError> override;
    auto decode_int() -> Result<int32_t, SerialError> override;
    auto decode_long() -> Result<int64_t, SerialError> override;
    auto decode_float() -> Result<float, SerialError> override;
    auto decode_double() -> Result<double, SerialError> override;
    auto decode_char() -> Result<char16_t, SerialError> override;
    auto decode_string() -> Result<std::string, SerialError> override;
    auto decode_enum(const SerialDescriptor& enum_descriptor)
        -> Result<size_t, SerialError> override;

    auto decode_boolean_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<bool, SerialError> override;
    auto decode_byte_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int8_t, SerialError> override;
    auto decode_short_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int16_t, SerialError> override;
    auto decode_int_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int32_t, SerialError> override;
    auto decode_long_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<int64_t, SerialError> override;
    auto decode_float_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<float, SerialError> override;
    auto decode_double_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<double, SerialError> override;
    auto decode_char_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<char16_t, SerialError> override;
    auto decode_string_element(const SerialDescriptor& descriptor, size_t index)
        -> Result<std::string, SerialError> override;

    auto end_structure(const SerialDescriptor& /*descriptor*/) -> Result<bool, SerialError> override {
        return true;
    }

    /// Path of the value currently addressed, e.g. `$.items[2]`.
    [[nodiscard]] auto current_path() const -> std::string;

protected:
    /// Tag of element `index`. Formats override this to apply naming policies.
    virtual auto element_name(const SerialDescriptor& descriptor, size_t index) -> std::string {
        return descriptor.get_element_name(index);
    }

    /// How a tag appears in error paths. Defaults to `.tag`.
    [[nodiscard]] virtual auto render_segment(const std::string& tag) const -> std::string {
        return "." + tag;
    }

    virtual auto decode_tagged_not_null_mark(const std::string& tag) -> Result<bool, SerialError> = 0;
    virtual auto decode_tagged_null(const std::string& /*tag*/) -> Result<bool, SerialError> {
        return true;
    }
    virtual auto decode_tagged_boolean(const std::string& tag) -> Result<bool, SerialError> = 0;
    virtual auto decode_tagged_byte(const std::string& tag) -> Result<int8_t, SerialError> = 0;
    virtual auto decode_tagged_short(const std::string& tag) -> Result<int16_t, SerialError> = 0;
    virtual auto decode_tagged_int(const std::string& tag) -> Result<int32_t, SerialError> = 0;
    virtual auto decode_tagged_long(const std::string& tag) -> Result<int64_t, SerialError> = 0;
    virtual auto decode_tagged_float(const std::string& tag) -> Result<float, SerialError> = 0;
    virtual auto decode_tagged_double(const std::string& tag) -> Result<double, SerialError> = 0;
    virtual auto decode_tagged_char(const std::string& tag) -> Result<char16_t, SerialError> = 0;
    virtual auto decode_tagged_string(const std::string& tag)
        -> Result<std::string, SerialError> = 0;
    virtual auto decode_tagged_enum(const std::string& tag, const SerialDescriptor& enum_descriptor)
        -> Result<size_t, SerialError> = 0;

    auto enter_element(const SerialDescriptor& descriptor, size_t index) -> Decoder& override;
    void leave_element() override;

    /// Top of the tag stack, or nullptr when the decoder itself is addressed.
    [[nodiscard]] auto current_tag() const -> const std::string* {
        return tag_stack_.empty() ? nullptr : &tag_stack_.back();
    }

    void push_tag(std::string tag) {
        tag_stack_.push_back(std::move(tag));
    }

    auto pop_tag() -> std::string;

    /// Error located at the current path.
    [[nodiscard]] auto error(ErrorKind kind, std::string message) const -> SerialError;

    /// Error located at element `tag` below the current path.
    [[nodiscard]] auto error_at(const std::string& tag, ErrorKind kind, std::string message) const
        -> SerialError;

    [[nodiscard]] auto path_prefix() const -> const std::string& {
        return path_prefix_;
    }

private:
    [[nodiscard]] auto root_value_error() const -> SerialError;

    std::vector<std::string> tag_stack_;
    bool popped_ = false;
    std::string path_prefix_;
};

} // namespace weft
