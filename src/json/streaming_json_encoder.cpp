#include "weft/json/streaming_json_encoder.hpp"

#include "weft/json/json_names.hpp"
#include "weft/json/json_primitives.hpp"

#include <cmath>

namespace weft::json {

void StreamingJsonEncoder::encode_element(const SerialDescriptor& descriptor, size_t index) {
    switch (mode_) {
    case Mode::Obj:
        if (count_ > 0) {
            writer_.print(',');
        }
        writer_.next_item();
        writer_.print_quoted(serial_name_for_json(config_, descriptor, index));
        writer_.print(':');
        writer_.space();
        break;
    case Mode::List:
        if (count_ > 0) {
            writer_.print(',');
        }
        writer_.next_item();
        break;
    case Mode::Map:
        if (index % 2 == 0) {
            if (count_ > 0) {
                writer_.print(',');
            }
            writer_.next_item();
            key_mode_ = true;
        } else {
            writer_.print(':');
            writer_.space();
            key_mode_ = false;
        }
        break;
    }
    ++count_;
}

void StreamingJsonEncoder::write_discriminator(const std::string& type_name) {
    writer_.next_item();
    writer_.print_quoted(config_.class_discriminator);
    writer_.print(':');
    writer_.space();
    writer_.print_quoted(type_name);
    ++count_;
}

auto StreamingJsonEncoder::primitive_discriminator_error() const -> SerialError {
    return SerialError::make(ErrorKind::InvalidValue,
                             "Class '" + *pending_discriminator_ +
                                 "' cannot be written with a class discriminator because it is a "
                                 "primitive");
}

auto StreamingJsonEncoder::print_literal(std::string_view text) -> Result<bool, SerialError> {
    if (pending_discriminator_) {
        return primitive_discriminator_error();
    }
    if (key_mode_) {
        writer_.print_quoted(text);
    } else {
        writer_.print(text);
    }
    return true;
}

// ============================================================================
// Primitives
// ============================================================================

auto StreamingJsonEncoder::encode_null() -> Result<bool, SerialError> {
    return print_literal("null");
}

auto StreamingJsonEncoder::encode_boolean(bool value) -> Result<bool, SerialError> {
    return print_literal(value ? "true" : "false");
}

auto StreamingJsonEncoder::encode_byte(int8_t value) -> Result<bool, SerialError> {
    return print_literal(std::to_string(value));
}

auto StreamingJsonEncoder::encode_short(int16_t value) -> Result<bool, SerialError> {
    return print_literal(std::to_string(value));
}

auto StreamingJsonEncoder::encode_int(int32_t value) -> Result<bool, SerialError> {
    return print_literal(std::to_string(value));
}

auto StreamingJsonEncoder::encode_long(int64_t value) -> Result<bool, SerialError> {
    return print_literal(std::to_string(value));
}

auto StreamingJsonEncoder::encode_float(float value) -> Result<bool, SerialError> {
    if (!std::isfinite(value) && !config_.allow_special_floating_point_values) {
        return special_float_output_error(value);
    }
    return print_literal(format_float(value));
}

auto StreamingJsonEncoder::encode_double(double value) -> Result<bool, SerialError> {
    if (!std::isfinite(value) && !config_.allow_special_floating_point_values) {
        return special_float_output_error(value);
    }
    return print_literal(format_double(value));
}

auto StreamingJsonEncoder::encode_char(char16_t value) -> Result<bool, SerialError> {
    return encode_string(char_to_utf8(value));
}

auto StreamingJsonEncoder::encode_string(std::string_view value) -> Result<bool, SerialError> {
    if (pending_discriminator_) {
        return primitive_discriminator_error();
    }
    writer_.print_quoted(value);
    return true;
}

auto StreamingJsonEncoder::encode_enum(const SerialDescriptor& enum_descriptor, size_t index)
    -> Result<bool, SerialError> {
    return encode_string(enum_descriptor.get_element_name(index));
}

// ============================================================================
// Structures
// ============================================================================

auto StreamingJsonEncoder::set_polymorphic_discriminator(std::string_view type_name) -> bool {
    if (config_.use_array_polymorphism) {
        return false;
    }
    pending_discriminator_ = std::string(type_name);
    return true;
}

auto StreamingJsonEncoder::begin_structure(const DescriptorPtr& descriptor)
    -> Result<Box<CompositeEncoder>, SerialError> {
    if (key_mode_) {
        return SerialError::make(ErrorKind::InvalidValue,
                                 "Map key must be a primitive, but was a structure of '" +
                                     descriptor->serial_name() + "'");
    }

    SerialKind kind = descriptor->kind();
    if (is_polymorphic_kind(kind)) {
        kind = config_.use_array_polymorphism ? SerialKind::List : SerialKind::Class;
    }
    Mode mode = Mode::Obj;
    if (kind == SerialKind::List) {
        mode = Mode::List;
    } else if (kind == SerialKind::Map) {
        mode = Mode::Map;
    }

    if (pending_discriminator_ && mode != Mode::Obj) {
        return SerialError::make(ErrorKind::InvalidValue,
                                 "Class '" + *pending_discriminator_ +
                                     "' cannot be written with a class discriminator because it "
                                     "is not a class-like structure");
    }

    writer_.print(mode == Mode::List ? '[' : '{');
    writer_.indent();
    auto encoder = make_box<StreamingJsonEncoder>(config_, writer_, mode);
    if (pending_discriminator_) {
        encoder->write_discriminator(*pending_discriminator_);
        pending_discriminator_.reset();
    }
    return Box<CompositeEncoder>(std::move(encoder));
}

auto StreamingJsonEncoder::end_structure(const SerialDescriptor& /*descriptor*/)
    -> Result<bool, SerialError> {
    writer_.unindent();
    if (count_ > 0) {
        writer_.next_item();
    }
    writer_.print(mode_ == Mode::List ? ']' : '}');
    return true;
}

auto StreamingJsonEncoder::encode_json_element(const JsonValue& element)
    -> Result<bool, SerialError> {
    if (key_mode_) {
        if (element.is_array() || element.is_object()) {
            return SerialError::make(ErrorKind::InvalidValue,
                                     std::string("Map key must be a primitive, but was ") +
                                         element.type_name());
        }
        writer_.print_quoted(element.is_null() ? "null" : element.as_primitive().content);
        return true;
    }

    if (pending_discriminator_) {
        if (!element.is_object()) {
            return SerialError::make(ErrorKind::InvalidValue,
                                     "Class '" + *pending_discriminator_ +
                                         "' with a class discriminator must be a JSON object");
        }
        JsonObject tagged;
        tagged.set(config_.class_discriminator, json_string(*pending_discriminator_));
        const JsonObject& body = element.as_object();
        for (size_t i = 0; i < body.size(); ++i) {
            tagged.set(body.key_at(i), body.value_at(i).clone());
        }
        pending_discriminator_.reset();
        write_json_value(JsonValue(std::move(tagged)), writer_);
        return true;
    }

    write_json_value(element, writer_);
    return true;
}

} // namespace weft::json
