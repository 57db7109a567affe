#include "weft/json/json_tree_encoder.hpp"

#include "weft/json/json_names.hpp"
#include "weft/json/json_primitives.hpp"
#include "weft/json/json_writer.hpp"

#include <cmath>

namespace weft::json {

// ============================================================================
// AbstractJsonTreeEncoder
// ============================================================================

auto AbstractJsonTreeEncoder::element_name(const SerialDescriptor& descriptor, size_t index)
    -> std::string {
    return serial_name_for_json(config_, descriptor, index);
}

auto AbstractJsonTreeEncoder::set_polymorphic_discriminator(std::string_view type_name) -> bool {
    if (config_.use_array_polymorphism) {
        return false;
    }
    pending_discriminator_ = std::string(type_name);
    return true;
}

auto AbstractJsonTreeEncoder::begin_structure(const DescriptorPtr& descriptor)
    -> Result<Box<CompositeEncoder>, SerialError> {
    NodeConsumer consumer;
    if (const std::string* tag = current_tag()) {
        consumer = [this, key = *tag](JsonValue node) { return put_element(key, std::move(node)); };
    } else {
        consumer = consumer_;
    }

    SerialKind kind = descriptor->kind();
    if (is_polymorphic_kind(kind)) {
        kind = config_.use_array_polymorphism ? SerialKind::List : SerialKind::Map;
    }

    Box<AbstractJsonTreeEncoder> encoder;
    if (kind == SerialKind::List) {
        encoder = make_box<JsonTreeListEncoder>(config_, std::move(consumer));
    } else if (kind == SerialKind::Map) {
        encoder = make_box<JsonTreeMapEncoder>(config_, std::move(consumer));
    } else {
        encoder = make_box<JsonTreeObjectEncoder>(config_, std::move(consumer));
    }

    if (pending_discriminator_) {
        if (kind == SerialKind::List || kind == SerialKind::Map) {
            return SerialError::make(ErrorKind::InvalidValue,
                                     "Class '" + *pending_discriminator_ +
                                         "' cannot be written with a class discriminator "
                                         "because it is not a class-like structure");
        }
        auto written =
            encoder->put_element(config_.class_discriminator, json_string(*pending_discriminator_));
        pending_discriminator_.reset();
        if (is_err(written)) {
            return unwrap_err(written);
        }
    }
    return Box<CompositeEncoder>(std::move(encoder));
}

auto AbstractJsonTreeEncoder::end_encode(const SerialDescriptor& /*descriptor*/)
    -> Result<bool, SerialError> {
    return consumer_(take_current());
}

auto AbstractJsonTreeEncoder::encode_json_element(const JsonValue& element)
    -> Result<bool, SerialError> {
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
        return put_element(pop_tag(), JsonValue(std::move(tagged)));
    }
    return put_element(pop_tag(), element.clone());
}

// ============================================================================
// Leaves
// ============================================================================

auto AbstractJsonTreeEncoder::put_primitive(const std::string& tag, JsonValue element)
    -> Result<bool, SerialError> {
    if (pending_discriminator_) {
        return SerialError::make(ErrorKind::InvalidValue,
                                 "Class '" + *pending_discriminator_ +
                                     "' cannot be written with a class discriminator because it "
                                     "is a primitive");
    }
    return put_element(tag, std::move(element));
}

auto AbstractJsonTreeEncoder::encode_tagged_null(const std::string& tag)
    -> Result<bool, SerialError> {
    return put_primitive(tag, json_null());
}

auto AbstractJsonTreeEncoder::encode_tagged_boolean(const std::string& tag, bool value)
    -> Result<bool, SerialError> {
    return put_primitive(tag, json_bool(value));
}

auto AbstractJsonTreeEncoder::encode_tagged_long(const std::string& tag, int64_t value)
    -> Result<bool, SerialError> {
    return put_primitive(tag, json_int(value));
}

auto AbstractJsonTreeEncoder::encode_tagged_double(const std::string& tag, double value)
    -> Result<bool, SerialError> {
    if (!std::isfinite(value) && !config_.allow_special_floating_point_values) {
        return special_float_output_error(value);
    }
    return put_primitive(tag, json_double(value));
}

auto AbstractJsonTreeEncoder::encode_tagged_float(const std::string& tag, float value)
    -> Result<bool, SerialError> {
    if (!std::isfinite(value) && !config_.allow_special_floating_point_values) {
        return special_float_output_error(value);
    }
    return put_primitive(tag, json_number(format_float(value)));
}

auto AbstractJsonTreeEncoder::encode_tagged_char(const std::string& tag, char16_t value)
    -> Result<bool, SerialError> {
    return put_primitive(tag, json_string(char_to_utf8(value)));
}

auto AbstractJsonTreeEncoder::encode_tagged_string(const std::string& tag, std::string_view value)
    -> Result<bool, SerialError> {
    return put_primitive(tag, json_string(std::string(value)));
}

// ============================================================================
// Node Builders
// ============================================================================

auto JsonTreeObjectEncoder::put_element(const std::string& key, JsonValue element)
    -> Result<bool, SerialError> {
    content_.set(key, std::move(element));
    return true;
}

auto JsonTreeListEncoder::put_element(const std::string& /*key*/, JsonValue element)
    -> Result<bool, SerialError> {
    content_.push_back(std::move(element));
    return true;
}

auto JsonTreeMapEncoder::put_element(const std::string& /*key*/, JsonValue element)
    -> Result<bool, SerialError> {
    if (expecting_key_) {
        if (element.is_array() || element.is_object()) {
            return SerialError::make(ErrorKind::InvalidValue,
                                     std::string("Map key must be a primitive, but was ") +
                                         element.type_name());
        }
        key_ = element.is_null() ? "null" : element.as_primitive().content;
        expecting_key_ = false;
        return true;
    }
    content_.set(std::move(key_), std::move(element));
    key_.clear();
    expecting_key_ = true;
    return true;
}

JsonTreeRootEncoder::JsonTreeRootEncoder(const JsonConfiguration& config)
    : AbstractJsonTreeEncoder(config, nullptr) {
    push_tag(PRIMITIVE_TAG);
}

auto JsonTreeRootEncoder::put_element(const std::string& /*key*/, JsonValue element)
    -> Result<bool, SerialError> {
    result_ = std::move(element);
    return true;
}

auto JsonTreeRootEncoder::take_current() -> JsonValue {
    JsonValue value = result_ ? std::move(*result_) : JsonValue();
    result_.reset();
    return value;
}

auto JsonTreeRootEncoder::result() -> Result<JsonValue, SerialError> {
    if (!result_) {
        return SerialError::make(ErrorKind::InvalidValue, "Nothing was encoded");
    }
    return take_current();
}

} // namespace weft::json
