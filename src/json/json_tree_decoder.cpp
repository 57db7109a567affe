#include "weft/json/json_tree_decoder.hpp"

#include "weft/json/json_coercion.hpp"
#include "weft/json/json_primitives.hpp"
#include "weft/log/log.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace weft::json {

// ============================================================================
// AbstractJsonTreeDecoder
// ============================================================================

AbstractJsonTreeDecoder::AbstractJsonTreeDecoder(const JsonConfiguration& config,
                                                 const JsonValue& value, std::string path_prefix,
                                                 std::string polymorphic_discriminator)
    : TaggedDecoder(std::move(path_prefix)), config_(config), value_(value),
      polymorphic_discriminator_(std::move(polymorphic_discriminator)) {}

auto AbstractJsonTreeDecoder::current_object() -> Result<const JsonValue*, SerialError> {
    const std::string* tag = current_tag();
    if (!tag) {
        return &value_;
    }
    const JsonValue* element = current_element(*tag);
    if (!element) {
        return error(ErrorKind::MissingRequiredValue, "Element '" + *tag + "' is missing");
    }
    return element;
}

auto AbstractJsonTreeDecoder::decode_json_element() -> Result<JsonValue, SerialError> {
    if (current_tag()) {
        std::string tag = pop_tag();
        const JsonValue* element = current_element(tag);
        if (!element) {
            return error_at(tag, ErrorKind::MissingRequiredValue,
                            "Element '" + tag + "' is missing");
        }
        return element->clone();
    }
    return value_.clone();
}

auto AbstractJsonTreeDecoder::begin_structure(const DescriptorPtr& descriptor)
    -> Result<Box<CompositeDecoder>, SerialError> {
    auto current = current_object();
    if (is_err(current)) {
        return unwrap_err(current);
    }
    const JsonValue& source = *unwrap(current);

    SerialKind kind = descriptor->kind();
    if (is_polymorphic_kind(kind)) {
        kind = config_.use_array_polymorphism ? SerialKind::List : SerialKind::Map;
    }

    if (kind == SerialKind::List) {
        if (!source.is_array()) {
            return error(ErrorKind::UnexpectedStructure,
                         "Expected a JSON array for '" + descriptor->serial_name() +
                             "', but had " + source.type_name());
        }
        return Box<CompositeDecoder>(
            make_box<JsonTreeListDecoder>(config_, source, current_path()));
    }

    if (!source.is_object()) {
        return error(ErrorKind::UnexpectedStructure, "Expected a JSON object for '" +
                                                         descriptor->serial_name() +
                                                         "', but had " + source.type_name());
    }
    if (kind == SerialKind::Map) {
        return Box<CompositeDecoder>(make_box<JsonTreeMapDecoder>(config_, source, current_path()));
    }

    Rc<const NamesMap> names;
    if (needs_names_map(config_, *descriptor)) {
        auto built = names_map_for(config_, *descriptor);
        if (is_err(built)) {
            return error(ErrorKind::InvalidDescriptor, unwrap_err(built).message);
        }
        names = std::move(unwrap(built));
    }
    // The discriminator belongs to the structure this decoder was opened for.
    std::string discriminator = current_tag() ? std::string() : polymorphic_discriminator_;
    return Box<CompositeDecoder>(make_box<JsonTreeDecoder>(
        config_, source, std::move(names), current_path(), std::move(discriminator)));
}

auto AbstractJsonTreeDecoder::begin_polymorphic(const DescriptorPtr& base_descriptor)
    -> Result<std::optional<PolymorphicInput>, SerialError> {
    if (config_.use_array_polymorphism) {
        return std::optional<PolymorphicInput>{};
    }
    auto current = current_object();
    if (is_err(current)) {
        return unwrap_err(current);
    }
    const JsonValue& source = *unwrap(current);
    if (!source.is_object()) {
        return error(ErrorKind::UnexpectedStructure,
                     "Expected a JSON object for polymorphic '" + base_descriptor->serial_name() +
                         "', but had " + source.type_name());
    }

    const std::string& discriminator = config_.class_discriminator;
    const JsonValue* type = source.get(discriminator);
    if (!type) {
        return error(ErrorKind::MissingRequiredValue,
                     "Class discriminator '" + discriminator + "' is missing for polymorphic '" +
                         base_descriptor->serial_name() + "'");
    }
    if (!type->is_primitive()) {
        return error_at(discriminator, ErrorKind::TypeMismatch,
                        "Class discriminator must be a string, but had " +
                            std::string(type->type_name()));
    }

    PolymorphicInput input;
    input.type_name = type->as_primitive().content;
    input.payload =
        make_box<JsonTreeDecoder>(config_, source, nullptr, current_path(), discriminator);
    return std::optional<PolymorphicInput>(std::move(input));
}

// ============================================================================
// Primitives
// ============================================================================

auto AbstractJsonTreeDecoder::primitive_at(const std::string& tag, const char* type_name)
    -> Result<const JsonPrimitive*, SerialError> {
    const JsonValue* element = current_element(tag);
    if (!element) {
        return error_at(tag, ErrorKind::MissingRequiredValue, "Element '" + tag + "' is missing");
    }
    if (element->is_null()) {
        return error_at(tag, ErrorKind::TypeMismatch,
                        std::string("Unexpected 'null' literal when non-nullable ") + type_name +
                            " was expected");
    }
    if (!element->is_primitive()) {
        return error_at(tag, ErrorKind::TypeMismatch,
                        std::string("Expected ") + type_name + ", but had " + element->type_name());
    }
    return &element->as_primitive();
}

auto AbstractJsonTreeDecoder::bounded_at(const std::string& tag, int64_t min, int64_t max,
                                         const char* type_name) -> Result<int64_t, SerialError> {
    auto primitive = primitive_at(tag, type_name);
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    auto value = parse_bounded_integer(unwrap(primitive)->content, min, max, type_name);
    if (is_err(value)) {
        return located(tag, unwrap_err(value));
    }
    return unwrap(value);
}

auto AbstractJsonTreeDecoder::decode_tagged_not_null_mark(const std::string& tag)
    -> Result<bool, SerialError> {
    const JsonValue* element = current_element(tag);
    return !(element && element->is_null());
}

auto AbstractJsonTreeDecoder::decode_tagged_boolean(const std::string& tag)
    -> Result<bool, SerialError> {
    auto primitive = primitive_at(tag, "boolean");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    auto value = parse_boolean(unwrap(primitive)->content, config_.is_lenient);
    if (is_err(value)) {
        return located(tag, unwrap_err(value));
    }
    return unwrap(value);
}

auto AbstractJsonTreeDecoder::decode_tagged_byte(const std::string& tag)
    -> Result<int8_t, SerialError> {
    auto value = bounded_at(tag, std::numeric_limits<int8_t>::min(),
                            std::numeric_limits<int8_t>::max(), "byte");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int8_t>(unwrap(value));
}

auto AbstractJsonTreeDecoder::decode_tagged_short(const std::string& tag)
    -> Result<int16_t, SerialError> {
    auto value = bounded_at(tag, std::numeric_limits<int16_t>::min(),
                            std::numeric_limits<int16_t>::max(), "short");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int16_t>(unwrap(value));
}

auto AbstractJsonTreeDecoder::decode_tagged_int(const std::string& tag)
    -> Result<int32_t, SerialError> {
    auto value = bounded_at(tag, std::numeric_limits<int32_t>::min(),
                            std::numeric_limits<int32_t>::max(), "int");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int32_t>(unwrap(value));
}

auto AbstractJsonTreeDecoder::decode_tagged_long(const std::string& tag)
    -> Result<int64_t, SerialError> {
    auto primitive = primitive_at(tag, "long");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    auto value = parse_long(unwrap(primitive)->content);
    if (is_err(value)) {
        return located(tag, unwrap_err(value));
    }
    return unwrap(value);
}

auto AbstractJsonTreeDecoder::decode_tagged_float(const std::string& tag)
    -> Result<float, SerialError> {
    auto primitive = primitive_at(tag, "float");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    auto value = parse_double(unwrap(primitive)->content);
    if (is_err(value)) {
        return located(tag, unwrap_err(value));
    }
    auto result = static_cast<float>(unwrap(value));
    if (!std::isfinite(result) && !config_.allow_special_floating_point_values) {
        return located(tag, special_float_error(result));
    }
    return result;
}

auto AbstractJsonTreeDecoder::decode_tagged_double(const std::string& tag)
    -> Result<double, SerialError> {
    auto primitive = primitive_at(tag, "double");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    auto value = parse_double(unwrap(primitive)->content);
    if (is_err(value)) {
        return located(tag, unwrap_err(value));
    }
    if (!std::isfinite(unwrap(value)) && !config_.allow_special_floating_point_values) {
        return located(tag, special_float_error(unwrap(value)));
    }
    return unwrap(value);
}

auto AbstractJsonTreeDecoder::decode_tagged_char(const std::string& tag)
    -> Result<char16_t, SerialError> {
    auto primitive = primitive_at(tag, "char");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    const JsonPrimitive& literal = *unwrap(primitive);
    Result<char16_t, SerialError> value = parse_char(literal.content);
    if (!literal.is_string) {
        if (auto number = parse_double(literal.content); is_ok(number)) {
            value = code_point_to_char(unwrap(number));
        }
    }
    if (is_err(value)) {
        return located(tag, unwrap_err(value));
    }
    return unwrap(value);
}

auto AbstractJsonTreeDecoder::decode_tagged_string(const std::string& tag)
    -> Result<std::string, SerialError> {
    auto primitive = primitive_at(tag, "string");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    const JsonPrimitive& literal = *unwrap(primitive);
    if (!literal.is_string && !config_.is_lenient) {
        return error_at(tag, ErrorKind::TypeMismatch,
                        "String literal for key '" + tag +
                            "' should be quoted. Use 'is_lenient = true' to accept "
                            "non-compliant JSON");
    }
    return literal.content;
}

auto AbstractJsonTreeDecoder::decode_tagged_enum(const std::string& tag,
                                                 const SerialDescriptor& enum_descriptor)
    -> Result<size_t, SerialError> {
    auto primitive = primitive_at(tag, "enum value");
    if (is_err(primitive)) {
        return unwrap_err(primitive);
    }
    auto index = get_enum_index(config_, enum_descriptor, unwrap(primitive)->content);
    if (is_err(index)) {
        return located(tag, unwrap_err(index));
    }
    return unwrap(index);
}

// ============================================================================
// JsonTreeDecoder
// ============================================================================

JsonTreeDecoder::JsonTreeDecoder(const JsonConfiguration& config, const JsonValue& value,
                                 Rc<const NamesMap> names, std::string path_prefix,
                                 std::string polymorphic_discriminator)
    : AbstractJsonTreeDecoder(config, value, std::move(path_prefix),
                              std::move(polymorphic_discriminator)),
      object_(value.as_object()), names_(names ? std::move(names) : empty_names_map()) {}

auto JsonTreeDecoder::element_name(const SerialDescriptor& descriptor, size_t index)
    -> std::string {
    return resolve_element_name(configuration(), descriptor, index, *names_, object_.keys(),
                                [this](const std::string& key) { return object_.contains(key); });
}

auto JsonTreeDecoder::current_element(const std::string& tag) const -> const JsonValue* {
    return object_.get(tag);
}

auto JsonTreeDecoder::decode_tagged_not_null_mark(const std::string& tag)
    -> Result<bool, SerialError> {
    if (force_null_) {
        return false;
    }
    return AbstractJsonTreeDecoder::decode_tagged_not_null_mark(tag);
}

auto JsonTreeDecoder::decode_element_index(const SerialDescriptor& descriptor)
    -> Result<int, SerialError> {
    const JsonConfiguration& config = configuration();
    while (position_ < descriptor.elements_count()) {
        size_t index = position_++;
        force_null_ = false;
        std::string name = element_name(descriptor, index);
        const JsonValue* element = object_.get(name);

        if (!element) {
            if (absence_is_null(config, descriptor, index)) {
                WEFT_LOG_TRACE("json", "Absent '" << name << "' of " << descriptor.serial_name()
                                                  << " read as null");
                force_null_ = true;
                return static_cast<int>(index);
            }
            continue;
        }

        std::optional<std::string> content;
        if (element->is_primitive()) {
            content = element->as_primitive().content;
        }
        switch (try_coerce_value(config, descriptor, index, element->is_null(), content)) {
        case CoercionOutcome::Decode:
            return static_cast<int>(index);
        case CoercionOutcome::ForceNull:
            force_null_ = true;
            return static_cast<int>(index);
        case CoercionOutcome::Skip:
            break;
        }
    }
    return DECODE_DONE;
}

auto JsonTreeDecoder::end_structure(const SerialDescriptor& descriptor)
    -> Result<bool, SerialError> {
    const JsonConfiguration& config = configuration();
    if (config.ignore_unknown_keys || is_polymorphic_kind(descriptor.kind())) {
        return true;
    }
    for (const auto& key : object_.keys()) {
        if (key == polymorphic_discriminator()) {
            continue;
        }
        if (!get_json_name_index(config, descriptor, key, *names_)) {
            return error_at(key, ErrorKind::UnknownKey,
                            "Encountered an unknown key '" + key +
                                "'. Use 'ignore_unknown_keys = true' to ignore unknown keys");
        }
    }
    return true;
}

// ============================================================================
// JsonTreeListDecoder
// ============================================================================

JsonTreeListDecoder::JsonTreeListDecoder(const JsonConfiguration& config, const JsonValue& value,
                                         std::string path_prefix)
    : AbstractJsonTreeDecoder(config, value, std::move(path_prefix)), array_(value.as_array()) {}

auto JsonTreeListDecoder::decode_element_index(const SerialDescriptor& /*descriptor*/)
    -> Result<int, SerialError> {
    if (next_ < array_.size()) {
        return static_cast<int>(next_++);
    }
    return DECODE_DONE;
}

auto JsonTreeListDecoder::current_element(const std::string& tag) const -> const JsonValue* {
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(tag.data(), tag.data() + tag.size(), index);
    if (ec != std::errc{} || index >= array_.size()) {
        return nullptr;
    }
    return &array_[index];
}

// ============================================================================
// JsonTreeMapDecoder
// ============================================================================

JsonTreeMapDecoder::JsonTreeMapDecoder(const JsonConfiguration& config, const JsonValue& value,
                                       std::string path_prefix)
    : AbstractJsonTreeDecoder(config, value, std::move(path_prefix)),
      object_(value.as_object()) {
    keys_.reserve(object_.size());
    for (const auto& key : object_.keys()) {
        keys_.push_back(json_string(key));
    }
}

auto JsonTreeMapDecoder::decode_element_index(const SerialDescriptor& /*descriptor*/)
    -> Result<int, SerialError> {
    if (position_ + 1 < static_cast<int>(object_.size() * 2)) {
        return ++position_;
    }
    return DECODE_DONE;
}

auto JsonTreeMapDecoder::element_name(const SerialDescriptor& /*descriptor*/, size_t index)
    -> std::string {
    return object_.key_at(index / 2);
}

auto JsonTreeMapDecoder::current_element(const std::string& tag) const -> const JsonValue* {
    if (position_ >= 0 && position_ % 2 == 0) {
        return &keys_[static_cast<size_t>(position_ / 2)];
    }
    return object_.get(tag);
}

// ============================================================================
// JsonTreePrimitiveDecoder
// ============================================================================

JsonTreePrimitiveDecoder::JsonTreePrimitiveDecoder(const JsonConfiguration& config,
                                                   const JsonValue& value, std::string path_prefix)
    : AbstractJsonTreeDecoder(config, value, std::move(path_prefix)) {
    push_tag(PRIMITIVE_TAG);
}

auto JsonTreePrimitiveDecoder::current_element(const std::string& tag) const -> const JsonValue* {
    return tag == PRIMITIVE_TAG ? &value() : nullptr;
}

// ============================================================================
// Entry Point
// ============================================================================

auto make_tree_decoder(const JsonConfiguration& config, const JsonValue& value,
                       std::string path_prefix) -> Box<AbstractJsonTreeDecoder> {
    if (value.is_object()) {
        return make_box<JsonTreeDecoder>(config, value, nullptr, std::move(path_prefix));
    }
    if (value.is_array()) {
        return make_box<JsonTreeListDecoder>(config, value, std::move(path_prefix));
    }
    return make_box<JsonTreePrimitiveDecoder>(config, value, std::move(path_prefix));
}

} // namespace weft::json
