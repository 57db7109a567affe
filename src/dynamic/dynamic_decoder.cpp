#include "weft/dynamic/dynamic_decoder.hpp"

#include "weft/json/json_coercion.hpp"
#include "weft/json/json_primitives.hpp"
#include "weft/log/log.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace weft::dynamic {

using json::JsonValue;

namespace {

/// Decodes `value` as a JSON element through a fresh root decoder.
auto decode_element(const json::JsonConfiguration& config, const DynamicValue* value)
    -> Result<JsonValue, SerialError> {
    if (!value) {
        return JsonValue();
    }
    auto decoder = make_dynamic_decoder(config, *value);
    return decoder->decode_serializable_value(json::JsonElementSerializer{});
}

auto type_error(const std::string& what, const DynamicValue& value) -> std::string {
    return "Expected " + what + ", but had " + kind_name(value.kind()) + " " + value.describe();
}

} // namespace

// ============================================================================
// DynamicInput
// ============================================================================

DynamicInput::DynamicInput(const json::JsonConfiguration& config, const DynamicValue& value,
                           std::string path_prefix, Rc<const json::NamesMap> names,
                           std::string polymorphic_discriminator)
    : TaggedDecoder(std::move(path_prefix)), config_(config), value_(value),
      names_(names ? std::move(names) : json::empty_names_map()), polymorphic_discriminator_(std::move(polymorphic_discriminator)) {
    if (value_.kind() == DynamicKind::Mapping) {
        object_keys_ = value_.keys();
    }
}

auto DynamicInput::by_tag(const std::string& tag) const -> const DynamicValue* {
    return value_.kind() == DynamicKind::Mapping ? value_.get(tag) : nullptr;
}

auto DynamicInput::element_name(const SerialDescriptor& descriptor, size_t index)
    -> std::string {
    return json::resolve_element_name(
        config_, descriptor, index, *names_, object_keys_,
        [this](const std::string& key) { return by_tag(key) != nullptr; });
}

auto DynamicInput::decode_json_element() -> Result<JsonValue, SerialError> {
    if (current_tag()) {
        std::string tag = pop_tag();
        return decode_element(config_, by_tag(tag));
    }
    return convert_value();
}

auto DynamicInput::convert_value() -> Result<JsonValue, SerialError> {
    switch (value_.kind()) {
    case DynamicKind::Null:
        return JsonValue();
    case DynamicKind::Bool:
        return json::json_bool(value_.as_bool());
    case DynamicKind::Number: {
        double number = value_.as_number();
        auto integral = json::double_to_long(number);
        if (is_ok(integral)) {
            return json::json_int(unwrap(integral));
        }
        return json::json_double(number);
    }
    case DynamicKind::Text:
        return json::json_string(value_.as_text());
    case DynamicKind::Sequence: {
        json::JsonArray items;
        for (size_t i = 0; i < value_.length(); ++i) {
            auto item = decode_element(config_, value_.at(i));
            if (is_err(item)) {
                return item;
            }
            items.push_back(std::move(unwrap(item)));
        }
        return JsonValue(std::move(items));
    }
    case DynamicKind::Mapping: {
        json::JsonObject object;
        for (const auto& key : object_keys_) {
            const DynamicValue* member = value_.get(key);
            if (!member) {
                continue;
            }
            auto entry = decode_element(config_, member);
            if (is_err(entry)) {
                return entry;
            }
            object.set(key, std::move(unwrap(entry)));
        }
        return JsonValue(std::move(object));
    }
    }
    return JsonValue();
}

auto DynamicInput::begin_structure(const DescriptorPtr& descriptor)
    -> Result<Box<CompositeDecoder>, SerialError> {
    const DynamicValue* source = &value_;
    if (const std::string* tag = current_tag()) {
        source = by_tag(*tag);
        if (!source) {
            return error(ErrorKind::MissingRequiredValue, "Value for field " + *tag + " is missing");
        }
    }

    SerialKind kind = descriptor->kind();
    if (is_polymorphic_kind(kind)) {
        kind = config_.use_array_polymorphism ? SerialKind::List : SerialKind::Map;
    }

    if (kind == SerialKind::List) {
        if (source->kind() != DynamicKind::Sequence) {
            return error(ErrorKind::UnexpectedStructure,
                         type_error("an array for '" + descriptor->serial_name() + "'", *source));
        }
        return Box<CompositeDecoder>(make_box<DynamicListInput>(config_, *source, current_path()));
    }

    if (source->kind() != DynamicKind::Mapping) {
        return error(ErrorKind::UnexpectedStructure,
                     type_error("an object for '" + descriptor->serial_name() + "'", *source));
    }
    if (kind == SerialKind::Map) {
        return Box<CompositeDecoder>(make_box<DynamicMapInput>(config_, *source, current_path()));
    }

    Rc<const json::NamesMap> names;
    if (json::needs_names_map(config_, *descriptor)) {
        auto built = json::names_map_for(config_, *descriptor);
        if (is_err(built)) {
            return error(ErrorKind::InvalidDescriptor, unwrap_err(built).message);
        }
        names = std::move(unwrap(built));
    }
    std::string discriminator = current_tag() ? std::string() : polymorphic_discriminator_;
    return Box<CompositeDecoder>(make_box<DynamicInput>(config_, *source, current_path(),
                                                        std::move(names), std::move(discriminator)));
}

auto DynamicInput::begin_polymorphic(const DescriptorPtr& base_descriptor)
    -> Result<std::optional<PolymorphicInput>, SerialError> {
    if (config_.use_array_polymorphism) {
        return std::optional<PolymorphicInput>{};
    }
    const DynamicValue* source = &value_;
    if (const std::string* tag = current_tag()) {
        source = by_tag(*tag);
        if (!source) {
            return error(ErrorKind::MissingRequiredValue, "Value for field " + *tag + " is missing");
        }
    }
    if (source->kind() != DynamicKind::Mapping) {
        return error(ErrorKind::UnexpectedStructure,
                     type_error("an object for polymorphic '" + base_descriptor->serial_name() +
                                    "'",
                                *source));
    }

    const std::string& discriminator = config_.class_discriminator;
    const DynamicValue* type = source->get(discriminator);
    if (!type) {
        return error(ErrorKind::MissingRequiredValue,
                     "Class discriminator '" + discriminator + "' is missing for polymorphic '" +
                         base_descriptor->serial_name() + "'");
    }
    if (type->kind() != DynamicKind::Text) {
        return error_at(discriminator, ErrorKind::TypeMismatch,
                        type_error("a string class discriminator", *type));
    }

    PolymorphicInput input;
    input.type_name = type->as_text();
    input.payload =
        make_box<DynamicInput>(config_, *source, current_path(), nullptr, discriminator);
    return std::optional<PolymorphicInput>(std::move(input));
}

auto DynamicInput::decode_element_index(const SerialDescriptor& descriptor)
    -> Result<int, SerialError> {
    while (position_ < descriptor.elements_count()) {
        size_t index = position_++;
        force_null_ = false;
        std::string name = element_name(descriptor, index);
        const DynamicValue* element = by_tag(name);

        if (!element) {
            if (json::absence_is_null(config_, descriptor, index)) {
                WEFT_LOG_TRACE("dynamic", "Absent '" << name << "' of "
                                                     << descriptor.serial_name()
                                                     << " read as null");
                force_null_ = true;
                return static_cast<int>(index);
            }
            continue;
        }

        std::optional<std::string> text;
        if (element->kind() == DynamicKind::Text) {
            text = element->as_text();
        }
        switch (json::try_coerce_value(config_, descriptor, index, element->is_null(), text)) {
        case json::CoercionOutcome::Decode:
            return static_cast<int>(index);
        case json::CoercionOutcome::ForceNull:
            force_null_ = true;
            return static_cast<int>(index);
        case json::CoercionOutcome::Skip:
            break;
        }
    }
    return DECODE_DONE;
}

auto DynamicInput::end_structure(const SerialDescriptor& descriptor) -> Result<bool, SerialError> {
    SerialKind kind = descriptor.kind();
    if (config_.ignore_unknown_keys || (kind != SerialKind::Class && kind != SerialKind::Object)) {
        return true;
    }
    for (const auto& key : object_keys_) {
        if (key == polymorphic_discriminator_ || !value_.get(key)) {
            continue;
        }
        if (!json::get_json_name_index(config_, descriptor, key, *names_)) {
            return error_at(key, ErrorKind::UnknownKey,
                            "Encountered an unknown key '" + key +
                                "'. Use 'ignore_unknown_keys = true' to ignore unknown keys");
        }
    }
    return true;
}

// ============================================================================
// Primitives
// ============================================================================

auto DynamicInput::defined_at(const std::string& tag, const char* type_name)
    -> Result<const DynamicValue*, SerialError> {
    const DynamicValue* element = by_tag(tag);
    if (!element) {
        return error_at(tag, ErrorKind::MissingRequiredValue,
                        "Value for field " + tag + " is missing");
    }
    if (element->is_null()) {
        return error_at(tag, ErrorKind::TypeMismatch,
                        std::string("Unexpected 'null' literal when non-nullable ") + type_name +
                            " was expected");
    }
    return element;
}

auto DynamicInput::number_at(const std::string& tag, const char* type_name)
    -> Result<double, SerialError> {
    auto element = defined_at(tag, type_name);
    if (is_err(element)) {
        return unwrap_err(element);
    }
    const DynamicValue& value = *unwrap(element);
    if (value.kind() != DynamicKind::Number) {
        return error_at(tag, ErrorKind::TypeMismatch, type_error(type_name, value));
    }
    return value.as_number();
}

auto DynamicInput::bounded_at(const std::string& tag, int64_t min, int64_t max,
                              const char* type_name) -> Result<int64_t, SerialError> {
    auto number = number_at(tag, type_name);
    if (is_err(number)) {
        return unwrap_err(number);
    }
    auto value = json::double_to_bounded_integer(unwrap(number), min, max, type_name);
    if (is_err(value)) {
        return error_at(tag, unwrap_err(value).kind, unwrap_err(value).message);
    }
    return unwrap(value);
}

auto DynamicInput::decode_tagged_not_null_mark(const std::string& tag)
    -> Result<bool, SerialError> {
    if (force_null_) {
        return false;
    }
    const DynamicValue* element = by_tag(tag);
    if (!element) {
        return error_at(tag, ErrorKind::MissingRequiredValue,
                        "Value for field " + tag + " is missing");
    }
    return !element->is_null();
}

auto DynamicInput::decode_tagged_boolean(const std::string& tag) -> Result<bool, SerialError> {
    auto element = defined_at(tag, "boolean");
    if (is_err(element)) {
        return unwrap_err(element);
    }
    const DynamicValue& value = *unwrap(element);
    if (value.kind() != DynamicKind::Bool) {
        return error_at(tag, ErrorKind::TypeMismatch, type_error("boolean", value));
    }
    return value.as_bool();
}

auto DynamicInput::decode_tagged_byte(const std::string& tag) -> Result<int8_t, SerialError> {
    auto value = bounded_at(tag, std::numeric_limits<int8_t>::min(),
                            std::numeric_limits<int8_t>::max(), "byte");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int8_t>(unwrap(value));
}

auto DynamicInput::decode_tagged_short(const std::string& tag) -> Result<int16_t, SerialError> {
    auto value = bounded_at(tag, std::numeric_limits<int16_t>::min(),
                            std::numeric_limits<int16_t>::max(), "short");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int16_t>(unwrap(value));
}

auto DynamicInput::decode_tagged_int(const std::string& tag) -> Result<int32_t, SerialError> {
    auto value = bounded_at(tag, std::numeric_limits<int32_t>::min(),
                            std::numeric_limits<int32_t>::max(), "int");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int32_t>(unwrap(value));
}

auto DynamicInput::decode_tagged_long(const std::string& tag) -> Result<int64_t, SerialError> {
    auto number = number_at(tag, "long");
    if (is_err(number)) {
        return unwrap_err(number);
    }
    auto value = json::double_to_long(unwrap(number));
    if (is_err(value)) {
        return error_at(tag, unwrap_err(value).kind, unwrap_err(value).message);
    }
    return unwrap(value);
}

auto DynamicInput::decode_tagged_float(const std::string& tag) -> Result<float, SerialError> {
    auto number = number_at(tag, "float");
    if (is_err(number)) {
        return unwrap_err(number);
    }
    auto result = static_cast<float>(unwrap(number));
    if (!std::isfinite(result) && !config_.allow_special_floating_point_values) {
        auto special = json::special_float_error(result);
        return error_at(tag, special.kind, special.message);
    }
    return result;
}

auto DynamicInput::decode_tagged_double(const std::string& tag) -> Result<double, SerialError> {
    auto number = number_at(tag, "double");
    if (is_err(number)) {
        return unwrap_err(number);
    }
    if (!std::isfinite(unwrap(number)) && !config_.allow_special_floating_point_values) {
        auto special = json::special_float_error(unwrap(number));
        return error_at(tag, special.kind, special.message);
    }
    return unwrap(number);
}

auto DynamicInput::decode_tagged_char(const std::string& tag) -> Result<char16_t, SerialError> {
    auto element = defined_at(tag, "char");
    if (is_err(element)) {
        return unwrap_err(element);
    }
    const DynamicValue& value = *unwrap(element);
    Result<char16_t, SerialError> result =
        SerialError::make(ErrorKind::TypeMismatch,
                          value.describe() + " can't be represented as char");
    if (value.kind() == DynamicKind::Text) {
        result = json::parse_char(value.as_text());
    } else if (value.kind() == DynamicKind::Number) {
        result = json::code_point_to_char(value.as_number());
    }
    if (is_err(result)) {
        return error_at(tag, unwrap_err(result).kind, unwrap_err(result).message);
    }
    return unwrap(result);
}

auto DynamicInput::decode_tagged_string(const std::string& tag)
    -> Result<std::string, SerialError> {
    auto element = defined_at(tag, "string");
    if (is_err(element)) {
        return unwrap_err(element);
    }
    const DynamicValue& value = *unwrap(element);
    if (value.kind() != DynamicKind::Text) {
        return error_at(tag, ErrorKind::TypeMismatch, type_error("string", value));
    }
    return value.as_text();
}

auto DynamicInput::decode_tagged_enum(const std::string& tag,
                                      const SerialDescriptor& enum_descriptor)
    -> Result<size_t, SerialError> {
    auto element = defined_at(tag, "enum value");
    if (is_err(element)) {
        return unwrap_err(element);
    }
    const DynamicValue& value = *unwrap(element);
    if (value.kind() != DynamicKind::Text) {
        return error_at(tag, ErrorKind::TypeMismatch,
                        "Enum value must be a string, got '" + value.describe() + "'");
    }
    auto index = json::get_enum_index(config_, enum_descriptor, value.as_text());
    if (is_err(index)) {
        return error_at(tag, unwrap_err(index).kind, unwrap_err(index).message);
    }
    return unwrap(index);
}

// ============================================================================
// DynamicMapInput
// ============================================================================

DynamicMapInput::DynamicMapInput(const json::JsonConfiguration& config, const DynamicValue& value,
                                 std::string path_prefix)
    : DynamicInput(config, value, std::move(path_prefix)), keys_(value.keys()) {
    key_values_.reserve(keys_.size());
    for (const auto& key : keys_) {
        key_values_.push_back(NativeValue::text(key));
    }
}

auto DynamicMapInput::decode_element_index(const SerialDescriptor& /*descriptor*/)
    -> Result<int, SerialError> {
    int size = static_cast<int>(keys_.size() * 2);
    while (cursor_ + 1 < size) {
        int next = cursor_ + 1;
        if (next % 2 == 0 && !value().get(keys_[static_cast<size_t>(next / 2)])) {
            cursor_ += 2;
            continue;
        }
        cursor_ = next;
        return cursor_;
    }
    return DECODE_DONE;
}

auto DynamicMapInput::element_name(const SerialDescriptor& /*descriptor*/, size_t index)
    -> std::string {
    return keys_.at(index / 2);
}

auto DynamicMapInput::by_tag(const std::string& tag) const -> const DynamicValue* {
    if (is_key()) {
        return &key_values_[static_cast<size_t>(cursor_ / 2)];
    }
    return value().get(tag);
}

auto DynamicMapInput::illegal_key_type(const std::string& tag, const char* type_name) const
    -> SerialError {
    return error_at(tag, ErrorKind::TypeMismatch,
                    "Property " + tag + " is not valid type " + type_name + ": " + tag);
}

auto DynamicMapInput::number_at(const std::string& tag, const char* type_name)
    -> Result<double, SerialError> {
    if (!is_key()) {
        return DynamicInput::number_at(tag, type_name);
    }
    auto number = json::parse_double(tag);
    if (is_err(number)) {
        return illegal_key_type(tag, type_name);
    }
    return unwrap(number);
}

auto DynamicMapInput::decode_tagged_boolean(const std::string& tag) -> Result<bool, SerialError> {
    if (!is_key()) {
        return DynamicInput::decode_tagged_boolean(tag);
    }
    auto value = json::parse_boolean(tag, false);
    if (is_err(value)) {
        return illegal_key_type(tag, "boolean");
    }
    return unwrap(value);
}

auto DynamicMapInput::integer_key(const std::string& tag, int64_t min, int64_t max,
                                  const char* type_name) -> Result<int64_t, SerialError> {
    std::string_view digits = tag;
    if (digits.size() > 1 && digits[0] == '+' && digits[1] != '-') {
        digits.remove_prefix(1);
    }
    if (!json::is_integer_syntax(digits)) {
        return illegal_key_type(tag, type_name);
    }
    auto value = json::parse_bounded_integer(digits, min, max, type_name);
    if (is_err(value)) {
        return illegal_key_type(tag, type_name);
    }
    return unwrap(value);
}

auto DynamicMapInput::decode_tagged_byte(const std::string& tag) -> Result<int8_t, SerialError> {
    if (!is_key()) {
        return DynamicInput::decode_tagged_byte(tag);
    }
    auto value = integer_key(tag, std::numeric_limits<int8_t>::min(),
                             std::numeric_limits<int8_t>::max(), "byte");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int8_t>(unwrap(value));
}

auto DynamicMapInput::decode_tagged_short(const std::string& tag) -> Result<int16_t, SerialError> {
    if (!is_key()) {
        return DynamicInput::decode_tagged_short(tag);
    }
    auto value = integer_key(tag, std::numeric_limits<int16_t>::min(),
                             std::numeric_limits<int16_t>::max(), "short");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int16_t>(unwrap(value));
}

auto DynamicMapInput::decode_tagged_int(const std::string& tag) -> Result<int32_t, SerialError> {
    if (!is_key()) {
        return DynamicInput::decode_tagged_int(tag);
    }
    auto value = integer_key(tag, std::numeric_limits<int32_t>::min(),
                             std::numeric_limits<int32_t>::max(), "int");
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return static_cast<int32_t>(unwrap(value));
}

// ============================================================================
// DynamicListInput
// ============================================================================

DynamicListInput::DynamicListInput(const json::JsonConfiguration& config,
                                   const DynamicValue& value, std::string path_prefix)
    : DynamicInput(config, value, std::move(path_prefix)) {}

auto DynamicListInput::decode_element_index(const SerialDescriptor& /*descriptor*/)
    -> Result<int, SerialError> {
    int size = static_cast<int>(value().length());
    while (cursor_ + 1 < size) {
        ++cursor_;
        if (value().at(static_cast<size_t>(cursor_))) {
            return cursor_;
        }
    }
    return DECODE_DONE;
}

auto DynamicListInput::by_tag(const std::string& tag) const -> const DynamicValue* {
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(tag.data(), tag.data() + tag.size(), index);
    if (ec != std::errc{} || index >= value().length()) {
        return nullptr;
    }
    return value().at(index);
}

auto DynamicListInput::decode_json_element() -> Result<JsonValue, SerialError> {
    if (current_tag()) {
        std::string tag = pop_tag();
        return decode_element(configuration(), by_tag(tag));
    }
    json::JsonArray items;
    for (size_t i = 0; i < value().length(); ++i) {
        auto item = decode_element(configuration(), value().at(i));
        if (is_err(item)) {
            return item;
        }
        items.push_back(std::move(unwrap(item)));
    }
    return JsonValue(std::move(items));
}

// ============================================================================
// PrimitiveDynamicInput
// ============================================================================

PrimitiveDynamicInput::PrimitiveDynamicInput(const json::JsonConfiguration& config,
                                             const DynamicValue& value, std::string path_prefix)
    : DynamicInput(config, value, std::move(path_prefix)) {
    push_tag(PRIMITIVE_TAG);
}

auto PrimitiveDynamicInput::decode_json_element() -> Result<JsonValue, SerialError> {
    if (current_tag()) {
        pop_tag();
    }
    return convert_value();
}

// ============================================================================
// Entry Point
// ============================================================================

auto make_dynamic_decoder(const json::JsonConfiguration& config, const DynamicValue& value,
                          std::string path_prefix) -> Box<DynamicInput> {
    switch (value.kind()) {
    case DynamicKind::Mapping:
        return make_box<DynamicInput>(config, value, std::move(path_prefix));
    case DynamicKind::Sequence:
        return make_box<DynamicListInput>(config, value, std::move(path_prefix));
    default:
        return make_box<PrimitiveDynamicInput>(config, value, std::move(path_prefix));
    }
}

} // namespace weft::dynamic
