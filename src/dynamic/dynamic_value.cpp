#include "weft/dynamic/dynamic_value.hpp"

#include "weft/json/json_primitives.hpp"
#include "weft/json/json_writer.hpp"

namespace weft::dynamic {

auto kind_name(DynamicKind kind) -> const char* {
    switch (kind) {
    case DynamicKind::Null:
        return "null";
    case DynamicKind::Bool:
        return "boolean";
    case DynamicKind::Number:
        return "number";
    case DynamicKind::Text:
        return "string";
    case DynamicKind::Sequence:
        return "array";
    case DynamicKind::Mapping:
        return "object";
    }
    return "unknown";
}

auto DynamicValue::describe() const -> std::string {
    switch (kind()) {
    case DynamicKind::Null:
        return "null";
    case DynamicKind::Bool:
        return as_bool() ? "true" : "false";
    case DynamicKind::Number:
        return json::format_double(as_number());
    case DynamicKind::Text:
        return "\"" + json::escape_string(as_text()) + "\"";
    case DynamicKind::Sequence:
        return "[...]";
    case DynamicKind::Mapping:
        return "{...}";
    }
    return "?";
}

// ============================================================================
// NativeValue
// ============================================================================

auto NativeValue::boolean(bool value) -> NativeValue {
    NativeValue result;
    result.data_ = value;
    return result;
}

auto NativeValue::number(double value) -> NativeValue {
    NativeValue result;
    result.data_ = value;
    return result;
}

auto NativeValue::text(std::string value) -> NativeValue {
    NativeValue result;
    result.data_ = std::move(value);
    return result;
}

auto NativeValue::sequence() -> NativeValue {
    NativeValue result;
    result.data_ = Sequence{};
    return result;
}

auto NativeValue::mapping() -> NativeValue {
    NativeValue result;
    result.data_ = Mapping{};
    return result;
}

auto NativeValue::kind() const -> DynamicKind {
    switch (data_.index()) {
    case 1:
        return DynamicKind::Bool;
    case 2:
        return DynamicKind::Number;
    case 3:
        return DynamicKind::Text;
    case 4:
        return DynamicKind::Sequence;
    case 5:
        return DynamicKind::Mapping;
    default:
        return DynamicKind::Null;
    }
}

auto NativeValue::as_bool() const -> bool {
    return std::get<bool>(data_);
}

auto NativeValue::as_number() const -> double {
    return std::get<double>(data_);
}

auto NativeValue::as_text() const -> const std::string& {
    return std::get<std::string>(data_);
}

auto NativeValue::keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    if (const auto* mapping = std::get_if<Mapping>(&data_)) {
        result.reserve(mapping->size());
        for (const auto& [key, value] : *mapping) {
            result.push_back(key);
        }
    }
    return result;
}

auto NativeValue::get(const std::string& key) const -> const DynamicValue* {
    if (const auto* mapping = std::get_if<Mapping>(&data_)) {
        for (const auto& [name, value] : *mapping) {
            if (name == key) {
                return value.get();
            }
        }
    }
    return nullptr;
}

auto NativeValue::length() const -> size_t {
    if (const auto* sequence = std::get_if<Sequence>(&data_)) {
        return sequence->size();
    }
    if (const auto* mapping = std::get_if<Mapping>(&data_)) {
        return mapping->size();
    }
    return 0;
}

auto NativeValue::at(size_t index) const -> const DynamicValue* {
    const auto& sequence = std::get<Sequence>(data_);
    return index < sequence.size() ? sequence[index].get() : nullptr;
}

void NativeValue::push(NativeValue value) {
    std::get<Sequence>(data_).push_back(make_box<NativeValue>(std::move(value)));
}

void NativeValue::push_hole() {
    std::get<Sequence>(data_).push_back(nullptr);
}

auto NativeValue::entry(const std::string& key) -> Box<NativeValue>* {
    auto& mapping = std::get<Mapping>(data_);
    for (auto& [name, value] : mapping) {
        if (name == key) {
            return &value;
        }
    }
    mapping.emplace_back(key, nullptr);
    return &mapping.back().second;
}

void NativeValue::set(std::string key, NativeValue value) {
    *entry(key) = make_box<NativeValue>(std::move(value));
}

void NativeValue::set_undefined(std::string key) {
    entry(key)->reset();
}

// ============================================================================
// JSON Conversion
// ============================================================================

auto native_from_json(const json::JsonValue& value) -> NativeValue {
    if (value.is_null()) {
        return NativeValue::null();
    }
    if (value.is_primitive()) {
        const auto& primitive = value.as_primitive();
        if (primitive.is_string) {
            return NativeValue::text(primitive.content);
        }
        if (primitive.content == "true" || primitive.content == "false") {
            return NativeValue::boolean(primitive.content == "true");
        }
        auto number = json::parse_double(primitive.content);
        if (is_ok(number)) {
            return NativeValue::number(unwrap(number));
        }
        return NativeValue::text(primitive.content);
    }
    if (value.is_array()) {
        NativeValue result = NativeValue::sequence();
        for (const auto& item : value.as_array()) {
            result.push(native_from_json(item));
        }
        return result;
    }
    NativeValue result = NativeValue::mapping();
    const auto& object = value.as_object();
    for (size_t i = 0; i < object.size(); ++i) {
        result.set(object.key_at(i), native_from_json(object.value_at(i)));
    }
    return result;
}

} // namespace weft::dynamic
