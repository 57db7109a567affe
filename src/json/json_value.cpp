//! # JSON Value Implementation
//!
//! Object storage, deep copies and equality for `JsonValue`.
//!
//! ## Equality Semantics
//!
//! | Type | Comparison Rule |
//! |------|-----------------|
//! | `null` | All nulls are equal |
//! | primitive | Same literal text and same quoting |
//! | `array` | Element-by-element in order |
//! | `object` | Same key set, equal values per key (order independent) |
//!
//! Literal text is compared as written: `1` and `1.0` are different values.

#include "weft/json/json_value.hpp"

#include "weft/json/json_writer.hpp"

namespace weft::json {

// ============================================================================
// JsonObject
// ============================================================================

void JsonObject::set(std::string key, JsonValue value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        values_[it->second] = std::move(value);
        return;
    }
    index_.emplace(key, keys_.size());
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
}

auto JsonObject::get(std::string_view key) const -> const JsonValue* {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &values_[it->second];
}

auto JsonObject::remove(std::string_view key) -> bool {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return false;
    }
    size_t position = it->second;
    index_.erase(it);
    keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(position));
    values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(position));
    for (auto& [name, index] : index_) {
        if (index > position) {
            --index;
        }
    }
    return true;
}

auto JsonObject::value_at(size_t index) const -> const JsonValue& {
    return values_.at(index);
}

auto JsonObject::clone() const -> JsonObject {
    JsonObject copy;
    copy.keys_ = keys_;
    copy.index_ = index_;
    copy.values_.reserve(values_.size());
    for (const auto& value : values_) {
        copy.values_.push_back(value.clone());
    }
    return copy;
}

auto JsonObject::operator==(const JsonObject& other) const -> bool {
    if (size() != other.size()) {
        return false;
    }
    for (size_t i = 0; i < keys_.size(); ++i) {
        const JsonValue* theirs = other.get(keys_[i]);
        if (!theirs || *theirs != values_[i]) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// JsonValue
// ============================================================================

auto JsonValue::type_name() const -> const char* {
    if (is_null()) {
        return "null";
    }
    if (is_primitive()) {
        return as_primitive().is_string ? "string" : "primitive";
    }
    if (is_array()) {
        return "array";
    }
    return "object";
}

auto JsonValue::size() const -> size_t {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_primitive()) {
        return JsonValue(as_primitive());
    }
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        return JsonValue(as_object().clone());
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_primitive()) {
        return as_primitive() == other.as_primitive();
    }
    if (is_array()) {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (arr1[i] != arr2[i]) {
                return false;
            }
        }
        return true;
    }
    return as_object() == other.as_object();
}

auto json_double(double value) -> JsonValue {
    return JsonValue(JsonPrimitive{format_double(value), false});
}

} // namespace weft::json
