//! # JSON Value Types
//!
//! The JSON tree produced by `Json::parse_to_json_element` and consumed by
//! the tree decoder. Primitives keep their literal text, so numbers survive
//! a parse/print round trip unchanged and no precision is lost before a
//! serializer asks for a concrete type.
//!
//! ## Representation
//!
//! | JSON Input | Storage |
//! |------------|---------|
//! | `null` | `Null` |
//! | `true` | `JsonPrimitive{"true", is_string = false}` |
//! | `1.50` | `JsonPrimitive{"1.50", is_string = false}` |
//! | `"abc"` | `JsonPrimitive{"abc", is_string = true}` |
//! | `[...]` | `Box<JsonArray>` |
//! | `{...}` | `Box<JsonObject>` |
//!
//! Objects keep their keys in insertion order. Setting an existing key
//! replaces its value in place. Object equality ignores key order.
//!
//! ## Example
//!
//! ```cpp
//! auto obj = json_object();
//! obj.set("name", json_string("Alice"));
//! obj.set("age", json_int(30));
//!
//! if (auto* name = obj.get("name"); name && name->is_string()) {
//!     std::cout << name->as_primitive().content << std::endl;
//! }
//! ```

#pragma once

#include "weft/common.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace weft::json {

struct JsonValue;

/// An array of JSON values.
using JsonArray = std::vector<JsonValue>;

/// A leaf value: its literal text and whether it was a quoted string.
struct JsonPrimitive {
    std::string content;
    bool is_string = false;

    [[nodiscard]] auto operator==(const JsonPrimitive& other) const -> bool {
        return is_string == other.is_string && content == other.content;
    }
    [[nodiscard]] auto operator!=(const JsonPrimitive& other) const -> bool {
        return !(*this == other);
    }
};

/// An insertion-ordered string-keyed map of JSON values.
class JsonObject {
public:
    JsonObject() = default;
    JsonObject(JsonObject&&) noexcept = default;
    auto operator=(JsonObject&&) noexcept -> JsonObject& = default;

    /// Inserts `value` under `key`. An existing key keeps its position and
    /// takes the new value.
    void set(std::string key, JsonValue value);

    /// Returns the value under `key`, or `nullptr`.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue*;

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return index_.find(std::string(key)) != index_.end();
    }

    /// Removes `key`. Returns `false` if it was not present.
    auto remove(std::string_view key) -> bool;

    [[nodiscard]] auto size() const -> size_t {
        return keys_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return keys_.empty();
    }

    /// Keys in insertion order.
    [[nodiscard]] auto keys() const -> const std::vector<std::string>& {
        return keys_;
    }

    [[nodiscard]] auto key_at(size_t index) const -> const std::string& {
        return keys_.at(index);
    }
    [[nodiscard]] auto value_at(size_t index) const -> const JsonValue&;

    [[nodiscard]] auto clone() const -> JsonObject;

    /// Key-set and per-key value equality; key order is ignored.
    [[nodiscard]] auto operator==(const JsonObject& other) const -> bool;
    [[nodiscard]] auto operator!=(const JsonObject& other) const -> bool {
        return !(*this == other);
    }

private:
    std::vector<std::string> keys_;
    std::vector<JsonValue> values_;
    std::unordered_map<std::string, size_t> index_;
};

/// A JSON value.
///
/// `JsonValue` is move-only because arrays and objects are boxed. Use
/// `clone()` for a deep copy.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      JsonPrimitive,    // boolean, number, string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(JsonPrimitive value) : data(std::move(value)) {}

    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_primitive() const -> bool {
        return std::holds_alternative<JsonPrimitive>(data);
    }

    /// True for a quoted string primitive.
    [[nodiscard]] auto is_string() const -> bool {
        const auto* primitive = std::get_if<JsonPrimitive>(&data);
        return primitive && primitive->is_string;
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// Short type name for messages: `null`, `primitive`, `array` or `object`.
    [[nodiscard]] auto type_name() const -> const char*;

    // ========================================================================
    // Accessors
    // ========================================================================

    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a primitive.
    [[nodiscard]] auto as_primitive() const -> const JsonPrimitive& {
        return std::get<JsonPrimitive>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Gets a value from an object by key; `nullptr` if this is not an object
    /// or the key is absent.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue* {
        if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->get(key);
        }
        return nullptr;
    }

    /// # Panics
    ///
    /// Throws if this is not an array or `index` is out of bounds.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Size of an array or object; `0` for other values.
    [[nodiscard]] auto size() const -> size_t;

    // ========================================================================
    // Mutation
    // ========================================================================

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(std::string key, JsonValue value) {
        as_object_mut().set(std::move(key), std::move(value));
    }

    // ========================================================================
    // Serialization (json_writer.cpp)
    // ========================================================================

    /// Compact JSON text. Primitives are written from their literal text.
    [[nodiscard]] auto to_string() const -> std::string;

    /// JSON text with one element per line, indented by `indent`.
    [[nodiscard]] auto to_string_pretty(const std::string& indent = "    ") const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    // ========================================================================
    // Copy and Comparison
    // ========================================================================

    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(JsonPrimitive{value ? "true" : "false", false});
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(JsonPrimitive{std::to_string(value), false});
}

/// A number primitive from a double, written in its shortest round-trip
/// form. Non-finite values become `NaN`, `Infinity` or `-Infinity`.
[[nodiscard]] auto json_double(double value) -> JsonValue;

/// A number primitive from literal text, e.g. `json_number("1.50")`.
inline auto json_number(std::string literal) -> JsonValue {
    return JsonValue(JsonPrimitive{std::move(literal), false});
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(JsonPrimitive{std::move(value), true});
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace weft::json
