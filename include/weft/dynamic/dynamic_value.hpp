//! # Dynamic Values
//!
//! `DynamicValue` is a read-only view of a host object graph, shaped like
//! the values of a dynamically typed language:
//!
//! | Kind | Accessors |
//! |------|-----------|
//! | `Null` | - |
//! | `Bool` | `as_bool` |
//! | `Number` | `as_number` (always a double) |
//! | `Text` | `as_text` |
//! | `Sequence` | `length`, `at` (nullptr for a hole) |
//! | `Mapping` | `keys`, `get` (nullptr for an undefined entry) |
//!
//! Hosts adapt their own objects by implementing the interface.
//! `NativeValue` is an owning implementation for values built in C++.

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_value.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace weft::dynamic {

enum class DynamicKind { Null, Bool, Number, Text, Sequence, Mapping };

/// Short name of a kind for messages: `null`, `boolean`, `number`,
/// `string`, `array` or `object`.
[[nodiscard]] auto kind_name(DynamicKind kind) -> const char*;

class DynamicValue {
public:
    virtual ~DynamicValue() = default;

    [[nodiscard]] virtual auto kind() const -> DynamicKind = 0;

    [[nodiscard]] virtual auto as_bool() const -> bool = 0;
    [[nodiscard]] virtual auto as_number() const -> double = 0;
    [[nodiscard]] virtual auto as_text() const -> const std::string& = 0;

    /// Mapping keys in insertion order, including keys of undefined entries.
    [[nodiscard]] virtual auto keys() const -> std::vector<std::string> = 0;

    /// Mapping entry under `key`, or nullptr if undefined.
    [[nodiscard]] virtual auto get(const std::string& key) const -> const DynamicValue* = 0;

    [[nodiscard]] virtual auto length() const -> size_t = 0;

    /// Sequence item `index`, or nullptr for a hole.
    [[nodiscard]] virtual auto at(size_t index) const -> const DynamicValue* = 0;

    [[nodiscard]] auto is_null() const -> bool {
        return kind() == DynamicKind::Null;
    }

    /// Rendering for error messages, e.g. `42`, `"x"`, `[...]`.
    [[nodiscard]] auto describe() const -> std::string;
};

/// An owned dynamic value.
///
/// Accessors of the wrong kind throw `std::bad_variant_access`.
///
/// # Example
///
/// ```cpp
/// auto point = NativeValue::mapping();
/// point.set("x", NativeValue::number(1));
/// point.set("y", NativeValue::number(2));
/// ```
class NativeValue final : public DynamicValue {
public:
    using Sequence = std::vector<Box<NativeValue>>;
    using Mapping = std::vector<std::pair<std::string, Box<NativeValue>>>;

    NativeValue() = default;

    [[nodiscard]] static auto null() -> NativeValue {
        return NativeValue();
    }
    [[nodiscard]] static auto boolean(bool value) -> NativeValue;
    [[nodiscard]] static auto number(double value) -> NativeValue;
    [[nodiscard]] static auto text(std::string value) -> NativeValue;
    [[nodiscard]] static auto sequence() -> NativeValue;
    [[nodiscard]] static auto mapping() -> NativeValue;

    [[nodiscard]] auto kind() const -> DynamicKind override;
    [[nodiscard]] auto as_bool() const -> bool override;
    [[nodiscard]] auto as_number() const -> double override;
    [[nodiscard]] auto as_text() const -> const std::string& override;
    [[nodiscard]] auto keys() const -> std::vector<std::string> override;
    [[nodiscard]] auto get(const std::string& key) const -> const DynamicValue* override;
    [[nodiscard]] auto length() const -> size_t override;
    [[nodiscard]] auto at(size_t index) const -> const DynamicValue* override;

    /// Appends an item to a sequence.
    void push(NativeValue value);

    /// Appends a hole to a sequence.
    void push_hole();

    /// Sets a mapping entry; an existing key keeps its position.
    void set(std::string key, NativeValue value);

    /// Declares a mapping key whose entry is undefined.
    void set_undefined(std::string key);

private:
    auto entry(const std::string& key) -> Box<NativeValue>*;

    std::variant<std::monostate, bool, double, std::string, Sequence, Mapping> data_;
};

/// Converts a JSON tree the way a host `JSON.parse` would: numbers become
/// doubles, non-string literals other than `true` and `false` become text.
[[nodiscard]] auto native_from_json(const json::JsonValue& value) -> NativeValue;

} // namespace weft::dynamic
