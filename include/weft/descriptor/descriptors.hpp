//! # Descriptor Implementations and Factories
//!
//! Concrete descriptor types and the functions that build them:
//!
//! | Factory | Kind | Elements |
//! |---------|------|----------|
//! | `int_descriptor()` and friends | primitive | none |
//! | `primitive_descriptor(name, kind)` | primitive | none |
//! | `DescriptorBuilder` | Class, Object, Enum, Sealed, Open | declared |
//! | `enum_descriptor(name, entries)` | Enum | one Object per entry |
//! | `list_descriptor(name, element)` | List | `"0"` |
//! | `map_descriptor(name, key, value)` | Map | `"0"`, `"1"` |
//! | `nullable(desc)` | same as `desc` | same as `desc` |
//! | `make_descriptor(name, delegate)` | same as `delegate` | same as `delegate` |
//!
//! Builtin primitive descriptors reserve the names `bool`, `byte`, `short`,
//! `int`, `long`, `float`, `double`, `char` and `string`. No user descriptor
//! may take one of these names.

#pragma once

#include "weft/core/serial_error.hpp"
#include "weft/descriptor/serial_descriptor.hpp"

#include <functional>
#include <mutex>
#include <unordered_map>

namespace weft {

// ============================================================================
// Primitive Descriptors
// ============================================================================

/// Descriptor of a leaf value.
class PrimitiveDescriptor : public SerialDescriptor {
public:
    PrimitiveDescriptor(std::string serial_name, SerialKind kind)
        : name_(std::move(serial_name)), kind_(kind) {}

    [[nodiscard]] auto serial_name() const -> const std::string& override {
        return name_;
    }
    [[nodiscard]] auto kind() const -> SerialKind override {
        return kind_;
    }

private:
    std::string name_;
    SerialKind kind_;
};

[[nodiscard]] auto boolean_descriptor() -> DescriptorPtr;
[[nodiscard]] auto byte_descriptor() -> DescriptorPtr;
[[nodiscard]] auto short_descriptor() -> DescriptorPtr;
[[nodiscard]] auto int_descriptor() -> DescriptorPtr;
[[nodiscard]] auto long_descriptor() -> DescriptorPtr;
[[nodiscard]] auto float_descriptor() -> DescriptorPtr;
[[nodiscard]] auto double_descriptor() -> DescriptorPtr;
[[nodiscard]] auto char_descriptor() -> DescriptorPtr;
[[nodiscard]] auto string_descriptor() -> DescriptorPtr;

/// True if `name` is reserved by a builtin primitive descriptor.
[[nodiscard]] auto is_builtin_serial_name(std::string_view name) -> bool;

/// Creates a custom primitive descriptor, e.g. `("app.DateAsLong", SerialKind::Long)`.
///
/// Fails with `InvalidDescriptor` if the name is blank or reserved, or if
/// `kind` is not a primitive kind.
[[nodiscard]] auto primitive_descriptor(std::string serial_name, SerialKind kind)
    -> Result<DescriptorPtr, SerialError>;

// ============================================================================
// Class-like Descriptors
// ============================================================================

/// Resolves an element descriptor on first use. Used for recursive types.
using DescriptorProvider = std::function<DescriptorPtr()>;

/// Per-element metadata accepted by `DescriptorBuilder::element`.
struct ElementOptions {
    /// The element may be absent from the input.
    bool optional = false;

    /// Extra names accepted when decoding (`use_alternative_names`).
    std::vector<std::string> alternative_names;

    Annotations annotations;
};

/// Descriptor with a declared list of named elements.
///
/// Used for Class, Object, Enum and polymorphic kinds. Lazily provided element
/// descriptors are resolved once under `std::call_once` and then cached, so a
/// `ClassDescriptor` can be shared across threads.
class ClassDescriptor : public SerialDescriptor {
public:
    struct Element {
        std::string name;
        ElementOptions options;
        DescriptorProvider provider;
        mutable DescriptorPtr descriptor;
        mutable std::once_flag resolved;
    };

    ClassDescriptor(std::string serial_name, SerialKind kind, std::vector<Box<Element>> elements,
                    Annotations annotations);

    [[nodiscard]] auto serial_name() const -> const std::string& override {
        return name_;
    }
    [[nodiscard]] auto kind() const -> SerialKind override {
        return kind_;
    }
    [[nodiscard]] auto annotations() const -> const Annotations& override {
        return annotations_;
    }
    [[nodiscard]] auto elements_count() const -> size_t override {
        return elements_.size();
    }

    [[nodiscard]] auto get_element_name(size_t index) const -> const std::string& override;
    [[nodiscard]] auto get_element_descriptor(size_t index) const -> DescriptorPtr override;
    [[nodiscard]] auto get_element_annotations(size_t index) const -> const Annotations& override;
    [[nodiscard]] auto is_element_optional(size_t index) const -> bool override;
    [[nodiscard]] auto get_element_alternative_names(size_t index) const
        -> const std::vector<std::string>& override;
    [[nodiscard]] auto get_element_index(std::string_view name) const
        -> std::optional<size_t> override;

private:
    std::string name_;
    SerialKind kind_;
    Annotations annotations_;
    std::vector<Box<Element>> elements_;
    std::unordered_map<std::string, size_t> indices_;
};

/// Builds a `ClassDescriptor`.
///
/// # Example
///
/// ```cpp
/// auto node = DescriptorBuilder("app.Node")
///                 .element("value", int_descriptor())
///                 .lazy_element("next", [] { return nullable(node_descriptor()); },
///                               {.optional = true})
///                 .build();
/// ```
class DescriptorBuilder {
public:
    explicit DescriptorBuilder(std::string serial_name, SerialKind kind = SerialKind::Class);

    auto element(std::string name, DescriptorPtr descriptor, ElementOptions options = {})
        -> DescriptorBuilder&;

    auto lazy_element(std::string name, DescriptorProvider provider, ElementOptions options = {})
        -> DescriptorBuilder&;

    auto annotation(std::string key, std::string value) -> DescriptorBuilder&;

    /// Validates and produces the descriptor.
    ///
    /// Fails with `InvalidDescriptor` on a blank or reserved serial name, a
    /// kind the builder cannot produce, a blank or duplicate element name, or
    /// a missing element descriptor.
    [[nodiscard]] auto build() -> Result<DescriptorPtr, SerialError>;

private:
    std::string name_;
    SerialKind kind_;
    Annotations annotations_;
    std::vector<Box<ClassDescriptor::Element>> elements_;
};

/// Builds an Enum descriptor whose elements are Object descriptors named
/// `<serial_name>.<entry>`.
[[nodiscard]] auto enum_descriptor(std::string serial_name, const std::vector<std::string>& entries)
    -> Result<DescriptorPtr, SerialError>;

// ============================================================================
// Collection Descriptors
// ============================================================================

/// List descriptor: one element named `"0"`.
class ListDescriptor : public SerialDescriptor {
public:
    ListDescriptor(std::string serial_name, DescriptorPtr element);

    [[nodiscard]] auto serial_name() const -> const std::string& override {
        return name_;
    }
    [[nodiscard]] auto kind() const -> SerialKind override {
        return SerialKind::List;
    }
    [[nodiscard]] auto elements_count() const -> size_t override {
        return 1;
    }
    [[nodiscard]] auto get_element_name(size_t index) const -> const std::string& override;
    [[nodiscard]] auto get_element_descriptor(size_t index) const -> DescriptorPtr override;
    [[nodiscard]] auto get_element_index(std::string_view name) const
        -> std::optional<size_t> override;
    [[nodiscard]] auto to_string() const -> std::string override;

private:
    std::string name_;
    DescriptorPtr element_;
};

/// Map descriptor: key element `"0"` and value element `"1"`.
class MapDescriptor : public SerialDescriptor {
public:
    MapDescriptor(std::string serial_name, DescriptorPtr key, DescriptorPtr value);

    [[nodiscard]] auto serial_name() const -> const std::string& override {
        return name_;
    }
    [[nodiscard]] auto kind() const -> SerialKind override {
        return SerialKind::Map;
    }
    [[nodiscard]] auto elements_count() const -> size_t override {
        return 2;
    }
    [[nodiscard]] auto get_element_name(size_t index) const -> const std::string& override;
    [[nodiscard]] auto get_element_descriptor(size_t index) const -> DescriptorPtr override;
    [[nodiscard]] auto get_element_index(std::string_view name) const
        -> std::optional<size_t> override;
    [[nodiscard]] auto to_string() const -> std::string override;

private:
    std::string name_;
    DescriptorPtr key_;
    DescriptorPtr value_;
};

[[nodiscard]] auto list_descriptor(std::string serial_name, DescriptorPtr element) -> DescriptorPtr;

[[nodiscard]] auto map_descriptor(std::string serial_name, DescriptorPtr key, DescriptorPtr value)
    -> DescriptorPtr;

// ============================================================================
// Delegating Descriptors
// ============================================================================

/// Base for descriptors that forward every structural query to another one.
class DelegatingDescriptor : public SerialDescriptor {
public:
    explicit DelegatingDescriptor(DescriptorPtr original) : original_(std::move(original)) {}

    [[nodiscard]] auto kind() const -> SerialKind override {
        return original_->kind();
    }
    [[nodiscard]] auto is_nullable() const -> bool override {
        return original_->is_nullable();
    }
    [[nodiscard]] auto annotations() const -> const Annotations& override {
        return original_->annotations();
    }
    [[nodiscard]] auto elements_count() const -> size_t override {
        return original_->elements_count();
    }
    [[nodiscard]] auto get_element_name(size_t index) const -> const std::string& override {
        return original_->get_element_name(index);
    }
    [[nodiscard]] auto get_element_descriptor(size_t index) const -> DescriptorPtr override {
        return original_->get_element_descriptor(index);
    }
    [[nodiscard]] auto get_element_annotations(size_t index) const -> const Annotations& override {
        return original_->get_element_annotations(index);
    }
    [[nodiscard]] auto is_element_optional(size_t index) const -> bool override {
        return original_->is_element_optional(index);
    }
    [[nodiscard]] auto get_element_alternative_names(size_t index) const
        -> const std::vector<std::string>& override {
        return original_->get_element_alternative_names(index);
    }
    [[nodiscard]] auto get_element_index(std::string_view name) const
        -> std::optional<size_t> override {
        return original_->get_element_index(name);
    }

    [[nodiscard]] auto original() const -> const DescriptorPtr& {
        return original_;
    }

private:
    DescriptorPtr original_;
};

/// Nullable view of a descriptor. Its serial name is the original's plus `?`.
class NullableDescriptor : public DelegatingDescriptor {
public:
    explicit NullableDescriptor(DescriptorPtr original);

    [[nodiscard]] auto serial_name() const -> const std::string& override {
        return name_;
    }
    [[nodiscard]] auto is_nullable() const -> bool override {
        return true;
    }
    [[nodiscard]] auto to_string() const -> std::string override;

private:
    std::string name_;
};

/// A descriptor with the structure of another one under a different name.
class WrappedDescriptor : public DelegatingDescriptor {
public:
    WrappedDescriptor(std::string serial_name, DescriptorPtr original)
        : DelegatingDescriptor(std::move(original)), name_(std::move(serial_name)) {}

    [[nodiscard]] auto serial_name() const -> const std::string& override {
        return name_;
    }

private:
    std::string name_;
};

/// Returns a nullable view of `descriptor`; nullable input is returned unchanged.
[[nodiscard]] auto nullable(DescriptorPtr descriptor) -> DescriptorPtr;

/// Wraps `delegate` under a new serial name.
///
/// Fails with `InvalidDescriptor` if `serial_name` is blank, equals the
/// delegate's serial name, or is a reserved builtin name.
[[nodiscard]] auto make_descriptor(std::string serial_name, DescriptorPtr delegate)
    -> Result<DescriptorPtr, SerialError>;

} // namespace weft
