//! # Serial Descriptors
//!
//! A `SerialDescriptor` is an immutable description of a type's serialized
//! shape: its serial name, kind, nullability, annotations and, for structured
//! kinds, an ordered list of elements. Formats walk descriptors to decide how
//! a value is laid out; they never need to know how the descriptor was built.
//!
//! ## Element Addressing
//!
//! Elements are addressed by a 0-based index in `[0, elements_count())`.
//! Every index-taking accessor throws `std::out_of_range` for any other index.
//!
//! ## Equality
//!
//! Equality is structural: kind, serial name, nullability, annotations and
//! every element (name, optionality, alternative names, annotations and
//! element descriptor) must match, recursively. Self-referential descriptors
//! are handled with a visited-pair set, so comparing a recursive descriptor
//! with itself terminates.
//!
//! ## Example
//!
//! ```cpp
//! auto desc = DescriptorBuilder("app.Point")
//!                 .element("x", int_descriptor())
//!                 .element("y", int_descriptor())
//!                 .build();
//! unwrap(desc)->to_string(); // "app.Point(x: int, y: int)"
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/descriptor/serial_kind.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weft {

/// Opaque key-value annotation bag attached to descriptors and elements.
using Annotations = std::map<std::string, std::string>;

class SerialDescriptor;

/// Descriptors are immutable and shared.
using DescriptorPtr = Rc<const SerialDescriptor>;

/// Abstract schema of a serializable type.
///
/// Descriptors created by the factories in `descriptors.hpp` are owned by a
/// `DescriptorPtr`, so `weak_from_this()` can recover it.
class SerialDescriptor : public std::enable_shared_from_this<SerialDescriptor> {
public:
    virtual ~SerialDescriptor() = default;

    /// Non-blank identity of the described type.
    [[nodiscard]] virtual auto serial_name() const -> const std::string& = 0;

    [[nodiscard]] virtual auto kind() const -> SerialKind = 0;

    [[nodiscard]] virtual auto is_nullable() const -> bool {
        return false;
    }

    [[nodiscard]] virtual auto annotations() const -> const Annotations&;

    [[nodiscard]] virtual auto elements_count() const -> size_t {
        return 0;
    }

    /// Returns the primary name of element `index`.
    ///
    /// # Panics
    ///
    /// Throws `std::out_of_range` if `index >= elements_count()`.
    [[nodiscard]] virtual auto get_element_name(size_t index) const -> const std::string&;

    [[nodiscard]] virtual auto get_element_descriptor(size_t index) const -> DescriptorPtr;

    [[nodiscard]] virtual auto get_element_annotations(size_t index) const -> const Annotations&;

    /// True when the element may be absent from the input (it has a default).
    [[nodiscard]] virtual auto is_element_optional(size_t index) const -> bool;

    /// Additional names accepted for element `index` when decoding.
    [[nodiscard]] virtual auto get_element_alternative_names(size_t index) const
        -> const std::vector<std::string>&;

    /// Looks up an element by its primary name.
    [[nodiscard]] virtual auto get_element_index(std::string_view name) const
        -> std::optional<size_t>;

    /// Renders `Name(elem1: elemName1, elem2: elemName2)`.
    [[nodiscard]] virtual auto to_string() const -> std::string;

    /// Hash consistent with `operator==`. Does not recurse into element descriptors.
    [[nodiscard]] auto hash_code() const -> size_t;

    [[nodiscard]] auto operator==(const SerialDescriptor& other) const -> bool;

    [[nodiscard]] auto operator!=(const SerialDescriptor& other) const -> bool {
        return !(*this == other);
    }

protected:
    /// Throws `std::out_of_range` unless `index < elements_count()`.
    void check_element_index(size_t index) const;
};

/// Structural descriptor equality for shared pointers; null pointers are equal only to null.
[[nodiscard]] auto descriptors_equal(const DescriptorPtr& a, const DescriptorPtr& b) -> bool;

} // namespace weft
