//! # Descriptor Base Implementation
//!
//! Default element accessors, structural equality with cycle tolerance,
//! hashing and string rendering shared by every descriptor.

#include "weft/descriptor/serial_descriptor.hpp"

#include <functional>
#include <set>
#include <stdexcept>
#include <utility>

namespace weft {

namespace {

const Annotations EMPTY_ANNOTATIONS;
const std::vector<std::string> EMPTY_NAMES;

using VisitedPairs = std::set<std::pair<const SerialDescriptor*, const SerialDescriptor*>>;

auto structurally_equal(const SerialDescriptor& a, const SerialDescriptor& b, VisitedPairs& visited)
    -> bool {
    if (&a == &b) {
        return true;
    }
    // A pair already under comparison is assumed equal; any real difference
    // is found on the path that first reached it.
    if (!visited.emplace(&a, &b).second) {
        return true;
    }

    if (a.kind() != b.kind() || a.serial_name() != b.serial_name() ||
        a.is_nullable() != b.is_nullable() || a.annotations() != b.annotations() ||
        a.elements_count() != b.elements_count()) {
        return false;
    }

    for (size_t i = 0; i < a.elements_count(); ++i) {
        if (a.get_element_name(i) != b.get_element_name(i) ||
            a.is_element_optional(i) != b.is_element_optional(i) ||
            a.get_element_annotations(i) != b.get_element_annotations(i) ||
            a.get_element_alternative_names(i) != b.get_element_alternative_names(i)) {
            return false;
        }
        auto ea = a.get_element_descriptor(i);
        auto eb = b.get_element_descriptor(i);
        if (!structurally_equal(*ea, *eb, visited)) {
            return false;
        }
    }
    return true;
}

void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

// ============================================================================
// Default Element Accessors
// ============================================================================

auto SerialDescriptor::annotations() const -> const Annotations& {
    return EMPTY_ANNOTATIONS;
}

void SerialDescriptor::check_element_index(size_t index) const {
    if (index >= elements_count()) {
        throw std::out_of_range("Element index " + std::to_string(index) +
                                " is out of range for " + serial_name() + " with " +
                                std::to_string(elements_count()) + " elements");
    }
}

auto SerialDescriptor::get_element_name(size_t index) const -> const std::string& {
    check_element_index(index);
    throw std::logic_error(serial_name() + " does not define element names");
}

auto SerialDescriptor::get_element_descriptor(size_t index) const -> DescriptorPtr {
    check_element_index(index);
    throw std::logic_error(serial_name() + " does not define element descriptors");
}

auto SerialDescriptor::get_element_annotations(size_t index) const -> const Annotations& {
    check_element_index(index);
    return EMPTY_ANNOTATIONS;
}

auto SerialDescriptor::is_element_optional(size_t index) const -> bool {
    check_element_index(index);
    return false;
}

auto SerialDescriptor::get_element_alternative_names(size_t index) const
    -> const std::vector<std::string>& {
    check_element_index(index);
    return EMPTY_NAMES;
}

auto SerialDescriptor::get_element_index(std::string_view /*name*/) const
    -> std::optional<size_t> {
    return std::nullopt;
}

// ============================================================================
// Rendering, Hashing, Equality
// ============================================================================

auto SerialDescriptor::to_string() const -> std::string {
    if (is_primitive_kind(kind())) {
        return serial_name();
    }
    std::string out = serial_name() + "(";
    for (size_t i = 0; i < elements_count(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += get_element_name(i) + ": " + get_element_descriptor(i)->serial_name();
    }
    out += ")";
    return out;
}

auto SerialDescriptor::hash_code() const -> size_t {
    std::hash<std::string> hash_string;
    size_t seed = hash_string(serial_name());
    hash_combine(seed, static_cast<size_t>(kind()));
    hash_combine(seed, is_nullable() ? 1 : 0);
    for (size_t i = 0; i < elements_count(); ++i) {
        hash_combine(seed, hash_string(get_element_name(i)));
        hash_combine(seed, hash_string(get_element_descriptor(i)->serial_name()));
    }
    return seed;
}

auto SerialDescriptor::operator==(const SerialDescriptor& other) const -> bool {
    VisitedPairs visited;
    return structurally_equal(*this, other, visited);
}

auto descriptors_equal(const DescriptorPtr& a, const DescriptorPtr& b) -> bool {
    if (!a || !b) {
        return !a && !b;
    }
    return *a == *b;
}

} // namespace weft
