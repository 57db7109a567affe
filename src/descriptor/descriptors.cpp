//! # Descriptor Implementations
//!
//! Builtin primitive descriptors, `ClassDescriptor` and its builder, the
//! collection descriptors and the delegating wrappers.

#include "weft/descriptor/descriptors.hpp"

#include "weft/log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace weft {

namespace {

constexpr std::array<std::string_view, 9> BUILTIN_NAMES = {
    "bool", "byte", "short", "int", "long", "float", "double", "char", "string"};

const std::string LIST_ELEMENT_NAME = "0";
const std::string MAP_KEY_NAME = "0";
const std::string MAP_VALUE_NAME = "1";

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

auto builtin(std::string_view name, SerialKind kind) -> DescriptorPtr {
    return make_rc<PrimitiveDescriptor>(std::string(name), kind);
}

auto invalid(std::string message) -> SerialError {
    WEFT_LOG_DEBUG("descriptor", message);
    return SerialError::make(ErrorKind::InvalidDescriptor, std::move(message));
}

auto parse_index(std::string_view name) -> std::optional<size_t> {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
    if (ec != std::errc() || ptr != name.data() + name.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

// ============================================================================
// Primitive Descriptors
// ============================================================================

auto boolean_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("bool", SerialKind::Boolean);
    return desc;
}

auto byte_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("byte", SerialKind::Byte);
    return desc;
}

auto short_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("short", SerialKind::Short);
    return desc;
}

auto int_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("int", SerialKind::Int);
    return desc;
}

auto long_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("long", SerialKind::Long);
    return desc;
}

auto float_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("float", SerialKind::Float);
    return desc;
}

auto double_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("double", SerialKind::Double);
    return desc;
}

auto char_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("char", SerialKind::Char);
    return desc;
}

auto string_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = builtin("string", SerialKind::String);
    return desc;
}

auto is_builtin_serial_name(std::string_view name) -> bool {
    return std::find(BUILTIN_NAMES.begin(), BUILTIN_NAMES.end(), name) != BUILTIN_NAMES.end();
}

auto primitive_descriptor(std::string serial_name, SerialKind kind)
    -> Result<DescriptorPtr, SerialError> {
    if (is_blank(serial_name)) {
        return invalid("Blank serial names are prohibited");
    }
    if (is_builtin_serial_name(serial_name)) {
        return invalid("The name '" + serial_name + "' is reserved by a builtin descriptor");
    }
    if (!is_primitive_kind(kind)) {
        return invalid("Kind " + std::string(kind_name(kind)) + " of '" + serial_name +
                       "' is not a primitive kind");
    }
    return DescriptorPtr(make_rc<PrimitiveDescriptor>(std::move(serial_name), kind));
}

// ============================================================================
// ClassDescriptor
// ============================================================================

ClassDescriptor::ClassDescriptor(std::string serial_name, SerialKind kind,
                                 std::vector<Box<Element>> elements, Annotations annotations)
    : name_(std::move(serial_name)), kind_(kind), annotations_(std::move(annotations)),
      elements_(std::move(elements)) {
    for (size_t i = 0; i < elements_.size(); ++i) {
        indices_.emplace(elements_[i]->name, i);
    }
}

auto ClassDescriptor::get_element_name(size_t index) const -> const std::string& {
    check_element_index(index);
    return elements_[index]->name;
}

auto ClassDescriptor::get_element_descriptor(size_t index) const -> DescriptorPtr {
    check_element_index(index);
    const auto& element = *elements_[index];
    std::call_once(element.resolved, [&element] {
        if (!element.descriptor) {
            element.descriptor = element.provider();
        }
    });
    if (!element.descriptor) {
        throw std::logic_error("Descriptor provider for element '" + element.name + "' of " +
                               name_ + " returned null");
    }
    return element.descriptor;
}

auto ClassDescriptor::get_element_annotations(size_t index) const -> const Annotations& {
    check_element_index(index);
    return elements_[index]->options.annotations;
}

auto ClassDescriptor::is_element_optional(size_t index) const -> bool {
    check_element_index(index);
    return elements_[index]->options.optional;
}

auto ClassDescriptor::get_element_alternative_names(size_t index) const
    -> const std::vector<std::string>& {
    check_element_index(index);
    return elements_[index]->options.alternative_names;
}

auto ClassDescriptor::get_element_index(std::string_view name) const -> std::optional<size_t> {
    auto it = indices_.find(std::string(name));
    if (it == indices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// DescriptorBuilder
// ============================================================================

DescriptorBuilder::DescriptorBuilder(std::string serial_name, SerialKind kind)
    : name_(std::move(serial_name)), kind_(kind) {}

auto DescriptorBuilder::element(std::string name, DescriptorPtr descriptor,
                                ElementOptions options) -> DescriptorBuilder& {
    auto element = make_box<ClassDescriptor::Element>();
    element->name = std::move(name);
    element->options = std::move(options);
    element->descriptor = std::move(descriptor);
    elements_.push_back(std::move(element));
    return *this;
}

auto DescriptorBuilder::lazy_element(std::string name, DescriptorProvider provider,
                                     ElementOptions options) -> DescriptorBuilder& {
    auto element = make_box<ClassDescriptor::Element>();
    element->name = std::move(name);
    element->options = std::move(options);
    element->provider = std::move(provider);
    elements_.push_back(std::move(element));
    return *this;
}

auto DescriptorBuilder::annotation(std::string key, std::string value) -> DescriptorBuilder& {
    annotations_[std::move(key)] = std::move(value);
    return *this;
}

auto DescriptorBuilder::build() -> Result<DescriptorPtr, SerialError> {
    if (is_blank(name_)) {
        return invalid("Blank serial names are prohibited");
    }
    if (is_builtin_serial_name(name_)) {
        return invalid("The name '" + name_ + "' is reserved by a builtin descriptor");
    }
    switch (kind_) {
    case SerialKind::Class:
    case SerialKind::Object:
    case SerialKind::Enum:
    case SerialKind::Sealed:
    case SerialKind::Open:
        break;
    default:
        return invalid("DescriptorBuilder cannot build kind " + std::string(kind_name(kind_)) +
                       " for '" + name_ + "'");
    }

    std::unordered_map<std::string, size_t> seen;
    for (size_t i = 0; i < elements_.size(); ++i) {
        const auto& element = *elements_[i];
        if (is_blank(element.name)) {
            return invalid("Element " + std::to_string(i) + " of '" + name_ +
                           "' has a blank name");
        }
        if (!seen.emplace(element.name, i).second) {
            return invalid("Element name '" + element.name + "' is declared twice in '" + name_ +
                           "'");
        }
        if (!element.descriptor && !element.provider) {
            return invalid("Element '" + element.name + "' of '" + name_ +
                           "' has no descriptor");
        }
    }

    WEFT_LOG_TRACE("descriptor", "Built " << kind_name(kind_) << " descriptor '" << name_
                                          << "' with " << elements_.size() << " elements");
    return DescriptorPtr(make_rc<ClassDescriptor>(std::move(name_), kind_, std::move(elements_),
                                                  std::move(annotations_)));
}

auto enum_descriptor(std::string serial_name, const std::vector<std::string>& entries)
    -> Result<DescriptorPtr, SerialError> {
    DescriptorBuilder builder(serial_name, SerialKind::Enum);
    for (const auto& entry : entries) {
        auto entry_desc = DescriptorBuilder(serial_name + "." + entry, SerialKind::Object).build();
        if (is_err(entry_desc)) {
            return unwrap_err(entry_desc);
        }
        builder.element(entry, unwrap(entry_desc));
    }
    return builder.build();
}

// ============================================================================
// Collection Descriptors
// ============================================================================

ListDescriptor::ListDescriptor(std::string serial_name, DescriptorPtr element)
    : name_(std::move(serial_name)), element_(std::move(element)) {}

auto ListDescriptor::get_element_name(size_t index) const -> const std::string& {
    check_element_index(index);
    return LIST_ELEMENT_NAME;
}

auto ListDescriptor::get_element_descriptor(size_t index) const -> DescriptorPtr {
    check_element_index(index);
    return element_;
}

auto ListDescriptor::get_element_index(std::string_view name) const -> std::optional<size_t> {
    return parse_index(name);
}

auto ListDescriptor::to_string() const -> std::string {
    return name_ + "(" + element_->to_string() + ")";
}

MapDescriptor::MapDescriptor(std::string serial_name, DescriptorPtr key, DescriptorPtr value)
    : name_(std::move(serial_name)), key_(std::move(key)), value_(std::move(value)) {}

auto MapDescriptor::get_element_name(size_t index) const -> const std::string& {
    check_element_index(index);
    return index == 0 ? MAP_KEY_NAME : MAP_VALUE_NAME;
}

auto MapDescriptor::get_element_descriptor(size_t index) const -> DescriptorPtr {
    check_element_index(index);
    return index == 0 ? key_ : value_;
}

auto MapDescriptor::get_element_index(std::string_view name) const -> std::optional<size_t> {
    return parse_index(name);
}

auto MapDescriptor::to_string() const -> std::string {
    return name_ + "(" + key_->to_string() + ", " + value_->to_string() + ")";
}

auto list_descriptor(std::string serial_name, DescriptorPtr element) -> DescriptorPtr {
    return make_rc<ListDescriptor>(std::move(serial_name), std::move(element));
}

auto map_descriptor(std::string serial_name, DescriptorPtr key, DescriptorPtr value)
    -> DescriptorPtr {
    return make_rc<MapDescriptor>(std::move(serial_name), std::move(key), std::move(value));
}

// ============================================================================
// Delegating Descriptors
// ============================================================================

NullableDescriptor::NullableDescriptor(DescriptorPtr original)
    : DelegatingDescriptor(original), name_(original->serial_name() + "?") {}

auto NullableDescriptor::to_string() const -> std::string {
    return original()->to_string() + "?";
}

auto nullable(DescriptorPtr descriptor) -> DescriptorPtr {
    if (descriptor->is_nullable()) {
        return descriptor;
    }
    return make_rc<NullableDescriptor>(std::move(descriptor));
}

auto make_descriptor(std::string serial_name, DescriptorPtr delegate)
    -> Result<DescriptorPtr, SerialError> {
    if (is_blank(serial_name)) {
        return invalid("Blank serial names are prohibited");
    }
    if (serial_name == delegate->serial_name()) {
        return invalid("The name of the wrapped descriptor (" + serial_name +
                       ") cannot be the same as the name of the original descriptor (" +
                       delegate->serial_name() + ")");
    }
    if (is_builtin_serial_name(serial_name)) {
        return invalid("The name '" + serial_name +
                       "' collides with a builtin primitive descriptor");
    }
    return DescriptorPtr(make_rc<WrappedDescriptor>(std::move(serial_name), std::move(delegate)));
}

} // namespace weft
