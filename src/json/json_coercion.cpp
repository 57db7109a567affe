#include "weft/json/json_coercion.hpp"

#include "weft/json/json_names.hpp"
#include "weft/log/log.hpp"

namespace weft::json {

auto try_coerce_value(const JsonConfiguration& config, const SerialDescriptor& descriptor,
                      size_t index, bool is_null, const std::optional<std::string>& string_value)
    -> CoercionOutcome {
    if (!config.coerce_input_values) {
        return CoercionOutcome::Decode;
    }

    const bool optional = descriptor.is_element_optional(index);
    DescriptorPtr element = descriptor.get_element_descriptor(index);
    if (optional && !element->is_nullable() && is_null) {
        WEFT_LOG_DEBUG("json", "Coerced null of " << descriptor.serial_name() << "."
                                                  << descriptor.get_element_name(index)
                                                  << " to its default");
        return CoercionOutcome::Skip;
    }

    if (element->kind() != SerialKind::Enum) {
        return CoercionOutcome::Decode;
    }
    if (element->is_nullable() && is_null) {
        return CoercionOutcome::Decode;
    }
    if (!string_value) {
        return CoercionOutcome::Decode;
    }

    // A names map that cannot be built is reported by the regular enum decode.
    auto enum_index = get_json_name_index(config, *element, *string_value);
    if (is_err(enum_index) || unwrap(enum_index)) {
        return CoercionOutcome::Decode;
    }

    const bool coerce_to_null = !config.explicit_nulls && element->is_nullable();
    if (!optional && coerce_to_null) {
        WEFT_LOG_DEBUG("json", "Coerced unknown enum value '" << *string_value << "' to null");
        return CoercionOutcome::ForceNull;
    }
    if (optional) {
        WEFT_LOG_DEBUG("json", "Coerced unknown enum value '" << *string_value
                                                              << "' to its default");
        return CoercionOutcome::Skip;
    }
    return CoercionOutcome::Decode;
}

auto absence_is_null(const JsonConfiguration& config, const SerialDescriptor& descriptor,
                     size_t index) -> bool {
    return !config.explicit_nulls && !descriptor.is_element_optional(index) &&
           descriptor.get_element_descriptor(index)->is_nullable();
}

} // namespace weft::json
