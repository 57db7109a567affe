#include "weft/encoding/structure.hpp"

namespace weft {

auto missing_fields_error(const SerialDescriptor& descriptor, const std::vector<bool>& seen)
    -> std::optional<SerialError> {
    std::vector<std::string> missing;
    for (size_t i = 0; i < descriptor.elements_count(); ++i) {
        bool decoded = i < seen.size() && seen[i];
        if (!decoded && !descriptor.is_element_optional(i)) {
            missing.push_back(descriptor.get_element_name(i));
        }
    }
    if (missing.empty()) {
        return std::nullopt;
    }

    std::string message;
    if (missing.size() == 1) {
        message = "Field '" + missing.front() + "' is required for type with serial name '" +
                  descriptor.serial_name() + "', but it was missing";
    } else {
        std::string names;
        for (const auto& name : missing) {
            names += names.empty() ? name : ", " + name;
        }
        message = "Fields [" + names + "] are required for type with serial name '" +
                  descriptor.serial_name() + "', but they were missing";
    }
    return SerialError::make(ErrorKind::MissingRequiredValue, std::move(message));
}

} // namespace weft
