#include "weft/json/json_configuration.hpp"

#include <cctype>
#include <optional>

namespace weft::json {

namespace {

/// Splits camelCase words with `delimiter`. A run of capitals is one word,
/// except for its last letter when a lowercase letter follows.
auto convert_camel_case(const std::string& serial_name, char delimiter) -> std::string {
    std::string out;
    out.reserve(serial_name.size() * 2);
    std::optional<char> buffered;
    int previous_upper_count = 0;

    for (char c : serial_name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isupper(uc)) {
            if (previous_upper_count == 0 && !out.empty() && out.back() != delimiter) {
                out += delimiter;
            }
            if (buffered) {
                out += *buffered;
            }
            ++previous_upper_count;
            buffered = static_cast<char>(std::tolower(uc));
        } else {
            if (buffered) {
                if (previous_upper_count > 1 && std::isalpha(uc)) {
                    out += delimiter;
                }
                out += *buffered;
                previous_upper_count = 0;
                buffered.reset();
            }
            out += c;
        }
    }
    if (buffered) {
        out += *buffered;
    }
    return out;
}

class CamelCaseSplitter final : public JsonNamingStrategy {
public:
    explicit CamelCaseSplitter(char delimiter) : delimiter_(delimiter) {}

    [[nodiscard]] auto serial_name_for_json(const SerialDescriptor& /*descriptor*/,
                                            size_t /*element_index*/,
                                            const std::string& serial_name) const
        -> std::string override {
        return convert_camel_case(serial_name, delimiter_);
    }

private:
    char delimiter_;
};

} // namespace

auto snake_case() -> Rc<const JsonNamingStrategy> {
    static const Rc<const JsonNamingStrategy> strategy = make_rc<CamelCaseSplitter>('_');
    return strategy;
}

auto kebab_case() -> Rc<const JsonNamingStrategy> {
    static const Rc<const JsonNamingStrategy> strategy = make_rc<CamelCaseSplitter>('-');
    return strategy;
}

auto validate_configuration(const JsonConfiguration& config) -> Result<bool, SerialError> {
    for (char c : config.pretty_print_indent) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return SerialError::make(ErrorKind::InvalidConfiguration,
                                     "Only whitespace, tab, newline and carriage return are "
                                     "allowed as pretty print symbols. Had '" +
                                         config.pretty_print_indent + "'");
        }
    }
    if (!config.pretty_print && config.pretty_print_indent != JsonConfiguration{}.pretty_print_indent) {
        return SerialError::make(ErrorKind::InvalidConfiguration,
                                 "Indent should not be specified when default printing mode is used");
    }
    bool blank = true;
    for (char c : config.class_discriminator) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            blank = false;
            break;
        }
    }
    if (blank) {
        return SerialError::make(ErrorKind::InvalidConfiguration,
                                 "Class discriminator must not be blank");
    }
    return true;
}

} // namespace weft::json
