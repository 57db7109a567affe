//! # JSON Configuration
//!
//! `JsonConfiguration` holds every option of a `Json` instance as a plain
//! named field. A configuration is validated once by `Json::make` and then
//! shared read-only; a variant is made by copying and changing fields:
//!
//! ```cpp
//! JsonConfiguration config;
//! config.is_lenient = true;
//! config.naming_strategy = snake_case();
//! auto json = Json::make(config);
//! ```
//!
//! ## Options
//!
//! | Field | Default | Effect |
//! |-------|---------|--------|
//! | `encode_defaults` | false | Serializers write elements holding their default |
//! | `ignore_unknown_keys` | true | false: unknown object keys fail with `UnknownKey` |
//! | `is_lenient` | false | Unquoted keys and strings, single quotes, relaxed literals |
//! | `allow_comments` | false | `//` and `/* */` comments are skipped |
//! | `allow_trailing_comma` | false | `[1,2,]` and `{"a":1,}` are accepted |
//! | `allow_special_floating_point_values` | false | NaN and Infinity are read and written |
//! | `coerce_input_values` | false | Nulls and unknown enum values fall back to defaults |
//! | `explicit_nulls` | true | false: nulls are not written, absent nullables read as null |
//! | `use_alternative_names` | true | Alternative element names are accepted on input |
//! | `use_array_polymorphism` | false | `[type, value]` instead of a discriminator key |
//! | `class_discriminator` | `"type"` | Discriminator key for polymorphic objects |
//! | `pretty_print` | false | One item per line |
//! | `pretty_print_indent` | 4 spaces | Indentation unit of pretty output |
//! | `naming_strategy` | none | Renames Class elements on input and output |
//! | `decode_enums_case_insensitive` | false | Enum names match regardless of case |

#pragma once

#include "weft/common.hpp"
#include "weft/core/serial_error.hpp"
#include "weft/descriptor/serial_descriptor.hpp"

#include <string>

namespace weft::json {

/// Maps an element's serial name to the name used in JSON.
///
/// Applied to elements of Class-kind descriptors only, on both input and
/// output. Implementations must be deterministic and thread safe.
class JsonNamingStrategy {
public:
    virtual ~JsonNamingStrategy() = default;

    [[nodiscard]] virtual auto serial_name_for_json(const SerialDescriptor& descriptor,
                                                    size_t element_index,
                                                    const std::string& serial_name) const
        -> std::string = 0;
};

/// `someFieldName` becomes `some_field_name`, `URLMapping` becomes `url_mapping`.
[[nodiscard]] auto snake_case() -> Rc<const JsonNamingStrategy>;

/// `someFieldName` becomes `some-field-name`.
[[nodiscard]] auto kebab_case() -> Rc<const JsonNamingStrategy>;

class NamesMapCache;

/// Options of a `Json` instance.
struct JsonConfiguration {
    bool encode_defaults = false;
    bool ignore_unknown_keys = true;
    bool is_lenient = false;
    bool allow_comments = false;
    bool allow_trailing_comma = false;
    bool allow_special_floating_point_values = false;
    bool coerce_input_values = false;
    bool explicit_nulls = true;
    bool use_alternative_names = true;
    bool use_array_polymorphism = false;
    std::string class_discriminator = "type";
    bool pretty_print = false;
    std::string pretty_print_indent = "    ";
    Rc<const JsonNamingStrategy> naming_strategy;
    bool decode_enums_case_insensitive = false;

    /// Names maps of the descriptors this configuration has decoded. Set by
    /// `Json::make`; without it, names maps are built on each lookup.
    Rc<NamesMapCache> names_cache;
};

/// Checks a configuration before it is used.
///
/// Fails with `InvalidConfiguration` when the indent contains anything but
/// spaces, tabs, `\r` or `\n`, when a custom indent is set without
/// `pretty_print`, or when the class discriminator is blank.
[[nodiscard]] auto validate_configuration(const JsonConfiguration& config)
    -> Result<bool, SerialError>;

} // namespace weft::json
