//! # Input Coercion
//!
//! Decides, per present element, whether a decoder hands the value to the
//! serializer or substitutes absence or null for it.
//!
//! | Source value | Element | Outcome |
//! |--------------|---------|---------|
//! | `null` | optional, not nullable | `Skip` (the default applies) |
//! | unknown enum name | optional | `Skip` |
//! | unknown enum name | nullable, required, `explicit_nulls = false` | `ForceNull` |
//! | anything else | | `Decode` |
//!
//! Rules apply only with `coerce_input_values`.

#pragma once

#include "weft/descriptor/serial_descriptor.hpp"
#include "weft/json/json_configuration.hpp"

#include <optional>
#include <string>

namespace weft::json {

enum class CoercionOutcome {
    Decode,   ///< Decode the value as usual
    Skip,     ///< Treat the element as absent
    ForceNull ///< Decode the element as null
};

/// Applies the coercion rules to element `index` of `descriptor`.
///
/// # Arguments
///
/// * `is_null` - The source value is JSON null
/// * `string_value` - The source value as a string, if it is one
[[nodiscard]] auto try_coerce_value(const JsonConfiguration& config,
                                    const SerialDescriptor& descriptor, size_t index, bool is_null,
                                    const std::optional<std::string>& string_value)
    -> CoercionOutcome;

/// True if an absent element `index` is read as an explicit null: the element
/// is nullable and required, and `explicit_nulls` is off.
[[nodiscard]] auto absence_is_null(const JsonConfiguration& config,
                                   const SerialDescriptor& descriptor, size_t index) -> bool;

} // namespace weft::json
