//! # Structure Helpers
//!
//! Helpers for hand-written class serializers: the element loop every class
//! deserializer runs, and the error reported for absent required elements.
//!
//! ```cpp
//! Point point;
//! auto seen = decode_structure(decoder, desc, [&](CompositeDecoder& in, size_t index)
//!                                                 -> Result<bool, SerialError> {
//!     auto value = in.decode_int_element(*desc, index);
//!     if (is_err(value)) return unwrap_err(value);
//!     (index == 0 ? point.x : point.y) = unwrap(value);
//!     return true;
//! });
//! if (is_err(seen)) return unwrap_err(seen);
//! if (auto missing = missing_fields_error(*desc, unwrap(seen))) return *missing;
//! ```

#pragma once

#include "weft/encoding/decoder.hpp"

#include <optional>
#include <vector>

namespace weft {

/// Returns a `MissingRequiredValue` error naming every non-optional element
/// of `descriptor` whose `seen` flag is false, or nullopt if none is missing.
[[nodiscard]] auto missing_fields_error(const SerialDescriptor& descriptor,
                                        const std::vector<bool>& seen)
    -> std::optional<SerialError>;

/// Opens `descriptor`, calls `on_element(in, index)` for every element the
/// input provides, and closes the structure.
///
/// # Returns
///
/// One flag per element of `descriptor`, set for each element that was decoded.
template <typename Fn>
auto decode_structure(Decoder& decoder, const DescriptorPtr& descriptor, Fn&& on_element)
    -> Result<std::vector<bool>, SerialError> {
    auto opened = decoder.begin_structure(descriptor);
    if (is_err(opened)) {
        return unwrap_err(opened);
    }
    auto& in = *unwrap(opened);
    std::vector<bool> seen(descriptor->elements_count(), false);
    while (true) {
        auto index = in.decode_element_index(*descriptor);
        if (is_err(index)) {
            return unwrap_err(index);
        }
        if (unwrap(index) == CompositeDecoder::DECODE_DONE) {
            break;
        }
        auto element = static_cast<size_t>(unwrap(index));
        auto handled = on_element(in, element);
        if (is_err(handled)) {
            return unwrap_err(handled);
        }
        if (element < seen.size()) {
            seen[element] = true;
        }
    }
    auto ended = in.end_structure(*descriptor);
    if (is_err(ended)) {
        return unwrap_err(ended);
    }
    return seen;
}

} // namespace weft
