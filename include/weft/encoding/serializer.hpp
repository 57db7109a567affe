//! # Serializer Contract
//!
//! A `Serializer<T>` couples a descriptor with the two callbacks that move a
//! `T` through the structural protocol. Formats never look inside a
//! serializer; they only see the encode and decode calls it makes.

#pragma once

#include "weft/common.hpp"
#include "weft/core/serial_error.hpp"
#include "weft/descriptor/serial_descriptor.hpp"

namespace weft {

class Decoder;
class Encoder;

/// Descriptor plus serialize/deserialize callbacks for values of type `T`.
template <typename T> class Serializer {
public:
    using ValueType = T;

    virtual ~Serializer() = default;

    [[nodiscard]] virtual auto descriptor() const -> DescriptorPtr = 0;

    virtual auto serialize(Encoder& encoder, const T& value) const -> Result<bool, SerialError> = 0;

    virtual auto deserialize(Decoder& decoder) const -> Result<T, SerialError> = 0;
};

} // namespace weft
