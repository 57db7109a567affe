//! # Polymorphic Serializer
//!
//! Serializes `Rc<Base>` by the dynamic type of the pointee. Every concrete
//! subclass is registered with its own serializer; its descriptor's serial
//! name is the type name written to the output.
//!
//! The format decides the shape:
//!
//! - object shape: `{"type": "app.Circle", "radius": 1.0}` when the encoder
//!   accepts `set_polymorphic_discriminator` and the decoder implements
//!   `begin_polymorphic`
//! - array shape: `["app.Circle", {"radius": 1.0}]` otherwise
//!
//! ## Example
//!
//! ```cpp
//! PolymorphicSerializer<Shape> shapes("app.Shape");
//! shapes.register_subclass<Circle>(CircleSerializer{})
//!       .register_subclass<Square>(SquareSerializer{});
//! ```

#pragma once

#include "weft/descriptor/descriptors.hpp"
#include "weft/encoding/decoder.hpp"
#include "weft/encoding/encoder.hpp"
#include "weft/log/log.hpp"

#include <functional>
#include <stdexcept>
#include <typeindex>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace weft {

template <typename Base> class PolymorphicSerializer final : public Serializer<Rc<Base>> {
public:
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if `base_name` is blank or reserved, or
    /// if `kind` is not a polymorphic kind.
    explicit PolymorphicSerializer(std::string base_name, SerialKind kind = SerialKind::Sealed) {
        if (!is_polymorphic_kind(kind)) {
            throw std::invalid_argument("Polymorphic serializer '" + base_name +
                                        "' requires kind Sealed or Open");
        }
        auto value = make_rc<const ClassDescriptor>("weft.Polymorphic<" + base_name + ">",
                                                    SerialKind::Contextual,
                                                    std::vector<Box<ClassDescriptor::Element>>{},
                                                    Annotations{});
        auto built = DescriptorBuilder(std::move(base_name), kind)
                         .element("type", string_descriptor())
                         .element("value", std::move(value))
                         .build();
        if (is_err(built)) {
            throw std::invalid_argument(unwrap_err(built).message);
        }
        descriptor_ = std::move(unwrap(built));
    }

    /// Registers `Derived`, serialized by `serializer` (a `Serializer<Derived>`).
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if `Derived` or its serial name is already
    /// registered.
    template <typename Derived, typename S> auto register_subclass(S serializer)
        -> PolymorphicSerializer& {
        static_assert(std::is_base_of_v<Base, Derived>, "subclass must derive from the base");
        auto shared = make_rc<const S>(std::move(serializer));
        Subclass entry{shared->descriptor()->serial_name(), std::type_index(typeid(Derived)), {},
                       {}, {}, {}};
        for (const auto& existing : subclasses_) {
            if (existing.serial_name == entry.serial_name || existing.type == entry.type) {
                throw std::logic_error("Subclass '" + entry.serial_name +
                                       "' is already registered for '" +
                                       descriptor_->serial_name() + "'");
            }
        }

        entry.encode = [shared](Encoder& encoder, const Base& value) {
            return shared->serialize(encoder, static_cast<const Derived&>(value));
        };
        entry.decode = [shared](Decoder& decoder) -> Result<Rc<Base>, SerialError> {
            auto value = shared->deserialize(decoder);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            return Rc<Base>(make_rc<Derived>(std::move(unwrap(value))));
        };
        entry.encode_element = [shared](CompositeEncoder& out, const SerialDescriptor& desc,
                                        size_t index, const Base& value) {
            return out.encode_serializable_element(desc, index, *shared,
                                                   static_cast<const Derived&>(value));
        };
        entry.decode_element = [shared](CompositeDecoder& in, const SerialDescriptor& desc,
                                        size_t index) -> Result<Rc<Base>, SerialError> {
            auto value = in.decode_serializable_element(desc, index, *shared);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            return Rc<Base>(make_rc<Derived>(std::move(unwrap(value))));
        };
        subclasses_.push_back(std::move(entry));
        return *this;
    }

    [[nodiscard]] auto descriptor() const -> DescriptorPtr override {
        return descriptor_;
    }

    auto serialize(Encoder& encoder, const Rc<Base>& value) const
        -> Result<bool, SerialError> override {
        if (!value) {
            return SerialError::make(ErrorKind::InvalidValue,
                                     "Cannot serialize a null '" + descriptor_->serial_name() +
                                         "'; use a nullable serializer");
        }
        const Base& object = *value;
        const Subclass* subclass = find(std::type_index(typeid(object)));
        if (!subclass) {
            return SerialError::make(ErrorKind::UnknownPolymorphicType,
                                     std::string("Class '") + typeid(object).name() +
                                         "' is not registered for polymorphic serialization in "
                                         "the scope of '" +
                                         descriptor_->serial_name() + "'");
        }

        if (encoder.set_polymorphic_discriminator(subclass->serial_name)) {
            return subclass->encode(encoder, object);
        }

        auto opened = encoder.begin_structure(descriptor_);
        if (is_err(opened)) {
            return unwrap_err(opened);
        }
        auto& out = *unwrap(opened);
        auto type = out.encode_string_element(*descriptor_, 0, subclass->serial_name);
        if (is_err(type)) {
            return type;
        }
        auto payload = subclass->encode_element(out, *descriptor_, 1, object);
        if (is_err(payload)) {
            return payload;
        }
        return out.end_structure(*descriptor_);
    }

    auto deserialize(Decoder& decoder) const -> Result<Rc<Base>, SerialError> override {
        auto polymorphic = decoder.begin_polymorphic(descriptor_);
        if (is_err(polymorphic)) {
            return unwrap_err(polymorphic);
        }
        if (auto& input = unwrap(polymorphic)) {
            const Subclass* subclass = find(input->type_name);
            if (!subclass) {
                return unknown_type_error(input->type_name);
            }
            WEFT_LOG_DEBUG("json", "Resolved '" << input->type_name << "' for '"
                                                << descriptor_->serial_name() << "'");
            return subclass->decode(*input->payload);
        }
        return deserialize_array_shape(decoder);
    }

private:
    struct Subclass {
        std::string serial_name;
        std::type_index type;
        std::function<Result<bool, SerialError>(Encoder&, const Base&)> encode;
        std::function<Result<Rc<Base>, SerialError>(Decoder&)> decode;
        std::function<Result<bool, SerialError>(CompositeEncoder&, const SerialDescriptor&, size_t,
                                                const Base&)>
            encode_element;
        std::function<Result<Rc<Base>, SerialError>(CompositeDecoder&, const SerialDescriptor&,
                                                    size_t)>
            decode_element;
    };

    [[nodiscard]] auto find(std::type_index type) const -> const Subclass* {
        for (const auto& subclass : subclasses_) {
            if (subclass.type == type) {
                return &subclass;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto find(const std::string& serial_name) const -> const Subclass* {
        for (const auto& subclass : subclasses_) {
            if (subclass.serial_name == serial_name) {
                return &subclass;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto unknown_type_error(const std::string& type_name) const -> SerialError {
        return SerialError::make(ErrorKind::UnknownPolymorphicType,
                                 "Serializer for subclass '" + type_name +
                                     "' is not found in the polymorphic scope of '" +
                                     descriptor_->serial_name() + "'");
    }

    auto deserialize_array_shape(Decoder& decoder) const -> Result<Rc<Base>, SerialError> {
        auto opened = decoder.begin_structure(descriptor_);
        if (is_err(opened)) {
            return unwrap_err(opened);
        }
        auto& in = *unwrap(opened);
        std::optional<std::string> type_name;
        Rc<Base> result;
        while (true) {
            auto index = in.decode_element_index(*descriptor_);
            if (is_err(index)) {
                return unwrap_err(index);
            }
            int element = unwrap(index);
            if (element == CompositeDecoder::DECODE_DONE) {
                break;
            }
            if (element == 0) {
                auto name = in.decode_string_element(*descriptor_, 0);
                if (is_err(name)) {
                    return unwrap_err(name);
                }
                type_name = std::move(unwrap(name));
            } else if (element == 1) {
                if (!type_name) {
                    return SerialError::make(ErrorKind::MissingRequiredValue,
                                             "Cannot read polymorphic value before its type token");
                }
                const Subclass* subclass = find(*type_name);
                if (!subclass) {
                    return unknown_type_error(*type_name);
                }
                auto value = subclass->decode_element(in, *descriptor_, 1);
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                result = std::move(unwrap(value));
            } else {
                return SerialError::make(ErrorKind::UnexpectedStructure,
                                         "Invalid index in polymorphic deserialization of '" +
                                             descriptor_->serial_name() + "': " +
                                             std::to_string(element));
            }
        }
        auto ended = in.end_structure(*descriptor_);
        if (is_err(ended)) {
            return unwrap_err(ended);
        }
        if (!result) {
            return SerialError::make(ErrorKind::MissingRequiredValue,
                                     "Polymorphic value of '" + descriptor_->serial_name() +
                                         "' has no payload");
        }
        return result;
    }

    DescriptorPtr descriptor_;
    std::vector<Subclass> subclasses_;
};

} // namespace weft
