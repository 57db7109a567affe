//! # Serial Kinds
//!
//! The shape category of a descriptor. Primitive kinds describe leaves,
//! structure kinds describe values with elements, and polymorphic kinds
//! describe a base type whose concrete subtype is chosen at runtime.

#pragma once

namespace weft {

enum class SerialKind {
    // Primitive kinds
    Boolean,
    Byte,
    Short,
    Int,
    Long,
    Float,
    Double,
    Char,
    String,
    // Special kinds
    Enum,
    Contextual,
    // Structure kinds
    Class,
    Object,
    List,
    Map,
    // Polymorphic kinds
    Sealed,
    Open
};

/// Returns the display name of a kind (e.g. `"LIST"`).
inline auto kind_name(SerialKind kind) -> const char* {
    switch (kind) {
    case SerialKind::Boolean:
        return "BOOLEAN";
    case SerialKind::Byte:
        return "BYTE";
    case SerialKind::Short:
        return "SHORT";
    case SerialKind::Int:
        return "INT";
    case SerialKind::Long:
        return "LONG";
    case SerialKind::Float:
        return "FLOAT";
    case SerialKind::Double:
        return "DOUBLE";
    case SerialKind::Char:
        return "CHAR";
    case SerialKind::String:
        return "STRING";
    case SerialKind::Enum:
        return "ENUM";
    case SerialKind::Contextual:
        return "CONTEXTUAL";
    case SerialKind::Class:
        return "CLASS";
    case SerialKind::Object:
        return "OBJECT";
    case SerialKind::List:
        return "LIST";
    case SerialKind::Map:
        return "MAP";
    case SerialKind::Sealed:
        return "SEALED";
    case SerialKind::Open:
        return "OPEN";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr auto is_primitive_kind(SerialKind kind) -> bool {
    return kind >= SerialKind::Boolean && kind <= SerialKind::String;
}

[[nodiscard]] constexpr auto is_polymorphic_kind(SerialKind kind) -> bool {
    return kind == SerialKind::Sealed || kind == SerialKind::Open;
}

/// True for kinds whose values are written as JSON objects or arrays.
[[nodiscard]] constexpr auto is_structure_kind(SerialKind kind) -> bool {
    return kind == SerialKind::Class || kind == SerialKind::Object || kind == SerialKind::List ||
           kind == SerialKind::Map || is_polymorphic_kind(kind);
}

} // namespace weft
