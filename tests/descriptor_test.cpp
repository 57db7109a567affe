//! # Descriptor Tests
//!
//! Tests for building, inspecting, wrapping and comparing serial
//! descriptors.
//!
//! ## Test Coverage
//! - Builtin primitive descriptors and reserved names
//! - `DescriptorBuilder` validation (blank, duplicate, reserved, kind)
//! - Element accessors and index bounds
//! - Nullable and wrapped views
//! - Structural equality, including recursive descriptors

#include "weft/descriptor/descriptors.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace weft;

namespace {

auto point() -> DescriptorPtr {
    auto built = DescriptorBuilder("app.Point")
                     .element("x", int_descriptor())
                     .element("y", int_descriptor(), {.optional = true, .alternative_names = {"yy"}})
                     .build();
    return unwrap(built);
}

auto node_descriptor() -> DescriptorPtr;

auto build_node() -> DescriptorPtr {
    auto built = DescriptorBuilder("app.Node")
                     .element("value", int_descriptor())
                     .lazy_element("next", [] { return nullable(node_descriptor()); },
                                   {.optional = true})
                     .build();
    return unwrap(built);
}

auto node_descriptor() -> DescriptorPtr {
    static const DescriptorPtr desc = build_node();
    return desc;
}

} // namespace

// ============================================================================
// Primitive Descriptors
// ============================================================================

TEST(PrimitiveDescriptorTest, BuiltinNamesAndKinds) {
    EXPECT_EQ(int_descriptor()->serial_name(), "int");
    EXPECT_EQ(int_descriptor()->kind(), SerialKind::Int);
    EXPECT_EQ(string_descriptor()->kind(), SerialKind::String);
    EXPECT_EQ(char_descriptor()->elements_count(), 0u);
    EXPECT_FALSE(long_descriptor()->is_nullable());
    EXPECT_EQ(double_descriptor()->to_string(), "double");
}

TEST(PrimitiveDescriptorTest, BuiltinsAreShared) {
    EXPECT_EQ(int_descriptor().get(), int_descriptor().get());
}

TEST(PrimitiveDescriptorTest, CustomPrimitive) {
    auto custom = primitive_descriptor("app.Timestamp", SerialKind::Long);
    ASSERT_TRUE(is_ok(custom));
    EXPECT_EQ(unwrap(custom)->kind(), SerialKind::Long);

    auto reserved = primitive_descriptor("long", SerialKind::Long);
    ASSERT_TRUE(is_err(reserved));
    EXPECT_EQ(unwrap_err(reserved).kind, ErrorKind::InvalidDescriptor);

    auto structured = primitive_descriptor("app.Bad", SerialKind::Class);
    EXPECT_TRUE(is_err(structured));
}

// ============================================================================
// Builder
// ============================================================================

TEST(DescriptorBuilderTest, ElementsInDeclarationOrder) {
    auto desc = point();
    EXPECT_EQ(desc->kind(), SerialKind::Class);
    ASSERT_EQ(desc->elements_count(), 2u);
    EXPECT_EQ(desc->get_element_name(0), "x");
    EXPECT_EQ(desc->get_element_name(1), "y");
    EXPECT_FALSE(desc->is_element_optional(0));
    EXPECT_TRUE(desc->is_element_optional(1));
    EXPECT_EQ(desc->get_element_alternative_names(1), std::vector<std::string>{"yy"});
    EXPECT_EQ(desc->get_element_index("y"), std::optional<size_t>(1));
    EXPECT_EQ(desc->get_element_index("yy"), std::nullopt);
    EXPECT_EQ(desc->to_string(), "app.Point(x: int, y: int)");
}

TEST(DescriptorBuilderTest, OutOfRangeIndexThrows) {
    auto desc = point();
    EXPECT_THROW((void)desc->get_element_name(2), std::out_of_range);
    EXPECT_THROW((void)desc->get_element_descriptor(5), std::out_of_range);
    EXPECT_THROW((void)int_descriptor()->get_element_name(0), std::out_of_range);
}

TEST(DescriptorBuilderTest, RejectsBlankName) {
    auto blank = DescriptorBuilder("  ").build();
    ASSERT_TRUE(is_err(blank));
    EXPECT_EQ(unwrap_err(blank).kind, ErrorKind::InvalidDescriptor);

    auto blank_element = DescriptorBuilder("app.A").element("", int_descriptor()).build();
    EXPECT_TRUE(is_err(blank_element));
}

TEST(DescriptorBuilderTest, RejectsDuplicateElement) {
    auto built = DescriptorBuilder("app.A")
                     .element("a", int_descriptor())
                     .element("a", string_descriptor())
                     .build();
    ASSERT_TRUE(is_err(built));
    EXPECT_NE(unwrap_err(built).message.find("declared twice"), std::string::npos);
}

TEST(DescriptorBuilderTest, RejectsReservedNameAndKind) {
    EXPECT_TRUE(is_err(DescriptorBuilder("string").build()));
    EXPECT_TRUE(is_err(DescriptorBuilder("app.List", SerialKind::List).build()));
}

TEST(DescriptorBuilderTest, EnumEntriesAreObjects) {
    auto built = enum_descriptor("app.Color", {"RED", "GREEN"});
    ASSERT_TRUE(is_ok(built));
    const auto& desc = unwrap(built);
    EXPECT_EQ(desc->kind(), SerialKind::Enum);
    EXPECT_EQ(desc->elements_count(), 2u);
    EXPECT_EQ(desc->get_element_descriptor(1)->serial_name(), "app.Color.GREEN");
    EXPECT_EQ(desc->get_element_descriptor(1)->kind(), SerialKind::Object);

    EXPECT_TRUE(is_err(enum_descriptor("app.Color", {"RED", "RED"})));
}

TEST(DescriptorBuilderTest, RecursiveDescriptorResolvesLazily) {
    auto node = node_descriptor();
    auto next = node->get_element_descriptor(1);
    EXPECT_TRUE(next->is_nullable());
    EXPECT_EQ(next->serial_name(), "app.Node?");
    EXPECT_EQ(next->get_element_descriptor(1)->serial_name(), "app.Node?");
}

// ============================================================================
// Collections
// ============================================================================

TEST(CollectionDescriptorTest, ListAndMapElements) {
    auto list = list_descriptor("vector", int_descriptor());
    EXPECT_EQ(list->kind(), SerialKind::List);
    EXPECT_EQ(list->get_element_name(0), "0");
    EXPECT_EQ(list->get_element_index("17"), std::optional<size_t>(17));
    EXPECT_EQ(list->get_element_index("x"), std::nullopt);
    EXPECT_EQ(list->to_string(), "vector(int)");

    auto map = map_descriptor("map", string_descriptor(), list);
    EXPECT_EQ(map->elements_count(), 2u);
    EXPECT_EQ(map->get_element_descriptor(0)->serial_name(), "string");
    EXPECT_EQ(map->get_element_descriptor(1)->kind(), SerialKind::List);
    EXPECT_EQ(map->to_string(), "map(string, vector(int))");
}

// ============================================================================
// Nullable and Wrapped Views
// ============================================================================

TEST(DelegatingDescriptorTest, NullableView) {
    auto desc = nullable(point());
    EXPECT_TRUE(desc->is_nullable());
    EXPECT_EQ(desc->serial_name(), "app.Point?");
    EXPECT_EQ(desc->kind(), SerialKind::Class);
    EXPECT_EQ(desc->get_element_name(1), "y");
    EXPECT_EQ(nullable(desc).get(), desc.get());
}

TEST(DelegatingDescriptorTest, WrappedKeepsStructure) {
    auto original = point();
    auto wrapped = make_descriptor("app.Location", original);
    ASSERT_TRUE(is_ok(wrapped));
    const auto& desc = unwrap(wrapped);
    EXPECT_EQ(desc->serial_name(), "app.Location");
    EXPECT_EQ(desc->kind(), original->kind());
    EXPECT_EQ(desc->elements_count(), original->elements_count());
    EXPECT_EQ(desc->get_element_name(0), "x");
    EXPECT_EQ(desc->is_element_optional(1), original->is_element_optional(1));
    EXPECT_FALSE(*desc == *original);
}

TEST(DelegatingDescriptorTest, WrappedRejectsBadNames) {
    auto original = point();
    auto same = make_descriptor("app.Point", original);
    ASSERT_TRUE(is_err(same));
    EXPECT_EQ(unwrap_err(same).kind, ErrorKind::InvalidDescriptor);

    EXPECT_TRUE(is_err(make_descriptor("", original)));
    EXPECT_TRUE(is_err(make_descriptor("int", original)));
}

// ============================================================================
// Equality
// ============================================================================

TEST(DescriptorEqualityTest, StructuralEquality) {
    auto a = point();
    auto b = point();
    EXPECT_NE(a.get(), b.get());
    EXPECT_TRUE(*a == *b);
    EXPECT_EQ(a->hash_code(), b->hash_code());
    EXPECT_TRUE(descriptors_equal(a, b));
}

TEST(DescriptorEqualityTest, DifferencesAreDetected) {
    auto base = point();
    auto renamed = unwrap(DescriptorBuilder("app.Point")
                              .element("x", int_descriptor())
                              .element("z", int_descriptor(), {.optional = true})
                              .build());
    auto retyped = unwrap(DescriptorBuilder("app.Point")
                              .element("x", long_descriptor())
                              .element("y", int_descriptor(),
                                       {.optional = true, .alternative_names = {"yy"}})
                              .build());
    EXPECT_FALSE(*base == *renamed);
    EXPECT_FALSE(*base == *retyped);
    EXPECT_FALSE(*base == *nullable(base));
    EXPECT_FALSE(descriptors_equal(base, nullptr));
    EXPECT_TRUE(descriptors_equal(nullptr, nullptr));
}

TEST(DescriptorEqualityTest, RecursiveDescriptorTerminates) {
    auto node = node_descriptor();
    auto other = build_node();
    EXPECT_TRUE(*node == *node);
    EXPECT_TRUE(*node == *other);
}
