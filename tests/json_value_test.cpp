//! # JSON Value Tests
//!
//! Tests for the JSON tree types and their text output.
//!
//! ## Test Coverage
//! - Factory functions and type queries
//! - Insertion-ordered objects with in-place replacement
//! - Deep copies and order-independent object equality
//! - Compact and pretty output, string escaping, double formatting

#include "weft/json/json_value.hpp"
#include "weft/json/json_writer.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace weft::json;

// ============================================================================
// Factories and Type Queries
// ============================================================================

TEST(JsonValueTest, FactoriesProduceExpectedKinds) {
    EXPECT_TRUE(json_null().is_null());
    EXPECT_TRUE(json_bool(true).is_primitive());
    EXPECT_FALSE(json_bool(true).is_string());
    EXPECT_EQ(json_bool(false).as_primitive().content, "false");
    EXPECT_EQ(json_int(-42).as_primitive().content, "-42");
    EXPECT_TRUE(json_string("42").is_string());
    EXPECT_TRUE(json_array().is_array());
    EXPECT_TRUE(json_object().is_object());
}

TEST(JsonValueTest, TypeNames) {
    EXPECT_STREQ(json_null().type_name(), "null");
    EXPECT_STREQ(json_number("1.5").type_name(), "primitive");
    EXPECT_STREQ(json_string("x").type_name(), "string");
    EXPECT_STREQ(json_array().type_name(), "array");
    EXPECT_STREQ(json_object().type_name(), "object");
}

TEST(JsonValueTest, NumbersKeepLiteralText) {
    auto value = json_number("1.50");
    EXPECT_EQ(value.as_primitive().content, "1.50");
    EXPECT_EQ(value.to_string(), "1.50");
    EXPECT_NE(json_number("1"), json_number("1.0"));
}

TEST(JsonValueTest, StringAndNumberWithSameTextDiffer) {
    EXPECT_NE(json_string("1"), json_number("1"));
    EXPECT_EQ(json_string("1"), json_string("1"));
}

TEST(JsonValueTest, WrongAccessorThrows) {
    EXPECT_THROW((void)json_null().as_primitive(), std::bad_variant_access);
    EXPECT_THROW((void)json_string("x").as_array(), std::bad_variant_access);
}

// ============================================================================
// Arrays and Objects
// ============================================================================

TEST(JsonValueTest, ArrayPushAndIndex) {
    auto arr = json_array();
    arr.push(json_int(1));
    arr.push(json_string("two"));
    arr.push(json_null());

    EXPECT_EQ(arr.size(), 3u);
    EXPECT_EQ(arr[1].as_primitive().content, "two");
    EXPECT_TRUE(arr[2].is_null());
    EXPECT_THROW((void)arr[3], std::out_of_range);
}

TEST(JsonValueTest, ObjectKeepsInsertionOrder) {
    auto obj = json_object();
    obj.set("zeta", json_int(1));
    obj.set("alpha", json_int(2));
    obj.set("mid", json_int(3));

    const auto& keys = obj.as_object().keys();
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "zeta");
    EXPECT_EQ(keys[1], "alpha");
    EXPECT_EQ(keys[2], "mid");
}

TEST(JsonValueTest, ObjectSetReplacesInPlace) {
    auto obj = json_object();
    obj.set("a", json_int(1));
    obj.set("b", json_int(2));
    obj.set("a", json_int(3));

    EXPECT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.as_object().key_at(0), "a");
    EXPECT_EQ(obj.get("a")->as_primitive().content, "3");
    EXPECT_EQ(obj.to_string(), R"({"a":3,"b":2})");
}

TEST(JsonValueTest, ObjectRemoveReindexes) {
    auto obj = json_object();
    obj.set("a", json_int(1));
    obj.set("b", json_int(2));
    obj.set("c", json_int(3));

    EXPECT_TRUE(obj.as_object_mut().remove("a"));
    EXPECT_FALSE(obj.as_object_mut().remove("a"));
    EXPECT_EQ(obj.get("c")->as_primitive().content, "3");
    EXPECT_EQ(obj.as_object().key_at(0), "b");
    EXPECT_EQ(obj.get("missing"), nullptr);
    EXPECT_EQ(json_int(1).get("a"), nullptr);
}

// ============================================================================
// Copy and Equality
// ============================================================================

TEST(JsonValueTest, CloneIsDeep) {
    auto inner = json_array();
    inner.push(json_int(1));
    auto obj = json_object();
    obj.set("items", std::move(inner));

    auto copy = obj.clone();
    EXPECT_EQ(copy, obj);

    copy.as_object_mut().set("items", json_array());
    EXPECT_NE(copy, obj);
    EXPECT_EQ(obj.get("items")->size(), 1u);
}

TEST(JsonValueTest, ObjectEqualityIgnoresKeyOrder) {
    auto first = json_object();
    first.set("a", json_int(1));
    first.set("b", json_bool(true));

    auto second = json_object();
    second.set("b", json_bool(true));
    second.set("a", json_int(1));

    EXPECT_EQ(first, second);

    second.set("c", json_null());
    EXPECT_NE(first, second);
}

TEST(JsonValueTest, ArrayEqualityIsOrdered) {
    auto first = json_array();
    first.push(json_int(1));
    first.push(json_int(2));

    auto second = json_array();
    second.push(json_int(2));
    second.push(json_int(1));

    EXPECT_NE(first, second);
}

// ============================================================================
// Output
// ============================================================================

TEST(JsonValueOutputTest, CompactHasNoWhitespace) {
    auto obj = json_object();
    obj.set("name", json_string("Alice"));
    auto tags = json_array();
    tags.push(json_string("a"));
    tags.push(json_null());
    obj.set("tags", std::move(tags));
    obj.set("empty", json_object());

    EXPECT_EQ(obj.to_string(), R"({"name":"Alice","tags":["a",null],"empty":{}})");
}

TEST(JsonValueOutputTest, PrettyPutsItemsOnLines) {
    auto obj = json_object();
    obj.set("a", json_int(1));
    auto list = json_array();
    list.push(json_int(1));
    list.push(json_int(2));
    obj.set("b", std::move(list));
    obj.set("c", json_array());

    std::string expected = "{\n"
                           "  \"a\": 1,\n"
                           "  \"b\": [\n"
                           "    1,\n"
                           "    2\n"
                           "  ],\n"
                           "  \"c\": []\n"
                           "}";
    EXPECT_EQ(obj.to_string_pretty("  "), expected);
}

TEST(JsonValueOutputTest, PrettyEmptyRoot) {
    EXPECT_EQ(json_object().to_string_pretty(), "{}");
    EXPECT_EQ(json_array().to_string_pretty(), "[]");
}

TEST(JsonValueOutputTest, StringsAreEscaped) {
    EXPECT_EQ(json_string("a\"b\\c\n\t").to_string(), R"("a\"b\\c\n\t")");
    EXPECT_EQ(escape_string(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escape_string("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(JsonValueOutputTest, DoubleFormatting) {
    EXPECT_EQ(format_double(1.0), "1.0");
    EXPECT_EQ(format_double(0.1), "0.1");
    EXPECT_EQ(format_double(-2.5), "-2.5");
    EXPECT_EQ(format_double(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(format_double(-std::numeric_limits<double>::infinity()), "-Infinity");
    EXPECT_EQ(format_float(1.5f), "1.5");
    EXPECT_EQ(json_double(3.0).to_string(), "3.0");
}
