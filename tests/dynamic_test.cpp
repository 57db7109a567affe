//! # Dynamic Decoding Tests
//!
//! Tests for decoding host object graphs (`DynamicValue`) with the policies
//! of a `Json` instance.
//!
//! ## Test Coverage
//! - `NativeValue` construction and accessors
//! - Classes, names, coercion and undefined-versus-null presence
//! - Numbers as doubles: integral and range checks, the safe-integer bound
//! - Sequences with holes, maps with converted string keys
//! - Integer map keys written as integer literals only
//! - Unknown keys when `ignore_unknown_keys` is off
//! - JSON elements and polymorphic values from dynamic input
//! - Error paths

#include "weft/dynamic/dynamic_decoder.hpp"
#include "weft/json/json_element.hpp"

#include "test_models.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace weft;
using namespace weft::dynamic;
using namespace weft::json;
using namespace weft::test;

namespace {

auto point(double x, double y) -> NativeValue {
    auto value = NativeValue::mapping();
    value.set("x", NativeValue::number(x));
    value.set("y", NativeValue::number(y));
    return value;
}

} // namespace

class DynamicDecoderTest : public ::testing::Test {
protected:
    JsonConfiguration config;

    template <typename T>
    auto decode(const Serializer<T>& serializer, const DynamicValue& value)
        -> Result<T, SerialError> {
        auto json = Json::make(config);
        EXPECT_TRUE(is_ok(json));
        return decode_from_dynamic(unwrap(json), serializer, value);
    }

    template <typename T>
    auto decode_error(const Serializer<T>& serializer, const DynamicValue& value, ErrorKind kind)
        -> SerialError {
        auto result = decode(serializer, value);
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return SerialError{};
        }
        EXPECT_EQ(unwrap_err(result).kind, kind) << unwrap_err(result).to_string();
        return unwrap_err(result);
    }
};

// ============================================================================
// NativeValue
// ============================================================================

TEST(NativeValueTest, KindsAndAccessors) {
    EXPECT_EQ(NativeValue::null().kind(), DynamicKind::Null);
    EXPECT_TRUE(NativeValue::boolean(true).as_bool());
    EXPECT_DOUBLE_EQ(NativeValue::number(2.5).as_number(), 2.5);
    EXPECT_EQ(NativeValue::text("a").as_text(), "a");
    EXPECT_THROW((void)NativeValue::text("a").as_number(), std::bad_variant_access);
    EXPECT_STREQ(kind_name(DynamicKind::Mapping), "object");
    EXPECT_STREQ(kind_name(DynamicKind::Number), "number");
}

TEST(NativeValueTest, MappingKeepsKeyOrderAndUndefinedEntries) {
    auto value = NativeValue::mapping();
    value.set("b", NativeValue::number(1));
    value.set_undefined("a");
    value.set("b", NativeValue::number(2));

    EXPECT_EQ(value.keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_DOUBLE_EQ(value.get("b")->as_number(), 2);
    EXPECT_EQ(value.get("a"), nullptr);
    EXPECT_EQ(value.get("missing"), nullptr);
}

TEST(NativeValueTest, SequenceHoles) {
    auto value = NativeValue::sequence();
    value.push(NativeValue::number(1));
    value.push_hole();
    value.push(NativeValue::null());

    EXPECT_EQ(value.length(), 3u);
    EXPECT_NE(value.at(0), nullptr);
    EXPECT_EQ(value.at(1), nullptr);
    EXPECT_TRUE(value.at(2)->is_null());
}

TEST(NativeValueTest, Describe) {
    EXPECT_EQ(NativeValue::number(42).describe(), "42.0");
    EXPECT_EQ(NativeValue::text("x").describe(), "\"x\"");
    EXPECT_EQ(NativeValue::sequence().describe(), "[...]");
    EXPECT_EQ(NativeValue::null().describe(), "null");
}

TEST(NativeValueTest, FromJsonTree) {
    auto tree = parse_json(R"({"a":[1,true,"x",null],"b":{"c":-0.5}})", JsonConfiguration{});
    ASSERT_TRUE(is_ok(tree));
    auto value = native_from_json(unwrap(tree));

    ASSERT_EQ(value.kind(), DynamicKind::Mapping);
    const DynamicValue* items = value.get("a");
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->length(), 4u);
    EXPECT_EQ(items->at(0)->kind(), DynamicKind::Number);
    EXPECT_EQ(items->at(1)->kind(), DynamicKind::Bool);
    EXPECT_EQ(items->at(2)->kind(), DynamicKind::Text);
    EXPECT_TRUE(items->at(3)->is_null());
    EXPECT_DOUBLE_EQ(value.get("b")->get("c")->as_number(), -0.5);
}

// ============================================================================
// Classes
// ============================================================================

TEST_F(DynamicDecoderTest, DecodesClass) {
    auto result = decode(PointSerializer{}, point(1, 2));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (Point{1, 2}));
}

TEST_F(DynamicDecoderTest, MissingField) {
    auto value = NativeValue::mapping();
    value.set("x", NativeValue::number(1));
    auto error = decode_error(PointSerializer{}, value, ErrorKind::MissingRequiredValue);
    EXPECT_EQ(error.message,
              "Field 'y' is required for type with serial name 'test.Point', but it was missing");
}

TEST_F(DynamicDecoderTest, UnknownKeyFailsWhenNotIgnored) {
    auto value = point(1, 2);
    value.set("k", NativeValue::number(3));
    EXPECT_TRUE(is_ok(decode(PointSerializer{}, value)));

    config.ignore_unknown_keys = false;
    auto error = decode_error(PointSerializer{}, value, ErrorKind::UnknownKey);
    EXPECT_EQ(error.path, "$.k");
    EXPECT_EQ(error.message.rfind("Encountered an unknown key 'k'", 0), 0U) << error.message;

    auto undefined = point(1, 2);
    undefined.set_undefined("k");
    EXPECT_TRUE(is_ok(decode(PointSerializer{}, undefined)));
}

TEST_F(DynamicDecoderTest, UnknownKeyCheckSkipsDiscriminatorAndMaps) {
    config.ignore_unknown_keys = false;
    auto shape = NativeValue::mapping();
    shape.set("type", NativeValue::text("test.Square"));
    shape.set("side", NativeValue::number(5));
    EXPECT_TRUE(is_ok(decode(shape_serializer(), shape)));

    shape.set("colour", NativeValue::text("red"));
    decode_error(shape_serializer(), shape, ErrorKind::UnknownKey);

    MapSerializer<StringSerializer, IntSerializer> table{StringSerializer{}, IntSerializer{}};
    auto entries = NativeValue::mapping();
    entries.set("anything", NativeValue::number(1));
    auto result = decode(table, entries);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).at("anything"), 1);
}

TEST_F(DynamicDecoderTest, AlternativeNamesAndStrategy) {
    auto value = NativeValue::mapping();
    value.set("login", NativeValue::text("bob"));
    auto result = decode(ProfileSerializer{}, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).user_name, "bob");

    config.naming_strategy = snake_case();
    auto snake = NativeValue::mapping();
    snake.set("user_name", NativeValue::text("ann"));
    snake.set("age", NativeValue::number(30));
    auto renamed = decode(ProfileSerializer{}, snake);
    ASSERT_TRUE(is_ok(renamed));
    EXPECT_EQ(unwrap(renamed), (Profile{"ann", 30, 1, Color::Red}));
}

TEST_F(DynamicDecoderTest, UndefinedIsAbsentNullIsPresent) {
    auto with_null = NativeValue::mapping();
    with_null.set("title", NativeValue::text("t"));
    with_null.set("body", NativeValue::null());
    auto decoded = decode(NoteSerializer{}, with_null);
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).body, std::nullopt);

    auto undefined = NativeValue::mapping();
    undefined.set("title", NativeValue::text("t"));
    undefined.set_undefined("body");
    decode_error(NoteSerializer{}, undefined, ErrorKind::MissingRequiredValue);

    config.explicit_nulls = false;
    auto implicit = decode(NoteSerializer{}, undefined);
    ASSERT_TRUE(is_ok(implicit));
    EXPECT_EQ(unwrap(implicit), (Note{"t", std::nullopt}));
}

TEST_F(DynamicDecoderTest, CoercesInvalidOptionalValues) {
    auto value = NativeValue::mapping();
    value.set("userName", NativeValue::text("a"));
    value.set("level", NativeValue::null());
    value.set("color", NativeValue::text("PURPLE"));
    decode_error(ProfileSerializer{}, value, ErrorKind::TypeMismatch);

    config.coerce_input_values = true;
    auto result = decode(ProfileSerializer{}, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).level, 1);
    EXPECT_EQ(unwrap(result).color, Color::Red);
}

TEST_F(DynamicDecoderTest, EnumNeedsText) {
    auto value = NativeValue::mapping();
    value.set("userName", NativeValue::text("a"));
    value.set("color", NativeValue::number(1));
    auto error = decode_error(ProfileSerializer{}, value, ErrorKind::TypeMismatch);
    EXPECT_EQ(error.message, "Enum value must be a string, got '1.0'");
    EXPECT_EQ(error.path, "$.color");
}

// ============================================================================
// Numbers
// ============================================================================

TEST_F(DynamicDecoderTest, IntegersMustBeIntegralAndInRange) {
    decode_error(PointSerializer{}, point(1.5, 2), ErrorKind::TypeMismatch);
    decode_error(PointSerializer{}, point(4294967296.0, 2), ErrorKind::TypeMismatch);
    decode_error(ByteSerializer{}, NativeValue::number(300), ErrorKind::TypeMismatch);
}

TEST_F(DynamicDecoderTest, LongSafeIntegerBound) {
    auto safe = decode(LongSerializer{}, NativeValue::number(9007199254740991.0));
    ASSERT_TRUE(is_ok(safe));
    EXPECT_EQ(unwrap(safe), int64_t{9007199254740991});

    decode_error(LongSerializer{}, NativeValue::number(9007199254740992.0),
                 ErrorKind::PrecisionLoss);
}

TEST_F(DynamicDecoderTest, WrongKindNamesBothSides) {
    auto value = NativeValue::mapping();
    value.set("x", NativeValue::text("1"));
    value.set("y", NativeValue::number(2));
    auto error = decode_error(PointSerializer{}, value, ErrorKind::TypeMismatch);
    EXPECT_EQ(error.message, "Expected int, but had string \"1\"");
    EXPECT_EQ(error.path, "$.x");
}

TEST_F(DynamicDecoderTest, PrimitiveRoots) {
    auto number = decode(IntSerializer{}, NativeValue::number(42));
    ASSERT_TRUE(is_ok(number));
    EXPECT_EQ(unwrap(number), 42);

    auto text = decode(StringSerializer{}, NativeValue::text("hi"));
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "hi");

    auto ch = decode(CharSerializer{}, NativeValue::number(65));
    ASSERT_TRUE(is_ok(ch));
    EXPECT_EQ(unwrap(ch), u'A');

    NullableSerializer<IntSerializer> ints{IntSerializer{}};
    auto null = decode(ints, NativeValue::null());
    ASSERT_TRUE(is_ok(null));
    EXPECT_EQ(unwrap(null), std::nullopt);

    decode_error(IntSerializer{}, NativeValue::null(), ErrorKind::TypeMismatch);
}

TEST_F(DynamicDecoderTest, SpecialFloats) {
    CircleSerializer circles;
    auto value = NativeValue::mapping();
    value.set("radius", NativeValue::number(std::numeric_limits<double>::infinity()));
    decode_error(circles, value, ErrorKind::MalformedInput);

    config.allow_special_floating_point_values = true;
    auto allowed = decode(circles, value);
    ASSERT_TRUE(is_ok(allowed));
    EXPECT_TRUE(std::isinf(unwrap(allowed).radius));
}

// ============================================================================
// Collections
// ============================================================================

TEST_F(DynamicDecoderTest, SequenceHolesAreSkipped) {
    auto value = NativeValue::sequence();
    value.push(NativeValue::number(1));
    value.push_hole();
    value.push(NativeValue::number(3));

    ListSerializer<IntSerializer> ints{IntSerializer{}};
    auto result = decode(ints, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::vector<int32_t>{1, 3}));
}

TEST_F(DynamicDecoderTest, MapKeysConvertedFromText) {
    MapSerializer<IntSerializer, IntSerializer> table{IntSerializer{}, IntSerializer{}};
    auto value = NativeValue::mapping();
    value.set("1", NativeValue::number(2));
    value.set("10", NativeValue::number(20));
    auto result = decode(table, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::map<int32_t, int32_t>{{1, 2}, {10, 20}}));

    auto bad = NativeValue::mapping();
    bad.set("x", NativeValue::number(2));
    auto error = decode_error(table, bad, ErrorKind::TypeMismatch);
    EXPECT_EQ(error.message, "Property x is not valid type int: x");
}

TEST_F(DynamicDecoderTest, IntegerMapKeysNeedIntegerText) {
    MapSerializer<IntSerializer, IntSerializer> table{IntSerializer{}, IntSerializer{}};
    auto value = NativeValue::mapping();
    value.set("7", NativeValue::number(1));
    value.set("-3", NativeValue::number(2));
    auto result = decode(table, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::map<int32_t, int32_t>{{-3, 2}, {7, 1}}));

    for (const char* key : {"1.0", "1e0", "+-1", "2147483648"}) {
        auto bad = NativeValue::mapping();
        bad.set(key, NativeValue::number(1));
        auto error = decode_error(table, bad, ErrorKind::TypeMismatch);
        EXPECT_EQ(error.message,
                  std::string("Property ") + key + " is not valid type int: " + key);
    }

    MapSerializer<DoubleSerializer, IntSerializer> reals{DoubleSerializer{}, IntSerializer{}};
    auto fractional = NativeValue::mapping();
    fractional.set("1.5", NativeValue::number(1));
    auto decoded = decode(reals, fractional);
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).count(1.5), 1U);
}

TEST_F(DynamicDecoderTest, BooleanMapKeys) {
    MapSerializer<BooleanSerializer, IntSerializer> table{BooleanSerializer{}, IntSerializer{}};
    auto value = NativeValue::mapping();
    value.set("true", NativeValue::number(1));
    value.set("false", NativeValue::number(0));
    auto result = decode(table, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::map<bool, int32_t>{{false, 0}, {true, 1}}));

    auto bad = NativeValue::mapping();
    bad.set("yes", NativeValue::number(1));
    decode_error(table, bad, ErrorKind::TypeMismatch);
}

TEST_F(DynamicDecoderTest, UndefinedMapEntriesAreSkipped) {
    MapSerializer<StringSerializer, IntSerializer> table{StringSerializer{}, IntSerializer{}};
    auto value = NativeValue::mapping();
    value.set("a", NativeValue::number(1));
    value.set_undefined("b");
    auto result = decode(table, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::map<std::string, int32_t>{{"a", 1}}));
}

TEST_F(DynamicDecoderTest, NestedErrorPath) {
    auto members = NativeValue::sequence();
    members.push(point(1, 2));
    auto broken = NativeValue::mapping();
    broken.set("x", NativeValue::number(3));
    broken.set("y", NativeValue::text("a"));
    members.push(std::move(broken));

    auto team = NativeValue::mapping();
    team.set("name", NativeValue::text("core"));
    team.set("members", std::move(members));

    auto error = decode_error(TeamSerializer{}, team, ErrorKind::TypeMismatch);
    EXPECT_EQ(error.path, "$.members[1].y");
}

// ============================================================================
// JSON Elements and Polymorphism
// ============================================================================

TEST_F(DynamicDecoderTest, ConvertsToJsonElement) {
    auto items = NativeValue::sequence();
    items.push(NativeValue::number(1));
    items.push(NativeValue::boolean(false));
    auto value = NativeValue::mapping();
    value.set("n", NativeValue::number(3));
    value.set("f", NativeValue::number(1.5));
    value.set("s", NativeValue::text("t"));
    value.set("l", std::move(items));
    value.set("z", NativeValue::null());
    value.set_undefined("u");

    auto result = decode(JsonElementSerializer{}, value);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).to_string(), R"({"n":3,"f":1.5,"s":"t","l":[1,false],"z":null})");
}

TEST_F(DynamicDecoderTest, PolymorphicObject) {
    auto value = NativeValue::mapping();
    value.set("type", NativeValue::text("test.Square"));
    value.set("side", NativeValue::number(5));

    auto result = decode(shape_serializer(), value);
    ASSERT_TRUE(is_ok(result));
    auto square = std::dynamic_pointer_cast<Square>(unwrap(result));
    ASSERT_NE(square, nullptr);
    EXPECT_EQ(square->side, 5);

    value.set("type", NativeValue::number(1));
    decode_error(shape_serializer(), value, ErrorKind::TypeMismatch);
}
