//! # Polymorphic JSON Tests
//!
//! Tests for `PolymorphicSerializer` bound to the JSON codecs.
//!
//! ## Test Coverage
//! - Object shape with a class discriminator (default and custom key)
//! - Array shape under `use_array_polymorphism`
//! - Discriminator position, unknown and missing types
//! - Polymorphic values nested in lists
//! - Registration errors

#include "weft/json/json.hpp"

#include "test_models.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <typeinfo>

using namespace weft;
using namespace weft::json;
using namespace weft::test;

namespace {

struct Triangle : Shape {};

auto circle(double radius) -> Rc<Shape> {
    return make_rc<Circle>(radius);
}

auto square(int32_t side) -> Rc<Shape> {
    return make_rc<Square>(side);
}

auto radius_of(const Rc<Shape>& shape) -> double {
    auto c = std::dynamic_pointer_cast<Circle>(shape);
    return c ? c->radius : -1;
}

auto side_of(const Rc<Shape>& shape) -> int32_t {
    auto s = std::dynamic_pointer_cast<Square>(shape);
    return s ? s->side : -1;
}

} // namespace

class JsonPolymorphicTest : public ::testing::Test {
protected:
    JsonConfiguration config;
    PolymorphicSerializer<Shape> shapes = shape_serializer();

    auto json() -> Json {
        auto made = Json::make(config);
        EXPECT_TRUE(is_ok(made));
        return unwrap(made);
    }

    /// Encodes with both encoders, expecting the same text.
    auto encode(const Rc<Shape>& shape) -> std::string {
        auto instance = json();
        auto text = instance.encode_to_string(shapes, shape);
        auto tree = instance.encode_to_json_element(shapes, shape);
        EXPECT_TRUE(is_ok(text)) << (is_err(text) ? unwrap_err(text).to_string() : "");
        EXPECT_TRUE(is_ok(tree)) << (is_err(tree) ? unwrap_err(tree).to_string() : "");
        if (is_err(text) || is_err(tree)) {
            return {};
        }
        EXPECT_EQ(unwrap(tree).to_string(), unwrap(text));
        return unwrap(text);
    }

    auto decode_streaming(std::string_view text) -> Result<Rc<Shape>, SerialError> {
        return json().decode_from_string(shapes, text);
    }

    auto decode_tree(std::string_view text) -> Result<Rc<Shape>, SerialError> {
        auto instance = json();
        auto tree = instance.parse_to_json_element(text);
        if (is_err(tree)) {
            return unwrap_err(tree);
        }
        return instance.decode_from_json_element(shapes, unwrap(tree));
    }

    /// Decodes with both decoders; returns the streaming result.
    auto decode(std::string_view text) -> Rc<Shape> {
        auto streaming = decode_streaming(text);
        auto tree = decode_tree(text);
        EXPECT_TRUE(is_ok(streaming)) << text << ": "
                                      << (is_err(streaming) ? unwrap_err(streaming).to_string() : "");
        EXPECT_TRUE(is_ok(tree)) << text << ": "
                                 << (is_err(tree) ? unwrap_err(tree).to_string() : "");
        if (is_err(streaming) || is_err(tree)) {
            return nullptr;
        }
        const Shape& first = *unwrap(streaming);
        const Shape& second = *unwrap(tree);
        EXPECT_EQ(typeid(first), typeid(second));
        return unwrap(streaming);
    }

    void expect_decode_error(std::string_view text, ErrorKind kind) {
        auto streaming = decode_streaming(text);
        auto tree = decode_tree(text);
        ASSERT_TRUE(is_err(streaming)) << text;
        ASSERT_TRUE(is_err(tree)) << text;
        EXPECT_EQ(unwrap_err(streaming).kind, kind) << unwrap_err(streaming).to_string();
        EXPECT_EQ(unwrap_err(tree).kind, kind) << unwrap_err(tree).to_string();
    }
};

// ============================================================================
// Object Shape
// ============================================================================

TEST_F(JsonPolymorphicTest, EncodesDiscriminatorFirst) {
    EXPECT_EQ(encode(circle(1.5)), R"({"type":"test.Circle","radius":1.5})");
    EXPECT_EQ(encode(square(2)), R"({"type":"test.Square","side":2})");
}

TEST_F(JsonPolymorphicTest, DecodesBySerialName) {
    EXPECT_DOUBLE_EQ(radius_of(decode(R"({"type":"test.Circle","radius":1.5})")), 1.5);
    EXPECT_EQ(side_of(decode(R"({"type":"test.Square","side":4})")), 4);
}

TEST_F(JsonPolymorphicTest, DiscriminatorMayComeLast) {
    EXPECT_DOUBLE_EQ(radius_of(decode(R"({"radius":2.5,"type":"test.Circle"})")), 2.5);
}

TEST_F(JsonPolymorphicTest, DiscriminatorIsNotAnUnknownKey) {
    config.ignore_unknown_keys = false;
    EXPECT_EQ(side_of(decode(R"({"type":"test.Square","side":1})")), 1);
}

TEST_F(JsonPolymorphicTest, CustomDiscriminatorKey) {
    config.class_discriminator = "kind";
    EXPECT_EQ(encode(square(3)), R"({"kind":"test.Square","side":3})");
    EXPECT_EQ(side_of(decode(R"({"kind":"test.Square","side":3})")), 3);
    expect_decode_error(R"({"type":"test.Square","side":3})", ErrorKind::MissingRequiredValue);
}

TEST_F(JsonPolymorphicTest, UnknownSubclassFails) {
    expect_decode_error(R"({"type":"test.Hexagon","sides":6})", ErrorKind::UnknownPolymorphicType);

    auto streaming = decode_streaming(R"({"type":"test.Hexagon"})");
    ASSERT_TRUE(is_err(streaming));
    EXPECT_EQ(unwrap_err(streaming).message,
              "Serializer for subclass 'test.Hexagon' is not found in the polymorphic scope of "
              "'test.Shape'");
}

TEST_F(JsonPolymorphicTest, MissingDiscriminatorFails) {
    expect_decode_error(R"({"radius":1.0})", ErrorKind::MissingRequiredValue);
}

TEST_F(JsonPolymorphicTest, NonObjectFails) {
    expect_decode_error(R"(["test.Circle",{"radius":1.0}])", ErrorKind::UnexpectedStructure);
}

// ============================================================================
// Array Shape
// ============================================================================

TEST_F(JsonPolymorphicTest, ArrayPolymorphismRoundTrip) {
    config.use_array_polymorphism = true;
    EXPECT_EQ(encode(circle(1.5)), R"(["test.Circle",{"radius":1.5}])");
    EXPECT_DOUBLE_EQ(radius_of(decode(R"(["test.Circle",{"radius":1.5}])")), 1.5);
    EXPECT_EQ(side_of(decode(R"(["test.Square",{"side":9}])")), 9);
}

TEST_F(JsonPolymorphicTest, ArrayPolymorphismErrors) {
    config.use_array_polymorphism = true;
    expect_decode_error(R"(["test.Hexagon",{}])", ErrorKind::UnknownPolymorphicType);
    expect_decode_error(R"(["test.Circle"])", ErrorKind::MissingRequiredValue);
    expect_decode_error(R"({"type":"test.Circle","radius":1.0})", ErrorKind::UnexpectedStructure);
}

// ============================================================================
// Nesting
// ============================================================================

TEST_F(JsonPolymorphicTest, ListOfShapes) {
    ListSerializer<PolymorphicSerializer<Shape>> list{shapes};
    auto instance = json();
    std::vector<Rc<Shape>> values{circle(0.5), square(7)};
    std::string expected = R"([{"type":"test.Circle","radius":0.5},{"type":"test.Square","side":7}])";

    auto text = instance.encode_to_string(list, values);
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), expected);

    auto decoded = instance.decode_from_string(list, expected);
    ASSERT_TRUE(is_ok(decoded));
    ASSERT_EQ(unwrap(decoded).size(), 2u);
    EXPECT_DOUBLE_EQ(radius_of(unwrap(decoded)[0]), 0.5);
    EXPECT_EQ(side_of(unwrap(decoded)[1]), 7);
}

// ============================================================================
// Serialization Errors
// ============================================================================

TEST_F(JsonPolymorphicTest, UnregisteredSubclassFailsToEncode) {
    auto result = json().encode_to_string(shapes, Rc<Shape>(make_rc<Triangle>()));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnknownPolymorphicType);
}

TEST_F(JsonPolymorphicTest, NullPointerFailsToEncode) {
    auto result = json().encode_to_string(shapes, Rc<Shape>());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::InvalidValue);
}

TEST(PolymorphicSerializerTest, RegistrationErrors) {
    PolymorphicSerializer<Shape> registry("test.Shape");
    registry.register_subclass<Circle>(CircleSerializer{});
    EXPECT_THROW(registry.register_subclass<Circle>(CircleSerializer{}), std::logic_error);

    EXPECT_THROW(PolymorphicSerializer<Shape>("test.Shape", SerialKind::Class),
                 std::invalid_argument);
    EXPECT_EQ(registry.descriptor()->kind(), SerialKind::Sealed);
}
