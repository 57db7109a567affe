//! # JSON Codec Tests
//!
//! End-to-end tests of `Json` over the hand-written models in
//! `test_models.hpp`. Every decode runs through both the streaming decoder
//! and the tree decoder, and every encode through both encoders, so the two
//! codecs are held to the same behavior.
//!
//! ## Test Coverage
//! - Class round trips, defaults and `encode_defaults`
//! - Alternative names, naming strategies, quoted and unquoted literals
//! - Unknown keys (including malformed skipped values), missing fields and error paths
//! - `explicit_nulls` and `coerce_input_values`
//! - Special floating-point values
//! - Raw `JsonValue` output stays strict JSON
//! - Nested lists and maps, pretty printing
//! - Configuration validation

#include "weft/json/json.hpp"

#include "test_models.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace weft;
using namespace weft::json;
using namespace weft::test;

class JsonCodecTest : public ::testing::Test {
protected:
    JsonConfiguration config;

    auto json() -> Json {
        auto made = Json::make(config);
        EXPECT_TRUE(is_ok(made));
        return unwrap(made);
    }

    /// Decodes through the streaming path.
    template <typename T>
    auto decode_streaming(const Serializer<T>& serializer, std::string_view text)
        -> Result<T, SerialError> {
        return json().decode_from_string(serializer, text);
    }

    /// Decodes through a parsed tree.
    template <typename T>
    auto decode_tree(const Serializer<T>& serializer, std::string_view text)
        -> Result<T, SerialError> {
        auto instance = json();
        auto tree = instance.parse_to_json_element(text);
        if (is_err(tree)) {
            return unwrap_err(tree);
        }
        return instance.decode_from_json_element(serializer, unwrap(tree));
    }

    /// Decodes with both codecs, expecting the same value from each.
    template <typename T> auto decode(const Serializer<T>& serializer, std::string_view text) -> T {
        auto streaming = decode_streaming(serializer, text);
        auto tree = decode_tree(serializer, text);
        EXPECT_TRUE(is_ok(streaming)) << text << ": "
                                      << (is_err(streaming) ? unwrap_err(streaming).to_string() : "");
        EXPECT_TRUE(is_ok(tree)) << text << ": "
                                 << (is_err(tree) ? unwrap_err(tree).to_string() : "");
        if (is_err(streaming) || is_err(tree)) {
            return T{};
        }
        EXPECT_TRUE(unwrap(streaming) == unwrap(tree)) << text;
        return unwrap(streaming);
    }

    /// Decodes with both codecs, expecting each to fail with `kind`.
    template <typename T>
    auto decode_error(const Serializer<T>& serializer, std::string_view text, ErrorKind kind)
        -> std::pair<SerialError, SerialError> {
        auto streaming = decode_streaming(serializer, text);
        auto tree = decode_tree(serializer, text);
        EXPECT_TRUE(is_err(streaming)) << "streaming decoded: " << text;
        EXPECT_TRUE(is_err(tree)) << "tree decoded: " << text;
        if (is_ok(streaming) || is_ok(tree)) {
            return {};
        }
        EXPECT_EQ(unwrap_err(streaming).kind, kind) << unwrap_err(streaming).to_string();
        EXPECT_EQ(unwrap_err(tree).kind, kind) << unwrap_err(tree).to_string();
        return {unwrap_err(streaming), unwrap_err(tree)};
    }

    /// Encodes with both encoders, expecting the same compact text.
    template <typename T> auto encode(const Serializer<T>& serializer, const T& value) -> std::string {
        auto instance = json();
        auto text = instance.encode_to_string(serializer, value);
        auto tree = instance.encode_to_json_element(serializer, value);
        EXPECT_TRUE(is_ok(text)) << (is_err(text) ? unwrap_err(text).to_string() : "");
        EXPECT_TRUE(is_ok(tree)) << (is_err(tree) ? unwrap_err(tree).to_string() : "");
        if (is_err(text) || is_err(tree)) {
            return {};
        }
        if (!config.pretty_print) {
            EXPECT_EQ(unwrap(tree).to_string(), unwrap(text));
        }
        return unwrap(text);
    }

    /// Encodes with both encoders, expecting each to fail with `kind`.
    template <typename T>
    void encode_error(const Serializer<T>& serializer, const T& value, ErrorKind kind) {
        auto instance = json();
        auto text = instance.encode_to_string(serializer, value);
        auto tree = instance.encode_to_json_element(serializer, value);
        ASSERT_TRUE(is_err(text));
        ASSERT_TRUE(is_err(tree));
        EXPECT_EQ(unwrap_err(text).kind, kind);
        EXPECT_EQ(unwrap_err(tree).kind, kind);
    }
};

// ============================================================================
// Classes
// ============================================================================

TEST_F(JsonCodecTest, PointRoundTrip) {
    PointSerializer points;
    EXPECT_EQ(encode(points, Point{1, 2}), R"({"x":1,"y":2})");
    EXPECT_EQ(decode(points, R"({"x":1,"y":2})"), (Point{1, 2}));
    EXPECT_EQ(decode(points, R"( { "y" : -7 , "x" : 0 } )"), (Point{0, -7}));
}

TEST_F(JsonCodecTest, DefaultsOmittedUnlessRequested) {
    ProfileSerializer profiles;
    Profile profile{"ann", std::nullopt, 1, Color::Red};
    EXPECT_EQ(encode(profiles, profile), R"({"userName":"ann"})");

    config.encode_defaults = true;
    EXPECT_EQ(encode(profiles, profile), R"({"userName":"ann","age":null,"level":1,"color":"RED"})");
}

TEST_F(JsonCodecTest, DecodesOptionalAndAlternativeNames) {
    ProfileSerializer profiles;
    auto profile = decode(profiles, R"({"login":"bob","age":null,"color":"BLUE"})");
    EXPECT_EQ(profile.user_name, "bob");
    EXPECT_EQ(profile.age, std::nullopt);
    EXPECT_EQ(profile.level, 1);
    EXPECT_EQ(profile.color, Color::Blue);

    EXPECT_EQ(decode(profiles, R"({"userName":"c","age":41,"level":3})").age,
              std::optional<int32_t>(41));
}

TEST_F(JsonCodecTest, NamingStrategyRenamesBothWays) {
    config.naming_strategy = snake_case();
    ProfileSerializer profiles;
    Profile profile{"ann", 30, 1, Color::Red};
    EXPECT_EQ(encode(profiles, profile), R"({"user_name":"ann","age":30})");
    EXPECT_EQ(decode(profiles, R"({"user_name":"ann","age":30})"), profile);
}

TEST_F(JsonCodecTest, QuotedNumbersAccepted) {
    PointSerializer points;
    EXPECT_EQ(decode(points, R"({"x":"1","y":2})"), (Point{1, 2}));
}

TEST_F(JsonCodecTest, UnquotedStringNeedsLenient) {
    ProfileSerializer profiles;
    decode_error(profiles, R"({"userName":42})", ErrorKind::TypeMismatch);

    config.is_lenient = true;
    EXPECT_EQ(decode(profiles, R"({"userName":42})").user_name, "42");
    EXPECT_EQ(decode(profiles, R"({userName: ann, color: GREEN})").color, Color::Green);
}

// ============================================================================
// Unknown and Missing Keys
// ============================================================================

TEST_F(JsonCodecTest, UnknownKeysIgnoredByDefault) {
    PointSerializer points;
    EXPECT_EQ(decode(points, R"({"x":1,"extra":{"deep":[1,2,{}]},"y":2})"), (Point{1, 2}));
}

TEST_F(JsonCodecTest, MalformedSkippedValueFails) {
    PointSerializer points;
    decode_error(points, R"({"x":1,"junk":[1,2},"y":2})", ErrorKind::MalformedInput);
    decode_error(points, R"({"x":1,"junk":{"a":[{]}},"y":2})", ErrorKind::MalformedInput);
    decode_error(points, R"({"x":1,"junk":[[1],"y":2})", ErrorKind::MalformedInput);
}

TEST_F(JsonCodecTest, UnknownKeyFailsWhenNotIgnored) {
    config.ignore_unknown_keys = false;
    PointSerializer points;
    auto [streaming, tree] = decode_error(points, R"({"x":1,"k":0,"y":2})", ErrorKind::UnknownKey);
    EXPECT_EQ(streaming.message,
              "Encountered an unknown key 'k'. Use 'ignore_unknown_keys = true' to ignore "
              "unknown keys");
    EXPECT_NE(tree.message.find("'k'"), std::string::npos);
}

TEST_F(JsonCodecTest, MissingFieldNamesType) {
    PointSerializer points;
    auto [streaming, tree] = decode_error(points, R"({"x":1})", ErrorKind::MissingRequiredValue);
    EXPECT_EQ(streaming.message,
              "Field 'y' is required for type with serial name 'test.Point', but it was missing");
    EXPECT_EQ(tree.message, streaming.message);
}

TEST_F(JsonCodecTest, ErrorPathPointsIntoNestedValue) {
    TeamSerializer teams;
    auto [streaming, tree] =
        decode_error(teams, R"({"name":"n","members":[{"x":1,"y":2},{"x":3,"y":"a"}]})",
                     ErrorKind::TypeMismatch);
    EXPECT_EQ(streaming.path, "$.members[1].y");
    EXPECT_EQ(tree.path, "$.members[1].y");
    EXPECT_GT(streaming.line, 0u);
}

TEST_F(JsonCodecTest, NullForNonNullableFails) {
    PointSerializer points;
    auto [streaming, tree] = decode_error(points, R"({"x":null,"y":2})", ErrorKind::TypeMismatch);
    EXPECT_EQ(streaming.message, "Unexpected 'null' literal when non-nullable int was expected");
    EXPECT_EQ(tree.message, streaming.message);
}

TEST_F(JsonCodecTest, UnknownEnumValueFails) {
    ProfileSerializer profiles;
    auto [streaming, tree] =
        decode_error(profiles, R"({"userName":"a","color":"PURPLE"})", ErrorKind::UnknownEnumValue);
    EXPECT_EQ(streaming.message, "test.Color does not contain element with name 'PURPLE'");
}

// ============================================================================
// Nulls and Coercion
// ============================================================================

TEST_F(JsonCodecTest, ExplicitNullsWriteAndRequireNull) {
    NoteSerializer notes;
    EXPECT_EQ(encode(notes, Note{"t", std::nullopt}), R"({"title":"t","body":null})");
    EXPECT_EQ(decode(notes, R"({"title":"t","body":null})"), (Note{"t", std::nullopt}));
    decode_error(notes, R"({"title":"t"})", ErrorKind::MissingRequiredValue);
}

TEST_F(JsonCodecTest, ImplicitNullsOmitAndDefaultToNull) {
    config.explicit_nulls = false;
    NoteSerializer notes;
    EXPECT_EQ(encode(notes, Note{"t", std::nullopt}), R"({"title":"t"})");
    EXPECT_EQ(encode(notes, Note{"t", "b"}), R"({"title":"t","body":"b"})");
    EXPECT_EQ(decode(notes, R"({"title":"t"})"), (Note{"t", std::nullopt}));
}

TEST_F(JsonCodecTest, CoercionFallsBackToDefaults) {
    ProfileSerializer profiles;
    std::string input = R"({"userName":"a","level":null,"color":"PURPLE"})";
    decode_error(profiles, input, ErrorKind::TypeMismatch);

    config.coerce_input_values = true;
    auto profile = decode(profiles, input);
    EXPECT_EQ(profile.user_name, "a");
    EXPECT_EQ(profile.level, 1);
    EXPECT_EQ(profile.color, Color::Red);
}

TEST_F(JsonCodecTest, CoercionLeavesRequiredValuesAlone) {
    config.coerce_input_values = true;
    PointSerializer points;
    decode_error(points, R"({"x":null,"y":2})", ErrorKind::TypeMismatch);
}

// ============================================================================
// Primitives at the Root
// ============================================================================

TEST_F(JsonCodecTest, RootPrimitives) {
    EXPECT_EQ(decode(IntSerializer{}, "  42 "), 42);
    EXPECT_EQ(decode(StringSerializer{}, R"("a\nb")"), "a\nb");
    EXPECT_EQ(encode(StringSerializer{}, std::string("a\"b")), R"("a\"b")");
    EXPECT_EQ(encode(BooleanSerializer{}, true), "true");
    EXPECT_EQ(encode(DoubleSerializer{}, 2.0), "2.0");
}

TEST_F(JsonCodecTest, RootNullable) {
    NullableSerializer<IntSerializer> ints{IntSerializer{}};
    EXPECT_EQ(decode(ints, "null"), std::nullopt);
    EXPECT_EQ(decode(ints, "5"), std::optional<int32_t>(5));
    EXPECT_EQ(encode(ints, std::optional<int32_t>()), "null");
}

TEST_F(JsonCodecTest, LongBeyondSafeIntegerFails) {
    EXPECT_EQ(decode(LongSerializer{}, "9007199254740991"), int64_t{9007199254740991});
    decode_error(LongSerializer{}, "9007199254740992", ErrorKind::PrecisionLoss);
}

TEST_F(JsonCodecTest, OutOfRangeIntFails) {
    decode_error(ByteSerializer{}, "200", ErrorKind::TypeMismatch);
    decode_error(IntSerializer{}, "1.5", ErrorKind::TypeMismatch);
}

// ============================================================================
// Special Floating-Point Values
// ============================================================================

TEST_F(JsonCodecTest, SpecialFloatsRejectedByDefault) {
    CircleSerializer circles;
    encode_error(circles, Circle(std::numeric_limits<double>::quiet_NaN()),
                 ErrorKind::InvalidValue);
    decode_error(circles, R"({"radius":NaN})", ErrorKind::MalformedInput);
    decode_error(circles, R"({"radius":"Infinity"})", ErrorKind::MalformedInput);
}

TEST_F(JsonCodecTest, SpecialFloatsAllowedWhenEnabled) {
    config.allow_special_floating_point_values = true;
    CircleSerializer circles;
    EXPECT_EQ(encode(circles, Circle(std::numeric_limits<double>::infinity())),
              R"({"radius":Infinity})");

    auto streaming = decode_streaming(circles, R"({"radius":NaN})");
    ASSERT_TRUE(is_ok(streaming));
    EXPECT_TRUE(std::isnan(unwrap(streaming).radius));
    auto tree = decode_tree(circles, R"({"radius":-Infinity})");
    ASSERT_TRUE(is_ok(tree));
    EXPECT_TRUE(std::isinf(unwrap(tree).radius));
}

// ============================================================================
// JSON Elements
// ============================================================================

TEST_F(JsonCodecTest, LenientBareWordsWrittenAsStrings) {
    config.is_lenient = true;
    auto element = json().parse_to_json_element("{a: b, c: .5, d: 'x', e: 1.5, f: true, g: null}");
    ASSERT_TRUE(is_ok(element)) << unwrap_err(element).to_string();

    std::string text = encode(JsonElementSerializer{}, unwrap(element));
    EXPECT_EQ(text, R"({"a":"b","c":".5","d":"x","e":1.5,"f":true,"g":null})");

    auto reparsed = Json::default_instance().parse_to_json_element(text);
    ASSERT_TRUE(is_ok(reparsed)) << unwrap_err(reparsed).to_string();
    EXPECT_TRUE(unwrap(reparsed).as_object().get("e")->is_primitive());
}

TEST_F(JsonCodecTest, SpecialFloatElementsBareOnlyWhenEnabled) {
    config.allow_special_floating_point_values = true;
    auto element = json().parse_to_json_element("[NaN,-Infinity,2]");
    ASSERT_TRUE(is_ok(element)) << unwrap_err(element).to_string();
    EXPECT_EQ(encode(JsonElementSerializer{}, unwrap(element)), "[NaN,-Infinity,2]");

    auto strict = Json::default_instance().encode_to_string(JsonElementSerializer{},
                                                            unwrap(element));
    ASSERT_TRUE(is_ok(strict));
    EXPECT_EQ(unwrap(strict), R"(["NaN","-Infinity",2])");
}

// ============================================================================
// Collections
// ============================================================================

TEST_F(JsonCodecTest, NestedCollectionsRoundTrip) {
    TeamSerializer teams;
    Team team{"core", {{1, 2}, {3, 4}}, {{"a", 1}, {"b", 2}}};
    std::string text = R"({"name":"core","members":[{"x":1,"y":2},{"x":3,"y":4}],"scores":{"a":1,"b":2}})";
    EXPECT_EQ(encode(teams, team), text);
    EXPECT_EQ(decode(teams, text), team);
}

TEST_F(JsonCodecTest, EmptyCollections) {
    TeamSerializer teams;
    EXPECT_EQ(encode(teams, Team{"solo", {}, {}}), R"({"name":"solo"})");
    EXPECT_EQ(decode(teams, R"({"name":"solo","members":[],"scores":{}})"), (Team{"solo", {}, {}}));

    config.encode_defaults = true;
    EXPECT_EQ(encode(teams, Team{"solo", {}, {}}), R"({"name":"solo","members":[],"scores":{}})");
}

TEST_F(JsonCodecTest, MapKeysMustBeStrings) {
    MapSerializer<IntSerializer, StringSerializer> table{IntSerializer{}, StringSerializer{}};
    std::map<int32_t, std::string> values{{1, "one"}, {2, "two"}};
    EXPECT_EQ(encode(table, values), R"({"1":"one","2":"two"})");
    EXPECT_EQ(decode(table, R"({"2":"two","1":"one"})"), values);
    decode_error(table, R"({"x":"one"})", ErrorKind::TypeMismatch);
}

TEST_F(JsonCodecTest, StructuredMapKeysRejected) {
    using Keys = ListSerializer<IntSerializer>;
    MapSerializer<Keys, IntSerializer> table{Keys{IntSerializer{}}, IntSerializer{}};
    std::map<std::vector<int32_t>, int32_t> values{{{1, 2}, 3}};
    encode_error(table, values, ErrorKind::InvalidValue);
}

TEST_F(JsonCodecTest, TrailingContentFails) {
    decode_error(PointSerializer{}, R"({"x":1,"y":2} 3)", ErrorKind::MalformedInput);
}

// ============================================================================
// Pretty Printing
// ============================================================================

TEST_F(JsonCodecTest, PrettyPrintWithCustomIndent) {
    config.pretty_print = true;
    config.pretty_print_indent = "  ";
    EXPECT_EQ(encode(PointSerializer{}, Point{1, 2}), "{\n  \"x\": 1,\n  \"y\": 2\n}");
}

// ============================================================================
// Configuration
// ============================================================================

TEST(JsonConfigurationTest, RejectsInvalidOptions) {
    JsonConfiguration bad_indent;
    bad_indent.pretty_print = true;
    bad_indent.pretty_print_indent = "ab";
    auto indent = Json::make(bad_indent);
    ASSERT_TRUE(is_err(indent));
    EXPECT_EQ(unwrap_err(indent).kind, ErrorKind::InvalidConfiguration);

    JsonConfiguration indent_without_pretty;
    indent_without_pretty.pretty_print_indent = "\t";
    EXPECT_TRUE(is_err(Json::make(indent_without_pretty)));

    JsonConfiguration blank_discriminator;
    blank_discriminator.class_discriminator = " ";
    EXPECT_TRUE(is_err(Json::make(blank_discriminator)));

    EXPECT_TRUE(is_ok(Json::make(JsonConfiguration{})));
}

TEST(JsonConfigurationTest, DefaultInstance) {
    const auto& json = Json::default_instance();
    EXPECT_TRUE(json.configuration().ignore_unknown_keys);
    EXPECT_TRUE(json.configuration().explicit_nulls);
    EXPECT_EQ(json.configuration().class_discriminator, "type");
}
