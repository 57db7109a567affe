//! # JSON Parser Tests
//!
//! Tests for the lexer and the tree parser under the syntax options of
//! `JsonConfiguration`.
//!
//! ## Test Coverage
//! - Strict RFC 8259 input and error positions
//! - Lenient bare words and single quotes
//! - Comments and trailing commas
//! - Special floating-point literals
//! - Duplicate keys and the nesting depth limit

#include "weft/json/json_lexer.hpp"
#include "weft/json/json_parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace weft;
using namespace weft::json;

class JsonParserTest : public ::testing::Test {
protected:
    JsonConfiguration config;

    auto parse(std::string_view input) -> Result<JsonValue, SerialError> {
        return parse_json(input, config);
    }

    /// Parses `input`, expecting failure, and returns the error.
    auto parse_error(std::string_view input) -> SerialError {
        auto result = parse(input);
        EXPECT_TRUE(is_err(result)) << "parsed: " << input;
        if (is_ok(result)) {
            return SerialError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Strict Input
// ============================================================================

TEST_F(JsonParserTest, ParsesDocument) {
    auto result = parse(R"({"name": "Alice", "tags": ["a", 1, 2.5e3, true, null], "n": {}})");
    ASSERT_TRUE(is_ok(result));
    const auto& root = unwrap(result);

    EXPECT_EQ(root.get("name")->as_primitive().content, "Alice");
    const auto& tags = root.get("tags")->as_array();
    ASSERT_EQ(tags.size(), 5u);
    EXPECT_TRUE(tags[0].is_string());
    EXPECT_EQ(tags[2].as_primitive().content, "2.5e3");
    EXPECT_EQ(tags[3].as_primitive().content, "true");
    EXPECT_TRUE(tags[4].is_null());
    EXPECT_TRUE(root.get("n")->is_object());
}

TEST_F(JsonParserTest, ParsesPrimitiveRoot) {
    auto result = parse("  -0.5  ");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_primitive().content, "-0.5");
}

TEST_F(JsonParserTest, UnescapesStrings) {
    auto result = parse(R"("tab\tquote\"slash\/u\u00e9pair\ud83d\ude00")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_primitive().content,
              "tab\tquote\"slash/u\xc3\xa9pair\xf0\x9f\x98\x80");
}

TEST_F(JsonParserTest, RejectsBareWordWithPosition) {
    auto error = parse_error("{\n  \"a\": tru\n}");
    EXPECT_EQ(error.kind, ErrorKind::MalformedInput);
    EXPECT_EQ(error.line, 2u);
    EXPECT_EQ(error.column, 8u);
    EXPECT_NE(error.message.find("Unexpected token 'tru'"), std::string::npos);
    EXPECT_NE(error.message.find("is_lenient = true"), std::string::npos);
}

TEST_F(JsonParserTest, RejectsMalformedStructure) {
    EXPECT_NE(parse_error(R"({"a" 1})").message.find("Expected ':'"), std::string::npos);
    EXPECT_NE(parse_error(R"({1: 2})").message.find("Expected string key"), std::string::npos);
    EXPECT_NE(parse_error("[1 2]").message.find("Expected ',' or ']'"), std::string::npos);
    EXPECT_NE(parse_error("[1, ").message.find("Unexpected end of input"), std::string::npos);
    EXPECT_NE(parse_error("{} []").message.find("Unexpected content after JSON value"),
              std::string::npos);
    EXPECT_EQ(parse_error("").kind, ErrorKind::MalformedInput);
}

TEST_F(JsonParserTest, RejectsBadLiterals) {
    EXPECT_NE(parse_error("01").message.find("Unexpected content"), std::string::npos);
    EXPECT_NE(parse_error("1.").message.find("Expected digit after decimal point"),
              std::string::npos);
    EXPECT_NE(parse_error("\"abc").message.find("Unterminated string"), std::string::npos);
    EXPECT_NE(parse_error(R"("\x")").message.find("Invalid escape sequence"), std::string::npos);
    EXPECT_NE(parse_error("'a'").message.find("single-quoted"), std::string::npos);
}

// ============================================================================
// Lenient Input
// ============================================================================

TEST_F(JsonParserTest, StrictRejectsUnquotedKeys) {
    auto error = parse_error(R"({a: b, c: "d"})");
    EXPECT_EQ(error.kind, ErrorKind::MalformedInput);
}

TEST_F(JsonParserTest, LenientAcceptsBareWords) {
    config.is_lenient = true;
    auto result = parse(R"({a: b, c: "d", 'e': 'f', n: 12, t: true})");
    ASSERT_TRUE(is_ok(result));
    const auto& root = unwrap(result);

    EXPECT_EQ(root.get("a")->as_primitive().content, "b");
    EXPECT_FALSE(root.get("a")->is_string());
    EXPECT_TRUE(root.get("c")->is_string());
    EXPECT_EQ(root.get("e")->as_primitive().content, "f");
    EXPECT_EQ(root.get("n")->as_primitive().content, "12");
    EXPECT_EQ(root.get("t")->as_primitive().content, "true");
}

// ============================================================================
// Comments and Trailing Commas
// ============================================================================

TEST_F(JsonParserTest, CommentsNeedOption) {
    std::string input = "{ // line\n \"a\": /* block */ 1 }";
    EXPECT_TRUE(is_err(parse(input)));

    config.allow_comments = true;
    auto result = parse(input);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).get("a")->as_primitive().content, "1");
}

TEST_F(JsonParserTest, UnterminatedBlockComment) {
    config.allow_comments = true;
    auto error = parse_error("[1, /* never closed");
    EXPECT_NE(error.message.find("block comment"), std::string::npos);
}

TEST_F(JsonParserTest, TrailingCommaNeedsOption) {
    auto object_error = parse_error(R"({"a": 1,})");
    EXPECT_NE(object_error.message.find("Trailing comma before the end of JSON object"),
              std::string::npos);
    auto array_error = parse_error("[1, 2,]");
    EXPECT_NE(array_error.message.find("allow_trailing_comma = true"), std::string::npos);

    config.allow_trailing_comma = true;
    auto object = parse(R"({"a": 1,})");
    ASSERT_TRUE(is_ok(object));
    EXPECT_EQ(unwrap(object).size(), 1u);
    auto array = parse("[1, 2,]");
    ASSERT_TRUE(is_ok(array));
    EXPECT_EQ(unwrap(array).size(), 2u);

    EXPECT_TRUE(is_err(parse("[,]")));
}

// ============================================================================
// Special Floating-Point Values
// ============================================================================

TEST_F(JsonParserTest, SpecialFloatsNeedOption) {
    auto error = parse_error("[NaN]");
    EXPECT_EQ(error.kind, ErrorKind::MalformedInput);
    EXPECT_NE(error.message.find("Unexpected special floating-point value NaN"),
              std::string::npos);

    config.allow_special_floating_point_values = true;
    auto result = parse("[NaN, Infinity, -Infinity]");
    ASSERT_TRUE(is_ok(result));
    const auto& values = unwrap(result).as_array();
    EXPECT_EQ(values[0].as_primitive().content, "NaN");
    EXPECT_EQ(values[2].as_primitive().content, "-Infinity");
    EXPECT_FALSE(values[1].is_string());
}

TEST(JsonLexerHelpersTest, NumberGrammar) {
    EXPECT_TRUE(is_json_number("0"));
    EXPECT_TRUE(is_json_number("-12.5e-3"));
    EXPECT_FALSE(is_json_number("012"));
    EXPECT_FALSE(is_json_number(".5"));
    EXPECT_FALSE(is_json_number("1e"));
    EXPECT_FALSE(is_json_number(""));
    EXPECT_TRUE(is_special_float_literal("-Infinity"));
    EXPECT_FALSE(is_special_float_literal("nan"));
}

TEST(JsonLexerHelpersTest, TokensCarryPositions) {
    JsonLexer lexer("[1,\n  true]", {});
    EXPECT_EQ(lexer.next_token().kind, JsonTokenKind::LBracket);
    auto number = lexer.next_token();
    EXPECT_EQ(number.kind, JsonTokenKind::Number);
    EXPECT_EQ(number.text, "1");
    EXPECT_EQ(lexer.next_token().kind, JsonTokenKind::Comma);
    auto keyword = lexer.next_token();
    EXPECT_EQ(keyword.kind, JsonTokenKind::True);
    EXPECT_EQ(keyword.line, 2u);
    EXPECT_EQ(keyword.column, 3u);
    EXPECT_EQ(lexer.next_token().kind, JsonTokenKind::RBracket);
    EXPECT_EQ(lexer.next_token().kind, JsonTokenKind::Eof);
}

TEST(JsonLexerHelpersTest, SkipValueConsumesStructure) {
    JsonLexer lexer(R"({"a": [1, {"b": 2}]} 7)", {});
    auto skipped = lexer.skip_value();
    ASSERT_TRUE(is_ok(skipped));
    EXPECT_EQ(lexer.next_token().text, "7");
}

// ============================================================================
// Duplicate Keys and Depth
// ============================================================================

TEST_F(JsonParserTest, DuplicateKeyKeepsLastValueAtFirstPosition) {
    auto result = parse(R"({"a": 1, "b": 2, "a": 3})");
    ASSERT_TRUE(is_ok(result));
    const auto& obj = unwrap(result).as_object();
    ASSERT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.key_at(0), "a");
    EXPECT_EQ(obj.value_at(0).as_primitive().content, "3");
}

TEST_F(JsonParserTest, NestingUpToLimitIsAccepted) {
    std::string input(JsonParser::MAX_DEPTH, '[');
    input.append(JsonParser::MAX_DEPTH, ']');
    EXPECT_TRUE(is_ok(parse(input)));
}

TEST_F(JsonParserTest, NestingBeyondLimitFails) {
    std::string input(JsonParser::MAX_DEPTH + 1, '[');
    input.append(JsonParser::MAX_DEPTH + 1, ']');
    auto error = parse_error(input);
    EXPECT_NE(error.message.find("Maximum nesting depth exceeded"), std::string::npos);
    EXPECT_EQ(error.column, JsonParser::MAX_DEPTH + 1);
}
