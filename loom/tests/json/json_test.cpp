//! # JSON Tests
//!
//! Parser, serializer and string quoting as used for configuration files,
//! `package.json` lookups and the graph dump.

#include "json/json.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::json;

// ============================================================================
// Parser
// ============================================================================

TEST(JsonParserTest, Primitives) {
    auto n = parse_json("null");
    auto b = parse_json(" true ");
    auto i = parse_json("-42");
    auto d = parse_json("2.5e1");
    auto s = parse_json(R"("a\tb\u00e9")");
    ASSERT_TRUE(is_ok(n) && is_ok(b) && is_ok(i) && is_ok(d) && is_ok(s));

    EXPECT_TRUE(unwrap(n).is_null());
    EXPECT_TRUE(unwrap(b).as_bool());
    EXPECT_TRUE(unwrap(i).is_integer());
    EXPECT_EQ(unwrap(i).as_i64(), -42);
    EXPECT_FALSE(unwrap(d).is_integer());
    EXPECT_DOUBLE_EQ(unwrap(d).as_f64(), 25.0);
    EXPECT_EQ(unwrap(s).as_string(), "a\tb\xc3\xa9");
}

TEST(JsonParserTest, NestedObject) {
    auto result = parse_json(R"({"name": "lib", "exports": {"main": "index.js"}, "files": [1, 2]})");
    ASSERT_TRUE(is_ok(result));
    const auto& value = unwrap(result);

    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value.get("name")->as_string(), "lib");
    EXPECT_EQ(value.get("exports")->get("main")->as_string(), "index.js");
    EXPECT_EQ(value.get("files")->as_array().size(), 2u);
    EXPECT_EQ(value.get("missing"), nullptr);
    EXPECT_EQ(value.get("name")->get("x"), nullptr);
}

TEST(JsonParserTest, SurrogatePair) {
    auto result = parse_json(R"("\ud83d\ude00")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "\xf0\x9f\x98\x80");
}

TEST(JsonParserTest, ErrorsCarryLocation) {
    auto result = parse_json("{\n  \"a\": tru\n}");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).line, 2u);
    EXPECT_NE(unwrap_err(result).to_string().find("line 2"), std::string::npos);
}

TEST(JsonParserTest, RejectsMalformedInput) {
    for (const char* text : {"", "{", "[1,]", "{\"a\" 1}", "\"open", "1 2", "{'a': 1}"}) {
        EXPECT_TRUE(is_err(parse_json(text))) << text;
    }
}

TEST(JsonParserTest, DepthLimit) {
    std::string deep(MAX_DEPTH + 2, '[');
    deep += std::string(MAX_DEPTH + 2, ']');
    EXPECT_TRUE(is_err(parse_json(deep)));

    std::string ok(10, '[');
    ok += std::string(10, ']');
    EXPECT_TRUE(is_ok(parse_json(ok)));
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, CompactWithSortedKeys) {
    JsonObject object;
    object["b"] = JsonValue(1);
    object["a"] = JsonValue(JsonArray{JsonValue(true), JsonValue(), JsonValue("x")});
    EXPECT_EQ(JsonValue(object).to_string(), R"({"a":[true,null,"x"],"b":1})");
}

TEST(JsonSerializerTest, Indented) {
    JsonObject object;
    object["nodes"] = JsonValue(JsonArray{JsonValue("a.ts")});
    object["empty"] = JsonValue(JsonArray{});
    EXPECT_EQ(JsonValue(object).to_string(2), "{\n  \"empty\": [],\n  \"nodes\": [\n    \"a.ts\"\n  ]\n}");
}

TEST(JsonSerializerTest, SerializedOutputParsesBack) {
    auto text = R"({"alias":{"@":"./src"},"limit":10000,"ratio":0.5})";
    auto result = parse_json(text);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).to_string(), text);
}

// ============================================================================
// Quoting
// ============================================================================

TEST(JsonQuoteTest, EscapesControlCharacters) {
    EXPECT_EQ(quote("plain"), "\"plain\"");
    EXPECT_EQ(quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(quote("line\nbreak\t"), "\"line\\nbreak\\t\"");
    EXPECT_EQ(quote(std::string_view("\x01", 1)), "\"\\u0001\"");
}
