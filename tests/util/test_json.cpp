// KEYSEAL - JSON Value Tests
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include <gtest/gtest.h>

#include "keyseal/util/json.h"

#include <cmath>
#include <limits>
#include <string>

using namespace keyseal;
using namespace keyseal::util;

// ============================================================================
// Parsing
// ============================================================================

TEST(JSONParseTest, Primitives) {
    EXPECT_TRUE(JSONValue::Parse("null").IsNull());
    EXPECT_TRUE(JSONValue::Parse("true").GetBool());
    EXPECT_FALSE(JSONValue::Parse("false").GetBool(true));
    EXPECT_EQ(JSONValue::Parse("42").GetInt(), 42);
    EXPECT_EQ(JSONValue::Parse("-7").GetInt(), -7);
    EXPECT_DOUBLE_EQ(JSONValue::Parse("1.5").GetDouble(), 1.5);
    EXPECT_DOUBLE_EQ(JSONValue::Parse("2e3").GetDouble(), 2000.0);
    EXPECT_EQ(JSONValue::Parse("\"hi\"").GetString(), "hi");
}

TEST(JSONParseTest, IntegerVersusDouble) {
    EXPECT_TRUE(JSONValue::Parse("3").IsInt());
    EXPECT_TRUE(JSONValue::Parse("3.0").IsDouble());
    EXPECT_TRUE(JSONValue::Parse("3e0").IsDouble());

    // Beyond int64 falls back to double
    JSONValue big = JSONValue::Parse("123456789012345678901234");
    EXPECT_TRUE(big.IsDouble());
    EXPECT_TRUE(big.IsNumber());
}

TEST(JSONParseTest, NestedDocument) {
    const JSONValue doc = JSONValue::Parse(
        " { \"crypto\" : { \"kdf\" : \"scrypt\", \"kdfparams\" : { \"n\" : 1024 } },"
        "   \"list\" : [1, \"two\", null], \"version\" : 3 } ");

    ASSERT_TRUE(doc.IsObject());
    EXPECT_EQ(doc.Size(), 3u);
    EXPECT_EQ(doc["crypto"]["kdf"].GetString(), "scrypt");
    EXPECT_EQ(doc["crypto"]["kdfparams"]["n"].GetInt(), 1024);
    EXPECT_EQ(doc["version"].GetInt(), 3);

    const JSONValue& list = doc["list"];
    ASSERT_TRUE(list.IsArray());
    EXPECT_EQ(list.Size(), 3u);
    EXPECT_EQ(list[size_t{0}].GetInt(), 1);
    EXPECT_EQ(list[size_t{1}].GetString(), "two");
    EXPECT_TRUE(list[size_t{2}].IsNull());
    EXPECT_TRUE(list[size_t{3}].IsNull());
}

TEST(JSONParseTest, StringEscapes) {
    JSONValue v = JSONValue::Parse(R"("a\"b\\c\/d\n\t\u0041\u00e9\u20ac\ud83d\ude00")");
    EXPECT_EQ(v.GetString(), "a\"b\\c/d\n\tA\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(JSONParseTest, Errors) {
    const char* const bad[] = {
        "",
        "{",
        "[1,]",
        "{\"a\" 1}",
        "{\"a\":1,}",
        "tru",
        "01",
        "1.",
        "-",
        "\"unterminated",
        "\"bad \\x escape\"",
        "\"\\ud800\"",
        "\"\\udc00\"",
        "\"ctrl\x01\"",
        "{\"a\":1,\"a\":2}",
        "1 2",
        "{} x",
    };
    for (const char* text : bad) {
        EXPECT_THROW(JSONValue::Parse(text), JSONError) << text;
        EXPECT_FALSE(JSONValue::TryParse(text).has_value()) << text;
    }
}

TEST(JSONParseTest, ErrorReportsOffset) {
    try {
        JSONValue::Parse("[1, 2, x]");
        FAIL() << "expected JSONError";
    } catch (const JSONError& e) {
        EXPECT_EQ(e.Position(), 7u);
        EXPECT_NE(std::string(e.what()).find("at offset 7"), std::string::npos);
    }
}

TEST(JSONParseTest, DepthLimit) {
    std::string shallow(32, '[');
    shallow += std::string(32, ']');
    EXPECT_TRUE(JSONValue::TryParse(shallow).has_value());

    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(JSONValue::Parse(deep), JSONError);
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JSONSerializeTest, CompactSortsKeys) {
    JSONValue obj;
    obj["zeta"] = 1;
    obj["alpha"] = "x";
    obj["mid"] = JSONValue::Array{true, nullptr};
    EXPECT_EQ(obj.ToJSON(), R"({"alpha":"x","mid":[true,null],"zeta":1})");
}

TEST(JSONSerializeTest, Pretty) {
    JSONValue obj;
    obj["a"] = 1;
    obj["b"] = JSONValue::Array{2, 3};
    obj["c"] = JSONValue::Object{};
    EXPECT_EQ(obj.ToJSON(true),
              "{\n"
              "  \"a\": 1,\n"
              "  \"b\": [\n"
              "    2,\n"
              "    3\n"
              "  ],\n"
              "  \"c\": {}\n"
              "}");
}

TEST(JSONSerializeTest, EscapesStrings) {
    JSONValue v(std::string("q\"b\\n\nt\tc\x01"));
    EXPECT_EQ(v.ToJSON(), "\"q\\\"b\\\\n\\nt\\tc\\u0001\"");
}

TEST(JSONSerializeTest, Numbers) {
    EXPECT_EQ(JSONValue(int64_t{-12}).ToJSON(), "-12");
    EXPECT_EQ(JSONValue(uint32_t{262144}).ToJSON(), "262144");
    EXPECT_EQ(JSONValue(1.5).ToJSON(), "1.5");
    EXPECT_EQ(JSONValue(std::numeric_limits<double>::infinity()).ToJSON(), "null");
    EXPECT_EQ(JSONValue(std::nan("")).ToJSON(), "null");
}

TEST(JSONSerializeTest, ParseOfSerializedIsEqual) {
    JSONValue obj;
    obj["s"] = "text \xE2\x82\xAC";
    obj["n"] = 3;
    obj["nested"]["flag"] = false;

    EXPECT_EQ(JSONValue::Parse(obj.ToJSON()), obj);
    EXPECT_EQ(JSONValue::Parse(obj.ToJSON(true)), obj);
}

// ============================================================================
// Accessors
// ============================================================================

TEST(JSONValueTest, DefaultsOnTypeMismatch) {
    JSONValue s("text");
    EXPECT_EQ(s.GetInt(5), 5);
    EXPECT_TRUE(s.GetBool(true));
    EXPECT_DOUBLE_EQ(s.GetDouble(2.5), 2.5);
    EXPECT_TRUE(s.GetArray().empty());
    EXPECT_TRUE(s.GetObject().empty());
    EXPECT_EQ(s.Size(), 0u);
    EXPECT_FALSE(s.HasKey("x"));

    JSONValue n(7);
    EXPECT_EQ(n.GetString(), "");
    EXPECT_DOUBLE_EQ(n.GetDouble(), 7.0);
    EXPECT_EQ(JSONValue(9.75).GetInt(), 9);
}

TEST(JSONValueTest, MissingKeyIsNull) {
    const JSONValue obj = JSONValue::Parse(R"({"a":{"b":1}})");
    EXPECT_TRUE(obj.HasKey("a"));
    EXPECT_FALSE(obj.HasKey("z"));
    EXPECT_TRUE(obj["z"].IsNull());
    EXPECT_TRUE(obj["a"]["z"]["deeper"].IsNull());
    EXPECT_EQ(&obj["z"], &JSONValue::Null());
}

TEST(JSONValueTest, MutableAccessConvertsToContainer) {
    JSONValue v(5);
    v["k"] = "v";
    EXPECT_TRUE(v.IsObject());
    EXPECT_EQ(v.Size(), 1u);

    JSONValue arr;
    arr.Push(1);
    arr.Push("two");
    EXPECT_TRUE(arr.IsArray());
    EXPECT_EQ(arr.Size(), 2u);
}

TEST(JSONValueTest, Equality) {
    EXPECT_EQ(JSONValue(1), JSONValue(int64_t{1}));
    EXPECT_NE(JSONValue(1), JSONValue(1.0));
    EXPECT_NE(JSONValue("1"), JSONValue(1));
    EXPECT_EQ(JSONValue(), JSONValue(nullptr));
    EXPECT_EQ(JSONValue::Parse("[1,{\"a\":2}]"), JSONValue::Parse(" [ 1 , { \"a\" : 2 } ] "));
}

TEST(JSONValueTest, TypeNames) {
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::Null), "null");
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::Bool), "bool");
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::Int), "integer");
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::Double), "number");
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::String), "string");
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::Array), "array");
    EXPECT_STREQ(JSONTypeName(JSONValue::Type::Object), "object");
}
