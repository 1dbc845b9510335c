// SPECTRE - JSON Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/core/json.h"

#include <stdexcept>
#include <string>

namespace spectre {
namespace test {

TEST(JSONTest, ParseScalars) {
    EXPECT_TRUE(JSONValue::Parse("null").IsNull());
    EXPECT_TRUE(JSONValue::Parse("true").GetBool());
    EXPECT_EQ(JSONValue::Parse("-42").GetInt(), -42);
    EXPECT_DOUBLE_EQ(JSONValue::Parse("1.5").GetDouble(), 1.5);
    EXPECT_EQ(JSONValue::Parse("\"a\\nb\"").GetString(), "a\nb");
}

TEST(JSONTest, ParseNestedDocument) {
    JSONValue doc = JSONValue::Parse(
        R"({"operation":"deposit","inputs":[{"amount":"0","index":0}],"extData":{"fee":"0"}})");
    ASSERT_TRUE(doc.IsObject());
    EXPECT_EQ(doc["operation"].GetString(), "deposit");
    ASSERT_EQ(doc["inputs"].Size(), 1u);
    EXPECT_EQ(doc["inputs"][0]["index"].GetInt(), 0);
    EXPECT_EQ(doc["extData"]["fee"].GetString(), "0");
    EXPECT_TRUE(doc["missing"].IsNull());
}

TEST(JSONTest, WideIntegerKeepsLiteral) {
    const std::string big =
        "21888242871839275222246405745257275088548364400416034343698204186575808495616";
    JSONValue doc = JSONValue::Parse("{\"publicAmount\":" + big + "}");
    const JSONValue& value = doc["publicAmount"];
    EXPECT_TRUE(value.IsInt());
    EXPECT_EQ(value.GetNumberText(), big);
    ASSERT_TRUE(value.AsScalarText().has_value());
    EXPECT_EQ(*value.AsScalarText(), big);
    EXPECT_EQ(doc.ToJSON(), "{\"publicAmount\":" + big + "}");
}

TEST(JSONTest, AsScalarText) {
    EXPECT_EQ(*JSONValue("123").AsScalarText(), "123");
    EXPECT_EQ(*JSONValue(static_cast<int64_t>(7)).AsScalarText(), "7");
    EXPECT_FALSE(JSONValue(true).AsScalarText().has_value());
    EXPECT_FALSE(JSONValue(JSONValue::Array{}).AsScalarText().has_value());
}

TEST(JSONTest, FromNumberTextRejectsNonIntegers) {
    EXPECT_THROW(JSONValue::FromNumberText("1.5"), std::invalid_argument);
    EXPECT_THROW(JSONValue::FromNumberText("12a"), std::invalid_argument);
    EXPECT_EQ(JSONValue::FromNumberText("-3").GetInt(), -3);
}

TEST(JSONTest, TryParseRejectsMalformed) {
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\":}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,2").has_value());
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_THROW(JSONValue::Parse("nope"), std::runtime_error);
}

TEST(JSONTest, RejectsExcessiveNesting) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    EXPECT_FALSE(JSONValue::TryParse(deep).has_value());
}

TEST(JSONTest, SerializeObjectSortedKeys) {
    JSONValue::Object obj;
    obj["b"] = 1;
    obj["a"] = "x";
    obj["c"] = JSONValue::Array{JSONValue(1), JSONValue(2)};
    EXPECT_EQ(JSONValue(obj).ToJSON(), "{\"a\":\"x\",\"b\":1,\"c\":[1,2]}");
}

TEST(JSONTest, EscapesControlCharacters) {
    std::string out = JSONValue(std::string("say \"hi\"\n")).ToJSON();
    EXPECT_EQ(out, "\"say \\\"hi\\\"\\n\"");
}

} // namespace test
} // namespace spectre
