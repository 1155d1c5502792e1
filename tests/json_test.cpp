//! # JSON Value Tests
//!
//! Construction, type queries, equality, deep copy and serialization of
//! the JSON value type used by the schema export.

#include "json/json_value.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace schemly::json;

// ============================================================================
// Construction
// ============================================================================

TEST(JsonValueTest, NullConstruction) {
    JsonValue v;
    EXPECT_TRUE(v.is_null());
    EXPECT_FALSE(v.is_bool());
    EXPECT_FALSE(v.is_number());
    EXPECT_FALSE(v.is_string());
    EXPECT_FALSE(v.is_array());
    EXPECT_FALSE(v.is_object());
    EXPECT_EQ(v.size(), 0u);
}

TEST(JsonValueTest, BoolConstruction) {
    EXPECT_TRUE(JsonValue(true).as_bool());
    EXPECT_FALSE(JsonValue(false).as_bool());
}

TEST(JsonValueTest, IntegerConstruction) {
    JsonValue pos(int64_t(42));
    JsonValue neg(-100);
    JsonValue width(uint32_t(255));

    EXPECT_TRUE(pos.is_integer());
    EXPECT_EQ(pos.as_i64(), 42);
    EXPECT_EQ(neg.as_i64(), -100);
    EXPECT_EQ(width.as_i64(), 255);
}

TEST(JsonValueTest, FloatConstruction) {
    JsonValue v(3.14159);
    EXPECT_TRUE(v.is_number());
    EXPECT_FALSE(v.is_integer());
    EXPECT_DOUBLE_EQ(v.as_f64(), 3.14159);
    EXPECT_EQ(v.as_i64(), 3);
}

TEST(JsonValueTest, ArrayAndObjectConstruction) {
    JsonArray arr;
    arr.push_back(JsonValue(1));
    arr.push_back(JsonValue("two"));
    JsonValue list(std::move(arr));
    EXPECT_TRUE(list.is_array());
    EXPECT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1].as_string(), "two");

    JsonObject obj;
    obj["name"] = JsonValue("posts");
    obj["columns"] = JsonValue(3);
    JsonValue table(std::move(obj));
    EXPECT_TRUE(table.is_object());
    EXPECT_EQ(table.get("name")->as_string(), "posts");
    EXPECT_TRUE(table.contains("columns"));
    EXPECT_EQ(table.get("missing"), nullptr);
    EXPECT_EQ(list.get("name"), nullptr);
}

TEST(JsonValueTest, FactoryFunctions) {
    EXPECT_TRUE(json_null().is_null());
    EXPECT_TRUE(json_bool(true).as_bool());
    EXPECT_EQ(json_int(42).as_i64(), 42);
    EXPECT_DOUBLE_EQ(json_float(2.5).as_f64(), 2.5);
    EXPECT_EQ(json_string("test").as_string(), "test");
    EXPECT_TRUE(json_array().is_array());
    EXPECT_TRUE(json_object().is_object());

    auto names = json_string_array({"Post", "Tag"});
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0].as_string(), "Post");
}

TEST(JsonValueTest, Mutation) {
    auto obj = json_object();
    obj.set("a", json_int(1));
    obj.set("a", json_int(2));
    EXPECT_EQ(obj.size(), 1u);
    EXPECT_EQ(obj.get("a")->as_i64(), 2);

    auto arr = json_array();
    arr.push(json_bool(true));
    arr.push(json_null());
    EXPECT_EQ(arr.size(), 2u);
}

// ============================================================================
// Equality and Copy
// ============================================================================

TEST(JsonValueTest, Equality) {
    EXPECT_EQ(json_null(), json_null());
    EXPECT_EQ(json_int(1), json_float(1.0));
    EXPECT_NE(json_int(1), json_string("1"));
    EXPECT_NE(json_bool(false), json_null());
    EXPECT_EQ(json_string_array({"a", "b"}), json_string_array({"a", "b"}));
    EXPECT_NE(json_string_array({"a", "b"}), json_string_array({"b", "a"}));
}

TEST(JsonValueTest, CloneIsDeep) {
    auto original = json_object();
    original.set("tags", json_string_array({"x"}));
    auto copy = original.clone();
    EXPECT_EQ(copy, original);

    copy.as_object_mut()["tags"].push(json_string("y"));
    EXPECT_EQ(original.get("tags")->size(), 1u);
    EXPECT_EQ(copy.get("tags")->size(), 2u);
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, Scalars) {
    EXPECT_EQ(json_null().to_string(), "null");
    EXPECT_EQ(json_bool(true).to_string(), "true");
    EXPECT_EQ(json_int(-7).to_string(), "-7");
    EXPECT_EQ(json_float(2.0).to_string(), "2.0");
    EXPECT_NE(json_float(3.14).to_string().find("3.14"), std::string::npos);
    EXPECT_EQ(json_float(std::numeric_limits<double>::infinity()).to_string(), "null");
}

TEST(JsonSerializerTest, StringEscapes) {
    EXPECT_EQ(JsonValue("say \"hi\"").to_string(), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(JsonValue("line1\nline2").to_string(), "\"line1\\nline2\"");
    EXPECT_EQ(JsonValue("tab\there").to_string(), "\"tab\\there\"");
    EXPECT_EQ(JsonValue("App\\Models").to_string(), "\"App\\\\Models\"");
    EXPECT_EQ(JsonValue(std::string("\x01", 1)).to_string(), "\"\\u0001\"");
}

TEST(JsonSerializerTest, ObjectKeysAreSorted) {
    JsonObject obj;
    obj["zeta"] = JsonValue(1);
    obj["alpha"] = JsonValue(2);
    JsonValue v(std::move(obj));
    EXPECT_EQ(v.to_string(), R"({"alpha":2,"zeta":1})");
}

TEST(JsonSerializerTest, Nested) {
    auto root = json_object();
    root.set("list", json_string_array({"a"}));
    root.set("empty", json_array());
    root.set("obj", json_object());
    EXPECT_EQ(root.to_string(), R"({"empty":[],"list":["a"],"obj":{}})");
}

TEST(JsonSerializerTest, PrettyPrint) {
    auto root = json_object();
    root.set("name", json_string("posts"));
    root.set("keys", json_string_array({"post_id", "tag_id"}));

    std::string expected = "{\n"
                           "  \"keys\": [\n"
                           "    \"post_id\",\n"
                           "    \"tag_id\"\n"
                           "  ],\n"
                           "  \"name\": \"posts\"\n"
                           "}";
    EXPECT_EQ(root.to_string_pretty(2), expected);
    EXPECT_EQ(json_array().to_string_pretty(2), "[]");
    EXPECT_EQ(json_object().to_string_pretty(2), "{}");
}

TEST(JsonSerializerTest, WriteToStream) {
    JsonObject obj;
    obj["name"] = JsonValue("Alice");
    obj["age"] = JsonValue(int64_t(30));
    JsonValue v(std::move(obj));

    std::ostringstream oss;
    v.write_to(oss);
    EXPECT_EQ(oss.str(), R"({"age":30,"name":"Alice"})");
}
