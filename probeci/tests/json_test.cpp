//! # JSON Tests
//!
//! Report values, compact serialization and the builder.

#include "json/json_builder.hpp"
#include "json/json_value.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace probeci::json;

// ============================================================================
// JsonValue
// ============================================================================

TEST(JsonValueTest, TypeQueries) {
    EXPECT_TRUE(JsonValue().is_null());
    EXPECT_TRUE(JsonValue(true).is_bool());
    EXPECT_TRUE(JsonValue("x").is_string());
    EXPECT_TRUE(json_array().is_array());
    EXPECT_TRUE(json_object().is_object());
}

TEST(JsonValueTest, ObjectAccess) {
    auto obj = json_object();
    obj.set("build", JsonValue(false));
    obj.set("features", json_array());

    ASSERT_NE(obj.get("build"), nullptr);
    EXPECT_FALSE(obj.get("build")->as_bool());
    EXPECT_EQ(obj.get("missing"), nullptr);
    EXPECT_EQ(obj.size(), 2u);
    EXPECT_EQ(JsonValue("x").get("build"), nullptr);
}

TEST(JsonValueTest, SetReplacesExistingField) {
    auto obj = json_object();
    obj.set("test", JsonValue(false));
    obj.set("test", JsonValue(true));

    EXPECT_EQ(obj.size(), 1u);
    EXPECT_TRUE(obj.get("test")->as_bool());
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JsonSerializerTest, CompactScalars) {
    EXPECT_EQ(JsonValue().to_string(), "null");
    EXPECT_EQ(JsonValue(true).to_string(), "true");
    EXPECT_EQ(JsonValue("hi").to_string(), "\"hi\"");
}

TEST(JsonSerializerTest, EscapesStrings) {
    EXPECT_EQ(escape_string("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(escape_string("line\nnext\ttab\r"), "line\\nnext\\ttab\\r");
    EXPECT_EQ(escape_string(std::string("\x01", 1)), "\\u0001");
    // Non-ASCII UTF-8 is emitted as-is
    EXPECT_EQ(escape_string("\xEF\xBF\xBD"), "\xEF\xBF\xBD");
}

TEST(JsonSerializerTest, CompactObjectHasSortedKeys) {
    auto obj = json_object();
    obj.set("test", JsonValue(true));
    obj.set("build", JsonValue(false));
    EXPECT_EQ(obj.to_string(), "{\"build\":false,\"test\":true}");
}

TEST(JsonSerializerTest, EmptyContainers) {
    EXPECT_EQ(json_array().to_string(), "[]");
    EXPECT_EQ(json_object().to_string(), "{}");
}

TEST(JsonSerializerTest, NestedArrayInObject) {
    auto obj = json_object();
    auto arr = json_array();
    arr.push(JsonValue("fona"));
    arr.push(JsonValue("gps"));
    obj.set("features", std::move(arr));
    obj.set("build_stderr", JsonValue("warning: \"unused\"\n"));

    EXPECT_EQ(obj.to_string(), "{\"build_stderr\":\"warning: \\\"unused\\\"\\n\","
                               "\"features\":[\"fona\",\"gps\"]}");
}

// ============================================================================
// JsonBuilder
// ============================================================================

TEST(JsonBuilderTest, BuildsNestedDocument) {
    auto json = JsonBuilder()
                    .object()
                    .field("build", true)
                    .field("build_stdout", "done")
                    .field_array("features")
                    .item("fona")
                    .item("gps")
                    .end()
                    .end()
                    .build();

    EXPECT_EQ(json.to_string(), "{\"build\":true,\"build_stdout\":\"done\","
                                "\"features\":[\"fona\",\"gps\"]}");
}

TEST(JsonBuilderTest, MisuseThrows) {
    JsonBuilder builder;
    EXPECT_THROW(builder.field("x", true), std::logic_error);
    EXPECT_THROW(builder.end(), std::logic_error);

    EXPECT_THROW(builder.item("fona"), std::logic_error);
    EXPECT_THROW(builder.field_array("features"), std::logic_error);

    builder.object();
    EXPECT_THROW(builder.object(), std::logic_error);
    EXPECT_THROW(builder.item("fona"), std::logic_error);
    EXPECT_FALSE(builder.is_complete());
    EXPECT_THROW((void)builder.build(), std::logic_error);
}

TEST(JsonBuilderTest, EmptyArrayField) {
    auto json = JsonBuilder().object().field_array("features").end().end().build();
    EXPECT_EQ(json.to_string(), "{\"features\":[]}");
}
