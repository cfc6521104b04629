/**
 * @file test_util.cpp
 * @brief Tests for utility functions
 */

#include <gtest/gtest.h>
#include "persondir/Util.hpp"

using namespace persondir;

TEST(DeepMerge, NestedObjectsMergeKeyByKey) {
    Value a = {{"merger", {{"strategy", "multivalued"}, {"distinct", false}}}};
    Value b = {{"merger", {{"distinct", true}}}, {"lookup", {{"username", "uid"}}}};

    deep_merge(a, b);

    EXPECT_EQ(a["merger"]["strategy"], "multivalued");
    EXPECT_EQ(a["merger"]["distinct"], true);
    EXPECT_EQ(a["lookup"]["username"], "uid");
}

TEST(DeepMerge, NonObjectReplaces) {
    Value a = {{"sources", {{"files", Value::array({"a.json"})}}}};
    Value b = {{"sources", {{"files", Value::array({"b.json", "c.json"})}}}};

    deep_merge(a, b);

    EXPECT_EQ(a["sources"]["files"], Value::array({"b.json", "c.json"}));
}

TEST(DotPath, SetCreatesIntermediateObjects) {
    Value data = Value::object();
    set_by_dot(data, "merger.strategy", "replacing");

    ASSERT_TRUE(data["merger"].is_object());
    EXPECT_EQ(data["merger"]["strategy"], "replacing");
}

TEST(DotPath, SetReplacesScalarOnTheWay) {
    Value data = {{"merger", 5}};
    set_by_dot(data, "merger.recover", true);

    EXPECT_EQ(data["merger"]["recover"], true);
}

TEST(DotPath, FindAndExists) {
    Value data = {{"lookup", {{"username", "uid"}}}};

    ASSERT_NE(find_by_dot(data, "lookup.username"), nullptr);
    EXPECT_EQ(*find_by_dot(data, "lookup.username"), "uid");
    EXPECT_EQ(find_by_dot(data, "lookup.missing"), nullptr);
    EXPECT_EQ(find_by_dot(data, "lookup.username.deeper"), nullptr);

    EXPECT_TRUE(exists_by_dot(data, "lookup"));
    EXPECT_FALSE(exists_by_dot(data, "merger.strategy"));
}

TEST(ParseOverrides, JsonAndPlainValues) {
    auto result = parse_overrides("merger.strategy:replacing, merger.distinct:true, sources.files:[\"a.json\",\"b.json\"]");

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result["merger.strategy"], "replacing");
    EXPECT_EQ(result["merger.distinct"], true);
    EXPECT_EQ(result["sources.files"], Value::array({"a.json", "b.json"}));
}

TEST(ParseOverrides, CommasInsideQuotesAndObjects) {
    auto result = parse_overrides("a:\"x,y\", b:{\"k\":1,\"j\":2}");

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result["a"], "x,y");
    EXPECT_EQ(result["b"]["j"], 2);
}

TEST(ParseOverrides, SkipsMalformedPairs) {
    EXPECT_TRUE(parse_overrides("").empty());

    auto result = parse_overrides("novalue, :orphan, k:1");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result["k"], 1);
}

TEST(ParseJsonOrString, Fallback) {
    EXPECT_EQ(parse_json_or_string("42"), 42);
    EXPECT_EQ(parse_json_or_string("false"), false);
    EXPECT_TRUE(parse_json_or_string("null").is_null());
    EXPECT_EQ(parse_json_or_string("multivalued"), "multivalued");
    EXPECT_EQ(parse_json_or_string("{broken"), "{broken");
}

TEST(Strings, SplitAndLower) {
    EXPECT_EQ(split("a..b.c", '.'), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(split("", '.').empty());
    EXPECT_EQ(to_lower("MultiValued"), "multivalued");
}
