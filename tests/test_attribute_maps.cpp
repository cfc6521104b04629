/**
 * @file test_attribute_maps.cpp
 * @brief Tests for attribute map helpers and person records
 */

#include <gtest/gtest.h>
#include "persondir/AttributeMaps.hpp"
#include "persondir/Person.hpp"

using namespace persondir;

// ============================================================================
// copy_mutable
// ============================================================================

TEST(CopyMutable, EqualContentSameOrder) {
    AttributeMap source{
        {"uid", AttributeValues{"bob"}},
        {"mail", AttributeValues{"bob@x.org", "robert@x.org"}},
        {"phone", std::nullopt},
        {"groups", AttributeValues{}}
    };

    AttributeMap copy = copy_mutable(source);

    EXPECT_EQ(copy, source);
    ASSERT_EQ(copy.size(), 4u);
    auto it = copy.begin();
    EXPECT_EQ((it++)->first, "uid");
    EXPECT_EQ((it++)->first, "mail");
    EXPECT_EQ((it++)->first, "phone");
    EXPECT_EQ((it++)->first, "groups");
}

TEST(CopyMutable, AbsentListStaysAbsent) {
    AttributeMap source{{"phone", std::nullopt}};
    AttributeMap copy = copy_mutable(source);

    ASSERT_EQ(copy.count("phone"), 1u);
    EXPECT_FALSE(copy.at("phone").has_value());
}

TEST(CopyMutable, EditingCopyLeavesSourceAlone) {
    AttributeMap source{{"mail", AttributeValues{"a@x.org"}}};

    AttributeMap copy = copy_mutable(source);
    copy["mail"]->push_back("b@x.org");
    copy["mail"]->front() = "changed";
    copy["cn"] = AttributeValues{"Bob"};

    ASSERT_EQ(source.size(), 1u);
    ASSERT_TRUE(source.at("mail").has_value());
    ASSERT_EQ(source.at("mail")->size(), 1u);
    EXPECT_EQ(source.at("mail")->front(), "a@x.org");
}

TEST(CopyMutable, EmptyMap) {
    AttributeMap source;
    EXPECT_TRUE(copy_mutable(source).empty());
}

// ============================================================================
// new_attribute_map
// ============================================================================

TEST(NewAttributeMap, ReservesRequestedCapacity) {
    AttributeMap map = new_attribute_map(8);
    EXPECT_TRUE(map.empty());
    EXPECT_GE(map.capacity(), 8u);
}

TEST(NewAttributeMap, NonPositiveSizeGetsMinimalCapacity) {
    EXPECT_GE(new_attribute_map(0).capacity(), 1u);
    EXPECT_GE(new_attribute_map(-5).capacity(), 1u);
    EXPECT_TRUE(new_attribute_map(-5).empty());
}

TEST(NewAttributeMap, KeepsInsertionOrder) {
    AttributeMap map = new_attribute_map(0);
    map["z"] = AttributeValues{1};
    map["a"] = AttributeValues{2};
    map["m"] = std::nullopt;

    std::vector<std::string> keys;
    for (const auto& entry : map) keys.push_back(entry.first);
    EXPECT_EQ(keys, (std::vector<std::string>{"z", "a", "m"}));
}

// ============================================================================
// Rendering
// ============================================================================

TEST(AttributesToJson, ArraysAndNulls) {
    AttributeMap map{{"dept", AttributeValues{"eng"}}, {"phone", std::nullopt}};
    Value json = attributes_to_json(map);

    ASSERT_TRUE(json.is_object());
    EXPECT_EQ(json["dept"], Value::array({"eng"}));
    EXPECT_TRUE(json["phone"].is_null());
    EXPECT_EQ(json.begin().key(), "dept");
}

TEST(AttributesToString, Compact) {
    AttributeMap map{{"dept", AttributeValues{"eng"}}, {"phone", std::nullopt}};
    EXPECT_EQ(to_string(map), R"({dept=["eng"], phone=null})");
}

// ============================================================================
// PersonAttributes
// ============================================================================

TEST(PersonAttributes, Accessors) {
    auto bob = make_person("bob", AttributeMap{
        {"mail", AttributeValues{"a@x.org", "b@x.org"}},
        {"phone", std::nullopt},
        {"groups", AttributeValues{}}
    });

    EXPECT_EQ(bob->name(), std::optional<std::string>("bob"));
    ASSERT_NE(bob->attribute_values("mail"), nullptr);
    EXPECT_EQ(bob->attribute_values("mail")->size(), 2u);
    EXPECT_EQ(bob->attribute_value("mail"), std::optional<Value>("a@x.org"));

    EXPECT_EQ(bob->attribute_values("phone"), nullptr);
    EXPECT_EQ(bob->attribute_values("missing"), nullptr);
    EXPECT_FALSE(bob->attribute_value("groups").has_value());
}

TEST(PersonAttributes, UnnamedRecord) {
    auto anon = make_unnamed_person(AttributeMap{{"role", AttributeValues{"admin"}}});
    EXPECT_FALSE(anon->name().has_value());
    EXPECT_EQ(to_string(*anon), R"(<unnamed>{role=["admin"]})");
}

TEST(PersonAttributes, EqualityComparesNameAndAttributes) {
    PersonAttributes a("bob", AttributeMap{{"x", AttributeValues{1}}});
    PersonAttributes b("bob", AttributeMap{{"x", AttributeValues{1}}});
    PersonAttributes c("bob", AttributeMap{{"x", AttributeValues{2}}});
    PersonAttributes d(std::nullopt, AttributeMap{{"x", AttributeValues{1}}});

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
}

TEST(FindPerson, ByName) {
    auto bob = make_person("bob", AttributeMap{});
    PersonSet people{make_unnamed_person(AttributeMap{}), bob, nullptr};

    EXPECT_EQ(find_person(people, "bob"), bob);
    EXPECT_EQ(find_person(people, "carol"), nullptr);
}
