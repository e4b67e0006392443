/**
 * @file test_dotpath.cpp
 * @brief Unit tests for dot-path access (GoogleTest)
 *
 * Tests cover rules D1-D5.
 */

#include <gtest/gtest.h>
#include "recon/DotPath.hpp"
#include "recon/Errors.hpp"
#include "recon/Typed.hpp"

using namespace recon;

class DotPathTest : public ::testing::Test {
protected:
    Value data = {
        {"render", {{"max_depth", 9}, {"strong", false}}},
        {"compare", {{"exclude", {"Password", "Token"}}}},
        {"When", typed::datetime("2024-05-01T10:00:00")},
        {"name", "svc"},
    };
};

// ============================================================================
// Splitting and joining
// ============================================================================

TEST(SplitDotPath, DropsEmptySegments) {
    EXPECT_EQ(split_dot_path("a..b."), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_EQ(join_dot_path({"compare", "exclude", "0"}), "compare.exclude.0");
    EXPECT_EQ(join_dot_path({}), "");
}

// ============================================================================
// get_by_dot (RULE D1, D2)
// ============================================================================

TEST_F(DotPathTest, ResolvesNestedMembers) {
    EXPECT_EQ(*get_by_dot(data, "render.max_depth"), 9);
    EXPECT_EQ(*get_by_dot(data, "compare.exclude.1"), "Token");
    EXPECT_EQ(get_by_dot(data, ""), &data);
}

TEST_F(DotPathTest, TypedLeafIsAValue) {
    EXPECT_EQ(*get_by_dot(data, "When"), typed::datetime("2024-05-01T10:00:00"));
    EXPECT_THROW(get_by_dot(data, "When.value"), TypeError);
}

TEST_F(DotPathTest, MissingPathThrowsKeyError) {
    EXPECT_THROW(get_by_dot(data, "render.indent"), KeyError);
    EXPECT_THROW(get_by_dot(data, "compare.exclude.5"), KeyError);
    EXPECT_THROW(get_by_dot(data, "compare.exclude.01"), KeyError);
    try {
        get_by_dot(data, "render.indent");
        FAIL() << "expected KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.path(), "render.indent");
        EXPECT_EQ(e.segment(), "indent");
    }
}

TEST_F(DotPathTest, ScalarTraversalThrowsTypeError) {
    try {
        get_by_dot(data, "name.first");
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.path(), "name.first");
        EXPECT_EQ(e.actual(), "string");
    }
}

TEST_F(DotPathTest, FallbackForMissingPath) {
    const Value fallback = 4;
    EXPECT_EQ(*get_by_dot(data, "render.indent", fallback), 4);
    EXPECT_EQ(get_by_dot(data, "x.y.z", fallback), &fallback);
    EXPECT_EQ(*get_by_dot(data, "render.max_depth", fallback), 9);
    EXPECT_THROW(get_by_dot(data, "name.first", fallback), TypeError);
}

// ============================================================================
// set_by_dot (RULE D3, D4)
// ============================================================================

TEST_F(DotPathTest, SetExistingAndNewKeys) {
    set_by_dot(data, "render.max_depth", 3, false);
    EXPECT_EQ(data["render"]["max_depth"], 3);
    set_by_dot(data, "render.expand", -1, false);
    EXPECT_EQ(data["render"]["expand"], -1);
    EXPECT_EQ(data["render"]["strong"], false);
}

TEST_F(DotPathTest, SetWithoutCreateRejectsMissingParents) {
    EXPECT_THROW(set_by_dot(data, "log.level", "debug", false), KeyError);
    EXPECT_THROW(set_by_dot(data, "name.first", "x", false), TypeError);
}

TEST_F(DotPathTest, SetWithCreateBuildsParents) {
    set_by_dot(data, "log.level", "debug");
    EXPECT_EQ(data["log"]["level"], "debug");

    set_by_dot(data, "When.value", "now");
    EXPECT_EQ(data["When"], (Value{{"value", "now"}}));
}

TEST_F(DotPathTest, EmptyPathReplacesRoot) {
    set_by_dot(data, "", Value::array());
    EXPECT_EQ(data, Value::array());
}

// ============================================================================
// contains_dot (RULE D5)
// ============================================================================

TEST_F(DotPathTest, Contains) {
    EXPECT_TRUE(contains_dot(data, ""));
    EXPECT_TRUE(contains_dot(data, "render.strong"));
    EXPECT_TRUE(contains_dot(data, "compare.exclude.0"));
    EXPECT_FALSE(contains_dot(data, "render.indent"));
    EXPECT_FALSE(contains_dot(data, "name.first"));
    EXPECT_FALSE(contains_dot(data, "When.value"));
}
