#include <gtest/gtest.h>
#include "utils/identifiers.hpp"

using namespace querylens::utils;

TEST(IdentifiersTest, IsIdentifier) {
    EXPECT_TRUE(is_identifier("user_id"));
    EXPECT_TRUE(is_identifier("_private"));
    EXPECT_TRUE(is_identifier("Row2"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("2fast"));
    EXPECT_FALSE(is_identifier("user-id"));
    EXPECT_FALSE(is_identifier("?column?"));
}

TEST(IdentifiersTest, CppKeywords) {
    EXPECT_TRUE(is_cpp_keyword("class"));
    EXPECT_TRUE(is_cpp_keyword("default"));
    EXPECT_TRUE(is_cpp_keyword("override"));
    EXPECT_FALSE(is_cpp_keyword("Class"));
    EXPECT_FALSE(is_cpp_keyword("count"));
}

TEST(IdentifiersTest, SanitizeIdentifier) {
    EXPECT_EQ(sanitize_identifier("user_id"), "user_id");
    EXPECT_EQ(sanitize_identifier("?column?"), "_column_");
    EXPECT_EQ(sanitize_identifier("order total"), "order_total");
    EXPECT_EQ(sanitize_identifier("2nd"), "_2nd");
    EXPECT_EQ(sanitize_identifier("class"), "class_");
    EXPECT_EQ(sanitize_identifier(""), "");
}

TEST(IdentifiersTest, PascalCase) {
    EXPECT_EQ(to_pascal_case("list_users"), "ListUsers");
    EXPECT_EQ(to_pascal_case("get-order-by-id"), "GetOrderById");
    EXPECT_EQ(to_pascal_case("already"), "Already");
    EXPECT_EQ(to_pascal_case("top_10"), "Top10");
    EXPECT_EQ(to_pascal_case("1st_query"), "_1stQuery");
}

TEST(IdentifiersTest, TrimAndLower) {
    EXPECT_EQ(trim("  value \t\r\n"), "value");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("inner space"), "inner space");
    EXPECT_EQ(to_lower("PostgreSQL"), "postgresql");
}
