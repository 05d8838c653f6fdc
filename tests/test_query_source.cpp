#include <gtest/gtest.h>
#include "sources/query_source.hpp"
#include "core/resolve_error.hpp"
#include <filesystem>
#include <fstream>

using namespace querylens::sources;
using querylens::core::ResolveError;
using querylens::core::ResolveErrorKind;

namespace fs = std::filesystem;

TEST(QuerySourceTest, WholeFileIsOneQuery) {
    auto queries = parse_query_sources("SELECT USER_ID\nFROM USERS;\n", "sql/list_users.sql", "list_users");
    
    ASSERT_EQ(queries.size(), 1u);
    EXPECT_EQ(queries[0].name, "list_users");
    EXPECT_EQ(queries[0].sql, "SELECT USER_ID\nFROM USERS");
    EXPECT_EQ(queries[0].line, 1);
    EXPECT_EQ(queries[0].location(), "sql/list_users.sql:1");
    EXPECT_TRUE(queries[0].param_names.empty());
}

TEST(QuerySourceTest, NamedQueries) {
    const char* text =
        "-- Queries for the users page\n"
        "\n"
        "-- name: find_user\n"
        "-- param: user_id\n"
        "SELECT USERNAME FROM USERS WHERE USER_ID = ?;\n"
        "\n"
        "-- name: rename_user\n"
        "-- param: username\n"
        "-- param: user_id\n"
        "UPDATE USERS\n"
        "-- keeps comments inside the body\n"
        "SET USERNAME = ? WHERE USER_ID = ?\n";
    
    auto queries = parse_query_sources(text, "users.sql", "users");
    ASSERT_EQ(queries.size(), 2u);
    
    EXPECT_EQ(queries[0].name, "find_user");
    EXPECT_EQ(queries[0].line, 3);
    EXPECT_EQ(queries[0].sql, "SELECT USERNAME FROM USERS WHERE USER_ID = ?");
    EXPECT_EQ(queries[0].param_names, std::vector<std::string>{"user_id"});
    
    EXPECT_EQ(queries[1].name, "rename_user");
    EXPECT_EQ(queries[1].line, 7);
    EXPECT_EQ(queries[1].param_names, (std::vector<std::string>{"username", "user_id"}));
    EXPECT_EQ(queries[1].sql,
              "UPDATE USERS\n-- keeps comments inside the body\nSET USERNAME = ? WHERE USER_ID = ?");
}

TEST(QuerySourceTest, CarriageReturnsStripped) {
    auto queries = parse_query_sources("-- name: q\r\nSELECT 1\r\n", "q.sql", "q");
    ASSERT_EQ(queries.size(), 1u);
    EXPECT_EQ(queries[0].sql, "SELECT 1");
}

TEST(QuerySourceTest, InvalidQueryName) {
    try {
        parse_query_sources("-- name: find-user\nSELECT 1\n", "users.sql", "users");
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::SourceSyntax);
        EXPECT_NE(std::string(e.what()).find("users.sql:1"), std::string::npos);
    }
}

TEST(QuerySourceTest, InvalidParameterName) {
    EXPECT_THROW(parse_query_sources("-- name: q\n-- param: 1st\nSELECT ?\n", "q.sql", "q"), ResolveError);
}

TEST(QuerySourceTest, EmptyQuery) {
    EXPECT_THROW(parse_query_sources("-- name: a\n-- name: b\nSELECT 1\n", "q.sql", "q"), ResolveError);
    EXPECT_THROW(parse_query_sources("  \n", "blank.sql", "blank"), ResolveError);
    EXPECT_THROW(parse_query_sources("-- name: a\n;\n", "q.sql", "q"), ResolveError);
}

TEST(QuerySourceTest, CommentOnlyBodyIsEmpty) {
    try {
        parse_query_sources("-- name: a\n-- SELECT 1\n\n-- name: b\nSELECT 2\n", "q.sql", "q");
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::SourceSyntax);
        EXPECT_NE(std::string(e.what()).find("q.sql:1: query 'a' has no text"), std::string::npos);
    }
    
    EXPECT_THROW(parse_query_sources("-- nothing here yet\n", "todo.sql", "todo"), ResolveError);
}

TEST(QuerySourceTest, DuplicateParameterName) {
    try {
        parse_query_sources("-- name: find_user\n-- param: id\n-- param: id\n"
                            "SELECT USER_ID FROM USERS WHERE USER_ID = ? OR USER_ID = ?\n",
                            "users.sql", "users");
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::SourceSyntax);
        EXPECT_NE(std::string(e.what()).find("users.sql:3: duplicate parameter name 'id'"),
                  std::string::npos);
    }
    
    // "class" becomes the field "class_"
    EXPECT_THROW(parse_query_sources("-- name: q\n-- param: class\n-- param: class_\nSELECT ?, ?\n",
                                     "q.sql", "q"), ResolveError);
    
    // The same name in different queries is fine
    auto queries = parse_query_sources("-- name: a\n-- param: id\nSELECT ?\n"
                                       "-- name: b\n-- param: id\nSELECT ?\n", "q.sql", "q");
    EXPECT_EQ(queries.size(), 2u);
}

TEST(QuerySourceTest, TextBeforeFirstName) {
    EXPECT_THROW(parse_query_sources("SELECT 0;\n-- name: a\nSELECT 1\n", "q.sql", "q"), ResolveError);
}

TEST(QuerySourceTest, FileNameMustBeIdentifier) {
    EXPECT_THROW(parse_query_sources("SELECT 1\n", "list-users.sql", "list-users"), ResolveError);
}

class QuerySourceFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / "querylens_sources";
        fs::remove_all(root);
        fs::create_directories(root / "nested");
    }
    
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    
    void write(const fs::path& relative, const std::string& contents) {
        std::ofstream out(root / relative);
        out << contents;
    }
    
    fs::path root;
};

TEST_F(QuerySourceFilesTest, DirectoryScanIsSorted) {
    write("b_orders.sql", "SELECT ORDER_ID FROM ORDERS\n");
    write("a_users.sql", "-- name: list_users\nSELECT USER_ID FROM USERS\n");
    write("nested/c_items.sql", "SELECT ORDER_ITEM_ID FROM ORDER_ITEMS\n");
    write("notes.txt", "not a query\n");
    
    auto queries = load_query_sources({root});
    ASSERT_EQ(queries.size(), 3u);
    EXPECT_EQ(queries[0].name, "list_users");
    EXPECT_EQ(queries[1].name, "b_orders");
    EXPECT_EQ(queries[2].name, "c_items");
}

TEST_F(QuerySourceFilesTest, DuplicateNamesAcrossFiles) {
    write("one.sql", "-- name: same\nSELECT 1\n");
    write("two.sql", "-- name: same\nSELECT 2\n");
    
    try {
        load_query_sources({root / "one.sql", root / "two.sql"});
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::SourceSyntax);
        EXPECT_NE(std::string(e.what()).find("duplicate query name 'same'"), std::string::npos);
    }
}

TEST_F(QuerySourceFilesTest, NamesGeneratingTheSameTypes) {
    write("one.sql", "-- name: get_user\nSELECT USER_ID FROM USERS\n");
    write("two.sql", "\n-- name: getUser\nSELECT USERNAME FROM USERS\n");
    
    try {
        load_query_sources({root / "one.sql", root / "two.sql"});
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::SourceSyntax);
        std::string message = e.what();
        EXPECT_NE(message.find("two.sql:2:"), std::string::npos);
        EXPECT_NE(message.find("one.sql:1"), std::string::npos);
        EXPECT_NE(message.find("GetUserParams"), std::string::npos);
    }
}

TEST_F(QuerySourceFilesTest, NamesGeneratingTheSameTypesInOneFile) {
    write("users.sql", "-- name: get_user\nSELECT 1\n-- name: get__user\nSELECT 2\n");
    
    try {
        load_query_sources({root / "users.sql"});
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_NE(std::string(e.what()).find("'get__user' and 'get_user'"), std::string::npos);
    }
}

TEST_F(QuerySourceFilesTest, MissingPath) {
    try {
        load_query_sources({root / "absent.sql"});
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::Configuration);
    }
}
