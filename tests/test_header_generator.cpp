#include <gtest/gtest.h>
#include "codegen/header_generator.hpp"
#include "core/resolve_error.hpp"

using namespace querylens;
using namespace querylens::codegen;

namespace {

describe::ColumnDescription make_column(int ordinal, const char* name, SQLSMALLINT type,
                                        const char* type_name, describe::Nullability nullable) {
    describe::ColumnDescription column;
    column.ordinal = ordinal;
    column.name = name;
    column.type.data_type = type;
    column.type.type_name = type_name;
    column.nullable = nullable;
    return column;
}

resolver::ResolvedQuery find_user_query() {
    sources::QuerySource source;
    source.name = "find_user";
    source.sql = "SELECT USER_ID, EMAIL, COUNT(*) AS \"logins!\" FROM USERS WHERE USERNAME = ?";
    source.param_names = {"username"};
    source.file = "sql/users.sql";
    source.line = 4;
    
    describe::QueryDescription desc;
    describe::ParameterDescription param;
    param.ordinal = 1;
    param.type.data_type = SQL_VARCHAR;
    param.type.column_size = 50;
    param.nullable = false;
    desc.parameters.push_back(param);
    
    desc.columns.push_back(make_column(1, "USER_ID", SQL_INTEGER, "INTEGER", false));
    desc.columns.push_back(make_column(2, "EMAIL", SQL_VARCHAR, "VARCHAR", true));
    desc.columns.push_back(make_column(3, "logins!", SQL_BIGINT, "BIGINT", std::nullopt));
    desc.columns.push_back(make_column(4, "NOTE", SQL_VARCHAR, "VARCHAR", std::nullopt));
    
    return resolver::QueryResolver::build(source, cache::QueryData::make("MockDB", source.sql, desc));
}

} // anonymous namespace

TEST(HeaderGeneratorTest, MemberType) {
    EXPECT_EQ(member_type("std::int32_t", false), "std::int32_t");
    EXPECT_EQ(member_type("std::string", true), "std::optional<std::string>");
}

TEST(HeaderGeneratorTest, RawLiteral) {
    EXPECT_EQ(sql_literal("SELECT \"A\"\nFROM T"), "R\"querylens(SELECT \"A\"\nFROM T)querylens\"");
}

TEST(HeaderGeneratorTest, EscapedLiteralWhenDelimiterAppears) {
    EXPECT_EQ(sql_literal("SELECT ')querylens\"'"), "\"SELECT ')querylens\\\"'\"");
    EXPECT_EQ(sql_literal("A\t)querylens\"\n"), "\"A\\t)querylens\\\"\\n\"");
}

TEST(HeaderGeneratorTest, RendersStructs) {
    std::string header = render_header({find_user_query()});
    
    EXPECT_EQ(header.rfind("// Generated by querylens", 0), 0u);
    EXPECT_NE(header.find("#pragma once"), std::string::npos);
    EXPECT_NE(header.find("#include <sqlext.h>"), std::string::npos);
    EXPECT_NE(header.find("namespace queries {"), std::string::npos);
    EXPECT_NE(header.find("} // namespace queries"), std::string::npos);
    
    EXPECT_NE(header.find("// find_user (sql/users.sql:4)"), std::string::npos);
    EXPECT_NE(header.find("struct FindUserParams {"), std::string::npos);
    EXPECT_NE(header.find("    std::string username;  // VARCHAR"), std::string::npos);
    
    EXPECT_NE(header.find("struct FindUserRow {"), std::string::npos);
    EXPECT_NE(header.find("    std::int32_t USER_ID;  // INTEGER NOT NULL"), std::string::npos);
    EXPECT_NE(header.find("    std::optional<std::string> EMAIL;  // VARCHAR NULL"), std::string::npos);
    EXPECT_NE(header.find("    std::int64_t logins;  // BIGINT NOT NULL (forced)"), std::string::npos);
    EXPECT_NE(header.find("    std::optional<std::string> NOTE;  // VARCHAR NULL?"), std::string::npos);
    
    EXPECT_NE(header.find("inline constexpr const char* find_user_sql = R\"querylens("), std::string::npos);
}

TEST(HeaderGeneratorTest, NestedNamespace) {
    HeaderOptions options;
    options.namespace_name = "app::db";
    std::string header = render_header({find_user_query()}, options);
    
    auto open_app = header.find("namespace app {");
    auto open_db = header.find("namespace db {");
    auto close_db = header.find("} // namespace db");
    auto close_app = header.find("} // namespace app");
    ASSERT_NE(open_app, std::string::npos);
    ASSERT_NE(close_app, std::string::npos);
    EXPECT_LT(open_app, open_db);
    EXPECT_LT(open_db, close_db);
    EXPECT_LT(close_db, close_app);
}

TEST(HeaderGeneratorTest, EmptyQueryList) {
    std::string header = render_header({});
    EXPECT_NE(header.find("namespace queries {"), std::string::npos);
    EXPECT_EQ(header.find("struct "), std::string::npos);
}

TEST(HeaderGeneratorTest, InvalidNamespace) {
    HeaderOptions options;
    for (const char* ns : {"", "app::", "1db", "class", "app::my-db"}) {
        options.namespace_name = ns;
        EXPECT_THROW(render_header({}, options), core::ResolveError) << ns;
    }
}

TEST(HeaderGeneratorTest, TypeNameCollision) {
    auto first = find_user_query();
    auto second = find_user_query();
    second.source.name = "findUser";
    second.source.line = 9;
    
    try {
        render_header({first, second});
        FAIL() << "Expected ResolveError";
    } catch (const core::ResolveError& e) {
        EXPECT_EQ(e.kind(), core::ResolveErrorKind::SourceSyntax);
        std::string message = e.what();
        EXPECT_NE(message.find("sql/users.sql:9"), std::string::npos);
        EXPECT_NE(message.find("sql/users.sql:4"), std::string::npos);
        EXPECT_NE(message.find("FindUserParams"), std::string::npos);
    }
}
