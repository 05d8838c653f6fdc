// Tests for the prepare-time query analyzer
#include <gtest/gtest.h>
#include "mock/query_parser.hpp"
#include "mock/mock_catalog.hpp"

using namespace mock_odbc;

class QueryParserTest : public ::testing::Test {
protected:
    const MockCatalog& catalog = MockCatalog::preset("Default");

    PreparedQuery analyze(const std::string& sql) {
        return analyze_query(sql, catalog);
    }

    std::string error_state(const std::string& sql) {
        try {
            analyze_query(sql, catalog);
        } catch (const QueryError& e) {
            return e.sqlstate();
        }
        return "";
    }
};

// ===== Tokenizer =====

TEST(TokenizerTest, SplitsKindsAndDropsComments) {
    auto tokens = tokenize_sql("SELECT a, 'it''s' -- trailing\n FROM \"My Table\" /* x */ WHERE b >= ? AND c = 1.5");

    ASSERT_EQ(tokens.size(), 14u);
    EXPECT_EQ(tokens[0].kind, Token::Kind::Identifier);
    EXPECT_TRUE(tokens[0].is_keyword("SELECT"));
    EXPECT_TRUE(tokens[2].is_symbol(","));
    EXPECT_EQ(tokens[3].kind, Token::Kind::String);
    EXPECT_EQ(tokens[3].text, "it's");
    EXPECT_EQ(tokens[5].kind, Token::Kind::QuotedIdentifier);
    EXPECT_EQ(tokens[5].text, "My Table");
    EXPECT_TRUE(tokens[8].is_symbol(">="));
    EXPECT_EQ(tokens[9].kind, Token::Kind::Parameter);
    EXPECT_EQ(tokens[13].kind, Token::Kind::Number);
    EXPECT_EQ(tokens[13].text, "1.5");
}

TEST(TokenizerTest, KeywordMatchIsCaseInsensitive) {
    auto tokens = tokenize_sql("select");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_keyword("SELECT"));

    // Quoted identifiers are never keywords
    tokens = tokenize_sql("\"select\"");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_FALSE(tokens[0].is_keyword("SELECT"));
}

TEST(TokenizerTest, UnterminatedInputRaisesSyntaxError) {
    EXPECT_THROW(tokenize_sql("SELECT 'abc"), QueryError);
    EXPECT_THROW(tokenize_sql("SELECT 1 /* open"), QueryError);
}

// ===== SELECT =====

TEST_F(QueryParserTest, SelectColumnsFromCatalog) {
    auto query = analyze("SELECT user_id, email FROM users");

    EXPECT_EQ(query.kind, StatementKind::Select);
    ASSERT_EQ(query.columns.size(), 2u);
    EXPECT_EQ(query.columns[0].label, "USER_ID");
    EXPECT_EQ(query.columns[0].data_type, SQL_INTEGER);
    EXPECT_EQ(query.columns[0].nullable, SQL_NO_NULLS);
    EXPECT_EQ(query.columns[0].base_table, "USERS");
    EXPECT_EQ(query.columns[0].base_column, "USER_ID");
    EXPECT_EQ(query.columns[1].label, "EMAIL");
    EXPECT_EQ(query.columns[1].nullable, SQL_NULLABLE);
}

TEST_F(QueryParserTest, SelectStarExpandsAllColumns) {
    auto query = analyze("SELECT * FROM orders");
    ASSERT_EQ(query.columns.size(), 5u);
    EXPECT_EQ(query.columns[0].label, "ORDER_ID");
    EXPECT_EQ(query.columns[4].label, "STATUS");
}

TEST_F(QueryParserTest, QualifiedStarAndAliases) {
    auto query = analyze("SELECT o.*, u.username AS who FROM orders o JOIN users AS u ON u.user_id = o.user_id");
    ASSERT_EQ(query.columns.size(), 6u);
    EXPECT_EQ(query.columns[5].label, "who");
    EXPECT_EQ(query.columns[5].base_table, "USERS");
    EXPECT_EQ(query.columns[5].base_column, "USERNAME");
}

TEST_F(QueryParserTest, BareAliasRenamesColumn) {
    auto query = analyze("SELECT email contact FROM users");
    ASSERT_EQ(query.columns.size(), 1u);
    EXPECT_EQ(query.columns[0].label, "contact");
    EXPECT_EQ(query.columns[0].base_column, "EMAIL");
}

TEST_F(QueryParserTest, LeftJoinMakesOuterSideNullable) {
    auto query = analyze("SELECT u.username, o.order_id FROM users u LEFT JOIN orders o ON o.user_id = u.user_id");
    ASSERT_EQ(query.columns.size(), 2u);
    EXPECT_EQ(query.columns[0].nullable, SQL_NO_NULLS);
    EXPECT_EQ(query.columns[1].nullable, SQL_NULLABLE);
}

TEST_F(QueryParserTest, RightJoinMakesLeftSideNullable) {
    auto query = analyze("SELECT u.username, o.order_id FROM users u RIGHT OUTER JOIN orders o ON o.user_id = u.user_id");
    ASSERT_EQ(query.columns.size(), 2u);
    EXPECT_EQ(query.columns[0].nullable, SQL_NULLABLE);
    EXPECT_EQ(query.columns[1].nullable, SQL_NO_NULLS);
}

TEST_F(QueryParserTest, UnsignedAndDbmsTypeName) {
    auto query = analyze("SELECT login_count, external_id FROM users");
    ASSERT_EQ(query.columns.size(), 2u);
    EXPECT_TRUE(query.columns[0].is_unsigned);
    EXPECT_EQ(query.columns[0].type_name, "INTEGER UNSIGNED");
    EXPECT_EQ(query.columns[1].data_type, SQL_GUID);
    EXPECT_EQ(query.columns[1].type_name, "UUID");
}

TEST_F(QueryParserTest, Aggregates) {
    auto query = analyze("SELECT COUNT(*), SUM(quantity), MAX(unit_price) AS top, AVG(quantity) FROM order_items");
    ASSERT_EQ(query.columns.size(), 4u);

    EXPECT_EQ(query.columns[0].data_type, SQL_BIGINT);
    EXPECT_EQ(query.columns[0].nullable, SQL_NO_NULLS);
    EXPECT_EQ(query.columns[0].label, "EXPR_1");

    EXPECT_EQ(query.columns[1].data_type, SQL_BIGINT);
    EXPECT_EQ(query.columns[1].nullable, SQL_NULLABLE);
    EXPECT_TRUE(query.columns[1].base_table.empty());

    EXPECT_EQ(query.columns[2].label, "top");
    EXPECT_EQ(query.columns[2].data_type, SQL_DECIMAL);
    EXPECT_EQ(query.columns[2].decimal_digits, 2);

    EXPECT_EQ(query.columns[3].data_type, SQL_DOUBLE);
}

TEST_F(QueryParserTest, LiteralsWithoutFrom) {
    auto query = analyze("SELECT 1, 'abc', 2.50, NULL, TRUE");
    ASSERT_EQ(query.columns.size(), 5u);
    EXPECT_EQ(query.columns[0].data_type, SQL_INTEGER);
    EXPECT_EQ(query.columns[0].nullable, SQL_NO_NULLS);
    EXPECT_EQ(query.columns[1].data_type, SQL_VARCHAR);
    EXPECT_EQ(query.columns[1].column_size, 3u);
    EXPECT_EQ(query.columns[2].data_type, SQL_DECIMAL);
    EXPECT_EQ(query.columns[2].decimal_digits, 2);
    EXPECT_EQ(query.columns[3].nullable, SQL_NULLABLE);
    EXPECT_EQ(query.columns[4].data_type, SQL_BIT);
}

TEST_F(QueryParserTest, ComputedExpressionIsUnknownNullability) {
    auto query = analyze("SELECT price * 2 FROM products");
    ASSERT_EQ(query.columns.size(), 1u);
    EXPECT_EQ(query.columns[0].label, "EXPR_1");
    EXPECT_EQ(query.columns[0].nullable, SQL_NULLABLE_UNKNOWN);
    EXPECT_TRUE(query.columns[0].base_table.empty());
}

// ===== Errors =====

TEST_F(QueryParserTest, ErrorStates) {
    EXPECT_EQ(error_state(""), "42000");
    EXPECT_EQ(error_state("EXPLAIN SELECT 1"), "42000");
    EXPECT_EQ(error_state("SELECT * FROM missing_table"), "42S02");
    EXPECT_EQ(error_state("SELECT missing_column FROM users"), "42S22");
    EXPECT_EQ(error_state("SELECT x.user_id FROM users u"), "42S22");
    EXPECT_EQ(error_state("SELECT user_id FROM users JOIN orders ON 1 = 1"), "42000");
    EXPECT_EQ(error_state("SELECT *"), "42000");
    EXPECT_EQ(error_state("SELECT * FROM (SELECT 1) t"), "42000");
    EXPECT_EQ(error_state("INSERT INTO users (user_id, username) VALUES (?)"), "21S01");
}

// ===== Parameters =====

TEST_F(QueryParserTest, ComparisonParametersTakeColumnType) {
    auto query = analyze("SELECT username FROM users WHERE user_id = ? AND ? < balance");
    ASSERT_EQ(query.parameters.size(), 2u);
    EXPECT_EQ(query.parameters[0].data_type, SQL_INTEGER);
    EXPECT_EQ(query.parameters[0].nullable, SQL_NO_NULLS);
    EXPECT_EQ(query.parameters[1].data_type, SQL_DECIMAL);
    EXPECT_EQ(query.parameters[1].decimal_digits, 2);
}

TEST_F(QueryParserTest, LikeBetweenAndInParameters) {
    auto query = analyze(
        "SELECT order_id FROM orders o "
        "WHERE o.status NOT LIKE ? AND order_date BETWEEN ? AND ? AND user_id IN (?, ?)");
    ASSERT_EQ(query.parameters.size(), 5u);
    EXPECT_EQ(query.parameters[0].data_type, SQL_VARCHAR);
    EXPECT_EQ(query.parameters[0].column_size, 20u);
    EXPECT_EQ(query.parameters[1].data_type, SQL_TYPE_TIMESTAMP);
    EXPECT_EQ(query.parameters[2].data_type, SQL_TYPE_TIMESTAMP);
    EXPECT_EQ(query.parameters[3].data_type, SQL_INTEGER);
    EXPECT_EQ(query.parameters[4].data_type, SQL_INTEGER);
}

TEST_F(QueryParserTest, UntypedParameterKeepsDefault) {
    auto query = analyze("SELECT ? AS anything");
    ASSERT_EQ(query.parameters.size(), 1u);
    EXPECT_EQ(query.parameters[0].data_type, SQL_VARCHAR);
    EXPECT_EQ(query.parameters[0].column_size, 255u);
    EXPECT_EQ(query.parameters[0].nullable, SQL_NULLABLE_UNKNOWN);
}

TEST_F(QueryParserTest, InsertValuesTypedByTargetColumn) {
    auto query = analyze("INSERT INTO products (name, price, stock_quantity) VALUES (?, ?, 0)");
    EXPECT_EQ(query.kind, StatementKind::Insert);
    EXPECT_TRUE(query.columns.empty());
    ASSERT_EQ(query.parameters.size(), 2u);
    EXPECT_EQ(query.parameters[0].data_type, SQL_VARCHAR);
    EXPECT_EQ(query.parameters[0].column_size, 100u);
    EXPECT_EQ(query.parameters[0].nullable, SQL_NO_NULLS);
    EXPECT_EQ(query.parameters[1].data_type, SQL_DECIMAL);
}

TEST_F(QueryParserTest, InsertWithoutColumnListUsesTableOrder) {
    auto query = analyze("INSERT INTO order_items VALUES (?, ?, ?, ?, ?)");
    ASSERT_EQ(query.parameters.size(), 5u);
    EXPECT_EQ(query.parameters[4].data_type, SQL_DECIMAL);
}

TEST_F(QueryParserTest, UpdateAndDelete) {
    auto update = analyze("UPDATE users SET email = ? WHERE user_id = ?");
    EXPECT_EQ(update.kind, StatementKind::Update);
    ASSERT_EQ(update.parameters.size(), 2u);
    EXPECT_EQ(update.parameters[0].data_type, SQL_VARCHAR);
    EXPECT_EQ(update.parameters[0].nullable, SQL_NULLABLE);
    EXPECT_EQ(update.parameters[1].data_type, SQL_INTEGER);

    auto del = analyze("DELETE FROM orders WHERE status = ?");
    EXPECT_EQ(del.kind, StatementKind::Delete);
    ASSERT_EQ(del.parameters.size(), 1u);
    EXPECT_EQ(del.parameters[0].data_type, SQL_VARCHAR);
}

TEST_F(QueryParserTest, EmptyCatalogKnowsNoTables) {
    const MockCatalog& empty = MockCatalog::preset("Empty");
    EXPECT_THROW(analyze_query("SELECT * FROM users", empty), QueryError);
    EXPECT_NO_THROW(analyze_query("SELECT 1", empty));
}

TEST(MockCatalogTest, PatternMatching) {
    EXPECT_TRUE(MockCatalog::matches_pattern("USERS", "%"));
    EXPECT_TRUE(MockCatalog::matches_pattern("USERS", "us%"));
    EXPECT_TRUE(MockCatalog::matches_pattern("ORDER_ITEMS", "ORDER%ITEMS"));
    EXPECT_TRUE(MockCatalog::matches_pattern("USERS", "_SERS"));
    EXPECT_FALSE(MockCatalog::matches_pattern("ORDERS", "USERS"));
    EXPECT_FALSE(MockCatalog::matches_pattern("USERS", "USER"));
}
