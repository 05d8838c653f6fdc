#pragma once

#include "mock_catalog.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace mock_odbc {

// Parameter marker metadata reported by SQLDescribeParam
struct ParameterInfo {
    SQLSMALLINT data_type = SQL_VARCHAR;
    SQLULEN column_size = 255;
    SQLSMALLINT decimal_digits = 0;
    SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;
};

// Result column metadata reported by SQLDescribeCol / SQLColAttribute
struct ResultColumn {
    std::string label;
    SQLSMALLINT data_type = SQL_VARCHAR;
    std::string type_name = "VARCHAR";
    SQLULEN column_size = 255;
    SQLSMALLINT decimal_digits = 0;
    SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;
    bool is_unsigned = false;
    std::string base_table;     // empty for computed columns
    std::string base_column;
};

enum class StatementKind {
    Select,
    Insert,
    Update,
    Delete
};

// What preparing a statement against the mock catalog yields
struct PreparedQuery {
    StatementKind kind = StatementKind::Select;
    std::vector<ParameterInfo> parameters;
    std::vector<ResultColumn> columns;
};

// Raised for statements the catalog cannot satisfy; carries the SQLSTATE
class QueryError : public std::runtime_error {
public:
    QueryError(std::string sqlstate, const std::string& message)
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}
    
    const std::string& sqlstate() const { return sqlstate_; }
    
private:
    std::string sqlstate_;
};

// Token produced by tokenize_sql
struct Token {
    enum class Kind {
        Identifier,
        QuotedIdentifier,   // "..." or `...` with the quotes removed
        String,
        Number,
        Parameter,          // ?
        Symbol
    };
    
    Kind kind;
    std::string text;
    
    bool is_keyword(const char* keyword) const;
    bool is_symbol(const char* symbol) const;
};

// Split SQL text into tokens, dropping whitespace and comments
std::vector<Token> tokenize_sql(const std::string& sql);

// Describe a SELECT / INSERT / UPDATE / DELETE the way a server would
// at prepare time. Throws QueryError (42000, 42S02, 42S22, 21S01).
PreparedQuery analyze_query(const std::string& sql, const MockCatalog& catalog);

} // namespace mock_odbc
