#pragma once

#include "../driver/common.hpp"
#include <string>
#include <vector>

namespace mock_odbc {

// Column definition for mock catalog
struct MockColumn {
    std::string name;
    SQLSMALLINT data_type;
    std::string type_name;      // DBMS spelling reported as SQL_DESC_TYPE_NAME
    SQLULEN column_size;
    SQLSMALLINT decimal_digits;
    SQLSMALLINT nullable;       // SQL_NO_NULLS or SQL_NULLABLE
    bool is_unsigned = false;
};

// Table definition
struct MockTable {
    std::string catalog;
    std::string schema;
    std::string name;
    std::string type;           // "TABLE" or "VIEW"
    std::string remarks;
    std::vector<MockColumn> columns;
    
    // Case-insensitive column lookup
    const MockColumn* find_column(const std::string& column_name) const;
};

// An immutable set of tables. Each connection picks a preset by name
// (Catalog=Default|Empty) and keeps a pointer to it.
class MockCatalog {
public:
    // "Default" (unknown names fall back to it) or "Empty"
    static const MockCatalog& preset(const std::string& name);
    
    const std::vector<MockTable>& tables() const { return tables_; }
    
    // Case-insensitive table lookup
    const MockTable* find_table(const std::string& name) const;
    
    // SQL LIKE pattern matching (% and _), case-insensitive
    static bool matches_pattern(const std::string& value, const std::string& pattern);
    
private:
    MockCatalog() = default;
    static MockCatalog create_default_catalog();
    
    std::vector<MockTable> tables_;
};

} // namespace mock_odbc
