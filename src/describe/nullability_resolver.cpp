#include "nullability_resolver.hpp"
#include "core/odbc_statement.hpp"
#include "core/odbc_error.hpp"
#include "core/logger.hpp"

namespace querylens::describe {

namespace {

// SQLColumns result set columns
constexpr SQLUSMALLINT COLUMNS_TABLE_NAME = 3;
constexpr SQLUSMALLINT COLUMNS_COLUMN_NAME = 4;
constexpr SQLUSMALLINT COLUMNS_NULLABLE = 11;

// nullptr/0 means "any" for catalog and schema; an empty string would mean
// "objects without a catalog" to most drivers
SQLCHAR* as_catalog_arg(const std::string& value) {
    return value.empty() ? nullptr : reinterpret_cast<SQLCHAR*>(const_cast<char*>(value.c_str()));
}

SQLSMALLINT as_catalog_len(const std::string& value) {
    return value.empty() ? 0 : static_cast<SQLSMALLINT>(value.length());
}

} // anonymous namespace

NullabilityResolver::NullabilityResolver(core::OdbcConnection& conn)
    : conn_(conn) {
}

void NullabilityResolver::refine(std::vector<ColumnDescription>& columns) {
    for (auto& col : columns) {
        if (col.nullable.has_value()) {
            continue;
        }
        
        if (col.base_table.empty() || col.base_column.empty()) {
            LOG_DEBUG("Column #" + std::to_string(col.ordinal) + " (" + col.name +
                      ") has no base column, nullability stays unknown");
            continue;
        }
        
        col.nullable = lookup(col.catalog, col.schema, col.base_table, col.base_column);
        LOG_IF(col.nullable.has_value(),
               "Catalog resolved nullability of " + col.base_table + "." + col.base_column,
               "Catalog could not resolve nullability of " + col.base_table + "." + col.base_column);
    }
}

Nullability NullabilityResolver::lookup(const std::string& catalog, const std::string& schema,
                                        const std::string& table, const std::string& column) {
    Key key{catalog, schema, table, column};
    auto it = memo_.find(key);
    if (it != memo_.end()) {
        return it->second;
    }
    
    Nullability result;
    try {
        result = query_catalog(catalog, schema, table, column);
    } catch (const core::OdbcError& e) {
        // A catalog failure only costs us the refinement
        LOG_WARN("SQLColumns failed for " + table + "." + column + ": " + e.primary_message());
        result = std::nullopt;
    }
    
    memo_.emplace(std::move(key), result);
    return result;
}

Nullability NullabilityResolver::query_catalog(const std::string& catalog, const std::string& schema,
                                               const std::string& table, const std::string& column) {
    core::OdbcStatement stmt(conn_);
    ++catalog_queries_;
    
    std::string table_arg = table;
    std::string column_arg = column;
    
    SQLRETURN ret = SQLColumns(stmt.get_handle(),
        as_catalog_arg(catalog), as_catalog_len(catalog),
        as_catalog_arg(schema), as_catalog_len(schema),
        reinterpret_cast<SQLCHAR*>(table_arg.data()), static_cast<SQLSMALLINT>(table_arg.length()),
        reinterpret_cast<SQLCHAR*>(column_arg.data()), static_cast<SQLSMALLINT>(column_arg.length()));
    core::check_odbc_result(ret, SQL_HANDLE_STMT, stmt.get_handle(), "SQLColumns");
    
    // Table and column are search patterns ('_' matches any character), so
    // keep only rows naming exactly the column we asked about.
    Nullability result;
    while (stmt.fetch()) {
        auto row_table = stmt.get_string(COLUMNS_TABLE_NAME);
        auto row_column = stmt.get_string(COLUMNS_COLUMN_NAME);
        if (!row_table || !row_column || *row_table != table || *row_column != column) {
            continue;
        }
        
        auto code = stmt.get_smallint(COLUMNS_NULLABLE);
        result = code ? nullability_from_odbc(*code) : std::nullopt;
        break;
    }
    stmt.close_cursor();
    
    return result;
}

} // namespace querylens::describe
