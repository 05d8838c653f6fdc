// Catalog API - SQLTables, SQLColumns

#include "driver/handles.hpp"
#include "driver/diagnostics.hpp"
#include "mock/mock_catalog.hpp"
#include "utils/string_utils.hpp"

using namespace mock_odbc;

namespace {

ResultColumn catalog_column(const char* name, SQLSMALLINT type, SQLSMALLINT nullable = SQL_NULLABLE) {
    ResultColumn col;
    col.label = name;
    col.data_type = type;
    col.type_name = (type == SQL_VARCHAR) ? "VARCHAR" : (type == SQL_SMALLINT ? "SMALLINT" : "INTEGER");
    col.column_size = (type == SQL_VARCHAR) ? 128 : (type == SQL_SMALLINT ? 5 : 10);
    col.nullable = nullable;
    return col;
}

// Octet length a client needs to buffer one value of the column
long long buffer_length(const MockColumn& col) {
    switch (col.data_type) {
        case SQL_INTEGER: return 4;
        case SQL_SMALLINT: return 2;
        case SQL_BIGINT: return 8;
        case SQL_BIT: return 1;
        case SQL_TYPE_DATE: return 6;
        case SQL_TYPE_TIMESTAMP: return 16;
        case SQL_GUID: return 16;
        case SQL_DECIMAL:
        case SQL_NUMERIC: return static_cast<long long>(col.column_size) + 2;
        default: return static_cast<long long>(col.column_size);
    }
}

bool is_character_type(SQLSMALLINT type) {
    return type == SQL_CHAR || type == SQL_VARCHAR || type == SQL_LONGVARCHAR;
}

// SQL_DATA_TYPE / SQL_DATETIME_SUB split of a concise type
std::pair<long long, CellValue> verbose_type(SQLSMALLINT type) {
    switch (type) {
        case SQL_TYPE_DATE: return {SQL_DATETIME, static_cast<long long>(SQL_CODE_DATE)};
        case SQL_TYPE_TIME: return {SQL_DATETIME, static_cast<long long>(SQL_CODE_TIME)};
        case SQL_TYPE_TIMESTAMP: return {SQL_DATETIME, static_cast<long long>(SQL_CODE_TIMESTAMP)};
        case SQL_INTERVAL_DAY_TO_SECOND: return {SQL_INTERVAL, static_cast<long long>(SQL_CODE_DAY_TO_SECOND)};
        default: return {type, std::monostate{}};
    }
}

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLTables(
    SQLHSTMT hstmt,
    SQLCHAR* szCatalogName,
    SQLSMALLINT cbCatalogName,
    SQLCHAR* szSchemaName,
    SQLSMALLINT cbSchemaName,
    SQLCHAR* szTableName,
    SQLSMALLINT cbTableName,
    SQLCHAR* szTableType,
    SQLSMALLINT cbTableType) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (inject_failure(*stmt, stmt->config(), "SQLTables")) {
        return SQL_ERROR;
    }
    
    // The mock catalog has neither catalogs nor schemas
    (void)szCatalogName;
    (void)cbCatalogName;
    (void)szSchemaName;
    (void)cbSchemaName;
    
    std::string table_pattern = sql_to_string(szTableName, cbTableName);
    std::string type_filter = to_upper(sql_to_string(szTableType, cbTableType));
    
    std::vector<ResultColumn> columns = {
        catalog_column("TABLE_CAT", SQL_VARCHAR),
        catalog_column("TABLE_SCHEM", SQL_VARCHAR),
        catalog_column("TABLE_NAME", SQL_VARCHAR, SQL_NO_NULLS),
        catalog_column("TABLE_TYPE", SQL_VARCHAR, SQL_NO_NULLS),
        catalog_column("REMARKS", SQL_VARCHAR),
    };
    
    std::vector<MockRow> rows;
    for (const auto& table : stmt->connection()->catalog().tables()) {
        if (!MockCatalog::matches_pattern(table.name, table_pattern)) {
            continue;
        }
        // Types come as a list like 'TABLE','VIEW'
        if (!type_filter.empty() && type_filter.find(to_upper(table.type)) == std::string::npos) {
            continue;
        }
        
        rows.push_back({std::monostate{}, std::monostate{}, table.name, table.type, table.remarks});
    }
    
    stmt->set_result(std::move(columns), std::move(rows));
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLColumns(
    SQLHSTMT hstmt,
    SQLCHAR* szCatalogName,
    SQLSMALLINT cbCatalogName,
    SQLCHAR* szSchemaName,
    SQLSMALLINT cbSchemaName,
    SQLCHAR* szTableName,
    SQLSMALLINT cbTableName,
    SQLCHAR* szColumnName,
    SQLSMALLINT cbColumnName) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (inject_failure(*stmt, stmt->config(), "SQLColumns")) {
        return SQL_ERROR;
    }
    
    (void)szCatalogName;
    (void)cbCatalogName;
    (void)szSchemaName;
    (void)cbSchemaName;
    
    std::string table_pattern = sql_to_string(szTableName, cbTableName);
    std::string column_pattern = sql_to_string(szColumnName, cbColumnName);
    
    // The 18 columns of an ODBC 3 SQLColumns result
    std::vector<ResultColumn> columns = {
        catalog_column("TABLE_CAT", SQL_VARCHAR),
        catalog_column("TABLE_SCHEM", SQL_VARCHAR),
        catalog_column("TABLE_NAME", SQL_VARCHAR, SQL_NO_NULLS),
        catalog_column("COLUMN_NAME", SQL_VARCHAR, SQL_NO_NULLS),
        catalog_column("DATA_TYPE", SQL_SMALLINT, SQL_NO_NULLS),
        catalog_column("TYPE_NAME", SQL_VARCHAR, SQL_NO_NULLS),
        catalog_column("COLUMN_SIZE", SQL_INTEGER),
        catalog_column("BUFFER_LENGTH", SQL_INTEGER),
        catalog_column("DECIMAL_DIGITS", SQL_SMALLINT),
        catalog_column("NUM_PREC_RADIX", SQL_SMALLINT),
        catalog_column("NULLABLE", SQL_SMALLINT, SQL_NO_NULLS),
        catalog_column("REMARKS", SQL_VARCHAR),
        catalog_column("COLUMN_DEF", SQL_VARCHAR),
        catalog_column("SQL_DATA_TYPE", SQL_SMALLINT, SQL_NO_NULLS),
        catalog_column("SQL_DATETIME_SUB", SQL_SMALLINT),
        catalog_column("CHAR_OCTET_LENGTH", SQL_INTEGER),
        catalog_column("ORDINAL_POSITION", SQL_INTEGER, SQL_NO_NULLS),
        catalog_column("IS_NULLABLE", SQL_VARCHAR),
    };
    
    std::vector<MockRow> rows;
    for (const auto& table : stmt->connection()->catalog().tables()) {
        if (!MockCatalog::matches_pattern(table.name, table_pattern)) {
            continue;
        }
        
        for (size_t i = 0; i < table.columns.size(); ++i) {
            const auto& col = table.columns[i];
            if (!MockCatalog::matches_pattern(col.name, column_pattern)) {
                continue;
            }
            
            auto [sql_data_type, datetime_sub] = verbose_type(col.data_type);
            bool numeric = col.data_type == SQL_INTEGER || col.data_type == SQL_DECIMAL ||
                           col.data_type == SQL_SMALLINT || col.data_type == SQL_BIGINT;
            
            MockRow row;
            row.push_back(std::monostate{});                                    // TABLE_CAT
            row.push_back(std::monostate{});                                    // TABLE_SCHEM
            row.push_back(table.name);
            row.push_back(col.name);
            row.push_back(static_cast<long long>(col.data_type));
            row.push_back(col.type_name);
            row.push_back(static_cast<long long>(col.column_size));
            row.push_back(buffer_length(col));
            row.push_back(numeric ? CellValue(static_cast<long long>(col.decimal_digits)) : CellValue());
            row.push_back(numeric ? CellValue(10LL) : CellValue());
            row.push_back(static_cast<long long>(col.nullable));
            row.push_back(std::monostate{});                                    // REMARKS
            row.push_back(std::monostate{});                                    // COLUMN_DEF
            row.push_back(sql_data_type);
            row.push_back(datetime_sub);
            row.push_back(is_character_type(col.data_type)
                              ? CellValue(static_cast<long long>(col.column_size)) : CellValue());
            row.push_back(static_cast<long long>(i + 1));                       // ORDINAL_POSITION
            row.push_back(std::string(col.nullable == SQL_NO_NULLS ? "NO" : "YES"));
            rows.push_back(std::move(row));
        }
    }
    
    stmt->set_result(std::move(columns), std::move(rows));
    return SQL_SUCCESS;
}

} // extern "C"
