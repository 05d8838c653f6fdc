// Describe API - SQLNumParams, SQLDescribeParam, SQLNumResultCols,
// SQLDescribeCol, SQLColAttribute

#include "driver/handles.hpp"
#include "driver/diagnostics.hpp"
#include "utils/string_utils.hpp"

using namespace mock_odbc;

namespace {

bool has_metadata(StatementHandle* stmt) {
    if (stmt->prepared_ || stmt->executed_) {
        return true;
    }
    stmt->add_diagnostic(sqlstate::FUNCTION_SEQUENCE_ERROR, 0, "Function sequence error");
    return false;
}

const ResultColumn* result_column(StatementHandle* stmt, SQLUSMALLINT icol) {
    if (icol < 1 || icol > stmt->columns_.size()) {
        stmt->add_diagnostic(sqlstate::INVALID_COLUMN_NUMBER, 0, "Invalid descriptor index");
        return nullptr;
    }
    return &stmt->columns_[icol - 1];
}

// Characters needed to display a value of the column
SQLLEN display_size(const ResultColumn& col) {
    switch (col.data_type) {
        case SQL_BIT: return 1;
        case SQL_SMALLINT: return 6;
        case SQL_INTEGER: return 11;
        case SQL_BIGINT: return 20;
        case SQL_DOUBLE: return 24;
        case SQL_DECIMAL:
        case SQL_NUMERIC: return static_cast<SQLLEN>(col.column_size) + 2;
        case SQL_GUID: return 36;
        default: return static_cast<SQLLEN>(col.column_size);
    }
}

SQLLEN octet_length(const ResultColumn& col) {
    switch (col.data_type) {
        case SQL_BIT: return 1;
        case SQL_SMALLINT: return 2;
        case SQL_INTEGER: return 4;
        case SQL_BIGINT: return 8;
        case SQL_DOUBLE: return 8;
        case SQL_TYPE_DATE: return 6;
        case SQL_TYPE_TIMESTAMP: return 16;
        case SQL_GUID: return 16;
        default: return static_cast<SQLLEN>(col.column_size);
    }
}

// SQL_DESC_TYPE is the verbose type: datetime and interval types collapse
SQLLEN verbose_type(SQLSMALLINT type) {
    switch (type) {
        case SQL_TYPE_DATE:
        case SQL_TYPE_TIME:
        case SQL_TYPE_TIMESTAMP:
            return SQL_DATETIME;
        case SQL_INTERVAL_DAY_TO_SECOND:
            return SQL_INTERVAL;
        default:
            return type;
    }
}

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLNumParams(
    SQLHSTMT hstmt,
    SQLSMALLINT* pcpar) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!has_metadata(stmt)) {
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLNumParams")) {
        return SQL_ERROR;
    }
    
    if (pcpar) *pcpar = static_cast<SQLSMALLINT>(stmt->parameters_.size());
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLDescribeParam(
    SQLHSTMT hstmt,
    SQLUSMALLINT ipar,
    SQLSMALLINT* pfSqlType,
    SQLULEN* pcbParamDef,
    SQLSMALLINT* pibScale,
    SQLSMALLINT* pfNullable) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!stmt->config().describe_param_supported) {
        stmt->add_diagnostic(sqlstate::OPTIONAL_FEATURE_NOT_IMPLEMENTED, 0,
                            "Optional feature not implemented");
        return SQL_ERROR;
    }
    if (!has_metadata(stmt)) {
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLDescribeParam")) {
        return SQL_ERROR;
    }
    if (ipar < 1 || ipar > stmt->parameters_.size()) {
        stmt->add_diagnostic(sqlstate::INVALID_COLUMN_NUMBER, 0, "Invalid descriptor index");
        return SQL_ERROR;
    }
    
    const auto& param = stmt->parameters_[ipar - 1];
    if (pfSqlType) *pfSqlType = param.data_type;
    if (pcbParamDef) *pcbParamDef = param.column_size;
    if (pibScale) *pibScale = param.decimal_digits;
    if (pfNullable) *pfNullable = param.nullable;
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLNumResultCols(
    SQLHSTMT hstmt,
    SQLSMALLINT* pccol) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!has_metadata(stmt)) {
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLNumResultCols")) {
        return SQL_ERROR;
    }
    
    if (pccol) *pccol = static_cast<SQLSMALLINT>(stmt->columns_.size());
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLDescribeCol(
    SQLHSTMT hstmt,
    SQLUSMALLINT icol,
    SQLCHAR* szColName,
    SQLSMALLINT cbColNameMax,
    SQLSMALLINT* pcbColName,
    SQLSMALLINT* pfSqlType,
    SQLULEN* pcbColDef,
    SQLSMALLINT* pibScale,
    SQLSMALLINT* pfNullable) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!has_metadata(stmt)) {
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLDescribeCol")) {
        return SQL_ERROR;
    }
    
    const ResultColumn* col = result_column(stmt, icol);
    if (!col) {
        return SQL_ERROR;
    }
    
    if (pfSqlType) *pfSqlType = col->data_type;
    if (pcbColDef) *pcbColDef = col->column_size;
    if (pibScale) *pibScale = col->decimal_digits;
    if (pfNullable) *pfNullable = col->nullable;
    
    SQLRETURN ret = copy_string_to_buffer(col->label, szColName, cbColNameMax, pcbColName);
    if (ret == SQL_SUCCESS_WITH_INFO) {
        stmt->add_diagnostic(sqlstate::STRING_TRUNCATED, 0, "String data, right truncated");
    }
    return ret;
}

SQLRETURN SQL_API SQLColAttribute(
    SQLHSTMT hstmt,
    SQLUSMALLINT iCol,
    SQLUSMALLINT iField,
    SQLPOINTER pCharAttr,
    SQLSMALLINT cbCharAttrMax,
    SQLSMALLINT* pcbCharAttr,
    SQLLEN* pNumAttr) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!has_metadata(stmt)) {
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLColAttribute")) {
        return SQL_ERROR;
    }
    
    if (iField == SQL_DESC_COUNT) {
        if (pNumAttr) *pNumAttr = static_cast<SQLLEN>(stmt->columns_.size());
        return SQL_SUCCESS;
    }
    
    const ResultColumn* col = result_column(stmt, iCol);
    if (!col) {
        return SQL_ERROR;
    }
    
    auto string_attr = [&](const std::string& value) -> SQLRETURN {
        SQLRETURN ret = copy_string_to_buffer(value, static_cast<SQLCHAR*>(pCharAttr),
                                              cbCharAttrMax, pcbCharAttr);
        if (ret == SQL_SUCCESS_WITH_INFO) {
            stmt->add_diagnostic(sqlstate::STRING_TRUNCATED, 0, "String data, right truncated");
        }
        return ret;
    };
    auto numeric_attr = [&](SQLLEN value) -> SQLRETURN {
        if (pNumAttr) *pNumAttr = value;
        return SQL_SUCCESS;
    };
    
    switch (iField) {
        case SQL_DESC_LABEL:
        case SQL_DESC_NAME:
        case SQL_COLUMN_NAME:
            return string_attr(col->label);
            
        case SQL_DESC_TYPE_NAME:
        case SQL_DESC_LOCAL_TYPE_NAME:
            return string_attr(col->type_name);
            
        case SQL_DESC_BASE_TABLE_NAME:
        case SQL_DESC_TABLE_NAME:
            return string_attr(col->base_table);
            
        case SQL_DESC_BASE_COLUMN_NAME:
            return string_attr(col->base_column);
            
        // The mock catalog has neither schemas nor catalogs
        case SQL_DESC_SCHEMA_NAME:
        case SQL_DESC_CATALOG_NAME:
        case SQL_DESC_LITERAL_PREFIX:
        case SQL_DESC_LITERAL_SUFFIX:
            return string_attr("");
            
        case SQL_DESC_CONCISE_TYPE:
            return numeric_attr(col->data_type);
            
        case SQL_DESC_TYPE:
            return numeric_attr(verbose_type(col->data_type));
            
        case SQL_DESC_NULLABLE:
            return numeric_attr(col->nullable);
            
        case SQL_DESC_UNSIGNED:
            return numeric_attr(col->is_unsigned ? SQL_TRUE : SQL_FALSE);
            
        case SQL_DESC_LENGTH:
        case SQL_DESC_PRECISION:
        case SQL_COLUMN_LENGTH:
        case SQL_COLUMN_PRECISION:
            return numeric_attr(static_cast<SQLLEN>(col->column_size));
            
        case SQL_DESC_SCALE:
        case SQL_COLUMN_SCALE:
            return numeric_attr(col->decimal_digits);
            
        case SQL_DESC_DISPLAY_SIZE:
            return numeric_attr(display_size(*col));
            
        case SQL_DESC_OCTET_LENGTH:
            return numeric_attr(octet_length(*col));
            
        case SQL_DESC_UNNAMED:
            return numeric_attr(col->label.empty() ? SQL_UNNAMED : SQL_NAMED);
            
        case SQL_DESC_SEARCHABLE:
            return numeric_attr(SQL_PRED_SEARCHABLE);
            
        case SQL_DESC_UPDATABLE:
            return numeric_attr(col->base_table.empty() ? SQL_ATTR_READONLY : SQL_ATTR_WRITE);
            
        case SQL_DESC_AUTO_UNIQUE_VALUE:
            return numeric_attr(SQL_FALSE);
            
        case SQL_DESC_CASE_SENSITIVE:
            return numeric_attr(col->data_type == SQL_VARCHAR || col->data_type == SQL_LONGVARCHAR
                                    ? SQL_TRUE : SQL_FALSE);
            
        case SQL_DESC_FIXED_PREC_SCALE:
            return numeric_attr(col->data_type == SQL_DECIMAL ? SQL_TRUE : SQL_FALSE);
            
        default:
            stmt->add_diagnostic(sqlstate::INVALID_FIELD_IDENTIFIER, 0,
                                "Invalid descriptor field identifier");
            return SQL_ERROR;
    }
}

} // extern "C"
