// Statement API - SQLPrepare, SQLExecute, SQLExecDirect, SQLFetch, SQLGetData,
// statement attributes and cursor management

#include "driver/handles.hpp"
#include "driver/diagnostics.hpp"
#include "mock/mock_catalog.hpp"
#include "mock/query_parser.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <cstring>

using namespace mock_odbc;

namespace {

// Analyze sql against the connection's catalog and keep the metadata on stmt
SQLRETURN prepare_statement(StatementHandle* stmt, const std::string& sql) {
    if (stmt->cursor_open_) {
        stmt->add_diagnostic(sqlstate::INVALID_CURSOR_STATE, 0, "Invalid cursor state");
        return SQL_ERROR;
    }
    
    stmt->reset();
    
    PreparedQuery query;
    try {
        query = analyze_query(sql, stmt->connection()->catalog());
    } catch (const QueryError& e) {
        stmt->add_diagnostic(e.sqlstate(), -1, e.what());
        return SQL_ERROR;
    }
    
    if (stmt->config().nullable_reporting == NullableReporting::Unknown) {
        for (auto& col : query.columns) {
            col.nullable = SQL_NULLABLE_UNKNOWN;
        }
    }
    
    stmt->sql_ = sql;
    stmt->kind_ = query.kind;
    stmt->parameters_ = std::move(query.parameters);
    stmt->columns_ = std::move(query.columns);
    stmt->prepared_ = true;
    return SQL_SUCCESS;
}

// The mock has no stored rows: a query opens an empty cursor and DML touches nothing
SQLRETURN execute_statement(StatementHandle* stmt) {
    stmt->rows_.clear();
    stmt->current_row_ = -1;
    stmt->getdata_column_ = 0;
    stmt->getdata_offset_ = 0;
    stmt->executed_ = true;
    
    if (stmt->kind_ == StatementKind::Select) {
        stmt->cursor_open_ = true;
        stmt->affected_rows_ = -1;
    } else {
        stmt->cursor_open_ = false;
        stmt->affected_rows_ = 0;
    }
    return SQL_SUCCESS;
}

void close_cursor(StatementHandle* stmt) {
    stmt->cursor_open_ = false;
    stmt->current_row_ = -1;
    stmt->getdata_column_ = 0;
    stmt->getdata_offset_ = 0;
}

template<typename T>
SQLRETURN put_number(T value, SQLPOINTER target, SQLLEN* indicator) {
    if (target) *static_cast<T*>(target) = value;
    if (indicator) *indicator = sizeof(T);
    return SQL_SUCCESS;
}

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLPrepare(
    SQLHSTMT hstmt,
    SQLCHAR* szSqlStr,
    SQLINTEGER cbSqlStr) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (inject_failure(*stmt, stmt->config(), "SQLPrepare")) {
        return SQL_ERROR;
    }
    
    return prepare_statement(stmt, sql_to_string(szSqlStr, cbSqlStr));
}

SQLRETURN SQL_API SQLExecute(SQLHSTMT hstmt) {
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!stmt->prepared_) {
        stmt->add_diagnostic(sqlstate::FUNCTION_SEQUENCE_ERROR, 0, "Function sequence error");
        return SQL_ERROR;
    }
    if (stmt->cursor_open_) {
        stmt->add_diagnostic(sqlstate::INVALID_CURSOR_STATE, 0, "Invalid cursor state");
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLExecute")) {
        return SQL_ERROR;
    }
    
    return execute_statement(stmt);
}

SQLRETURN SQL_API SQLExecDirect(
    SQLHSTMT hstmt,
    SQLCHAR* szSqlStr,
    SQLINTEGER cbSqlStr) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (inject_failure(*stmt, stmt->config(), "SQLExecDirect")) {
        return SQL_ERROR;
    }
    
    SQLRETURN ret = prepare_statement(stmt, sql_to_string(szSqlStr, cbSqlStr));
    if (!SQL_SUCCEEDED(ret)) {
        return ret;
    }
    // A directly executed statement cannot be re-executed
    stmt->prepared_ = false;
    return execute_statement(stmt);
}

SQLRETURN SQL_API SQLFetch(SQLHSTMT hstmt) {
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!stmt->cursor_open_) {
        stmt->add_diagnostic(sqlstate::FUNCTION_SEQUENCE_ERROR, 0, "No open cursor");
        return SQL_ERROR;
    }
    if (inject_failure(*stmt, stmt->config(), "SQLFetch")) {
        return SQL_ERROR;
    }
    
    stmt->getdata_column_ = 0;
    stmt->getdata_offset_ = 0;
    
    SQLLEN total_rows = static_cast<SQLLEN>(stmt->rows_.size());
    if (stmt->current_row_ + 1 >= total_rows) {
        stmt->current_row_ = total_rows;
        return SQL_NO_DATA;
    }
    
    ++stmt->current_row_;
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLGetData(
    SQLHSTMT hstmt,
    SQLUSMALLINT icol,
    SQLSMALLINT fCType,
    SQLPOINTER rgbValue,
    SQLLEN cbValueMax,
    SQLLEN* pcbValue) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!stmt->cursor_open_ || stmt->current_row_ < 0 ||
        stmt->current_row_ >= static_cast<SQLLEN>(stmt->rows_.size())) {
        stmt->add_diagnostic(sqlstate::INVALID_CURSOR_STATE, 0, "Cursor is not positioned on a row");
        return SQL_ERROR;
    }
    
    const auto& row = stmt->rows_[static_cast<size_t>(stmt->current_row_)];
    if (icol < 1 || icol > row.size()) {
        stmt->add_diagnostic(sqlstate::INVALID_COLUMN_NUMBER, 0, "Invalid descriptor index");
        return SQL_ERROR;
    }
    
    // Once a column has been read completely, further calls report no data
    if (stmt->getdata_column_ != icol) {
        stmt->getdata_column_ = icol;
        stmt->getdata_offset_ = 0;
    } else if (stmt->getdata_offset_ == std::string::npos) {
        return SQL_NO_DATA;
    }
    
    const auto& cell = row[icol - 1];
    
    if (std::holds_alternative<std::monostate>(cell)) {
        if (!pcbValue) {
            stmt->add_diagnostic(sqlstate::INDICATOR_REQUIRED, 0, "Indicator variable required but not supplied");
            return SQL_ERROR;
        }
        *pcbValue = SQL_NULL_DATA;
        stmt->getdata_offset_ = std::string::npos;
        return SQL_SUCCESS;
    }
    
    const auto* number = std::get_if<long long>(&cell);
    if (number && fCType != SQL_C_CHAR && fCType != SQL_C_DEFAULT) {
        stmt->getdata_offset_ = std::string::npos;
        switch (fCType) {
            case SQL_C_SSHORT:
            case SQL_C_SHORT:
                return put_number(static_cast<SQLSMALLINT>(*number), rgbValue, pcbValue);
            case SQL_C_USHORT:
                return put_number(static_cast<SQLUSMALLINT>(*number), rgbValue, pcbValue);
            case SQL_C_SLONG:
            case SQL_C_LONG:
                return put_number(static_cast<SQLINTEGER>(*number), rgbValue, pcbValue);
            case SQL_C_ULONG:
                return put_number(static_cast<SQLUINTEGER>(*number), rgbValue, pcbValue);
            case SQL_C_SBIGINT:
                return put_number(static_cast<SQLBIGINT>(*number), rgbValue, pcbValue);
            default:
                break;
        }
    }
    
    if (fCType != SQL_C_CHAR && fCType != SQL_C_DEFAULT) {
        stmt->add_diagnostic(sqlstate::RESTRICTED_DATA_TYPE, 0,
                            "Restricted data type attribute violation");
        return SQL_ERROR;
    }
    
    std::string text = number ? std::to_string(*number) : std::get<std::string>(cell);
    
    size_t offset = stmt->getdata_offset_;
    size_t remaining = text.length() - offset;
    if (pcbValue) {
        *pcbValue = static_cast<SQLLEN>(remaining);
    }
    
    if (!rgbValue || cbValueMax <= 0) {
        stmt->add_diagnostic(sqlstate::STRING_TRUNCATED, 0, "String data, right truncated");
        return SQL_SUCCESS_WITH_INFO;
    }
    
    size_t capacity = static_cast<size_t>(cbValueMax) - 1;
    size_t copy_len = std::min(remaining, capacity);
    std::memcpy(rgbValue, text.data() + offset, copy_len);
    static_cast<char*>(rgbValue)[copy_len] = '\0';
    
    if (copy_len < remaining) {
        stmt->getdata_offset_ = offset + copy_len;
        stmt->add_diagnostic(sqlstate::STRING_TRUNCATED, 0, "String data, right truncated");
        return SQL_SUCCESS_WITH_INFO;
    }
    
    stmt->getdata_offset_ = std::string::npos;
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLRowCount(
    SQLHSTMT hstmt,
    SQLLEN* pcrow) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!stmt->executed_) {
        stmt->add_diagnostic(sqlstate::FUNCTION_SEQUENCE_ERROR, 0, "Function sequence error");
        return SQL_ERROR;
    }
    
    if (pcrow) *pcrow = stmt->affected_rows_;
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLCloseCursor(SQLHSTMT hstmt) {
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    if (!stmt->cursor_open_) {
        stmt->add_diagnostic(sqlstate::INVALID_CURSOR_STATE, 0, "Invalid cursor state");
        return SQL_ERROR;
    }
    
    close_cursor(stmt);
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLMoreResults(SQLHSTMT hstmt) {
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    // Only one result set per statement
    close_cursor(stmt);
    return SQL_NO_DATA;
}

SQLRETURN SQL_API SQLFreeStmt(
    SQLHSTMT hstmt,
    SQLUSMALLINT fOption) {
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    
    switch (fOption) {
        case SQL_CLOSE: {
            HandleLock lock(stmt);
            stmt->clear_diagnostics();
            close_cursor(stmt);
            return SQL_SUCCESS;
        }
        case SQL_UNBIND:
        case SQL_RESET_PARAMS:
            // No bindings are kept
            return SQL_SUCCESS;
        case SQL_DROP:
            delete stmt;
            return SQL_SUCCESS;
        default:
            stmt->add_diagnostic(sqlstate::INVALID_ATTRIBUTE_IDENTIFIER, 0, "Option type out of range");
            return SQL_ERROR;
    }
}

SQLRETURN SQL_API SQLCancel(SQLHSTMT hstmt) {
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    // Nothing runs asynchronously, so there is nothing to interrupt
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLGetStmtAttr(
    SQLHSTMT hstmt,
    SQLINTEGER fAttribute,
    SQLPOINTER rgbValue,
    SQLINTEGER cbValueMax,
    SQLINTEGER* pcbValue) {
    
    (void)cbValueMax;
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    SQLHANDLE descriptor = SQL_NULL_HANDLE;
    SQLULEN value = 0;
    
    switch (fAttribute) {
        case SQL_ATTR_APP_PARAM_DESC:
            descriptor = stmt->app_param_desc_;
            break;
        case SQL_ATTR_IMP_PARAM_DESC:
            descriptor = stmt->imp_param_desc_;
            break;
        case SQL_ATTR_APP_ROW_DESC:
            descriptor = stmt->app_row_desc_;
            break;
        case SQL_ATTR_IMP_ROW_DESC:
            descriptor = stmt->imp_row_desc_;
            break;
        case SQL_ATTR_CURSOR_TYPE:
            value = stmt->cursor_type_;
            break;
        case SQL_ATTR_CONCURRENCY:
            value = stmt->concurrency_;
            break;
        case SQL_ATTR_MAX_ROWS:
            value = stmt->max_rows_;
            break;
        case SQL_ATTR_QUERY_TIMEOUT:
            value = stmt->query_timeout_;
            break;
        case SQL_ATTR_ROW_ARRAY_SIZE:
            value = stmt->row_array_size_;
            break;
        case SQL_ATTR_PARAMSET_SIZE:
            value = stmt->paramset_size_;
            break;
        case SQL_ATTR_NOSCAN:
            value = stmt->noscan_;
            break;
        case SQL_ATTR_MAX_LENGTH:
            value = stmt->max_length_;
            break;
        case SQL_ATTR_ROW_NUMBER:
            value = stmt->current_row_ >= 0 ? static_cast<SQLULEN>(stmt->current_row_ + 1) : 0;
            break;
        default:
            stmt->add_diagnostic(sqlstate::INVALID_ATTRIBUTE_IDENTIFIER, 0,
                                "Invalid attribute/option identifier");
            return SQL_ERROR;
    }
    
    if (descriptor != SQL_NULL_HANDLE) {
        if (rgbValue) *static_cast<SQLHANDLE*>(rgbValue) = descriptor;
        if (pcbValue) *pcbValue = sizeof(SQLHANDLE);
        return SQL_SUCCESS;
    }
    
    if (rgbValue) *static_cast<SQLULEN*>(rgbValue) = value;
    if (pcbValue) *pcbValue = sizeof(SQLULEN);
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLSetStmtAttr(
    SQLHSTMT hstmt,
    SQLINTEGER fAttribute,
    SQLPOINTER rgbValue,
    SQLINTEGER cbValue) {
    
    (void)cbValue;
    
    auto* stmt = validate_stmt_handle(hstmt);
    if (!stmt) return SQL_INVALID_HANDLE;
    HandleLock lock(stmt);
    
    stmt->clear_diagnostics();
    
    auto value = static_cast<SQLULEN>(reinterpret_cast<uintptr_t>(rgbValue));
    
    switch (fAttribute) {
        case SQL_ATTR_CURSOR_TYPE:
            if (value != SQL_CURSOR_FORWARD_ONLY) {
                // Option value changed
                stmt->add_diagnostic("01S02", 0, "Only forward-only cursors are supported");
                return SQL_SUCCESS_WITH_INFO;
            }
            stmt->cursor_type_ = value;
            break;
        case SQL_ATTR_CONCURRENCY:
            stmt->concurrency_ = value;
            break;
        case SQL_ATTR_MAX_ROWS:
            stmt->max_rows_ = value;
            break;
        case SQL_ATTR_QUERY_TIMEOUT:
            stmt->query_timeout_ = value;
            break;
        case SQL_ATTR_ROW_ARRAY_SIZE:
            stmt->row_array_size_ = value;
            break;
        case SQL_ATTR_PARAMSET_SIZE:
            stmt->paramset_size_ = value;
            break;
        case SQL_ATTR_NOSCAN:
            stmt->noscan_ = value;
            break;
        case SQL_ATTR_MAX_LENGTH:
            stmt->max_length_ = value;
            break;
        default:
            stmt->add_diagnostic(sqlstate::INVALID_ATTRIBUTE_IDENTIFIER, 0,
                                "Invalid attribute/option identifier");
            return SQL_ERROR;
    }
    
    return SQL_SUCCESS;
}

} // extern "C"
