#include "odbc_statement.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"
#include <vector>

namespace querylens::core {

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE succeeds even when no cursor is open, unlike SQLCloseCursor (24000)
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
}

void OdbcStatement::prepare(std::string_view sql) {
    recycle();
    LOG_TRACE("SQLPrepare: " + std::string(sql));
    std::string text(sql);
    SQLRETURN ret = SQLPrepare(handle_, reinterpret_cast<SQLCHAR*>(text.data()),
                               static_cast<SQLINTEGER>(text.length()));
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLPrepare");
}

void OdbcStatement::execute(std::string_view sql) {
    recycle();
    std::string text(sql);
    SQLRETURN ret = SQLExecDirect(handle_, reinterpret_cast<SQLCHAR*>(text.data()),
                                  static_cast<SQLINTEGER>(text.length()));
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
}

SQLSMALLINT OdbcStatement::num_params() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumParams(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumParams");
    return count;
}

SQLSMALLINT OdbcStatement::num_result_cols() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumResultCols");
    return count;
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);
    
    if (ret == SQL_NO_DATA) {
        return false;
    }
    
    // Allow SQL_SUCCESS_WITH_INFO (warnings)
    if (ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
        return true;
    }
    
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return false;
}

void OdbcStatement::close_cursor() {
    SQLFreeStmt(handle_, SQL_CLOSE);
}

std::optional<std::string> OdbcStatement::get_string(SQLUSMALLINT column) {
    std::vector<SQLCHAR> buffer(256, 0);
    SQLLEN indicator = 0;
    
    SQLRETURN ret = SQLGetData(handle_, column, SQL_C_CHAR, buffer.data(),
                               static_cast<SQLLEN>(buffer.size()), &indicator);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetData");
    
    if (indicator == SQL_NULL_DATA) {
        return std::nullopt;
    }
    
    std::string value(reinterpret_cast<char*>(buffer.data()));
    
    // 01004: more data pending, keep reading in chunks
    while (ret == SQL_SUCCESS_WITH_INFO) {
        std::fill(buffer.begin(), buffer.end(), 0);
        ret = SQLGetData(handle_, column, SQL_C_CHAR, buffer.data(),
                         static_cast<SQLLEN>(buffer.size()), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetData");
        value += reinterpret_cast<char*>(buffer.data());
    }
    
    return value;
}

std::optional<SQLSMALLINT> OdbcStatement::get_smallint(SQLUSMALLINT column) {
    SQLSMALLINT value = 0;
    SQLLEN indicator = 0;
    
    SQLRETURN ret = SQLGetData(handle_, column, SQL_C_SSHORT, &value, 0, &indicator);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetData");
    
    if (indicator == SQL_NULL_DATA) {
        return std::nullopt;
    }
    return value;
}

} // namespace querylens::core
