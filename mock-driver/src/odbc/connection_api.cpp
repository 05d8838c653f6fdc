// Connection API - SQLConnect, SQLDriverConnect, SQLDisconnect, connection attributes

#include "driver/handles.hpp"
#include "driver/config.hpp"
#include "driver/diagnostics.hpp"
#include "utils/string_utils.hpp"

using namespace mock_odbc;

namespace {

// Integer-valued attributes that are simply stored on the connection
SQLUINTEGER* stored_attribute(ConnectionHandle& conn, SQLINTEGER attribute) {
    switch (attribute) {
        case SQL_ATTR_ACCESS_MODE:        return &conn.access_mode_;
        case SQL_ATTR_AUTOCOMMIT:         return &conn.autocommit_;
        case SQL_ATTR_LOGIN_TIMEOUT:      return &conn.login_timeout_;
        case SQL_ATTR_CONNECTION_TIMEOUT: return &conn.connection_timeout_;
        default:                          return nullptr;
    }
}

SQLRETURN refuse_if_open(ConnectionHandle& conn) {
    if (!conn.connected_) return SQL_SUCCESS;
    conn.add_diagnostic(sqlstate::CONNECTION_IN_USE, 0, "Connection already open");
    return SQL_ERROR;
}

SQLRETURN unknown_attribute(ConnectionHandle& conn) {
    conn.add_diagnostic(sqlstate::INVALID_ATTRIBUTE_IDENTIFIER, 0,
                        "Invalid attribute/option identifier");
    return SQL_ERROR;
}

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLConnect(
    SQLHDBC hdbc,
    SQLCHAR* szDSN,
    SQLSMALLINT cbDSN,
    SQLCHAR* szUID,
    SQLSMALLINT cbUID,
    SQLCHAR* szPWD,
    SQLSMALLINT cbPWD) {

    (void)szPWD;
    (void)cbPWD;

    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    conn->clear_diagnostics();

    if (refuse_if_open(*conn) != SQL_SUCCESS) return SQL_ERROR;

    // A DSN connect carries no behaviour keys; the defaults apply
    conn->open("DSN=" + sql_to_string(szDSN, cbDSN) + ";UID=" + sql_to_string(szUID, cbUID) + ";");
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLDriverConnect(
    SQLHDBC hdbc,
    SQLHWND hwnd,
    SQLCHAR* szConnStrIn,
    SQLSMALLINT cbConnStrIn,
    SQLCHAR* szConnStrOut,
    SQLSMALLINT cbConnStrOutMax,
    SQLSMALLINT* pcbConnStrOut,
    SQLUSMALLINT fDriverCompletion) {

    (void)hwnd;
    (void)fDriverCompletion;

    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    conn->clear_diagnostics();

    if (refuse_if_open(*conn) != SQL_SUCCESS) return SQL_ERROR;

    // Failure injection reads the configuration before the connection exists
    const std::string input = sql_to_string(szConnStrIn, cbConnStrIn);
    if (inject_failure(*conn, parse_connection_string(input), "SQLDriverConnect")) {
        return SQL_ERROR;
    }
    conn->open(input);

    // The completed string is the input, unchanged
    SQLRETURN ret = copy_string_to_buffer(conn->connection_string_, szConnStrOut,
                                          cbConnStrOutMax, pcbConnStrOut);
    if (ret == SQL_SUCCESS_WITH_INFO) {
        conn->add_diagnostic(sqlstate::STRING_TRUNCATED, 0, "String data, right truncated");
    }
    return ret;
}

SQLRETURN SQL_API SQLDisconnect(SQLHDBC hdbc) {
    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    conn->clear_diagnostics();

    if (!conn->connected_) {
        conn->add_diagnostic(sqlstate::CONNECTION_NOT_OPEN, 0, "Connection not open");
        return SQL_ERROR;
    }

    // Statements unregister themselves while being deleted
    auto statements = conn->statements_;
    for (auto* stmt : statements) {
        delete stmt;
    }
    conn->close();
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLGetConnectAttr(
    SQLHDBC hdbc,
    SQLINTEGER fAttribute,
    SQLPOINTER rgbValue,
    SQLINTEGER cbValueMax,
    SQLINTEGER* pcbValue) {

    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    conn->clear_diagnostics();

    if (fAttribute == SQL_ATTR_CURRENT_CATALOG) {
        const std::string& name = conn->current_catalog_name_;
        SQLRETURN ret = SQL_SUCCESS;
        if (rgbValue && cbValueMax > 0) {
            ret = copy_string_to_buffer(name, static_cast<SQLCHAR*>(rgbValue),
                                        static_cast<SQLSMALLINT>(cbValueMax), nullptr);
        }
        if (pcbValue) *pcbValue = static_cast<SQLINTEGER>(name.size());
        return ret;
    }

    SQLUINTEGER value = 0;
    if (fAttribute == SQL_ATTR_CONNECTION_DEAD) {
        value = conn->is_connected() ? SQL_CD_FALSE : SQL_CD_TRUE;
    } else if (SQLUINTEGER* stored = stored_attribute(*conn, fAttribute)) {
        value = *stored;
    } else {
        return unknown_attribute(*conn);
    }

    if (rgbValue) *static_cast<SQLUINTEGER*>(rgbValue) = value;
    if (pcbValue) *pcbValue = sizeof(SQLUINTEGER);
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLSetConnectAttr(
    SQLHDBC hdbc,
    SQLINTEGER fAttribute,
    SQLPOINTER rgbValue,
    SQLINTEGER cbValue) {

    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    conn->clear_diagnostics();

    if (fAttribute == SQL_ATTR_CURRENT_CATALOG) {
        conn->current_catalog_name_ = sql_to_string(static_cast<SQLCHAR*>(rgbValue), cbValue);
        return SQL_SUCCESS;
    }

    // SQL_ATTR_CONNECTION_DEAD is read-only and lands here too
    SQLUINTEGER* stored = stored_attribute(*conn, fAttribute);
    if (!stored) return unknown_attribute(*conn);

    *stored = static_cast<SQLUINTEGER>(reinterpret_cast<uintptr_t>(rgbValue));
    return SQL_SUCCESS;
}

} // extern "C"
