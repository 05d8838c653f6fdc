// Info API - SQLGetInfo, SQLGetFunctions

#include "driver/handles.hpp"
#include "driver/diagnostics.hpp"
#include "utils/string_utils.hpp"
#include <cstring>
#include <optional>
#include <string>
#include <variant>

using namespace mock_odbc;

namespace {

// Every ODBC 3 function this library exports
const SQLUSMALLINT exported_functions[] = {
    SQL_API_SQLALLOCHANDLE,
    SQL_API_SQLCANCEL,
    SQL_API_SQLCLOSECURSOR,
    SQL_API_SQLCOLATTRIBUTE,
    SQL_API_SQLCOLUMNS,
    SQL_API_SQLCONNECT,
    SQL_API_SQLDESCRIBECOL,
    SQL_API_SQLDESCRIBEPARAM,
    SQL_API_SQLDISCONNECT,
    SQL_API_SQLDRIVERCONNECT,
    SQL_API_SQLEXECDIRECT,
    SQL_API_SQLEXECUTE,
    SQL_API_SQLFETCH,
    SQL_API_SQLFREEHANDLE,
    SQL_API_SQLFREESTMT,
    SQL_API_SQLGETCONNECTATTR,
    SQL_API_SQLGETDATA,
    SQL_API_SQLGETDIAGFIELD,
    SQL_API_SQLGETDIAGREC,
    SQL_API_SQLGETENVATTR,
    SQL_API_SQLGETFUNCTIONS,
    SQL_API_SQLGETINFO,
    SQL_API_SQLGETSTMTATTR,
    SQL_API_SQLMORERESULTS,
    SQL_API_SQLNUMPARAMS,
    SQL_API_SQLNUMRESULTCOLS,
    SQL_API_SQLPREPARE,
    SQL_API_SQLROWCOUNT,
    SQL_API_SQLSETCONNECTATTR,
    SQL_API_SQLSETENVATTR,
    SQL_API_SQLSETSTMTATTR,
    SQL_API_SQLTABLES,
};

bool function_available(const DriverConfig& config, SQLUSMALLINT function) {
    if (function == SQL_API_SQLDESCRIBEPARAM && !config.describe_param_supported) {
        return false;
    }
    for (SQLUSMALLINT exported : exported_functions) {
        if (exported == function) return true;
    }
    return false;
}

using InfoValue = std::variant<std::string, SQLUSMALLINT, SQLUINTEGER>;

// Info types a describe-only client asks about; anything else is HY096
std::optional<InfoValue> info_value(const ConnectionHandle& conn, SQLUSMALLINT info_type) {
    const DriverConfig& config = conn.config();
    switch (info_type) {
        case SQL_DRIVER_NAME:            return InfoValue(config.driver_name);
        case SQL_DRIVER_VER:             return InfoValue(config.driver_version);
        case SQL_DRIVER_ODBC_VER:        return InfoValue(config.driver_odbc_version);
        case SQL_DBMS_NAME:              return InfoValue(config.dbms_name);
        case SQL_DBMS_VER:               return InfoValue(config.dbms_version);
        case SQL_DATABASE_NAME:          return InfoValue(std::string("MockDatabase"));
        case SQL_IDENTIFIER_QUOTE_CHAR:  return InfoValue(std::string("\""));
        case SQL_CATALOG_NAME:           return InfoValue(std::string("N"));
        case SQL_DESCRIBE_PARAMETER:
            return InfoValue(std::string(config.describe_param_supported ? "Y" : "N"));
        case SQL_DATA_SOURCE_READ_ONLY:
            return InfoValue(std::string(conn.access_mode_ == SQL_MODE_READ_ONLY ? "Y" : "N"));
        case SQL_IDENTIFIER_CASE:        return InfoValue(SQLUSMALLINT{SQL_IC_UPPER});
        case SQL_MAX_COLUMN_NAME_LEN:
        case SQL_MAX_TABLE_NAME_LEN:     return InfoValue(SQLUSMALLINT{128});
        case SQL_TXN_CAPABLE:            return InfoValue(SQLUSMALLINT{SQL_TC_NONE});
        case SQL_CURSOR_COMMIT_BEHAVIOR:
        case SQL_CURSOR_ROLLBACK_BEHAVIOR:
            return InfoValue(SQLUSMALLINT{SQL_CB_CLOSE});
        case SQL_GETDATA_EXTENSIONS:
            return InfoValue(SQLUINTEGER{SQL_GD_ANY_COLUMN | SQL_GD_ANY_ORDER});
        case SQL_SCROLL_OPTIONS:         return InfoValue(SQLUINTEGER{SQL_SO_FORWARD_ONLY});
        default:                         return std::nullopt;
    }
}

struct InfoWriter {
    SQLPOINTER target;
    SQLSMALLINT buffer_length;
    SQLSMALLINT* length;

    SQLRETURN operator()(const std::string& text) const {
        return copy_string_to_buffer(text, static_cast<SQLCHAR*>(target), buffer_length, length);
    }

    template <typename T>
    SQLRETURN operator()(T number) const {
        if (target) *static_cast<T*>(target) = number;
        if (length) *length = static_cast<SQLSMALLINT>(sizeof(T));
        return SQL_SUCCESS;
    }
};

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLGetInfo(
    SQLHDBC hdbc,
    SQLUSMALLINT fInfoType,
    SQLPOINTER rgbInfoValue,
    SQLSMALLINT cbInfoValueMax,
    SQLSMALLINT* pcbInfoValue) {

    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    conn->clear_diagnostics();

    if (inject_failure(*conn, conn->config(), "SQLGetInfo")) {
        return SQL_ERROR;
    }

    auto value = info_value(*conn, fInfoType);
    if (!value) {
        conn->add_diagnostic(sqlstate::INVALID_INFO_TYPE, 0, "Information type out of range");
        return SQL_ERROR;
    }

    SQLRETURN ret = std::visit(InfoWriter{rgbInfoValue, cbInfoValueMax, pcbInfoValue}, *value);
    if (ret == SQL_SUCCESS_WITH_INFO) {
        conn->add_diagnostic(sqlstate::STRING_TRUNCATED, 0, "String data, right truncated");
    }
    return ret;
}

SQLRETURN SQL_API SQLGetFunctions(
    SQLHDBC hdbc,
    SQLUSMALLINT fFunction,
    SQLUSMALLINT* pfExists) {
    
    auto* conn = validate_dbc_handle(hdbc);
    if (!conn) return SQL_INVALID_HANDLE;
    HandleLock lock(conn);
    
    conn->clear_diagnostics();
    
    if (!pfExists) {
        return SQL_SUCCESS;
    }
    
    const auto& config = conn->config();
    
    if (fFunction == SQL_API_ODBC3_ALL_FUNCTIONS) {
        // Bitmap of SQL_API_ODBC3_ALL_FUNCTIONS_SIZE words
        std::memset(pfExists, 0, SQL_API_ODBC3_ALL_FUNCTIONS_SIZE * sizeof(SQLUSMALLINT));
        for (SQLUSMALLINT func : exported_functions) {
            if (function_available(config, func) && func < SQL_API_ODBC3_ALL_FUNCTIONS_SIZE * 16) {
                pfExists[func >> 4] |= static_cast<SQLUSMALLINT>(1 << (func & 0xF));
            }
        }
    } else if (fFunction == SQL_API_ALL_FUNCTIONS) {
        // Legacy 100-element array
        std::memset(pfExists, SQL_FALSE, 100 * sizeof(SQLUSMALLINT));
        for (SQLUSMALLINT func : exported_functions) {
            if (function_available(config, func) && func < 100) {
                pfExists[func] = SQL_TRUE;
            }
        }
    } else {
        *pfExists = function_available(config, fFunction) ? SQL_TRUE : SQL_FALSE;
    }
    
    return SQL_SUCCESS;
}

} // extern "C"
