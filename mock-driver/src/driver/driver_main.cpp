// Mock ODBC Driver - module entry point, handle allocation and environment attributes

#include "driver/handles.hpp"
#include "driver/diagnostics.hpp"
#include <new>

#ifdef _WIN32
#include <windows.h>

BOOL WINAPI DllMain(HINSTANCE hinstDLL, DWORD fdwReason, LPVOID lpvReserved) {
    (void)lpvReserved;
    
    if (fdwReason == DLL_PROCESS_ATTACH) {
        DisableThreadLibraryCalls(hinstDLL);
    }
    return TRUE;
}
#endif

using namespace mock_odbc;

namespace {

SQLRETURN alloc_environment(SQLHANDLE input, SQLHANDLE* output) {
    if (input != SQL_NULL_HANDLE) {
        return SQL_ERROR;
    }
    auto* env = new (std::nothrow) EnvironmentHandle();
    if (!env) {
        return SQL_ERROR;
    }
    *output = static_cast<SQLHANDLE>(env);
    return SQL_SUCCESS;
}

SQLRETURN alloc_connection(SQLHANDLE input, SQLHANDLE* output) {
    auto* env = validate_env_handle(input);
    if (!env) {
        return SQL_INVALID_HANDLE;
    }
    HandleLock lock(env);
    env->clear_diagnostics();
    
    auto* conn = new (std::nothrow) ConnectionHandle(env);
    if (!conn) {
        env->add_diagnostic(sqlstate::GENERAL_ERROR, 0, "Memory allocation error");
        return SQL_ERROR;
    }
    *output = static_cast<SQLHANDLE>(conn);
    return SQL_SUCCESS;
}

// Statements only exist on an open connection: preparing needs its catalog
SQLRETURN alloc_statement(SQLHANDLE input, SQLHANDLE* output) {
    auto* conn = validate_dbc_handle(input);
    if (!conn) {
        return SQL_INVALID_HANDLE;
    }
    HandleLock lock(conn);
    conn->clear_diagnostics();
    
    if (!conn->is_connected()) {
        conn->add_diagnostic(sqlstate::CONNECTION_NOT_OPEN, 0, "Connection not open");
        return SQL_ERROR;
    }
    
    auto* stmt = new (std::nothrow) StatementHandle(conn);
    if (!stmt) {
        conn->add_diagnostic(sqlstate::GENERAL_ERROR, 0, "Memory allocation error");
        return SQL_ERROR;
    }
    *output = static_cast<SQLHANDLE>(stmt);
    return SQL_SUCCESS;
}

SQLRETURN alloc_descriptor(SQLHANDLE input, SQLHANDLE* output) {
    auto* conn = validate_dbc_handle(input);
    if (!conn) {
        return SQL_INVALID_HANDLE;
    }
    auto* desc = new (std::nothrow) DescriptorHandle(conn, true);
    if (!desc) {
        return SQL_ERROR;
    }
    *output = static_cast<SQLHANDLE>(desc);
    return SQL_SUCCESS;
}

bool valid_odbc_version(SQLINTEGER version) {
    return version == SQL_OV_ODBC2 || version == SQL_OV_ODBC3
#ifdef SQL_OV_ODBC3_80
        || version == SQL_OV_ODBC3_80
#endif
        ;
}

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLAllocHandle(
    SQLSMALLINT fHandleType,
    SQLHANDLE hInput,
    SQLHANDLE* phOutput) {
    
    if (!phOutput) {
        return SQL_ERROR;
    }
    *phOutput = SQL_NULL_HANDLE;
    
    switch (fHandleType) {
        case SQL_HANDLE_ENV:  return alloc_environment(hInput, phOutput);
        case SQL_HANDLE_DBC:  return alloc_connection(hInput, phOutput);
        case SQL_HANDLE_STMT: return alloc_statement(hInput, phOutput);
        case SQL_HANDLE_DESC: return alloc_descriptor(hInput, phOutput);
        default:              return SQL_ERROR;
    }
}

SQLRETURN SQL_API SQLFreeHandle(
    SQLSMALLINT fHandleType,
    SQLHANDLE hHandle) {
    
    switch (fHandleType) {
        case SQL_HANDLE_ENV: {
            auto* env = validate_env_handle(hHandle);
            if (!env) return SQL_INVALID_HANDLE;
            
            if (!env->connections_.empty()) {
                env->add_diagnostic(sqlstate::FUNCTION_SEQUENCE_ERROR, 0,
                                   "Connection handles still allocated");
                return SQL_ERROR;
            }
            delete env;
            return SQL_SUCCESS;
        }
        
        case SQL_HANDLE_DBC: {
            auto* conn = validate_dbc_handle(hHandle);
            if (!conn) return SQL_INVALID_HANDLE;
            
            if (conn->is_connected()) {
                conn->add_diagnostic(sqlstate::FUNCTION_SEQUENCE_ERROR, 0,
                                    "Connection still open");
                return SQL_ERROR;
            }
            delete conn;
            return SQL_SUCCESS;
        }
        
        case SQL_HANDLE_STMT: {
            auto* stmt = validate_stmt_handle(hHandle);
            if (!stmt) return SQL_INVALID_HANDLE;
            delete stmt;
            return SQL_SUCCESS;
        }
        
        case SQL_HANDLE_DESC: {
            auto* desc = validate_desc_handle(hHandle);
            if (!desc) return SQL_INVALID_HANDLE;
            
            // Implicit descriptors belong to their statement
            if (!desc->is_app_descriptor()) {
                desc->add_diagnostic(sqlstate::INVALID_HANDLE_TYPE_FOR_FREE, 0,
                                    "Invalid use of an automatically allocated descriptor handle");
                return SQL_ERROR;
            }
            delete desc;
            return SQL_SUCCESS;
        }
        
        default:
            return SQL_INVALID_HANDLE;
    }
}

SQLRETURN SQL_API SQLGetEnvAttr(
    SQLHENV henv,
    SQLINTEGER fAttribute,
    SQLPOINTER rgbValue,
    SQLINTEGER cbValueMax,
    SQLINTEGER* pcbValue) {
    
    (void)cbValueMax;
    
    auto* env = validate_env_handle(henv);
    if (!env) return SQL_INVALID_HANDLE;
    HandleLock lock(env);
    env->clear_diagnostics();
    
    SQLINTEGER value = 0;
    switch (fAttribute) {
        case SQL_ATTR_ODBC_VERSION:
            value = env->odbc_version_;
            break;
        case SQL_ATTR_OUTPUT_NTS:
            value = SQL_TRUE;
            break;
        default:
            env->add_diagnostic(sqlstate::INVALID_ATTRIBUTE_IDENTIFIER, 0,
                               "Invalid attribute identifier");
            return SQL_ERROR;
    }
    
    if (rgbValue) *static_cast<SQLINTEGER*>(rgbValue) = value;
    if (pcbValue) *pcbValue = sizeof(SQLINTEGER);
    return SQL_SUCCESS;
}

SQLRETURN SQL_API SQLSetEnvAttr(
    SQLHENV henv,
    SQLINTEGER fAttribute,
    SQLPOINTER rgbValue,
    SQLINTEGER cbValue) {
    
    (void)cbValue;
    
    auto* env = validate_env_handle(henv);
    if (!env) return SQL_INVALID_HANDLE;
    HandleLock lock(env);
    env->clear_diagnostics();
    
    SQLINTEGER value = static_cast<SQLINTEGER>(reinterpret_cast<intptr_t>(rgbValue));
    
    switch (fAttribute) {
        case SQL_ATTR_ODBC_VERSION:
            if (!valid_odbc_version(value)) {
                env->add_diagnostic(sqlstate::INVALID_ATTRIBUTE_VALUE, 0,
                                   "Invalid attribute value");
                return SQL_ERROR;
            }
            env->odbc_version_ = value;
            return SQL_SUCCESS;
            
        case SQL_ATTR_OUTPUT_NTS:
            if (value != SQL_TRUE) {
                env->add_diagnostic(sqlstate::OPTIONAL_FEATURE_NOT_IMPLEMENTED, 0,
                                   "Only null-terminated output strings are supported");
                return SQL_ERROR;
            }
            return SQL_SUCCESS;
            
        default:
            // Pooling and manager-private attributes are accepted and ignored
            return SQL_SUCCESS;
    }
}

// Legacy allocation functions, still called by some driver managers
SQLRETURN SQL_API SQLAllocEnv(SQLHENV* phenv) {
    return SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, phenv);
}

SQLRETURN SQL_API SQLAllocConnect(SQLHENV henv, SQLHDBC* phdbc) {
    return SQLAllocHandle(SQL_HANDLE_DBC, henv, phdbc);
}

SQLRETURN SQL_API SQLAllocStmt(SQLHDBC hdbc, SQLHSTMT* phstmt) {
    return SQLAllocHandle(SQL_HANDLE_STMT, hdbc, phstmt);
}

SQLRETURN SQL_API SQLFreeEnv(SQLHENV henv) {
    return SQLFreeHandle(SQL_HANDLE_ENV, henv);
}

SQLRETURN SQL_API SQLFreeConnect(SQLHDBC hdbc) {
    return SQLFreeHandle(SQL_HANDLE_DBC, hdbc);
}

} // extern "C"
