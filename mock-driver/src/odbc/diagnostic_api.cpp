// Diagnostic API - SQLGetDiagRec, SQLGetDiagField

#include "driver/handles.hpp"
#include "driver/diagnostics.hpp"
#include "utils/string_utils.hpp"
#include <cstring>

using namespace mock_odbc;

namespace {

template <typename T>
SQLRETURN write_fixed(T value, SQLPOINTER target, SQLSMALLINT* length) {
    if (target) *static_cast<T*>(target) = value;
    if (length) *length = static_cast<SQLSMALLINT>(sizeof(T));
    return SQL_SUCCESS;
}

SQLRETURN write_text(const std::string& value, SQLPOINTER target,
                     SQLSMALLINT buffer_length, SQLSMALLINT* length) {
    return copy_string_to_buffer(value, static_cast<SQLCHAR*>(target), buffer_length, length);
}

// Record 0 is the diagnostic header
SQLRETURN header_field(SQLSMALLINT handle_type, OdbcHandle* handle, SQLSMALLINT field,
                       SQLPOINTER target, SQLSMALLINT* length) {
    switch (field) {
        case SQL_DIAG_NUMBER:
            return write_fixed(static_cast<SQLINTEGER>(handle->diagnostic_count()), target, length);
        case SQL_DIAG_RETURNCODE:
            return write_fixed(handle->return_code_, target, length);
        case SQL_DIAG_ROW_COUNT:
            if (handle_type != SQL_HANDLE_STMT) return SQL_ERROR;
            return write_fixed(static_cast<StatementHandle*>(handle)->affected_rows_, target, length);
        default:
            return SQL_ERROR;
    }
}

SQLRETURN record_field(const DiagnosticRecord& rec, SQLSMALLINT field, SQLPOINTER target,
                       SQLSMALLINT buffer_length, SQLSMALLINT* length) {
    switch (field) {
        case SQL_DIAG_SQLSTATE:
            return write_text(rec.sqlstate, target, buffer_length, length);
        case SQL_DIAG_NATIVE:
            return write_fixed(rec.native_error, target, length);
        case SQL_DIAG_MESSAGE_TEXT:
            return write_text(rec.message, target, buffer_length, length);
        case SQL_DIAG_CLASS_ORIGIN:
            return write_text(rec.class_origin, target, buffer_length, length);
        case SQL_DIAG_SUBCLASS_ORIGIN:
            return write_text(rec.subclass_origin, target, buffer_length, length);
        case SQL_DIAG_SERVER_NAME:
            return write_text(rec.server_name, target, buffer_length, length);
        case SQL_DIAG_CONNECTION_NAME:
            return write_text("", target, buffer_length, length);
        case SQL_DIAG_COLUMN_NUMBER:
            return write_fixed(static_cast<SQLINTEGER>(SQL_NO_COLUMN_NUMBER), target, length);
        case SQL_DIAG_ROW_NUMBER:
            return write_fixed(static_cast<SQLLEN>(SQL_NO_ROW_NUMBER), target, length);
        default:
            return SQL_ERROR;
    }
}

} // anonymous namespace

extern "C" {

SQLRETURN SQL_API SQLGetDiagRec(
    SQLSMALLINT fHandleType,
    SQLHANDLE hHandle,
    SQLSMALLINT iRecord,
    SQLCHAR* szSqlState,
    SQLINTEGER* pfNativeError,
    SQLCHAR* szErrorMsg,
    SQLSMALLINT cbErrorMsgMax,
    SQLSMALLINT* pcbErrorMsg) {

    OdbcHandle* handle = validate_any_handle(fHandleType, hHandle);
    if (!handle) return SQL_INVALID_HANDLE;
    if (iRecord < 1 || cbErrorMsgMax < 0) return SQL_ERROR;

    const DiagnosticRecord* rec = handle->get_diagnostic(iRecord);
    if (!rec) return SQL_NO_DATA;

    if (szSqlState) {
        std::memcpy(szSqlState, rec->sqlstate.c_str(), 5);
        szSqlState[5] = '\0';
    }
    if (pfNativeError) *pfNativeError = rec->native_error;

    return copy_string_to_buffer(rec->message, szErrorMsg, cbErrorMsgMax, pcbErrorMsg);
}

SQLRETURN SQL_API SQLGetDiagField(
    SQLSMALLINT fHandleType,
    SQLHANDLE hHandle,
    SQLSMALLINT iRecord,
    SQLSMALLINT fDiagField,
    SQLPOINTER rgbDiagInfo,
    SQLSMALLINT cbDiagInfoMax,
    SQLSMALLINT* pcbDiagInfo) {

    OdbcHandle* handle = validate_any_handle(fHandleType, hHandle);
    if (!handle) return SQL_INVALID_HANDLE;

    if (iRecord == 0) {
        return header_field(fHandleType, handle, fDiagField, rgbDiagInfo, pcbDiagInfo);
    }

    const DiagnosticRecord* rec = handle->get_diagnostic(iRecord);
    if (!rec) return SQL_NO_DATA;

    return record_field(*rec, fDiagField, rgbDiagInfo, cbDiagInfoMax, pcbDiagInfo);
}

} // extern "C"
