#pragma once

#include "common.hpp"
#include <string>
#include <vector>

namespace mock_odbc {

// One queued diagnostic; message already carries the "[Mock][server]" prefix
struct DiagnosticRecord {
    std::string sqlstate;
    SQLINTEGER native_error = 0;
    std::string message;
    std::string class_origin;
    std::string subclass_origin;
    std::string server_name;
};

// SQLSTATE codes the mock driver raises
namespace sqlstate {
    constexpr const char* STRING_TRUNCATED = "01004";
    constexpr const char* INVALID_CURSOR_STATE = "24000";
    constexpr const char* SYNTAX_ERROR = "42000";
    constexpr const char* TABLE_NOT_FOUND = "42S02";
    constexpr const char* COLUMN_NOT_FOUND = "42S22";
    constexpr const char* CONNECTION_NOT_OPEN = "08003";
    constexpr const char* CONNECTION_IN_USE = "08002";
    constexpr const char* INVALID_ATTRIBUTE_IDENTIFIER = "HY092";
    constexpr const char* INVALID_ATTRIBUTE_VALUE = "HY024";
    constexpr const char* INVALID_HANDLE_TYPE_FOR_FREE = "HY017";
    constexpr const char* INVALID_INFO_TYPE = "HY096";
    constexpr const char* INVALID_COLUMN_NUMBER = "07009";
    constexpr const char* INVALID_FIELD_IDENTIFIER = "HY091";
    constexpr const char* INDICATOR_REQUIRED = "22002";
    constexpr const char* FUNCTION_SEQUENCE_ERROR = "HY010";
    constexpr const char* OPTIONAL_FEATURE_NOT_IMPLEMENTED = "HYC00";
    constexpr const char* GENERAL_ERROR = "HY000";
    constexpr const char* RESTRICTED_DATA_TYPE = "07006";
    constexpr const char* INSERT_VALUE_LIST_MISMATCH = "21S01";
}

// Builds a record, deriving class and subclass origin from the SQLSTATE class
DiagnosticRecord make_diagnostic(const std::string& sqlstate, 
                                  SQLINTEGER native_error,
                                  const std::string& message,
                                  const std::string& server_name);

} // namespace mock_odbc
