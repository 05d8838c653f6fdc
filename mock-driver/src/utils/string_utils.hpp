#pragma once

#include "../driver/common.hpp"
#include <string>

namespace mock_odbc {

// Copies src into an application buffer, NUL-terminated.
// Returns SQL_SUCCESS_WITH_INFO when the text did not fit; the caller queues 01004.
SQLRETURN copy_string_to_buffer(
    const std::string& src,
    SQLCHAR* target,
    SQLSMALLINT buffer_length,
    SQLSMALLINT* string_length);

// length may be SQL_NTS
std::string sql_to_string(const SQLCHAR* sql_str, SQLINTEGER length);

// ASCII case folding for identifiers and keywords
std::string to_upper(const std::string& s);
std::string to_lower(const std::string& s);

std::string trim(const std::string& s);

} // namespace mock_odbc
