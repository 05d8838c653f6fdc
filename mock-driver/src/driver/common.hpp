#pragma once

// ODBC headers and shared types for the mock driver

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// ANSI entry points only; the driver manager maps the W calls onto them
#ifdef UNICODE
#undef UNICODE
#endif
#ifdef _UNICODE
#undef _UNICODE
#endif

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

#include <cstdint>
#include <string>
#include <vector>
#include <variant>

namespace mock_odbc {

// Forward declarations
class EnvironmentHandle;
class ConnectionHandle;
class StatementHandle;
class DescriptorHandle;

// Handle types
enum class HandleType {
    ENV = SQL_HANDLE_ENV,
    DBC = SQL_HANDLE_DBC,
    STMT = SQL_HANDLE_STMT,
    DESC = SQL_HANDLE_DESC
};

// Magic number to validate handles
constexpr uint32_t HANDLE_MAGIC = 0x4D4F434B;  // "MOCK"

// One value of a catalog result set row
using CellValue = std::variant<std::monostate, long long, std::string>;
using MockRow = std::vector<CellValue>;

} // namespace mock_odbc
