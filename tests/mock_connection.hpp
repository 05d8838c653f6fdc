// Mock ODBC Driver Connection Utilities
// Connection strings that load the mock driver by path, so no odbcinst.ini
// registration is needed

#pragma once

#include <cstdlib>
#include <optional>
#include <string>

#ifndef QUERYLENS_MOCK_DRIVER_PATH
#error "QUERYLENS_MOCK_DRIVER_PATH must name the mock driver module"
#endif

namespace querylens::test {

/**
 * Mock driver connection string with default configuration
 * Mode=Success, Catalog=Default
 */
inline std::string get_mock_connection(const std::string& options = "") {
    return std::string("Driver=") + QUERYLENS_MOCK_DRIVER_PATH + ";Mode=Success;Catalog=Default;" + options;
}

/**
 * Mock driver connection string where one function fails with error_code
 */
inline std::string get_mock_connection_with_failure(const char* fail_on, const char* error_code = "42000") {
    return std::string("Driver=") + QUERYLENS_MOCK_DRIVER_PATH + ";Mode=Partial;FailOn=" + fail_on +
           ";ErrorCode=" + error_code + ";Catalog=Default;";
}

/**
 * Mock driver connection string with empty catalog (no tables)
 */
inline std::string get_mock_connection_empty() {
    return std::string("Driver=") + QUERYLENS_MOCK_DRIVER_PATH + ";Mode=Success;Catalog=Empty;";
}

/**
 * Connection string of a real database from QUERYLENS_TEST_CONNECTION, if set
 */
inline std::optional<std::string> get_live_connection() {
    const char* value = std::getenv("QUERYLENS_TEST_CONNECTION");
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace querylens::test
