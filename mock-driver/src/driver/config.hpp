#pragma once

#include "common.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace mock_odbc {

// Driver behavior mode
enum class BehaviorMode {
    Success,    // All operations succeed
    Failure,    // Every injectable operation fails
    Partial     // Only the functions named in FailOn fail
};

// How result column nullability is reported by SQLDescribeCol
enum class NullableReporting {
    Exact,      // SQL_NO_NULLS / SQL_NULLABLE from the catalog
    Unknown     // Always SQL_NULLABLE_UNKNOWN, like drivers that cannot tell
};

// Configuration from connection string. Each connection owns its own copy.
struct DriverConfig {
    BehaviorMode mode = BehaviorMode::Success;
    
    // Catalog preset: Default or Empty
    std::string catalog = "Default";
    
    // Functions to fail on (Partial mode)
    std::vector<std::string> fail_on;
    
    // SQLSTATE to return on injected failure
    std::string error_code = "42000";
    
    NullableReporting nullable_reporting = NullableReporting::Exact;
    
    // DescribeParam=Unsupported hides SQLDescribeParam from SQLGetFunctions
    // and makes it return HYC00
    bool describe_param_supported = true;
    
    // Reported by SQLGetInfo
    std::string driver_name = "Mock ODBC Driver";
    std::string driver_version = "01.00.0000";
    std::string driver_odbc_version = "03.80";
    std::string dbms_name = "MockDB";
    std::string dbms_version = "01.00.0000";
    
    // Check if a function should fail
    bool should_fail(const std::string& function_name) const;
};

// Parse connection string into configuration
DriverConfig parse_connection_string(const std::string& conn_str);

// Parse key=value pairs from connection string (keys lowercased)
std::unordered_map<std::string, std::string> parse_connection_string_pairs(
    const std::string& conn_str);

// Get a string value from parsed pairs (case-insensitive)
std::string get_string_value(const std::unordered_map<std::string, std::string>& pairs,
                              const std::string& key, 
                              const std::string& default_value = "");

} // namespace mock_odbc
