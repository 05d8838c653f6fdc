#pragma once

#include "odbc_error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace querylens::core {

// RAII wrapper for ODBC Environment handle (ODBC 3.x behaviour)
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();
    
    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;
    
    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;
    
    SQLHENV get_handle() const noexcept { return handle_; }
    
private:
    SQLHENV handle_ = SQL_NULL_HENV;
};

// RAII wrapper for ODBC Connection handle
class OdbcConnection {
public:
    explicit OdbcConnection(OdbcEnvironment& env);
    ~OdbcConnection();
    
    // Non-copyable, non-movable (due to reference member)
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;
    
    void connect(std::string_view connection_string);
    void disconnect();
    bool is_connected() const noexcept { return connected_; }
    
    // SQLGetInfo for string-valued info types; nullopt if the driver refuses
    std::optional<std::string> get_info_string(SQLUSMALLINT info_type) const;
    
    // SQLGetFunctions for a single function id; false if the driver refuses
    bool supports_function(SQLUSMALLINT function_id) const;
    
    // DBMS product name (SQL_DBMS_NAME), "unknown" if not reported
    std::string dbms_name() const;
    
    SQLHDBC get_handle() const noexcept { return handle_; }
    OdbcEnvironment& get_environment() const noexcept { return env_; }
    
private:
    SQLHDBC handle_ = SQL_NULL_HDBC;
    OdbcEnvironment& env_;
    bool connected_ = false;
};

} // namespace querylens::core
