#pragma once

#include "odbc_connection.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace querylens::core {

// RAII wrapper for ODBC Statement handle
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();
    
    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;
    
    // Prepare without executing; the driver validates the text
    void prepare(std::string_view sql);
    void execute(std::string_view sql);
    
    SQLSMALLINT num_params();
    SQLSMALLINT num_result_cols();
    
    bool fetch();
    void close_cursor();
    
    // SQLGetData helpers for catalog result sets; nullopt for SQL NULL
    std::optional<std::string> get_string(SQLUSMALLINT column);
    std::optional<SQLSMALLINT> get_smallint(SQLUSMALLINT column);
    
    SQLHSTMT get_handle() const noexcept { return handle_; }
    OdbcConnection& get_connection() const noexcept { return conn_; }
    
private:
    void recycle() noexcept;
    
    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
};

} // namespace querylens::core
