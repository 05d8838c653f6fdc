#pragma once

#include "common.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "../mock/query_parser.hpp"
#include <cstdint>
#include <mutex>
#include <type_traits>

namespace mock_odbc {

class MockCatalog;

// Base class for all ODBC handles
class OdbcHandle {
public:
    explicit OdbcHandle(HandleType type);
    virtual ~OdbcHandle() = default;
    
    // Prevent copying
    OdbcHandle(const OdbcHandle&) = delete;
    OdbcHandle& operator=(const OdbcHandle&) = delete;
    
    // Handle validation
    bool is_valid() const { return magic_ == HANDLE_MAGIC; }
    HandleType type() const { return type_; }
    
    // Diagnostics
    void clear_diagnostics();
    void add_diagnostic(const std::string& sqlstate, SQLINTEGER native_error, 
                       const std::string& message);
    size_t diagnostic_count() const { return diagnostics_.size(); }
    const DiagnosticRecord* get_diagnostic(SQLSMALLINT rec_number) const;
    
    // Diagnostic header fields
    SQLRETURN return_code_ = SQL_SUCCESS;
    
    // Per-handle mutex for thread safety
    std::mutex& mutex() { return mutex_; }
    
protected:
    // Server name stamped on diagnostics
    virtual std::string server_name() const { return "MockDB"; }
    
    uint32_t magic_;
    HandleType type_;
    std::vector<DiagnosticRecord> diagnostics_;
    std::mutex mutex_;
};

// Environment Handle
class EnvironmentHandle : public OdbcHandle {
public:
    EnvironmentHandle();
    ~EnvironmentHandle() override;
    
    // Attributes; pooling belongs to the driver manager and is not kept here
    SQLINTEGER odbc_version_ = SQL_OV_ODBC3;
    
    // Allocated connections
    std::vector<ConnectionHandle*> connections_;
};

// Connection Handle
class ConnectionHandle : public OdbcHandle {
public:
    explicit ConnectionHandle(EnvironmentHandle* env);
    ~ConnectionHandle() override;
    
    EnvironmentHandle* environment() const { return env_; }
    bool is_connected() const { return connected_; }
    
    // Parse the connection string into config_ and pick the catalog preset
    void open(const std::string& connection_string);
    void close();
    
    const DriverConfig& config() const { return config_; }
    const MockCatalog& catalog() const;
    
    // Connection state
    bool connected_ = false;
    std::string connection_string_;
    
    // Integer attributes are stored, not acted on; read-only mode shows in SQLGetInfo
    SQLUINTEGER access_mode_ = SQL_MODE_READ_WRITE;
    SQLUINTEGER autocommit_ = SQL_AUTOCOMMIT_ON;
    SQLUINTEGER login_timeout_ = 0;
    SQLUINTEGER connection_timeout_ = 0;
    std::string current_catalog_name_;
    
    // Allocated statements
    std::vector<StatementHandle*> statements_;
    
protected:
    std::string server_name() const override { return config_.dbms_name; }
    
private:
    EnvironmentHandle* env_;
    DriverConfig config_;
    const MockCatalog* catalog_ = nullptr;
};

// Statement Handle
class StatementHandle : public OdbcHandle {
public:
    explicit StatementHandle(ConnectionHandle* conn);
    ~StatementHandle() override;
    
    ConnectionHandle* connection() const { return conn_; }
    const DriverConfig& config() const { return conn_->config(); }
    
    // Drop the prepared statement and any result set
    void reset();
    // Install a result set built by a catalog function
    void set_result(std::vector<ResultColumn> columns, std::vector<MockRow> rows);
    
    // Statement state
    bool prepared_ = false;
    bool executed_ = false;
    bool cursor_open_ = false;
    std::string sql_;
    StatementKind kind_ = StatementKind::Select;
    
    // Metadata from prepare or from a catalog function
    std::vector<ParameterInfo> parameters_;
    std::vector<ResultColumn> columns_;
    
    // Result rows and cursor
    std::vector<MockRow> rows_;
    SQLLEN current_row_ = -1;
    SQLLEN affected_rows_ = -1;
    
    // SQLGetData progress for piecewise reads of the current column
    SQLUSMALLINT getdata_column_ = 0;
    size_t getdata_offset_ = 0;
    
    // Attributes
    SQLULEN cursor_type_ = SQL_CURSOR_FORWARD_ONLY;
    SQLULEN concurrency_ = SQL_CONCUR_READ_ONLY;
    SQLULEN max_rows_ = 0;
    SQLULEN query_timeout_ = 0;
    SQLULEN row_array_size_ = 1;
    SQLULEN paramset_size_ = 1;
    SQLULEN noscan_ = SQL_NOSCAN_OFF;
    SQLULEN max_length_ = 0;
    
    // Implicit descriptors, handed out by SQLGetStmtAttr
    DescriptorHandle* app_param_desc_ = nullptr;
    DescriptorHandle* imp_param_desc_ = nullptr;
    DescriptorHandle* app_row_desc_ = nullptr;
    DescriptorHandle* imp_row_desc_ = nullptr;
    
protected:
    std::string server_name() const override { return conn_->config().dbms_name; }
    
private:
    ConnectionHandle* conn_;
};

// Descriptor Handle. The mock keeps no descriptor records; the handles
// exist because driver managers query them right after statement allocation.
class DescriptorHandle : public OdbcHandle {
public:
    DescriptorHandle(ConnectionHandle* conn, bool is_app_desc);
    ~DescriptorHandle() override;
    
    ConnectionHandle* connection() const { return conn_; }
    bool is_app_descriptor() const { return is_app_desc_; }
    
private:
    ConnectionHandle* conn_;
    bool is_app_desc_;
};

// RAII lock guard for any OdbcHandle
class HandleLock {
public:
    explicit HandleLock(OdbcHandle* h) : handle_(h) {
        if (handle_) handle_->mutex().lock();
    }
    ~HandleLock() {
        if (handle_) handle_->mutex().unlock();
    }
    HandleLock(const HandleLock&) = delete;
    HandleLock& operator=(const HandleLock&) = delete;
private:
    OdbcHandle* handle_;
};

// Handle validation helpers
template<typename T>
T* validate_handle(SQLHANDLE handle) {
    if (!handle) return nullptr;
    auto* h = static_cast<OdbcHandle*>(handle);
    if (!h->is_valid()) return nullptr;
    
    // Manual type checking instead of dynamic_cast to avoid DLL boundary issues
    HandleType expected_type;
    if (std::is_same<T, EnvironmentHandle>::value) {
        expected_type = HandleType::ENV;
    } else if (std::is_same<T, ConnectionHandle>::value) {
        expected_type = HandleType::DBC;
    } else if (std::is_same<T, StatementHandle>::value) {
        expected_type = HandleType::STMT;
    } else if (std::is_same<T, DescriptorHandle>::value) {
        expected_type = HandleType::DESC;
    } else {
        return nullptr;
    }
    
    if (h->type() != expected_type) return nullptr;
    return static_cast<T*>(h);
}

EnvironmentHandle* validate_env_handle(SQLHENV handle);
ConnectionHandle* validate_dbc_handle(SQLHDBC handle);
StatementHandle* validate_stmt_handle(SQLHSTMT handle);
DescriptorHandle* validate_desc_handle(SQLHDESC handle);

// Record the configured failure on handle when config says function fails
bool inject_failure(OdbcHandle& handle, const DriverConfig& config, const std::string& function);

// Validate any handle by its ODBC handle type
OdbcHandle* validate_any_handle(SQLSMALLINT handle_type, SQLHANDLE handle);

} // namespace mock_odbc
