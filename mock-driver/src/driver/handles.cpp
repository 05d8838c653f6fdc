#include "handles.hpp"
#include "../mock/mock_catalog.hpp"
#include <algorithm>

namespace mock_odbc {

// OdbcHandle base class
OdbcHandle::OdbcHandle(HandleType type) 
    : magic_(HANDLE_MAGIC), type_(type) {
}

void OdbcHandle::clear_diagnostics() {
    diagnostics_.clear();
    return_code_ = SQL_SUCCESS;
}

void OdbcHandle::add_diagnostic(const std::string& sqlstate, SQLINTEGER native_error,
                                 const std::string& message) {
    diagnostics_.push_back(make_diagnostic(sqlstate, native_error, message, server_name()));
    // Class 01 is a warning
    return_code_ = sqlstate.compare(0, 2, "01") == 0 ? SQL_SUCCESS_WITH_INFO : SQL_ERROR;
}

const DiagnosticRecord* OdbcHandle::get_diagnostic(SQLSMALLINT rec_number) const {
    if (rec_number < 1 || static_cast<size_t>(rec_number) > diagnostics_.size()) {
        return nullptr;
    }
    return &diagnostics_[rec_number - 1];
}

// EnvironmentHandle
EnvironmentHandle::EnvironmentHandle() : OdbcHandle(HandleType::ENV) {
}

EnvironmentHandle::~EnvironmentHandle() {
    // Connection destructors unregister themselves, so work on a copy
    auto connections = connections_;
    for (auto* conn : connections) {
        delete conn;
    }
    magic_ = 0;  // Invalidate handle
}

// ConnectionHandle
ConnectionHandle::ConnectionHandle(EnvironmentHandle* env) 
    : OdbcHandle(HandleType::DBC), env_(env) {
    if (env_) {
        env_->connections_.push_back(this);
    }
}

ConnectionHandle::~ConnectionHandle() {
    auto statements = statements_;
    for (auto* stmt : statements) {
        delete stmt;
    }
    
    if (env_) {
        auto it = std::find(env_->connections_.begin(), env_->connections_.end(), this);
        if (it != env_->connections_.end()) {
            env_->connections_.erase(it);
        }
    }
    magic_ = 0;
}

void ConnectionHandle::open(const std::string& connection_string) {
    connection_string_ = connection_string;
    config_ = parse_connection_string(connection_string);
    catalog_ = &MockCatalog::preset(config_.catalog);
    connected_ = true;
}

void ConnectionHandle::close() {
    connected_ = false;
    connection_string_.clear();
}

const MockCatalog& ConnectionHandle::catalog() const {
    return catalog_ ? *catalog_ : MockCatalog::preset("Default");
}

// StatementHandle
StatementHandle::StatementHandle(ConnectionHandle* conn) 
    : OdbcHandle(HandleType::STMT), conn_(conn) {
    if (conn_) {
        conn_->statements_.push_back(this);
    }
    // The Windows DM asks for the four implicit descriptor handles right
    // after SQLAllocHandle(SQL_HANDLE_STMT) and crashes on NULL.
    app_param_desc_ = new DescriptorHandle(conn_, true);
    imp_param_desc_ = new DescriptorHandle(conn_, false);
    app_row_desc_   = new DescriptorHandle(conn_, true);
    imp_row_desc_   = new DescriptorHandle(conn_, false);
}

StatementHandle::~StatementHandle() {
    delete app_param_desc_;
    delete imp_param_desc_;
    delete app_row_desc_;
    delete imp_row_desc_;
    
    if (conn_) {
        auto it = std::find(conn_->statements_.begin(), conn_->statements_.end(), this);
        if (it != conn_->statements_.end()) {
            conn_->statements_.erase(it);
        }
    }
    magic_ = 0;
}

void StatementHandle::reset() {
    prepared_ = false;
    executed_ = false;
    cursor_open_ = false;
    sql_.clear();
    kind_ = StatementKind::Select;
    parameters_.clear();
    columns_.clear();
    rows_.clear();
    current_row_ = -1;
    affected_rows_ = -1;
    getdata_column_ = 0;
    getdata_offset_ = 0;
}

void StatementHandle::set_result(std::vector<ResultColumn> columns, std::vector<MockRow> rows) {
    reset();
    columns_ = std::move(columns);
    rows_ = std::move(rows);
    executed_ = true;
    cursor_open_ = true;
}

// DescriptorHandle
DescriptorHandle::DescriptorHandle(ConnectionHandle* conn, bool is_app_desc)
    : OdbcHandle(HandleType::DESC), conn_(conn), is_app_desc_(is_app_desc) {
}

DescriptorHandle::~DescriptorHandle() {
    magic_ = 0;
}

// Handle validation helpers
EnvironmentHandle* validate_env_handle(SQLHENV handle) {
    return validate_handle<EnvironmentHandle>(handle);
}

ConnectionHandle* validate_dbc_handle(SQLHDBC handle) {
    return validate_handle<ConnectionHandle>(handle);
}

StatementHandle* validate_stmt_handle(SQLHSTMT handle) {
    return validate_handle<StatementHandle>(handle);
}

DescriptorHandle* validate_desc_handle(SQLHDESC handle) {
    return validate_handle<DescriptorHandle>(handle);
}

bool inject_failure(OdbcHandle& handle, const DriverConfig& config, const std::string& function) {
    if (!config.should_fail(function)) {
        return false;
    }
    handle.add_diagnostic(config.error_code, 0, "Simulated failure in " + function);
    return true;
}

OdbcHandle* validate_any_handle(SQLSMALLINT handle_type, SQLHANDLE handle) {
    switch (handle_type) {
        case SQL_HANDLE_ENV:
            return validate_env_handle(handle);
        case SQL_HANDLE_DBC:
            return validate_dbc_handle(handle);
        case SQL_HANDLE_STMT:
            return validate_stmt_handle(handle);
        case SQL_HANDLE_DESC:
            return validate_desc_handle(handle);
        default:
            return nullptr;
    }
}

} // namespace mock_odbc
