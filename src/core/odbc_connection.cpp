#include "odbc_connection.hpp"
#include "logger.hpp"
#include <utility>
#include <vector>

namespace querylens::core {

namespace {

void release(SQLSMALLINT type, SQLHANDLE& handle) {
    if (handle != SQL_NULL_HANDLE) {
        SQLFreeHandle(type, handle);
        handle = SQL_NULL_HANDLE;
    }
}

} // anonymous namespace

// ---- OdbcEnvironment ----

OdbcEnvironment::OdbcEnvironment() {
    check_odbc_result(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_),
                      SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLAllocHandle(ENV)");

    SQLRETURN ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION,
                                  reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(SQL_OV_ODBC3)), 0);
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_ENV, handle_, "SQLSetEnvAttr(ODBC_VERSION)");
        release(SQL_HANDLE_ENV, handle_);
        throw error;
    }
}

OdbcEnvironment::~OdbcEnvironment() {
    release(SQL_HANDLE_ENV, handle_);
}

OdbcEnvironment::OdbcEnvironment(OdbcEnvironment&& other) noexcept
    : handle_(std::exchange(other.handle_, SQL_NULL_HENV)) {
}

OdbcEnvironment& OdbcEnvironment::operator=(OdbcEnvironment&& other) noexcept {
    if (this != &other) {
        release(SQL_HANDLE_ENV, handle_);
        handle_ = std::exchange(other.handle_, SQL_NULL_HENV);
    }
    return *this;
}

// ---- OdbcConnection ----

OdbcConnection::OdbcConnection(OdbcEnvironment& env)
    : env_(env) {
    check_odbc_result(SQLAllocHandle(SQL_HANDLE_DBC, env_.get_handle(), &handle_),
                      SQL_HANDLE_ENV, env_.get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    // No throwing here; a failed disconnect only leaks the server session
    if (connected_ && !SQL_SUCCEEDED(SQLDisconnect(handle_))) {
        LOG_WARN("SQLDisconnect failed during connection teardown");
    }
    release(SQL_HANDLE_DBC, handle_);
}

void OdbcConnection::connect(std::string_view connection_string) {
    if (connected_) {
        throw OdbcError("Already connected");
    }

    LOG_DEBUG("Connecting via SQLDriverConnect");

    // SQLDriverConnect wants a mutable, terminated buffer
    std::string input(connection_string);
    SQLCHAR completed[1024];
    SQLSMALLINT completed_length = 0;

    SQLRETURN ret = SQLDriverConnect(handle_, nullptr,
                                     reinterpret_cast<SQLCHAR*>(&input[0]),
                                     static_cast<SQLSMALLINT>(input.size()),
                                     completed, sizeof(completed), &completed_length,
                                     SQL_DRIVER_NOPROMPT);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    LOG_IF(ret == SQL_SUCCESS_WITH_INFO, "SQLDriverConnect returned SQL_SUCCESS_WITH_INFO");
    connected_ = true;

    // Only metadata is read; drivers that refuse the hint still work
    ret = SQLSetConnectAttr(handle_, SQL_ATTR_ACCESS_MODE,
                            reinterpret_cast<SQLPOINTER>(static_cast<uintptr_t>(SQL_MODE_READ_ONLY)), 0);
    LOG_IF(!SQL_SUCCEEDED(ret), "Driver refused SQL_MODE_READ_ONLY");
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }
    check_odbc_result(SQLDisconnect(handle_), SQL_HANDLE_DBC, handle_, "SQLDisconnect");
    connected_ = false;
}

std::optional<std::string> OdbcConnection::get_info_string(SQLUSMALLINT info_type) const {
    std::vector<SQLCHAR> buffer(256, 0);
    SQLSMALLINT length = 0;

    // A second pass covers values longer than the first buffer
    for (int attempt = 0; attempt < 2; ++attempt) {
        SQLRETURN ret = SQLGetInfo(handle_, info_type, buffer.data(),
                                   static_cast<SQLSMALLINT>(buffer.size()), &length);
        if (!SQL_SUCCEEDED(ret)) {
            return std::nullopt;
        }
        if (length < static_cast<SQLSMALLINT>(buffer.size())) {
            return std::string(reinterpret_cast<const char*>(buffer.data()),
                               static_cast<size_t>(length));
        }
        buffer.assign(static_cast<size_t>(length) + 1, 0);
    }
    return std::nullopt;
}

bool OdbcConnection::supports_function(SQLUSMALLINT function_id) const {
    SQLUSMALLINT exists = SQL_FALSE;
    return SQL_SUCCEEDED(SQLGetFunctions(handle_, function_id, &exists)) && exists == SQL_TRUE;
}

std::string OdbcConnection::dbms_name() const {
    auto name = get_info_string(SQL_DBMS_NAME);
    return name && !name->empty() ? *name : "unknown";
}

} // namespace querylens::core
