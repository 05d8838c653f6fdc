#include "query_describer.hpp"
#include "core/odbc_error.hpp"
#include "core/logger.hpp"
#include <vector>

namespace querylens::describe {

namespace {

// SQLSTATEs meaning "the driver cannot describe parameters"
bool is_not_supported(const core::OdbcError& e) {
    return e.has_sqlstate("HYC00") || e.has_sqlstate("IM001");
}

} // anonymous namespace

QueryDescriber::QueryDescriber(core::OdbcConnection& conn)
    : conn_(conn), nullability_(conn) {
}

QueryDescription QueryDescriber::describe(std::string_view sql) {
    QueryDescription desc;
    
    core::OdbcStatement stmt(conn_);
    stmt.prepare(sql);
    
    describe_parameters(stmt, desc);
    
    SQLSMALLINT column_count = stmt.num_result_cols();
    LOG_DEBUG("Prepared query has " + std::to_string(desc.parameters.size()) +
              " parameter(s) and " + std::to_string(column_count) + " column(s)");
    
    for (SQLSMALLINT i = 1; i <= column_count; ++i) {
        desc.columns.push_back(describe_column(stmt, static_cast<SQLUSMALLINT>(i)));
    }
    
    // Catalog lookups need their own statement; free the prepared one's cursor first
    stmt.close_cursor();
    
    if (catalog_refinement_) {
        nullability_.refine(desc.columns);
    }
    
    return desc;
}

void QueryDescriber::describe_parameters(core::OdbcStatement& stmt, QueryDescription& desc) {
    SQLSMALLINT param_count = stmt.num_params();
    
    for (SQLSMALLINT i = 1; i <= param_count; ++i) {
        ParameterDescription param;
        param.ordinal = i;
        desc.parameters.push_back(param);
    }
    
    if (param_count == 0) {
        return;
    }
    
    if (describe_param_support_ < 0) {
        describe_param_support_ = conn_.supports_function(SQL_API_SQLDESCRIBEPARAM) ? 1 : 0;
        LOG_IF(describe_param_support_ == 0, "Driver does not implement SQLDescribeParam");
    }
    
    if (describe_param_support_ == 0) {
        desc.parameter_types_known = false;
        return;
    }
    
    for (auto& param : desc.parameters) {
        SQLSMALLINT data_type = SQL_UNKNOWN_TYPE;
        SQLULEN size = 0;
        SQLSMALLINT digits = 0;
        SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;
        
        SQLRETURN ret = SQLDescribeParam(stmt.get_handle(), static_cast<SQLUSMALLINT>(param.ordinal),
                                         &data_type, &size, &digits, &nullable);
        try {
            core::check_odbc_result(ret, SQL_HANDLE_STMT, stmt.get_handle(), "SQLDescribeParam");
        } catch (const core::OdbcError& e) {
            if (!is_not_supported(e)) {
                throw;
            }
            LOG_DEBUG("SQLDescribeParam not supported for this statement: " + e.primary_message());
            for (auto& p : desc.parameters) {
                p.type = SqlType{};
                p.nullable = std::nullopt;
            }
            desc.parameter_types_known = false;
            return;
        }
        
        param.type.data_type = data_type;
        param.type.column_size = size;
        param.type.decimal_digits = digits;
        param.nullable = nullability_from_odbc(nullable);
    }
}

ColumnDescription QueryDescriber::describe_column(core::OdbcStatement& stmt, SQLUSMALLINT ordinal) {
    ColumnDescription col;
    col.ordinal = ordinal;
    
    std::vector<SQLCHAR> name(256, 0);
    SQLSMALLINT name_length = 0;
    SQLSMALLINT data_type = SQL_UNKNOWN_TYPE;
    SQLULEN size = 0;
    SQLSMALLINT digits = 0;
    SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;
    
    SQLRETURN ret = SQLDescribeCol(stmt.get_handle(), ordinal,
                                   name.data(), static_cast<SQLSMALLINT>(name.size()), &name_length,
                                   &data_type, &size, &digits, &nullable);
    core::check_odbc_result(ret, SQL_HANDLE_STMT, stmt.get_handle(), "SQLDescribeCol");
    
    // Long aliases carry annotations; do not silently cut them
    if (name_length >= static_cast<SQLSMALLINT>(name.size())) {
        name.assign(static_cast<size_t>(name_length) + 1, 0);
        ret = SQLDescribeCol(stmt.get_handle(), ordinal,
                             name.data(), static_cast<SQLSMALLINT>(name.size()), &name_length,
                             &data_type, &size, &digits, &nullable);
        core::check_odbc_result(ret, SQL_HANDLE_STMT, stmt.get_handle(), "SQLDescribeCol");
    }
    
    col.name.assign(reinterpret_cast<char*>(name.data()), static_cast<size_t>(name_length));
    col.type.data_type = data_type;
    col.type.column_size = size;
    col.type.decimal_digits = digits;
    col.nullable = nullability_from_odbc(nullable);
    
    col.type.type_name = string_attribute(stmt, ordinal, SQL_DESC_TYPE_NAME);
    if (auto is_unsigned = numeric_attribute(stmt, ordinal, SQL_DESC_UNSIGNED)) {
        col.type.is_unsigned = (*is_unsigned == SQL_TRUE);
    }
    col.base_table = string_attribute(stmt, ordinal, SQL_DESC_BASE_TABLE_NAME);
    col.base_column = string_attribute(stmt, ordinal, SQL_DESC_BASE_COLUMN_NAME);
    col.schema = string_attribute(stmt, ordinal, SQL_DESC_SCHEMA_NAME);
    col.catalog = string_attribute(stmt, ordinal, SQL_DESC_CATALOG_NAME);
    
    LOG_TRACE("Column #" + std::to_string(ordinal) + " " + col.name + " " +
              display_type_name(col.type) + " nullable=" +
              (col.nullable ? (*col.nullable ? "yes" : "no") : "unknown"));
    
    return col;
}

std::string QueryDescriber::string_attribute(core::OdbcStatement& stmt, SQLUSMALLINT ordinal,
                                             SQLUSMALLINT field) {
    std::vector<SQLCHAR> buffer(256, 0);
    SQLSMALLINT length = 0;
    
    SQLRETURN ret = SQLColAttribute(stmt.get_handle(), ordinal, field,
                                    buffer.data(), static_cast<SQLSMALLINT>(buffer.size()),
                                    &length, nullptr);
    if (!SQL_SUCCEEDED(ret)) {
        LOG_TRACE("SQLColAttribute(" + std::to_string(field) + ") not available for column #" +
                  std::to_string(ordinal));
        return "";
    }
    
    return std::string(reinterpret_cast<char*>(buffer.data()));
}

std::optional<SQLLEN> QueryDescriber::numeric_attribute(core::OdbcStatement& stmt, SQLUSMALLINT ordinal,
                                                        SQLUSMALLINT field) {
    SQLLEN value = 0;
    SQLRETURN ret = SQLColAttribute(stmt.get_handle(), ordinal, field,
                                    nullptr, 0, nullptr, &value);
    if (!SQL_SUCCEEDED(ret)) {
        return std::nullopt;
    }
    return value;
}

} // namespace querylens::describe
