#pragma once

#include "core/odbc_error.hpp"
#include <optional>
#include <string>
#include <vector>

namespace querylens::describe {

// true = nullable, false = NOT NULL, nullopt = the database could not say
using Nullability = std::optional<bool>;

// SQL type as reported by the driver
struct SqlType {
    SQLSMALLINT data_type = SQL_UNKNOWN_TYPE;  // ODBC SQL type code
    std::string type_name;                     // SQL_DESC_TYPE_NAME (DBMS spelling)
    SQLULEN column_size = 0;
    SQLSMALLINT decimal_digits = 0;
    bool is_unsigned = false;
    
    bool known() const { return data_type != SQL_UNKNOWN_TYPE; }
    
    bool operator==(const SqlType& other) const {
        return data_type == other.data_type && type_name == other.type_name &&
               column_size == other.column_size &&
               decimal_digits == other.decimal_digits &&
               is_unsigned == other.is_unsigned;
    }
    bool operator!=(const SqlType& other) const { return !(*this == other); }
};

struct ParameterDescription {
    int ordinal = 0;                  // 1-based
    SqlType type;
    Nullability nullable;
    
    bool operator==(const ParameterDescription& other) const {
        return ordinal == other.ordinal && type == other.type && nullable == other.nullable;
    }
};

struct ColumnDescription {
    int ordinal = 0;                  // 1-based
    std::string name;                 // As reported, annotations included
    SqlType type;
    Nullability nullable;
    std::string base_table;           // Empty for computed columns
    std::string base_column;
    std::string schema;
    std::string catalog;
    
    bool operator==(const ColumnDescription& other) const {
        return ordinal == other.ordinal && name == other.name && type == other.type &&
               nullable == other.nullable && base_table == other.base_table &&
               base_column == other.base_column && schema == other.schema &&
               catalog == other.catalog;
    }
};

// Everything the database told us about one prepared query
struct QueryDescription {
    std::vector<ParameterDescription> parameters;
    bool parameter_types_known = true;  // false: only the count is reliable
    std::vector<ColumnDescription> columns;
    
    bool operator==(const QueryDescription& other) const {
        return parameters == other.parameters &&
               parameter_types_known == other.parameter_types_known &&
               columns == other.columns;
    }
    bool operator!=(const QueryDescription& other) const { return !(*this == other); }
};

// Printable name for an ODBC SQL type code ("INTEGER", "TYPE_DATE", ...)
std::string sql_type_name(SQLSMALLINT data_type);

// The DBMS spelling when known, otherwise the ODBC name
std::string display_type_name(const SqlType& type);

// ODBC nullable code (SQL_NO_NULLS etc.) to Nullability
Nullability nullability_from_odbc(SQLLEN code);

} // namespace querylens::describe
