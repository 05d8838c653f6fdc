#include "query_description.hpp"

namespace querylens::describe {

std::string sql_type_name(SQLSMALLINT data_type) {
    switch (data_type) {
        case SQL_UNKNOWN_TYPE:      return "UNKNOWN";
        case SQL_CHAR:              return "CHAR";
        case SQL_VARCHAR:           return "VARCHAR";
        case SQL_LONGVARCHAR:       return "LONGVARCHAR";
        case SQL_WCHAR:             return "WCHAR";
        case SQL_WVARCHAR:          return "WVARCHAR";
        case SQL_WLONGVARCHAR:      return "WLONGVARCHAR";
        case SQL_DECIMAL:           return "DECIMAL";
        case SQL_NUMERIC:           return "NUMERIC";
        case SQL_SMALLINT:          return "SMALLINT";
        case SQL_INTEGER:           return "INTEGER";
        case SQL_REAL:              return "REAL";
        case SQL_FLOAT:             return "FLOAT";
        case SQL_DOUBLE:            return "DOUBLE";
        case SQL_BIT:               return "BIT";
        case SQL_TINYINT:           return "TINYINT";
        case SQL_BIGINT:            return "BIGINT";
        case SQL_BINARY:            return "BINARY";
        case SQL_VARBINARY:         return "VARBINARY";
        case SQL_LONGVARBINARY:     return "LONGVARBINARY";
        case SQL_TYPE_DATE:         return "TYPE_DATE";
        case SQL_TYPE_TIME:         return "TYPE_TIME";
        case SQL_TYPE_TIMESTAMP:    return "TYPE_TIMESTAMP";
        case SQL_GUID:              return "GUID";
        case SQL_INTERVAL_YEAR:
        case SQL_INTERVAL_MONTH:
        case SQL_INTERVAL_DAY:
        case SQL_INTERVAL_HOUR:
        case SQL_INTERVAL_MINUTE:
        case SQL_INTERVAL_SECOND:
        case SQL_INTERVAL_YEAR_TO_MONTH:
        case SQL_INTERVAL_DAY_TO_HOUR:
        case SQL_INTERVAL_DAY_TO_MINUTE:
        case SQL_INTERVAL_DAY_TO_SECOND:
        case SQL_INTERVAL_HOUR_TO_MINUTE:
        case SQL_INTERVAL_HOUR_TO_SECOND:
        case SQL_INTERVAL_MINUTE_TO_SECOND:
            return "INTERVAL";
        default:
            return "UNKNOWN(" + std::to_string(data_type) + ")";
    }
}

std::string display_type_name(const SqlType& type) {
    if (!type.type_name.empty()) {
        return type.type_name;
    }
    return sql_type_name(type.data_type);
}

Nullability nullability_from_odbc(SQLLEN code) {
    switch (code) {
        case SQL_NO_NULLS: return false;
        case SQL_NULLABLE: return true;
        default:           return std::nullopt;
    }
}

} // namespace querylens::describe
