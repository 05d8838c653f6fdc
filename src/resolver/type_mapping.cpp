#include "type_mapping.hpp"
#include "core/resolve_error.hpp"
#include "utils/identifiers.hpp"
#include <map>

namespace querylens::resolver {

namespace {

// Type names (lower case) whose ODBC type code is misleading or missing
const std::map<std::string, std::map<std::string, std::string>>& dbms_type_names() {
    static const std::map<std::string, std::map<std::string, std::string>> table = {
        {"postgresql", {
            {"uuid", "SQLGUID"},
            {"json", "std::string"},
            {"jsonb", "std::string"},
            {"bool", "bool"},
            {"bytea", "std::vector<std::uint8_t>"},
            {"text", "std::string"},
            {"int2", "std::int16_t"},
            {"int4", "std::int32_t"},
            {"int8", "std::int64_t"},
        }},
        {"mysql", {
            {"json", "std::string"},
            {"tinyint unsigned", "std::uint8_t"},
            {"year", "std::int16_t"},
        }},
        {"mariadb", {
            {"json", "std::string"},
            {"year", "std::int16_t"},
        }},
        {"microsoft sql server", {
            {"uniqueidentifier", "SQLGUID"},
            {"datetimeoffset", "std::string"},
            {"xml", "std::string"},
        }},
        {"db2", {
            {"xml", "std::string"},
            {"decfloat", "std::string"},
        }},
    };
    return table;
}

// DB2 reports names such as "DB2/LINUXX8664"
std::string normalize_dbms(const std::string& dbms_name) {
    std::string lower = utils::to_lower(dbms_name);
    if (lower.rfind("db2", 0) == 0) {
        return "db2";
    }
    return lower;
}

} // anonymous namespace

TypeMapper::TypeMapper(std::string dbms_name)
    : dbms_name_(std::move(dbms_name)) {
}

std::optional<std::string> TypeMapper::dbms_specific(const std::string& type_name) const {
    if (type_name.empty()) {
        return std::nullopt;
    }
    
    const auto& table = dbms_type_names();
    auto dbms = table.find(normalize_dbms(dbms_name_));
    if (dbms == table.end()) {
        return std::nullopt;
    }
    
    auto it = dbms->second.find(utils::to_lower(type_name));
    if (it == dbms->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> TypeMapper::host_type_for(const describe::SqlType& type) const {
    if (auto specific = dbms_specific(type.type_name)) {
        return specific;
    }
    
    switch (type.data_type) {
        case SQL_BIT:
            return std::string("bool");
        case SQL_TINYINT:
            return std::string(type.is_unsigned ? "std::uint8_t" : "std::int8_t");
        case SQL_SMALLINT:
            return std::string(type.is_unsigned ? "std::uint16_t" : "std::int16_t");
        case SQL_INTEGER:
            return std::string(type.is_unsigned ? "std::uint32_t" : "std::int32_t");
        case SQL_BIGINT:
            return std::string(type.is_unsigned ? "std::uint64_t" : "std::int64_t");
        case SQL_REAL:
            return std::string("float");
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return std::string("double");
        // Exact numerics keep their text form; no lossless built-in type exists
        case SQL_DECIMAL:
        case SQL_NUMERIC:
        case SQL_CHAR:
        case SQL_VARCHAR:
        case SQL_LONGVARCHAR:
        case SQL_WCHAR:
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR:
            return std::string("std::string");
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            return std::string("std::vector<std::uint8_t>");
        case SQL_TYPE_DATE:
            return std::string("SQL_DATE_STRUCT");
        case SQL_TYPE_TIME:
            return std::string("SQL_TIME_STRUCT");
        case SQL_TYPE_TIMESTAMP:
            return std::string("SQL_TIMESTAMP_STRUCT");
        case SQL_GUID:
            return std::string("SQLGUID");
        default:
            return std::nullopt;
    }
}

ResolvedColumn TypeMapper::map_column(const describe::ColumnDescription& column,
                                      const ColumnOverride& ov) const {
    ResolvedColumn resolved;
    resolved.ordinal = column.ordinal;
    resolved.field_name = field_name_for(ov);
    resolved.sql_name = column.name;
    resolved.sql_type = column.type;
    resolved.described_nullable = column.nullable;
    
    if (ov.host_type) {
        resolved.host_type = *ov.host_type;
        resolved.type_overridden = true;
    } else if (auto host = host_type_for(column.type)) {
        resolved.host_type = *host;
    } else {
        throw core::ResolveError(core::ResolveErrorKind::UnsupportedType,
            "unsupported type " + describe::display_type_name(column.type) +
            " of column #" + std::to_string(column.ordinal) + " (\"" + ov.name + "\")");
    }
    
    if (ov.nullable) {
        resolved.nullable = *ov.nullable;
        resolved.nullable_overridden = true;
    } else {
        // Unknown is treated as nullable
        resolved.nullable = column.nullable.value_or(true);
    }
    
    return resolved;
}

ResolvedParameter TypeMapper::map_parameter(const describe::ParameterDescription& param,
                                            const std::string& field_name) const {
    ResolvedParameter resolved;
    resolved.ordinal = param.ordinal;
    resolved.field_name = field_name;
    resolved.sql_type = param.type;
    resolved.nullable = param.nullable.value_or(true);
    
    if (!param.type.known()) {
        // Bound as text; the database converts
        resolved.host_type = "std::string";
        return resolved;
    }
    
    auto host = host_type_for(param.type);
    if (!host) {
        throw core::ResolveError(core::ResolveErrorKind::UnsupportedType,
            "unsupported type " + describe::display_type_name(param.type) +
            " for param #" + std::to_string(param.ordinal));
    }
    resolved.host_type = *host;
    return resolved;
}

} // namespace querylens::resolver
