#pragma once

#include "column_override.hpp"
#include "describe/query_description.hpp"
#include <optional>
#include <string>

namespace querylens::resolver {

// A result column ready for code generation
struct ResolvedColumn {
    int ordinal = 0;
    std::string field_name;          // C++ member name
    std::string sql_name;            // Name as described (annotations included)
    std::string host_type;           // C++ type, without std::optional
    bool nullable = true;            // Effective nullability
    describe::Nullability described_nullable;
    bool nullable_overridden = false;
    bool type_overridden = false;
    describe::SqlType sql_type;
};

// A parameter ready for code generation
struct ResolvedParameter {
    int ordinal = 0;
    std::string field_name;
    std::string host_type;
    bool nullable = true;
    describe::SqlType sql_type;
};

// Maps ODBC SQL types to C++ host types. DBMS-specific type names refine
// the mapping where the ODBC type code alone is too coarse.
class TypeMapper {
public:
    explicit TypeMapper(std::string dbms_name = "");
    
    // Host type for a described type; nullopt when there is none
    std::optional<std::string> host_type_for(const describe::SqlType& type) const;
    
    // Throws core::ResolveError(UnsupportedType) when the type has no
    // mapping and the override does not supply one
    ResolvedColumn map_column(const describe::ColumnDescription& column,
                              const ColumnOverride& ov) const;
    
    ResolvedParameter map_parameter(const describe::ParameterDescription& param,
                                    const std::string& field_name) const;
    
    const std::string& dbms_name() const { return dbms_name_; }
    
private:
    std::optional<std::string> dbms_specific(const std::string& type_name) const;
    
    std::string dbms_name_;
};

} // namespace querylens::resolver
