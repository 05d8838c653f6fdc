#pragma once

#include "query_description.hpp"
#include "nullability_resolver.hpp"
#include "core/odbc_connection.hpp"
#include "core/odbc_statement.hpp"
#include <string>
#include <string_view>

namespace querylens::describe {

// Prepares a query and reads its parameter and result-column metadata.
// The statement is never executed.
class QueryDescriber {
public:
    explicit QueryDescriber(core::OdbcConnection& conn);
    
    // Throws core::OdbcError if the driver rejects the query
    QueryDescription describe(std::string_view sql);
    
    // Skip the SQLColumns pass (leave unknown nullability unknown)
    void set_catalog_refinement(bool enabled) { catalog_refinement_ = enabled; }
    
private:
    void describe_parameters(core::OdbcStatement& stmt, QueryDescription& desc);
    ColumnDescription describe_column(core::OdbcStatement& stmt, SQLUSMALLINT ordinal);
    
    std::string string_attribute(core::OdbcStatement& stmt, SQLUSMALLINT ordinal,
                                 SQLUSMALLINT field);
    std::optional<SQLLEN> numeric_attribute(core::OdbcStatement& stmt, SQLUSMALLINT ordinal,
                                            SQLUSMALLINT field);
    
    core::OdbcConnection& conn_;
    NullabilityResolver nullability_;
    bool catalog_refinement_ = true;
    int describe_param_support_ = -1;  // -1 not asked yet, 0 no, 1 yes
};

} // namespace querylens::describe
