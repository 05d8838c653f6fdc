#pragma once

#include "query_description.hpp"
#include "core/odbc_connection.hpp"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace querylens::describe {

// Fills in unknown column nullability from the catalog (SQLColumns).
// Only columns that trace back to a base table column can be refined;
// computed columns stay unknown.
class NullabilityResolver {
public:
    explicit NullabilityResolver(core::OdbcConnection& conn);
    
    // Refine every column whose nullability is unknown
    void refine(std::vector<ColumnDescription>& columns);
    
    // Catalog nullability of one base column; memoised
    Nullability lookup(const std::string& catalog, const std::string& schema,
                       const std::string& table, const std::string& column);
    
    size_t catalog_queries() const { return catalog_queries_; }
    
private:
    using Key = std::tuple<std::string, std::string, std::string, std::string>;
    
    Nullability query_catalog(const std::string& catalog, const std::string& schema,
                              const std::string& table, const std::string& column);
    
    core::OdbcConnection& conn_;
    std::map<Key, Nullability> memo_;
    size_t catalog_queries_ = 0;
};

} // namespace querylens::describe
