#pragma once

#include "type_mapping.hpp"
#include "cache/query_cache.hpp"
#include "cache/query_data.hpp"
#include "config/resolver_config.hpp"
#include "core/odbc_connection.hpp"
#include "describe/query_describer.hpp"
#include "sources/query_source.hpp"
#include <memory>
#include <string>
#include <vector>

namespace querylens::resolver {

// Everything known about one query after resolution
struct ResolvedQuery {
    sources::QuerySource source;
    cache::QueryData data;
    std::vector<ResolvedParameter> parameters;
    std::vector<ResolvedColumn> columns;
};

// Resolves queries online (prepare + describe through ODBC) or offline
// (from the query cache), depending on the configuration.
class QueryResolver {
public:
    // Decides the mode up front; throws core::ResolveError(Configuration)
    explicit QueryResolver(config::ResolverConfig config);
    ~QueryResolver();
    
    QueryResolver(const QueryResolver&) = delete;
    QueryResolver& operator=(const QueryResolver&) = delete;
    
    // Query data plus overrides, type mapping and parameter checks
    ResolvedQuery resolve(const sources::QuerySource& source);
    
    // Query data only, from whichever side the mode selects
    cache::QueryData fetch(const sources::QuerySource& source);
    
    // Open the connection now rather than on the first online query.
    // Throws core::OdbcError when the database is unreachable.
    void connect();
    
    config::ResolveMode mode() const { return mode_; }
    const config::ResolverConfig& config() const { return config_; }
    const cache::QueryCache& cache() const { return cache_; }
    
    // DBMS name of the live connection (empty until connected)
    const std::string& db_name() const { return db_name_; }
    
    // Overrides, type mapping and checks applied to already obtained data
    static ResolvedQuery build(const sources::QuerySource& source, cache::QueryData data);
    
private:
    cache::QueryData describe_online(const sources::QuerySource& source);
    cache::QueryData load_offline(const sources::QuerySource& source) const;
    
    config::ResolverConfig config_;
    config::ResolveMode mode_;
    cache::QueryCache cache_;
    
    std::unique_ptr<core::OdbcEnvironment> env_;
    std::unique_ptr<core::OdbcConnection> conn_;
    std::unique_ptr<describe::QueryDescriber> describer_;
    std::string db_name_;
};

} // namespace querylens::resolver
