#pragma once

#include "config/resolver_config.hpp"
#include "resolver/query_resolver.hpp"
#include <chrono>
#include <string>

namespace querylens::reporting {

// Reporter interface
class Reporter {
public:
    virtual ~Reporter() = default;
    
    // Report the start of a run and how queries are resolved
    virtual void report_start(config::ResolveMode mode) = 0;
    
    // Report one successfully resolved query
    virtual void report_query(const resolver::ResolvedQuery& query) = 0;
    
    // Report a query that could not be resolved
    virtual void report_failure(const sources::QuerySource& source,
                                const std::string& message) = 0;
    
    // Report the final summary
    virtual void report_summary(size_t total, size_t ok, size_t failed,
                                std::chrono::microseconds total_duration) = 0;
    
    // Report the end of the run
    virtual void report_end() = 0;
};

// "NOT NULL", "NULL", or "NULL?" when the database could not say
std::string nullability_label(const describe::Nullability& nullable);

std::string format_duration(std::chrono::microseconds duration);

} // namespace querylens::reporting
