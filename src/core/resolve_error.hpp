#pragma once

#include <stdexcept>
#include <string>

namespace querylens::core {

// What went wrong while resolving query metadata (non-ODBC failures)
enum class ResolveErrorKind {
    Configuration,       // Missing or contradictory settings
    OfflineDataMissing,  // Offline mode and no cache entry for the query
    CacheCorrupt,        // Cache entry unreadable or inconsistent
    CacheIo,             // Cache directory/file could not be written
    UnsupportedType,     // No host type for a described SQL type
    ParameterCount,      // Named parameters disagree with the database
    InvalidOverride,     // Malformed column alias annotation
    SourceSyntax,        // Malformed .sql query source
    DriverCrash          // Driver crashed while describing
};

const char* resolve_error_kind_to_string(ResolveErrorKind kind);

class ResolveError : public std::runtime_error {
public:
    ResolveError(ResolveErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    
    ResolveErrorKind kind() const noexcept { return kind_; }
    
private:
    ResolveErrorKind kind_;
};

} // namespace querylens::core
