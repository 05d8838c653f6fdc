#pragma once

#include "query_resolver.hpp"
#include "sources/query_source.hpp"
#include <string>
#include <vector>

namespace querylens::resolver {

enum class CacheEntryState {
    Prepared,   // Described and written
    Current,    // Cached entry matches a fresh describe
    Missing,    // No entry for the query
    Stale,      // Entry differs from a fresh describe, or cannot be read
    Unused,     // Entry no query refers to
    Failed      // The query itself could not be described
};

const char* cache_entry_state_to_string(CacheEntryState state);

struct CacheEntryStatus {
    CacheEntryState state = CacheEntryState::Current;
    std::string query;      // Query name; empty for Unused entries
    std::string location;   // "file:line" of the query; empty for Unused entries
    std::string entry;      // Cache file name ("query-<hash>.json")
    std::string detail;     // Failure or corruption message
};

struct CacheSyncResult {
    std::vector<CacheEntryStatus> entries;  // Queries in input order, then unused entries
    size_t failed = 0;
    size_t outdated = 0;     // Missing + Stale + Unused
    bool pruned = false;
    size_t removed = 0;
    
    // 0 when every query resolved and nothing is outdated, 1 otherwise
    int exit_code() const { return (failed > 0 || outdated > 0) ? 1 : 0; }
};

// Describe every query, write its cache entry, then remove entries no query
// uses. Nothing is removed when any query failed. The resolver must be
// online and saving to the cache.
CacheSyncResult prepare_cache(QueryResolver& resolver,
                              const std::vector<sources::QuerySource>& sources);

// Describe every query without writing and compare with what is cached.
// The resolver must be online and not saving to the cache.
CacheSyncResult check_cache(QueryResolver& resolver,
                            const std::vector<sources::QuerySource>& sources);

} // namespace querylens::resolver
