#include "cache_check.hpp"
#include "cache/query_hash.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "core/resolve_error.hpp"
#include <optional>
#include <set>

namespace querylens::resolver {

namespace {

void require_online(const QueryResolver& resolver, bool saving, const char* operation) {
    if (resolver.mode() != config::ResolveMode::Online) {
        throw core::ResolveError(core::ResolveErrorKind::Configuration,
            std::string(operation) + " needs a database connection");
    }
    if (resolver.config().save_to_cache != saving) {
        throw core::ResolveError(core::ResolveErrorKind::Configuration,
            std::string(operation) + (saving ? " must" : " must not") + " write to the query cache");
    }
}

CacheEntryStatus status_for(const QueryResolver& resolver, const sources::QuerySource& source,
                            CacheEntryState state) {
    CacheEntryStatus status;
    status.state = state;
    status.query = source.name;
    status.location = source.location();
    status.entry = resolver.cache().path_for(cache::query_hash(source.sql)).filename().string();
    return status;
}

// Resolve one query, recording a Failed status instead of throwing
std::optional<ResolvedQuery> try_resolve(QueryResolver& resolver,
                                         const sources::QuerySource& source,
                                         CacheSyncResult& result) {
    try {
        return resolver.resolve(source);
    } catch (const core::ResolveError& e) {
        LOG_ERROR(source.name + ": " + e.what());
        auto status = status_for(resolver, source, CacheEntryState::Failed);
        status.detail = e.what();
        result.entries.push_back(std::move(status));
    } catch (const core::OdbcError& e) {
        LOG_ERROR(source.name + ": " + e.format_diagnostics());
        auto status = status_for(resolver, source, CacheEntryState::Failed);
        status.detail = e.summary();
        result.entries.push_back(std::move(status));
    }
    ++result.failed;
    return std::nullopt;
}

} // anonymous namespace

const char* cache_entry_state_to_string(CacheEntryState state) {
    switch (state) {
        case CacheEntryState::Prepared: return "prepared";
        case CacheEntryState::Current: return "ok";
        case CacheEntryState::Missing: return "missing";
        case CacheEntryState::Stale: return "stale";
        case CacheEntryState::Unused: return "unused";
        case CacheEntryState::Failed: return "error";
        default: return "unknown";
    }
}

CacheSyncResult prepare_cache(QueryResolver& resolver,
                              const std::vector<sources::QuerySource>& sources) {
    require_online(resolver, true, "prepare");
    
    CacheSyncResult result;
    std::set<std::string> keep;
    
    for (const auto& source : sources) {
        auto resolved = try_resolve(resolver, source, result);
        if (!resolved) {
            continue;
        }
        keep.insert(resolved->data.hash);
        result.entries.push_back(status_for(resolver, source, CacheEntryState::Prepared));
    }
    
    if (result.failed > 0) {
        LOG_WARN(std::to_string(result.failed) + " queries failed; cache not pruned");
        return result;
    }
    
    result.removed = resolver.cache().prune(keep);
    result.pruned = true;
    LOG_INFO("Query cache " + resolver.cache().dir().string() + ": " +
             std::to_string(keep.size()) + " entries, " + std::to_string(result.removed) +
             " removed");
    return result;
}

CacheSyncResult check_cache(QueryResolver& resolver,
                            const std::vector<sources::QuerySource>& sources) {
    require_online(resolver, false, "check");
    
    const auto& cache = resolver.cache();
    CacheSyncResult result;
    std::set<std::string> keep;
    
    for (const auto& source : sources) {
        // A failed query still owns its entry
        keep.insert(cache::query_hash(source.sql));
        
        auto resolved = try_resolve(resolver, source, result);
        if (!resolved) {
            continue;
        }
        
        std::optional<cache::QueryData> cached;
        std::string detail;
        try {
            cached = cache.load(source.sql);
        } catch (const core::ResolveError& e) {
            detail = e.what();
        }
        
        CacheEntryState state;
        if (!detail.empty()) {
            state = CacheEntryState::Stale;
        } else if (!cached) {
            state = CacheEntryState::Missing;
        } else if (*cached != resolved->data) {
            state = CacheEntryState::Stale;
        } else {
            state = CacheEntryState::Current;
        }
        
        auto status = status_for(resolver, source, state);
        status.detail = detail;
        if (state != CacheEntryState::Current) {
            LOG_DEBUG(source.name + ": cache entry " + status.entry + " is " +
                      cache_entry_state_to_string(state));
            ++result.outdated;
        }
        result.entries.push_back(std::move(status));
    }
    
    for (const auto& hash : cache.list_hashes()) {
        if (keep.count(hash) == 0) {
            CacheEntryStatus status;
            status.state = CacheEntryState::Unused;
            status.entry = cache.path_for(hash).filename().string();
            result.entries.push_back(std::move(status));
            ++result.outdated;
        }
    }
    
    return result;
}

} // namespace querylens::resolver
