#pragma once

#include "query_data.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace querylens::cache {

// Directory of query-<hash>.json files
class QueryCache {
public:
    explicit QueryCache(std::filesystem::path dir);
    
    const std::filesystem::path& dir() const { return dir_; }
    bool exists() const;
    
    std::filesystem::path path_for(const std::string& hash) const;
    
    // nullopt if there is no entry; throws ResolveError(CacheCorrupt) if the
    // entry cannot be trusted
    std::optional<QueryData> load(std::string_view sql) const;
    
    // Atomic: write a temporary file then rename over the entry
    void save(const QueryData& data) const;
    
    // Hashes of all entries currently on disk
    std::set<std::string> list_hashes() const;
    
    // Remove entries not in `keep`; returns how many were removed
    size_t prune(const std::set<std::string>& keep) const;
    
private:
    std::filesystem::path dir_;
};

} // namespace querylens::cache
