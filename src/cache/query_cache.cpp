#include "query_cache.hpp"
#include "query_hash.hpp"
#include "core/resolve_error.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <system_error>

namespace querylens::cache {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view ENTRY_PREFIX = "query-";
constexpr std::string_view ENTRY_SUFFIX = ".json";

// "query-<hash>.json" -> "<hash>", or empty if not an entry name
std::string hash_from_filename(const std::string& filename) {
    if (filename.size() <= ENTRY_PREFIX.size() + ENTRY_SUFFIX.size()) {
        return "";
    }
    if (filename.compare(0, ENTRY_PREFIX.size(), ENTRY_PREFIX) != 0) {
        return "";
    }
    if (filename.compare(filename.size() - ENTRY_SUFFIX.size(), ENTRY_SUFFIX.size(), ENTRY_SUFFIX) != 0) {
        return "";
    }
    return filename.substr(ENTRY_PREFIX.size(),
                           filename.size() - ENTRY_PREFIX.size() - ENTRY_SUFFIX.size());
}

[[noreturn]] void corrupt(const fs::path& path, const std::string& why) {
    throw core::ResolveError(core::ResolveErrorKind::CacheCorrupt,
        "cached query data " + path.string() + " is unusable: " + why +
        "; run `querylens prepare` to regenerate it");
}

[[noreturn]] void io_failure(const fs::path& path, const std::string& why) {
    throw core::ResolveError(core::ResolveErrorKind::CacheIo,
        "cannot write " + path.string() + ": " + why);
}

} // anonymous namespace

QueryCache::QueryCache(fs::path dir)
    : dir_(std::move(dir)) {
}

bool QueryCache::exists() const {
    std::error_code ec;
    return fs::is_directory(dir_, ec);
}

fs::path QueryCache::path_for(const std::string& hash) const {
    return dir_ / (std::string(ENTRY_PREFIX) + hash + std::string(ENTRY_SUFFIX));
}

std::optional<QueryData> QueryCache::load(std::string_view sql) const {
    std::string hash = query_hash(sql);
    fs::path path = path_for(hash);
    
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_DEBUG("No cache entry " + path.string());
        return std::nullopt;
    }
    
    std::ifstream in(path);
    if (!in) {
        corrupt(path, "cannot open file");
    }
    
    QueryData data;
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        data = j.get<QueryData>();
    } catch (const nlohmann::json::exception& e) {
        corrupt(path, e.what());
    }
    
    if (data.hash != hash) {
        corrupt(path, "stored hash " + data.hash + " does not match file name");
    }
    if (data.query != sql) {
        corrupt(path, "stored query text differs from the query being resolved");
    }
    
    LOG_DEBUG("Loaded cache entry " + path.string());
    return data;
}

void QueryCache::save(const QueryData& data) const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        io_failure(dir_, ec.message());
    }
    
    fs::path target = path_for(data.hash);
    fs::path temp = target;
    temp += ".tmp";
    
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            io_failure(temp, "cannot open for writing");
        }
        out << nlohmann::json(data).dump(2) << "\n";
        out.flush();
        if (!out) {
            io_failure(temp, "write failed");
        }
    }
    
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        io_failure(target, "rename failed");
    }
    
    LOG_DEBUG("Wrote cache entry " + target.string());
}

std::set<std::string> QueryCache::list_hashes() const {
    std::set<std::string> hashes;
    if (!exists()) {
        return hashes;
    }
    
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string hash = hash_from_filename(entry.path().filename().string());
        if (!hash.empty()) {
            hashes.insert(std::move(hash));
        }
    }
    if (ec) {
        LOG_WARN("Listing " + dir_.string() + " failed: " + ec.message());
    }
    
    return hashes;
}

size_t QueryCache::prune(const std::set<std::string>& keep) const {
    size_t removed = 0;
    
    for (const auto& hash : list_hashes()) {
        if (keep.count(hash) > 0) {
            continue;
        }
        
        std::error_code ec;
        fs::path path = path_for(hash);
        if (fs::remove(path, ec)) {
            LOG_DEBUG("Pruned stale cache entry " + path.string());
            ++removed;
        } else if (ec) {
            io_failure(path, "remove failed: " + ec.message());
        }
    }
    
    return removed;
}

} // namespace querylens::cache
