#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace querylens::config {

enum class ResolveMode {
    Online,   // Prepare and describe against a live database
    Offline   // Read cached query data only
};

const char* resolve_mode_to_string(ResolveMode mode);

// Where and how queries are resolved
struct ResolverConfig {
    static constexpr const char* ENV_CONNECTION = "QUERYLENS_CONNECTION";
    static constexpr const char* ENV_OFFLINE = "QUERYLENS_OFFLINE";
    static constexpr const char* ENV_OFFLINE_DIR = "QUERYLENS_OFFLINE_DIR";
    static constexpr const char* DEFAULT_OFFLINE_DIR = ".querylens";
    
    std::string connection_string;     // ODBC connection string, empty if none
    std::optional<bool> offline;       // Forced mode; nullopt decides automatically
    std::filesystem::path offline_dir = DEFAULT_OFFLINE_DIR;
    bool save_to_cache = false;        // Online results are written to offline_dir
    
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
    
    // Read the QUERYLENS_* variables. Throws core::ResolveError(Configuration)
    // for an unrecognised QUERYLENS_OFFLINE value.
    static ResolverConfig from_environment(const EnvLookup& lookup);
    static ResolverConfig from_environment();
    
    // Mode decision; throws core::ResolveError(Configuration) when neither
    // a connection nor a cache is available, or online is forced without
    // a connection string
    ResolveMode effective_mode() const;
    
    // True when offline was requested rather than chosen automatically
    bool offline_forced() const { return offline.value_or(false); }
};

// "true"/"1"/"yes"/"on" and "false"/"0"/"no"/"off", case-insensitive
std::optional<bool> parse_bool_setting(const std::string& value);

} // namespace querylens::config
