#include "resolver_config.hpp"
#include "core/resolve_error.hpp"
#include "core/logger.hpp"
#include "utils/identifiers.hpp"
#include <cstdlib>
#include <system_error>

namespace querylens::config {

const char* resolve_mode_to_string(ResolveMode mode) {
    switch (mode) {
        case ResolveMode::Online: return "online";
        case ResolveMode::Offline: return "offline";
        default: return "unknown";
    }
}

std::optional<bool> parse_bool_setting(const std::string& value) {
    std::string lower = utils::to_lower(utils::trim(value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

ResolverConfig ResolverConfig::from_environment(const EnvLookup& lookup) {
    ResolverConfig config;
    
    if (auto conn = lookup(ENV_CONNECTION); conn && !conn->empty()) {
        config.connection_string = *conn;
    }
    
    if (auto offline = lookup(ENV_OFFLINE); offline && !offline->empty()) {
        config.offline = parse_bool_setting(*offline);
        if (!config.offline) {
            throw core::ResolveError(core::ResolveErrorKind::Configuration,
                std::string(ENV_OFFLINE) + " must be true or false, got '" + *offline + "'");
        }
    }
    
    if (auto dir = lookup(ENV_OFFLINE_DIR); dir && !dir->empty()) {
        config.offline_dir = *dir;
    }
    
    return config;
}

ResolverConfig ResolverConfig::from_environment() {
    return from_environment([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

ResolveMode ResolverConfig::effective_mode() const {
    if (offline.has_value()) {
        if (*offline) {
            LOG_DEBUG("Offline mode forced");
            return ResolveMode::Offline;
        }
        if (connection_string.empty()) {
            throw core::ResolveError(core::ResolveErrorKind::Configuration,
                "online mode requested but " + std::string(ENV_CONNECTION) + " is not set");
        }
        LOG_DEBUG("Online mode forced");
        return ResolveMode::Online;
    }
    
    if (!connection_string.empty()) {
        LOG_DEBUG("Connection string present, resolving online");
        return ResolveMode::Online;
    }
    
    std::error_code ec;
    bool have_cache = std::filesystem::is_directory(offline_dir, ec);
    LOG_IF(have_cache, "No connection string, using query cache " + offline_dir.string(),
           "No connection string and no query cache at " + offline_dir.string());
    if (have_cache) {
        return ResolveMode::Offline;
    }
    
    throw core::ResolveError(core::ResolveErrorKind::Configuration,
        "set " + std::string(ENV_CONNECTION) +
        " to resolve queries online, or run `querylens prepare` to update the query cache");
}

} // namespace querylens::config
