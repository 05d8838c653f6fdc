#include "resolve_error.hpp"

namespace querylens::core {

const char* resolve_error_kind_to_string(ResolveErrorKind kind) {
    switch (kind) {
        case ResolveErrorKind::Configuration:      return "configuration";
        case ResolveErrorKind::OfflineDataMissing: return "offline-data-missing";
        case ResolveErrorKind::CacheCorrupt:       return "cache-corrupt";
        case ResolveErrorKind::CacheIo:            return "cache-io";
        case ResolveErrorKind::UnsupportedType:    return "unsupported-type";
        case ResolveErrorKind::ParameterCount:     return "parameter-count";
        case ResolveErrorKind::InvalidOverride:    return "invalid-override";
        case ResolveErrorKind::SourceSyntax:       return "source-syntax";
        case ResolveErrorKind::DriverCrash:        return "driver-crash";
    }
    return "unknown";
}

} // namespace querylens::core
