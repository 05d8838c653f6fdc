#include "column_override.hpp"
#include "core/resolve_error.hpp"
#include "utils/identifiers.hpp"

namespace querylens::resolver {

namespace {

[[noreturn]] void invalid(std::string_view raw, const std::string& why) {
    throw core::ResolveError(core::ResolveErrorKind::InvalidOverride,
        "invalid column override \"" + std::string(raw) + "\": " + why);
}

} // anonymous namespace

ColumnOverride parse_column_override(std::string_view raw) {
    ColumnOverride ov;
    
    std::string_view head = raw;
    auto colon = raw.find(':');
    if (colon != std::string_view::npos) {
        head = raw.substr(0, colon);
        std::string type = utils::trim(raw.substr(colon + 1));
        if (type.empty()) {
            invalid(raw, "missing type after ':'");
        }
        // "_" only asks for inference, it is not a type
        if (type != "_") {
            ov.host_type = std::move(type);
        }
    }
    
    std::string name = utils::trim(head);
    
    bool force_not_null = false;
    bool force_nullable = false;
    while (!name.empty() && (name.back() == '!' || name.back() == '?')) {
        if (name.back() == '!') {
            force_not_null = true;
        } else {
            force_nullable = true;
        }
        name.pop_back();
    }
    
    if (force_not_null && force_nullable) {
        invalid(raw, "cannot be both '!' and '?'");
    }
    if (force_not_null) {
        ov.nullable = false;
    } else if (force_nullable) {
        ov.nullable = true;
    }
    
    ov.name = utils::trim(name);
    if (ov.name.empty()) {
        invalid(raw, "empty column name");
    }
    
    return ov;
}

std::string field_name_for(const ColumnOverride& ov) {
    return utils::sanitize_identifier(ov.name);
}

} // namespace querylens::resolver
