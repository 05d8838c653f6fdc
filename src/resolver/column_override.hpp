#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace querylens::resolver {

// Annotation carried in a result column alias:
//   name        nothing
//   name!       force NOT NULL
//   name?       force nullable
//   name: Type  force host type (name!: Type / name?: Type combine both)
//   name: _     keep the inferred host type
struct ColumnOverride {
    std::string name;                      // Alias with annotations stripped
    std::optional<bool> nullable;          // Forced nullability
    std::optional<std::string> host_type;  // Forced host type
    
    bool empty() const { return !nullable && !host_type; }
};

// Throws core::ResolveError(InvalidOverride) on malformed annotations
ColumnOverride parse_column_override(std::string_view raw);

// The alias as a C++ member name
std::string field_name_for(const ColumnOverride& ov);

} // namespace querylens::resolver
