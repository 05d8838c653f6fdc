#pragma once

#include "resolver/query_resolver.hpp"
#include <string>
#include <vector>

namespace querylens::codegen {

struct HeaderOptions {
    std::string namespace_name = "queries";  // May be nested ("app::db")
};

// Render one self-contained C++ header with a Params struct, a Row struct
// and the SQL text for each query, in the order given.
// Throws core::ResolveError(Configuration) for an unusable namespace and
// ResolveError(SourceSyntax) when two query names map to the same type name.
std::string render_header(const std::vector<resolver::ResolvedQuery>& queries,
                          const HeaderOptions& options = {});

// C++ spelling of a member type, std::optional<> when nullable
std::string member_type(const std::string& host_type, bool nullable);

// The query text as a C++ string literal (raw when possible)
std::string sql_literal(const std::string& sql);

} // namespace querylens::codegen
