#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace querylens::sources {

// One named query read from a .sql file
struct QuerySource {
    std::string name;                      // Identifier from "-- name:" or the file stem
    std::string sql;                       // Query text handed to the database
    std::vector<std::string> param_names;  // From "-- param:" lines, in order
    std::string file;
    int line = 1;                          // Line of the "-- name:" directive
    
    // "file:line" for diagnostics
    std::string location() const;
};

// Split the contents of one .sql file into queries. `default_name` names the
// query when the text carries no "-- name:" line. Throws
// core::ResolveError(SourceSyntax).
std::vector<QuerySource> parse_query_sources(std::string_view text,
                                             const std::string& file,
                                             const std::string& default_name);

std::vector<QuerySource> load_query_file(const std::filesystem::path& path);

// Files are read as given; directories are scanned recursively for *.sql in
// sorted order. Query names must be unique across everything loaded.
std::vector<QuerySource> load_query_sources(const std::vector<std::filesystem::path>& paths);

} // namespace querylens::sources
