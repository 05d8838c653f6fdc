#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace querylens::config {

using DotenvEntries = std::vector<std::pair<std::string, std::string>>;

// Parse dotenv text:
//   KEY=VALUE, optional "export " prefix, '#' comments and blank lines,
//   'single' (literal) or "double" (\n, \" and \\ escapes) quoted values,
//   trailing " # comment" on unquoted values.
// Throws core::ResolveError(Configuration) naming file:line on bad lines.
DotenvEntries parse_dotenv(std::string_view text, const std::string& file = ".env");

// Read and parse a dotenv file. A missing file yields no entries unless
// `required` is set, in which case it is a Configuration error.
DotenvEntries load_dotenv(const std::filesystem::path& path, bool required);

// Export entries into the process environment without overriding variables
// that are already set. Returns how many were applied.
size_t apply_dotenv(const DotenvEntries& entries);

} // namespace querylens::config
