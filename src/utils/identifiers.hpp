#pragma once

#include <string>
#include <string_view>

namespace querylens::utils {

// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(std::string_view text);

// Reserved words of C++17 (plus alternative operator spellings)
bool is_cpp_keyword(std::string_view text);

// Turn an arbitrary column or query name into a usable C++ identifier:
// other characters become '_', a leading digit gets a '_' prefix and
// keywords get a trailing '_'. Returns empty for empty input.
std::string sanitize_identifier(std::string_view text);

// "get_user_by_id" -> "GetUserById"
std::string to_pascal_case(std::string_view text);

// Whitespace trimming shared by the parsers
std::string trim(std::string_view text);

std::string to_lower(std::string_view text);

} // namespace querylens::utils
