#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace mock_odbc {

namespace {

const char* const WHITESPACE = " \t\r\n";

template <typename Fn>
std::string map_chars(std::string s, Fn fn) {
    for (auto& c : s) {
        c = static_cast<char>(fn(static_cast<unsigned char>(c)));
    }
    return s;
}

} // anonymous namespace

SQLRETURN copy_string_to_buffer(
    const std::string& src,
    SQLCHAR* target,
    SQLSMALLINT buffer_length,
    SQLSMALLINT* string_length) {

    // Full length is reported even when the copy is cut short
    const auto full = static_cast<SQLSMALLINT>(src.size());
    if (string_length) *string_length = full;

    if (!target || buffer_length <= 0) return SQL_SUCCESS;

    const SQLSMALLINT room = buffer_length - 1;
    const SQLSMALLINT n = std::min(full, room);
    std::memcpy(target, src.data(), static_cast<size_t>(n));
    target[n] = '\0';

    return full > room ? SQL_SUCCESS_WITH_INFO : SQL_SUCCESS;
}

std::string sql_to_string(const SQLCHAR* sql_str, SQLINTEGER length) {
    if (!sql_str) return {};
    const char* text = reinterpret_cast<const char*>(sql_str);
    if (length == SQL_NTS) return text;
    if (length <= 0) return {};
    return std::string(text, static_cast<size_t>(length));
}

std::string to_upper(const std::string& s) {
    return map_chars(s, [](unsigned char c) { return std::toupper(c); });
}

std::string to_lower(const std::string& s) {
    return map_chars(s, [](unsigned char c) { return std::tolower(c); });
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

} // namespace mock_odbc
