#pragma once

#include <string>
#include <string_view>

namespace querylens::cache {

// Lowercase hex SHA-256 of the exact query text (cache key)
std::string query_hash(std::string_view sql);

} // namespace querylens::cache
