#pragma once

#include "describe/query_description.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace querylens::cache {

// One offline cache entry
struct QueryData {
    std::string db_name;               // SQL_DBMS_NAME of the database that described it
    std::string query;                 // Exact query text
    describe::QueryDescription describe;
    std::string hash;                  // query_hash(query)
    
    // Build an entry, computing the hash
    static QueryData make(std::string db_name, std::string query,
                          describe::QueryDescription describe);
    
    bool operator==(const QueryData& other) const {
        return db_name == other.db_name && query == other.query &&
               describe == other.describe && hash == other.hash;
    }
    bool operator!=(const QueryData& other) const { return !(*this == other); }
};

} // namespace querylens::cache

// JSON conversions (found by ADL)
namespace querylens::describe {
void to_json(nlohmann::json& j, const SqlType& type);
void from_json(const nlohmann::json& j, SqlType& type);
void to_json(nlohmann::json& j, const ParameterDescription& param);
void from_json(const nlohmann::json& j, ParameterDescription& param);
void to_json(nlohmann::json& j, const ColumnDescription& column);
void from_json(const nlohmann::json& j, ColumnDescription& column);
void to_json(nlohmann::json& j, const QueryDescription& desc);
void from_json(const nlohmann::json& j, QueryDescription& desc);
} // namespace querylens::describe

namespace querylens::cache {
void to_json(nlohmann::json& j, const QueryData& data);
void from_json(const nlohmann::json& j, QueryData& data);
} // namespace querylens::cache
