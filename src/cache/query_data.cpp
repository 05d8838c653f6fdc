#include "query_data.hpp"
#include "query_hash.hpp"

namespace querylens::describe {

namespace {

nlohmann::json nullability_to_json(const Nullability& n) {
    if (!n) {
        return nullptr;
    }
    return *n;
}

Nullability nullability_from_json(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<bool>();
}

} // anonymous namespace

void to_json(nlohmann::json& j, const SqlType& type) {
    j = nlohmann::json{
        {"data_type", type.data_type},
        {"type_name", type.type_name},
        {"column_size", type.column_size},
        {"decimal_digits", type.decimal_digits},
        {"unsigned", type.is_unsigned}
    };
}

void from_json(const nlohmann::json& j, SqlType& type) {
    j.at("data_type").get_to(type.data_type);
    j.at("type_name").get_to(type.type_name);
    j.at("column_size").get_to(type.column_size);
    j.at("decimal_digits").get_to(type.decimal_digits);
    type.is_unsigned = j.value("unsigned", false);
}

void to_json(nlohmann::json& j, const ParameterDescription& param) {
    j = nlohmann::json{
        {"ordinal", param.ordinal},
        {"type", param.type},
        {"nullable", nullability_to_json(param.nullable)}
    };
}

void from_json(const nlohmann::json& j, ParameterDescription& param) {
    j.at("ordinal").get_to(param.ordinal);
    j.at("type").get_to(param.type);
    param.nullable = nullability_from_json(j.at("nullable"));
}

void to_json(nlohmann::json& j, const ColumnDescription& column) {
    j = nlohmann::json{
        {"ordinal", column.ordinal},
        {"name", column.name},
        {"type", column.type},
        {"nullable", nullability_to_json(column.nullable)},
        {"base_table", column.base_table},
        {"base_column", column.base_column},
        {"schema", column.schema},
        {"catalog", column.catalog}
    };
}

void from_json(const nlohmann::json& j, ColumnDescription& column) {
    j.at("ordinal").get_to(column.ordinal);
    j.at("name").get_to(column.name);
    j.at("type").get_to(column.type);
    column.nullable = nullability_from_json(j.at("nullable"));
    column.base_table = j.value("base_table", "");
    column.base_column = j.value("base_column", "");
    column.schema = j.value("schema", "");
    column.catalog = j.value("catalog", "");
}

void to_json(nlohmann::json& j, const QueryDescription& desc) {
    j = nlohmann::json{
        {"parameters", desc.parameters},
        {"parameter_types_known", desc.parameter_types_known},
        {"columns", desc.columns}
    };
}

void from_json(const nlohmann::json& j, QueryDescription& desc) {
    j.at("parameters").get_to(desc.parameters);
    desc.parameter_types_known = j.value("parameter_types_known", true);
    j.at("columns").get_to(desc.columns);
}

} // namespace querylens::describe

namespace querylens::cache {

QueryData QueryData::make(std::string db_name, std::string query,
                          describe::QueryDescription describe) {
    QueryData data;
    data.db_name = std::move(db_name);
    data.hash = query_hash(query);
    data.query = std::move(query);
    data.describe = std::move(describe);
    return data;
}

void to_json(nlohmann::json& j, const QueryData& data) {
    j = nlohmann::json{
        {"db_name", data.db_name},
        {"query", data.query},
        {"describe", data.describe},
        {"hash", data.hash}
    };
}

void from_json(const nlohmann::json& j, QueryData& data) {
    j.at("db_name").get_to(data.db_name);
    j.at("query").get_to(data.query);
    j.at("describe").get_to(data.describe);
    j.at("hash").get_to(data.hash);
}

} // namespace querylens::cache
