#include "json_reporter.hpp"
#include "querylens/version.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace querylens::reporting {

namespace {

nlohmann::json nullability_json(const describe::Nullability& nullable) {
    if (!nullable) {
        return nullptr;
    }
    return *nullable;
}

} // anonymous namespace

void JsonReporter::report_start(config::ResolveMode mode) {
    root_ = nlohmann::json::object();
    root_["version"] = QUERYLENS_VERSION;
    root_["mode"] = config::resolve_mode_to_string(mode);
    queries_ = nlohmann::json::array();
    failures_ = nlohmann::json::array();
}

void JsonReporter::report_query(const resolver::ResolvedQuery& query) {
    nlohmann::json q;
    q["name"] = query.source.name;
    q["file"] = query.source.file;
    q["line"] = query.source.line;
    q["sql"] = query.source.sql;
    q["db_name"] = query.data.db_name;
    q["hash"] = query.data.hash;
    q["parameter_types_known"] = query.data.describe.parameter_types_known;
    
    nlohmann::json params = nlohmann::json::array();
    for (const auto& param : query.parameters) {
        nlohmann::json p;
        p["ordinal"] = param.ordinal;
        p["name"] = param.field_name;
        p["sql_type"] = describe::display_type_name(param.sql_type);
        p["host_type"] = param.host_type;
        p["nullable"] = param.nullable;
        params.push_back(p);
    }
    q["parameters"] = params;
    
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& column : query.columns) {
        nlohmann::json c;
        c["ordinal"] = column.ordinal;
        c["name"] = column.field_name;
        c["sql_name"] = column.sql_name;
        c["sql_type"] = describe::display_type_name(column.sql_type);
        c["host_type"] = column.host_type;
        c["nullable"] = column.nullable;
        c["described_nullable"] = nullability_json(column.described_nullable);
        c["nullable_overridden"] = column.nullable_overridden;
        c["type_overridden"] = column.type_overridden;
        columns.push_back(c);
    }
    q["columns"] = columns;
    
    queries_.push_back(q);
}

void JsonReporter::report_failure(const sources::QuerySource& source,
                                  const std::string& message) {
    nlohmann::json f;
    f["name"] = source.name;
    f["file"] = source.file;
    f["line"] = source.line;
    f["message"] = message;
    failures_.push_back(f);
}

void JsonReporter::report_summary(size_t total, size_t ok, size_t failed,
                                  std::chrono::microseconds total_duration) {
    nlohmann::json summary;
    summary["total"] = total;
    summary["ok"] = ok;
    summary["failed"] = failed;
    summary["total_duration_us"] = total_duration.count();
    
    root_["summary"] = summary;
    root_["queries"] = queries_;
    root_["failures"] = failures_;
}

void JsonReporter::report_end() {
    if (output_file_.empty()) {
        out_ << std::setw(2) << root_ << std::endl;
        return;
    }
    
    std::ofstream file(output_file_);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write JSON report to " + output_file_);
    }
    file << std::setw(2) << root_ << std::endl;
}

} // namespace querylens::reporting
