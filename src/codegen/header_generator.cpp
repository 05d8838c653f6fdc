#include "header_generator.hpp"
#include "core/resolve_error.hpp"
#include "describe/query_description.hpp"
#include "utils/identifiers.hpp"
#include "querylens/version.hpp"
#include <map>
#include <sstream>

namespace querylens::codegen {

namespace {

constexpr const char* RAW_DELIMITER = "querylens";

std::vector<std::string> split_namespace(const std::string& ns) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t sep = ns.find("::", start);
        parts.push_back(ns.substr(start, sep == std::string::npos ? std::string::npos : sep - start));
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 2;
    }
    
    for (const auto& part : parts) {
        if (!utils::is_identifier(part) || utils::is_cpp_keyword(part)) {
            throw core::ResolveError(core::ResolveErrorKind::Configuration,
                "invalid namespace '" + ns + "'");
        }
    }
    return parts;
}

std::string nullability_note(const resolver::ResolvedColumn& column) {
    if (column.nullable_overridden) {
        return column.nullable ? "NULL (forced)" : "NOT NULL (forced)";
    }
    if (!column.described_nullable) {
        return "NULL?";
    }
    return column.nullable ? "NULL" : "NOT NULL";
}

void render_query(std::ostringstream& out, const resolver::ResolvedQuery& query) {
    const std::string type_name = utils::to_pascal_case(query.source.name);
    
    out << "// " << query.source.name << " (" << query.source.location() << ")\n";
    
    out << "struct " << type_name << "Params {\n";
    for (const auto& param : query.parameters) {
        out << "    " << member_type(param.host_type, param.nullable) << " "
            << param.field_name << ";";
        if (param.sql_type.known()) {
            out << "  // " << describe::display_type_name(param.sql_type);
        }
        out << "\n";
    }
    out << "};\n\n";
    
    out << "struct " << type_name << "Row {\n";
    for (const auto& column : query.columns) {
        out << "    " << member_type(column.host_type, column.nullable) << " "
            << column.field_name << ";  // " << describe::display_type_name(column.sql_type)
            << " " << nullability_note(column) << "\n";
    }
    out << "};\n\n";
    
    out << "inline constexpr const char* " << query.source.name << "_sql = "
        << sql_literal(query.source.sql) << ";\n";
}

} // anonymous namespace

std::string member_type(const std::string& host_type, bool nullable) {
    if (nullable) {
        return "std::optional<" + host_type + ">";
    }
    return host_type;
}

std::string sql_literal(const std::string& sql) {
    const std::string terminator = std::string(")") + RAW_DELIMITER + "\"";
    if (sql.find(terminator) == std::string::npos) {
        return std::string("R\"") + RAW_DELIMITER + "(" + sql + terminator;
    }
    
    std::string escaped = "\"";
    for (char c : sql) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    escaped += "\"";
    return escaped;
}

std::string render_header(const std::vector<resolver::ResolvedQuery>& queries,
                          const HeaderOptions& options) {
    std::vector<std::string> ns = split_namespace(options.namespace_name);
    
    std::ostringstream out;
    out << "// Generated by querylens " << QUERYLENS_VERSION << ". Do not edit.\n"
        << "#pragma once\n\n"
        << "#include <cstdint>\n"
        << "#include <optional>\n"
        << "#include <string>\n"
        << "#include <vector>\n\n"
        << "#ifdef _WIN32\n#include <windows.h>\n#endif\n"
        << "#include <sql.h>\n"
        << "#include <sqlext.h>\n\n";
    
    for (const auto& part : ns) {
        out << "namespace " << part << " {\n";
    }
    
    std::map<std::string, const sources::QuerySource*> type_names;
    for (const auto& query : queries) {
        auto [it, inserted] = type_names.emplace(utils::to_pascal_case(query.source.name),
                                                 &query.source);
        if (!inserted) {
            throw core::ResolveError(core::ResolveErrorKind::SourceSyntax,
                query.source.location() + ": query '" + query.source.name + "' and '" +
                it->second->name + "' (" + it->second->location() + ") both generate " +
                it->first + "Params/" + it->first + "Row");
        }
        out << "\n";
        render_query(out, query);
    }
    
    out << "\n";
    for (auto it = ns.rbegin(); it != ns.rend(); ++it) {
        out << "} // namespace " << *it << "\n";
    }
    
    return out.str();
}

} // namespace querylens::codegen
