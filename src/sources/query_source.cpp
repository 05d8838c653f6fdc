#include "query_source.hpp"
#include "core/resolve_error.hpp"
#include "core/logger.hpp"
#include "utils/identifiers.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>

namespace querylens::sources {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void syntax_error(const std::string& file, int line, const std::string& message) {
    throw core::ResolveError(core::ResolveErrorKind::SourceSyntax,
        file + ":" + std::to_string(line) + ": " + message);
}

// "-- key: value" -> value, if the line is that directive
std::optional<std::string> directive(std::string_view line, std::string_view key) {
    std::string trimmed = utils::trim(line);
    if (trimmed.compare(0, 2, "--") != 0) {
        return std::nullopt;
    }
    
    std::string body = utils::trim(std::string_view(trimmed).substr(2));
    if (body.size() <= key.size() || body.compare(0, key.size(), key) != 0 ||
        body[key.size()] != ':') {
        return std::nullopt;
    }
    return utils::trim(std::string_view(body).substr(key.size() + 1));
}

std::string finish_text(const std::string& raw) {
    std::string text = utils::trim(raw);
    if (!text.empty() && text.back() == ';') {
        text.pop_back();
        text = utils::trim(text);
    }
    return text;
}

bool only_comments(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = utils::trim(line);
        if (!trimmed.empty() && trimmed.compare(0, 2, "--") != 0) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string QuerySource::location() const {
    return file + ":" + std::to_string(line);
}

std::vector<QuerySource> parse_query_sources(std::string_view text,
                                             const std::string& file,
                                             const std::string& default_name) {
    std::vector<QuerySource> queries;
    std::string preamble;
    std::string body;
    bool in_directives = false;
    
    auto flush = [&]() {
        if (queries.empty()) {
            return;
        }
        QuerySource& current = queries.back();
        current.sql = finish_text(body);
        if (current.sql.empty() || only_comments(current.sql)) {
            syntax_error(file, current.line, "query '" + current.name + "' has no text");
        }
        body.clear();
    };
    
    std::istringstream in{std::string(text)};
    std::string line;
    int line_no = 0;
    
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        
        if (auto name = directive(line, "name")) {
            flush();
            if (!utils::is_identifier(*name)) {
                syntax_error(file, line_no, "invalid query name '" + *name + "'");
            }
            QuerySource source;
            source.name = *name;
            source.file = file;
            source.line = line_no;
            queries.push_back(std::move(source));
            in_directives = true;
            continue;
        }
        
        if (queries.empty()) {
            preamble += line;
            preamble += '\n';
            continue;
        }
        
        if (in_directives) {
            if (auto param = directive(line, "param")) {
                if (!utils::is_identifier(*param)) {
                    syntax_error(file, line_no, "invalid parameter name '" + *param + "'");
                }
                auto& params = queries.back().param_names;
                const std::string field = utils::sanitize_identifier(*param);
                for (const auto& existing : params) {
                    if (utils::sanitize_identifier(existing) == field) {
                        syntax_error(file, line_no, "duplicate parameter name '" + *param +
                                     "' in query '" + queries.back().name + "'");
                    }
                }
                params.push_back(*param);
                continue;
            }
            in_directives = false;
        }
        
        body += line;
        body += '\n';
    }
    
    if (queries.empty()) {
        // The whole file is one query
        if (!utils::is_identifier(default_name)) {
            syntax_error(file, 1, "file name '" + default_name +
                         "' is not a valid query name; add a '-- name:' line");
        }
        QuerySource source;
        source.name = default_name;
        source.file = file;
        source.line = 1;
        source.sql = finish_text(preamble);
        if (source.sql.empty() || only_comments(source.sql)) {
            syntax_error(file, 1, "query '" + default_name + "' has no text");
        }
        queries.push_back(std::move(source));
        return queries;
    }
    
    flush();
    
    if (!only_comments(preamble)) {
        syntax_error(file, 1, "query text before the first '-- name:' line");
    }
    
    return queries;
}

std::vector<QuerySource> load_query_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::ResolveError(core::ResolveErrorKind::Configuration,
            "cannot read query file " + path.string());
    }
    
    std::ostringstream contents;
    contents << in.rdbuf();
    
    LOG_DEBUG("Reading queries from " + path.string());
    return parse_query_sources(contents.str(), path.string(), path.stem().string());
}

std::vector<QuerySource> load_query_sources(const std::vector<fs::path>& paths) {
    std::vector<fs::path> files;
    
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> found;
            for (const auto& entry : fs::recursive_directory_iterator(path, ec)) {
                if (entry.is_regular_file() && entry.path().extension() == ".sql") {
                    found.push_back(entry.path());
                }
            }
            if (ec) {
                throw core::ResolveError(core::ResolveErrorKind::Configuration,
                    "cannot scan " + path.string() + ": " + ec.message());
            }
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        } else if (fs::exists(path, ec)) {
            files.push_back(path);
        } else {
            throw core::ResolveError(core::ResolveErrorKind::Configuration,
                "no such file or directory: " + path.string());
        }
    }
    
    std::vector<QuerySource> all;
    // Generated type name -> first query using it
    std::map<std::string, const QuerySource*> seen;
    
    for (const auto& file : files) {
        for (auto& query : load_query_file(file)) {
            all.push_back(std::move(query));
        }
    }
    
    for (const auto& query : all) {
        auto [it, inserted] = seen.emplace(utils::to_pascal_case(query.name), &query);
        if (inserted) {
            continue;
        }
        const QuerySource& first = *it->second;
        if (first.name == query.name) {
            syntax_error(query.file, query.line,
                "duplicate query name '" + query.name + "' (first defined at " +
                first.location() + ")");
        }
        syntax_error(query.file, query.line,
            "query name '" + query.name + "' and '" + first.name + "' (" +
            first.location() + ") both generate " + it->first + "Params/" + it->first + "Row");
    }
    
    LOG_INFO("Loaded " + std::to_string(all.size()) + " queries from " +
             std::to_string(files.size()) + " files");
    return all;
}

} // namespace querylens::sources
