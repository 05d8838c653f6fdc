#include "dotenv.hpp"
#include "core/resolve_error.hpp"
#include "core/logger.hpp"
#include "utils/identifiers.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace querylens::config {

namespace {

[[noreturn]] void bad_line(const std::string& file, int line, const std::string& message) {
    throw core::ResolveError(core::ResolveErrorKind::Configuration,
        file + ":" + std::to_string(line) + ": " + message);
}

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

// Value after '=': quoted forms must close on the same line
std::string parse_value(std::string_view raw, const std::string& file, int line) {
    std::string value = utils::trim(raw);
    if (value.empty()) {
        return value;
    }
    
    char quote = value.front();
    if (quote == '\'' || quote == '"') {
        std::string out;
        size_t i = 1;
        bool closed = false;
        for (; i < value.size(); ++i) {
            char c = value[i];
            if (c == quote) {
                closed = true;
                break;
            }
            if (quote == '"' && c == '\\' && i + 1 < value.size()) {
                char next = value[++i];
                switch (next) {
                    case 'n': out += '\n'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    default:
                        out += '\\';
                        out += next;
                        break;
                }
                continue;
            }
            out += c;
        }
        if (!closed) {
            bad_line(file, line, "unterminated quoted value");
        }
        
        std::string rest = utils::trim(std::string_view(value).substr(i + 1));
        if (!rest.empty() && rest.front() != '#') {
            bad_line(file, line, "unexpected text after quoted value");
        }
        return out;
    }
    
    // Unquoted: " #" starts a comment
    size_t hash = value.find(" #");
    if (hash == std::string::npos) {
        hash = value.find("\t#");
    }
    if (hash != std::string::npos) {
        value = utils::trim(std::string_view(value).substr(0, hash));
    }
    return value;
}

} // anonymous namespace

DotenvEntries parse_dotenv(std::string_view text, const std::string& file) {
    DotenvEntries entries;
    std::istringstream in{std::string(text)};
    std::string raw;
    int line_no = 0;
    
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = utils::trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        
        if (line.compare(0, 7, "export ") == 0) {
            line = utils::trim(std::string_view(line).substr(7));
        }
        
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            bad_line(file, line_no, "expected KEY=VALUE");
        }
        
        std::string key = utils::trim(std::string_view(line).substr(0, eq));
        if (key.empty()) {
            bad_line(file, line_no, "empty variable name");
        }
        for (char c : key) {
            if (!is_key_char(c)) {
                bad_line(file, line_no, "invalid variable name '" + key + "'");
            }
        }
        
        entries.emplace_back(key, parse_value(std::string_view(line).substr(eq + 1), file, line_no));
    }
    
    return entries;
}

DotenvEntries load_dotenv(const std::filesystem::path& path, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            throw core::ResolveError(core::ResolveErrorKind::Configuration,
                "environment file " + path.string() + " does not exist");
        }
        LOG_DEBUG("No " + path.string() + " file");
        return {};
    }
    
    std::ifstream in(path);
    if (!in) {
        throw core::ResolveError(core::ResolveErrorKind::Configuration,
            "cannot read environment file " + path.string());
    }
    
    std::ostringstream contents;
    contents << in.rdbuf();
    
    LOG_DEBUG("Reading environment file " + path.string());
    return parse_dotenv(contents.str(), path.string());
}

size_t apply_dotenv(const DotenvEntries& entries) {
    size_t applied = 0;
    
    for (const auto& [key, value] : entries) {
        if (std::getenv(key.c_str()) != nullptr) {
            LOG_TRACE(key + " already set in the environment, keeping it");
            continue;
        }
        
#ifdef _WIN32
        int rc = _putenv_s(key.c_str(), value.c_str());
#else
        int rc = setenv(key.c_str(), value.c_str(), 0);
#endif
        if (rc != 0) {
            throw core::ResolveError(core::ResolveErrorKind::Configuration,
                "cannot set environment variable " + key);
        }
        ++applied;
    }
    
    return applied;
}

} // namespace querylens::config
