#include "identifiers.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace querylens::utils {

namespace {

constexpr std::array<std::string_view, 97> CPP_KEYWORDS = {
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t",
    "class", "compl", "concept", "const", "consteval", "constexpr", "constinit",
    "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype",
    "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
    "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
    "protected", "public", "register", "reinterpret_cast", "requires", "return",
    "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "thread_local", "throw", "true",
    "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
    "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
    "final", "override", "import", "module", "reflexpr"
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

bool is_identifier(std::string_view text) {
    if (text.empty() || !is_ident_start(text.front())) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), is_ident_char);
}

bool is_cpp_keyword(std::string_view text) {
    return std::find(CPP_KEYWORDS.begin(), CPP_KEYWORDS.end(), text) != CPP_KEYWORDS.end();
}

std::string sanitize_identifier(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 1);
    
    for (char c : text) {
        result += is_ident_char(c) ? c : '_';
    }
    
    if (result.empty()) {
        return result;
    }
    
    if (std::isdigit(static_cast<unsigned char>(result.front()))) {
        result.insert(result.begin(), '_');
    }
    
    if (is_cpp_keyword(result)) {
        result += '_';
    }
    
    return result;
}

std::string to_pascal_case(std::string_view text) {
    std::string result;
    bool upper_next = true;
    
    for (char c : text) {
        if (!is_ident_char(c) || c == '_') {
            upper_next = true;
            continue;
        }
        if (upper_next) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            upper_next = false;
        } else {
            result += c;
        }
    }
    
    if (!result.empty() && std::isdigit(static_cast<unsigned char>(result.front()))) {
        result.insert(result.begin(), '_');
    }
    
    return result;
}

std::string trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

} // namespace querylens::utils
