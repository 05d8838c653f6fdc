#include "config.hpp"
#include "../utils/string_utils.hpp"
#include <algorithm>
#include <initializer_list>
#include <sstream>

namespace mock_odbc {

namespace {

using PairMap = std::unordered_map<std::string, std::string>;

// "Key = {value}" -> pairs["key"] = "value"; segments without '=' are ignored
void store_pair(PairMap& pairs, const std::string& segment) {
    const auto eq = segment.find('=');
    if (eq == std::string::npos) return;

    std::string value = trim(segment.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '{' && value.back() == '}') {
        value = value.substr(1, value.size() - 2);
    }
    pairs[to_lower(trim(segment.substr(0, eq)))] = value;
}

bool matches_any(const std::string& value, std::initializer_list<const char*> words) {
    const std::string lowered = to_lower(value);
    return std::any_of(words.begin(), words.end(),
                       [&](const char* word) { return lowered == word; });
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // anonymous namespace

bool DriverConfig::should_fail(const std::string& function_name) const {
    if (mode == BehaviorMode::Failure) return true;
    if (mode != BehaviorMode::Partial) return false;

    const std::string wanted = to_lower(function_name);
    return std::any_of(fail_on.begin(), fail_on.end(),
                       [&](const std::string& f) { return to_lower(f) == wanted; });
}

std::unordered_map<std::string, std::string> parse_connection_string_pairs(
    const std::string& conn_str) {
    PairMap pairs;
    std::string segment;
    int depth = 0;

    // Semicolons inside {...} belong to the value
    for (char c : conn_str) {
        if (c == ';' && depth == 0) {
            store_pair(pairs, segment);
            segment.clear();
            continue;
        }
        if (c == '{') ++depth;
        if (c == '}' && depth > 0) --depth;
        segment += c;
    }
    if (!segment.empty()) store_pair(pairs, segment);

    return pairs;
}

std::string get_string_value(const std::unordered_map<std::string, std::string>& pairs,
                             const std::string& key,
                             const std::string& default_value) {
    auto it = pairs.find(to_lower(key));
    return it == pairs.end() ? default_value : it->second;
}

DriverConfig parse_connection_string(const std::string& conn_str) {
    const PairMap pairs = parse_connection_string_pairs(conn_str);
    DriverConfig config;

    const std::string mode = get_string_value(pairs, "Mode", "Success");
    if (matches_any(mode, {"failure", "fail"})) {
        config.mode = BehaviorMode::Failure;
    } else if (matches_any(mode, {"partial"})) {
        config.mode = BehaviorMode::Partial;
    }

    config.catalog = get_string_value(pairs, "Catalog", config.catalog);
    config.fail_on = split_list(get_string_value(pairs, "FailOn"));
    config.error_code = get_string_value(pairs, "ErrorCode", config.error_code);

    if (matches_any(get_string_value(pairs, "NullableReporting"), {"unknown"})) {
        config.nullable_reporting = NullableReporting::Unknown;
    }
    if (matches_any(get_string_value(pairs, "DescribeParam"), {"unsupported", "no", "false"})) {
        config.describe_param_supported = false;
    }

    config.dbms_name = get_string_value(pairs, "DbmsName", config.dbms_name);
    config.dbms_version = get_string_value(pairs, "DbmsVersion", config.dbms_version);

    return config;
}

} // namespace mock_odbc
