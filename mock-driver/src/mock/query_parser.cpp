#include "query_parser.hpp"
#include "../driver/diagnostics.hpp"
#include "../utils/string_utils.hpp"
#include <cctype>
#include <map>
#include <optional>
#include <set>

namespace mock_odbc {

bool Token::is_keyword(const char* keyword) const {
    return kind == Kind::Identifier && to_upper(text) == keyword;
}

bool Token::is_symbol(const char* symbol) const {
    return kind == Kind::Symbol && text == symbol;
}

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Read a quoted run starting at sql[i] (the opening quote); a doubled
// closing quote stands for itself. Returns the index after the closing quote.
size_t read_quoted(const std::string& sql, size_t i, char close, std::string& value,
                   const char* what) {
    ++i;
    while (i < sql.size()) {
        if (sql[i] == close) {
            if (i + 1 < sql.size() && sql[i + 1] == close) {
                value += close;
                i += 2;
                continue;
            }
            return i + 1;
        }
        value += sql[i++];
    }
    throw QueryError(sqlstate::SYNTAX_ERROR, std::string("Unterminated ") + what);
}

// Words that end a table reference or select item instead of naming an alias
bool is_reserved(const Token& t) {
    static const std::set<std::string> reserved = {
        "AS", "FROM", "WHERE", "JOIN", "INNER", "LEFT", "RIGHT", "FULL", "CROSS", "OUTER",
        "ON", "USING", "GROUP", "ORDER", "HAVING", "LIMIT", "OFFSET", "UNION", "EXCEPT",
        "INTERSECT", "SET", "VALUES", "END", "AND", "OR", "NOT", "RETURNING"
    };
    return t.kind == Token::Kind::Identifier && reserved.count(to_upper(t.text)) > 0;
}

bool is_name(const Token& t) {
    return t.kind == Token::Kind::Identifier || t.kind == Token::Kind::QuotedIdentifier;
}

bool is_comparison(const Token& t) {
    static const std::set<std::string> ops = {"=", "<>", "!=", "<", ">", "<=", ">="};
    return (t.kind == Token::Kind::Symbol && ops.count(t.text) > 0) || t.is_keyword("LIKE");
}

struct TableRef {
    const MockTable* table = nullptr;
    std::string alias;
    bool outer_side = false;    // right of LEFT JOIN / left of RIGHT JOIN
};

struct ColumnMatch {
    const TableRef* ref;
    const MockColumn* column;
};

class QueryAnalyzer {
public:
    QueryAnalyzer(std::vector<Token> tokens, const MockCatalog& catalog)
        : tokens_(std::move(tokens)), catalog_(catalog) {
        for (size_t i = 0; i < tokens_.size(); ++i) {
            if (tokens_[i].kind == Token::Kind::Parameter) {
                param_index_[i] = result_.parameters.size();
                result_.parameters.push_back(ParameterInfo{});
            }
        }
    }
    
    PreparedQuery analyze() {
        if (tokens_.empty()) {
            throw QueryError(sqlstate::SYNTAX_ERROR, "Empty statement");
        }
        
        if (accept_keyword("SELECT")) {
            result_.kind = StatementKind::Select;
            analyze_select();
        } else if (accept_keyword("INSERT")) {
            result_.kind = StatementKind::Insert;
            analyze_insert();
        } else if (accept_keyword("UPDATE")) {
            result_.kind = StatementKind::Update;
            analyze_update();
        } else if (accept_keyword("DELETE")) {
            result_.kind = StatementKind::Delete;
            analyze_delete();
        } else {
            throw QueryError(sqlstate::SYNTAX_ERROR,
                             "Syntax error or unsupported statement near '" + tokens_[0].text + "'");
        }
        
        infer_parameters();
        return std::move(result_);
    }
    
private:
    // --- cursor helpers ---
    
    bool at_end() const { return pos_ >= tokens_.size(); }
    
    const Token& current() const {
        if (at_end()) {
            throw QueryError(sqlstate::SYNTAX_ERROR, "Unexpected end of statement");
        }
        return tokens_[pos_];
    }
    
    bool at_keyword(const char* keyword) const {
        return !at_end() && tokens_[pos_].is_keyword(keyword);
    }
    
    bool at_symbol(const char* symbol) const {
        return !at_end() && tokens_[pos_].is_symbol(symbol);
    }
    
    bool accept_keyword(const char* keyword) {
        if (at_keyword(keyword)) {
            ++pos_;
            return true;
        }
        return false;
    }
    
    bool accept_symbol(const char* symbol) {
        if (at_symbol(symbol)) {
            ++pos_;
            return true;
        }
        return false;
    }
    
    void expect_keyword(const char* keyword) {
        if (!accept_keyword(keyword)) {
            throw QueryError(sqlstate::SYNTAX_ERROR, std::string("Expected ") + keyword + " near '" +
                             (at_end() ? std::string("end of statement") : tokens_[pos_].text) + "'");
        }
    }
    
    void expect_symbol(const char* symbol) {
        if (!accept_symbol(symbol)) {
            throw QueryError(sqlstate::SYNTAX_ERROR, std::string("Expected '") + symbol + "' near '" +
                             (at_end() ? std::string("end of statement") : tokens_[pos_].text) + "'");
        }
    }
    
    size_t matching_paren(size_t open) const {
        int depth = 0;
        for (size_t i = open; i < tokens_.size(); ++i) {
            if (tokens_[i].is_symbol("(")) ++depth;
            if (tokens_[i].is_symbol(")") && --depth == 0) return i;
        }
        throw QueryError(sqlstate::SYNTAX_ERROR, "Unbalanced parentheses");
    }
    
    // --- tables ---
    
    const MockTable& lookup_table(const std::string& name) const {
        const MockTable* table = catalog_.find_table(name);
        if (!table) {
            throw QueryError(sqlstate::TABLE_NOT_FOUND, "Base table or view not found: " + name);
        }
        return *table;
    }
    
    TableRef parse_table_ref() {
        if (at_symbol("(")) {
            throw QueryError(sqlstate::SYNTAX_ERROR, "Derived tables are not supported");
        }
        if (at_end() || !is_name(tokens_[pos_]) || is_reserved(tokens_[pos_])) {
            throw QueryError(sqlstate::SYNTAX_ERROR, "Expected table name");
        }
        
        std::string name = tokens_[pos_++].text;
        // schema.table: the mock catalog has no schemas, keep the table part
        if (at_symbol(".") && pos_ + 1 < tokens_.size() && is_name(tokens_[pos_ + 1])) {
            name = tokens_[pos_ + 1].text;
            pos_ += 2;
        }
        
        TableRef ref;
        ref.table = &lookup_table(name);
        ref.alias = ref.table->name;
        
        if (accept_keyword("AS")) {
            if (at_end() || !is_name(tokens_[pos_])) {
                throw QueryError(sqlstate::SYNTAX_ERROR, "Expected alias after AS");
            }
            ref.alias = tokens_[pos_++].text;
        } else if (!at_end() && is_name(tokens_[pos_]) && !is_reserved(tokens_[pos_])) {
            ref.alias = tokens_[pos_++].text;
        }
        
        return ref;
    }
    
    bool at_clause_boundary() const {
        if (at_end() || at_symbol(",") || at_symbol(";")) return true;
        static const char* boundaries[] = {
            "JOIN", "INNER", "LEFT", "RIGHT", "FULL", "CROSS", "WHERE", "GROUP",
            "ORDER", "HAVING", "LIMIT", "OFFSET", "UNION", "EXCEPT", "INTERSECT"
        };
        for (const char* keyword : boundaries) {
            if (at_keyword(keyword)) return true;
        }
        return false;
    }
    
    void parse_from_clause() {
        tables_.push_back(parse_table_ref());
        
        while (!at_end()) {
            if (accept_symbol(",")) {
                tables_.push_back(parse_table_ref());
                continue;
            }
            
            bool left = false;
            bool right = false;
            if (accept_keyword("INNER")) {
                expect_keyword("JOIN");
            } else if (accept_keyword("LEFT")) {
                left = true;
                accept_keyword("OUTER");
                expect_keyword("JOIN");
            } else if (accept_keyword("RIGHT")) {
                right = true;
                accept_keyword("OUTER");
                expect_keyword("JOIN");
            } else if (accept_keyword("FULL")) {
                left = right = true;
                accept_keyword("OUTER");
                expect_keyword("JOIN");
            } else if (accept_keyword("CROSS")) {
                expect_keyword("JOIN");
            } else if (!accept_keyword("JOIN")) {
                break;
            }
            
            TableRef ref = parse_table_ref();
            if (right) {
                for (auto& existing : tables_) existing.outer_side = true;
            }
            ref.outer_side = left;
            tables_.push_back(ref);
            
            if (accept_keyword("ON")) {
                while (!at_clause_boundary()) {
                    pos_ = at_symbol("(") ? matching_paren(pos_) + 1 : pos_ + 1;
                }
            } else if (accept_keyword("USING")) {
                if (!at_symbol("(")) {
                    throw QueryError(sqlstate::SYNTAX_ERROR, "Expected '(' after USING");
                }
                pos_ = matching_paren(pos_) + 1;
            }
        }
    }
    
    const TableRef& find_ref(const std::string& qualifier) const {
        std::string upper = to_upper(qualifier);
        for (const auto& ref : tables_) {
            if (to_upper(ref.alias) == upper) return ref;
        }
        throw QueryError(sqlstate::COLUMN_NOT_FOUND, "Unknown table or alias: " + qualifier);
    }
    
    ColumnMatch resolve_column(const std::string& qualifier, const std::string& name) const {
        if (!qualifier.empty()) {
            const TableRef& ref = find_ref(qualifier);
            const MockColumn* column = ref.table->find_column(name);
            if (!column) {
                throw QueryError(sqlstate::COLUMN_NOT_FOUND, "Column not found: " + qualifier + "." + name);
            }
            return {&ref, column};
        }
        
        std::optional<ColumnMatch> match;
        for (const auto& ref : tables_) {
            if (const MockColumn* column = ref.table->find_column(name)) {
                if (match) {
                    throw QueryError(sqlstate::SYNTAX_ERROR, "Ambiguous column name: " + name);
                }
                match = ColumnMatch{&ref, column};
            }
        }
        if (!match) {
            throw QueryError(sqlstate::COLUMN_NOT_FOUND, "Column not found: " + name);
        }
        return *match;
    }
    
    // Column reference whose last token is tokens_[last]
    std::optional<ColumnMatch> column_ref_ending_at(size_t last) const {
        if (last >= tokens_.size() || !is_name(tokens_[last]) || is_reserved(tokens_[last])) {
            return std::nullopt;
        }
        if (last >= 2 && tokens_[last - 1].is_symbol(".") && is_name(tokens_[last - 2])) {
            return resolve_column(tokens_[last - 2].text, tokens_[last].text);
        }
        return resolve_column("", tokens_[last].text);
    }
    
    // Column reference whose first token is tokens_[first]
    std::optional<ColumnMatch> column_ref_starting_at(size_t first) const {
        if (first >= tokens_.size() || !is_name(tokens_[first]) || is_reserved(tokens_[first])) {
            return std::nullopt;
        }
        if (first + 1 < tokens_.size() && tokens_[first + 1].is_symbol("(")) {
            return std::nullopt;    // function call
        }
        if (first + 2 < tokens_.size() && tokens_[first + 1].is_symbol(".") && is_name(tokens_[first + 2])) {
            return resolve_column(tokens_[first].text, tokens_[first + 2].text);
        }
        return resolve_column("", tokens_[first].text);
    }
    
    // --- result columns ---
    
    static ResultColumn column_from(const TableRef& ref, const MockColumn& col, const std::string& label) {
        ResultColumn result;
        result.label = label;
        result.data_type = col.data_type;
        result.type_name = col.type_name;
        result.column_size = col.column_size;
        result.decimal_digits = col.decimal_digits;
        result.nullable = ref.outer_side ? SQL_NULLABLE : col.nullable;
        result.is_unsigned = col.is_unsigned;
        result.base_table = ref.table->name;
        result.base_column = col.name;
        return result;
    }
    
    static ResultColumn computed(SQLSMALLINT type, const char* type_name, SQLULEN size,
                                 SQLSMALLINT digits, SQLSMALLINT nullable) {
        ResultColumn result;
        result.data_type = type;
        result.type_name = type_name;
        result.column_size = size;
        result.decimal_digits = digits;
        result.nullable = nullable;
        return result;
    }
    
    ResultColumn describe_aggregate(const std::string& function, size_t arg_begin, size_t arg_end) const {
        if (function == "COUNT") {
            return computed(SQL_BIGINT, "BIGINT", 19, 0, SQL_NO_NULLS);
        }
        
        // Aggregates over an empty set yield NULL
        std::optional<ColumnMatch> match;
        if (arg_end - arg_begin == 1 || (arg_end - arg_begin == 3 && tokens_[arg_begin + 1].is_symbol("."))) {
            match = column_ref_ending_at(arg_end - 1);
        }
        if (function == "AVG" || !match) {
            return computed(SQL_DOUBLE, "DOUBLE PRECISION", 15, 0, SQL_NULLABLE);
        }
        
        ResultColumn result = column_from(*match->ref, *match->column, "");
        result.nullable = SQL_NULLABLE;
        result.base_table.clear();
        result.base_column.clear();
        if (function == "SUM" && (result.data_type == SQL_INTEGER || result.data_type == SQL_SMALLINT ||
                                  result.data_type == SQL_TINYINT)) {
            result.data_type = SQL_BIGINT;
            result.type_name = "BIGINT";
            result.column_size = 19;
        }
        return result;
    }
    
    ResultColumn describe_expression(size_t begin, size_t end) const {
        size_t count = end - begin;
        const Token& first = tokens_[begin];
        
        if (count == 1) {
            if (first.is_keyword("NULL")) {
                return computed(SQL_VARCHAR, "NULL", 0, 0, SQL_NULLABLE);
            }
            if (first.is_keyword("TRUE") || first.is_keyword("FALSE")) {
                return computed(SQL_BIT, "BIT", 1, 0, SQL_NO_NULLS);
            }
            switch (first.kind) {
                case Token::Kind::Number: {
                    auto dot = first.text.find('.');
                    if (dot == std::string::npos) {
                        return computed(SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS);
                    }
                    return computed(SQL_DECIMAL, "DECIMAL", first.text.length() - 1,
                                    static_cast<SQLSMALLINT>(first.text.length() - dot - 1), SQL_NO_NULLS);
                }
                case Token::Kind::String:
                    return computed(SQL_VARCHAR, "VARCHAR", first.text.length(), 0, SQL_NO_NULLS);
                case Token::Kind::Parameter:
                    return computed(SQL_VARCHAR, "VARCHAR", 255, 0, SQL_NULLABLE_UNKNOWN);
                default:
                    break;
            }
        }
        
        if ((count == 1 || (count == 3 && tokens_[begin + 1].is_symbol("."))) && is_name(first)) {
            auto match = column_ref_ending_at(end - 1);
            return column_from(*match->ref, *match->column, match->column->name);
        }
        
        if (count >= 3 && first.kind == Token::Kind::Identifier && tokens_[begin + 1].is_symbol("(") &&
            matching_paren(begin + 1) == end - 1) {
            std::string function = to_upper(first.text);
            if (function == "COUNT" || function == "SUM" || function == "MIN" ||
                function == "MAX" || function == "AVG") {
                return describe_aggregate(function, begin + 2, end - 1);
            }
        }
        
        return computed(SQL_VARCHAR, "VARCHAR", 255, 0, SQL_NULLABLE_UNKNOWN);
    }
    
    void describe_select_item(size_t begin, size_t end) {
        if (begin >= end) {
            throw QueryError(sqlstate::SYNTAX_ERROR, "Empty select list item");
        }
        
        // * and t.*
        if (end - begin == 1 && tokens_[begin].is_symbol("*")) {
            if (tables_.empty()) {
                throw QueryError(sqlstate::SYNTAX_ERROR, "SELECT * requires a FROM clause");
            }
            for (const auto& ref : tables_) {
                for (const auto& col : ref.table->columns) {
                    result_.columns.push_back(column_from(ref, col, col.name));
                }
            }
            return;
        }
        if (end - begin == 3 && is_name(tokens_[begin]) && tokens_[begin + 1].is_symbol(".") &&
            tokens_[begin + 2].is_symbol("*")) {
            const TableRef& ref = find_ref(tokens_[begin].text);
            for (const auto& col : ref.table->columns) {
                result_.columns.push_back(column_from(ref, col, col.name));
            }
            return;
        }
        
        std::optional<std::string> alias;
        if (end - begin >= 3 && tokens_[end - 2].is_keyword("AS") && is_name(tokens_[end - 1])) {
            alias = tokens_[end - 1].text;
            end -= 2;
        } else if (end - begin >= 2 && is_name(tokens_[end - 1]) && !is_reserved(tokens_[end - 1])) {
            const Token& prior = tokens_[end - 2];
            if (!prior.is_symbol(".") && (prior.kind != Token::Kind::Symbol || prior.is_symbol(")")) &&
                !is_reserved(prior)) {
                alias = tokens_[end - 1].text;
                end -= 1;
            }
        }
        
        ResultColumn column = describe_expression(begin, end);
        if (alias) {
            column.label = *alias;
        } else if (column.label.empty()) {
            column.label = "EXPR_" + std::to_string(result_.columns.size() + 1);
        }
        result_.columns.push_back(std::move(column));
    }
    
    // --- statements ---
    
    void analyze_select() {
        if (!accept_keyword("DISTINCT")) {
            accept_keyword("ALL");
        }
        
        size_t list_begin = pos_;
        int depth = 0;
        while (!at_end()) {
            const Token& t = tokens_[pos_];
            if (t.is_symbol("(")) ++depth;
            if (t.is_symbol(")")) --depth;
            if (depth == 0 && (t.is_keyword("FROM") || t.is_keyword("WHERE") || t.is_keyword("GROUP") ||
                               t.is_keyword("ORDER") || t.is_keyword("LIMIT") || t.is_keyword("UNION") ||
                               t.is_symbol(";"))) {
                break;
            }
            ++pos_;
        }
        size_t list_end = pos_;
        
        if (accept_keyword("FROM")) {
            parse_from_clause();
        }
        
        size_t item_begin = list_begin;
        depth = 0;
        for (size_t i = list_begin; i < list_end; ++i) {
            if (tokens_[i].is_symbol("(")) ++depth;
            if (tokens_[i].is_symbol(")")) --depth;
            if (depth == 0 && tokens_[i].is_symbol(",")) {
                describe_select_item(item_begin, i);
                item_begin = i + 1;
            }
        }
        describe_select_item(item_begin, list_end);
    }
    
    void analyze_insert() {
        expect_keyword("INTO");
        TableRef ref = parse_table_ref();
        tables_.push_back(ref);
        
        std::vector<const MockColumn*> targets;
        if (accept_symbol("(")) {
            do {
                if (at_end() || !is_name(tokens_[pos_])) {
                    throw QueryError(sqlstate::SYNTAX_ERROR, "Expected column name in INSERT column list");
                }
                const std::string& name = tokens_[pos_++].text;
                const MockColumn* column = ref.table->find_column(name);
                if (!column) {
                    throw QueryError(sqlstate::COLUMN_NOT_FOUND, "Column not found: " + name);
                }
                targets.push_back(column);
            } while (accept_symbol(","));
            expect_symbol(")");
        } else {
            for (const auto& col : ref.table->columns) {
                targets.push_back(&col);
            }
        }
        
        if (!accept_keyword("VALUES")) {
            return;     // INSERT ... SELECT; parameters keep their defaults
        }
        
        do {
            if (!at_symbol("(")) {
                throw QueryError(sqlstate::SYNTAX_ERROR, "Expected '(' after VALUES");
            }
            size_t close = matching_paren(pos_);
            std::vector<std::pair<size_t, size_t>> values;
            size_t value_begin = pos_ + 1;
            int depth = 0;
            for (size_t i = pos_ + 1; i < close; ++i) {
                if (tokens_[i].is_symbol("(")) ++depth;
                if (tokens_[i].is_symbol(")")) --depth;
                if (depth == 0 && tokens_[i].is_symbol(",")) {
                    values.emplace_back(value_begin, i);
                    value_begin = i + 1;
                }
            }
            values.emplace_back(value_begin, close);
            
            if (values.size() != targets.size()) {
                throw QueryError(sqlstate::INSERT_VALUE_LIST_MISMATCH,
                                 "Insert value list does not match column list");
            }
            
            for (size_t v = 0; v < values.size(); ++v) {
                auto [first, last] = values[v];
                if (last - first == 1 && tokens_[first].kind == Token::Kind::Parameter) {
                    auto& param = result_.parameters[param_index_.at(first)];
                    param.data_type = targets[v]->data_type;
                    param.column_size = targets[v]->column_size;
                    param.decimal_digits = targets[v]->decimal_digits;
                    param.nullable = targets[v]->nullable;
                    fixed_params_.insert(first);
                }
            }
            pos_ = close + 1;
        } while (accept_symbol(","));
    }
    
    void analyze_update() {
        tables_.push_back(parse_table_ref());
        expect_keyword("SET");
    }
    
    void analyze_delete() {
        expect_keyword("FROM");
        tables_.push_back(parse_table_ref());
    }
    
    // Type each parameter from the column it is compared with or assigned to
    void infer_parameters() {
        for (const auto& [index, ordinal] : param_index_) {
            if (fixed_params_.count(index) > 0) continue;
            
            std::optional<ColumnMatch> match;
            if (index >= 2 && is_comparison(tokens_[index - 1])) {
                size_t before = index - 2;
                if (tokens_[index - 1].is_keyword("LIKE") && before > 0 && tokens_[before].is_keyword("NOT")) {
                    --before;
                }
                match = column_ref_ending_at(before);
            } else if (index + 2 < tokens_.size() && is_comparison(tokens_[index + 1])) {
                match = column_ref_starting_at(index + 2);
            } else if (index >= 2 && tokens_[index - 1].is_keyword("BETWEEN")) {
                match = column_ref_ending_at(index - 2);
            } else if (index >= 4 && tokens_[index - 1].is_keyword("AND") &&
                       tokens_[index - 3].is_keyword("BETWEEN")) {
                match = column_ref_ending_at(index - 4);
            } else {
                // col [NOT] IN (?, ?, ...)
                size_t j = index;
                while (j > 0 && (tokens_[j].kind == Token::Kind::Parameter || tokens_[j].is_symbol(","))) {
                    --j;
                }
                if (j >= 2 && tokens_[j].is_symbol("(") && tokens_[j - 1].is_keyword("IN")) {
                    size_t before = j - 2;
                    if (before > 0 && tokens_[before].is_keyword("NOT")) --before;
                    match = column_ref_ending_at(before);
                }
            }
            
            if (match) {
                auto& param = result_.parameters[ordinal];
                param.data_type = match->column->data_type;
                param.column_size = match->column->column_size;
                param.decimal_digits = match->column->decimal_digits;
                param.nullable = match->column->nullable;
            }
        }
    }
    
    std::vector<Token> tokens_;
    const MockCatalog& catalog_;
    size_t pos_ = 0;
    std::vector<TableRef> tables_;
    PreparedQuery result_;
    std::map<size_t, size_t> param_index_;  // token index -> parameter ordinal - 1
    std::set<size_t> fixed_params_;
};

} // anonymous namespace

std::vector<Token> tokenize_sql(const std::string& sql) {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = sql.size();
    
    while (i < n) {
        char c = sql[i];
        
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        
        // Comments
        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            while (i < n && sql[i] != '\n') ++i;
            continue;
        }
        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            size_t close = sql.find("*/", i + 2);
            if (close == std::string::npos) {
                throw QueryError(sqlstate::SYNTAX_ERROR, "Unterminated comment");
            }
            i = close + 2;
            continue;
        }
        
        if (c == '\'') {
            std::string value;
            i = read_quoted(sql, i, '\'', value, "string literal");
            tokens.push_back({Token::Kind::String, value});
            continue;
        }
        
        if (c == '"' || c == '`' || c == '[') {
            std::string value;
            i = read_quoted(sql, i, c == '[' ? ']' : c, value, "quoted identifier");
            tokens.push_back({Token::Kind::QuotedIdentifier, value});
            continue;
        }
        
        if (is_ident_start(c)) {
            size_t start = i;
            while (i < n && is_ident_char(sql[i])) ++i;
            tokens.push_back({Token::Kind::Identifier, sql.substr(start, i - start)});
            continue;
        }
        
        if (is_digit(c) || (c == '.' && i + 1 < n && is_digit(sql[i + 1]))) {
            size_t start = i;
            while (i < n && (is_digit(sql[i]) || sql[i] == '.')) ++i;
            tokens.push_back({Token::Kind::Number, sql.substr(start, i - start)});
            continue;
        }
        
        if (c == '?') {
            tokens.push_back({Token::Kind::Parameter, "?"});
            ++i;
            continue;
        }
        
        if (i + 1 < n) {
            std::string two = sql.substr(i, 2);
            if (two == "<=" || two == ">=" || two == "<>" || two == "!=" || two == "||" || two == "::") {
                tokens.push_back({Token::Kind::Symbol, two});
                i += 2;
                continue;
            }
        }
        
        tokens.push_back({Token::Kind::Symbol, std::string(1, c)});
        ++i;
    }
    
    return tokens;
}

PreparedQuery analyze_query(const std::string& sql, const MockCatalog& catalog) {
    QueryAnalyzer analyzer(tokenize_sql(sql), catalog);
    return analyzer.analyze();
}

} // namespace mock_odbc
