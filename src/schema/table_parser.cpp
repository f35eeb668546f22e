// ---------------------------------------------------------------------------
// table_parser.cpp
//
// 헤더는 정규식으로 확인하고, 이름/요소 목록은 text_scan 과 identifier
// 헬퍼로 직접 읽는다. 요소는 괄호 깊이 0 의 쉼표로 나눈다.
// ---------------------------------------------------------------------------

#include "schema/table_parser.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "construct/text_scan.hpp"
#include "schema/identifier.hpp"

namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

const std::regex& create_table_regex() {
    static const std::regex re(
        R"(^\s*CREATE\s+(?:(?:GLOBAL|LOCAL)\s+)?(?:(?:UNLOGGED|TEMP|TEMPORARY)\s+)?TABLE\s+(?:IF\s+NOT\s+EXISTS\s+)?)",
        std::regex::icase);
    return re;
}

const std::regex& comment_on_regex() {
    static const std::regex re(R"(^\s*COMMENT\s+ON\s+(TABLE|COLUMN)\s+)", std::regex::icase);
    return re;
}

const std::regex& not_null_regex() {
    static const std::regex re(R"(\bNOT\s+NULL\b)", std::regex::icase);
    return re;
}

const std::regex& primary_key_regex() {
    static const std::regex re(R"(\bPRIMARY\s+KEY\b)", std::regex::icase);
    return re;
}

// 컬럼 정의에서 타입 뒤에 올 수 있는 제약 키워드
constexpr std::array<std::string_view, 10> kColumnConstraintWords = {
    "NOT", "NULL", "PRIMARY", "DEFAULT", "REFERENCES",
    "UNIQUE", "CHECK", "CONSTRAINT", "COLLATE", "GENERATED",
};

// from 이후 가장 앞선 컬럼 제약 키워드 위치 (괄호 깊이 0). 없으면 text.size().
std::size_t next_constraint_word(std::string_view text, std::size_t from) noexcept {
    std::size_t best = text.size();
    for (const auto word : kColumnConstraintWords) {
        const auto pos = text_scan::find_top_level_word(text, word, from);
        if (pos != std::string_view::npos) {
            best = std::min(best, pos);
        }
    }
    return best;
}

std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept {
    const auto p = text.find_first_not_of(" \t\r\n", pos);
    return (p == std::string_view::npos) ? text.size() : p;
}

// "KEYWORD ( ... )" 에서 괄호 내용. 괄호가 없으면 nullopt.
std::optional<std::string_view> paren_after(std::string_view text, std::size_t from) {
    const auto open = skip_spaces(text, from);
    if (open >= text.size() || text[open] != '(') {
        return std::nullopt;
    }
    const auto span = text_scan::extract_parenthesized(text, open);
    if (!span) {
        return std::nullopt;
    }
    return span->content;
}

// REFERENCES [schema.]table 의 table 이름
std::optional<std::string> references_target(std::string_view text) {
    const auto pos = text_scan::find_top_level_word(text, "REFERENCES");
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    const auto name = read_qualified_name(text, pos + 10);
    if (!name) {
        return std::nullopt;
    }
    return name->name();
}

ColumnInfo* find_column(std::vector<ColumnInfo>& columns, std::string_view name) {
    for (auto& c : columns) {
        if (text_scan::iequals(c.name, name)) {
            return &c;
        }
    }
    return nullptr;
}

struct TableConstraints {
    std::vector<std::string>              primary_key{};
    std::vector<std::vector<std::string>> unique{};
    std::vector<std::string>              checks{};
    std::vector<std::pair<std::string, std::string>> foreign_keys{};  // (column, table)
};

// 테이블 제약이면 true 를 반환하고 out 에 기록한다.
bool parse_table_constraint(std::string_view element, TableConstraints& out) {
    std::string_view body = element;
    if (text_scan::starts_with_word(body, "CONSTRAINT")) {
        const auto name = read_identifier(body, 10);
        if (!name) {
            return true;
        }
        body = text_scan::trim(body.substr(name->second));
    }

    if (text_scan::starts_with_word(body, "PRIMARY")) {
        const auto key_pos = text_scan::find_word(body, "KEY");
        if (key_pos != std::string_view::npos) {
            if (const auto cols = paren_after(body, key_pos + 3)) {
                out.primary_key = split_identifier_list(*cols);
            }
        }
        return true;
    }
    if (text_scan::starts_with_word(body, "UNIQUE")) {
        if (const auto cols = paren_after(body, 6)) {
            out.unique.push_back(split_identifier_list(*cols));
        }
        return true;
    }
    if (text_scan::starts_with_word(body, "CHECK")) {
        if (const auto expr = paren_after(body, 5)) {
            out.checks.push_back(text_scan::collapse_whitespace(*expr));
        }
        return true;
    }
    if (text_scan::starts_with_word(body, "FOREIGN")) {
        const auto key_pos = text_scan::find_word(body, "KEY");
        if (key_pos != std::string_view::npos) {
            const auto cols   = paren_after(body, key_pos + 3);
            const auto target = references_target(body);
            if (cols && target) {
                const auto names = split_identifier_list(*cols);
                if (!names.empty()) {
                    out.foreign_keys.emplace_back(names.front(), *target);
                }
            }
        }
        return true;
    }
    return text_scan::starts_with_word(body, "EXCLUDE") || text_scan::starts_with_word(body, "LIKE");
}

std::optional<ColumnInfo> parse_column(std::string_view element) {
    const auto name = read_identifier(element, 0);
    if (!name) {
        return std::nullopt;
    }

    ColumnInfo col;
    col.name = name->first;

    const auto rest     = element.substr(name->second);
    const auto type_end = next_constraint_word(rest, 0);
    col.type = text_scan::to_upper(text_scan::collapse_whitespace(rest.substr(0, type_end)));
    if (col.type.empty()) {
        return std::nullopt;
    }

    const auto constraints = rest.substr(type_end);
    if (std::regex_search(constraints.begin(), constraints.end(), not_null_regex())) {
        col.nullable = false;
    }
    if (std::regex_search(constraints.begin(), constraints.end(), primary_key_regex())) {
        col.is_primary_key = true;
        col.nullable       = false;
    }

    const auto default_pos = text_scan::find_top_level_word(constraints, "DEFAULT");
    if (default_pos != std::string_view::npos) {
        const auto value_begin = skip_spaces(constraints, default_pos + 7);
        const auto value_end   = next_constraint_word(constraints, value_begin + 1);
        const auto value = text_scan::trim(
            constraints.substr(value_begin, std::max(value_end, value_begin) - value_begin));
        if (!value.empty()) {
            col.default_value = std::string(value);
        }
    }

    col.references_table = references_target(constraints);
    return col;
}

}  // namespace

std::expected<ParsedTable, ParseError> TableParser::parse(std::string_view statement) const {
    if (text_scan::trim(statement).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty statement", statement));
    }

    const std::string cleaned = text_scan::remove_comments(statement);
    const std::string_view sql{cleaned};

    SvMatch header;
    if (!std::regex_search(sql.begin(), sql.end(), header, create_table_regex())) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kUnsupportedStatement, "not a CREATE TABLE statement", statement));
    }

    const auto name_pos = static_cast<std::size_t>(header.length(0));
    const auto name     = read_qualified_name(sql, name_pos);
    if (!name) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement, "missing table name", statement));
    }

    ParsedTable table;
    table.table_name = name->name();
    if (auto schema = name->qualifier()) {
        table.schema = std::move(*schema);
    }
    table.source_sql = std::string(text_scan::trim(statement));

    const auto open = skip_spaces(sql, name->end);
    if (open >= sql.size() || sql[open] != '(') {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement, "missing column list", statement));
    }
    const auto elements = text_scan::extract_parenthesized(sql, open);
    if (!elements) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kUnbalancedParens, "unbalanced column list", statement));
    }

    TableConstraints constraints;
    for (const auto element : text_scan::split_top_level_commas(elements->content)) {
        if (parse_table_constraint(element, constraints)) {
            continue;
        }
        auto col = parse_column(element);
        if (!col) {
            spdlog::debug("table_parser: skipped element '{}' in {}",
                          text_scan::collapse_whitespace(element), table.table_name);
            continue;
        }
        table.columns.push_back(std::move(*col));
    }

    if (table.columns.empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement, "table has no columns", statement));
    }

    // 테이블 수준 PRIMARY KEY 가 인라인 선언보다 우선한다
    if (!constraints.primary_key.empty()) {
        table.primary_key = constraints.primary_key;
        for (auto& col : table.columns) {
            const bool in_key = std::any_of(
                table.primary_key.begin(), table.primary_key.end(),
                [&col](const std::string& k) { return text_scan::iequals(k, col.name); });
            col.is_primary_key = in_key;
            if (in_key) {
                col.nullable = false;
            }
        }
    } else {
        for (const auto& col : table.columns) {
            if (col.is_primary_key) {
                table.primary_key.push_back(col.name);
            }
        }
    }

    for (const auto& [column, target] : constraints.foreign_keys) {
        if (auto* col = find_column(table.columns, column)) {
            col->references_table = target;
        }
    }
    table.unique_constraints = std::move(constraints.unique);
    table.check_constraints  = std::move(constraints.checks);
    return table;
}

std::expected<CommentStatement, ParseError>
TableParser::parse_comment(std::string_view statement) const {
    const std::string cleaned = text_scan::remove_comments(statement);
    const std::string_view sql{cleaned};

    SvMatch header;
    if (!std::regex_search(sql.begin(), sql.end(), header, comment_on_regex())) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kUnsupportedStatement, "not a COMMENT ON TABLE/COLUMN statement",
            statement));
    }

    CommentStatement out;
    out.on_column = text_scan::iequals(header[1].str(), "COLUMN");

    const auto target = read_qualified_name(sql, static_cast<std::size_t>(header.length(0)),
                                            out.on_column ? 3 : 2);
    if (!target || (out.on_column && target->parts.size() < 2)) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement, "missing comment target", statement));
    }

    const auto& parts = target->parts;
    if (out.on_column) {
        out.column = parts[parts.size() - 1];
        out.table  = parts[parts.size() - 2];
        if (parts.size() == 3) {
            out.schema = parts[0];
        }
    } else {
        out.table = parts.back();
        if (parts.size() == 2) {
            out.schema = parts[0];
        }
    }

    const auto is_pos = text_scan::find_word(sql, "IS", target->end);
    if (is_pos == std::string_view::npos) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMissingKeyword, "COMMENT without IS", statement));
    }
    const auto value_pos = skip_spaces(sql, is_pos + 2);
    if (text_scan::starts_with_word(sql.substr(value_pos), "NULL")) {
        return out;
    }
    out.text = read_string_literal(sql, value_pos);
    if (!out.text) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement, "comment text is not a string literal",
            statement));
    }
    return out;
}

std::size_t TableParser::attach_comments(std::vector<ParsedTable>&            tables,
                                         const std::vector<CommentStatement>& comments) {
    std::size_t unmatched = 0;
    for (const auto& comment : comments) {
        auto it = std::find_if(tables.begin(), tables.end(), [&comment](const ParsedTable& t) {
            return text_scan::iequals(t.table_name, comment.table)
                && (!comment.schema || text_scan::iequals(t.schema, *comment.schema));
        });
        if (it == tables.end()) {
            ++unmatched;
            continue;
        }
        if (!comment.on_column) {
            it->table_comment = comment.text;
            continue;
        }
        if (auto* col = find_column(it->columns, comment.column)) {
            col->comment = comment.text;
        } else {
            ++unmatched;
        }
    }
    return unmatched;
}
