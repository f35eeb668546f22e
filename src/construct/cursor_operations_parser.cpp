// ---------------------------------------------------------------------------
// cursor_operations_parser.cpp
// ---------------------------------------------------------------------------

#include "construct/cursor_operations_parser.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "construct/text_scan.hpp"

namespace {

using SvIter  = std::string_view::const_iterator;
using SvMatch = std::match_results<SvIter>;

const std::regex& declare_regex() {
    static const std::regex re(
        R"((\w+)\s+(?:NO\s+)?(?:SCROLL\s+)?CURSOR\s*(?:\([^)]*\))?\s*FOR\s)",
        std::regex::icase);
    return re;
}

// FETCH [direction] [FROM|IN] cursor INTO target
const std::regex& fetch_regex() {
    static const std::regex re(
        R"(^FETCH\s+(?:(?:NEXT|PRIOR|FIRST|LAST|FORWARD|BACKWARD|(?:ABSOLUTE|RELATIVE)\s+-?\d+)\s+)?(?:(?:FROM|IN)\s+)?(\w+)\s+INTO\s+(\w+))",
        std::regex::icase);
    return re;
}

// MOVE [direction] [FROM|IN] cursor
const std::regex& move_regex() {
    static const std::regex re(
        R"(^MOVE\s+(?:(?:NEXT|PRIOR|FIRST|LAST|FORWARD|BACKWARD|(?:ABSOLUTE|RELATIVE)\s+-?\d+)\s+)?(?:(?:FROM|IN)\s+)?(\w+))",
        std::regex::icase);
    return re;
}

// 문장 앞에 붙는 블록 키워드
constexpr std::array<std::string_view, 4> kTransparentPrefixes = {"BEGIN", "LOOP", "THEN", "ELSE"};

std::string_view strip_transparent_prefixes(std::string_view stmt) noexcept {
    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const auto word : kTransparentPrefixes) {
            if (text_scan::starts_with_word(stmt, word)) {
                stmt     = text_scan::trim(stmt.substr(word.size()));
                stripped = true;
                break;
            }
        }
    }
    return stmt;
}

// 키워드 다음 첫 식별자
std::string first_identifier_after(std::string_view stmt, std::size_t keyword_len) {
    const auto rest = text_scan::trim(stmt.substr(keyword_len));
    std::size_t end = 0;
    while (end < rest.size() && text_scan::is_ident_char(rest[end])) {
        ++end;
    }
    return std::string(rest.substr(0, end));
}

ConstructStep make_step(const char* kind, std::string label, std::string_view raw) {
    ConstructStep step;
    step.kind     = kind;
    step.label    = std::move(label);
    step.raw_text = std::string(raw);
    return step;
}

}  // namespace

std::vector<ConstructStep> CursorOperationsParser::parse_declarations(std::string_view text) const {
    std::vector<ConstructStep> steps;
    for (auto it = std::regex_iterator<SvIter>(text.begin(), text.end(), declare_regex());
         it != std::regex_iterator<SvIter>(); ++it) {
        const auto& m = *it;
        const auto query_begin = static_cast<std::size_t>(m.position(0) + m.length(0));
        auto query_end = text_scan::find_statement_end(text, query_begin);
        if (query_end == std::string_view::npos) {
            query_end = text.size();
        }
        const auto query = text_scan::trim(text.substr(query_begin, query_end - query_begin));
        steps.push_back(make_step("cursor_declare", m[1].str(), query));
    }
    return steps;
}

std::vector<ConstructStep> CursorOperationsParser::parse_operations(std::string_view text) const {
    std::vector<ConstructStep> steps;
    for (const auto raw_stmt : text_scan::split_statements(text)) {
        const auto stmt = strip_transparent_prefixes(raw_stmt);

        if (text_scan::starts_with_word(stmt, "OPEN")) {
            steps.push_back(make_step("cursor_open", first_identifier_after(stmt, 4), stmt));
        } else if (text_scan::starts_with_word(stmt, "CLOSE")) {
            steps.push_back(make_step("cursor_close", first_identifier_after(stmt, 5), stmt));
        } else if (text_scan::starts_with_word(stmt, "FETCH")) {
            SvMatch m;
            if (std::regex_search(stmt.begin(), stmt.end(), m, fetch_regex())) {
                steps.push_back(make_step("cursor_fetch", m[1].str(), stmt));
            }
        } else if (text_scan::starts_with_word(stmt, "MOVE")) {
            SvMatch m;
            if (std::regex_search(stmt.begin(), stmt.end(), m, move_regex())) {
                steps.push_back(make_step("cursor_move", m[1].str(), stmt));
            }
        }
    }
    return steps;
}

std::expected<ConstructParse, ParseError>
CursorOperationsParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    const std::string cleaned = text_scan::remove_comments(text);

    ConstructParse out;
    out.steps = parse_declarations(cleaned);
    const auto declared = out.steps.size();

    auto operations = parse_operations(cleaned);
    const bool has_fetch = std::any_of(operations.begin(), operations.end(),
        [](const ConstructStep& s) { return s.kind == "cursor_fetch"; });
    const auto operation_count = operations.size();
    for (auto& op : operations) {
        out.steps.push_back(std::move(op));
    }

    out.metadata["cursor_count"]    = static_cast<std::int64_t>(declared);
    out.metadata["operation_count"] = static_cast<std::int64_t>(operation_count);
    out.metadata["has_fetch"]       = has_fetch;
    return out;
}
