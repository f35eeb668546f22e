// ---------------------------------------------------------------------------
// function_parser.cpp
// ---------------------------------------------------------------------------

#include "schema/function_parser.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "construct/text_scan.hpp"
#include "schema/identifier.hpp"

namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

const std::regex& create_routine_regex() {
    static const std::regex re(R"(^\s*CREATE\s+(?:OR\s+REPLACE\s+)?(FUNCTION|PROCEDURE)\s+)",
                               std::regex::icase);
    return re;
}

// 헤더 해석 실패 시 이름만 찾는 느슨한 패턴
const std::regex& loose_name_regex() {
    static const std::regex re(R"(\b(FUNCTION|PROCEDURE)\s+([\w."]+))", std::regex::icase);
    return re;
}

const std::regex& language_regex() {
    static const std::regex re(R"(\bLANGUAGE\s+'?(\w+)'?)", std::regex::icase);
    return re;
}

// RETURNS 절의 끝을 나타내는 키워드
constexpr std::array<std::string_view, 11> kReturnTerminators = {
    "LANGUAGE", "AS", "IMMUTABLE", "STABLE", "VOLATILE", "SECURITY",
    "STRICT", "CALLED", "PARALLEL", "COST", "SET",
};

std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept {
    const auto p = text.find_first_not_of(" \t\r\n", pos);
    return (p == std::string_view::npos) ? text.size() : p;
}

RoutineKind routine_kind(std::string_view word) noexcept {
    return text_scan::iequals(word, "PROCEDURE") ? RoutineKind::kProcedure : RoutineKind::kFunction;
}

// $tag$ 본문, 없으면 AS '...' 리터럴
std::optional<std::string> extract_body(std::string_view text) {
    if (const auto body = text_scan::dollar_quoted_body(text)) {
        return std::string(*body);
    }
    const auto as_pos = text_scan::find_top_level_word(text, "AS");
    if (as_pos == std::string_view::npos) {
        return std::nullopt;
    }
    return read_string_literal(text, skip_spaces(text, as_pos + 2));
}

std::string extract_language(std::string_view text) {
    // 본문 안의 LANGUAGE 단어를 피하기 위해 본문을 제외하고 찾는다
    std::string outside;
    std::size_t i = 0;
    while (i < text.size()) {
        const auto skipped = text_scan::skip_literal_or_comment(text, i);
        if (skipped != i) {
            outside.push_back(' ');
            i = skipped;
            continue;
        }
        outside.push_back(text[i]);
        ++i;
    }
    std::smatch m;
    if (std::regex_search(outside, m, language_regex())) {
        return text_scan::to_lower(m[1].str());
    }
    return {};
}

std::string extract_return_type(std::string_view tail) {
    const auto returns_pos = text_scan::find_top_level_word(tail, "RETURNS");
    if (returns_pos == std::string_view::npos) {
        return {};
    }
    const std::size_t begin = returns_pos + 7;
    std::size_t end = tail.size();
    for (const auto word : kReturnTerminators) {
        const auto pos = text_scan::find_top_level_word(tail, word, begin);
        if (pos != std::string_view::npos) {
            end = std::min(end, pos);
        }
    }
    return text_scan::collapse_whitespace(tail.substr(begin, end - begin));
}

}  // namespace

std::expected<ParsedFunction, ParseError> FunctionParser::parse(std::string_view statement) const {
    if (text_scan::trim(statement).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty statement", statement));
    }

    const std::string cleaned = text_scan::remove_comments(statement);
    const std::string_view sql{cleaned};

    SvMatch header;
    if (!std::regex_search(sql.begin(), sql.end(), header, create_routine_regex())) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kUnsupportedStatement, "not a CREATE FUNCTION/PROCEDURE statement",
            statement));
    }

    ParsedFunction fn;
    fn.kind = routine_kind(header[1].str());

    const auto name = read_qualified_name(sql, static_cast<std::size_t>(header.length(0)));
    std::optional<text_scan::ParenSpan> params;
    if (name) {
        const auto open = skip_spaces(sql, name->end);
        if (open < sql.size() && sql[open] == '(') {
            params = text_scan::extract_parenthesized(sql, open);
        }
    }

    if (name && params) {
        fn.function_name = name->name();
        if (auto schema = name->qualifier()) {
            fn.schema = std::move(*schema);
        }
        fn.parameters  = text_scan::collapse_whitespace(params->content);
        fn.return_type = extract_return_type(sql.substr(params->end));
    } else {
        // 헤더 해석 실패: 느슨한 패턴으로 이름만 찾는다
        SvMatch loose;
        if (!std::regex_search(sql.begin(), sql.end(), loose, loose_name_regex())) {
            return std::unexpected(make_parse_error(
                ParseErrorCode::kMalformedStatement, "cannot find routine name", statement));
        }
        const auto loose_name = read_qualified_name(loose[2].str(), 0);
        fn.function_name = loose_name ? loose_name->name() : loose[2].str();
        if (loose_name) {
            if (auto schema = loose_name->qualifier()) {
                fn.schema = std::move(*schema);
            }
        }
        fn.used_fallback = true;
        spdlog::warn("function_parser: header not recognized, fallback used for '{}'",
                     fn.function_name);
    }

    auto body = extract_body(sql);
    if (!body) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement, "routine has no body", statement));
    }
    fn.body     = std::move(*body);
    fn.language = extract_language(sql);
    return fn;
}
