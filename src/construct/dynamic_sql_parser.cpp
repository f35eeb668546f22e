// ---------------------------------------------------------------------------
// dynamic_sql_parser.cpp
// ---------------------------------------------------------------------------

#include "construct/dynamic_sql_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "construct/text_scan.hpp"

namespace {

const std::regex& format_call_regex() {
    static const std::regex re(R"(\bformat\s*\()", std::regex::icase);
    return re;
}

bool has_format_call(std::string_view text) {
    return std::regex_search(text.begin(), text.end(), format_call_regex());
}

const char* classify_statement(std::string_view stmt) {
    if (has_format_call(stmt)) {
        return "format";
    }
    if (stmt.find("||") != std::string_view::npos) {
        return "concat";
    }
    return "literal";
}

}  // namespace

std::expected<ConstructParse, ParseError>
DynamicSqlParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    ConstructParse out;
    bool has_using        = false;
    bool has_into         = false;
    bool saw_bare_execute = false;

    std::size_t pos = text_scan::find_word(text, "EXECUTE");
    while (pos != std::string_view::npos) {
        const std::size_t body_begin = pos + 7;
        const auto after = text_scan::trim(text.substr(body_begin));

        if (text_scan::starts_with_word(after, "PROCEDURE")
            || text_scan::starts_with_word(after, "FUNCTION")) {
            pos = text_scan::find_word(text, "EXECUTE", body_begin);
            continue;
        }

        auto end = text_scan::find_statement_end(text, body_begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const auto stmt = text_scan::trim(text.substr(body_begin, end - body_begin));

        if (stmt.empty()) {
            saw_bare_execute = true;
        } else {
            has_using = has_using || text_scan::contains_word(stmt, "USING");
            has_into  = has_into  || text_scan::contains_word(stmt, "INTO");

            ConstructStep step;
            step.kind     = "dynamic_sql";
            step.label    = classify_statement(stmt);
            step.raw_text = std::string(stmt);
            out.steps.push_back(std::move(step));
        }

        pos = text_scan::find_word(text, "EXECUTE", std::max(end, body_begin));
    }

    if (out.steps.empty() && saw_bare_execute) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kMalformedStatement,
            "EXECUTE without statement text",
            text));
    }

    out.metadata["has_format"]      = has_format_call(text);
    out.metadata["has_using"]       = has_using;
    out.metadata["has_into"]        = has_into;
    out.metadata["statement_count"] = static_cast<std::int64_t>(out.steps.size());
    return out;
}
