// ---------------------------------------------------------------------------
// window_function_parser.cpp
// ---------------------------------------------------------------------------

#include "construct/window_function_parser.hpp"

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "construct/text_scan.hpp"

namespace {

bool matches(std::string_view text, const std::regex& re) {
    return std::regex_search(text.begin(), text.end(), re);
}

const std::regex& partition_by_regex() {
    static const std::regex re(R"(\bPARTITION\s+BY\b)", std::regex::icase);
    return re;
}

const std::regex& order_by_regex() {
    static const std::regex re(R"(\bORDER\s+BY\b)", std::regex::icase);
    return re;
}

}  // namespace

std::expected<ConstructParse, ParseError>
WindowFunctionParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    const std::string cleaned = text_scan::remove_comments(text);
    const std::string_view sql{cleaned};

    ConstructParse out;
    bool has_partition_by = false;
    bool has_order_by     = false;
    std::string functions;

    for (auto over_pos = text_scan::find_word(sql, "OVER");
         over_pos != std::string_view::npos;
         over_pos = text_scan::find_word(sql, "OVER", over_pos + 4)) {
        const std::size_t spec_pos = sql.find_first_not_of(" \t\r\n", over_pos + 4);
        if (spec_pos == std::string_view::npos) {
            break;
        }

        std::size_t clause_end = spec_pos;
        if (sql[spec_pos] == '(') {
            const auto span = text_scan::extract_parenthesized(sql, spec_pos);
            if (!span) {
                return std::unexpected(make_parse_error(
                    ParseErrorCode::kUnbalancedParens,
                    "unbalanced parenthesis in OVER clause",
                    sql.substr(over_pos)));
            }
            has_partition_by = has_partition_by || matches(span->content, partition_by_regex());
            has_order_by     = has_order_by     || matches(span->content, order_by_regex());
            clause_end = span->end;
        } else if (text_scan::is_ident_char(sql[spec_pos])) {
            while (clause_end < sql.size() && text_scan::is_ident_char(sql[clause_end])) {
                ++clause_end;
            }
        } else {
            continue;
        }

        const auto call = text_scan::find_call_before(sql, over_pos);
        if (!call) {
            continue;
        }

        ConstructStep step;
        step.kind     = "window_function";
        step.label    = std::string(call->name);
        step.raw_text = std::string(sql.substr(call->begin, clause_end - call->begin));
        out.steps.push_back(std::move(step));

        if (!functions.empty()) {
            functions += ',';
        }
        functions += text_scan::to_lower(call->name);
    }

    out.metadata["function_count"]   = static_cast<std::int64_t>(out.steps.size());
    out.metadata["has_partition_by"] = has_partition_by;
    out.metadata["has_order_by"]     = has_order_by;
    out.metadata["functions"]        = functions;
    return out;
}
