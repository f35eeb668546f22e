// ---------------------------------------------------------------------------
// aggregate_filter_parser.cpp
// ---------------------------------------------------------------------------

#include "construct/aggregate_filter_parser.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "construct/text_scan.hpp"

std::expected<ConstructParse, ParseError>
AggregateFilterParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    const std::string cleaned = text_scan::remove_comments(text);
    const std::string_view sql{cleaned};

    ConstructParse out;
    std::string aggregates;

    for (auto filter_pos = text_scan::find_word(sql, "FILTER");
         filter_pos != std::string_view::npos;
         filter_pos = text_scan::find_word(sql, "FILTER", filter_pos + 6)) {
        const std::size_t open_pos = sql.find_first_not_of(" \t\r\n", filter_pos + 6);
        if (open_pos == std::string_view::npos || sql[open_pos] != '(') {
            continue;
        }
        const auto inner = text_scan::trim(sql.substr(open_pos + 1));
        if (!text_scan::starts_with_word(inner, "WHERE")) {
            continue;
        }

        const auto span = text_scan::extract_parenthesized(sql, open_pos);
        if (!span) {
            return std::unexpected(make_parse_error(
                ParseErrorCode::kUnbalancedParens,
                "unbalanced parenthesis in FILTER clause",
                sql.substr(filter_pos)));
        }

        const auto call = text_scan::find_call_before(sql, filter_pos);
        if (!call) {
            continue;
        }

        ConstructStep step;
        step.kind     = "aggregate_filter";
        step.label    = std::string(call->name);
        step.raw_text = std::string(sql.substr(call->begin, span->end - call->begin));
        out.steps.push_back(std::move(step));

        if (!aggregates.empty()) {
            aggregates += ',';
        }
        aggregates += text_scan::to_lower(call->name);
    }

    out.metadata["filter_count"] = static_cast<std::int64_t>(out.steps.size());
    out.metadata["aggregates"]   = aggregates;
    return out;
}
