// ---------------------------------------------------------------------------
// cte_parser.cpp
// ---------------------------------------------------------------------------

#include "construct/cte_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "construct/text_scan.hpp"

namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

const std::regex& cte_head_regex() {
    static const std::regex re(R"((\w+)\s+AS\s*\()", std::regex::icase);
    return re;
}

std::int64_t count_cte_heads(std::string_view text) {
    const auto begin = std::regex_iterator<std::string_view::const_iterator>(
        text.begin(), text.end(), cte_head_regex());
    const auto end = std::regex_iterator<std::string_view::const_iterator>();
    return static_cast<std::int64_t>(std::distance(begin, end));
}

void add_unique(std::vector<std::string>& out, const char* name) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.emplace_back(name);
    }
}

}  // namespace

std::expected<std::vector<ConstructStep>, ParseError>
CteParser::parse_clauses(std::string_view text, std::size_t depth) const {
    if (depth > kMaxNestingDepth) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kNestingTooDeep,
            "CTE nesting exceeds " + std::to_string(kMaxNestingDepth) + " levels",
            text));
    }

    std::vector<ConstructStep> steps;
    std::size_t consumed_end = 0;

    for (auto with_pos = text_scan::find_word(text, "WITH");
         with_pos != std::string_view::npos;
         with_pos = text_scan::find_word(text, "WITH", with_pos + 4)) {
        if (with_pos < consumed_end) {
            continue;
        }

        std::size_t pos = with_pos + 4;
        const auto recursive_pos = text_scan::find_word(text, "RECURSIVE", pos);
        if (recursive_pos != std::string_view::npos
            && text_scan::trim(text.substr(pos, recursive_pos - pos)).empty()) {
            pos = recursive_pos + 9;
        }

        while (pos < text.size()) {
            SvMatch m;
            if (!std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(pos),
                                   text.end(), m, cte_head_regex())) {
                break;
            }
            const std::string name = m[1].str();
            const std::size_t open_pos =
                pos + static_cast<std::size_t>(m.position(0) + m.length(0)) - 1;

            const auto span = text_scan::extract_parenthesized(text, open_pos);
            if (!span) {
                break;
            }

            if (text_scan::contains_word(span->content, "WITH")) {
                auto nested = parse_clauses(span->content, depth + 1);
                if (!nested) {
                    return std::unexpected(std::move(nested.error()));
                }
                for (auto& step : *nested) {
                    steps.push_back(std::move(step));
                }
            }

            ConstructStep step;
            step.kind     = "cte";
            step.label    = name;
            step.raw_text = std::string(text_scan::trim(span->content));
            steps.push_back(std::move(step));

            pos          = span->end;
            consumed_end = std::max(consumed_end, span->end);

            const auto rest    = text.substr(pos);
            const auto trimmed = text_scan::trim(rest);
            if (trimmed.empty() || trimmed.front() != ',') {
                break;
            }
            pos += (rest.size() - trimmed.size()) + 1;
        }
    }
    return steps;
}

std::expected<ConstructParse, ParseError>
CteParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    ConstructParse out;
    out.metadata["is_recursive"] = text_scan::contains_word(text, "RECURSIVE");
    out.metadata["cte_count"]    = count_cte_heads(text);

    auto steps = parse_clauses(text, 0);
    if (!steps) {
        return std::unexpected(std::move(steps.error()));
    }
    out.steps = std::move(*steps);
    return out;
}

std::vector<std::string> CteParser::detect_patterns(const std::vector<ConstructStep>& steps) {
    std::vector<std::string> patterns;
    for (const auto& step : steps) {
        if (step.raw_text.empty()) {
            continue;
        }
        const std::string query = text_scan::to_upper(step.raw_text);
        const auto has = [&query](std::string_view needle) {
            return query.find(needle) != std::string::npos;
        };

        if (has("UNION") && (has("PARENT") || has("CHILD") || has("LEVEL"))) {
            add_unique(patterns, "recursive_hierarchy");
        }
        if (has("CONNECT BY")) {
            add_unique(patterns, "tree_traversal");
        }
        if (has("PATH") && (has("CONCAT") || has("||"))) {
            add_unique(patterns, "materialized_path");
        }
    }
    return patterns;
}
