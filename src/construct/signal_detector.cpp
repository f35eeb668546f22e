// ---------------------------------------------------------------------------
// signal_detector.cpp
//
// 단일 키워드는 text_scan::contains_word 로, 공백을 사이에 둔 복합 신호
// (OVER (, PARTITION BY, FILTER (WHERE) 는 정규식으로 판정한다.
// 정규식 오류 시에는 단순 단어 탐색으로 폴백하여 예외를 밖으로 내지 않는다.
// ---------------------------------------------------------------------------

#include "construct/signal_detector.hpp"

#include <initializer_list>
#include <regex>
#include <string>
#include <string_view>

#include "construct/text_scan.hpp"

namespace {

bool contains_any_word(std::string_view sql, std::initializer_list<std::string_view> words) noexcept {
    for (const auto word : words) {
        if (text_scan::contains_word(sql, word)) {
            return true;
        }
    }
    return false;
}

// pattern 정규식 검색. regex 예외 시 fallback_word 단어 탐색으로 대체.
bool matches_pattern(std::string_view sql,
                     const char*      pattern,
                     std::string_view fallback_word) noexcept {
    try {
        const std::regex re(pattern,
                            std::regex_constants::icase | std::regex_constants::ECMAScript);
        return std::regex_search(sql.begin(), sql.end(), re);
    } catch (const std::exception&) {
        // regex_error / bad_alloc: 오탐 쪽으로 폴백
        return text_scan::contains_word(sql, fallback_word);
    }
}

}  // namespace

bool should_use_cte_parser(std::string_view sql) noexcept {
    return text_scan::contains_word(sql, "WITH");
}

bool should_use_exception_parser(std::string_view sql) noexcept {
    return text_scan::contains_word(sql, "EXCEPTION");
}

bool should_use_dynamic_sql_parser(std::string_view sql) noexcept {
    return text_scan::contains_word(sql, "EXECUTE");
}

bool should_use_control_flow_parser(std::string_view sql) noexcept {
    return contains_any_word(sql, {"FOR", "LOOP", "WHILE"});
}

bool should_use_window_parser(std::string_view sql) noexcept {
    return matches_pattern(sql, "\\bOVER\\s*\\(", "OVER")
        || matches_pattern(sql, "\\bPARTITION\\s+BY\\b", "PARTITION")
        || text_scan::contains_word(sql, "ROW_NUMBER");
}

bool should_use_aggregate_parser(std::string_view sql) noexcept {
    return matches_pattern(sql, "\\bFILTER\\s*\\(\\s*WHERE\\b", "FILTER");
}

bool should_use_cursor_parser(std::string_view sql) noexcept {
    return contains_any_word(sql, {"CURSOR", "FETCH", "OPEN", "CLOSE"});
}

bool should_use_parser(ConstructKind kind, std::string_view sql) noexcept {
    switch (kind) {
        case ConstructKind::kCte:             return should_use_cte_parser(sql);
        case ConstructKind::kException:       return should_use_exception_parser(sql);
        case ConstructKind::kDynamicSql:      return should_use_dynamic_sql_parser(sql);
        case ConstructKind::kControlFlow:     return should_use_control_flow_parser(sql);
        case ConstructKind::kWindow:          return should_use_window_parser(sql);
        case ConstructKind::kAggregateFilter: return should_use_aggregate_parser(sql);
        case ConstructKind::kCursor:          return should_use_cursor_parser(sql);
    }
    return false;
}
