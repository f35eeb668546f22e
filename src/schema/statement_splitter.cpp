// ---------------------------------------------------------------------------
// statement_splitter.cpp
// ---------------------------------------------------------------------------

#include "schema/statement_splitter.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "construct/text_scan.hpp"

namespace {

struct KindPattern {
    const char*   pattern;
    StatementKind kind;
};

// 선언 순서대로 검사한다
constexpr KindPattern kKindPatterns[] = {
    {R"(^CREATE\s+(?:(?:GLOBAL|LOCAL)\s+)?(?:(?:UNLOGGED|TEMP|TEMPORARY)\s+)?TABLE\b)",
     StatementKind::kCreateTable},
    {R"(^COMMENT\s+ON\s+TABLE\b)",  StatementKind::kCommentOnTable},
    {R"(^COMMENT\s+ON\s+COLUMN\b)", StatementKind::kCommentOnColumn},
    {R"(^CREATE\s+(?:OR\s+REPLACE\s+)?(?:FUNCTION|PROCEDURE)\b)",
     StatementKind::kCreateFunction},
};

}  // namespace

StatementKind StatementSplitter::classify(std::string_view statement) {
    const std::string normalized =
        text_scan::to_upper(text_scan::trim(text_scan::remove_comments(statement)));
    if (normalized.empty()) {
        return StatementKind::kOther;
    }

    for (const auto& entry : kKindPatterns) {
        try {
            const std::regex re(entry.pattern, std::regex_constants::ECMAScript);
            if (std::regex_search(normalized, re)) {
                return entry.kind;
            }
        } catch (const std::regex_error& e) {
            spdlog::warn("statement_splitter: regex error for '{}': {}", entry.pattern, e.what());
        }
    }
    return StatementKind::kOther;
}

std::vector<SqlStatement> StatementSplitter::split(std::string_view script) const {
    std::vector<SqlStatement> statements;
    for (const auto piece : text_scan::split_statements(script)) {
        // 주석만 있는 조각
        if (text_scan::trim(text_scan::remove_comments(piece)).empty()) {
            continue;
        }
        SqlStatement stmt;
        stmt.kind  = classify(piece);
        stmt.text  = std::string(piece);
        stmt.index = statements.size();
        statements.push_back(std::move(stmt));
    }
    spdlog::debug("statement_splitter: {} statements", statements.size());
    return statements;
}
