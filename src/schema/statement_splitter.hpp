#pragma once

// ---------------------------------------------------------------------------
// statement_splitter.hpp
//
// DDL 스크립트를 문장 단위로 분리하고 선행 키워드로 분류한다.
//
// [분리 규칙]
// - ';' 는 작은따옴표 문자열, 큰따옴표 식별자, -- / /* */ 주석,
//   $tag$ dollar-quote 본문 밖에서만 문장 종결자로 본다.
// - 공백/주석만 있는 문장은 버린다.
//
// [분류 규칙] 주석 제거 + 대문자 정규화 후 선행 키워드 비교
// - CREATE [GLOBAL|LOCAL] [UNLOGGED|TEMP|TEMPORARY] TABLE -> kCreateTable
// - COMMENT ON TABLE  -> kCommentOnTable
// - COMMENT ON COLUMN -> kCommentOnColumn
// - CREATE [OR REPLACE] FUNCTION|PROCEDURE -> kCreateFunction
// - 그 외 -> kOther
// ---------------------------------------------------------------------------

#include <string_view>
#include <vector>

#include "schema/schema_types.hpp"

class StatementSplitter {
public:
    StatementSplitter()  = default;
    ~StatementSplitter() = default;

    StatementSplitter(const StatementSplitter&)            = default;
    StatementSplitter& operator=(const StatementSplitter&) = default;
    StatementSplitter(StatementSplitter&&)                 = default;
    StatementSplitter& operator=(StatementSplitter&&)      = default;

    [[nodiscard]] std::vector<SqlStatement> split(std::string_view script) const;

    [[nodiscard]] static StatementKind classify(std::string_view statement);
};
