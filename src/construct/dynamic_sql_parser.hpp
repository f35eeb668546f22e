#pragma once

// ---------------------------------------------------------------------------
// dynamic_sql_parser.hpp
//
// PL/pgSQL 동적 SQL (EXECUTE <expr> [INTO ...] [USING ...];) 을 탐지한다.
//
// [설계 한계]
// 1. 문자열 리터럴 안의 실제 SQL 은 해석하지 않는다. 구성 방식만 분류한다.
//    - format : format(...) 으로 조립
//    - concat : || 연결로 조립
//    - literal: 그 외 (상수 문자열, 변수)
// 2. EXECUTE PROCEDURE / EXECUTE FUNCTION (트리거 정의) 은 제외한다.
// 3. 변수에 미리 조립한 SQL (EXECUTE v_sql;) 은 literal 로 분류된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

class DynamicSqlParser {
public:
    DynamicSqlParser()  = default;
    ~DynamicSqlParser() = default;

    DynamicSqlParser(const DynamicSqlParser&)            = default;
    DynamicSqlParser& operator=(const DynamicSqlParser&) = default;
    DynamicSqlParser(DynamicSqlParser&&)                 = default;
    DynamicSqlParser& operator=(DynamicSqlParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   steps: kind "dynamic_sql", label format|concat|literal,
    //          raw_text = EXECUTE 뒤 ';' 전까지의 식 (trim)
    //   문장이 하나도 없고 빈 EXECUTE 만 있으면 kMalformedStatement.
    //   metadata: has_format, has_using, has_into, statement_count
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;
};
