#pragma once

// ---------------------------------------------------------------------------
// table_parser.hpp
//
// CREATE TABLE 문과 COMMENT ON TABLE/COLUMN 문을 해석한다.
//
// [지원 범위]
// - CREATE [GLOBAL|LOCAL] [UNLOGGED|TEMP|TEMPORARY] TABLE [IF NOT EXISTS]
//   [schema.]name ( element, ... )
// - 컬럼: name type [NOT NULL] [NULL] [PRIMARY KEY] [UNIQUE] [DEFAULT expr]
//         [REFERENCES [schema.]table [(col)]] [CHECK (...)]
// - 테이블 제약: [CONSTRAINT n] PRIMARY KEY (...) | UNIQUE (...) |
//               CHECK (...) | FOREIGN KEY (c) REFERENCES t
//
// [설계 한계]
// 1. PARTITION OF / LIKE / INHERITS 는 컬럼 정보를 얻지 못한다.
//    (LIKE 요소는 건너뛰고 나머지 컬럼만 해석한다.)
// 2. 복합 FOREIGN KEY 는 첫 번째 컬럼에만 references_table 을 기록한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "schema/schema_types.hpp"

class TableParser {
public:
    TableParser()  = default;
    ~TableParser() = default;

    TableParser(const TableParser&)            = default;
    TableParser& operator=(const TableParser&) = default;
    TableParser(TableParser&&)                 = default;
    TableParser& operator=(TableParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   CREATE TABLE 이 아니면 kUnsupportedStatement.
    //   요소 목록 괄호 짝 불일치 kUnbalancedParens, 컬럼 0개 kMalformedStatement.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ParsedTable, ParseError> parse(std::string_view statement) const;

    // COMMENT ON TABLE | COLUMN ... IS '...' | NULL
    [[nodiscard]] std::expected<CommentStatement, ParseError>
    parse_comment(std::string_view statement) const;

    // -----------------------------------------------------------------------
    // attach_comments
    //   테이블 이름(대소문자 무시) 과 schema(지정된 경우) 가 일치하는 테이블에
    //   주석을 붙인다. 같은 대상의 주석이 여럿이면 마지막 것이 남는다.
    //   반환값: 대상을 찾지 못한 주석 수
    // -----------------------------------------------------------------------
    static std::size_t attach_comments(std::vector<ParsedTable>&            tables,
                                       const std::vector<CommentStatement>& comments);
};
