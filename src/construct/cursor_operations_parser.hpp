#pragma once

// ---------------------------------------------------------------------------
// cursor_operations_parser.hpp
//
// 명시적 커서 선언과 OPEN / FETCH / MOVE / CLOSE 구문을 추출한다.
//
// [설계 한계]
// 1. 선언은 "name [NO] [SCROLL] CURSOR [(args)] FOR query;" 형태만 인식한다.
//    refcursor 변수 선언(c refcursor;) 은 커서 선언으로 보지 않는다.
// 2. 조작 구문은 문장 첫 단어로 판정한다. BEGIN/LOOP/THEN/ELSE 는
//    문장 앞에 붙어 있어도 건너뛴다. IF ... THEN CLOSE c; 처럼
//    조건식 뒤에 오는 구문은 놓친다 (false negative).
// 3. FETCH 는 "cursor INTO target" 을 해석하지 못하면 건너뛴다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

class CursorOperationsParser {
public:
    CursorOperationsParser()  = default;
    ~CursorOperationsParser() = default;

    CursorOperationsParser(const CursorOperationsParser&)            = default;
    CursorOperationsParser& operator=(const CursorOperationsParser&) = default;
    CursorOperationsParser(CursorOperationsParser&&)                 = default;
    CursorOperationsParser& operator=(CursorOperationsParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   선언 step 이 먼저, 조작 step 이 등장 순서대로 뒤따른다.
    //   kinds: cursor_declare, cursor_open, cursor_fetch, cursor_move, cursor_close
    //   metadata: cursor_count, operation_count, has_fetch
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;

private:
    [[nodiscard]] std::vector<ConstructStep> parse_declarations(std::string_view text) const;
    [[nodiscard]] std::vector<ConstructStep> parse_operations(std::string_view text) const;
};
