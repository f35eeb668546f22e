#pragma once

// ---------------------------------------------------------------------------
// cte_parser.hpp
//
// WITH [RECURSIVE] name AS (...) [, name AS (...)] 공통 테이블 식을 추출한다.
//
// [설계 한계]
// 1. "<name> AS (" 패턴만 인식한다. 컬럼 목록을 붙인 name(a, b) AS (...)
//    형태는 이름 없이 건너뛴다.
// 2. CTE 본문 안의 WITH 는 재귀적으로 파싱하며 최대 10 단계까지 허용한다.
//    이미 소비한 본문 안의 WITH 는 바깥 스캔에서 다시 보지 않는다.
// 3. 쉼표 없이 이어지는 텍스트(본 쿼리)를 만나면 절이 끝난 것으로 본다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

class CteParser {
public:
    static constexpr std::size_t kMaxNestingDepth = 10;

    CteParser()  = default;
    ~CteParser() = default;

    CteParser(const CteParser&)            = default;
    CteParser& operator=(const CteParser&) = default;
    CteParser(CteParser&&)                 = default;
    CteParser& operator=(CteParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   steps: kind "cte", label = CTE 이름, raw_text = trim 된 본문.
    //   중첩 CTE 는 바깥 CTE 보다 먼저 나온다.
    //   metadata: is_recursive, cte_count
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;

    // -----------------------------------------------------------------------
    // detect_patterns
    //   CTE 본문에서 계층 질의 관용구를 찾는다. 중복 없이 발견 순서대로 반환.
    //   - recursive_hierarchy: UNION + (PARENT | CHILD | LEVEL)
    //   - tree_traversal:      CONNECT BY
    //   - materialized_path:   PATH + (CONCAT | ||)
    // -----------------------------------------------------------------------
    [[nodiscard]] static std::vector<std::string>
    detect_patterns(const std::vector<ConstructStep>& steps);

private:
    [[nodiscard]] std::expected<std::vector<ConstructStep>, ParseError>
    parse_clauses(std::string_view text, std::size_t depth) const;
};
