#pragma once

// ---------------------------------------------------------------------------
// control_flow_parser.hpp
//
// PL/pgSQL 제어 흐름 (IF / FOR / FOREACH / WHILE / LOOP) 을 문장 트리로
// 복원하는 소형 재귀 하강 스캐너.
//
// [인식 규칙]
// - IF c THEN ... [ELSIF c THEN ...]* [ELSE ...] END IF;
//     kind "if", label = 조건식. ELSIF 는 else_branch 안의 단일 if 로 중첩.
// - FOR h LOOP ... END LOOP;
//     header 에 ".." 가 있으면 "for_range", 없으면 "for_query"
//     (SELECT / EXECUTE / 커서 순회).
// - FOREACH h LOOP ... END LOOP;   kind "foreach"
// - WHILE c LOOP ... END LOOP;     kind "while"
// - LOOP ... END LOOP;             kind "loop"
// - 본문은 then_branch 에 담긴다. 본문 안의 일반 문장은 kind "statement".
//   최상위 일반 문장은 버린다.
// - BEGIN / DECLARE / 블록 END / EXCEPTION / CASE 는 투명하게 통과한다.
//   WHEN ... THEN 접두부는 건너뛴다.
// - 입력에 $tag$ 본문이 있으면 그 본문만 스캔한다.
//
// [설계 한계]
// 1. CASE 문 분기는 둘러싼 본문에 평탄화된다.
// 2. <<label>> 은 무시한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string_view>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

class ControlFlowParser {
public:
    static constexpr std::size_t kMaxNestingDepth = 32;

    ControlFlowParser()  = default;
    ~ControlFlowParser() = default;

    ControlFlowParser(const ControlFlowParser&)            = default;
    ControlFlowParser& operator=(const ControlFlowParser&) = default;
    ControlFlowParser(ControlFlowParser&&)                 = default;
    ControlFlowParser& operator=(ControlFlowParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   닫히지 않은 블록: kMalformedStatement
    //   IF 뒤 THEN / FOR 뒤 LOOP 누락: kMissingKeyword
    //   32 단계 초과 중첩: kNestingTooDeep
    //   metadata: loop_count, branch_count, max_depth
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;
};
