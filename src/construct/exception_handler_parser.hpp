#pragma once

// ---------------------------------------------------------------------------
// exception_handler_parser.hpp
//
// PL/pgSQL 블록의 EXCEPTION WHEN ... THEN ... 처리부를 탐지한다.
//
// [설계 한계]
// 1. 첫 번째 단어 경계 EXCEPTION 에서 한 번만 분리한다. 중첩 블록의
//    두 번째 EXCEPTION 절은 첫 번째 절의 나머지 텍스트에 포함된다.
// 2. RAISE EXCEPTION 도 분리 지점이 될 수 있다 (false positive).
//    이 경우 WHEN 이 없으면 handler_count 0 인 단일 step 이 된다.
// 3. 개별 핸들러 (조건, 동작) 목록은 검증용으로만 계산하며 step 으로
//    노출하지 않는다. 블록 전체를 try-except step 하나로 요약한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

// ---------------------------------------------------------------------------
// ExceptionHandler
//   WHEN <condition> THEN <action> 한 쌍.
// ---------------------------------------------------------------------------
struct ExceptionHandler {
    std::string condition{};
    std::string action{};
};

class ExceptionHandlerParser {
public:
    ExceptionHandlerParser()  = default;
    ~ExceptionHandlerParser() = default;

    ExceptionHandlerParser(const ExceptionHandlerParser&)            = default;
    ExceptionHandlerParser& operator=(const ExceptionHandlerParser&) = default;
    ExceptionHandlerParser(ExceptionHandlerParser&&)                 = default;
    ExceptionHandlerParser& operator=(ExceptionHandlerParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   EXCEPTION 이 없으면 빈 steps 를 반환한다.
    //   WHEN 세그먼트에 THEN 이 없으면 kMissingKeyword.
    //   metadata: handler_count (text 전체의 단어 경계 WHEN 개수)
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;

    // EXCEPTION 이후 텍스트를 (condition, action) 목록으로 분해한다.
    [[nodiscard]] std::expected<std::vector<ExceptionHandler>, ParseError>
    extract_handlers(std::string_view exception_block) const;

    // 파서 자체 가산치. ParserCoordinator 는 자체 정책표(+0.05)를 쓰며
    // 이 값을 읽지 않는다.
    [[nodiscard]] static constexpr double confidence_boost() noexcept { return 0.15; }
};
