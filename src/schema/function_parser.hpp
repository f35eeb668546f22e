#pragma once

// ---------------------------------------------------------------------------
// function_parser.hpp
//
// CREATE [OR REPLACE] FUNCTION | PROCEDURE 문에서 이름/인자/반환형/언어/
// 본문을 추출한다.
//
// [설계 한계]
// 1. 본문은 첫 번째 $tag$ ... $tag$ 영역 또는 AS '...' 리터럴만 인식한다.
// 2. 헤더를 해석하지 못하면 느슨한 패턴으로 이름과 본문만 추출하고
//    used_fallback 을 설정한다. 파이프라인은 이 경우 baseline 에
//    fallback_penalty 를 곱한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"
#include "schema/schema_types.hpp"

class FunctionParser {
public:
    FunctionParser()  = default;
    ~FunctionParser() = default;

    FunctionParser(const FunctionParser&)            = default;
    FunctionParser& operator=(const FunctionParser&) = default;
    FunctionParser(FunctionParser&&)                 = default;
    FunctionParser& operator=(FunctionParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   CREATE FUNCTION/PROCEDURE 가 아니면 kUnsupportedStatement.
    //   본문이 없으면 kMalformedStatement.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ParsedFunction, ParseError> parse(std::string_view statement) const;
};
