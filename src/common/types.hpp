#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// ---------------------------------------------------------------------------
// ParseErrorCode
//   DDL/PLpgSQL 파싱 단계에서 발생 가능한 오류 분류.
//   특수 구문 파서와 테이블/함수 파서가 공통으로 사용한다.
//   ParserCoordinator 는 모든 코드를 switch 로 매칭하여 복구한다.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kEmptyInput           = 0,  // 빈 입력 또는 공백만 있는 입력
    kMalformedStatement   = 1,  // 구문 구조가 올바르지 않음 (미종료 블록 등)
    kUnbalancedParens     = 2,  // 괄호 짝이 맞지 않음
    kMissingKeyword       = 3,  // 필수 키워드 누락 (예: WHEN 뒤 THEN 없음)
    kNestingTooDeep       = 4,  // 중첩 깊이 제한 초과
    kUnsupportedStatement = 5,  // 이 파서가 다루지 않는 구문
    kInternalError        = 6,  // 파서 내부 오류 (예: regex 예외)
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 입력 단편 (로깅용, 앞부분만)
};

// ---------------------------------------------------------------------------
// parse_error_code_name
//   로그 출력용 코드 이름. 알 수 없는 값은 "unknown".
// ---------------------------------------------------------------------------
[[nodiscard]] constexpr std::string_view parse_error_code_name(ParseErrorCode code) noexcept {
    switch (code) {
        case ParseErrorCode::kEmptyInput:           return "empty_input";
        case ParseErrorCode::kMalformedStatement:   return "malformed_statement";
        case ParseErrorCode::kUnbalancedParens:     return "unbalanced_parens";
        case ParseErrorCode::kMissingKeyword:       return "missing_keyword";
        case ParseErrorCode::kNestingTooDeep:       return "nesting_too_deep";
        case ParseErrorCode::kUnsupportedStatement: return "unsupported_statement";
        case ParseErrorCode::kInternalError:        return "internal_error";
    }
    return "unknown";
}

// 오류 context 에 담을 입력 앞부분 길이
inline constexpr std::size_t kErrorContextLength = 120;

// ---------------------------------------------------------------------------
// make_parse_error
//   context 는 입력 앞부분 kErrorContextLength 바이트만 보존한다.
// ---------------------------------------------------------------------------
[[nodiscard]] inline ParseError make_parse_error(ParseErrorCode   code,
                                                 std::string      message,
                                                 std::string_view input) {
    return ParseError{
        code,
        std::move(message),
        std::string(input.substr(0, kErrorContextLength))
    };
}
