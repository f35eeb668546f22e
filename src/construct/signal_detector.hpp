#pragma once

// ---------------------------------------------------------------------------
// signal_detector.hpp
//
// 특수 구문 파서 호출 여부를 결정하는 저비용 어휘 신호 탐지기.
// 모든 함수는 상태가 없고 예외를 던지지 않는다.
//
// [오탐/미탐 트레이드오프]
// - 오탐 허용: 주석/문자열 안의 키워드도 신호로 본다. 호출된 파서가
//   구문 부재 시 빈 결과를 반환하므로 정확성의 유일한 관문이 아니다.
// - 미탐 금지: 신호가 false 이면 해당 파서는 아예 호출되지 않는다.
//   따라서 패턴은 넓게 잡는다.
// ---------------------------------------------------------------------------

#include <string_view>

#include "construct/construct_types.hpp"

// WITH (단어 경계, 대소문자 무시)
[[nodiscard]] bool should_use_cte_parser(std::string_view sql) noexcept;

// EXCEPTION
[[nodiscard]] bool should_use_exception_parser(std::string_view sql) noexcept;

// EXECUTE
[[nodiscard]] bool should_use_dynamic_sql_parser(std::string_view sql) noexcept;

// FOR | LOOP | WHILE
[[nodiscard]] bool should_use_control_flow_parser(std::string_view sql) noexcept;

// OVER ( | PARTITION BY | ROW_NUMBER
[[nodiscard]] bool should_use_window_parser(std::string_view sql) noexcept;

// FILTER ( WHERE
[[nodiscard]] bool should_use_aggregate_parser(std::string_view sql) noexcept;

// CURSOR | FETCH | OPEN | CLOSE
[[nodiscard]] bool should_use_cursor_parser(std::string_view sql) noexcept;

// ConstructKind 별 탐지기 디스패치
[[nodiscard]] bool should_use_parser(ConstructKind kind, std::string_view sql) noexcept;
