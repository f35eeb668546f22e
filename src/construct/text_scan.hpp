#pragma once

// ---------------------------------------------------------------------------
// text_scan.hpp
//
// 파서 공용 어휘 스캔 헬퍼.
// 문법 트리를 만들지 않는 "키워드 + 괄호 매칭" 수준의 경량 스캐너다.
//
// [인식하는 어휘 영역]
// - '...'         문자열 리터럴 ('' 이스케이프 포함)
// - "..."         따옴표 식별자
// - $tag$...$tag$ PostgreSQL dollar-quote (태그 없는 $$ 포함, $1 같은
//                 위치 파라미터는 dollar-quote 로 보지 않는다)
// - -- ...        줄 주석
// - /* ... */     블록 주석 (중첩 미지원)
//
// [설계 한계]
// - E'...' 의 백슬래시 이스케이프는 처리하지 않는다.
// - 키워드 비교는 ASCII 대소문자 무시 비교만 수행한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace text_scan {

// 식별자 구성 문자인지 (알파벳, 숫자, 밑줄)
[[nodiscard]] bool is_ident_char(char c) noexcept;

[[nodiscard]] std::string to_upper(std::string_view s);
[[nodiscard]] std::string to_lower(std::string_view s);

// 앞뒤 공백(스페이스, 탭, 개행) 제거
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// text 가 word 로 시작하고 바로 뒤가 식별자 문자가 아니면 true (대소문자 무시)
[[nodiscard]] bool starts_with_word(std::string_view text, std::string_view word) noexcept;

// ---------------------------------------------------------------------------
// find_word
//   from 이후 첫 번째 word 의 위치 (대소문자 무시, 단어 경계 적용).
//   리터럴/주석을 구분하지 않는 원문 스캔. 없으면 npos.
// ---------------------------------------------------------------------------
[[nodiscard]] std::size_t find_word(std::string_view text,
                                    std::string_view word,
                                    std::size_t      from = 0) noexcept;

[[nodiscard]] bool contains_word(std::string_view text, std::string_view word) noexcept;

[[nodiscard]] std::size_t count_words(std::string_view text, std::string_view word) noexcept;

// ---------------------------------------------------------------------------
// skip_literal_or_comment
//   pos 가 문자열/식별자/dollar-quote/주석의 시작이면 그 영역 바로 뒤
//   위치를 반환한다. 시작이 아니면 pos 를 그대로 반환한다.
//   닫히지 않은 영역은 text.size() 를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::size_t skip_literal_or_comment(std::string_view text,
                                                  std::size_t      pos) noexcept;

// ---------------------------------------------------------------------------
// find_top_level_word
//   리터럴/주석 밖, 괄호 깊이 0 에서 word 를 찾는다. 없으면 npos.
// ---------------------------------------------------------------------------
[[nodiscard]] std::size_t find_top_level_word(std::string_view text,
                                              std::string_view word,
                                              std::size_t      from = 0) noexcept;

// ---------------------------------------------------------------------------
// find_statement_end
//   from 이후 리터럴/주석 밖의 첫 ';' 위치. 없으면 npos.
// ---------------------------------------------------------------------------
[[nodiscard]] std::size_t find_statement_end(std::string_view text,
                                             std::size_t      from = 0) noexcept;

// ---------------------------------------------------------------------------
// split_statements
//   리터럴/주석 밖 ';' 기준으로 분리한다. 각 조각은 trim 되며 빈 조각은 제외.
//   반환된 view 는 text 의 수명에 종속된다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string_view> split_statements(std::string_view text);

// ---------------------------------------------------------------------------
// split_top_level_commas
//   괄호 깊이 0, 리터럴 밖의 ',' 기준으로 분리한다 (CREATE TABLE 요소 목록용).
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string_view> split_top_level_commas(std::string_view text);

// ---------------------------------------------------------------------------
// ParenSpan
//   extract_parenthesized 결과.
//   content 는 바깥 괄호를 제외한 내용, end 는 닫는 ')' 바로 뒤 위치.
// ---------------------------------------------------------------------------
struct ParenSpan {
    std::string_view content{};
    std::size_t      end{0};
};

// ---------------------------------------------------------------------------
// extract_parenthesized
//   text[open_pos] 가 '(' 일 때 짝이 맞는 ')' 까지의 내용을 반환한다.
//   리터럴 내부 괄호는 무시한다. 짝이 없으면 nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<ParenSpan> extract_parenthesized(std::string_view text,
                                                             std::size_t      open_pos);

// ---------------------------------------------------------------------------
// match_paren_backward
//   text[close_pos] 가 ')' 일 때 짝이 되는 '(' 위치를 역방향으로 찾는다.
//   리터럴은 고려하지 않는다. 없으면 nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::size_t> match_paren_backward(std::string_view text,
                                                              std::size_t      close_pos) noexcept;

// ---------------------------------------------------------------------------
// CallSpan / find_call_before
//   pos 바로 앞(공백 무시)에 있는 "name(args)" 호출을 역방향으로 찾는다.
//   begin 은 name 의 시작 위치. 호출이 없으면 nullopt.
//   count(*) FILTER (WHERE ...) OVER (...) 처럼 호출 뒤에 FILTER 절이
//   붙어 있으면 FILTER 절을 건너뛰어 집계 호출을 반환한다.
// ---------------------------------------------------------------------------
struct CallSpan {
    std::string_view name{};
    std::size_t      begin{0};
};

[[nodiscard]] std::optional<CallSpan> find_call_before(std::string_view text,
                                                       std::size_t      pos) noexcept;

// ---------------------------------------------------------------------------
// dollar_quoted_body
//   text 안 첫 번째 $tag$ ... $tag$ 영역의 내용 (태그 제외).
//   닫는 태그가 없으면 여는 태그 이후 전체. dollar-quote 가 없으면 nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string_view> dollar_quoted_body(std::string_view text) noexcept;

// 블록/줄 주석을 공백 하나로 치환한다. 문자열 리터럴 내용은 보존한다.
[[nodiscard]] std::string remove_comments(std::string_view sql);

// 연속 공백을 스페이스 하나로 접는다 (로그/요약용)
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

}  // namespace text_scan
