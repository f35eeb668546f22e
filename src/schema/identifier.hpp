#pragma once

// ---------------------------------------------------------------------------
// identifier.hpp
//
// [schema.]name 형태의 SQL 식별자 읽기.
// "Quoted Name" 은 따옴표를 제거하고 대소문자를 보존한다 ("" 는 " 로 복원).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// QualifiedName
//   parts: 점으로 구분된 식별자 조각 (1~3개). end: 마지막 조각 바로 뒤 위치.
// ---------------------------------------------------------------------------
struct QualifiedName {
    std::vector<std::string> parts{};
    std::size_t              end{0};

    // 마지막 조각
    [[nodiscard]] const std::string& name() const { return parts.back(); }

    // 마지막 조각 앞 (없으면 nullopt)
    [[nodiscard]] std::optional<std::string> qualifier() const {
        if (parts.size() < 2) {
            return std::nullopt;
        }
        return parts[parts.size() - 2];
    }
};

// pos 부터 공백을 건너뛰고 식별자 하나를 읽는다. 실패 시 nullopt.
[[nodiscard]] std::optional<std::pair<std::string, std::size_t>>
read_identifier(std::string_view text, std::size_t pos);

// pos 부터 최대 max_parts 개의 점 구분 식별자를 읽는다.
[[nodiscard]] std::optional<QualifiedName>
read_qualified_name(std::string_view text, std::size_t pos, std::size_t max_parts = 2);

// 식별자 목록 "(a, "B", c)" 의 내용 부분을 이름 목록으로 분해한다.
[[nodiscard]] std::vector<std::string> split_identifier_list(std::string_view list);

// '...' 리터럴 내용 ('' → ') 을 읽는다. text[pos] 가 '\'' 가 아니면 nullopt.
[[nodiscard]] std::optional<std::string> read_string_literal(std::string_view text, std::size_t pos);

// ---------------------------------------------------------------------------
// normalize_entity_name
//   소문자로 바꾼 뒤 prefixes 를 선언 순서대로 각각 한 번씩 제거한다.
//   예: ("TB_Contract", {"tb_", "tv_"}) -> "contract"
//       ("tb_tv_zone",  {"tb_", "tv_"}) -> "zone"
// ---------------------------------------------------------------------------
[[nodiscard]] std::string normalize_entity_name(std::string_view                table_name,
                                                const std::vector<std::string>& prefixes);
