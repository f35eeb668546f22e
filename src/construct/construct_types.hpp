#pragma once

// ---------------------------------------------------------------------------
// construct_types.hpp
//
// 특수 구문 파서와 ParserCoordinator 가 공유하는 데이터 타입 정의.
//
// [설계 원칙]
// - ConstructKind 는 닫힌 열거형이다. 파서 추가 시 kConstructCount 와
//   kDispatchOrder 를 함께 갱신해야 하며, switch 누락은 -Wswitch 로 검출된다.
// - ConstructStep 은 생성 후 변경하지 않는다. 소유권은 ParserResult 에 있다.
// - metadata 는 coordinator 의 confidence 조정에 쓰이는 보조 사실만 담는다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// ConstructKind
//   특수 구문 종류. 선언 순서 = 디스패치 순서.
// ---------------------------------------------------------------------------
enum class ConstructKind : std::uint8_t {
    kCte             = 0,  // WITH ... AS (...)
    kException       = 1,  // EXCEPTION WHEN ... THEN ...
    kDynamicSql      = 2,  // EXECUTE '...' / EXECUTE format(...)
    kControlFlow     = 3,  // IF / FOR / WHILE / LOOP
    kWindow          = 4,  // fn(...) OVER (...)
    kAggregateFilter = 5,  // agg(...) FILTER (WHERE ...)
    kCursor          = 6,  // CURSOR / OPEN / FETCH / MOVE / CLOSE
};

inline constexpr std::size_t kConstructCount = 7;

// 디스패치 순서는 ParserResult 출력 순서를 결정한다.
inline constexpr std::array<ConstructKind, kConstructCount> kDispatchOrder = {
    ConstructKind::kCte,
    ConstructKind::kException,
    ConstructKind::kDynamicSql,
    ConstructKind::kControlFlow,
    ConstructKind::kWindow,
    ConstructKind::kAggregateFilter,
    ConstructKind::kCursor,
};

[[nodiscard]] constexpr std::size_t to_index(ConstructKind kind) noexcept {
    return static_cast<std::size_t>(kind);
}

// ---------------------------------------------------------------------------
// construct_id
//   로그/요약 출력에 쓰는 안정적인 식별자.
//   metrics_summary 는 이 문자열 기준으로 정렬한다.
// ---------------------------------------------------------------------------
[[nodiscard]] constexpr std::string_view construct_id(ConstructKind kind) noexcept {
    switch (kind) {
        case ConstructKind::kCte:             return "cte";
        case ConstructKind::kException:       return "exception";
        case ConstructKind::kDynamicSql:      return "dynamic_sql";
        case ConstructKind::kControlFlow:     return "control_flow";
        case ConstructKind::kWindow:          return "window";
        case ConstructKind::kAggregateFilter: return "aggregate";
        case ConstructKind::kCursor:          return "cursor";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ConstructStep
//   구문 하나를 나타내는 트리 노드.
//   then_branch / else_branch 는 조건문·반복문 본문일 때만 채워진다.
// ---------------------------------------------------------------------------
struct ConstructStep {
    std::string                kind{};         // "try-except", "cte", "if", "for_loop" ...
    std::string                label{};        // CTE 이름, 커서 이름, 함수 이름 등 (없으면 빈값)
    std::string                raw_text{};     // 원문 단편 (변형 없음)
    std::vector<ConstructStep> then_branch{};
    std::vector<ConstructStep> else_branch{};
};

// ---------------------------------------------------------------------------
// ConstructMetadata
//   파서가 보고하는 판별 사실. 예: {"is_recursive": true, "cte_count": 2}
// ---------------------------------------------------------------------------
using MetadataValue     = std::variant<bool, std::int64_t, double, std::string>;
using ConstructMetadata = std::map<std::string, MetadataValue>;

// ---------------------------------------------------------------------------
// ConstructParse
//   특수 구문 파서 한 번의 성공 출력. steps 가 비어 있으면 "구문 없음".
// ---------------------------------------------------------------------------
struct ConstructParse {
    std::vector<ConstructStep> steps{};
    ConstructMetadata          metadata{};
};

// ---------------------------------------------------------------------------
// ParserResult
//   coordinator 가 성공한 파서 호출마다 생성하는 결과.
//   confidence_delta 는 [0,1] 로 제한되지 않으며 음수일 수 있다.
//   succeeded == false 이면 steps 는 항상 비어 있다.
// ---------------------------------------------------------------------------
struct ParserResult {
    std::vector<ConstructStep> steps{};
    double                     confidence_delta{0.0};
    ConstructKind              parser_id{ConstructKind::kCte};
    ConstructMetadata          metadata{};
    bool                       succeeded{false};
};

// ---------------------------------------------------------------------------
// metadata 조회 헬퍼. 키가 없거나 타입이 다르면 fallback.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T metadata_value(const ConstructMetadata& metadata,
                               const std::string&       key,
                               T                        fallback) {
    const auto it = metadata.find(key);
    if (it == metadata.end()) {
        return fallback;
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    return fallback;
}
