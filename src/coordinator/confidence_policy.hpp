#pragma once

// ---------------------------------------------------------------------------
// confidence_policy.hpp
//
// 특수 구문 파서 성공 시 액션 confidence 에 더할 가산치 정책표.
//
// | 구문              | 기본    | 조정                                        |
// |-------------------|---------|---------------------------------------------|
// | CTE               | +0.10   | 재귀 → +0.15, cte_count > 2 이면 +0.05 추가 |
// | Exception handler | +0.05   |                                             |
// | Dynamic SQL       | -0.10   |                                             |
// | Control flow      | +0.08   |                                             |
// | Window function   | +0.08   |                                             |
// | Aggregate filter  | +0.07   |                                             |
// | Cursor operations | +0.08   |                                             |
//
// 가산치 합계는 여기서 제한하지 않는다. [0,1] 제한은 최종 confidence 에만
// 적용한다 (clamp_confidence).
// ---------------------------------------------------------------------------

#include <cstdint>

#include "construct/construct_types.hpp"

inline constexpr double       kCteBaseDelta         = 0.10;
inline constexpr double       kCteRecursiveDelta    = 0.15;
inline constexpr double       kCteManyBonus         = 0.05;
inline constexpr std::int64_t kCteManyThreshold     = 2;
inline constexpr double       kExceptionDelta       = 0.05;
inline constexpr double       kDynamicSqlDelta      = -0.10;
inline constexpr double       kControlFlowDelta     = 0.08;
inline constexpr double       kWindowDelta          = 0.08;
inline constexpr double       kAggregateFilterDelta = 0.07;
inline constexpr double       kCursorDelta          = 0.08;

// kind 와 파서 metadata 로 가산치를 계산한다.
[[nodiscard]] double confidence_delta_for(ConstructKind kind, const ConstructMetadata& metadata);

// [0,1] 로 제한
[[nodiscard]] double clamp_confidence(double value) noexcept;
