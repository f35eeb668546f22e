#pragma once

// ---------------------------------------------------------------------------
// structure_scorer.hpp
//
// 테이블 구조 신호로 엔티티 baseline confidence 를 계산한다.
//
//   baseline = 0.40 * (trinity / 3) + 0.30 * (audit / 3)
//            + 0.15 [선언된 PK] + 0.10 [tenant 컬럼] + 0.05 [테이블 주석]
//   (상한 1.0)
//
// - trinity: pk_<entity>, id, identifier
//   (entity = 접두사를 제거한 소문자 테이블 이름)
// - audit:   created_at, updated_at, deleted_at
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

#include "schema/schema_types.hpp"

inline constexpr double kTrinityWeight      = 0.40;
inline constexpr double kAuditWeight        = 0.30;
inline constexpr double kDeclaredPkWeight   = 0.15;
inline constexpr double kTenantWeight       = 0.10;
inline constexpr double kTableCommentWeight = 0.05;

class StructureScorer {
public:
    StructureScorer(std::vector<std::string> table_prefixes,
                    std::vector<std::string> tenant_columns);

    [[nodiscard]] StructuralSignals score(const ParsedTable& table) const;

private:
    std::vector<std::string> table_prefixes_;
    std::vector<std::string> tenant_columns_;
};
