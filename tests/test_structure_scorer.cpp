// ---------------------------------------------------------------------------
// test_structure_scorer.cpp
//
// StructureScorer 단위 테스트.
//
// [테스트 범위]
// - trinity (pk_<entity>, id, identifier) / audit 컬럼 탐지
// - 접두사 제거 후 surrogate key 이름 비교 (대소문자 무시)
// - tenant 컬럼, 선언된 PK, 테이블 주석 가중치
// - baseline 상한 1.0
// ---------------------------------------------------------------------------

#include "schema/structure_scorer.hpp"

#include <gtest/gtest.h>
#include <initializer_list>
#include <string>

namespace {

ParsedTable make_table(const std::string& name, std::initializer_list<const char*> columns) {
    ParsedTable table;
    table.table_name = name;
    for (const char* c : columns) {
        ColumnInfo col;
        col.name = c;
        col.type = "TEXT";
        table.columns.push_back(col);
    }
    return table;
}

StructureScorer default_scorer() {
    return StructureScorer({"tb_", "tv_"}, {"tenant_id", "fk_customer_org"});
}

}  // namespace

TEST(StructureScorer, FullEntity_CappedAtOne) {
    auto table = make_table("tb_contract", {"pk_contract", "id", "identifier", "created_at",
                                            "updated_at", "deleted_at", "tenant_id"});
    table.primary_key   = {"pk_contract"};
    table.table_comment = "Contracts";

    const auto s = default_scorer().score(table);
    EXPECT_TRUE(s.has_surrogate_key);
    EXPECT_TRUE(s.has_external_id);
    EXPECT_TRUE(s.has_lookup_key);
    EXPECT_EQ(s.trinity_count(), 3);
    EXPECT_EQ(s.audit_count(), 3);
    EXPECT_TRUE(s.has_tenant_column);
    EXPECT_TRUE(s.has_declared_pk);
    EXPECT_TRUE(s.has_table_comment);
    EXPECT_NEAR(s.baseline_confidence, 1.0, 1e-9);
}

TEST(StructureScorer, PartialSignals) {
    const auto table = make_table("tb_contact", {"id", "created_at", "email"});
    const auto s = default_scorer().score(table);

    EXPECT_FALSE(s.has_surrogate_key);
    EXPECT_EQ(s.trinity_count(), 1);
    EXPECT_EQ(s.audit_count(), 1);
    EXPECT_FALSE(s.has_declared_pk);
    EXPECT_NEAR(s.baseline_confidence, 0.40 / 3.0 + 0.30 / 3.0, 1e-9);
}

TEST(StructureScorer, SurrogateKey_UsesEntityNameWithoutPrefix) {
    const auto table = make_table("TB_Contact", {"PK_CONTACT"});
    const auto s = default_scorer().score(table);
    EXPECT_TRUE(s.has_surrogate_key);

    // 접두사가 없는 테이블은 이름 전체가 엔티티
    const auto plain = make_table("contact", {"pk_contact"});
    EXPECT_TRUE(default_scorer().score(plain).has_surrogate_key);

    const auto wrong = make_table("tb_contact", {"pk_tb_contact"});
    EXPECT_FALSE(default_scorer().score(wrong).has_surrogate_key);
}

TEST(StructureScorer, TenantColumn_Configurable) {
    const auto table = make_table("tb_order", {"fk_customer_org"});
    EXPECT_TRUE(default_scorer().score(table).has_tenant_column);

    const StructureScorer no_tenant({"tb_"}, {"org_id"});
    EXPECT_FALSE(no_tenant.score(table).has_tenant_column);
    EXPECT_DOUBLE_EQ(no_tenant.score(table).baseline_confidence, 0.0);
}

TEST(StructureScorer, EmptyTableComment_NotCounted) {
    auto table = make_table("tb_x", {"id"});
    table.table_comment = "";
    EXPECT_FALSE(default_scorer().score(table).has_table_comment);
}
