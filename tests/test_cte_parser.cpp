// ---------------------------------------------------------------------------
// test_cte_parser.cpp
//
// CteParser 단위 테스트.
//
// [테스트 범위]
// - WITH / WITH RECURSIVE 절의 CTE 이름과 본문 추출
// - is_recursive, cte_count 메타데이터
// - 중첩 WITH 의 step 순서 (안쪽 먼저) / 최대 중첩 깊이
// - detect_patterns 계층 질의 관용구
// ---------------------------------------------------------------------------

#include "construct/cte_parser.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

namespace {

// 깊이 n 의 중첩 WITH 문 생성
std::string nested_with(int levels) {
    std::string sql = "SELECT 1";
    for (int i = levels - 1; i >= 0; --i) {
        sql = "WITH c" + std::to_string(i) + " AS (" + sql + ") SELECT * FROM c" + std::to_string(i);
    }
    return sql;
}

}  // namespace

TEST(CteParser, RecursiveCte_TwoClauses) {
    CteParser parser;
    const std::string sql =
        "WITH RECURSIVE tree AS ("
        "SELECT id, parent_id FROM nodes WHERE parent_id IS NULL "
        "UNION ALL "
        "SELECT n.id, n.parent_id FROM nodes n JOIN tree t ON n.parent_id = t.id"
        "), leaves AS (SELECT * FROM tree) "
        "SELECT * FROM leaves";

    const auto result = parser.parse(sql);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->steps.size(), 2u);
    EXPECT_EQ(result->steps[0].kind, "cte");
    EXPECT_EQ(result->steps[0].label, "tree");
    EXPECT_EQ(result->steps[1].label, "leaves");
    EXPECT_EQ(result->steps[1].raw_text, "SELECT * FROM tree");

    EXPECT_TRUE(metadata_value<bool>(result->metadata, "is_recursive", false));
    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "cte_count", -1), 2);
}

TEST(CteParser, PlainCte_NotRecursive) {
    CteParser parser;
    const auto result = parser.parse("with totals as (select sum(x) from t) select * from totals");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->steps.size(), 1u);
    EXPECT_EQ(result->steps[0].label, "totals");
    EXPECT_EQ(result->steps[0].raw_text, "select sum(x) from t");
    EXPECT_FALSE(metadata_value<bool>(result->metadata, "is_recursive", true));
}

TEST(CteParser, LowerCaseKeywords_CountedAndRecursive) {
    CteParser parser;
    const auto result = parser.parse(
        "with recursive walk as (select 1 as n union all select n + 1 from walk where n < 3), "
        "final as (select * from walk) select * from final");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(metadata_value<bool>(result->metadata, "is_recursive", false));
    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "cte_count", -1), 2);
    ASSERT_EQ(result->steps.size(), 2u);
    EXPECT_EQ(result->steps[0].label, "walk");
    EXPECT_EQ(result->steps[1].label, "final");
}

TEST(CteParser, RecursiveInsideIdentifier_NotRecursive) {
    CteParser parser;
    const auto result = parser.parse(
        "WITH non_recursive_total AS (SELECT 1) SELECT * FROM non_recursive_total");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_FALSE(metadata_value<bool>(result->metadata, "is_recursive", true));
    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "cte_count", -1), 1);
}

TEST(CteParser, NoWith_EmptySteps) {
    CteParser parser;
    const auto result = parser.parse("SELECT * FROM users");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->steps.empty());
    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "cte_count", -1), 0);
}

TEST(CteParser, NestedWith_InnerStepFirst) {
    CteParser parser;
    const auto result = parser.parse(
        "WITH outer_q AS (WITH inner_q AS (SELECT 1 AS v) SELECT v FROM inner_q) "
        "SELECT * FROM outer_q");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->steps.size(), 2u);
    EXPECT_EQ(result->steps[0].label, "inner_q");
    EXPECT_EQ(result->steps[1].label, "outer_q");
}

TEST(CteParser, NestingAtLimit_Accepted) {
    CteParser parser;
    const auto result = parser.parse(nested_with(11));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->steps.size(), 11u);
}

TEST(CteParser, NestingTooDeep_ReturnsError) {
    CteParser parser;
    const auto result = parser.parse(nested_with(12));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kNestingTooDeep);
}

TEST(CteParser, EmptyInput_ReturnsError) {
    CteParser parser;
    const auto result = parser.parse("  ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kEmptyInput);
}

// ---------------------------------------------------------------------------
// detect_patterns
// ---------------------------------------------------------------------------

TEST(CteParser, DetectPatterns_RecursiveHierarchy) {
    std::vector<ConstructStep> steps(1);
    steps[0].raw_text = "select id from org union all select c.id from org c where c.parent_id = 1";
    const auto patterns = CteParser::detect_patterns(steps);
    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns[0], "recursive_hierarchy");
}

TEST(CteParser, DetectPatterns_TreeAndPath_NoDuplicates) {
    std::vector<ConstructStep> steps(3);
    steps[0].raw_text = "SELECT id FROM t CONNECT BY PRIOR id = pid";
    steps[1].raw_text = "SELECT path || '/' || name AS path FROM t";
    steps[2].raw_text = "SELECT id FROM t CONNECT BY PRIOR id = pid";

    const auto patterns = CteParser::detect_patterns(steps);
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0], "tree_traversal");
    EXPECT_EQ(patterns[1], "materialized_path");
}

TEST(CteParser, DetectPatterns_UnionAloneIsNotHierarchy) {
    std::vector<ConstructStep> steps(1);
    steps[0].raw_text = "SELECT a FROM x UNION SELECT b FROM y";
    EXPECT_TRUE(CteParser::detect_patterns(steps).empty());
}
