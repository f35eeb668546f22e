// ---------------------------------------------------------------------------
// test_parser_coordinator.cpp
//
// ParserCoordinator / confidence 정책 단위 테스트.
//
// [테스트 범위]
// - 탐지기 기반 파서 선택과 디스패치 순서
// - 구문별 confidence 가산치 (CTE 재귀/다수 보너스, 동적 SQL 감점)
// - 빈 결과와 오류는 failure 로 집계
// - 성공률 / metrics_summary 형식 / reset_metrics
// ---------------------------------------------------------------------------

#include "coordinator/confidence_policy.hpp"
#include "coordinator/parser_coordinator.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

namespace {

const std::string kRecursiveTwoCtes =
    "WITH RECURSIVE a AS (SELECT 1 AS n UNION ALL SELECT n + 1 FROM a WHERE n < 5), "
    "b AS (SELECT * FROM a) SELECT * FROM b";

const std::string kFourCtes =
    "WITH a AS (SELECT 1), b AS (SELECT 2), c AS (SELECT 3), d AS (SELECT 4) "
    "SELECT * FROM d";

}  // namespace

// ---------------------------------------------------------------------------
// confidence 정책
// ---------------------------------------------------------------------------

TEST(ConfidencePolicy, CteDelta_RecursiveAndMany) {
    ConstructMetadata plain{{"is_recursive", false}, {"cte_count", std::int64_t{1}}};
    ConstructMetadata recursive{{"is_recursive", true}, {"cte_count", std::int64_t{2}}};
    ConstructMetadata recursive_many{{"is_recursive", true}, {"cte_count", std::int64_t{3}}};

    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kCte, plain), 0.10);
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kCte, recursive), 0.15);
    EXPECT_NEAR(confidence_delta_for(ConstructKind::kCte, recursive_many), 0.20, 1e-9);
}

TEST(ConfidencePolicy, FixedDeltas) {
    const ConstructMetadata none;
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kException, none), 0.05);
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kDynamicSql, none), -0.10);
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kControlFlow, none), 0.08);
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kWindow, none), 0.08);
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kAggregateFilter, none), 0.07);
    EXPECT_DOUBLE_EQ(confidence_delta_for(ConstructKind::kCursor, none), 0.08);
}

TEST(ConfidencePolicy, ClampToUnitRange) {
    EXPECT_DOUBLE_EQ(clamp_confidence(1.25), 1.0);
    EXPECT_DOUBLE_EQ(clamp_confidence(-0.3), 0.0);
    EXPECT_DOUBLE_EQ(clamp_confidence(0.42), 0.42);
}

// ---------------------------------------------------------------------------
// 디스패치
// ---------------------------------------------------------------------------

TEST(ParserCoordinator, RecursiveTwoCtes_Delta015) {
    ParserCoordinator coordinator;
    const auto results = coordinator.parse_with_best_parsers(kRecursiveTwoCtes);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].parser_id, ConstructKind::kCte);
    EXPECT_TRUE(results[0].succeeded);
    EXPECT_EQ(metadata_value<std::int64_t>(results[0].metadata, "cte_count", -1), 2);
    EXPECT_DOUBLE_EQ(results[0].confidence_delta, 0.15);
}

TEST(ParserCoordinator, FourPlainCtes_Delta015) {
    ParserCoordinator coordinator;
    const auto results = coordinator.parse_with_best_parsers(kFourCtes);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].steps.size(), 4u);
    EXPECT_NEAR(results[0].confidence_delta, 0.15, 1e-9);
}

TEST(ParserCoordinator, FormatExecute_NegativeDelta) {
    ParserCoordinator coordinator;
    const auto results = coordinator.parse_with_best_parsers("EXECUTE format('DROP TABLE %I', t);");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].parser_id, ConstructKind::kDynamicSql);
    EXPECT_TRUE(metadata_value<bool>(results[0].metadata, "has_format", false));
    EXPECT_DOUBLE_EQ(ParserCoordinator::total_delta(results), -0.10);
}

TEST(ParserCoordinator, MultipleConstructs_DispatchOrder) {
    ParserCoordinator coordinator;
    const auto results = coordinator.parse_with_best_parsers(
        "BEGIN "
        "FOR r IN SELECT rank() OVER (ORDER BY id) AS rk FROM t LOOP PERFORM 1; END LOOP; "
        "EXCEPTION WHEN OTHERS THEN NULL; "
        "END;");

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].parser_id, ConstructKind::kException);
    EXPECT_EQ(results[1].parser_id, ConstructKind::kControlFlow);
    EXPECT_EQ(results[2].parser_id, ConstructKind::kWindow);
    EXPECT_NEAR(ParserCoordinator::total_delta(results), 0.21, 1e-9);
}

TEST(ParserCoordinator, NoSignals_NoAttempts) {
    ParserCoordinator coordinator;
    const auto results = coordinator.parse_with_best_parsers("SELECT id FROM users WHERE id = 1");
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(coordinator.get_metrics().total_attempts(), 0u);
    EXPECT_EQ(coordinator.metrics_summary(), "Parser Success Rates:");
}

// ---------------------------------------------------------------------------
// 메트릭
// ---------------------------------------------------------------------------

TEST(ParserCoordinator, EmptyResultAndError_CountAsFailure) {
    ParserCoordinator coordinator;

    EXPECT_FALSE(coordinator.parse_with(ConstructKind::kCte, "SELECT 1").has_value());
    EXPECT_FALSE(coordinator.parse_with(ConstructKind::kWindow,
                                        "SELECT rank() OVER (ORDER BY (x").has_value());

    const auto snap = coordinator.get_metrics();
    EXPECT_EQ(snap.at(ConstructKind::kCte).attempts, 1u);
    EXPECT_EQ(snap.at(ConstructKind::kCte).failures, 1u);
    EXPECT_EQ(snap.at(ConstructKind::kWindow).attempts, 1u);
    EXPECT_EQ(snap.at(ConstructKind::kWindow).failures, 1u);
    EXPECT_EQ(snap.at(ConstructKind::kWindow).successes, 0u);
}

TEST(ParserCoordinator, DeeplyNestedBeginBlocks_IsolatedAsFailure) {
    std::string body = "FOR i IN 1..2 LOOP ";
    for (int i = 0; i < 10000; ++i) {
        body += "BEGIN ";
    }

    ParserCoordinator coordinator;
    EXPECT_FALSE(coordinator.parse_with(ConstructKind::kControlFlow, body).has_value());

    const auto snap = coordinator.get_metrics();
    EXPECT_EQ(snap.at(ConstructKind::kControlFlow).attempts, 1u);
    EXPECT_EQ(snap.at(ConstructKind::kControlFlow).failures, 1u);
}

TEST(ParserCoordinator, SuccessRates_ZeroForUnattempted) {
    ParserCoordinator coordinator;
    ASSERT_TRUE(coordinator.parse_with(ConstructKind::kCte, kFourCtes).has_value());
    EXPECT_FALSE(coordinator.parse_with(ConstructKind::kCte, "SELECT 1").has_value());

    const auto rates = coordinator.get_success_rates();
    EXPECT_DOUBLE_EQ(rates[to_index(ConstructKind::kCte)], 0.5);
    EXPECT_DOUBLE_EQ(rates[to_index(ConstructKind::kCursor)], 0.0);
}

TEST(ParserCoordinator, MetricsSummary_Format) {
    ParserCoordinator coordinator;
    ASSERT_TRUE(coordinator.parse_with(ConstructKind::kCte, kRecursiveTwoCtes).has_value());
    EXPECT_FALSE(coordinator.parse_with(ConstructKind::kCte, "SELECT 1").has_value());
    ASSERT_TRUE(coordinator.parse_with(ConstructKind::kDynamicSql, "EXECUTE 'SELECT 1';").has_value());

    EXPECT_EQ(coordinator.metrics_summary(),
              "Parser Success Rates:\n"
              "  cte            :  50.0% (2 attempts)\n"
              "  dynamic_sql    : 100.0% (1 attempts)");
}

TEST(ParserCoordinator, ResetMetrics_Idempotent) {
    ParserCoordinator coordinator;
    (void)coordinator.parse_with_best_parsers(kFourCtes);
    ASSERT_GT(coordinator.get_metrics().total_attempts(), 0u);

    coordinator.reset_metrics();
    coordinator.reset_metrics();
    EXPECT_EQ(coordinator.get_metrics().total_attempts(), 0u);
    EXPECT_EQ(coordinator.metrics_summary(), "Parser Success Rates:");
}
