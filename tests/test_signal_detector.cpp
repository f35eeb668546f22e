// ---------------------------------------------------------------------------
// test_signal_detector.cpp
//
// 구문 신호 탐지기 단위 테스트.
//
// [테스트 범위]
// - 구문별 키워드 탐지 (대소문자 무관, 단어 경계)
// - 공백이 끼어드는 복합 신호 (OVER (, PARTITION BY, FILTER (WHERE)
// - should_use_parser 디스패치 테이블
//
// [오탐/미탐 주의사항]
// - 문자열 리터럴/주석 안의 키워드도 신호로 본다 (오탐 허용).
// - 식별자 일부(WITHIN, OVERALL)는 단어 경계로 걸러낸다.
// ---------------------------------------------------------------------------

#include "construct/signal_detector.hpp"

#include <gtest/gtest.h>
#include <string>

// ---------------------------------------------------------------------------
// CTE
// ---------------------------------------------------------------------------

TEST(SignalDetector, Cte_WithKeyword) {
    EXPECT_TRUE(should_use_cte_parser("WITH a AS (SELECT 1) SELECT * FROM a"));
    EXPECT_TRUE(should_use_cte_parser("with recursive t as (select 1) select * from t"));
}

TEST(SignalDetector, Cte_NoKeyword) {
    EXPECT_FALSE(should_use_cte_parser("SELECT * FROM users"));
    EXPECT_FALSE(should_use_cte_parser(""));
}

TEST(SignalDetector, Cte_WordBoundary) {
    // WITHIN, WITHOUT 은 WITH 가 아니다
    EXPECT_FALSE(should_use_cte_parser("SELECT percentile_cont(0.5) WITHIN GROUP (ORDER BY x)"));
    EXPECT_FALSE(should_use_cte_parser("SELECT 'x' WITHOUT_TZ"));
}

// ---------------------------------------------------------------------------
// EXCEPTION / EXECUTE
// ---------------------------------------------------------------------------

TEST(SignalDetector, Exception_Keyword) {
    EXPECT_TRUE(should_use_exception_parser("BEGIN x := 1; EXCEPTION WHEN OTHERS THEN NULL; END;"));
    EXPECT_FALSE(should_use_exception_parser("BEGIN x := 1; END;"));
    EXPECT_FALSE(should_use_exception_parser("SELECT exceptional FROM t"));
}

TEST(SignalDetector, DynamicSql_Keyword) {
    EXPECT_TRUE(should_use_dynamic_sql_parser("EXECUTE 'SELECT 1';"));
    EXPECT_TRUE(should_use_dynamic_sql_parser("execute format('DROP TABLE %I', t);"));
    EXPECT_FALSE(should_use_dynamic_sql_parser("SELECT executed_at FROM jobs"));
}

// ---------------------------------------------------------------------------
// 제어 흐름
// ---------------------------------------------------------------------------

TEST(SignalDetector, ControlFlow_AnyLoopKeyword) {
    EXPECT_TRUE(should_use_control_flow_parser("FOR r IN SELECT * FROM t LOOP NULL; END LOOP;"));
    EXPECT_TRUE(should_use_control_flow_parser("LOOP EXIT; END LOOP;"));
    EXPECT_TRUE(should_use_control_flow_parser("while i < 10 loop i := i + 1; end loop;"));
}

TEST(SignalDetector, ControlFlow_IfAloneIsNotSignal) {
    EXPECT_FALSE(should_use_control_flow_parser("IF x THEN y := 1; END IF;"));
}

// ---------------------------------------------------------------------------
// 윈도 함수
// ---------------------------------------------------------------------------

TEST(SignalDetector, Window_OverWithWhitespace) {
    EXPECT_TRUE(should_use_window_parser("SELECT rank() OVER (ORDER BY x) FROM t"));
    EXPECT_TRUE(should_use_window_parser("SELECT rank() over\n   (order by x) FROM t"));
}

TEST(SignalDetector, Window_PartitionByOrRowNumber) {
    EXPECT_TRUE(should_use_window_parser("... PARTITION   BY dept ..."));
    EXPECT_TRUE(should_use_window_parser("SELECT row_number FROM t"));
}

TEST(SignalDetector, Window_OverWithoutParenIsNotSignal) {
    EXPECT_FALSE(should_use_window_parser("SELECT overall FROM t"));
    EXPECT_FALSE(should_use_window_parser("SELECT * FROM t WHERE game_over"));
}

// ---------------------------------------------------------------------------
// 집계 필터 / 커서
// ---------------------------------------------------------------------------

TEST(SignalDetector, AggregateFilter_Pattern) {
    EXPECT_TRUE(should_use_aggregate_parser("count(*) FILTER (WHERE active)"));
    EXPECT_TRUE(should_use_aggregate_parser("sum(x) filter(   where y > 0)"));
    EXPECT_FALSE(should_use_aggregate_parser("SELECT filter FROM t WHERE x"));
}

TEST(SignalDetector, Cursor_AnyKeyword) {
    EXPECT_TRUE(should_use_cursor_parser("c CURSOR FOR SELECT 1;"));
    EXPECT_TRUE(should_use_cursor_parser("FETCH c INTO r;"));
    EXPECT_TRUE(should_use_cursor_parser("open c;"));
    EXPECT_TRUE(should_use_cursor_parser("CLOSE c;"));
    EXPECT_FALSE(should_use_cursor_parser("SELECT opened_at, closed_at FROM t"));
}

// ---------------------------------------------------------------------------
// 디스패치 테이블
// ---------------------------------------------------------------------------

TEST(SignalDetector, ShouldUseParser_MatchesIndividualDetectors) {
    const std::string sql =
        "WITH a AS (SELECT 1) SELECT count(*) FILTER (WHERE x) FROM a; "
        "EXECUTE 'x'; EXCEPTION WHEN OTHERS THEN NULL;";

    EXPECT_TRUE(should_use_parser(ConstructKind::kCte, sql));
    EXPECT_TRUE(should_use_parser(ConstructKind::kException, sql));
    EXPECT_TRUE(should_use_parser(ConstructKind::kDynamicSql, sql));
    EXPECT_FALSE(should_use_parser(ConstructKind::kControlFlow, sql));
    EXPECT_FALSE(should_use_parser(ConstructKind::kWindow, sql));
    EXPECT_TRUE(should_use_parser(ConstructKind::kAggregateFilter, sql));
    EXPECT_FALSE(should_use_parser(ConstructKind::kCursor, sql));
}
