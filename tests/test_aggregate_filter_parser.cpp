// ---------------------------------------------------------------------------
// test_aggregate_filter_parser.cpp
//
// AggregateFilterParser 단위 테스트.
//
// [테스트 범위]
// - agg(...) FILTER (WHERE ...) 추출, label = 집계 함수 이름
// - filter_count / aggregates 메타데이터
// - WHERE 없는 FILTER( 는 무시, 괄호 불균형 오류
// ---------------------------------------------------------------------------

#include "construct/aggregate_filter_parser.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

TEST(AggregateFilterParser, TwoFilteredAggregates) {
    AggregateFilterParser parser;
    const auto result = parser.parse(
        "SELECT count(*) FILTER (WHERE active),\n"
        "       SUM(amount) filter (where amount > 0)\n"
        "  FROM orders");

    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->steps.size(), 2u);

    EXPECT_EQ(result->steps[0].kind, "aggregate_filter");
    EXPECT_EQ(result->steps[0].label, "count");
    EXPECT_EQ(result->steps[0].raw_text, "count(*) FILTER (WHERE active)");
    EXPECT_EQ(result->steps[1].label, "SUM");
    EXPECT_EQ(result->steps[1].raw_text, "SUM(amount) filter (where amount > 0)");

    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "filter_count", -1), 2);
    EXPECT_EQ(metadata_value<std::string>(result->metadata, "aggregates", ""), "count,sum");
}

TEST(AggregateFilterParser, FilterWithoutWhere_Ignored) {
    AggregateFilterParser parser;
    const auto result = parser.parse("SELECT filter(x) FROM t");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->steps.empty());
    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "filter_count", -1), 0);
}

TEST(AggregateFilterParser, UnbalancedFilter_ReturnsError) {
    AggregateFilterParser parser;
    const auto result = parser.parse("SELECT count(*) FILTER (WHERE x > (1 FROM t");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kUnbalancedParens);
}

TEST(AggregateFilterParser, EmptyInput_ReturnsError) {
    AggregateFilterParser parser;
    const auto result = parser.parse("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kEmptyInput);
}
