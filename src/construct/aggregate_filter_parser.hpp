#pragma once

// ---------------------------------------------------------------------------
// aggregate_filter_parser.hpp
//
// agg(args) FILTER (WHERE cond) 조건부 집계를 추출한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

class AggregateFilterParser {
public:
    AggregateFilterParser()  = default;
    ~AggregateFilterParser() = default;

    AggregateFilterParser(const AggregateFilterParser&)            = default;
    AggregateFilterParser& operator=(const AggregateFilterParser&) = default;
    AggregateFilterParser(AggregateFilterParser&&)                 = default;
    AggregateFilterParser& operator=(AggregateFilterParser&&)      = default;

    // steps: kind "aggregate_filter", label = 집계 함수 이름,
    //        raw_text = 호출부터 FILTER 절 끝까지
    // metadata: filter_count, aggregates (소문자, 쉼표 연결)
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;
};
