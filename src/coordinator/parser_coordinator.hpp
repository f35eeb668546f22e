#pragma once

// ---------------------------------------------------------------------------
// parser_coordinator.hpp
//
// 신호 탐지기로 적용할 특수 구문 파서를 고르고, 각 파서를 격리 경계 안에서
// 호출하여 ParserResult 와 파서별 메트릭을 만든다.
//
// [격리 원칙]
// - 파서 하나의 실패(ParseError 반환 또는 std::exception)는 경고 로그로
//   바뀌고 다른 파서 호출에 영향을 주지 않는다.
// - coordinator 경계 밖으로 예외를 전파하지 않는다.
//
// [상태 전이] 호출 1회 기준
//   not-attempted -> attempted -> (succeeded | failed). 재시도 없음.
//
// [스레드 안전성]
// - 단일 스레드 전용. 메트릭은 coordinator 인스턴스가 소유한다.
// ---------------------------------------------------------------------------

#include <array>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "construct/aggregate_filter_parser.hpp"
#include "construct/construct_types.hpp"
#include "construct/control_flow_parser.hpp"
#include "construct/cte_parser.hpp"
#include "construct/cursor_operations_parser.hpp"
#include "construct/dynamic_sql_parser.hpp"
#include "construct/exception_handler_parser.hpp"
#include "construct/window_function_parser.hpp"
#include "coordinator/parser_metrics.hpp"

class ParserCoordinator {
public:
    ParserCoordinator()  = default;
    ~ParserCoordinator() = default;

    // 메트릭 소유권이 인스턴스에 묶이므로 복사 금지
    ParserCoordinator(const ParserCoordinator&)            = delete;
    ParserCoordinator& operator=(const ParserCoordinator&) = delete;
    ParserCoordinator(ParserCoordinator&&)                 = default;
    ParserCoordinator& operator=(ParserCoordinator&&)      = default;

    // -----------------------------------------------------------------------
    // parse_with
    //   탐지기를 거치지 않고 kind 파서를 직접 호출한다.
    //   attempts 를 항상 1 증가시킨다.
    //   steps 가 비어 있지 않으면 successes 증가 + ParserResult 반환,
    //   그 외(빈 결과, 오류, 예외)는 failures 증가 + nullopt.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::optional<ParserResult> parse_with(ConstructKind kind, std::string_view sql);

    // -----------------------------------------------------------------------
    // parse_with_best_parsers
    //   디스패치 순서대로 탐지기를 평가하고, 참이면 parse_with 를 호출한다.
    //   반환 순서 = 디스패치 순서.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::vector<ParserResult> parse_with_best_parsers(std::string_view sql);

    // 카운터 복사본
    [[nodiscard]] MetricsSnapshot get_metrics() const noexcept { return metrics_.snapshot(); }

    // ConstructKind 색인. attempts == 0 인 파서는 정확히 0.0
    [[nodiscard]] std::array<double, kConstructCount> get_success_rates() const noexcept;

    void reset_metrics() noexcept { metrics_.reset(); }

    // -----------------------------------------------------------------------
    // metrics_summary
    //   "Parser Success Rates:" 다음 줄부터 attempts > 0 인 파서만
    //   식별자 순으로 "  <id:15>: <rate*100:5.1f>% (<n> attempts)" 형식 (예: " 50.0%").
    //   줄 구분은 '\n', 마지막 줄 뒤 개행 없음.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::string metrics_summary() const;

    // 결과 목록의 confidence_delta 합계
    [[nodiscard]] static double total_delta(const std::vector<ParserResult>& results) noexcept;

private:
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    dispatch(ConstructKind kind, std::string_view sql) const;

    CteParser              cte_parser_;
    ExceptionHandlerParser exception_parser_;
    DynamicSqlParser       dynamic_sql_parser_;
    ControlFlowParser      control_flow_parser_;
    WindowFunctionParser   window_parser_;
    AggregateFilterParser  aggregate_parser_;
    CursorOperationsParser cursor_parser_;

    ParserMetricsTable metrics_;
};
