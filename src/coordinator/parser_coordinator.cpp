// ---------------------------------------------------------------------------
// parser_coordinator.cpp
// ---------------------------------------------------------------------------

#include "coordinator/parser_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "construct/signal_detector.hpp"
#include "coordinator/confidence_policy.hpp"

namespace {

// 입력 문제로 인한 실패인지, 파서 자체 결함인지 구분한다
const char* failure_category(ParseErrorCode code) noexcept {
    switch (code) {
        case ParseErrorCode::kEmptyInput:
        case ParseErrorCode::kMalformedStatement:
        case ParseErrorCode::kUnbalancedParens:
        case ParseErrorCode::kMissingKeyword:
        case ParseErrorCode::kNestingTooDeep:
        case ParseErrorCode::kUnsupportedStatement:
            return "input";
        case ParseErrorCode::kInternalError:
            return "internal";
    }
    return "internal";
}

}  // namespace

std::expected<ConstructParse, ParseError>
ParserCoordinator::dispatch(ConstructKind kind, std::string_view sql) const {
    switch (kind) {
        case ConstructKind::kCte:             return cte_parser_.parse(sql);
        case ConstructKind::kException:       return exception_parser_.parse(sql);
        case ConstructKind::kDynamicSql:      return dynamic_sql_parser_.parse(sql);
        case ConstructKind::kControlFlow:     return control_flow_parser_.parse(sql);
        case ConstructKind::kWindow:          return window_parser_.parse(sql);
        case ConstructKind::kAggregateFilter: return aggregate_parser_.parse(sql);
        case ConstructKind::kCursor:          return cursor_parser_.parse(sql);
    }
    return std::unexpected(make_parse_error(
        ParseErrorCode::kInternalError, "unknown construct kind", sql));
}

std::optional<ParserResult> ParserCoordinator::parse_with(ConstructKind kind, std::string_view sql) {
    metrics_.on_attempt(kind);

    std::expected<ConstructParse, ParseError> parsed = std::unexpected(ParseError{});
    try {
        parsed = dispatch(kind, sql);
    } catch (const std::exception& e) {
        // std::regex_error, std::bad_alloc 등
        parsed = std::unexpected(make_parse_error(
            ParseErrorCode::kInternalError, e.what(), sql));
    }

    if (!parsed) {
        const auto& err = parsed.error();
        spdlog::warn("[parser_coordinator] {} parser failed ({} error {}): {}",
                     construct_id(kind), failure_category(err.code),
                     parse_error_code_name(err.code), err.message);
        metrics_.on_failure(kind);
        return std::nullopt;
    }

    if (parsed->steps.empty()) {
        spdlog::debug("[parser_coordinator] {} parser produced no steps", construct_id(kind));
        metrics_.on_failure(kind);
        return std::nullopt;
    }

    metrics_.on_success(kind);

    ParserResult result;
    result.confidence_delta = confidence_delta_for(kind, parsed->metadata);
    result.steps            = std::move(parsed->steps);
    result.metadata         = std::move(parsed->metadata);
    result.parser_id        = kind;
    result.succeeded        = true;
    return result;
}

std::vector<ParserResult> ParserCoordinator::parse_with_best_parsers(std::string_view sql) {
    std::vector<ParserResult> results;
    for (const auto kind : kDispatchOrder) {
        if (!should_use_parser(kind, sql)) {
            continue;
        }
        auto result = parse_with(kind, sql);
        if (result) {
            results.push_back(std::move(*result));
        }
    }
    return results;
}

std::array<double, kConstructCount> ParserCoordinator::get_success_rates() const noexcept {
    const auto snap = metrics_.snapshot();
    std::array<double, kConstructCount> rates{};
    for (std::size_t i = 0; i < kConstructCount; ++i) {
        rates[i] = snap.per_parser[i].success_rate();
    }
    return rates;
}

std::string ParserCoordinator::metrics_summary() const {
    const auto snap = metrics_.snapshot();

    std::vector<ConstructKind> kinds(kDispatchOrder.begin(), kDispatchOrder.end());
    std::sort(kinds.begin(), kinds.end(), [](ConstructKind a, ConstructKind b) {
        return construct_id(a) < construct_id(b);
    });

    std::string out = "Parser Success Rates:";
    for (const auto kind : kinds) {
        const auto& m = snap.at(kind);
        if (m.attempts == 0) {
            continue;
        }
        out += fmt::format("\n  {:<15}: {:5.1f}% ({} attempts)",
                           construct_id(kind), m.success_rate() * 100.0, m.attempts);
    }
    return out;
}

double ParserCoordinator::total_delta(const std::vector<ParserResult>& results) noexcept {
    double total = 0.0;
    for (const auto& r : results) {
        total += r.confidence_delta;
    }
    return total;
}
