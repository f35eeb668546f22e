#pragma once

// ---------------------------------------------------------------------------
// parser_metrics.hpp
//
// 특수 구문 파서별 시도/성공/실패 카운터. 헤더 전용.
//
// [스레드 안전성]
// - ParserCoordinator 하나가 소유하며 단일 스레드에서만 갱신한다.
//   여러 스레드에서 coordinator 를 공유하려면 외부 동기화가 필요하다.
//
// [불변식]
// - successes + failures <= attempts
// - 모든 갱신 메서드는 noexcept
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>

#include "construct/construct_types.hpp"

// ---------------------------------------------------------------------------
// ParserMetrics
//   파서 하나의 누적 카운터.
// ---------------------------------------------------------------------------
struct ParserMetrics {
    std::uint64_t attempts{0};
    std::uint64_t successes{0};
    std::uint64_t failures{0};

    // attempts == 0 이면 정확히 0.0
    [[nodiscard]] double success_rate() const noexcept {
        if (attempts == 0) {
            return 0.0;
        }
        return static_cast<double>(successes) / static_cast<double>(attempts);
    }
};

// ---------------------------------------------------------------------------
// MetricsSnapshot
//   특정 시점의 전체 카운터 복사본 (불변 값 객체). ConstructKind 로 색인.
// ---------------------------------------------------------------------------
struct MetricsSnapshot {
    std::array<ParserMetrics, kConstructCount> per_parser{};

    [[nodiscard]] const ParserMetrics& at(ConstructKind kind) const noexcept {
        return per_parser[to_index(kind)];
    }

    [[nodiscard]] std::uint64_t total_attempts() const noexcept {
        std::uint64_t total = 0;
        for (const auto& m : per_parser) {
            total += m.attempts;
        }
        return total;
    }
};

// ---------------------------------------------------------------------------
// ParserMetricsTable
//   ConstructKind 별 ParserMetrics 고정 배열.
// ---------------------------------------------------------------------------
class ParserMetricsTable {
public:
    ParserMetricsTable() noexcept = default;

    void on_attempt(ConstructKind kind) noexcept {
        ++metrics_[to_index(kind)].attempts;
    }

    void on_success(ConstructKind kind) noexcept {
        ++metrics_[to_index(kind)].successes;
    }

    void on_failure(ConstructKind kind) noexcept {
        ++metrics_[to_index(kind)].failures;
    }

    void reset() noexcept {
        metrics_.fill(ParserMetrics{});
    }

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        return MetricsSnapshot{.per_parser = metrics_};
    }

private:
    std::array<ParserMetrics, kConstructCount> metrics_{};
};
