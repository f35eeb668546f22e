#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ParsedTable, ParserResult 등을 직접 include 하지 않는다.
//   호출자(SchemaReverser)가 필요한 값만 복사해서 채운다.
// - ParseErrorCode 는 문자열 이름으로 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// LogFormat
//   kJson: 한 줄에 JSON 객체 하나
//   kText: event key=value ... (사람이 읽는 용도)
// ---------------------------------------------------------------------------
enum class LogFormat : std::uint8_t {
    kJson = 0,
    kText = 1,
};

// ---------------------------------------------------------------------------
// EntityLog
//   테이블 하나의 역공학 결과. event: "entity_reversed"
//   classification: "vocabulary" | "instance" | "translation" | "plain"
// ---------------------------------------------------------------------------
struct EntityLog {
    std::string                           schema{};
    std::string                           table_name{};
    std::size_t                           column_count{0};
    double                                baseline{0.0};
    double                                final_confidence{0.0};
    bool                                  accepted{false};
    std::string                           classification{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ActionLog
//   함수/프로시저 하나의 역공학 결과. event: "action_reversed"
//   parsers: 성공한 construct 파서 식별자 (dispatch 순서)
// ---------------------------------------------------------------------------
struct ActionLog {
    std::string                           schema{};
    std::string                           function_name{};
    std::string                           kind{};         // "function" | "procedure"
    std::vector<std::string>              parsers{};
    double                                baseline{0.0};
    double                                delta{0.0};
    double                                final_confidence{0.0};
    bool                                  accepted{false};
    bool                                  used_fallback{false};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// PairLog
//   vocabulary/instance 짝 탐지. event: "pair_detected"
// ---------------------------------------------------------------------------
struct PairLog {
    std::string                           vocabulary_table{};
    std::string                           instance_table{};
    std::string                           base_entity_name{};
    std::optional<std::string>            translation_table{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// RejectLog
//   제외된 문장 진단. event: "statement_rejected"
//   source: 파일 경로 (스크립트 직접 입력이면 "<script>")
//   context: 입력 앞부분 (ParseError::context)
// ---------------------------------------------------------------------------
struct RejectLog {
    std::string                           source{};
    std::size_t                           statement_index{0};
    std::string                           code{};
    std::string                           message{};
    std::string                           context{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// MetricsLog
//   construct 파서별 카운터 스냅샷. event: "parser_metrics"
//   attempts > 0 인 파서만 담는다.
// ---------------------------------------------------------------------------
struct ParserMetricsEntry {
    std::string   parser_id{};
    std::uint64_t attempts{0};
    std::uint64_t successes{0};
    std::uint64_t failures{0};
};

struct MetricsLog {
    std::vector<ParserMetricsEntry>       parsers{};
    std::chrono::system_clock::time_point timestamp{};
};
