#pragma once

// ---------------------------------------------------------------------------
// schema_reverser.hpp
//
// DDL/함수 스크립트를 confidence 점수가 붙은 엔티티/액션 보고서로 변환한다.
//
// [처리 순서]
//   1. 문장 분할 + 분류
//   2. CREATE TABLE 파싱 (실패 문장은 rejected 에 기록하고 계속)
//   3. COMMENT ON 부착
//   4. 구조 점수 (baseline)
//   5. 번역 테이블 탐지 + 색인
//   6. vocabulary/instance 분류, 채택된 테이블로 detect_pairs
//   7. 함수 본문마다 ParserCoordinator 실행, final = clamp(baseline + Σdelta)
//   8. final >= min_confidence 인 엔티티/액션만 accepted
//
// [오류 처리]
// - 어떤 예외도 reverse() 밖으로 나가지 않는다. 모든 실패는 진단 항목이다.
//
// [스레드 안전성]
// - 단일 스레드 전용 (ParserCoordinator 메트릭 소유).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "config/reverse_config.hpp"
#include "construct/construct_types.hpp"
#include "coordinator/parser_coordinator.hpp"
#include "coordinator/parser_metrics.hpp"
#include "logger/structured_logger.hpp"
#include "pattern/info_instance_detector.hpp"
#include "pattern/translation_detector.hpp"
#include "schema/function_parser.hpp"
#include "schema/schema_types.hpp"
#include "schema/statement_splitter.hpp"
#include "schema/structure_scorer.hpp"
#include "schema/table_parser.hpp"

enum class EntityClassification : std::uint8_t {
    kPlain       = 0,
    kVocabulary  = 1,
    kInstance    = 2,
    kTranslation = 3,
};

[[nodiscard]] constexpr std::string_view entity_classification_name(EntityClassification c) noexcept {
    switch (c) {
        case EntityClassification::kPlain:       return "plain";
        case EntityClassification::kVocabulary:  return "vocabulary";
        case EntityClassification::kInstance:    return "instance";
        case EntityClassification::kTranslation: return "translation";
    }
    return "plain";
}

// ---------------------------------------------------------------------------
// EntityReport
//   엔티티에는 construct delta 가 없으므로 final_confidence == baseline.
// ---------------------------------------------------------------------------
struct EntityReport {
    ParsedTable                 table{};
    StructuralSignals           signals{};
    InfoInstanceDetectionResult info_instance{};
    TranslationDetectionResult  translation{};
    EntityClassification        classification{EntityClassification::kPlain};
    double                      baseline{0.0};
    double                      final_confidence{0.0};
    bool                        accepted{false};
};

// ---------------------------------------------------------------------------
// ActionReport
//   baseline = action_baseline (fallback 이면 * fallback_penalty)
//   final    = clamp(baseline + delta, 0, 1)
// ---------------------------------------------------------------------------
struct ActionReport {
    ParsedFunction            function{};
    std::vector<ParserResult> parser_results{};
    double                    baseline{0.0};
    double                    delta{0.0};
    double                    final_confidence{0.0};
    bool                      accepted{false};
};

// ---------------------------------------------------------------------------
// RejectedStatement
//   source: 파일 경로 또는 "<script>"
//   읽을 수 없는 파일은 statement_index 0, kind kOther, kInternalError.
// ---------------------------------------------------------------------------
struct RejectedStatement {
    std::string   source{};
    std::size_t   statement_index{0};
    StatementKind kind{StatementKind::kOther};
    ParseError    error{};
};

struct ReverseReport {
    std::vector<EntityReport>      entities{};
    std::vector<ActionReport>      actions{};
    std::vector<InfoInstancePair>  pairs{};
    TranslationIndex               translation_index{};
    std::vector<RejectedStatement> rejected{};
    std::size_t                    unmatched_comments{0};
    std::size_t                    ignored_statements{0};
    MetricsSnapshot                metrics{};
    std::string                    metrics_summary{};

    [[nodiscard]] std::size_t accepted_entity_count() const noexcept;
    [[nodiscard]] std::size_t accepted_action_count() const noexcept;
};

class SchemaReverser {
public:
    // logger 가 nullptr 이면 구조화 이벤트를 기록하지 않는다 (spdlog 진단은 유지).
    explicit SchemaReverser(ReverseConfig                     config,
                            std::shared_ptr<StructuredLogger> logger = nullptr);

    ~SchemaReverser() = default;

    SchemaReverser(const SchemaReverser&)            = delete;
    SchemaReverser& operator=(const SchemaReverser&) = delete;
    SchemaReverser(SchemaReverser&&)                 = default;
    SchemaReverser& operator=(SchemaReverser&&)      = default;

    // 스크립트 하나를 역공학한다. 호출마다 파서 메트릭을 초기화한다.
    [[nodiscard]] ReverseReport reverse(std::string_view script,
                                        std::string_view source = "<script>");

    // -----------------------------------------------------------------------
    // reverse_files
    //   모든 파일의 문장을 하나의 배치로 처리한다 (파일 간 짝짓기 가능).
    //   읽을 수 없는 파일은 rejected 에 기록하고 나머지를 계속 처리한다.
    // -----------------------------------------------------------------------
    [[nodiscard]] ReverseReport reverse_files(const std::vector<std::filesystem::path>& paths);

    [[nodiscard]] const ReverseConfig& config() const noexcept { return config_; }

private:
    struct SourceScript {
        std::string source;
        std::string text;
    };

    // rejected: 분할 전에 이미 발생한 진단 (읽을 수 없는 파일)
    [[nodiscard]] ReverseReport run(const std::vector<SourceScript>& scripts,
                                    std::vector<RejectedStatement>   rejected);

    [[nodiscard]] ActionReport reverse_function(ParsedFunction function);

    void emit_events(const ReverseReport& report);

    ReverseConfig                     config_;
    std::shared_ptr<StructuredLogger> logger_;

    StatementSplitter        splitter_;
    TableParser              table_parser_;
    FunctionParser           function_parser_;
    StructureScorer          scorer_;
    InfoInstanceDetector     info_instance_detector_;
    TranslationTableDetector translation_detector_;
    ParserCoordinator        coordinator_;
};
