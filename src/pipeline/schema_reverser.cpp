// ---------------------------------------------------------------------------
// schema_reverser.cpp
// ---------------------------------------------------------------------------

#include "pipeline/schema_reverser.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "coordinator/confidence_policy.hpp"

namespace {

// 파일에서 읽은 문장 (출처 포함)
struct SourcedStatement {
    const std::string* source;
    SqlStatement       statement;
};

std::vector<std::string> column_names(const ParsedTable& table) {
    std::vector<std::string> names;
    names.reserve(table.columns.size());
    for (const auto& col : table.columns) {
        names.push_back(col.name);
    }
    return names;
}

EntityClassification classify_entity(const InfoInstanceDetectionResult& info_instance,
                                     const TranslationDetectionResult&  translation) noexcept {
    if (translation.is_translation_table) {
        return EntityClassification::kTranslation;
    }
    if (info_instance.is_vocabulary_table) {
        return EntityClassification::kVocabulary;
    }
    if (info_instance.is_instance_table) {
        return EntityClassification::kInstance;
    }
    return EntityClassification::kPlain;
}

RejectedStatement make_rejected(const std::string& source, const SqlStatement& stmt, ParseError error) {
    return RejectedStatement{
        .source          = source,
        .statement_index = stmt.index,
        .kind            = stmt.kind,
        .error           = std::move(error),
    };
}

}  // namespace

std::size_t ReverseReport::accepted_entity_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        entities.begin(), entities.end(), [](const EntityReport& e) { return e.accepted; }));
}

std::size_t ReverseReport::accepted_action_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        actions.begin(), actions.end(), [](const ActionReport& a) { return a.accepted; }));
}

SchemaReverser::SchemaReverser(ReverseConfig config, std::shared_ptr<StructuredLogger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , scorer_(config_.classifier.table_prefixes, config_.structure.tenant_columns)
    , info_instance_detector_(config_.classifier)
    , translation_detector_(config_.classifier)
{}

ReverseReport SchemaReverser::reverse(std::string_view script, std::string_view source) {
    std::vector<SourceScript> scripts;
    scripts.push_back(SourceScript{std::string(source), std::string(script)});
    return run(scripts, {});
}

ReverseReport SchemaReverser::reverse_files(const std::vector<std::filesystem::path>& paths) {
    std::vector<SourceScript>      scripts;
    std::vector<RejectedStatement> unreadable;

    for (const auto& path : paths) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            unreadable.push_back(RejectedStatement{
                .source          = path.string(),
                .statement_index = 0,
                .kind            = StatementKind::kOther,
                .error           = ParseError{ParseErrorCode::kInternalError,
                                              fmt::format("cannot open file '{}'", path.string()),
                                              {}},
            });
            continue;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        scripts.push_back(SourceScript{path.string(), buffer.str()});
    }

    return run(scripts, std::move(unreadable));
}

// ---------------------------------------------------------------------------
// run
//   모든 스크립트의 문장을 하나의 배치로 처리한다.
// ---------------------------------------------------------------------------
ReverseReport SchemaReverser::run(const std::vector<SourceScript>& scripts,
                                  std::vector<RejectedStatement>   rejected) {
    coordinator_.reset_metrics();

    ReverseReport report;
    report.rejected = std::move(rejected);

    // 1. 분할
    std::vector<SourcedStatement> statements;
    for (const auto& script : scripts) {
        for (auto& stmt : splitter_.split(script.text)) {
            statements.push_back(SourcedStatement{&script.source, std::move(stmt)});
        }
    }

    // 2. 문장 종류별 파싱
    std::vector<ParsedTable>      tables;
    std::vector<CommentStatement> comments;
    std::vector<ParsedFunction>   functions;

    for (const auto& [source, stmt] : statements) {
        try {
            switch (stmt.kind) {
                case StatementKind::kCreateTable: {
                    auto parsed = table_parser_.parse(stmt.text);
                    if (!parsed) {
                        report.rejected.push_back(make_rejected(*source, stmt, std::move(parsed.error())));
                        break;
                    }
                    tables.push_back(std::move(*parsed));
                    break;
                }
                case StatementKind::kCommentOnTable:
                case StatementKind::kCommentOnColumn: {
                    auto parsed = table_parser_.parse_comment(stmt.text);
                    if (!parsed) {
                        report.rejected.push_back(make_rejected(*source, stmt, std::move(parsed.error())));
                        break;
                    }
                    comments.push_back(std::move(*parsed));
                    break;
                }
                case StatementKind::kCreateFunction: {
                    auto parsed = function_parser_.parse(stmt.text);
                    if (!parsed) {
                        report.rejected.push_back(make_rejected(*source, stmt, std::move(parsed.error())));
                        break;
                    }
                    functions.push_back(std::move(*parsed));
                    break;
                }
                case StatementKind::kOther:
                    ++report.ignored_statements;
                    break;
            }
        } catch (const std::exception& e) {
            report.rejected.push_back(make_rejected(
                *source, stmt,
                make_parse_error(ParseErrorCode::kInternalError,
                                 fmt::format("unexpected exception: {}", e.what()), stmt.text)));
        }
    }

    for (const auto& r : report.rejected) {
        spdlog::warn("schema_reverser: {} statement #{} rejected ({}): {}",
                     r.source, r.statement_index, parse_error_code_name(r.error.code),
                     r.error.message);
    }

    // 3. 주석 부착
    report.unmatched_comments = TableParser::attach_comments(tables, comments);
    if (report.unmatched_comments > 0) {
        spdlog::debug("schema_reverser: {} comment(s) without a matching table",
                      report.unmatched_comments);
    }

    // 4. 번역 색인
    report.translation_index = translation_detector_.build_index(tables);

    // 5~6. 점수 + 분류 + 짝짓기
    std::vector<TableColumns> accepted_tables;
    report.entities.reserve(tables.size());
    for (auto& table : tables) {
        EntityReport entity;
        entity.signals          = scorer_.score(table);
        entity.baseline         = entity.signals.baseline_confidence;
        entity.final_confidence = clamp_confidence(entity.baseline);
        entity.accepted         = entity.final_confidence >= config_.confidence.min_confidence;

        const auto columns   = column_names(table);
        entity.info_instance = info_instance_detector_.classify(table.table_name, columns);
        entity.translation   = translation_detector_.detect(table);
        entity.classification = classify_entity(entity.info_instance, entity.translation);

        if (entity.accepted) {
            accepted_tables.push_back(TableColumns{table.table_name, columns});
        }
        entity.table = std::move(table);
        report.entities.push_back(std::move(entity));
    }

    report.pairs = info_instance_detector_.detect_pairs(accepted_tables, report.translation_index);

    // 7. 액션 보고서
    report.actions.reserve(functions.size());
    for (auto& fn : functions) {
        report.actions.push_back(reverse_function(std::move(fn)));
    }

    report.metrics         = coordinator_.get_metrics();
    report.metrics_summary = coordinator_.metrics_summary();

    spdlog::info("schema_reverser: {} table(s) ({} accepted), {} routine(s) ({} accepted), "
                 "{} pair(s), {} rejected",
                 report.entities.size(), report.accepted_entity_count(),
                 report.actions.size(), report.accepted_action_count(),
                 report.pairs.size(), report.rejected.size());

    emit_events(report);
    return report;
}

ActionReport SchemaReverser::reverse_function(ParsedFunction function) {
    ActionReport action;

    action.baseline = config_.confidence.action_baseline;
    if (function.used_fallback) {
        action.baseline *= config_.confidence.fallback_penalty;
    }

    action.parser_results   = coordinator_.parse_with_best_parsers(function.body);
    action.delta            = ParserCoordinator::total_delta(action.parser_results);
    action.final_confidence = clamp_confidence(action.baseline + action.delta);
    action.accepted         = action.final_confidence >= config_.confidence.min_confidence;

    spdlog::debug("schema_reverser: routine '{}' baseline={:.2f} delta={:+.2f} final={:.2f}",
                  function.function_name, action.baseline, action.delta, action.final_confidence);

    action.function = std::move(function);
    return action;
}

// ---------------------------------------------------------------------------
// emit_events
//   구조화 로거가 있을 때만 이벤트를 기록한다.
// ---------------------------------------------------------------------------
void SchemaReverser::emit_events(const ReverseReport& report) {
    if (!logger_) {
        return;
    }
    const auto now = std::chrono::system_clock::now();

    for (const auto& r : report.rejected) {
        logger_->log_reject(RejectLog{
            .source          = r.source,
            .statement_index = r.statement_index,
            .code            = std::string(parse_error_code_name(r.error.code)),
            .message         = r.error.message,
            .context         = r.error.context,
            .timestamp       = now,
        });
    }

    for (const auto& e : report.entities) {
        logger_->log_entity(EntityLog{
            .schema           = e.table.schema,
            .table_name       = e.table.table_name,
            .column_count     = e.table.columns.size(),
            .baseline         = e.baseline,
            .final_confidence = e.final_confidence,
            .accepted         = e.accepted,
            .classification   = std::string(entity_classification_name(e.classification)),
            .timestamp        = now,
        });
    }

    for (const auto& a : report.actions) {
        std::vector<std::string> parsers;
        parsers.reserve(a.parser_results.size());
        for (const auto& r : a.parser_results) {
            parsers.emplace_back(construct_id(r.parser_id));
        }
        logger_->log_action(ActionLog{
            .schema           = a.function.schema,
            .function_name    = a.function.function_name,
            .kind             = a.function.kind == RoutineKind::kProcedure ? "procedure" : "function",
            .parsers          = std::move(parsers),
            .baseline         = a.baseline,
            .delta            = a.delta,
            .final_confidence = a.final_confidence,
            .accepted         = a.accepted,
            .used_fallback    = a.function.used_fallback,
            .timestamp        = now,
        });
    }

    for (const auto& p : report.pairs) {
        logger_->log_pair(PairLog{
            .vocabulary_table  = p.vocabulary_table,
            .instance_table    = p.instance_table,
            .base_entity_name  = p.base_entity_name,
            .translation_table = p.translation_table,
            .timestamp         = now,
        });
    }

    MetricsLog metrics{.parsers = {}, .timestamp = now};
    for (const auto kind : kDispatchOrder) {
        const auto& m = report.metrics.at(kind);
        if (m.attempts == 0) {
            continue;
        }
        metrics.parsers.push_back(ParserMetricsEntry{
            .parser_id = std::string(construct_id(kind)),
            .attempts  = m.attempts,
            .successes = m.successes,
            .failures  = m.failures,
        });
    }
    logger_->log_metrics(metrics);
}
