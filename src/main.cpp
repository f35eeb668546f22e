#include "config/config_loader.hpp"
#include "construct/text_scan.hpp"
#include "logger/structured_logger.hpp"
#include "pipeline/schema_reverser.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

void print_usage(const char* argv0) {
    spdlog::error("usage: {} <schema.sql> [more.sql ...]", argv0);
    spdlog::error("  SCHEMAREV_CONFIG    : YAML config path (optional)");
    spdlog::error("  SCHEMAREV_LOG_PATH  : structured log file (overrides global.log_path)");
    spdlog::error("  SCHEMAREV_LOG_LEVEL : debug|info|warn|error (overrides global.log_level)");
}

void print_report(const ReverseReport& report) {
    for (const auto& e : report.entities) {
        spdlog::info("entity {}.{} [{}] confidence={:.2f} {}",
                     e.table.schema, e.table.table_name,
                     entity_classification_name(e.classification),
                     e.final_confidence, e.accepted ? "accepted" : "below threshold");
    }
    for (const auto& a : report.actions) {
        spdlog::info("action {}.{} parsers={} confidence={:.2f} {}",
                     a.function.schema, a.function.function_name, a.parser_results.size(),
                     a.final_confidence, a.accepted ? "accepted" : "below threshold");
    }
    for (const auto& p : report.pairs) {
        spdlog::info("pair {} <-> {} (base={}, translation={})",
                     p.vocabulary_table, p.instance_table, p.base_entity_name,
                     p.translation_table.value_or("-"));
    }
    for (const auto& r : report.rejected) {
        spdlog::warn("rejected {} #{}: {}", r.source, r.statement_index, r.error.message);
    }
    spdlog::info("{}", report.metrics_summary);
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    // ── 설정 로드 (파일 → 환경변수 덮어쓰기) ─────────────────────────────
    ReverseConfig config;
    const std::string config_path = env_str("SCHEMAREV_CONFIG", "");
    if (!config_path.empty()) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            spdlog::error("schemarev: configuration error: {}", loaded.error());
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    config.global.log_path  = env_str("SCHEMAREV_LOG_PATH",  config.global.log_path);
    config.global.log_level = env_str("SCHEMAREV_LOG_LEVEL", config.global.log_level);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    const auto log_level = parse_log_level(config.global.log_level);
    if (!log_level) {
        spdlog::error("schemarev: unknown log level '{}'", config.global.log_level);
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(text_scan::to_lower(config.global.log_level)));

    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(
            *log_level, config.global.log_path,
            parse_log_format(config.global.log_format).value_or(LogFormat::kJson));
    } catch (const std::runtime_error& e) {
        spdlog::error("schemarev: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Starting schemarev");
    spdlog::info("Config: {}", config_path.empty() ? "<defaults>" : config_path);
    spdlog::info("Log: {} ({})", config.global.log_path, config.global.log_level);
    spdlog::info("Min confidence: {:.2f}", config.confidence.min_confidence);

    // ── 역공학 실행 ─────────────────────────────────────────────────────
    std::vector<std::filesystem::path> paths;
    for (int i = 1; i < argc; ++i) {
        paths.emplace_back(argv[i]);
    }

    SchemaReverser reverser{config, logger};
    const ReverseReport report = reverser.reverse_files(paths);
    print_report(report);
    logger->flush();

    spdlog::info("schemarev finished: {}/{} entities, {}/{} actions accepted",
                 report.accepted_entity_count(), report.entities.size(),
                 report.accepted_action_count(), report.actions.size());

    return EXIT_SUCCESS;
}
