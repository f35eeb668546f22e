// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 ReverseConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱/검증 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - 시퀀스 키가 있으나 비어 있으면 빈 목록으로 취급한다 (기본값 아님).
//   table_prefixes 의 경우 이것이 검증 오류가 된다.
//
// [알려진 한계]
// - 알 수 없는 키는 조용히 무시한다 (오타 감지 불가).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <string>
#include <filesystem>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없으면 fallback, sequence 가 아니면 fallback 과 경고.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node&               node,
                                                            const std::vector<std::string>& fallback) {
    if (!node) {
        return fallback;
    }
    if (!node.IsSequence()) {
        spdlog::warn("config_loader: expected a sequence, using defaults");
        return fallback;
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 double 값을 읽는다.
// 스칼라가 숫자가 아니면 YAML::BadConversion 을 그대로 던진다
// (섹션 파서의 try-catch 가 오류로 변환).
// ---------------------------------------------------------------------------
[[nodiscard]] double read_double(const YAML::Node& node, double fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<double>();
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level  = read_string(node["log_level"],  cfg.log_level);
    cfg.log_format = read_string(node["log_format"], cfg.log_format);
    cfg.log_path   = read_string(node["log_path"],   cfg.log_path);

    if (cfg.log_format != "json" && cfg.log_format != "text") {
        spdlog::warn("config_loader: global.log_format '{}' is not 'json' or 'text', "
                     "defaulting to 'json'", cfg.log_format);
        cfg.log_format = "json";
    }
    return cfg;
}

[[nodiscard]] ConfidenceConfig parse_confidence(const YAML::Node& node) {
    ConfidenceConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.min_confidence   = read_double(node["min_confidence"],   cfg.min_confidence);
    cfg.action_baseline  = read_double(node["action_baseline"],  cfg.action_baseline);
    cfg.fallback_penalty = read_double(node["fallback_penalty"], cfg.fallback_penalty);
    return cfg;
}

[[nodiscard]] ClassifierConfig parse_classifier(const YAML::Node& node) {
    ClassifierConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.table_prefixes     = read_string_sequence(node["table_prefixes"], cfg.table_prefixes);
    cfg.vocabulary_suffix  = read_string(node["vocabulary_suffix"],  cfg.vocabulary_suffix);
    cfg.translation_suffix = read_string(node["translation_suffix"], cfg.translation_suffix);
    cfg.translation_prefix = read_string(node["translation_prefix"], cfg.translation_prefix);
    cfg.locale_columns     = read_string_sequence(node["locale_columns"], cfg.locale_columns);
    return cfg;
}

[[nodiscard]] StructureConfig parse_structure(const YAML::Node& node) {
    StructureConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.tenant_columns = read_string_sequence(node["tenant_columns"], cfg.tenant_columns);
    return cfg;
}

[[nodiscard]] bool in_unit_range(double v) noexcept {
    return v >= 0.0 && v <= 1.0;
}

}  // namespace

std::expected<void, std::string> ConfigLoader::validate(const ReverseConfig& cfg) {
    const struct {
        const char* key;
        double      value;
    } ranged[] = {
        {"confidence.min_confidence",   cfg.confidence.min_confidence},
        {"confidence.action_baseline",  cfg.confidence.action_baseline},
        {"confidence.fallback_penalty", cfg.confidence.fallback_penalty},
    };
    for (const auto& entry : ranged) {
        if (!in_unit_range(entry.value)) {
            return std::unexpected(fmt::format(
                "config_loader: {} must be within [0, 1], got {}", entry.key, entry.value));
        }
    }
    if (cfg.classifier.table_prefixes.empty()) {
        return std::unexpected(std::string(
            "config_loader: classifier.table_prefixes must have at least one prefix"));
    }
    if (cfg.classifier.vocabulary_suffix.empty()) {
        return std::unexpected(std::string(
            "config_loader: classifier.vocabulary_suffix must not be empty"));
    }
    return {};
}

std::expected<ReverseConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 섹션별 파싱
    ReverseConfig cfg{};

    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'global' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        cfg.confidence = parse_confidence(root["confidence"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'confidence' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        cfg.classifier = parse_classifier(root["classifier"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'classifier' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        cfg.structure = parse_structure(root["structure"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'structure' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 4. 값 범위 검증
    if (auto valid = validate(cfg); !valid) {
        spdlog::error("{}", valid.error());
        return std::unexpected(valid.error());
    }

    spdlog::info(
        "config_loader: config loaded successfully, "
        "min_confidence={}, table_prefixes={}, tenant_columns={}",
        cfg.confidence.min_confidence,
        cfg.classifier.table_prefixes.size(),
        cfg.structure.tenant_columns.size()
    );

    return cfg;
}
