// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader 단위 테스트
//
// [테스트 범위]
// - 전체 섹션이 있는 정상 YAML
// - 누락 섹션/키 기본값
// - 경로/문법/최상위 구조 오류
// - confidence 범위 검증, table_prefixes 빈 목록
// - log_format 잘못된 값 → json
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace {

// 임시 YAML 파일 작성. 반환값은 파일 경로.
std::string write_temp_yaml(const char* name, const char* content) {
    const std::string path = std::string("/tmp/") + name;
    FILE* fp = std::fopen(path.c_str(), "w");
    if (fp) {
        std::fputs(content, fp);
        std::fclose(fp);
    }
    return path;
}

}  // namespace

// ---------------------------------------------------------------------------
// 정상 로드
// ---------------------------------------------------------------------------

TEST(ConfigLoader, Load_FullConfig_AllSectionsParsed) {
    const auto path = write_temp_yaml("schemarev_cfg_full.yaml",
        "global:\n"
        "  log_level: debug\n"
        "  log_format: text\n"
        "  log_path: /tmp/schemarev_cfg.log\n"
        "confidence:\n"
        "  min_confidence: 0.5\n"
        "  action_baseline: 0.9\n"
        "  fallback_penalty: 0.7\n"
        "classifier:\n"
        "  table_prefixes: [t_]\n"
        "  vocabulary_suffix: _vocab\n"
        "  translation_suffix: _tr\n"
        "  translation_prefix: tr_\n"
        "  locale_columns: [locale]\n"
        "structure:\n"
        "  tenant_columns: [org_id]\n");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& cfg = *result;
    EXPECT_EQ(cfg.global.log_level, "debug");
    EXPECT_EQ(cfg.global.log_format, "text");
    EXPECT_EQ(cfg.global.log_path, "/tmp/schemarev_cfg.log");
    EXPECT_DOUBLE_EQ(cfg.confidence.min_confidence, 0.5);
    EXPECT_DOUBLE_EQ(cfg.confidence.action_baseline, 0.9);
    EXPECT_DOUBLE_EQ(cfg.confidence.fallback_penalty, 0.7);
    ASSERT_EQ(cfg.classifier.table_prefixes.size(), 1u);
    EXPECT_EQ(cfg.classifier.table_prefixes[0], "t_");
    EXPECT_EQ(cfg.classifier.vocabulary_suffix, "_vocab");
    EXPECT_EQ(cfg.classifier.translation_suffix, "_tr");
    EXPECT_EQ(cfg.classifier.translation_prefix, "tr_");
    ASSERT_EQ(cfg.classifier.locale_columns.size(), 1u);
    ASSERT_EQ(cfg.structure.tenant_columns.size(), 1u);
    EXPECT_EQ(cfg.structure.tenant_columns[0], "org_id");

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_MissingSections_UseDefaults) {
    const auto path = write_temp_yaml("schemarev_cfg_partial.yaml",
        "structure:\n"
        "  tenant_columns: [tenant_id]\n");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& cfg = *result;
    EXPECT_EQ(cfg.global.log_level, "info");
    EXPECT_EQ(cfg.global.log_format, "json");
    EXPECT_EQ(cfg.global.log_path, "logs/schemarev.log");
    EXPECT_DOUBLE_EQ(cfg.confidence.min_confidence, 0.80);
    EXPECT_DOUBLE_EQ(cfg.confidence.action_baseline, 0.85);
    EXPECT_DOUBLE_EQ(cfg.confidence.fallback_penalty, 0.80);
    ASSERT_EQ(cfg.classifier.table_prefixes.size(), 2u);
    EXPECT_EQ(cfg.classifier.table_prefixes[0], "tb_");
    EXPECT_EQ(cfg.classifier.table_prefixes[1], "tv_");
    EXPECT_EQ(cfg.classifier.vocabulary_suffix, "_info");
    EXPECT_EQ(cfg.classifier.locale_columns.size(), 4u);
    ASSERT_EQ(cfg.structure.tenant_columns.size(), 1u);

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_UnknownLogFormat_FallsBackToJson) {
    const auto path = write_temp_yaml("schemarev_cfg_format.yaml",
        "global:\n"
        "  log_format: xml\n");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->global.log_format, "json");

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_NonSequencePrefixes_UseDefaults) {
    const auto path = write_temp_yaml("schemarev_cfg_scalar_prefix.yaml",
        "classifier:\n"
        "  table_prefixes: tb_\n");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->classifier.table_prefixes.size(), 2u);

    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// 로드 실패
// ---------------------------------------------------------------------------

TEST(ConfigLoader, Load_MissingFile_Fails) {
    auto result = ConfigLoader::load("/tmp/schemarev_cfg_does_not_exist.yaml");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("cannot resolve config path"), std::string::npos)
        << result.error();
}

TEST(ConfigLoader, Load_SyntaxError_Fails) {
    const auto path = write_temp_yaml("schemarev_cfg_syntax.yaml",
        "global:\n"
        "  log_level: [unclosed\n");

    auto result = ConfigLoader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("YAML parse error"), std::string::npos) << result.error();

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_TopLevelSequence_Fails) {
    const auto path = write_temp_yaml("schemarev_cfg_seq.yaml",
        "- global\n"
        "- confidence\n");

    auto result = ConfigLoader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("not a valid YAML map"), std::string::npos) << result.error();

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_ConfidenceOutOfRange_Fails) {
    const auto path = write_temp_yaml("schemarev_cfg_range.yaml",
        "confidence:\n"
        "  min_confidence: 1.5\n");

    auto result = ConfigLoader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("confidence.min_confidence must be within [0, 1]"),
              std::string::npos) << result.error();

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_NonNumericConfidence_Fails) {
    const auto path = write_temp_yaml("schemarev_cfg_nan.yaml",
        "confidence:\n"
        "  action_baseline: high\n");

    auto result = ConfigLoader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("error parsing 'confidence' section"), std::string::npos)
        << result.error();

    std::remove(path.c_str());
}

TEST(ConfigLoader, Load_EmptyPrefixList_Fails) {
    const auto path = write_temp_yaml("schemarev_cfg_noprefix.yaml",
        "classifier:\n"
        "  table_prefixes: []\n");

    auto result = ConfigLoader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("table_prefixes must have at least one prefix"),
              std::string::npos) << result.error();

    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// validate 직접 호출
// ---------------------------------------------------------------------------

TEST(ConfigLoader, Validate_Defaults_Pass) {
    EXPECT_TRUE(ConfigLoader::validate(ReverseConfig{}).has_value());
}

TEST(ConfigLoader, Validate_NegativePenalty_Fails) {
    ReverseConfig cfg{};
    cfg.confidence.fallback_penalty = -0.1;
    auto result = ConfigLoader::validate(cfg);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("confidence.fallback_penalty"), std::string::npos);
}

TEST(ConfigLoader, Validate_EmptyVocabularySuffix_Fails) {
    ReverseConfig cfg{};
    cfg.classifier.vocabulary_suffix.clear();
    auto result = ConfigLoader::validate(cfg);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("vocabulary_suffix must not be empty"), std::string::npos);
}
