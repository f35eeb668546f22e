#pragma once

// ---------------------------------------------------------------------------
// translation_detector.hpp
//
// 번역 테이블 (<x>_translation / tl_<x>) 탐지.
//
// 번역 테이블 조건:
//   1. 이름이 translation_suffix 로 끝나거나 translation_prefix 로 시작
//   2. fk_* 컬럼과 locale 컬럼이 존재
//   3. PRIMARY KEY 가 정확히 그 두 컬럼
//
// translatable_fields 는 조건 충족 여부와 무관하게 항상 계산한다
// (fk/locale 컬럼을 제외한 나머지).
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <vector>

#include "config/reverse_config.hpp"
#include "pattern/info_instance_detector.hpp"
#include "schema/schema_types.hpp"

struct TranslationDetectionResult {
    bool                       is_translation_table{false};
    std::optional<std::string> parent_table{};
    std::optional<std::string> fk_column{};
    std::optional<std::string> locale_column{};
    std::vector<std::string>   translatable_fields{};
};

class TranslationTableDetector {
public:
    explicit TranslationTableDetector(ClassifierConfig config = {});

    [[nodiscard]] TranslationDetectionResult detect(const ParsedTable& table) const;

    // -----------------------------------------------------------------------
    // build_index
    //   번역 테이블만 골라 정규화된 부모 이름 -> 번역 테이블 이름 맵을 만든다.
    //   예: tl_contract_info -> "contract_info", tb_contract_translation -> "contract"
    //   같은 부모가 여럿이면 나중 테이블이 이긴다.
    // -----------------------------------------------------------------------
    [[nodiscard]] TranslationIndex build_index(const std::vector<ParsedTable>& tables) const;

private:
    // 접미사/접두사를 뗀 부모 이름 (원문 대소문자). 번역 이름이 아니면 nullopt.
    [[nodiscard]] std::optional<std::string> parent_name(const std::string& table_name) const;

    ClassifierConfig config_;
};
