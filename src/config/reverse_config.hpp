#pragma once

// ---------------------------------------------------------------------------
// reverse_config.hpp
//
// 역공학 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/schemarev.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다.
// - 모든 멤버는 기본값을 가진다. 설정 파일 없이도 동작 가능해야 한다.
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level : "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   log_format: "json" | "text"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_format{"json"};
    std::string log_path{"logs/schemarev.log"};
};

// ---------------------------------------------------------------------------
// ConfidenceConfig
//   모든 값은 [0,1].
//   min_confidence  : 이 값 이상인 엔티티/액션만 채택
//   action_baseline : 함수 본문 파싱 성공 시 기본 confidence
//   fallback_penalty: 헤더 해석 실패(fallback) 시 baseline 에 곱하는 계수
// ---------------------------------------------------------------------------
struct ConfidenceConfig {
    double min_confidence{0.80};
    double action_baseline{0.85};
    double fallback_penalty{0.80};
};

// ---------------------------------------------------------------------------
// ClassifierConfig
//   table_prefixes 는 선언 순서대로 각각 한 번씩 제거한다.
// ---------------------------------------------------------------------------
struct ClassifierConfig {
    std::vector<std::string> table_prefixes{"tb_", "tv_"};
    std::string              vocabulary_suffix{"_info"};
    std::string              translation_suffix{"_translation"};
    std::string              translation_prefix{"tl_"};
    std::vector<std::string> locale_columns{"locale", "language", "lang_code", "lang"};
};

// ---------------------------------------------------------------------------
// StructureConfig
//   tenant_columns: 다중 테넌트 격리 컬럼 이름 (하나라도 있으면 tenant 신호)
// ---------------------------------------------------------------------------
struct StructureConfig {
    std::vector<std::string> tenant_columns{"tenant_id", "fk_customer_org"};
};

// ---------------------------------------------------------------------------
// ReverseConfig
//   ConfigLoader::load 가 반환하는 루트 구조체.
// ---------------------------------------------------------------------------
struct ReverseConfig {
    GlobalConfig     global{};
    ConfidenceConfig confidence{};
    ClassifierConfig classifier{};
    StructureConfig  structure{};
};
