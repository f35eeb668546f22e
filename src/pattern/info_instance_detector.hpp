#pragma once

// ---------------------------------------------------------------------------
// info_instance_detector.hpp
//
// Vocabulary/Instance 이중 테이블 패턴 탐지.
//
//   tb_<x>_info : 엔티티가 "무엇"인지 정의 (vocabulary)
//   tb_<x>      : 계층에서 "어디"에 있는지 정의 (instance, fk_<x>_info 보유)
//
// [설계 원칙]
// - 이름 비교는 소문자 정규화 후 수행한다. 반환하는 테이블/컬럼 이름은
//   원문 대소문자를 보존한다.
// - 분류가 모호한 경우는 정책으로 해결하며 오류를 반환하지 않는다.
// ---------------------------------------------------------------------------

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/reverse_config.hpp"

// ---------------------------------------------------------------------------
// TableColumns
//   detect_pairs 입력: 테이블 이름 + 컬럼 이름 목록.
// ---------------------------------------------------------------------------
struct TableColumns {
    std::string              name{};
    std::vector<std::string> columns{};
};

struct InfoInstanceDetectionResult {
    bool                       is_vocabulary_table{false};
    bool                       is_instance_table{false};
    std::optional<std::string> base_entity_name{};
    std::optional<std::string> vocabulary_fk_column{};  // instance 테이블만
    std::optional<std::string> parent_fk_column{};      // instance 테이블의 자기 참조 FK
};

struct InfoInstancePair {
    std::string                vocabulary_table{};
    std::string                instance_table{};
    std::string                base_entity_name{};
    std::optional<std::string> translation_table{};
};

// 정규화된 부모 이름 -> 번역 테이블 이름
using TranslationIndex = std::map<std::string, std::string>;

class InfoInstanceDetector {
public:
    explicit InfoInstanceDetector(ClassifierConfig config = {});

    // -----------------------------------------------------------------------
    // classify
    //   1. 소문자화 후 설정된 접두사 하나를 제거
    //   2. vocabulary_suffix 로 끝나면 vocabulary 테이블
    //   3. 아니면 fk_<base>_info 컬럼이 있을 때 instance 테이블
    //      (fk_parent_<base> 가 있으면 parent_fk_column 기록)
    //   4. 그 외에는 둘 다 아님
    // -----------------------------------------------------------------------
    [[nodiscard]] InfoInstanceDetectionResult
    classify(std::string_view table_name, const std::vector<std::string>& columns) const;

    // -----------------------------------------------------------------------
    // detect_pairs
    //   같은 base 이름의 vocabulary/instance 테이블을 짝짓는다.
    //   base 이름이 중복되면 나중 테이블이 이기지만 순서는 처음 위치를 유지한다.
    //   결과는 vocabulary base 이름이 입력에 처음 나온 순서. 짝이 없는 vocabulary 테이블은 버린다.
    //   번역 테이블은 "<base>_info" 다음 "<base>" 순서로 찾는다.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::vector<InfoInstancePair>
    detect_pairs(const std::vector<TableColumns>& tables,
                 const TranslationIndex&          translation_index = {}) const;

private:
    ClassifierConfig config_;
};
