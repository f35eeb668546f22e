// ---------------------------------------------------------------------------
// info_instance_detector.cpp
// ---------------------------------------------------------------------------

#include "pattern/info_instance_detector.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "construct/text_scan.hpp"
#include "schema/identifier.hpp"

namespace {

// 대소문자 무시로 expected 와 같은 컬럼을 찾아 원문 이름을 반환
std::optional<std::string> find_column(const std::vector<std::string>& columns,
                                       std::string_view                expected) {
    for (const auto& col : columns) {
        if (text_scan::iequals(col, expected)) {
            return col;
        }
    }
    return std::nullopt;
}

}  // namespace

InfoInstanceDetector::InfoInstanceDetector(ClassifierConfig config)
    : config_(std::move(config))
{}

InfoInstanceDetectionResult
InfoInstanceDetector::classify(std::string_view                table_name,
                               const std::vector<std::string>& columns) const {
    const std::string normalized = normalize_entity_name(table_name, config_.table_prefixes);
    const std::string suffix     = text_scan::to_lower(config_.vocabulary_suffix);

    InfoInstanceDetectionResult result;

    if (!suffix.empty() && normalized.size() > suffix.size() && normalized.ends_with(suffix)) {
        result.is_vocabulary_table = true;
        result.base_entity_name    = normalized.substr(0, normalized.size() - suffix.size());
        return result;
    }

    auto vocabulary_fk = find_column(columns, "fk_" + normalized + suffix);
    if (!vocabulary_fk) {
        return result;
    }

    result.is_instance_table    = true;
    result.base_entity_name     = normalized;
    result.vocabulary_fk_column = std::move(vocabulary_fk);
    result.parent_fk_column     = find_column(columns, "fk_parent_" + normalized);
    return result;
}

std::vector<InfoInstancePair>
InfoInstanceDetector::detect_pairs(const std::vector<TableColumns>& tables,
                                   const TranslationIndex&          translation_index) const {
    // 1차: base 이름별 분류. 출력 순서는 vocabulary base 이름이 처음 나온 순서.
    std::vector<std::string>           vocabulary_order;
    std::map<std::string, std::string> vocabulary_tables;
    std::map<std::string, std::string> instance_tables;

    for (const auto& table : tables) {
        const auto result = classify(table.name, table.columns);
        if (!result.base_entity_name) {
            continue;
        }
        if (result.is_vocabulary_table) {
            const auto& base = *result.base_entity_name;
            if (!vocabulary_tables.contains(base)) {
                vocabulary_order.push_back(base);
            }
            vocabulary_tables[base] = table.name;
        } else if (result.is_instance_table) {
            instance_tables[*result.base_entity_name] = table.name;
        }
    }

    // 2차: 짝짓기
    std::vector<InfoInstancePair> pairs;
    for (const auto& base : vocabulary_order) {
        const auto& vocabulary_table = vocabulary_tables.at(base);
        const auto inst = instance_tables.find(base);
        if (inst == instance_tables.end()) {
            continue;
        }

        InfoInstancePair pair;
        pair.vocabulary_table = vocabulary_table;
        pair.instance_table   = inst->second;
        pair.base_entity_name = base;

        if (auto tl = translation_index.find(base + text_scan::to_lower(config_.vocabulary_suffix));
            tl != translation_index.end()) {
            pair.translation_table = tl->second;
        } else if (auto tl_base = translation_index.find(base); tl_base != translation_index.end()) {
            pair.translation_table = tl_base->second;
        }

        spdlog::debug("info_instance_detector: paired '{}' with '{}' (base={})",
                      pair.vocabulary_table, pair.instance_table, base);
        pairs.push_back(std::move(pair));
    }
    return pairs;
}
