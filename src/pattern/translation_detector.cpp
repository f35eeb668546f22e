// ---------------------------------------------------------------------------
// translation_detector.cpp
// ---------------------------------------------------------------------------

#include "pattern/translation_detector.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "construct/text_scan.hpp"
#include "schema/identifier.hpp"

namespace {

bool in_primary_key(const ParsedTable& table, const std::string& column) {
    return std::any_of(table.primary_key.begin(), table.primary_key.end(),
                       [&column](const std::string& pk) { return text_scan::iequals(pk, column); });
}

}  // namespace

TranslationTableDetector::TranslationTableDetector(ClassifierConfig config)
    : config_(std::move(config))
{}

std::optional<std::string>
TranslationTableDetector::parent_name(const std::string& table_name) const {
    const std::string lowered = text_scan::to_lower(table_name);
    const std::string suffix  = text_scan::to_lower(config_.translation_suffix);
    const std::string prefix  = text_scan::to_lower(config_.translation_prefix);

    if (!suffix.empty() && lowered.size() > suffix.size() && lowered.ends_with(suffix)) {
        return table_name.substr(0, table_name.size() - suffix.size());
    }
    if (!prefix.empty() && lowered.size() > prefix.size() && lowered.starts_with(prefix)) {
        return table_name.substr(prefix.size());
    }
    return std::nullopt;
}

TranslationDetectionResult TranslationTableDetector::detect(const ParsedTable& table) const {
    TranslationDetectionResult result;

    const auto parent = parent_name(table.table_name);
    if (!parent) {
        return result;
    }

    std::optional<std::string> fk_column;
    std::optional<std::string> locale_column;
    for (const auto& col : table.columns) {
        const std::string lowered = text_scan::to_lower(col.name);
        if (!fk_column && lowered.starts_with("fk_")) {
            fk_column = col.name;
            continue;
        }
        if (!locale_column
            && std::any_of(config_.locale_columns.begin(), config_.locale_columns.end(),
                           [&lowered](const std::string& l) { return text_scan::iequals(lowered, l); })) {
            locale_column = col.name;
        }
    }

    for (const auto& col : table.columns) {
        if ((fk_column && col.name == *fk_column) || (locale_column && col.name == *locale_column)) {
            continue;
        }
        result.translatable_fields.push_back(col.name);
    }

    const bool is_translation = fk_column && locale_column
                             && table.primary_key.size() == 2
                             && in_primary_key(table, *fk_column)
                             && in_primary_key(table, *locale_column);
    if (!is_translation) {
        spdlog::debug("translation_detector: '{}' has a translation name but not the "
                      "fk + locale primary key shape", table.table_name);
        return result;
    }

    result.is_translation_table = true;
    result.parent_table         = *parent;
    result.fk_column            = std::move(fk_column);
    result.locale_column        = std::move(locale_column);
    return result;
}

TranslationIndex TranslationTableDetector::build_index(const std::vector<ParsedTable>& tables) const {
    TranslationIndex index;
    for (const auto& table : tables) {
        const auto result = detect(table);
        if (!result.is_translation_table || !result.parent_table) {
            continue;
        }
        index[normalize_entity_name(*result.parent_table, config_.table_prefixes)] = table.table_name;
    }
    return index;
}
