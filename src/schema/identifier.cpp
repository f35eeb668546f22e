// ---------------------------------------------------------------------------
// identifier.cpp
// ---------------------------------------------------------------------------

#include "schema/identifier.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "construct/text_scan.hpp"

namespace {

std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept {
    const auto p = text.find_first_not_of(" \t\r\n", pos);
    return (p == std::string_view::npos) ? text.size() : p;
}

}  // namespace

std::optional<std::pair<std::string, std::size_t>>
read_identifier(std::string_view text, std::size_t pos) {
    pos = skip_spaces(text, pos);
    if (pos >= text.size()) {
        return std::nullopt;
    }

    if (text[pos] == '"') {
        std::string name;
        std::size_t i = pos + 1;
        while (i < text.size()) {
            if (text[i] == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    name.push_back('"');
                    i += 2;
                    continue;
                }
                return std::make_pair(std::move(name), i + 1);
            }
            name.push_back(text[i]);
            ++i;
        }
        return std::nullopt;  // 닫히지 않은 따옴표
    }

    std::size_t end = pos;
    while (end < text.size() && (text_scan::is_ident_char(text[end]) || text[end] == '$')) {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(text.substr(pos, end - pos)), end);
}

std::optional<QualifiedName>
read_qualified_name(std::string_view text, std::size_t pos, std::size_t max_parts) {
    QualifiedName out;
    auto part = read_identifier(text, pos);
    if (!part) {
        return std::nullopt;
    }
    out.parts.push_back(std::move(part->first));
    out.end = part->second;

    while (out.parts.size() < max_parts && out.end < text.size() && text[out.end] == '.') {
        auto next = read_identifier(text, out.end + 1);
        if (!next) {
            break;
        }
        out.parts.push_back(std::move(next->first));
        out.end = next->second;
    }
    return out;
}

std::vector<std::string> split_identifier_list(std::string_view list) {
    std::vector<std::string> names;
    for (const auto item : text_scan::split_top_level_commas(list)) {
        auto ident = read_identifier(item, 0);
        if (ident) {
            names.push_back(std::move(ident->first));
        }
    }
    return names;
}

std::optional<std::string> read_string_literal(std::string_view text, std::size_t pos) {
    if (pos >= text.size() || text[pos] != '\'') {
        return std::nullopt;
    }
    std::string value;
    std::size_t i = pos + 1;
    while (i < text.size()) {
        if (text[i] == '\'') {
            if (i + 1 < text.size() && text[i + 1] == '\'') {
                value.push_back('\'');
                i += 2;
                continue;
            }
            return value;
        }
        value.push_back(text[i]);
        ++i;
    }
    return std::nullopt;
}

std::string normalize_entity_name(std::string_view                table_name,
                                  const std::vector<std::string>& prefixes) {
    std::string name = text_scan::to_lower(table_name);
    for (const auto& prefix : prefixes) {
        const std::string lower_prefix = text_scan::to_lower(prefix);
        if (!lower_prefix.empty() && name.starts_with(lower_prefix)) {
            name.erase(0, lower_prefix.size());
        }
    }
    return name;
}
