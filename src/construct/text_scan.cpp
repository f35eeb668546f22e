// ---------------------------------------------------------------------------
// text_scan.cpp
//
// 파서 공용 어휘 스캔 헬퍼 구현.
//
// [상태 머신]
// skip_literal_or_comment 하나가 모든 리터럴/주석 영역을 건너뛰고,
// find_* / split_* 함수는 이 함수를 통해서만 영역을 판정한다.
// 영역 판정 규칙이 한 곳에 있어야 파서 간 결과가 어긋나지 않는다.
// ---------------------------------------------------------------------------

#include "construct/text_scan.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace text_scan {

namespace {

char upper_char(char c) noexcept {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// pos 위치에서 word 가 대소문자 무시로 일치하고 양쪽이 단어 경계인지
bool word_at(std::string_view text, std::string_view word, std::size_t pos) noexcept {
    if (word.empty() || pos + word.size() > text.size()) {
        return false;
    }
    for (std::size_t i = 0; i < word.size(); ++i) {
        if (upper_char(text[pos + i]) != upper_char(word[i])) {
            return false;
        }
    }
    const bool valid_start = (pos == 0) || !is_ident_char(text[pos - 1]);
    const bool valid_end   = (pos + word.size() >= text.size())
                          || !is_ident_char(text[pos + word.size()]);
    return valid_start && valid_end;
}

// "$tag$" 형태의 dollar-quote 여는 태그 길이. 아니면 0.
// $1, $2 같은 위치 파라미터는 태그가 숫자로 시작하므로 제외된다.
std::size_t dollar_tag_length(std::string_view text, std::size_t pos) noexcept {
    if (pos >= text.size() || text[pos] != '$') {
        return 0;
    }
    std::size_t i = pos + 1;
    if (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        return 0;
    }
    while (i < text.size() && is_ident_char(text[i])) {
        ++i;
    }
    if (i < text.size() && text[i] == '$') {
        return i - pos + 1;
    }
    return 0;
}

}  // namespace

bool is_ident_char(char c) noexcept {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) noexcept {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (upper_char(a[i]) != upper_char(b[i])) {
            return false;
        }
    }
    return true;
}

bool starts_with_word(std::string_view text, std::string_view word) noexcept {
    return word_at(text, word, 0);
}

std::size_t find_word(std::string_view text, std::string_view word, std::size_t from) noexcept {
    if (word.empty()) {
        return std::string_view::npos;
    }
    for (std::size_t i = from; i + word.size() <= text.size(); ++i) {
        if (word_at(text, word, i)) {
            return i;
        }
    }
    return std::string_view::npos;
}

bool contains_word(std::string_view text, std::string_view word) noexcept {
    return find_word(text, word) != std::string_view::npos;
}

std::size_t count_words(std::string_view text, std::string_view word) noexcept {
    std::size_t count = 0;
    std::size_t pos   = find_word(text, word);
    while (pos != std::string_view::npos) {
        ++count;
        pos = find_word(text, word, pos + word.size());
    }
    return count;
}

std::size_t skip_literal_or_comment(std::string_view text, std::size_t pos) noexcept {
    const std::size_t len = text.size();
    if (pos >= len) {
        return pos;
    }
    const char c    = text[pos];
    const char next = (pos + 1 < len) ? text[pos + 1] : '\0';

    // '...' / "..." : 같은 따옴표 두 번은 이스케이프
    if (c == '\'' || c == '"') {
        std::size_t i = pos + 1;
        while (i < len) {
            if (text[i] == c) {
                if (i + 1 < len && text[i + 1] == c) {
                    i += 2;
                    continue;
                }
                return i + 1;
            }
            ++i;
        }
        return len;
    }

    // -- 줄 주석
    if (c == '-' && next == '-') {
        const auto nl = text.find('\n', pos);
        return (nl == std::string_view::npos) ? len : nl + 1;
    }

    // /* 블록 주석 */
    if (c == '/' && next == '*') {
        const auto close = text.find("*/", pos + 2);
        return (close == std::string_view::npos) ? len : close + 2;
    }

    // $tag$ ... $tag$
    const std::size_t tag_len = dollar_tag_length(text, pos);
    if (tag_len > 0) {
        const std::string_view tag = text.substr(pos, tag_len);
        const auto close = text.find(tag, pos + tag_len);
        return (close == std::string_view::npos) ? len : close + tag_len;
    }

    return pos;
}

std::size_t find_top_level_word(std::string_view text,
                                std::string_view word,
                                std::size_t      from) noexcept {
    int depth = 0;
    std::size_t i = from;
    while (i < text.size()) {
        const std::size_t skipped = skip_literal_or_comment(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        const char c = text[i];
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth > 0) {
                --depth;
            }
        } else if (depth == 0 && word_at(text, word, i)) {
            return i;
        }
        ++i;
    }
    return std::string_view::npos;
}

std::size_t find_statement_end(std::string_view text, std::size_t from) noexcept {
    std::size_t i = from;
    while (i < text.size()) {
        const std::size_t skipped = skip_literal_or_comment(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        if (text[i] == ';') {
            return i;
        }
        ++i;
    }
    return std::string_view::npos;
}

std::vector<std::string_view> split_statements(std::string_view text) {
    std::vector<std::string_view> result;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = find_statement_end(text, start);
        const auto piece = (end == std::string_view::npos)
            ? text.substr(start)
            : text.substr(start, end - start);
        const auto trimmed = trim(piece);
        if (!trimmed.empty()) {
            result.push_back(trimmed);
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return result;
}

std::vector<std::string_view> split_top_level_commas(std::string_view text) {
    std::vector<std::string_view> result;
    int depth = 0;
    std::size_t start = 0;
    std::size_t i     = 0;
    while (i < text.size()) {
        const std::size_t skipped = skip_literal_or_comment(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        const char c = text[i];
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth > 0) {
                --depth;
            }
        } else if (c == ',' && depth == 0) {
            const auto trimmed = trim(text.substr(start, i - start));
            if (!trimmed.empty()) {
                result.push_back(trimmed);
            }
            start = i + 1;
        }
        ++i;
    }
    const auto tail = trim(text.substr(std::min(start, text.size())));
    if (!tail.empty()) {
        result.push_back(tail);
    }
    return result;
}

std::optional<ParenSpan> extract_parenthesized(std::string_view text, std::size_t open_pos) {
    if (open_pos >= text.size() || text[open_pos] != '(') {
        return std::nullopt;
    }
    int depth = 0;
    std::size_t i = open_pos;
    while (i < text.size()) {
        const std::size_t skipped = skip_literal_or_comment(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        if (text[i] == '(') {
            ++depth;
        } else if (text[i] == ')') {
            --depth;
            if (depth == 0) {
                return ParenSpan{text.substr(open_pos + 1, i - open_pos - 1), i + 1};
            }
        }
        ++i;
    }
    return std::nullopt;
}

std::optional<std::size_t> match_paren_backward(std::string_view text,
                                                std::size_t      close_pos) noexcept {
    if (close_pos >= text.size() || text[close_pos] != ')') {
        return std::nullopt;
    }
    int depth = 0;
    std::size_t i = close_pos + 1;
    while (i > 0) {
        --i;
        if (text[i] == ')') {
            ++depth;
        } else if (text[i] == '(') {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::optional<CallSpan> find_call_before(std::string_view text, std::size_t pos) noexcept {
    std::size_t i = std::min(pos, text.size());
    while (true) {
        while (i > 0 && is_space(text[i - 1])) {
            --i;
        }
        if (i == 0 || text[i - 1] != ')') {
            return std::nullopt;
        }
        const auto open = match_paren_backward(text, i - 1);
        if (!open) {
            return std::nullopt;
        }
        std::size_t name_end = *open;
        while (name_end > 0 && is_space(text[name_end - 1])) {
            --name_end;
        }
        std::size_t name_begin = name_end;
        while (name_begin > 0 && is_ident_char(text[name_begin - 1])) {
            --name_begin;
        }
        if (name_begin == name_end) {
            return std::nullopt;
        }
        const auto name = text.substr(name_begin, name_end - name_begin);
        if (iequals(name, "FILTER")) {
            i = name_begin;
            continue;
        }
        return CallSpan{name, name_begin};
    }
}

std::optional<std::string_view> dollar_quoted_body(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t tag_len = dollar_tag_length(text, i);
        if (tag_len > 0) {
            const std::size_t content_begin = i + tag_len;
            const auto close = text.find(text.substr(i, tag_len), content_begin);
            if (close == std::string_view::npos) {
                return text.substr(content_begin);
            }
            return text.substr(content_begin, close - content_begin);
        }
        const std::size_t skipped = skip_literal_or_comment(text, i);
        i = (skipped != i) ? skipped : i + 1;
    }
    return std::nullopt;
}

std::string remove_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();
    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';
        const bool is_comment = (c == '-' && next == '-') || (c == '/' && next == '*');

        const std::size_t skipped = skip_literal_or_comment(sql, i);
        if (skipped == i) {
            result.push_back(c);
            ++i;
            continue;
        }
        if (is_comment) {
            // 주석 자리에 공백 하나 삽입 (END/**/LOOP 가 붙지 않도록)
            result.push_back(' ');
        } else {
            result.append(sql.substr(i, skipped - i));
        }
        i = skipped;
    }
    return result;
}

std::string collapse_whitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool in_space = false;
    for (const char c : trim(text)) {
        if (is_space(c)) {
            if (!in_space) {
                result.push_back(' ');
            }
            in_space = true;
        } else {
            result.push_back(c);
            in_space = false;
        }
    }
    return result;
}

}  // namespace text_scan
