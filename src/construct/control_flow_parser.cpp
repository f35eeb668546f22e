// ---------------------------------------------------------------------------
// control_flow_parser.cpp
//
// BlockScanner 가 텍스트 위치 하나를 앞으로만 옮기며 본문을 읽는다.
// parse_body 는 종결 키워드(END / ELSIF / ELSE) 를 만나면 소비하지 않고
// 위치만 돌려주며, 종결 키워드의 짝 검사는 호출자(parse_if / parse_loop)
// 가 맡는다.
// ---------------------------------------------------------------------------

#include "construct/control_flow_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "construct/text_scan.hpp"

namespace {

enum class Terminator : std::uint8_t {
    kEof   = 0,
    kEnd   = 1,
    kElsif = 2,
    kElse  = 3,
};

struct Body {
    std::vector<ConstructStep> steps{};
    Terminator                 term{Terminator::kEof};
    std::size_t                pos{0};  // 종결 키워드 위치 (kEof 이면 text.size())
};

struct Parsed {
    ConstructStep step{};
    std::size_t   next{0};  // 소비한 블록 바로 뒤 위치
};

class BlockScanner {
public:
    explicit BlockScanner(std::string_view text) : text_(text) {}

    std::expected<Body, ParseError> parse_body(std::size_t pos, std::size_t depth, bool in_body);

    [[nodiscard]] std::int64_t loop_count() const noexcept { return loop_count_; }
    [[nodiscard]] std::int64_t branch_count() const noexcept { return branch_count_; }
    [[nodiscard]] std::int64_t max_depth() const noexcept { return max_depth_; }

    // 공백과 <<label>> 을 건너뛴다
    [[nodiscard]] std::size_t skip_space(std::size_t pos) const noexcept;

    // 블록 END 뒤의 선택적 라벨과 ';' 을 소비한다
    [[nodiscard]] std::size_t consume_end_tail(std::size_t pos) const noexcept;

private:
    [[nodiscard]] std::string_view word_at(std::size_t pos) const noexcept;

    std::expected<Parsed, ParseError> parse_if(std::size_t start, std::size_t keyword_len,
                                               std::size_t depth);
    std::expected<Parsed, ParseError> parse_loop(const char* kind, std::size_t start,
                                                 std::size_t header_begin, std::size_t depth);
    std::expected<std::size_t, ParseError> expect_end(std::size_t end_pos,
                                                      std::string_view keyword) const;

    [[nodiscard]] ParseError error(ParseErrorCode code, std::string message,
                                   std::size_t pos) const {
        return make_parse_error(code, std::move(message), text_.substr(std::min(pos, text_.size())));
    }

    // BEGIN 블록은 max_depth 에 세지 않지만 중첩 한도에는 포함된다
    [[nodiscard]] std::expected<void, ParseError> check_nesting(std::size_t depth) const {
        if (depth + block_depth_ > ControlFlowParser::kMaxNestingDepth) {
            return std::unexpected(make_parse_error(
                ParseErrorCode::kNestingTooDeep,
                "control flow nesting exceeds " +
                    std::to_string(ControlFlowParser::kMaxNestingDepth) + " levels",
                text_));
        }
        return {};
    }

    std::expected<void, ParseError> enter(std::size_t depth) {
        if (auto ok = check_nesting(depth); !ok) {
            return ok;
        }
        max_depth_ = std::max(max_depth_, static_cast<std::int64_t>(depth));
        return {};
    }

    std::string_view text_;
    std::int64_t     loop_count_{0};
    std::int64_t     branch_count_{0};
    std::int64_t     max_depth_{0};
    std::size_t      block_depth_{0};
};

std::size_t BlockScanner::skip_space(std::size_t pos) const noexcept {
    while (pos < text_.size()) {
        const char c = text_[pos];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            ++pos;
        } else if (text_.compare(pos, 2, "<<") == 0) {
            const auto close = text_.find(">>", pos + 2);
            pos = (close == std::string_view::npos) ? text_.size() : close + 2;
        } else {
            break;
        }
    }
    return pos;
}

std::string_view BlockScanner::word_at(std::size_t pos) const noexcept {
    if (pos >= text_.size()) {
        return {};
    }
    std::size_t end = pos;
    while (end < text_.size() && text_scan::is_ident_char(text_[end])) {
        ++end;
    }
    return text_.substr(pos, end - pos);
}

std::size_t BlockScanner::consume_end_tail(std::size_t pos) const noexcept {
    std::size_t p = skip_space(pos);
    if (p < text_.size() && text_[p] == ';') {
        return p + 1;
    }
    const auto label = word_at(p);
    if (!label.empty()) {
        const std::size_t q = skip_space(p + label.size());
        if (q < text_.size() && text_[q] == ';') {
            return q + 1;
        }
    }
    return p;
}

std::expected<std::size_t, ParseError>
BlockScanner::expect_end(std::size_t end_pos, std::string_view keyword) const {
    const std::size_t after = skip_space(end_pos + 3);
    if (!text_scan::iequals(word_at(after), keyword)) {
        return std::unexpected(error(ParseErrorCode::kMalformedStatement,
                                     "expected END " + std::string(keyword), end_pos));
    }
    return consume_end_tail(after + keyword.size());
}

std::expected<Parsed, ParseError>
BlockScanner::parse_if(std::size_t start, std::size_t keyword_len, std::size_t depth) {
    if (auto ok = enter(depth + 1); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    struct Branch {
        std::size_t                start;
        std::string                label;
        std::vector<ConstructStep> steps;
    };

    // ELSIF 체인은 반복으로 모은 뒤 뒤에서부터 중첩 if 로 접는다
    std::vector<Branch>        branches;
    std::vector<ConstructStep> else_steps;
    std::size_t                next = 0;

    std::size_t branch_start = start;
    std::size_t branch_kw    = keyword_len;
    for (;;) {
        ++branch_count_;

        const std::size_t cond_begin = branch_start + branch_kw;
        const std::size_t then_pos   = text_scan::find_top_level_word(text_, "THEN", cond_begin);
        if (then_pos == std::string_view::npos) {
            return std::unexpected(error(ParseErrorCode::kMissingKeyword, "IF without THEN",
                                         branch_start));
        }

        auto body = parse_body(then_pos + 4, depth + 1, true);
        if (!body) {
            return std::unexpected(std::move(body.error()));
        }
        branches.push_back(Branch{
            branch_start,
            text_scan::collapse_whitespace(text_.substr(cond_begin, then_pos - cond_begin)),
            std::move(body->steps),
        });

        if (body->term == Terminator::kElsif) {
            branch_start = body->pos;
            branch_kw    = word_at(body->pos).size();
            continue;
        }
        if (body->term == Terminator::kElse) {
            auto else_body = parse_body(body->pos + 4, depth + 1, true);
            if (!else_body) {
                return std::unexpected(std::move(else_body.error()));
            }
            if (else_body->term != Terminator::kEnd) {
                return std::unexpected(error(ParseErrorCode::kMalformedStatement,
                                             "unterminated IF", branch_start));
            }
            else_steps = std::move(else_body->steps);
            auto end = expect_end(else_body->pos, "IF");
            if (!end) {
                return std::unexpected(std::move(end.error()));
            }
            next = *end;
            break;
        }
        if (body->term == Terminator::kEnd) {
            auto end = expect_end(body->pos, "IF");
            if (!end) {
                return std::unexpected(std::move(end.error()));
            }
            next = *end;
            break;
        }
        return std::unexpected(error(ParseErrorCode::kMalformedStatement,
                                     "unterminated IF", branch_start));
    }

    Parsed out;
    out.next = next;
    for (auto it = branches.rbegin(); it != branches.rend(); ++it) {
        ConstructStep step;
        step.kind        = "if";
        step.label       = std::move(it->label);
        step.then_branch = std::move(it->steps);
        if (it == branches.rbegin()) {
            step.else_branch = std::move(else_steps);
        } else {
            step.else_branch.push_back(std::move(out.step));
        }
        step.raw_text = std::string(text_scan::trim(text_.substr(it->start, next - it->start)));
        out.step      = std::move(step);
    }
    return out;
}

std::expected<Parsed, ParseError>
BlockScanner::parse_loop(const char* kind, std::size_t start,
                         std::size_t header_begin, std::size_t depth) {
    if (auto ok = enter(depth + 1); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    ++loop_count_;

    const std::size_t loop_pos = text_scan::find_top_level_word(text_, "LOOP", header_begin);
    if (loop_pos == std::string_view::npos) {
        return std::unexpected(error(ParseErrorCode::kMissingKeyword,
                                     std::string(kind) + " without LOOP", start));
    }

    Parsed out;
    out.step.kind  = kind;
    out.step.label = text_scan::collapse_whitespace(text_.substr(header_begin, loop_pos - header_begin));

    auto body = parse_body(loop_pos + 4, depth + 1, true);
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }
    if (body->term != Terminator::kEnd) {
        return std::unexpected(error(ParseErrorCode::kMalformedStatement,
                                     "unterminated LOOP", start));
    }
    out.step.then_branch = std::move(body->steps);

    auto next = expect_end(body->pos, "LOOP");
    if (!next) {
        return std::unexpected(std::move(next.error()));
    }
    out.next = *next;
    out.step.raw_text = std::string(text_scan::trim(text_.substr(start, out.next - start)));
    return out;
}

std::expected<Body, ParseError>
BlockScanner::parse_body(std::size_t pos, std::size_t depth, bool in_body) {
    Body out;
    pos = skip_space(pos);

    while (pos < text_.size()) {
        const auto word = word_at(pos);

        if (text_scan::iequals(word, "END")) {
            const std::size_t after = skip_space(pos + 3);
            if (text_scan::iequals(word_at(after), "CASE")) {
                pos = skip_space(consume_end_tail(after + 4));
                continue;
            }
            out.term = Terminator::kEnd;
            out.pos  = pos;
            return out;
        }
        if (text_scan::iequals(word, "ELSIF") || text_scan::iequals(word, "ELSEIF")) {
            out.term = Terminator::kElsif;
            out.pos  = pos;
            return out;
        }
        if (text_scan::iequals(word, "ELSE")) {
            out.term = Terminator::kElse;
            out.pos  = pos;
            return out;
        }

        if (text_scan::iequals(word, "EXCEPTION")) {
            pos = skip_space(pos + word.size());
            continue;
        }
        if (text_scan::iequals(word, "WHEN")) {
            const auto then_pos = text_scan::find_top_level_word(text_, "THEN", pos + 4);
            if (then_pos == std::string_view::npos) {
                return std::unexpected(error(ParseErrorCode::kMissingKeyword,
                                             "WHEN without THEN", pos));
            }
            pos = skip_space(then_pos + 4);
            continue;
        }
        if (text_scan::iequals(word, "CASE")) {
            const auto when_pos = text_scan::find_top_level_word(text_, "WHEN", pos + 4);
            if (when_pos != std::string_view::npos) {
                pos = when_pos;
                continue;
            }
        }
        if (text_scan::iequals(word, "DECLARE")) {
            const auto begin_pos = text_scan::find_top_level_word(text_, "BEGIN", pos + 7);
            pos = (begin_pos == std::string_view::npos) ? text_.size() : begin_pos;
            continue;
        }
        if (text_scan::iequals(word, "BEGIN")) {
            if (auto ok = check_nesting(depth + 1); !ok) {
                return std::unexpected(std::move(ok.error()));
            }
            ++block_depth_;
            auto inner = parse_body(pos + 5, depth, in_body);
            --block_depth_;
            if (!inner) {
                return std::unexpected(std::move(inner.error()));
            }
            if (inner->term != Terminator::kEnd) {
                return std::unexpected(error(ParseErrorCode::kMalformedStatement,
                                             "BEGIN without END", pos));
            }
            const auto closer = word_at(skip_space(inner->pos + 3));
            if (text_scan::iequals(closer, "IF") || text_scan::iequals(closer, "LOOP")) {
                return std::unexpected(error(ParseErrorCode::kMalformedStatement,
                                             "unexpected END " + std::string(closer), inner->pos));
            }
            for (auto& step : inner->steps) {
                out.steps.push_back(std::move(step));
            }
            pos = skip_space(consume_end_tail(inner->pos + 3));
            continue;
        }

        std::expected<Parsed, ParseError> block = std::unexpected(ParseError{});
        bool is_block = true;
        if (text_scan::iequals(word, "IF")) {
            block = parse_if(pos, 2, depth);
        } else if (text_scan::iequals(word, "FOREACH")) {
            block = parse_loop("foreach", pos, pos + 7, depth);
        } else if (text_scan::iequals(word, "FOR")) {
            const auto loop_pos = text_scan::find_top_level_word(text_, "LOOP", pos + 3);
            const auto header   = text_.substr(pos + 3, loop_pos == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : loop_pos - pos - 3);
            const bool is_range = header.find("..") != std::string_view::npos;
            block = parse_loop(is_range ? "for_range" : "for_query", pos, pos + 3, depth);
        } else if (text_scan::iequals(word, "WHILE")) {
            block = parse_loop("while", pos, pos + 5, depth);
        } else if (text_scan::iequals(word, "LOOP")) {
            block = parse_loop("loop", pos, pos, depth);
        } else {
            is_block = false;
        }

        if (is_block) {
            if (!block) {
                return std::unexpected(std::move(block.error()));
            }
            out.steps.push_back(std::move(block->step));
            pos = skip_space(block->next);
            continue;
        }

        // 일반 문장
        const auto end  = text_scan::find_statement_end(text_, pos);
        const auto stop = (end == std::string_view::npos) ? text_.size() : end;
        if (in_body) {
            const auto raw = text_scan::trim(text_.substr(pos, stop - pos));
            if (!raw.empty()) {
                ConstructStep step;
                step.kind     = "statement";
                step.raw_text = std::string(raw);
                out.steps.push_back(std::move(step));
            }
        }
        pos = skip_space((end == std::string_view::npos) ? text_.size() : end + 1);
    }

    out.term = Terminator::kEof;
    out.pos  = text_.size();
    return out;
}

}  // namespace

std::expected<ConstructParse, ParseError>
ControlFlowParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    const std::string cleaned = text_scan::remove_comments(text);
    const std::string_view body_text = text_scan::dollar_quoted_body(cleaned).value_or(cleaned);

    BlockScanner scanner(body_text);
    ConstructParse out;

    // 최상위의 짝 없는 END / ELSE 는 건너뛰고 계속 읽는다
    std::size_t pos = 0;
    while (pos < body_text.size()) {
        auto body = scanner.parse_body(pos, 0, false);
        if (!body) {
            return std::unexpected(std::move(body.error()));
        }
        for (auto& step : body->steps) {
            out.steps.push_back(std::move(step));
        }
        if (body->term == Terminator::kEof) {
            break;
        }
        std::size_t word_end = body->pos;
        while (word_end < body_text.size() && text_scan::is_ident_char(body_text[word_end])) {
            ++word_end;
        }
        pos = scanner.consume_end_tail(word_end);
    }

    out.metadata["loop_count"]   = scanner.loop_count();
    out.metadata["branch_count"] = scanner.branch_count();
    out.metadata["max_depth"]    = scanner.max_depth();
    return out;
}
