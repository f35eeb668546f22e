// ---------------------------------------------------------------------------
// exception_handler_parser.cpp
// ---------------------------------------------------------------------------

#include "construct/exception_handler_parser.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "construct/text_scan.hpp"

std::expected<std::vector<ExceptionHandler>, ParseError>
ExceptionHandlerParser::extract_handlers(std::string_view exception_block) const {
    std::vector<ExceptionHandler> handlers;

    // WHEN 위치 목록으로 세그먼트 분리. 첫 세그먼트(WHEN 이전)는 버린다.
    std::vector<std::size_t> when_positions;
    for (auto pos = text_scan::find_word(exception_block, "WHEN");
         pos != std::string_view::npos;
         pos = text_scan::find_word(exception_block, "WHEN", pos + 4)) {
        when_positions.push_back(pos);
    }

    for (std::size_t i = 0; i < when_positions.size(); ++i) {
        const std::size_t seg_begin = when_positions[i] + 4;
        const std::size_t seg_end   = (i + 1 < when_positions.size())
            ? when_positions[i + 1]
            : exception_block.size();
        const auto segment = text_scan::trim(exception_block.substr(seg_begin, seg_end - seg_begin));
        if (segment.empty()) {
            continue;
        }

        const auto then_pos = text_scan::find_word(segment, "THEN");
        if (then_pos == std::string_view::npos) {
            return std::unexpected(make_parse_error(
                ParseErrorCode::kMissingKeyword,
                "exception handler without THEN",
                segment));
        }

        handlers.push_back(ExceptionHandler{
            std::string(text_scan::trim(segment.substr(0, then_pos))),
            std::string(text_scan::trim(segment.substr(then_pos + 4))),
        });
    }
    return handlers;
}

std::expected<ConstructParse, ParseError>
ExceptionHandlerParser::parse(std::string_view text) const {
    if (text_scan::trim(text).empty()) {
        return std::unexpected(make_parse_error(
            ParseErrorCode::kEmptyInput, "empty input", text));
    }

    ConstructParse out;
    out.metadata["handler_count"] =
        static_cast<std::int64_t>(text_scan::count_words(text, "WHEN"));

    const auto exc_pos = text_scan::find_word(text, "EXCEPTION");
    if (exc_pos == std::string_view::npos) {
        return out;
    }

    const auto remainder = text.substr(exc_pos + 9);
    auto handlers = extract_handlers(remainder);
    if (!handlers) {
        return std::unexpected(std::move(handlers.error()));
    }

    ConstructStep step;
    step.kind     = "try-except";
    step.raw_text = "EXCEPTION" + std::string(remainder);
    out.steps.push_back(std::move(step));
    return out;
}
