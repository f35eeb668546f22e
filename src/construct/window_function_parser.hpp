#pragma once

// ---------------------------------------------------------------------------
// window_function_parser.hpp
//
// fn(args) OVER (window_spec) / fn(args) OVER window_name 윈도 함수 호출을
// 추출한다.
//
// [설계 한계]
// 1. OVER 바로 앞의 호출만 인식한다. 호출과 OVER 사이에는 FILTER 절만
//    허용된다.
// 2. has_partition_by / has_order_by 는 OVER (...) 안에서만 판정한다.
//    WINDOW w AS (...) 로 분리된 정의는 보지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"
#include "construct/construct_types.hpp"

class WindowFunctionParser {
public:
    WindowFunctionParser()  = default;
    ~WindowFunctionParser() = default;

    WindowFunctionParser(const WindowFunctionParser&)            = default;
    WindowFunctionParser& operator=(const WindowFunctionParser&) = default;
    WindowFunctionParser(WindowFunctionParser&&)                 = default;
    WindowFunctionParser& operator=(WindowFunctionParser&&)      = default;

    // -----------------------------------------------------------------------
    // parse
    //   steps: kind "window_function", label = 함수 이름,
    //          raw_text = 호출부터 OVER 절 끝까지
    //   OVER ( 의 괄호 짝이 맞지 않으면 kUnbalancedParens.
    //   metadata: function_count, has_partition_by, has_order_by,
    //             functions (소문자, 쉼표 연결)
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<ConstructParse, ParseError>
    parse(std::string_view text) const;
};
