// ---------------------------------------------------------------------------
// test_cursor_operations_parser.cpp
//
// CursorOperationsParser 단위 테스트.
//
// [테스트 범위]
// - 커서 선언 (NO SCROLL, 인자 목록 포함) → cursor_declare
// - OPEN / FETCH ... INTO / MOVE / CLOSE → cursor_* step
// - 선언 step 이 연산 step 보다 앞선다
// - cursor_count / operation_count / has_fetch 메타데이터
// ---------------------------------------------------------------------------

#include "construct/cursor_operations_parser.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

TEST(CursorOperationsParser, FullCursorLifecycle) {
    CursorOperationsParser parser;
    const std::string body =
        "DECLARE\n"
        "  cur_emp NO SCROLL CURSOR FOR SELECT id FROM emp WHERE active;\n"
        "  rec record;\n"
        "BEGIN\n"
        "  OPEN cur_emp;\n"
        "  LOOP\n"
        "    FETCH NEXT FROM cur_emp INTO rec;\n"
        "    EXIT WHEN NOT FOUND;\n"
        "  END LOOP;\n"
        "  MOVE FIRST IN cur_emp;\n"
        "  CLOSE cur_emp;\n"
        "END;";

    const auto result = parser.parse(body);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->steps.size(), 5u);

    EXPECT_EQ(result->steps[0].kind, "cursor_declare");
    EXPECT_EQ(result->steps[0].label, "cur_emp");
    EXPECT_EQ(result->steps[0].raw_text, "SELECT id FROM emp WHERE active");

    EXPECT_EQ(result->steps[1].kind, "cursor_open");
    EXPECT_EQ(result->steps[1].label, "cur_emp");
    EXPECT_EQ(result->steps[2].kind, "cursor_fetch");
    EXPECT_EQ(result->steps[2].label, "cur_emp");
    EXPECT_EQ(result->steps[2].raw_text, "FETCH NEXT FROM cur_emp INTO rec");
    EXPECT_EQ(result->steps[3].kind, "cursor_move");
    EXPECT_EQ(result->steps[4].kind, "cursor_close");

    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "cursor_count", -1), 1);
    EXPECT_EQ(metadata_value<std::int64_t>(result->metadata, "operation_count", -1), 4);
    EXPECT_TRUE(metadata_value<bool>(result->metadata, "has_fetch", false));
}

TEST(CursorOperationsParser, CursorWithArguments) {
    CursorOperationsParser parser;
    const auto result = parser.parse(
        "DECLARE c_by_dept CURSOR (p_dept integer) FOR SELECT * FROM emp WHERE dept = p_dept;");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->steps.size(), 1u);
    EXPECT_EQ(result->steps[0].label, "c_by_dept");
    EXPECT_FALSE(metadata_value<bool>(result->metadata, "has_fetch", true));
}

TEST(CursorOperationsParser, FetchWithoutInto_NotCounted) {
    CursorOperationsParser parser;
    const auto result = parser.parse("BEGIN FETCH c; CLOSE c; END;");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->steps.size(), 1u);
    EXPECT_EQ(result->steps[0].kind, "cursor_close");
    EXPECT_FALSE(metadata_value<bool>(result->metadata, "has_fetch", true));
}

TEST(CursorOperationsParser, EmptyInput_ReturnsError) {
    CursorOperationsParser parser;
    const auto result = parser.parse("   ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kEmptyInput);
}
