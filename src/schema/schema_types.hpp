#pragma once

// ---------------------------------------------------------------------------
// schema_types.hpp
//
// DDL 스크립트 역공학 단계에서 공유하는 데이터 타입 정의.
//
// [이름 규칙]
// - table_name / column name 은 원문 대소문자를 보존한다 (따옴표만 제거).
// - 비교가 필요한 곳에서는 호출자가 소문자 정규화를 수행한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// StatementKind
//   스크립트 분할 후 선행 키워드 기반 분류.
// ---------------------------------------------------------------------------
enum class StatementKind : std::uint8_t {
    kCreateTable     = 0,  // CREATE [UNLOGGED|TEMP] TABLE
    kCommentOnTable  = 1,  // COMMENT ON TABLE
    kCommentOnColumn = 2,  // COMMENT ON COLUMN
    kCreateFunction  = 3,  // CREATE [OR REPLACE] FUNCTION | PROCEDURE
    kOther           = 4,  // 역공학 대상 아님 (INDEX, GRANT 등)
};

[[nodiscard]] constexpr std::string_view statement_kind_name(StatementKind kind) noexcept {
    switch (kind) {
        case StatementKind::kCreateTable:     return "create_table";
        case StatementKind::kCommentOnTable:  return "comment_on_table";
        case StatementKind::kCommentOnColumn: return "comment_on_column";
        case StatementKind::kCreateFunction:  return "create_function";
        case StatementKind::kOther:           return "other";
    }
    return "other";
}

// ---------------------------------------------------------------------------
// SqlStatement
//   text 는 앞뒤 공백만 제거한 원문 (종결 ';' 제외).
//   index 는 스크립트 내 0 기반 순번 (진단 로그용).
// ---------------------------------------------------------------------------
struct SqlStatement {
    StatementKind kind{StatementKind::kOther};
    std::string   text{};
    std::size_t   index{0};
};

// ---------------------------------------------------------------------------
// ColumnInfo
//   type 은 대문자 + 공백 정규화 (예: "VARCHAR(255)", "TIMESTAMP WITH TIME ZONE").
// ---------------------------------------------------------------------------
struct ColumnInfo {
    std::string                name{};
    std::string                type{};
    bool                       nullable{true};
    std::optional<std::string> default_value{};
    bool                       is_primary_key{false};
    std::optional<std::string> references_table{};
    std::optional<std::string> comment{};
};

// ---------------------------------------------------------------------------
// ParsedTable
//   primary_key: 테이블 수준 PRIMARY KEY (...) 가 있으면 그것, 없으면
//   인라인 PRIMARY KEY 컬럼 목록.
// ---------------------------------------------------------------------------
struct ParsedTable {
    std::string                           schema{"public"};
    std::string                           table_name{};
    std::vector<ColumnInfo>               columns{};
    std::vector<std::string>              primary_key{};
    std::vector<std::vector<std::string>> unique_constraints{};
    std::vector<std::string>              check_constraints{};
    std::optional<std::string>            table_comment{};
    std::string                           source_sql{};
};

// ---------------------------------------------------------------------------
// CommentStatement
//   COMMENT ON TABLE s.t IS '...' / COMMENT ON COLUMN s.t.c IS '...'
//   IS NULL 이면 text 는 nullopt (기존 주석 제거 의미).
// ---------------------------------------------------------------------------
struct CommentStatement {
    bool                       on_column{false};
    std::optional<std::string> schema{};
    std::string                table{};
    std::string                column{};  // on_column 일 때만 유효
    std::optional<std::string> text{};
};

// ---------------------------------------------------------------------------
// StructuralSignals
//   StructureScorer 결과. baseline_confidence 는 [0,1].
// ---------------------------------------------------------------------------
struct StructuralSignals {
    bool   has_surrogate_key{false};    // pk_<entity>
    bool   has_external_id{false};      // id
    bool   has_lookup_key{false};       // identifier
    bool   has_created_at{false};
    bool   has_updated_at{false};
    bool   has_deleted_at{false};       // soft delete
    bool   has_tenant_column{false};
    bool   has_declared_pk{false};
    bool   has_table_comment{false};
    double baseline_confidence{0.0};

    [[nodiscard]] int trinity_count() const noexcept {
        return static_cast<int>(has_surrogate_key) + static_cast<int>(has_external_id)
             + static_cast<int>(has_lookup_key);
    }

    [[nodiscard]] int audit_count() const noexcept {
        return static_cast<int>(has_created_at) + static_cast<int>(has_updated_at)
             + static_cast<int>(has_deleted_at);
    }
};

enum class RoutineKind : std::uint8_t {
    kFunction  = 0,
    kProcedure = 1,
};

// ---------------------------------------------------------------------------
// ParsedFunction
//   used_fallback: 헤더를 해석하지 못해 느슨한 패턴으로 이름/본문만 추출함.
// ---------------------------------------------------------------------------
struct ParsedFunction {
    std::string schema{"public"};
    std::string function_name{};
    RoutineKind kind{RoutineKind::kFunction};
    std::string parameters{};
    std::string return_type{};
    std::string language{};
    std::string body{};
    bool        used_fallback{false};
};
