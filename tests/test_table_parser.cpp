// ---------------------------------------------------------------------------
// test_table_parser.cpp
//
// TableParser / 식별자 헬퍼 단위 테스트.
//
// [테스트 범위]
// - 컬럼 타입 정규화, NOT NULL, DEFAULT, 인라인 PRIMARY KEY, REFERENCES
// - 테이블 제약 (PRIMARY KEY, UNIQUE, CHECK, FOREIGN KEY)
// - 따옴표 식별자, schema 한정 이름
// - COMMENT ON 해석과 attach_comments
// - 오류 코드 (지원하지 않는 문장, 괄호 불균형, 컬럼 없음)
// ---------------------------------------------------------------------------

#include "schema/identifier.hpp"
#include "schema/table_parser.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

const std::string kContractDdl =
    "CREATE TABLE IF NOT EXISTS app.tb_contract (\n"
    "    pk_contract     bigserial PRIMARY KEY,\n"
    "    id              uuid NOT NULL DEFAULT gen_random_uuid(),\n"
    "    identifier      varchar(64) NOT NULL UNIQUE,\n"
    "    \"Title\"         text,\n"
    "    fk_customer_org bigint REFERENCES app.tb_customer_org (pk_customer_org),\n"
    "    amount          numeric(12, 2) CHECK (amount >= 0),\n"
    "    created_at      timestamp   with time zone DEFAULT now() NOT NULL,\n"
    "    CONSTRAINT uq_contract_title UNIQUE (\"Title\", identifier),\n"
    "    CHECK (amount < 1000000)\n"
    ")";

const ColumnInfo* column(const ParsedTable& table, const std::string& name) {
    for (const auto& c : table.columns) {
        if (c.name == name) {
            return &c;
        }
    }
    return nullptr;
}

}  // namespace

TEST(TableParser, Parse_ColumnsAndConstraints) {
    TableParser parser;
    const auto result = parser.parse(kContractDdl);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& table = *result;
    EXPECT_EQ(table.schema, "app");
    EXPECT_EQ(table.table_name, "tb_contract");
    ASSERT_EQ(table.columns.size(), 7u);

    const auto* pk = column(table, "pk_contract");
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->type, "BIGSERIAL");
    EXPECT_TRUE(pk->is_primary_key);
    EXPECT_FALSE(pk->nullable);

    const auto* id = column(table, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->type, "UUID");
    EXPECT_FALSE(id->nullable);
    ASSERT_TRUE(id->default_value.has_value());
    EXPECT_EQ(*id->default_value, "gen_random_uuid()");

    const auto* title = column(table, "Title");
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->type, "TEXT");
    EXPECT_TRUE(title->nullable);

    const auto* fk = column(table, "fk_customer_org");
    ASSERT_NE(fk, nullptr);
    ASSERT_TRUE(fk->references_table.has_value());
    EXPECT_EQ(*fk->references_table, "tb_customer_org");

    const auto* amount = column(table, "amount");
    ASSERT_NE(amount, nullptr);
    EXPECT_EQ(amount->type, "NUMERIC(12, 2)");

    const auto* created = column(table, "created_at");
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->type, "TIMESTAMP WITH TIME ZONE");
    EXPECT_EQ(created->default_value.value_or(""), "now()");
    EXPECT_FALSE(created->nullable);

    EXPECT_EQ(table.primary_key, std::vector<std::string>{"pk_contract"});
    ASSERT_EQ(table.unique_constraints.size(), 1u);
    EXPECT_EQ(table.unique_constraints[0], (std::vector<std::string>{"Title", "identifier"}));
    ASSERT_EQ(table.check_constraints.size(), 1u);
    EXPECT_EQ(table.check_constraints[0], "amount < 1000000");
}

TEST(TableParser, Parse_TableLevelPrimaryKeyAndForeignKey) {
    TableParser parser;
    const auto result = parser.parse(
        "create table tl_contract (\n"
        "  fk_contract bigint,\n"
        "  locale varchar(8),\n"
        "  title text,\n"
        "  primary key (fk_contract, locale),\n"
        "  foreign key (fk_contract) references tb_contract\n"
        ")");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->schema, "public");
    EXPECT_EQ(result->primary_key, (std::vector<std::string>{"fk_contract", "locale"}));
    ASSERT_EQ(result->columns.size(), 3u);
    EXPECT_TRUE(result->columns[0].is_primary_key);
    EXPECT_FALSE(result->columns[0].nullable);
    EXPECT_TRUE(result->columns[1].is_primary_key);
    EXPECT_FALSE(result->columns[2].is_primary_key);
    EXPECT_EQ(result->columns[0].references_table.value_or(""), "tb_contract");
}

TEST(TableParser, Parse_NotCreateTable_Unsupported) {
    TableParser parser;
    const auto result = parser.parse("CREATE INDEX ix ON t (a)");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kUnsupportedStatement);
}

TEST(TableParser, Parse_UnbalancedColumnList) {
    TableParser parser;
    const auto result = parser.parse("CREATE TABLE t (id int, name varchar(10)");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kUnbalancedParens);
}

TEST(TableParser, Parse_NoColumnsOrNoList_Malformed) {
    TableParser parser;

    const auto empty_list = parser.parse("CREATE TABLE t ()");
    ASSERT_FALSE(empty_list.has_value());
    EXPECT_EQ(empty_list.error().code, ParseErrorCode::kMalformedStatement);

    const auto as_select = parser.parse("CREATE TABLE t AS SELECT 1");
    ASSERT_FALSE(as_select.has_value());
    EXPECT_EQ(as_select.error().code, ParseErrorCode::kMalformedStatement);
}

// ---------------------------------------------------------------------------
// COMMENT ON
// ---------------------------------------------------------------------------

TEST(TableParser, ParseComment_ColumnWithSchema) {
    TableParser parser;
    const auto result = parser.parse_comment(
        "COMMENT ON COLUMN app.tb_contract.amount IS 'Contract amount (it''s net)'");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->on_column);
    EXPECT_EQ(result->schema.value_or(""), "app");
    EXPECT_EQ(result->table, "tb_contract");
    EXPECT_EQ(result->column, "amount");
    EXPECT_EQ(result->text.value_or(""), "Contract amount (it's net)");
}

TEST(TableParser, ParseComment_IsNull) {
    TableParser parser;
    const auto result = parser.parse_comment("COMMENT ON TABLE tb_contract IS NULL");
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->on_column);
    EXPECT_FALSE(result->schema.has_value());
    EXPECT_FALSE(result->text.has_value());
}

TEST(TableParser, ParseComment_MissingIs) {
    TableParser parser;
    const auto result = parser.parse_comment("COMMENT ON TABLE tb_contract 'x'");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kMissingKeyword);
}

TEST(TableParser, AttachComments_CaseInsensitiveAndUnmatched) {
    TableParser parser;
    auto table = parser.parse(kContractDdl);
    ASSERT_TRUE(table.has_value());
    std::vector<ParsedTable> tables{*table};

    std::vector<CommentStatement> comments;
    comments.push_back(CommentStatement{false, std::nullopt, "TB_CONTRACT", "", "Contracts"});
    comments.push_back(CommentStatement{true, std::string("app"), "tb_contract", "AMOUNT", "Net amount"});
    comments.push_back(CommentStatement{false, std::nullopt, "tb_missing", "", "nowhere"});
    comments.push_back(CommentStatement{true, std::nullopt, "tb_contract", "no_such_col", "x"});
    comments.push_back(CommentStatement{false, std::string("other"), "tb_contract", "", "wrong schema"});

    const auto unmatched = TableParser::attach_comments(tables, comments);
    EXPECT_EQ(unmatched, 3u);
    EXPECT_EQ(tables[0].table_comment.value_or(""), "Contracts");
    EXPECT_EQ(column(tables[0], "amount")->comment.value_or(""), "Net amount");
}

// ---------------------------------------------------------------------------
// 식별자 헬퍼
// ---------------------------------------------------------------------------

TEST(Identifier, ReadQualifiedName_QuotedParts) {
    const auto name = read_qualified_name(R"(  "My Schema"."Odd""Name" (x))", 0);
    ASSERT_TRUE(name.has_value());
    ASSERT_EQ(name->parts.size(), 2u);
    EXPECT_EQ(name->parts[0], "My Schema");
    EXPECT_EQ(name->name(), "Odd\"Name");
    EXPECT_EQ(name->qualifier().value_or(""), "My Schema");
}

TEST(Identifier, NormalizeEntityName_PrefixesInDeclaredOrder) {
    const std::vector<std::string> prefixes{"tb_", "tv_"};
    EXPECT_EQ(normalize_entity_name("TB_Contract", prefixes), "contract");
    EXPECT_EQ(normalize_entity_name("tb_tv_zone", prefixes), "zone");
    // tb_ 검사가 먼저 끝나므로 tv_ 뒤의 tb_ 는 남는다
    EXPECT_EQ(normalize_entity_name("tv_tb_view", prefixes), "tb_view");
    // 같은 접두사는 한 번만
    EXPECT_EQ(normalize_entity_name("tb_tb_log", prefixes), "tb_log");
    EXPECT_EQ(normalize_entity_name("contact", prefixes), "contact");
}
