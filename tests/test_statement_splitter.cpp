// ---------------------------------------------------------------------------
// test_statement_splitter.cpp
//
// split_statements 단위 테스트.
//
// [테스트 범위]
// - 세미콜론 분리, 공백 정리, 빈 구문 제거
// - 따옴표/백틱/주석 내부의 세미콜론 무시
// - 백슬래시 이스케이프된 따옴표
// - 닫히지 않은 따옴표 (나머지 전체를 한 구문으로)
// ---------------------------------------------------------------------------

#include "parser/statement_splitter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using Statements = std::vector<std::string>;

// ---------------------------------------------------------------------------
// 기본 분리
// ---------------------------------------------------------------------------

TEST(StatementSplitter, SingleStatementWithoutTerminator) {
    EXPECT_EQ(split_statements("SELECT 1"), Statements{"SELECT 1"});
}

TEST(StatementSplitter, TrailingSemicolonRemoved) {
    EXPECT_EQ(split_statements("SELECT 1;"), Statements{"SELECT 1"});
}

TEST(StatementSplitter, MultipleStatementsTrimmed) {
    const auto result = split_statements("  SELECT * FROM t ;\n\tDROP TABLE x ;  ");
    EXPECT_EQ(result, (Statements{"SELECT * FROM t", "DROP TABLE x"}));
}

TEST(StatementSplitter, EmptyFragmentsDropped) {
    EXPECT_EQ(split_statements(";;SELECT 1;; ;\n;SELECT 2;"),
              (Statements{"SELECT 1", "SELECT 2"}));
}

TEST(StatementSplitter, EmptyAndWhitespaceInput) {
    EXPECT_TRUE(split_statements("").empty());
    EXPECT_TRUE(split_statements("   \n\t ").empty());
    EXPECT_TRUE(split_statements(";;;").empty());
}

// ---------------------------------------------------------------------------
// 어휘 상태
// ---------------------------------------------------------------------------

TEST(StatementSplitter, SemicolonInsideSingleQuotes) {
    const auto result = split_statements("SELECT 'a;b' FROM t; SELECT 2");
    EXPECT_EQ(result, (Statements{"SELECT 'a;b' FROM t", "SELECT 2"}));
}

TEST(StatementSplitter, SemicolonInsideDoubleQuotes) {
    const auto result = split_statements("SELECT \"x;y\" FROM t");
    EXPECT_EQ(result, Statements{"SELECT \"x;y\" FROM t"});
}

TEST(StatementSplitter, SemicolonInsideBacktick) {
    const auto result = split_statements("SELECT * FROM `we;ird`; SELECT 1");
    EXPECT_EQ(result, (Statements{"SELECT * FROM `we;ird`", "SELECT 1"}));
}

TEST(StatementSplitter, SemicolonInsideLineComment) {
    const auto result = split_statements("SELECT 1 -- note; still comment\nFROM t; SELECT 2");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "SELECT 1 -- note; still comment\nFROM t");
    EXPECT_EQ(result[1], "SELECT 2");
}

TEST(StatementSplitter, SemicolonInsideBlockComment) {
    const auto result = split_statements("SELECT /* a; b; c */ 1; SELECT 2");
    EXPECT_EQ(result, (Statements{"SELECT /* a; b; c */ 1", "SELECT 2"}));
}

TEST(StatementSplitter, EscapedQuoteDoesNotClose) {
    const auto result = split_statements(R"(SELECT 'it\'s; fine' FROM t; SELECT 2)");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], R"(SELECT 'it\'s; fine' FROM t)");
}

TEST(StatementSplitter, OtherQuoteKindInsideStringIgnored) {
    const auto result = split_statements("SELECT 'a \" ; ` b'; SELECT 2");
    EXPECT_EQ(result, (Statements{"SELECT 'a \" ; ` b'", "SELECT 2"}));
}

TEST(StatementSplitter, UnterminatedQuoteKeepsRemainder) {
    const auto result = split_statements("SELECT 1; SELECT 'oops; DROP TABLE t");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[1], "SELECT 'oops; DROP TABLE t")
        << "닫히지 않은 따옴표 이후는 하나의 구문이어야 함";
}

TEST(StatementSplitter, StackedQueryAttackSplit) {
    const auto result = split_statements("SELECT * FROM safe_table; DROP TABLE sensitive_data");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[1], "DROP TABLE sensitive_data");
}
