// ---------------------------------------------------------------------------
// test_sql_lexer.cpp
//
// tokenize / is_keyword / is_punct 단위 테스트.
// ---------------------------------------------------------------------------

#include "parser/sql_lexer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

std::vector<Token> lex_ok(std::string_view sql) {
    auto tokens = tokenize(sql);
    EXPECT_TRUE(tokens.has_value()) << "tokenize failed for: " << sql;
    if (!tokens) {
        return {};
    }
    return std::move(*tokens);
}

}  // namespace

TEST(SqlLexer, WordsNumbersAndPunct) {
    const auto tokens = lex_ok("SELECT a, 42 FROM t");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, TokenType::kWord);
    EXPECT_EQ(tokens[1].text, "a");
    EXPECT_TRUE(is_punct(tokens[2], ','));
    EXPECT_EQ(tokens[3].type, TokenType::kNumber);
    EXPECT_EQ(tokens[3].text, "42");
    EXPECT_EQ(tokens[6].type, TokenType::kEnd);
}

TEST(SqlLexer, QuotedIdentifiersAreUnquoted) {
    const auto tokens = lex_ok("SELECT * FROM `my db`.\"tbl\"");
    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[3].type, TokenType::kQuotedIdentifier);
    EXPECT_EQ(tokens[3].text, "my db");
    EXPECT_TRUE(is_punct(tokens[4], '.'));
    EXPECT_EQ(tokens[5].type, TokenType::kQuotedIdentifier);
    EXPECT_EQ(tokens[5].text, "tbl");
}

TEST(SqlLexer, StringEscapes) {
    const auto tokens = lex_ok(R"(SELECT 'it''s', 'a\'b')");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, TokenType::kString);
    EXPECT_EQ(tokens[1].text, "it's");
    EXPECT_EQ(tokens[3].text, "a'b");
}

TEST(SqlLexer, CommentsSkipped) {
    const auto tokens = lex_ok("SELECT /* hidden FROM x */ 1 -- tail FROM y\n# hash FROM z\n");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_TRUE(is_keyword(tokens[0], "select"));
    EXPECT_EQ(tokens[1].text, "1");
}

TEST(SqlLexer, OffsetsPointIntoSource) {
    const auto tokens = lex_ok("SELECT  x");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].offset, 8u);
    EXPECT_EQ(tokens[2].offset, 9u);
}

TEST(SqlLexer, UnterminatedString) {
    const auto tokens = tokenize("SELECT 'abc");
    ASSERT_FALSE(tokens.has_value());
    EXPECT_EQ(tokens.error().code, ParseErrorCode::kUnterminatedToken);
}

TEST(SqlLexer, UnterminatedBlockComment) {
    const auto tokens = tokenize("SELECT 1 /* never closed");
    ASSERT_FALSE(tokens.has_value());
    EXPECT_EQ(tokens.error().code, ParseErrorCode::kUnterminatedToken);
}

TEST(SqlLexer, UnterminatedBacktick) {
    const auto tokens = tokenize("SELECT * FROM `t");
    ASSERT_FALSE(tokens.has_value());
    EXPECT_EQ(tokens.error().code, ParseErrorCode::kUnterminatedToken);
}

TEST(SqlLexer, KeywordMatchIsCaseInsensitiveAndWordOnly) {
    const auto tokens = lex_ok("sElEcT 'select' `select`");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(is_keyword(tokens[0], "SELECT"));
    EXPECT_FALSE(is_keyword(tokens[1], "SELECT")) << "문자열은 키워드가 아님";
    EXPECT_FALSE(is_keyword(tokens[2], "SELECT")) << "따옴표 식별자는 키워드가 아님";
}

TEST(SqlLexer, EmptyInputYieldsEndOnly) {
    const auto tokens = lex_ok("   ");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::kEnd);
}
