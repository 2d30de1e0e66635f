#include <gtest/gtest.h>
#include "query/lexer.h"

using namespace quanta;
using namespace quanta::query;

namespace {

std::vector<TokenType> typesOf(const std::string& text) {
    Lexer lexer(text);
    auto result = lexer.tokenize();
    EXPECT_TRUE(result.status.ok) << result.status.toString();
    std::vector<TokenType> types;
    for (const auto& tok : result.tokens) types.push_back(tok.type);
    return types;
}

} // namespace

TEST(LexerTest, KeywordsAreCaseInsensitive) {
    auto types = typesOf("find Tasks.title MATCH tasks.status = 'pending'");
    std::vector<TokenType> expected = {
        TokenType::FIND, TokenType::IDENTIFIER, TokenType::DOT, TokenType::IDENTIFIER,
        TokenType::MATCH, TokenType::IDENTIFIER, TokenType::DOT, TokenType::IDENTIFIER,
        TokenType::EQ, TokenType::STRING, TokenType::END_OF_FILE};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, KeywordKeepsOriginalSpelling) {
    Lexer lexer("NaViGaTe");
    auto result = lexer.tokenize();
    ASSERT_TRUE(result.status.ok);
    EXPECT_EQ(result.tokens[0].type, TokenType::NAVIGATE);
    EXPECT_EQ(result.tokens[0].lexeme, "NaViGaTe");
}

TEST(LexerTest, MultiCharacterOperators) {
    auto types = typesOf("== != <> <= >= -> && || < > =");
    std::vector<TokenType> expected = {
        TokenType::EQ, TokenType::NEQ, TokenType::NEQ, TokenType::LTE, TokenType::GTE,
        TokenType::ARROW, TokenType::AND, TokenType::OR, TokenType::LT, TokenType::GT,
        TokenType::EQ, TokenType::END_OF_FILE};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, NumbersAndDates) {
    Lexer lexer("42 3.5 1e3 2025-06-01 2025-06-01T12:30:00.250+02:00 2025-06-01t08:00:00z");
    auto result = lexer.tokenize();
    ASSERT_TRUE(result.status.ok);
    ASSERT_EQ(result.tokens.size(), 7u);
    EXPECT_EQ(result.tokens[0].type, TokenType::INTEGER);
    EXPECT_EQ(result.tokens[1].type, TokenType::FLOAT);
    EXPECT_EQ(result.tokens[2].type, TokenType::FLOAT);
    EXPECT_EQ(result.tokens[3].type, TokenType::DATETIME);
    EXPECT_EQ(result.tokens[3].lexeme, "2025-06-01");
    EXPECT_EQ(result.tokens[4].type, TokenType::DATETIME);
    EXPECT_EQ(result.tokens[4].lexeme, "2025-06-01T12:30:00.250+02:00");
    EXPECT_EQ(result.tokens[5].lexeme, "2025-06-01T08:00:00Z");
}

TEST(LexerTest, StringEscapes) {
    Lexer lexer(R"("say \"hi\"\n" 'it\'s')");
    auto result = lexer.tokenize();
    ASSERT_TRUE(result.status.ok);
    EXPECT_EQ(result.tokens[0].lexeme, "say \"hi\"\n");
    EXPECT_EQ(result.tokens[1].lexeme, "it's");
}

TEST(LexerTest, CommentsAreSkipped) {
    auto types = typesOf("FIND -- trailing comment\n /* block\n comment */ users.name");
    std::vector<TokenType> expected = {
        TokenType::FIND, TokenType::IDENTIFIER, TokenType::DOT, TokenType::IDENTIFIER, TokenType::END_OF_FILE};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, PositionsLinesAndColumns) {
    Lexer lexer("FIND\n  users.name");
    auto result = lexer.tokenize();
    ASSERT_TRUE(result.status.ok);
    const Token& users = result.tokens[1];
    EXPECT_EQ(users.position, 7u);
    EXPECT_EQ(users.line, 2u);
    EXPECT_EQ(users.column, 3u);
}

TEST(LexerTest, UnexpectedCharacterReportsPosition) {
    Lexer lexer("FIND users.name # oops");
    auto result = lexer.tokenize();
    EXPECT_FALSE(result.status.ok);
    EXPECT_EQ(result.status.kind, ErrorKind::Lexical);
    EXPECT_EQ(result.status.position, 16u);
    EXPECT_NE(result.status.message.find("'#'"), std::string::npos);
    EXPECT_TRUE(result.tokens.empty());
}

TEST(LexerTest, UnterminatedStringReportsStart) {
    Lexer lexer("MATCH x = \"open");
    auto result = lexer.tokenize();
    EXPECT_FALSE(result.status.ok);
    EXPECT_EQ(result.status.kind, ErrorKind::Lexical);
    EXPECT_EQ(result.status.position, 10u);
    EXPECT_NE(result.status.message.find("unterminated"), std::string::npos);
}

TEST(LexerTest, UnterminatedBlockComment) {
    Lexer lexer("FIND /* never closed");
    auto result = lexer.tokenize();
    EXPECT_FALSE(result.status.ok);
    EXPECT_EQ(result.status.position, 5u);
}

TEST(LexerTest, IdentifierGluedToNumberIsRejected) {
    Lexer lexer("LIMIT 10abc");
    auto result = lexer.tokenize();
    EXPECT_FALSE(result.status.ok);
    EXPECT_EQ(result.status.position, 8u);
}

TEST(LexerTest, TokenizeIsRepeatable) {
    Lexer lexer("FIND a.b");
    auto first = lexer.tokenize();
    auto second = lexer.tokenize();
    ASSERT_EQ(first.tokens.size(), second.tokens.size());
    for (size_t i = 0; i < first.tokens.size(); ++i) {
        EXPECT_EQ(first.tokens[i].type, second.tokens[i].type);
        EXPECT_EQ(first.tokens[i].position, second.tokens[i].position);
    }
}
