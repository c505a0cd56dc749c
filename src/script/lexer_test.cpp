#include "script/lexer.hpp"

#include <algorithm>

#include <gtest/gtest.h>

namespace warden::script {
namespace {

std::vector<TokenKind> Kinds(const std::vector<Token>& tokens) {
    std::vector<TokenKind> kinds;
    for (const auto& token : tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

TEST(LexerTest, EmitsIndentAndDedentAroundBlocks) {
    const auto tokens = Tokenize("if x:\n    y = 1\nz = 2\n");
    const std::vector<TokenKind> expected = {
        TokenKind::kKeyword, TokenKind::kName, TokenKind::kOp, TokenKind::kNewline,
        TokenKind::kIndent, TokenKind::kName, TokenKind::kOp, TokenKind::kInt, TokenKind::kNewline,
        TokenKind::kDedent, TokenKind::kName, TokenKind::kOp, TokenKind::kInt, TokenKind::kNewline,
        TokenKind::kEnd};
    EXPECT_EQ(Kinds(tokens), expected);
}

TEST(LexerTest, ReadsNumbersWithUnderscoresAndPrefixes) {
    const auto tokens = Tokenize("10_000 0x1f 2.5\n");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::kInt);
    EXPECT_EQ(tokens[0].int_value, 10000);
    EXPECT_EQ(tokens[1].int_value, 31);
    EXPECT_EQ(tokens[2].kind, TokenKind::kFloat);
    EXPECT_DOUBLE_EQ(tokens[2].float_value, 2.5);
}

TEST(LexerTest, DecodesStringEscapes) {
    const auto tokens = Tokenize("'a\\nb' \"q\\\"\"\n");
    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::kString);
    EXPECT_EQ(tokens[0].text, "a\nb");
    EXPECT_EQ(tokens[1].text, "q\"");
}

TEST(LexerTest, TracksLineAndColumn) {
    const auto tokens = Tokenize("a = 1\nbb = 2\n");
    const auto it = std::find_if(tokens.begin(), tokens.end(), [](const Token& t) { return t.text == "bb"; });
    ASSERT_NE(it, tokens.end());
    EXPECT_EQ(it->pos.line, 2);
    EXPECT_EQ(it->pos.column, 1);
}

TEST(LexerTest, RejectsFStringsAndBytes) {
    EXPECT_THROW(Tokenize("x = f'{y}'\n"), SyntaxError);
    EXPECT_THROW(Tokenize("x = b'raw'\n"), SyntaxError);
}

TEST(LexerTest, RejectsUnterminatedString) {
    EXPECT_THROW(Tokenize("x = 'open\n"), SyntaxError);
}

TEST(LexerTest, RejectsDoubledUnderscoreInNumber) {
    EXPECT_THROW(Tokenize("x = 1__0\n"), SyntaxError);
}

TEST(LexerTest, KnowsKeywords) {
    EXPECT_TRUE(IsKeyword("def"));
    EXPECT_TRUE(IsKeyword("lambda"));
    EXPECT_FALSE(IsKeyword("result"));
}

TEST(LexerTest, ClassifiesKeywordTokens) {
    const auto tokens = Tokenize("while True:\n    import math\n");
    ASSERT_GE(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].kind, TokenKind::kKeyword);
    EXPECT_EQ(tokens[0].text, "while");
    EXPECT_EQ(tokens[1].kind, TokenKind::kKeyword);
    EXPECT_EQ(tokens[1].text, "True");
    EXPECT_EQ(tokens[5].kind, TokenKind::kKeyword);
    EXPECT_EQ(tokens[5].text, "import");
    EXPECT_EQ(tokens[6].kind, TokenKind::kName);
    EXPECT_EQ(tokens[6].text, "math");
}

}  // namespace
}  // namespace warden::script
