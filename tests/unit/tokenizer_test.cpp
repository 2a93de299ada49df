#include <gtest/gtest.h>
#include <stylebind/css/parser/tokenizer.h>

using namespace stylebind::css;

// =============================================================================
// Tokenizer Tests
// =============================================================================

class CSSTokenizerTest : public ::testing::Test {};

// Test 1: Class selector is a '.' delim followed by an ident
TEST_F(CSSTokenizerTest, ClassSelector) {
    auto tokens = CSSTokenizer::tokenize_all(".button");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::Delim);
    EXPECT_EQ(tokens[0].value, ".");
    EXPECT_EQ(tokens[1].type, CSSToken::Ident);
    EXPECT_EQ(tokens[1].value, "button");
    EXPECT_EQ(tokens[1].offset, 1u);
    EXPECT_EQ(tokens[1].end_offset, 7u);
    EXPECT_EQ(tokens[2].type, CSSToken::EndOfFile);
}

// Test 2: Idents keep dashes and underscores
TEST_F(CSSTokenizerTest, IdentWithDashes) {
    auto tokens = CSSTokenizer::tokenize_all("--main-color_2");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::Ident);
    EXPECT_EQ(tokens[0].value, "--main-color_2");
}

// Test 3: Escapes in names are decoded
TEST_F(CSSTokenizerTest, EscapedIdent) {
    auto tokens = CSSTokenizer::tokenize_all("a\\:b \\31 23");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::Ident);
    EXPECT_EQ(tokens[0].value, "a:b");
    EXPECT_EQ(tokens[2].type, CSSToken::Ident);
    EXPECT_EQ(tokens[2].value, "123");
}

// Test 4: Strings in both quote styles
TEST_F(CSSTokenizerTest, Strings) {
    auto tokens = CSSTokenizer::tokenize_all("'./a.css' \"b\\\"c\"");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::String);
    EXPECT_EQ(tokens[0].value, "./a.css");
    EXPECT_EQ(tokens[2].type, CSSToken::String);
    EXPECT_EQ(tokens[2].value, "b\"c");
}

// Test 5: Newline inside a string makes a bad string
TEST_F(CSSTokenizerTest, BadString) {
    auto tokens = CSSTokenizer::tokenize_all("'abc\ndef'");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::BadString);
}

// Test 6: Comments are skipped, unterminated ones reported
TEST_F(CSSTokenizerTest, Comments) {
    auto tokens = CSSTokenizer::tokenize_all("/* x */a/* y */");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, CSSToken::Ident);
    EXPECT_EQ(tokens[0].offset, 7u);

    auto bad = CSSTokenizer::tokenize_all("a /* never closed");
    ASSERT_GE(bad.size(), 3u);
    EXPECT_EQ(bad[2].type, CSSToken::BadComment);
    EXPECT_EQ(bad[2].offset, 2u);
}

// Test 7: Numbers, dimensions and percentages
TEST_F(CSSTokenizerTest, Numerics) {
    auto tokens = CSSTokenizer::tokenize_all("10px 50% -1.5 .5em");
    ASSERT_GE(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[0].unit, "px");
    EXPECT_DOUBLE_EQ(tokens[0].numeric_value, 10.0);
    EXPECT_EQ(tokens[2].type, CSSToken::Percentage);
    EXPECT_EQ(tokens[4].type, CSSToken::Number);
    EXPECT_DOUBLE_EQ(tokens[4].numeric_value, -1.5);
    EXPECT_FALSE(tokens[4].is_integer);
    EXPECT_EQ(tokens[6].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[6].unit, "em");
}

// Test 8: Functions, at-keywords and hashes
TEST_F(CSSTokenizerTest, FunctionAtKeywordHash) {
    auto tokens = CSSTokenizer::tokenize_all("@import url(#id)");
    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].type, CSSToken::AtKeyword);
    EXPECT_EQ(tokens[0].value, "import");
    EXPECT_EQ(tokens[2].type, CSSToken::Function);
    EXPECT_EQ(tokens[2].value, "url");
    EXPECT_EQ(tokens[3].type, CSSToken::Hash);
    EXPECT_EQ(tokens[3].value, "id");
    EXPECT_EQ(tokens[4].type, CSSToken::RightParen);
}

// Test 9: Punctuation
TEST_F(CSSTokenizerTest, Punctuation) {
    auto tokens = CSSTokenizer::tokenize_all("{}:;,[]&");
    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_EQ(tokens[0].type, CSSToken::LeftBrace);
    EXPECT_EQ(tokens[1].type, CSSToken::RightBrace);
    EXPECT_EQ(tokens[2].type, CSSToken::Colon);
    EXPECT_EQ(tokens[3].type, CSSToken::Semicolon);
    EXPECT_EQ(tokens[4].type, CSSToken::Comma);
    EXPECT_EQ(tokens[5].type, CSSToken::LeftBracket);
    EXPECT_EQ(tokens[6].type, CSSToken::RightBracket);
    EXPECT_EQ(tokens[7].type, CSSToken::Delim);
    EXPECT_EQ(tokens[7].value, "&");
}

// Test 10: CDO and CDC
TEST_F(CSSTokenizerTest, CdoCdc) {
    auto tokens = CSSTokenizer::tokenize_all("<!-- -->");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::CDO);
    EXPECT_EQ(tokens[2].type, CSSToken::CDC);
}

// =============================================================================
// LineIndex Tests
// =============================================================================

// Test 11: Offsets map to 1-based line and column
TEST(LineIndexTest, PositionOf) {
    LineIndex index("ab\ncd\n\nx");
    EXPECT_EQ(index.position_of(0), (TextPosition{1, 1}));
    EXPECT_EQ(index.position_of(1), (TextPosition{1, 2}));
    EXPECT_EQ(index.position_of(3), (TextPosition{2, 1}));
    EXPECT_EQ(index.position_of(6), (TextPosition{3, 1}));
    EXPECT_EQ(index.position_of(7), (TextPosition{4, 1}));
    EXPECT_EQ(index.position_of(8), (TextPosition{4, 2}));
}
