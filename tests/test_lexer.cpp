/*
 * Lexer tests - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <argforge/lex/lexer.hpp>
#include <argforge/lex/tokens.hpp>

using namespace argforge;

TEST(LexerBasic, QuotedUrlAndSwitch) {
    Lexer lx("-u \"http://x/y?id=1\" --batch");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[0].kind, TokenKind::Word);
    EXPECT_EQ(ts[0].lexeme, "-u");
    EXPECT_EQ(ts[1].lexeme, "http://x/y?id=1");
    EXPECT_EQ(ts[1].pos, 3u);
    EXPECT_EQ(ts[2].lexeme, "--batch");
    EXPECT_EQ(ts.back().kind, TokenKind::Eof);
}

TEST(LexerQuotes, SingleQuotesAreLiteral) {
    auto r = split_command_line("--data 'a=\"1\" \\n b'");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.words.size(), 2u);
    EXPECT_EQ(r.words[1], "a=\"1\" \\n b");
}

TEST(LexerQuotes, DoubleQuoteEscapes) {
    auto r = split_command_line(R"(--prefix "a\"b\\c\d")");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.words.size(), 2u);
    EXPECT_EQ(r.words[1], R"(a"b\c\d)");
}

TEST(LexerQuotes, AdjacentPartsJoin) {
    auto r = split_command_line(R"(--cookie=id='1 2'"3"\ 4)");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.words.size(), 1u);
    EXPECT_EQ(r.words[0], "--cookie=id=1 23 4");
}

TEST(LexerErrors, UnterminatedQuote) {
    Lexer lx("-u \"http://x");
    auto ts = lx.run();
    EXPECT_EQ(ts.back().kind, TokenKind::Invalid);
    EXPECT_EQ(lx.error(), "No closing quotation");
    auto r = split_command_line("-u 'abc");
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(r.words.empty());
}

TEST(LexerErrors, TrailingBackslash) {
    auto r = split_command_line("--batch \\");
    EXPECT_EQ(r.error, "No escaped character");
}

TEST(LexerBasic, BlankLineHasNoWords) {
    auto r = split_command_line("   \t ");
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.words.empty());
}
