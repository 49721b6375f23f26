/*
 * Lexical sanitizer tests - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <argforge/normalize/sanitizer.hpp>

using namespace argforge;

TEST(SanitizerDashes, LookAlikesBecomeHyphens) {
    EXPECT_EQ(normalize_dashes("––batch"), "--batch");
    EXPECT_EQ(normalize_dashes("—u"), "-u");
    EXPECT_EQ(normalize_dashes("－−level=3"), "--level=3");
    EXPECT_EQ(normalize_dashes("\u4E00\u1680\uFE63\u2010x"), "----x");
}

TEST(SanitizerDashes, OnlyLeadingRun) {
    EXPECT_EQ(normalize_dashes("--data=a–b"), "--data=a–b");
    EXPECT_EQ(normalize_dashes("-–x"), "-–x");
    EXPECT_EQ(normalize_dashes("plain"), "plain");
}

TEST(SanitizerQuotes, StrippedFromBothEnds) {
    EXPECT_EQ(strip_quotes("“http://x/y?id=1”"), "http://x/y?id=1");
    EXPECT_EQ(strip_quotes("«--batch»"), "--batch");
    EXPECT_EQ(strip_quotes("＂a“b＂"), "a“b");
    EXPECT_EQ(strip_quotes("'kept'"), "'kept'");
}

TEST(SanitizerToken, DashesThenQuotes) {
    EXPECT_EQ(sanitize_token("––url=http://a”"), "--url=http://a");
    std::string untouched = "--threads=4";
    EXPECT_EQ(sanitize_token(untouched), untouched);
}

TEST(SanitizerIllegal, RichQuotesAroundValue) {
    auto err = check_illegal_characters("--data=“id=1”");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::Lexical);
    EXPECT_NE(err->message.find("quote characters"), std::string::npos);
    EXPECT_NE(err->message.find("--data="), std::string::npos);
}

TEST(SanitizerIllegal, FullWidthComma) {
    auto err = check_illegal_characters("--skip=id，name");
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("comma characters"), std::string::npos);
}

TEST(SanitizerIllegal, OrdinaryTokensPass) {
    EXPECT_FALSE(check_illegal_characters("--data=id=1").has_value());
    EXPECT_FALSE(check_illegal_characters("“").has_value());
    EXPECT_FALSE(check_illegal_characters("--data=“id=1").has_value());
    EXPECT_FALSE(check_illegal_characters("-u").has_value());
}
