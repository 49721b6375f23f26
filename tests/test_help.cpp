/*
 * Help formatter tests - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <argforge/options/help.hpp>
#include <sstream>

using namespace argforge;

static bool has_line_starting(const std::string& text, const std::string& prefix) {
    std::istringstream in(text); std::string line;
    while (std::getline(in, line)) if (line.rfind(prefix, 0) == 0) return true;
    return false;
}

TEST(HelpInvocation, MetavarFromDestination) {
    auto* url = default_catalogue().find("--url");
    ASSERT_NE(url, nullptr);
    EXPECT_EQ(HelpFormatter::format_invocation(*url), "-u URL, --url=URL");
    auto* batch = default_catalogue().find("--batch");
    ASSERT_NE(batch, nullptr);
    EXPECT_EQ(HelpFormatter::format_invocation(*batch), "--batch");
}

TEST(HelpInvocation, LongInvocationsAreCut) {
    auto* agent = default_catalogue().find("--user-agent");
    ASSERT_NE(agent, nullptr);
    std::string inv = HelpFormatter::format_invocation(*agent);
    EXPECT_EQ(inv, "-A AGENT, --user..");
    EXPECT_EQ(inv.size(), 18u);
}

TEST(HelpFull, ListsGroupsAndSkipsHidden) {
    HelpFormatter help(default_catalogue(), "argforge", default_usage("argforge"));
    std::string text = help.format_help(HelpMode::Advanced);
    EXPECT_EQ(text.rfind("Usage: argforge [options]\n\nOptions:\n", 0), 0u);
    EXPECT_TRUE(has_line_starting(text, "  -h, --help            Show basic help message and exit"));
    EXPECT_TRUE(has_line_starting(text, "  Target:"));
    EXPECT_TRUE(has_line_starting(text, "  Miscellaneous:"));
    EXPECT_TRUE(has_line_starting(text, "    -u URL, --url=URL   Target URL"));
    EXPECT_NE(text.find("--keep-alive"), std::string::npos);
    EXPECT_EQ(text.find("--dummy"), std::string::npos);
    EXPECT_EQ(text.find("--crack"), std::string::npos);
}

TEST(HelpBasic, OnlyBasicItems) {
    HelpFormatter help(default_catalogue(), "argforge", default_usage("argforge"));
    std::string text = help.format_help(HelpMode::Basic);
    EXPECT_NE(text.find("--url=URL"), std::string::npos);
    EXPECT_NE(text.find("--batch"), std::string::npos);
    EXPECT_NE(text.find("-hh"), std::string::npos);
    EXPECT_EQ(text.find("--keep-alive"), std::string::npos);
    EXPECT_EQ(text.find("--answers"), std::string::npos);
    // groups without any basic item disappear
    EXPECT_FALSE(has_line_starting(text, "  Optimization:"));
    EXPECT_FALSE(has_line_starting(text, "  Brute force:"));
    EXPECT_TRUE(has_line_starting(text, "  Detection:"));
}

TEST(HelpWrap, LongHelpWrapsAtHelpColumn) {
    HelpFormatter help(default_catalogue(), "argforge", "");
    std::string text = help.format_help(HelpMode::Advanced);
    std::istringstream in(text); std::string line;
    while (std::getline(in, line)) EXPECT_LE(line.size(), 80u) << line;
}

TEST(HelpError, UsageBannerThenError) {
    HelpFormatter help(default_catalogue(), "argforge", default_usage("argforge"));
    EXPECT_EQ(help.format_error("no such option: -Q"),
              "Usage: argforge [options]\n\nargforge: error: no such option: -Q\n");
    HelpFormatter shell(default_catalogue(), "argforge", "");
    EXPECT_EQ(shell.format_error("x"), "argforge: error: x\n");
    EXPECT_EQ(shell.format_help(HelpMode::Basic).rfind("Options:\n", 0), 0u);
}
