/*
 * Mnemonic expander tests - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <argforge/normalize/mnemonics.hpp>
#include <argforge/util/console.hpp>
#include <sstream>

using namespace argforge;

class MnemonicTest : public ::testing::Test {
protected:
    void SetUp() override { set_console_stream(&out); set_console_options(ConsoleOptions{false, 1}); }
    void TearDown() override { set_console_stream(nullptr); }
    std::ostringstream out;
    MnemonicExpander expander{default_catalogue()};
};

TEST_F(MnemonicTest, ExpandsSwitchesAndValues) {
    OptionValues values;
    auto err = expander.expand("flu,bat,ban,tec=EU", values);
    ASSERT_FALSE(err.has_value()) << err->message;
    EXPECT_TRUE(values.flag("flushSession"));
    EXPECT_TRUE(values.flag("batch"));
    EXPECT_TRUE(values.flag("getBanner"));
    EXPECT_EQ(values.str("technique"), "EU");
}

TEST_F(MnemonicTest, ConvertsToOptionType) {
    OptionValues values;
    ASSERT_FALSE(expander.expand("lev=3,risk=2,thr=4", values).has_value());
    EXPECT_EQ(values.integer("level"), 3);
    EXPECT_EQ(values.integer("risk"), 2);
    EXPECT_EQ(values.integer("threads"), 4);
}

TEST_F(MnemonicTest, ExactNameWins) {
    auto res = expander.resolve("url");
    ASSERT_TRUE(std::holds_alternative<const OptionSpec*>(res));
    EXPECT_EQ(std::get<const OptionSpec*>(res)->dest, "url");
    auto dump = expander.resolve("dump");
    ASSERT_TRUE(std::holds_alternative<const OptionSpec*>(dump));
    EXPECT_EQ(std::get<const OptionSpec*>(dump)->dest, "dumpTable");
}

TEST_F(MnemonicTest, AmbiguityResolvesToShortest) {
    auto res = expander.resolve("ignore");
    ASSERT_TRUE(std::holds_alternative<const OptionSpec*>(res));
    EXPECT_EQ(std::get<const OptionSpec*>(res)->dest, "ignoreCode");
    EXPECT_NE(out.str().find("detected ambiguity (mnemonic 'ignore'"), std::string::npos);
    EXPECT_NE(out.str().find("Resolved to shortest of those ('ignorecode')"), std::string::npos);
}

TEST_F(MnemonicTest, HyphensInCodesAreIgnored) {
    OptionValues values;
    ASSERT_FALSE(expander.expand("--random-agent", values).has_value());
    EXPECT_TRUE(values.flag("randomAgent"));
}

TEST_F(MnemonicTest, UnknownCodeFails) {
    OptionValues values;
    auto err = expander.expand("bat,qqq", values);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::Mnemonic);
    EXPECT_EQ(err->message, "mnemonic 'qqq' can't be resolved to any parameter name");
}

TEST_F(MnemonicTest, ValueRequired) {
    OptionValues values;
    auto err = expander.expand("lev", values);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "mnemonic 'lev' requires value of type 'int'");
    auto bad = expander.expand("lev=high", values);
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(bad->kind, ErrorKind::Mnemonic);
}

TEST_F(MnemonicTest, FirstCodeKeepsDestination) {
    OptionValues values;
    ASSERT_FALSE(expander.expand("lev=2,level=5", values).has_value());
    EXPECT_EQ(values.integer("level"), 2);
}

TEST_F(MnemonicTest, TopLevelOptionsAreNotMnemonics) {
    auto res = expander.resolve("version");
    EXPECT_TRUE(std::holds_alternative<Failure>(res));
}
