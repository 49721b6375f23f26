/*
 * Option parser tests - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <argforge/options/option_parser.hpp>

using namespace argforge;

using Args = std::vector<std::string>;

static ParsedOptions parse_ok(const Args& args) {
    OptionParser parser(default_catalogue());
    auto res = parser.parse(args);
    if (auto* f = std::get_if<Failure>(&res)) ADD_FAILURE() << f->message;
    if (auto* p = std::get_if<ParsedOptions>(&res)) return *p;
    return {};
}

static std::string parse_error(const Args& args) {
    OptionParser parser(default_catalogue());
    auto res = parser.parse(args);
    auto* f = std::get_if<Failure>(&res);
    if (!f) { ADD_FAILURE() << "expected a usage error"; return {}; }
    EXPECT_EQ(f->kind, ErrorKind::Usage);
    return f->message;
}

TEST(OptionParserDefaults, AppliedForEveryDestination) {
    auto p = parse_ok({});
    EXPECT_EQ(p.values.integer("verbose"), 1);
    EXPECT_EQ(p.values.integer("level"), 1);
    EXPECT_EQ(p.values.integer("threads"), 1);
    EXPECT_EQ(p.values.str("technique"), "BEUSTQ");
    EXPECT_FALSE(p.values.flag("batch"));
    EXPECT_TRUE(p.values.has("url"));
    EXPECT_FALSE(p.values.truthy("url"));
}

TEST(OptionParserLong, InlineAndDetachedValues) {
    auto p = parse_ok({"--url=http://x/?id=1", "--data", "id=1", "--level=3", "--timeout", "12.5", "--batch"});
    EXPECT_EQ(p.values.str("url"), "http://x/?id=1");
    EXPECT_EQ(p.values.str("data"), "id=1");
    EXPECT_EQ(p.values.integer("level"), 3);
    auto* timeout = std::get_if<double>(&p.values.get("timeout"));
    ASSERT_NE(timeout, nullptr);
    EXPECT_DOUBLE_EQ(*timeout, 12.5);
    EXPECT_TRUE(p.values.flag("batch"));
}

TEST(OptionParserLong, UniqueAbbreviation) {
    auto p = parse_ok({"--bat", "--flush"});
    EXPECT_TRUE(p.values.flag("batch"));
    EXPECT_TRUE(p.values.flag("flushSession"));
}

TEST(OptionParserLong, AmbiguousAbbreviation) {
    EXPECT_EQ(parse_error({"--dump-f"}), "ambiguous option: --dump-f (--dump-file, --dump-format?)");
}

TEST(OptionParserLong, Errors) {
    EXPECT_EQ(parse_error({"--frobnicate"}), "no such option: --frobnicate");
    EXPECT_EQ(parse_error({"--url"}), "--url option requires an argument");
    EXPECT_EQ(parse_error({"--batch=1"}), "--batch option does not take a value");
    EXPECT_EQ(parse_error({"--level=high"}), "option --level: invalid integer value: 'high'");
    EXPECT_EQ(parse_error({"--delay", "soon"}), "option --delay: invalid floating-point value: 'soon'");
}

TEST(OptionParserShort, AttachedDetachedAndClusters) {
    auto p = parse_ok({"-uhttp://x", "-p", "id", "-bf", "-v", "3"});
    EXPECT_EQ(p.values.str("url"), "http://x");
    EXPECT_EQ(p.values.str("testParameter"), "id");
    EXPECT_TRUE(p.values.flag("getBanner"));
    EXPECT_TRUE(p.values.flag("extensiveFp"));
    EXPECT_EQ(p.values.integer("verbose"), 3);
}

TEST(OptionParserShort, ClusterEndingInValuedOption) {
    auto p = parse_ok({"-bD", "testdb"});
    EXPECT_TRUE(p.values.flag("getBanner"));
    EXPECT_EQ(p.values.str("db"), "testdb");
}

TEST(OptionParserShort, Errors) {
    EXPECT_EQ(parse_error({"-Q"}), "no such option: -Q");
    EXPECT_EQ(parse_error({"-u"}), "-u option requires an argument");
    EXPECT_EQ(parse_error({"-v", "x"}), "option -v: invalid integer value: 'x'");
}

TEST(OptionParserPositional, ExtrasAndTerminator) {
    auto p = parse_ok({"stray", "--batch", "-", "--", "--level=9", "-b"});
    EXPECT_EQ(p.extras, (Args{"stray", "-", "--level=9", "-b"}));
    EXPECT_EQ(p.values.integer("level"), 1);
    EXPECT_FALSE(p.values.flag("getBanner"));
}

TEST(OptionParserHelp, StopsAtHelp) {
    auto p = parse_ok({"--batch", "-h", "--frobnicate"});
    EXPECT_TRUE(p.help_requested);
    EXPECT_TRUE(p.values.flag("batch"));
    EXPECT_TRUE(parse_ok({"--help"}).help_requested);
}

TEST(OptionParserHidden, HiddenOptionsAreAccepted) {
    auto p = parse_ok({"--dummy", "--ignore-stdin", "--crack", "hashes.txt"});
    EXPECT_TRUE(p.values.flag("dummy"));
    EXPECT_TRUE(p.values.flag("ignoreStdin"));
    EXPECT_EQ(p.values.str("hashFile"), "hashes.txt");
}
