/*
 * Shell history tests - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <argforge/shell/history.hpp>
#include <filesystem>
#include <fstream>

using namespace argforge;
namespace fs = std::filesystem;

class HistoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        home = fs::temp_directory_path() / ("argforge_history_" + std::string(
            ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(home);
    }
    void TearDown() override { fs::remove_all(home); }
    fs::path home;
};

TEST_F(HistoryTest, PathPerKind) {
    History main(home.string(), HistoryKind::Main);
    History sql(home.string(), HistoryKind::Sql);
    History os(home.string(), HistoryKind::Os);
    EXPECT_EQ(main.path(), (home / "history" / "main.hst").string());
    EXPECT_EQ(sql.path(), (home / "history" / "sql.hst").string());
    EXPECT_EQ(os.path(), (home / "history" / "os.hst").string());
}

TEST_F(HistoryTest, MissingFileLoadsEmpty) {
    History h(home.string(), HistoryKind::Main);
    EXPECT_TRUE(h.load());
    EXPECT_TRUE(h.entries().empty());
}

TEST_F(HistoryTest, SaveThenLoad) {
    History h(home.string(), HistoryKind::Main);
    h.add("-u http://x --batch");
    h.add("");
    h.add("--wizard");
    ASSERT_TRUE(h.save());
    History again(home.string(), HistoryKind::Main);
    ASSERT_TRUE(again.load());
    EXPECT_EQ(again.entries(), (std::vector<std::string>{"-u http://x --batch", "--wizard"}));
}

TEST_F(HistoryTest, KeepsNewestEntries) {
    History h(home.string(), HistoryKind::Sql, 3);
    for (int i = 0; i < 5; ++i) h.add("select " + std::to_string(i));
    EXPECT_EQ(h.entries(), (std::vector<std::string>{"select 2", "select 3", "select 4"}));
    ASSERT_TRUE(h.save());

    // a longer file written elsewhere is cut on load
    std::ofstream(h.path(), std::ios::app) << "select 5\nselect 6\n";
    History small(home.string(), HistoryKind::Sql, 3);
    ASSERT_TRUE(small.load());
    EXPECT_EQ(small.entries(), (std::vector<std::string>{"select 4", "select 5", "select 6"}));
}

TEST_F(HistoryTest, ClearEmptiesFileOnSave) {
    History h(home.string(), HistoryKind::Os);
    h.add("id");
    ASSERT_TRUE(h.save());
    h.clear();
    ASSERT_TRUE(h.save());
    History again(home.string(), HistoryKind::Os);
    ASSERT_TRUE(again.load());
    EXPECT_TRUE(again.entries().empty());
}
