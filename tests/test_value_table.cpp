///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "errors.hpp"
#include "value_table.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string tempPath(const std::string& name) {
    return ::testing::TempDir() + name;
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ValueTableTest, UpdateMovesTowardTheReward) {
    ValueTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_DOUBLE_EQ(table.value("room|p0|c1|move"), 0.0);

    table.update("room|p0|c1|move", 2.0, 0.5);
    EXPECT_DOUBLE_EQ(table.value("room|p0|c1|move"), 1.0);
    table.update("room|p0|c1|move", 2.0, 0.5);
    EXPECT_DOUBLE_EQ(table.value("room|p0|c1|move"), 1.5);
    EXPECT_TRUE(table.contains("room|p0|c1|move"));
    EXPECT_FALSE(table.contains("room|p1|c1|move"));
    EXPECT_EQ(table.size(), 1);
}

TEST(ValueTableTest, SaveAndLoadPersistAcrossRuns) {
    std::string path = tempPath("value_table_roundtrip.txt");
    {
        ValueTable table;
        table.update("faculty|p3|c2|move", 3.0, 0.3);
        table.update("student|p0|c1|swap", 1.0, 1.0);
        table.save(path);
    }
    ValueTable loaded;
    loaded.update("stale|p0|c0|move", 5.0, 1.0);
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.size(), 2);
    EXPECT_FALSE(loaded.contains("stale|p0|c0|move"));
    EXPECT_DOUBLE_EQ(loaded.value("faculty|p3|c2|move"), 0.9);
    EXPECT_DOUBLE_EQ(loaded.value("student|p0|c1|swap"), 1.0);
    std::remove(path.c_str());
}

TEST(ValueTableTest, MissingFileLeavesTheTableCold) {
    ValueTable table;
    EXPECT_FALSE(table.load(tempPath("no_such_value_table.txt")));
    EXPECT_TRUE(table.empty());
}

TEST(ValueTableTest, MalformedLineIsRejected) {
    std::string path = tempPath("value_table_malformed.txt");
    {
        std::ofstream out(path);
        out << "# learned values\n";
        out << "room|p0|c1|move 0.5\n";
        out << "room|p1|c1|move not-a-number\n";
    }
    ValueTable table;
    table.update("kept|p0|c0|move", 1.0, 1.0);
    EXPECT_THROW(table.load(path), TimetableError);
    EXPECT_TRUE(table.contains("kept|p0|c0|move"));
    std::remove(path.c_str());
}

TEST(ValueTableTest, CopiesAreIndependent) {
    ValueTable table;
    table.update("a|p0|c0|move", 1.0, 1.0);
    ValueTable copy(table);
    copy.update("b|p0|c0|move", 1.0, 1.0);
    EXPECT_EQ(table.size(), 1);
    EXPECT_EQ(copy.size(), 2);
}
