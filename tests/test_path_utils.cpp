#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(wdi::NormalizeArchivePath("./operadriver_linux64/operadriver"), "operadriver_linux64/operadriver");
    EXPECT_EQ(wdi::NormalizeArchivePath("/a//b///c"), "a/b/c");
    EXPECT_EQ(wdi::NormalizeArchivePath("operadriver_mac64/"), "operadriver_mac64");
    EXPECT_EQ(wdi::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, IsPlainFileName) {
    EXPECT_TRUE(wdi::IsPlainFileName("operadriver"));
    EXPECT_TRUE(wdi::IsPlainFileName("operadriver.exe"));
    EXPECT_FALSE(wdi::IsPlainFileName(""));
    EXPECT_FALSE(wdi::IsPlainFileName(".."));
    EXPECT_FALSE(wdi::IsPlainFileName("bin/operadriver"));
    EXPECT_FALSE(wdi::IsPlainFileName("..\\operadriver.exe"));
}

TEST(PathUtilsTest, HasPathSeparator) {
    EXPECT_TRUE(wdi::HasPathSeparator("C:\\Program Files\\Opera\\opera.exe"));
    EXPECT_TRUE(wdi::HasPathSeparator("/snap/bin/opera"));
    EXPECT_FALSE(wdi::HasPathSeparator("opera.exe"));
}
