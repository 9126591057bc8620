#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, SplitDropsEmptySegmentsOnly) {
    const auto segs = apg::SplitPathSegments("//a/./b//c/");
    ASSERT_EQ(segs.size(), 4U);
    EXPECT_EQ(segs[0], "a");
    EXPECT_EQ(segs[1], ".");
    EXPECT_EQ(segs[2], "b");
    EXPECT_EQ(segs[3], "c");
    EXPECT_TRUE(apg::SplitPathSegments("").empty());
    EXPECT_TRUE(apg::SplitPathSegments("///").empty());
}

TEST(PathUtilsTest, CleanTarPathCleansInput) {
    EXPECT_EQ(apg::CleanTarPath("./metadata.json"), "metadata.json");
    EXPECT_EQ(apg::CleanTarPath("data//usr///bin/"), "data/usr/bin");
    EXPECT_EQ(apg::CleanTarPath("././a/./b"), "a/b");
    EXPECT_EQ(apg::CleanTarPath("./"), "");
    EXPECT_EQ(apg::CleanTarPath(""), "");
}

TEST(PathUtilsTest, CleanTarPathKeepsParentSegments) {
    EXPECT_EQ(apg::CleanTarPath("./data/../x"), "data/../x");
    EXPECT_TRUE(apg::HasParentSegment(apg::CleanTarPath("a/./../b")));
}

TEST(PathUtilsTest, IsAbsoluteTarPath) {
    EXPECT_TRUE(apg::IsAbsoluteTarPath("/etc/passwd"));
    EXPECT_TRUE(apg::IsAbsoluteTarPath("//x"));
    EXPECT_FALSE(apg::IsAbsoluteTarPath("etc/passwd"));
    EXPECT_FALSE(apg::IsAbsoluteTarPath("./etc"));
    EXPECT_FALSE(apg::IsAbsoluteTarPath(""));
}

TEST(PathUtilsTest, HasParentSegmentMatchesWholeSegmentsOnly) {
    EXPECT_TRUE(apg::HasParentSegment(".."));
    EXPECT_TRUE(apg::HasParentSegment("a/../b"));
    EXPECT_TRUE(apg::HasParentSegment("a/b/.."));
    EXPECT_FALSE(apg::HasParentSegment("a..b/c"));
    EXPECT_FALSE(apg::HasParentSegment("..."));
    EXPECT_FALSE(apg::HasParentSegment("a/.hidden"));
}
