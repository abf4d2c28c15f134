#include <gtest/gtest.h>
#include "../main/src/version.hpp"

TEST(VersionTest, Comparisons) {
    EXPECT_TRUE(version_less("1.0", "2.0"));
    EXPECT_FALSE(version_less("2.0", "1.0"));
    EXPECT_FALSE(version_less("1.0", "1.0")); // strictly less

    EXPECT_TRUE(version_less("1.9", "1.10"));
    EXPECT_TRUE(version_less("1.0", "1.0.1"));
    EXPECT_TRUE(version_less("1.0-alpha", "1.0"));
    EXPECT_TRUE(version_less("1.0-alpha", "1.0-beta"));
    EXPECT_TRUE(version_less("1.0-beta-1", "1.0-beta-2"));
    EXPECT_TRUE(version_less("1.0-beta.9", "1.0-beta.10"));
}

TEST(VersionTest, SnapshotSortsBelowRelease) {
    EXPECT_TRUE(version_less("1.0-SNAPSHOT", "1.0"));
    EXPECT_TRUE(version_less("1.0", "1.1-SNAPSHOT"));
}

TEST(VersionTest, OrderIsTotal) {
    EXPECT_NE(compare_versions("1.0", "1.0.0"), 0);
    EXPECT_EQ(compare_versions("1.0", "1.0.0"), -compare_versions("1.0.0", "1.0"));
    EXPECT_EQ(compare_versions("3.2.1", "3.2.1"), 0);
}

TEST(VersionTest, HugeNumericPartsDoNotOverflow) {
    EXPECT_TRUE(version_less("1.99999999999999999999", "1.100000000000000000000"));
    EXPECT_NE(compare_versions("1.007", "1.7"), 0);
}

TEST(VersionTest, LatestAndRelease) {
    std::vector<std::string> versions = {"1.0", "2.0-SNAPSHOT", "1.10", "1.9"};
    EXPECT_EQ(latest_version(versions), "2.0-SNAPSHOT");
    EXPECT_EQ(latest_release(versions), "1.10");
    EXPECT_EQ(latest_release({"1.0-SNAPSHOT"}), "");
    EXPECT_EQ(latest_version({}), "");
}
