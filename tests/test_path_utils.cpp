#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, IsPlainFileName) {
    EXPECT_TRUE(otafetch::IsPlainFileName("ota.zip"));
    EXPECT_TRUE(otafetch::IsPlainFileName(".hidden"));
    EXPECT_FALSE(otafetch::IsPlainFileName(""));
    EXPECT_FALSE(otafetch::IsPlainFileName("."));
    EXPECT_FALSE(otafetch::IsPlainFileName(".."));
    EXPECT_FALSE(otafetch::IsPlainFileName("a/b.zip"));
    EXPECT_FALSE(otafetch::IsPlainFileName("/ota.zip"));
}

TEST(PathUtilsTest, LocalPathFromUrlStripsScheme) {
    EXPECT_EQ(otafetch::LocalPathFromUrl("file:///mnt/mirror/ota.zip"), "/mnt/mirror/ota.zip");
    EXPECT_EQ(otafetch::LocalPathFromUrl("/mnt/mirror/ota.zip"), "/mnt/mirror/ota.zip");
    EXPECT_EQ(otafetch::LocalPathFromUrl(""), "");
}
