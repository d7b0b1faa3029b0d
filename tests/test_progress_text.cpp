#include <gtest/gtest.h>

#include "util/progress_text.hpp"

namespace otafetch {
namespace {

TEST(ProgressTextTest, FormatsBinaryUnits) {
    EXPECT_EQ(FormatBytes(0), "0 B");
    EXPECT_EQ(FormatBytes(512), "512 B");
    EXPECT_EQ(FormatBytes(512 * 1024), "512.0 KiB");
    EXPECT_EQ(FormatBytes(1536 * 1024), "1.5 MiB");
    EXPECT_EQ(FormatBytes(1024ULL * 1024 * 1024), "1.0 GiB");
}

TEST(ProgressTextTest, DoneOverTotal) {
    EXPECT_EQ(FormatProgressText(512 * 1024, 1024ULL * 1024 * 1024), "512.0 KiB / 1.0 GiB");
    EXPECT_EQ(FormatProgressText(10, 1000), "10 B / 1000 B");
}

TEST(ProgressTextTest, PercentIsFlooredAndClamped) {
    EXPECT_EQ(ProgressPercent(0, 1000), 0);
    EXPECT_EQ(ProgressPercent(9, 1000), 0);
    EXPECT_EQ(ProgressPercent(10, 1000), 1);
    EXPECT_EQ(ProgressPercent(999, 1000), 99);
    EXPECT_EQ(ProgressPercent(1000, 1000), 100);
    EXPECT_EQ(ProgressPercent(2000, 1000), 100);
    EXPECT_EQ(ProgressPercent(5, 0), 0);
}

} // namespace
} // namespace otafetch
