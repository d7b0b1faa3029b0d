#include <gtest/gtest.h>

#include "ota/update_descriptor.hpp"
#include "util/update_policy.hpp"
#include "util/version_comparator.hpp"

namespace otafetch {
namespace {

TEST(VersionComparatorTest, DottedNumericOrder) {
    EXPECT_GT(VersionComparator::Compare("1.10.0", "1.9.9"), 0);
    EXPECT_LT(VersionComparator::Compare("1.2", "1.2.1"), 0);
    EXPECT_EQ(VersionComparator::Compare("1.2", "1.2.0"), 0);
    EXPECT_EQ(VersionComparator::Compare("2.0.0", "2.0.0"), 0);
}

TEST(VersionComparatorTest, IgnoresPrefixAndSuffix) {
    EXPECT_EQ(VersionComparator::Compare("v1.4.2", "1.4.2"), 0);
    EXPECT_EQ(VersionComparator::Compare("1.4.2-rc1", "1.4.2"), 0);
    EXPECT_EQ(VersionComparator::Compare("1.4.2+build7", "V1.4.2"), 0);
    EXPECT_GT(VersionComparator::Compare("1.5-beta", "1.4.9"), 0);
}

TEST(VersionComparatorTest, GarbagePartsCountAsZero) {
    EXPECT_EQ(VersionComparator::Compare("1.x.3", "1.0.3"), 0);
    EXPECT_LT(VersionComparator::Compare("", "0.0.1"), 0);
    EXPECT_EQ(VersionComparator::Compare("", "0"), 0);
}

TEST(UpdatePolicyTest, NewerOrForced) {
    UpdateDescriptor d;
    d.version = "2.0.0";
    EXPECT_TRUE(UpdatePolicy::IsNewer(d, "1.9.0"));
    EXPECT_FALSE(UpdatePolicy::IsNewer(d, "2.0.0"));
    EXPECT_FALSE(UpdatePolicy::IsNewer(d, "3.0"));
    d.force = true;
    EXPECT_TRUE(UpdatePolicy::IsNewer(d, "3.0"));
}

} // namespace
} // namespace otafetch
