#include <gtest/gtest.h>

#include "crypto/digest.hpp"
#include "testing.hpp"

#include <cstring>
#include <string>

namespace otafetch {
namespace {

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(DigestTest, Sha256KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";
    EXPECT_EQ(DigestHex(DigestAlgorithm::kSha256, Bytes("abc")), expected);
}

TEST(DigestTest, Md5KnownVectors) {
    EXPECT_EQ(DigestHex(DigestAlgorithm::kMd5, Bytes("abc")), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(DigestHex(DigestAlgorithm::kMd5, Bytes("")), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
    auto d = Digest::Create(DigestAlgorithm::kSha256);
    ASSERT_TRUE(d.has_value()) << d.error();
    ASSERT_TRUE(d->Update(Bytes("a")));
    ASSERT_TRUE(d->Update(Bytes("bc")));
    EXPECT_EQ(d->FinalHex(), DigestHex(DigestAlgorithm::kSha256, Bytes("abc")));
    // Finalized twice.
    EXPECT_EQ(d->FinalHex(), "");
}

TEST(DigestTest, ReaderOverload) {
    testutil::MemoryReader reader("abc");
    EXPECT_EQ(DigestHex(DigestAlgorithm::kMd5, reader), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(DigestTest, UnknownNameIsUnavailable) {
    auto d = Digest::Create("no-such-digest");
    ASSERT_FALSE(d.has_value());
    EXPECT_FALSE(d.error().empty());
}

TEST(DigestTest, NamesAndLengths) {
    EXPECT_STREQ(DigestName(DigestAlgorithm::kMd5), "md5");
    EXPECT_STREQ(DigestName(DigestAlgorithm::kSha256), "sha256");
    EXPECT_EQ(DigestHexLength(DigestAlgorithm::kMd5), 32u);
    EXPECT_EQ(DigestHexLength(DigestAlgorithm::kSha256), 64u);
    EXPECT_EQ(DigestAlgorithmFromName("sha256"), DigestAlgorithm::kSha256);
    EXPECT_FALSE(DigestAlgorithmFromName("crc32").has_value());

    const std::uint8_t raw[] = {0x00, 0xab, 0xff};
    EXPECT_EQ(HexEncode(raw), "00abff");
}

} // namespace
} // namespace otafetch
