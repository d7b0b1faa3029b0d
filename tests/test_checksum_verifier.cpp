#include <gtest/gtest.h>

#include "ota/checksum_verifier.hpp"
#include "testing.hpp"
#include "util/worker_pool.hpp"

#include <filesystem>
#include <string>

namespace otafetch {
namespace {

using namespace std::chrono_literals;

class ChecksumVerifierTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(ChecksumVerifierTests, MatchingDigestPasses) {
    const std::string p = tmp.File("ota.zip");
    testutil::WriteFile(p, testutil::Payload(1000));

    const ChecksumVerifier verifier;
    const auto r = verifier.Verify(p, "f508aa489132a4985042045dfee3cc2a", DigestAlgorithm::kMd5);
    EXPECT_TRUE(r.passed()) << r.message;
    EXPECT_EQ(r.actual, "f508aa489132a4985042045dfee3cc2a");
}

TEST_F(ChecksumVerifierTests, ExpectedValueIsCaseInsensitive) {
    const std::string p = tmp.File("abc.bin");
    testutil::WriteFile(p, "abc");

    const ChecksumVerifier verifier;
    const auto r = verifier.Verify(p, "900150983CD24FB0D6963F7D28E17F72", DigestAlgorithm::kMd5);
    EXPECT_EQ(r.outcome, VerifyOutcome::kPassed);
}

TEST_F(ChecksumVerifierTests, SmallChunksGiveSameDigest) {
    const std::string p = tmp.File("big.bin");
    testutil::WriteFile(p, testutil::Payload(3 * 1024 * 1024 + 5));

    const ChecksumVerifier verifier(4096);
    const auto r = verifier.Verify(p,
                                   "5ea6e4826d1a9bab3529e3350753fdb8a750273fc31c4d4d4c1a5e1b5bdcf2ca",
                                   DigestAlgorithm::kSha256);
    EXPECT_TRUE(r.passed()) << r.message;
}

TEST_F(ChecksumVerifierTests, MismatchReportsActualDigest) {
    const std::string p = tmp.File("abc.bin");
    testutil::WriteFile(p, "abc");

    const ChecksumVerifier verifier;
    const auto r = verifier.Verify(p, "d41d8cd98f00b204e9800998ecf8427e", DigestAlgorithm::kMd5);
    EXPECT_EQ(r.outcome, VerifyOutcome::kMismatch);
    EXPECT_EQ(r.actual, "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(ChecksumVerifierTests, MissingFileIsDistinct) {
    const ChecksumVerifier verifier;
    const auto r = verifier.Verify(tmp.File("nope.zip"), "d41d8cd98f00b204e9800998ecf8427e", DigestAlgorithm::kMd5);
    EXPECT_EQ(r.outcome, VerifyOutcome::kFileMissing);
}

TEST_F(ChecksumVerifierTests, DirectoryIsIoError) {
    std::filesystem::create_directories(tmp.File("dir"));
    const ChecksumVerifier verifier;
    const auto r = verifier.Verify(tmp.File("dir"), "d41d8cd98f00b204e9800998ecf8427e", DigestAlgorithm::kMd5);
    EXPECT_EQ(r.outcome, VerifyOutcome::kIoError);
}

TEST_F(ChecksumVerifierTests, CancelledTokenStopsVerification) {
    const std::string p = tmp.File("ota.zip");
    testutil::WriteFile(p, testutil::Payload(1000));

    WorkerPool pool(1);
    VerifyResult result;
    auto handle = pool.Submit("verify", [&](const CancelToken& token) {
        (void)token.WaitFor(5s);
        result = ChecksumVerifier().Verify(p, "f508aa489132a4985042045dfee3cc2a", DigestAlgorithm::kMd5, token);
    });
    handle.Cancel();
    ASSERT_TRUE(handle.WaitDone(5s));
    EXPECT_EQ(result.outcome, VerifyOutcome::kCancelled);
}

} // namespace
} // namespace otafetch
