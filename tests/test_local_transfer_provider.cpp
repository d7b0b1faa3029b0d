#include <gtest/gtest.h>

#include "ota/local_transfer_provider.hpp"
#include "testing.hpp"

#include <thread>

namespace otafetch {
namespace {

using namespace std::chrono_literals;

class LocalTransferProviderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::string source;
    std::string payload = testutil::Payload(600 * 1024 + 17);
    UpdateDescriptor descriptor;

    void SetUp() override {
        source = tmp.File("mirror.bin");
        testutil::WriteFile(source, payload);
        descriptor.file_name = "ota.zip";
        descriptor.total_bytes = payload.size();
        descriptor.url = "file://" + source;
    }

    // Waits until the transfer leaves the running state.
    std::int64_t WaitSettled(LocalTransferProvider& p, std::int64_t target) {
        std::int64_t last = p.QueryProgressBytes();
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (last >= 0 && last != target && std::chrono::steady_clock::now() < deadline) {
            p.WaitForChange(last, 50ms);
            last = p.QueryProgressBytes();
        }
        return last;
    }
};

TEST_F(LocalTransferProviderTests, CopiesWholeFile) {
    LocalTransferProvider p;
    EXPECT_FALSE(p.HasTargetSet());
    EXPECT_EQ(p.QueryProgressBytes(), ITransferProvider::kTerminated);

    ASSERT_TRUE(p.SetTarget(descriptor).ok);
    EXPECT_TRUE(p.HasTargetSet());

    const std::string dest = tmp.File("ota.zip");
    ASSERT_TRUE(p.Start(dest, Network{.name = "wlan0", .handle = 3}, 0).ok);
    EXPECT_EQ(WaitSettled(p, static_cast<std::int64_t>(payload.size())), static_cast<std::int64_t>(payload.size()));
    // Success stays readable until release.
    EXPECT_EQ(p.QueryProgressBytes(), static_cast<std::int64_t>(payload.size()));

    p.Release();
    EXPECT_EQ(p.QueryProgressBytes(), ITransferProvider::kTerminated);
    EXPECT_EQ(testutil::ReadFile(dest), payload);
}

TEST_F(LocalTransferProviderTests, ResumesFromOffsetAndDropsTrailingBytes) {
    const std::string dest = tmp.File("ota.zip");
    testutil::WriteFile(dest, payload.substr(0, 1000) + "garbage");

    LocalTransferProvider p;
    ASSERT_TRUE(p.SetTarget(descriptor).ok);
    ASSERT_TRUE(p.Start(dest, std::nullopt, 1000).ok);
    EXPECT_EQ(WaitSettled(p, static_cast<std::int64_t>(payload.size())), static_cast<std::int64_t>(payload.size()));
    p.Release();
    EXPECT_EQ(testutil::ReadFile(dest), payload);
}

TEST_F(LocalTransferProviderTests, ReleaseStopsThrottledTransfer) {
    LocalTransferProvider p(LocalTransferProvider::Options{.chunk_bytes = 4096, .throttle_bytes_per_sec = 64 * 1024});
    ASSERT_TRUE(p.SetTarget(descriptor).ok);

    const std::string dest = tmp.File("ota.zip");
    ASSERT_TRUE(p.Start(dest, std::nullopt, 0).ok);
    std::this_thread::sleep_for(100ms);
    p.Release();
    EXPECT_EQ(p.QueryProgressBytes(), ITransferProvider::kTerminated);

    const auto on_disk = testutil::FileSize(dest);
    EXPECT_GT(on_disk, 0);
    EXPECT_LT(on_disk, static_cast<std::int64_t>(payload.size()));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(testutil::FileSize(dest), on_disk);
}

TEST_F(LocalTransferProviderTests, MissingSourceTerminates) {
    descriptor.url = tmp.File("missing.bin");
    LocalTransferProvider p;
    ASSERT_TRUE(p.SetTarget(descriptor).ok);
    ASSERT_TRUE(p.Start(tmp.File("ota.zip"), std::nullopt, 0).ok);
    EXPECT_EQ(WaitSettled(p, -2), ITransferProvider::kTerminated);
    p.Release();
}

TEST_F(LocalTransferProviderTests, ShortSourceIsFailure) {
    descriptor.total_bytes = payload.size() + 10;
    LocalTransferProvider p;
    ASSERT_TRUE(p.SetTarget(descriptor).ok);
    ASSERT_TRUE(p.Start(tmp.File("ota.zip"), std::nullopt, 0).ok);
    EXPECT_EQ(WaitSettled(p, -2), ITransferProvider::kTerminated);
}

TEST_F(LocalTransferProviderTests, StartRequiresTarget) {
    LocalTransferProvider p;
    EXPECT_FALSE(p.Start(tmp.File("ota.zip"), std::nullopt, 0).ok);

    descriptor.url.clear();
    EXPECT_FALSE(p.SetTarget(descriptor).ok);
}

} // namespace
} // namespace otafetch
