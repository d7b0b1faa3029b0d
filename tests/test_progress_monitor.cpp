#include <gtest/gtest.h>

#include "ota/progress_monitor.hpp"
#include "testing.hpp"
#include "util/progress_text.hpp"
#include "util/worker_pool.hpp"

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

namespace otafetch {
namespace {

using namespace std::chrono_literals;

class RecordingSink final : public IProgressSink {
  public:
    bool OnProgress(const ProgressUpdate& update) override {
        std::lock_guard<std::mutex> lk(mu_);
        updates_.push_back(update);
        return keep_going_;
    }
    void OnTransferComplete() override { ++completions_; }

    std::vector<ProgressUpdate> Updates() const {
        std::lock_guard<std::mutex> lk(mu_);
        return updates_;
    }
    int Completions() const { return completions_.load(); }
    void StopAfterFirst() { keep_going_ = false; }

  private:
    mutable std::mutex mu_;
    std::vector<ProgressUpdate> updates_;
    std::atomic<int> completions_{0};
    bool keep_going_ = true;
};

class ProgressMonitorTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    RecordingSink sink;

    ProgressMonitor::Outcome RunWhile(ITransferProvider& provider,
                                      std::uint64_t total,
                                      std::uint64_t initial,
                                      const std::function<void()>& drive) {
        ProgressMonitor monitor(provider, sink, total, initial, ProgressPercent(initial, total),
                                ProgressMonitor::Options{.poll_interval = 5ms});
        ProgressMonitor::Outcome outcome = ProgressMonitor::Outcome::kCancelled;
        std::thread runner([&] { outcome = monitor.Run(CancelToken()); });
        drive();
        runner.join();
        return outcome;
    }
};

TEST_F(ProgressMonitorTests, ForwardsGrowthAndCompletesAtTotal) {
    testutil::FakeTransferProvider provider(testutil::Payload(1000));
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);

    const auto outcome = RunWhile(provider, 1000, 0, [&] {
        provider.Advance(500);
        std::this_thread::sleep_for(20ms);
        provider.Advance(500);
    });

    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kCompleted);
    EXPECT_EQ(sink.Completions(), 1);
    const auto updates = sink.Updates();
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().bytes, 1000u);
    EXPECT_EQ(updates.back().text, "1000 B / 1000 B");
    ASSERT_TRUE(updates.back().percent.has_value());
    EXPECT_EQ(*updates.back().percent, 100);

    std::uint64_t last = 0;
    for (const auto& u : updates) {
        EXPECT_GT(u.bytes, last);
        last = u.bytes;
    }
}

TEST_F(ProgressMonitorTests, PollsProvidersWithoutChangeNotification) {
    testutil::FakeTransferProvider provider(testutil::Payload(100), /*push=*/false);
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);

    const auto outcome = RunWhile(provider, 100, 0, [&] {
        for (int i = 0; i < 10; ++i) {
            provider.Advance(10);
            std::this_thread::sleep_for(2ms);
        }
    });
    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kCompleted);
    EXPECT_EQ(sink.Completions(), 1);
}

TEST_F(ProgressMonitorTests, TerminatedTransferNeverCompletes) {
    testutil::FakeTransferProvider provider(testutil::Payload(1000));
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);

    const auto outcome = RunWhile(provider, 1000, 0, [&] {
        provider.Advance(300);
        std::this_thread::sleep_for(20ms);
        provider.Fail();
    });
    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kTerminated);
    EXPECT_EQ(sink.Completions(), 0);
}

TEST_F(ProgressMonitorTests, EmptyArtifactCompletesWithFinalPercent) {
    testutil::FakeTransferProvider provider("");
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);

    const auto outcome = RunWhile(provider, 0, 0, [] {});
    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kCompleted);
    EXPECT_EQ(sink.Completions(), 1);
    const auto updates = sink.Updates();
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].bytes, 0u);
    ASSERT_TRUE(updates[0].percent.has_value());
    EXPECT_EQ(*updates[0].percent, 100);
}

TEST_F(ProgressMonitorTests, SizeBeyondTotalIsTerminated) {
    testutil::FakeTransferProvider provider(testutil::Payload(2000));
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);

    const auto outcome = RunWhile(provider, 1000, 0, [&] { provider.Advance(1500); });
    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kTerminated);
    EXPECT_EQ(sink.Completions(), 0);
}

TEST_F(ProgressMonitorTests, ResumedAttemptOnlyReportsNewPercents) {
    testutil::FakeTransferProvider provider(testutil::Payload(1000));
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 400).ok);

    const auto outcome = RunWhile(provider, 1000, 400, [&] {
        provider.Advance(5);
        std::this_thread::sleep_for(20ms);
        provider.Advance(595);
    });
    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kCompleted);

    const auto updates = sink.Updates();
    ASSERT_FALSE(updates.empty());
    EXPECT_GT(updates.front().bytes, 400u);
    for (const auto& u : updates) {
        if (u.percent) {
            EXPECT_GT(*u.percent, 40);
        }
    }
}

TEST_F(ProgressMonitorTests, SinkCanStopTheMonitor) {
    testutil::FakeTransferProvider provider(testutil::Payload(1000));
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);
    sink.StopAfterFirst();

    const auto outcome = RunWhile(provider, 1000, 0, [&] { provider.Advance(100); });
    EXPECT_EQ(outcome, ProgressMonitor::Outcome::kCancelled);
    EXPECT_EQ(sink.Updates().size(), 1u);
}

TEST_F(ProgressMonitorTests, CancellationStopsWithoutCallbacks) {
    testutil::FakeTransferProvider provider(testutil::Payload(1000), /*push=*/false);
    ASSERT_TRUE(provider.Start(tmp.File("f"), std::nullopt, 0).ok);

    WorkerPool pool(1);
    std::atomic<int> outcome{-1};
    auto handle = pool.Submit("monitor", [&](const CancelToken& token) {
        ProgressMonitor monitor(provider, sink, 1000, 0, 0, ProgressMonitor::Options{.poll_interval = 5ms});
        outcome = static_cast<int>(monitor.Run(token));
    });
    std::this_thread::sleep_for(20ms);
    handle.Cancel();
    ASSERT_TRUE(handle.WaitDone(2s));
    provider.Advance(1000);

    EXPECT_EQ(outcome.load(), static_cast<int>(ProgressMonitor::Outcome::kCancelled));
    EXPECT_TRUE(sink.Updates().empty());
    EXPECT_EQ(sink.Completions(), 0);
}

TEST(MonitorOutcomeNameTest, Names) {
    EXPECT_STREQ(MonitorOutcomeName(ProgressMonitor::Outcome::kCompleted), "completed");
    EXPECT_STREQ(MonitorOutcomeName(ProgressMonitor::Outcome::kTerminated), "terminated");
    EXPECT_STREQ(MonitorOutcomeName(ProgressMonitor::Outcome::kCancelled), "cancelled");
}

} // namespace
} // namespace otafetch
