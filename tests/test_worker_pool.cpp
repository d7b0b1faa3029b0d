#include <gtest/gtest.h>

#include "util/worker_pool.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace otafetch {
namespace {

using namespace std::chrono_literals;

TEST(WorkerPoolTest, RunsSubmittedTasks) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.ThreadCount(), 4u);

    std::atomic<int> ran{0};
    std::vector<TaskHandle> handles;
    for (int i = 0; i < 16; ++i) {
        handles.push_back(pool.Submit("count", [&](const CancelToken&) { ++ran; }));
    }
    for (auto& h : handles) {
        ASSERT_TRUE(h.WaitDone(2s));
    }
    EXPECT_EQ(ran.load(), 16);
}

TEST(WorkerPoolTest, CancelWakesWaitingTask) {
    WorkerPool pool(1);
    std::atomic<bool> woke_early{false};
    auto h = pool.Submit("sleeper", [&](const CancelToken& token) {
        woke_early = !token.WaitFor(10s);
    });
    std::this_thread::sleep_for(20ms);
    h.Cancel();
    ASSERT_TRUE(h.WaitDone(2s));
    EXPECT_TRUE(woke_early.load());
    EXPECT_TRUE(h.IsCancelled());
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
    WorkerPool pool(1);
    auto bad = pool.Submit("bad", [](const CancelToken&) { throw std::runtime_error("boom"); });
    ASSERT_TRUE(bad.WaitDone(2s));

    std::atomic<bool> ran{false};
    auto good = pool.Submit("good", [&](const CancelToken&) { ran = true; });
    ASSERT_TRUE(good.WaitDone(2s));
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, SubmitAfterShutdownIsRejected) {
    WorkerPool pool(2);
    pool.Shutdown();
    std::atomic<bool> ran{false};
    auto h = pool.Submit("late", [&](const CancelToken&) { ran = true; });
    EXPECT_TRUE(h.IsCancelled());
    EXPECT_TRUE(h.Done());
    EXPECT_FALSE(ran.load());
}

TEST(WorkerPoolTest, ShutdownCancelsRunningTasks) {
    WorkerPool pool(1);
    std::atomic<bool> cancelled{false};
    auto h = pool.Submit("long", [&](const CancelToken& token) {
        cancelled = !token.WaitFor(10s);
    });
    std::this_thread::sleep_for(20ms);
    pool.Shutdown();
    EXPECT_TRUE(h.Done());
    EXPECT_TRUE(cancelled.load());
}

TEST(StrandTest, RunsClosuresInOrderOneAtATime) {
    WorkerPool pool(4);
    Strand strand(pool);

    std::mutex mu;
    std::vector<int> order;
    std::atomic<int> in_flight{0};
    std::atomic<bool> overlapped{false};

    for (int i = 0; i < 50; ++i) {
        strand.Post([&, i] {
            if (++in_flight > 1) overlapped = true;
            std::this_thread::sleep_for(100us);
            {
                std::lock_guard<std::mutex> lk(mu);
                order.push_back(i);
            }
            --in_flight;
        });
    }
    ASSERT_TRUE(strand.WaitIdle(5s));
    EXPECT_TRUE(strand.Idle());
    EXPECT_FALSE(overlapped.load());
    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST(StrandTest, PostAfterShutdownIsDropped) {
    WorkerPool pool(1);
    Strand strand(pool);
    pool.Shutdown();

    std::atomic<bool> ran{false};
    strand.Post([&] { ran = true; });
    EXPECT_TRUE(strand.WaitIdle(1s));
    EXPECT_FALSE(ran.load());
}

} // namespace
} // namespace otafetch
