// ═══════════════════════════════════════════════════════════════════
//  test_lifecycle.cpp — Tests for the download limit, drain and
//  shutdown coordination
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <lanserve/lifecycle.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace lanserve;
using namespace std::chrono_literals;

// ── TransferLimit ──

TEST(TransferLimitTest, RaisesOnlyWhenMaxReached) {
    lifecycle::Lifecycle life(3);

    auto first = life.limit.recordCompletion();
    EXPECT_FALSE(life.signal.raised());
    EXPECT_EQ(first.completed, 1u);
    EXPECT_EQ(first.remaining, 2u);

    auto second = life.limit.recordCompletion();
    EXPECT_FALSE(life.signal.raised());
    EXPECT_EQ(second.remaining, 1u);

    auto third = life.limit.recordCompletion();
    EXPECT_TRUE(life.signal.raised());
    EXPECT_TRUE(third.limitReached);
    EXPECT_EQ(third.remaining, 0u);
    EXPECT_EQ(life.signal.trigger(), lifecycle::Trigger::LimitReached);
}

TEST(TransferLimitTest, UnlimitedNeverRaises) {
    lifecycle::Lifecycle life(0);
    for (int i = 0; i < 5; i++) {
        auto c = life.limit.recordCompletion();
        EXPECT_FALSE(c.remaining.has_value());
        EXPECT_FALSE(c.limitReached);
    }
    EXPECT_FALSE(life.signal.raised());
    EXPECT_EQ(life.limit.completed(), 5u);
    EXPECT_TRUE(life.limit.unlimited());
}

TEST(TransferLimitTest, RemainingClampsAtZero) {
    lifecycle::Lifecycle life(1);
    life.limit.recordCompletion();
    auto extra = life.limit.recordCompletion();
    EXPECT_EQ(extra.completed, 2u);
    EXPECT_EQ(extra.remaining, 0u);
    EXPECT_EQ(life.limit.remaining(), 0u);
}

TEST(TransferLimitTest, ConcurrentCompletionsAreAllCounted) {
    lifecycle::Lifecycle life(100);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; i++) life.limit.recordCompletion();
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(life.limit.completed(), 200u);
    EXPECT_TRUE(life.signal.raised());
}

// ── ShutdownSignal ──

TEST(ShutdownSignalTest, FirstRaiseWins) {
    lifecycle::ShutdownSignal signal;
    EXPECT_TRUE(signal.raise(lifecycle::Trigger::Interrupt, "SIGINT"));
    EXPECT_FALSE(signal.raise(lifecycle::Trigger::LimitReached));
    EXPECT_EQ(signal.trigger(), lifecycle::Trigger::Interrupt);
    EXPECT_EQ(signal.detail(), "SIGINT");
}

TEST(ShutdownSignalTest, WaitForTimesOutWhenNotRaised) {
    lifecycle::ShutdownSignal signal;
    EXPECT_FALSE(signal.waitFor(10ms).has_value());
}

TEST(ShutdownSignalTest, WaitWakesOnRaiseFromOtherThread) {
    lifecycle::ShutdownSignal signal;
    std::thread raiser([&] {
        std::this_thread::sleep_for(20ms);
        signal.raise(lifecycle::Trigger::ServerError, "accept failed");
    });
    EXPECT_EQ(signal.wait(), lifecycle::Trigger::ServerError);
    raiser.join();
}

TEST(ShutdownSignalTest, ConcurrentRaisesFireExactlyOnce) {
    lifecycle::ShutdownSignal signal;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; i++) {
        threads.emplace_back([&] {
            if (signal.raise(lifecycle::Trigger::LimitReached)) winners++;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}

// ── ActiveTransfers ──

TEST(ActiveTransfersTest, GuardCountsForItsLifetime) {
    lifecycle::ActiveTransfers active;
    {
        auto a = active.track();
        EXPECT_EQ(active.count(), 1u);
        {
            auto b = active.track();
            EXPECT_EQ(active.count(), 2u);
        }
        EXPECT_EQ(active.count(), 1u);
    }
    EXPECT_EQ(active.count(), 0u);
}

TEST(ActiveTransfersTest, MovedGuardReleasesOnce) {
    lifecycle::ActiveTransfers active;
    {
        auto a = active.track();
        auto b = std::move(a);
        EXPECT_EQ(active.count(), 1u);
    }
    EXPECT_EQ(active.count(), 0u);
}

TEST(ActiveTransfersTest, GuardReleasesOnException) {
    lifecycle::ActiveTransfers active;
    try {
        auto guard = active.track();
        throw std::runtime_error("transfer failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(active.count(), 0u);
}

TEST(ActiveTransfersTest, WaitIdleReturnsImmediatelyWhenIdle) {
    lifecycle::ActiveTransfers active;
    EXPECT_TRUE(active.waitIdle(0ms));
}

TEST(ActiveTransfersTest, WaitIdleWaitsForRunningTransfer) {
    lifecycle::ActiveTransfers active;
    auto guard = std::make_unique<lifecycle::ActiveTransfers::Guard>(active.track());
    std::thread finisher([&] {
        std::this_thread::sleep_for(20ms);
        guard.reset();
    });
    EXPECT_TRUE(active.waitIdle(5s));
    finisher.join();
}

TEST(ActiveTransfersTest, WaitIdleTimesOut) {
    lifecycle::ActiveTransfers active;
    auto guard = active.track();
    EXPECT_FALSE(active.waitIdle(20ms));
}

// ── ShutdownCoordinator ──

TEST(ShutdownCoordinatorTest, LimitTriggersStopAndDrain) {
    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    bool stopped = false;

    std::thread transfer([life] {
        auto guard = life->active.track();
        life->limit.recordCompletion();
    });

    auto outcome = lifecycle::ShutdownCoordinator(life, 5s).runWith([&] { stopped = true; });
    transfer.join();

    EXPECT_TRUE(stopped);
    EXPECT_EQ(outcome.trigger, lifecycle::Trigger::LimitReached);
    EXPECT_TRUE(outcome.drained);
}

TEST(ShutdownCoordinatorTest, DrainTimeoutAbandonsStragglers) {
    auto life = std::make_shared<lifecycle::Lifecycle>(0);
    auto straggler = life->active.track();
    life->signal.raise(lifecycle::Trigger::Interrupt, "SIGTERM");

    auto outcome = lifecycle::ShutdownCoordinator(life, 20ms).runWith([] {});

    EXPECT_EQ(outcome.trigger, lifecycle::Trigger::Interrupt);
    EXPECT_EQ(outcome.detail, "SIGTERM");
    EXPECT_FALSE(outcome.drained);
}

TEST(ShutdownCoordinatorTest, WaitsForInFlightTransferAfterTrigger) {
    auto life = std::make_shared<lifecycle::Lifecycle>(0);
    auto guard = std::make_unique<lifecycle::ActiveTransfers::Guard>(life->active.track());

    std::thread finisher([&] {
        std::this_thread::sleep_for(30ms);
        guard.reset();
    });
    life->signal.raise(lifecycle::Trigger::ServerError, "boom");

    auto outcome = lifecycle::ShutdownCoordinator(life, 5s).runWith([] {});
    finisher.join();

    EXPECT_EQ(outcome.trigger, lifecycle::Trigger::ServerError);
    EXPECT_TRUE(outcome.drained);
    EXPECT_EQ(life->active.count(), 0u);
}

TEST(TriggerTest, DescribeNamesEveryTrigger) {
    EXPECT_EQ(lifecycle::describe(lifecycle::Trigger::Interrupt), "interrupt");
    EXPECT_EQ(lifecycle::describe(lifecycle::Trigger::ServerError), "server error");
    EXPECT_EQ(lifecycle::describe(lifecycle::Trigger::LimitReached), "download limit reached");
}
