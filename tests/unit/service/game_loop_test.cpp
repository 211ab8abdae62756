/// @file game_loop_test.cpp
/// @brief Unit tests for GameLoop, alone and as the session thread that
///        drains a CompletionQueue.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "csync/foundation/completion_queue.hpp"
#include "csync/service/game_loop.hpp"

using namespace csync::service;
using namespace std::chrono_literals;

// ============================================================================
// GameLoop Tests
// ============================================================================

class GameLoopTest : public ::testing::Test {
protected:
    GameLoop loop_{20}; // 20 Hz
};

TEST_F(GameLoopTest, DefaultTickRate) {
    EXPECT_EQ(loop_.tickRate(), 20u);
}

TEST_F(GameLoopTest, TargetFrameTimeForTwentyHz) {
    EXPECT_EQ(loop_.targetFrameTime(), 50000us);
}

TEST_F(GameLoopTest, CustomTickRate) {
    GameLoop custom(60);
    EXPECT_EQ(custom.tickRate(), 60u);
    // 1'000'000 / 60 = 16666 us
    EXPECT_EQ(custom.targetFrameTime().count(), 16666);
}

TEST_F(GameLoopTest, ZeroTickRateDefaultsToTwenty) {
    GameLoop zeroRate(0);
    EXPECT_EQ(zeroRate.tickRate(), 20u);
}

TEST_F(GameLoopTest, NotRunningByDefault) {
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_EQ(loop_.tickCount(), 0u);
}

TEST_F(GameLoopTest, ManualTickIncreasesCount) {
    (void)loop_.tick();
    (void)loop_.tick();
    EXPECT_EQ(loop_.tickCount(), 2u);
}

TEST_F(GameLoopTest, ManualTickPassesTargetDelta) {
    std::vector<std::chrono::milliseconds> deltas;
    loop_.setTickCallback([&](std::chrono::milliseconds delta) { deltas.push_back(delta); });

    auto metrics = loop_.tick();

    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0], 50ms);
    EXPECT_EQ(metrics.tickNumber, 0u);
    EXPECT_EQ(metrics.frameTime, 50000us);
}

TEST_F(GameLoopTest, MetricsCallbackNotCalledOnManualTick) {
    int metricsCount = 0;
    loop_.setMetricsCallback([&](const TickMetrics&) { ++metricsCount; });

    (void)loop_.tick();
    EXPECT_EQ(metricsCount, 0);
}

TEST_F(GameLoopTest, StartAndStopLifecycle) {
    EXPECT_TRUE(loop_.start());
    EXPECT_TRUE(loop_.isRunning());
    EXPECT_FALSE(loop_.start()); // Already running.

    std::this_thread::sleep_for(120ms);

    loop_.stop();
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_GT(loop_.tickCount(), 0u);
}

TEST_F(GameLoopTest, StopWhenNotRunningIsSafe) {
    loop_.stop();
    EXPECT_FALSE(loop_.isRunning());
}

TEST_F(GameLoopTest, ThreadedCallbacks) {
    std::atomic<int> ticks{0};
    std::atomic<int> metricsCount{0};
    loop_.setTickCallback([&](std::chrono::milliseconds) { ticks.fetch_add(1); });
    loop_.setMetricsCallback([&](const TickMetrics&) { metricsCount.fetch_add(1); });

    EXPECT_TRUE(loop_.start());
    std::this_thread::sleep_for(250ms);
    loop_.stop();

    // At 20Hz, ~250ms should yield at least 2 ticks (generous for CI).
    EXPECT_GE(ticks.load(), 2);
    EXPECT_GE(metricsCount.load(), 2);
    EXPECT_GT(loop_.lastMetrics().tickNumber, 0u);
}

TEST_F(GameLoopTest, OverrunDetection) {
    loop_.setTickCallback([](std::chrono::milliseconds) { std::this_thread::sleep_for(60ms); });

    auto metrics = loop_.tick();
    EXPECT_TRUE(metrics.overrun);
    EXPECT_GT(metrics.budgetUtilization, 1.0f);
}

TEST_F(GameLoopTest, NormalTickIsNotOverrun) {
    loop_.setTickCallback([](std::chrono::milliseconds) {});

    auto metrics = loop_.tick();
    EXPECT_FALSE(metrics.overrun);
    EXPECT_LT(metrics.budgetUtilization, 1.0f);
}

TEST_F(GameLoopTest, DestructorStopsRunningLoop) {
    auto loop = std::make_unique<GameLoop>(20);
    loop->setTickCallback([](std::chrono::milliseconds) {});
    EXPECT_TRUE(loop->start());
    loop.reset();
}

// ============================================================================
// Session thread
// ============================================================================

TEST(SessionThreadTest, LoopDrainsPostedCompletions) {
    csync::foundation::CompletionQueue completions;
    GameLoop loop(50);
    std::atomic<std::thread::id> ranOn{};
    std::atomic<int> ran{0};

    loop.setTickCallback([&](std::chrono::milliseconds) { completions.drain(); });
    ASSERT_TRUE(loop.start());

    std::thread producer([&] {
        for (int i = 0; i < 10; ++i) {
            EXPECT_TRUE(completions.post([&] {
                ranOn = std::this_thread::get_id();
                ran.fetch_add(1);
            }));
        }
    });
    producer.join();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (ran.load() < 10 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    loop.stop();

    EXPECT_EQ(ran.load(), 10);
    EXPECT_NE(ranOn.load(), std::this_thread::get_id());
}

TEST(SessionThreadTest, ClosedQueueRejectsPosts) {
    csync::foundation::CompletionQueue completions;
    int ran = 0;
    EXPECT_TRUE(completions.post([&] { ++ran; }));
    completions.close();
    EXPECT_FALSE(completions.post([&] { ++ran; }));

    // Tasks queued before close still run.
    EXPECT_EQ(completions.drain(), 1u);
    EXPECT_EQ(ran, 1);
}
