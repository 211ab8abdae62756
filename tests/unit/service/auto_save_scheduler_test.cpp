/// @file auto_save_scheduler_test.cpp
/// @brief Unit tests for AutoSaveScheduler and AutoSaveConfig.

#include <gtest/gtest.h>

#include <chrono>

#include "csync/chess/board.hpp"
#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/game_metrics.hpp"
#include "csync/service/auto_save_scheduler.hpp"
#include "csync/service/memory_session_store.hpp"
#include "csync/service/persistence_gateway.hpp"
#include "csync/service/replication_channel.hpp"
#include "csync/service/session_coordinator.hpp"
#include "csync/service/session_metrics.hpp"

using namespace csync::service;
using namespace csync::foundation;
using namespace std::chrono_literals;

// ===========================================================================
// AutoSaveConfig
// ===========================================================================

TEST(AutoSaveConfigTest, DefaultsWhenKeysAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("session:\n  role: host\n").hasValue());

    auto result = AutoSaveConfig::fromConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().enabled);
    EXPECT_EQ(result.value().interval, 60s);
    EXPECT_EQ(result.value().moveInterval, 5);
}

TEST(AutoSaveConfigTest, ReadsAutosaveSection) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
autosave:
  enabled: true
  interval_seconds: 15
  move_interval: 8
)").hasValue());

    auto result = AutoSaveConfig::fromConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().enabled);
    EXPECT_EQ(result.value().interval, 15s);
    EXPECT_EQ(result.value().moveInterval, 8);
}

TEST(AutoSaveConfigTest, RejectsNonPositiveValues) {
    ConfigManager interval;
    ASSERT_TRUE(interval.loadFromString("autosave:\n  interval_seconds: 0\n").hasValue());
    auto badInterval = AutoSaveConfig::fromConfig(interval);
    ASSERT_TRUE(badInterval.hasError());
    EXPECT_EQ(badInterval.error().code(), ErrorCode::ConfigInvalidValue);

    ConfigManager moves;
    ASSERT_TRUE(moves.loadFromString("autosave:\n  move_interval: -2\n").hasValue());
    auto badMoves = AutoSaveConfig::fromConfig(moves);
    ASSERT_TRUE(badMoves.hasError());
    EXPECT_EQ(badMoves.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(AutoSaveConfigTest, RejectsWrongType) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("autosave:\n  enabled: sometimes\n").hasValue());
    auto result = AutoSaveConfig::fromConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ===========================================================================
// Scheduler fixture
// ===========================================================================

class AutoSaveSchedulerTest : public ::testing::Test {
protected:
    static AutoSaveConfig enabledConfig() {
        AutoSaveConfig config;
        config.enabled = true;
        config.interval = 60s;
        config.moveInterval = 5;
        return config;
    }

    csync::chess::Board board_ = csync::chess::Board::standard();
    MemorySessionStore store_;
    PersistenceGateway gateway_{store_};
    ReplicationChannel channel_;
    GameMetrics metrics_;
    SessionCoordinator coordinator_{SessionRole::Host, board_, gateway_, channel_};
    AutoSaveScheduler scheduler_{coordinator_, enabledConfig()};

    void SetUp() override {
        coordinator_.setMetrics(metrics_);
        ASSERT_TRUE(coordinator_.startSession().hasValue());
    }
};

// ===========================================================================
// Move-count trigger
// ===========================================================================

TEST_F(AutoSaveSchedulerTest, SavesOnEveryMoveMultiple) {
    for (int64_t i = 1; i <= 15; ++i) {
        ASSERT_TRUE(coordinator_.recordMove(i).hasValue());
    }

    EXPECT_EQ(scheduler_.triggeredCount(), 3u);
    EXPECT_EQ(store_.writeCount(), 3u);
    EXPECT_EQ(coordinator_.state().lastSavedMoveIndex, 15);
}

TEST_F(AutoSaveSchedulerTest, RepeatedIndexFiresOnce) {
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    EXPECT_EQ(scheduler_.triggeredCount(), 1u);
}

TEST_F(AutoSaveSchedulerTest, IndexAlreadySavedDoesNotFire) {
    scheduler_.setEnabled(false);
    ASSERT_TRUE(coordinator_.recordMove(10).hasValue());
    ASSERT_TRUE(coordinator_.save().hasValue());
    scheduler_.setEnabled(true);

    // Takeback to an index at or below the last save.
    ASSERT_TRUE(coordinator_.recordMove(10).hasValue());
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    EXPECT_EQ(scheduler_.triggeredCount(), 0u);
    EXPECT_EQ(store_.writeCount(), 1u);
}

TEST_F(AutoSaveSchedulerTest, TriggerWhileSavingIsDropped) {
    store_.setDeferred(true);
    for (int64_t i = 1; i <= 10; ++i) {
        ASSERT_TRUE(coordinator_.recordMove(i).hasValue());
    }

    EXPECT_EQ(scheduler_.triggeredCount(), 1u);
    EXPECT_EQ(scheduler_.droppedCount(), 1u);
    EXPECT_EQ(metrics_.counterValue(metrics::kAutoSaveDroppedTotal), 1u);

    store_.completePending();
    EXPECT_EQ(store_.writeCount(), 1u);
    EXPECT_EQ(coordinator_.state().lastSavedMoveIndex, 5);
}

TEST_F(AutoSaveSchedulerTest, UnavailableStoreDropsTrigger) {
    store_.setReady(false);
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    EXPECT_EQ(scheduler_.triggeredCount(), 0u);
    EXPECT_EQ(scheduler_.droppedCount(), 1u);
    // Counted on the coordinator's sink, not the process-wide one.
    EXPECT_EQ(metrics_.counterValue(metrics::kAutoSaveDroppedTotal), 1u);
}

// ===========================================================================
// Interval trigger
// ===========================================================================

TEST_F(AutoSaveSchedulerTest, IntervalFiresWhenElapsed) {
    scheduler_.update(30s);
    EXPECT_EQ(scheduler_.triggeredCount(), 0u);
    EXPECT_EQ(scheduler_.elapsed(), 30s);

    scheduler_.update(30s);
    EXPECT_EQ(scheduler_.triggeredCount(), 1u);
    EXPECT_EQ(scheduler_.elapsed(), 0s);
    EXPECT_EQ(store_.writeCount(), 1u);
}

TEST_F(AutoSaveSchedulerTest, MissedPeriodsCollapse) {
    scheduler_.update(150s);
    EXPECT_EQ(scheduler_.triggeredCount(), 1u);
    EXPECT_EQ(scheduler_.elapsed(), 30s);
}

TEST_F(AutoSaveSchedulerTest, DisabledSchedulerIsIdle) {
    scheduler_.update(40s);
    scheduler_.setEnabled(false);
    EXPECT_FALSE(scheduler_.isEnabled());
    EXPECT_EQ(scheduler_.elapsed(), 0s);

    scheduler_.update(120s);
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    EXPECT_EQ(scheduler_.triggeredCount(), 0u);
    EXPECT_EQ(store_.writeCount(), 0u);

    scheduler_.setEnabled(true);
    scheduler_.update(59s);
    EXPECT_EQ(scheduler_.triggeredCount(), 0u);
}

TEST_F(AutoSaveSchedulerTest, SessionEndCancelsTimer) {
    scheduler_.update(45s);
    ASSERT_TRUE(coordinator_.endSession().hasValue());
    EXPECT_EQ(scheduler_.elapsed(), 0s);

    scheduler_.update(120s);
    EXPECT_EQ(scheduler_.triggeredCount(), 0u);
    EXPECT_EQ(scheduler_.droppedCount(), 0u);
}

TEST_F(AutoSaveSchedulerTest, NewGameRearms) {
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    scheduler_.update(45s);
    ASSERT_TRUE(coordinator_.newGame().hasValue());
    EXPECT_EQ(scheduler_.elapsed(), 0s);

    // Index 5 fires again in the new game.
    ASSERT_TRUE(coordinator_.recordMove(5).hasValue());
    EXPECT_EQ(scheduler_.triggeredCount(), 2u);
}

// ===========================================================================
// Roles and construction
// ===========================================================================

TEST(AutoSaveSchedulerRoleTest, ClientNeverSaves) {
    auto board = csync::chess::Board::standard();
    MemorySessionStore store;
    PersistenceGateway gateway(store);
    ReplicationChannel channel;
    SessionCoordinator client(SessionRole::Client, board, gateway, channel);

    AutoSaveConfig config;
    config.enabled = true;
    config.interval = 1s;
    AutoSaveScheduler scheduler(client, config);

    scheduler.update(10s);
    EXPECT_EQ(scheduler.triggeredCount(), 0u);
    EXPECT_EQ(scheduler.droppedCount(), 0u);
    EXPECT_EQ(store.writeCount(), 0u);
}

TEST(AutoSaveSchedulerRoleTest, ConstructedMidSessionStartsTimer) {
    auto board = csync::chess::Board::standard();
    MemorySessionStore store;
    PersistenceGateway gateway(store);
    ReplicationChannel channel;
    SessionCoordinator host(SessionRole::Host, board, gateway, channel);
    ASSERT_TRUE(host.startSession().hasValue());

    AutoSaveConfig config;
    config.enabled = true;
    config.interval = 10s;
    AutoSaveScheduler scheduler(host, config);

    scheduler.update(10s);
    EXPECT_EQ(scheduler.triggeredCount(), 1u);
    EXPECT_EQ(store.writeCount(), 1u);
}
