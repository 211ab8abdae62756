#include <gtest/gtest.h>

#include "csync/chess/board.hpp"
#include "csync/chess/snapshot_codec.hpp"
#include "csync/foundation/error_code.hpp"
#include "csync/foundation/game_metrics.hpp"
#include "csync/foundation/game_network_manager.hpp"
#include "csync/service/auto_save_scheduler.hpp"
#include "csync/service/memory_session_store.hpp"
#include "csync/service/persistence_gateway.hpp"
#include "csync/service/replication_channel.hpp"
#include "csync/service/session_coordinator.hpp"
#include "csync/service/session_replica.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

using namespace csync::service;
using csync::chess::Board;
using csync::chess::SnapshotCodec;
using csync::chess::Square;
using csync::foundation::ErrorCode;
using csync::foundation::FrameAssembler;
using csync::foundation::GameMetrics;
using csync::foundation::GameResult;
using csync::foundation::NetworkMessage;
using csync::foundation::PeerId;
using csync::foundation::SessionId;

namespace {

/// One peer at the end of a byte stream. Frames are delivered in small
/// chunks the way TCP may split them.
struct WirePeer {
    Board board;
    SessionReplica replica{&board};
    FrameAssembler assembler;
    std::size_t frames = 0;

    void receive(const std::vector<uint8_t>& bytes) {
        constexpr std::size_t kChunk = 3;
        for (std::size_t offset = 0; offset < bytes.size(); offset += kChunk) {
            auto count = std::min(kChunk, bytes.size() - offset);
            auto messages = assembler.feed(bytes.data() + offset, count);
            ASSERT_TRUE(messages.hasValue());
            for (const auto& message : messages.value()) {
                ++frames;
                ASSERT_TRUE(replica.apply(message).hasValue());
            }
        }
    }
};

/// In-process transport: serializes every message and streams it to the
/// attached peers.
class WireTransport final : public IReplicationTransport {
public:
    WirePeer& attach(PeerId id) {
        auto& slot = peers_[id];
        slot = std::make_unique<WirePeer>();
        return *slot;
    }

    GameResult<void> broadcast(const NetworkMessage& message) override {
        ++broadcasts;
        auto bytes = message.serialize();
        for (auto& [id, peer] : peers_) {
            peer->receive(bytes);
        }
        return GameResult<void>::ok();
    }

    GameResult<void> sendTo(PeerId peer, const NetworkMessage& message) override {
        auto it = peers_.find(peer);
        if (it == peers_.end()) {
            return GameResult<void>::err(csync::foundation::GameError(
                ErrorCode::PeerNotFound, "no peer " + std::to_string(peer.value())));
        }
        it->second->receive(message.serialize());
        return GameResult<void>::ok();
    }

    std::size_t broadcasts = 0;

private:
    std::map<PeerId, std::unique_ptr<WirePeer>> peers_;
};

Square sq(std::string_view text) {
    return *Square::fromAlgebraic(text);
}

}  // namespace

// =============================================================================
// Integration fixture: host coordinator replicating to wire peers
// =============================================================================

class SessionSyncIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator_ = std::make_unique<SessionCoordinator>(
            SessionRole::Host, board_, gateway_, channel_,
            [] { return SessionId("a1b2c3d4"); });
        coordinator_->setMetrics(metrics_);

        AutoSaveConfig autoSave;
        autoSave.enabled = true;
        autoSave.interval = std::chrono::seconds(60);
        autoSave.moveInterval = 5;
        scheduler_ = std::make_unique<AutoSaveScheduler>(*coordinator_, autoSave);
    }

    /// Play one half-move on the host board and record it.
    void play(std::string_view from, std::string_view to, int64_t index) {
        ASSERT_TRUE(board_.move(sq(from), sq(to)).hasValue());
        ASSERT_TRUE(coordinator_->recordMove(index).hasValue());
    }

    Board board_ = Board::standard();
    MemorySessionStore store_;
    PersistenceGateway gateway_{store_};
    WireTransport transport_;
    ReplicationChannel channel_{&transport_};
    GameMetrics metrics_;
    WirePeer& peer_ = transport_.attach(PeerId(1));

    std::unique_ptr<SessionCoordinator> coordinator_;
    std::unique_ptr<AutoSaveScheduler> scheduler_;
};

// =============================================================================
// Auto-save after move five
// =============================================================================

TEST_F(SessionSyncIntegrationTest, AutoSaveAfterFifthMove) {
    ASSERT_TRUE(coordinator_->startSession().hasValue());
    EXPECT_EQ(peer_.replica.sessionId(), SessionId("a1b2c3d4"));

    play("e2", "e4", 1);
    play("e7", "e5", 2);
    play("g1", "f3", 3);
    play("b8", "c6", 4);
    EXPECT_EQ(store_.writeCount(), 0u);

    play("f1", "b5", 5);

    auto record = store_.find(SessionId("a1b2c3d4"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->payload, SnapshotCodec::toDocument(SnapshotCodec::encode(board_)));
    EXPECT_GT(record->timestampUs, 0);
    EXPECT_EQ(coordinator_->state().lastSavedMoveIndex, 5);
    EXPECT_EQ(scheduler_->triggeredCount(), 1u);

    // The peer heard about the save but its board did not move.
    ASSERT_TRUE(peer_.replica.lastSavedId().has_value());
    EXPECT_EQ(*peer_.replica.lastSavedId(), SessionId("a1b2c3d4"));
    EXPECT_EQ(peer_.board.pieceCount(), 32u);
    EXPECT_EQ(peer_.assembler.pendingBytes(), 0u);
}

// =============================================================================
// Client authority
// =============================================================================

TEST_F(SessionSyncIntegrationTest, ClientLoadIsRejectedWithoutTraffic) {
    Board clientBoard = Board::standard();
    SessionCoordinator client(SessionRole::Client, clientBoard, gateway_, channel_);

    auto result = client.load(SessionId("a1b2c3d4"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotAuthorized);
    EXPECT_EQ(transport_.broadcasts, 0u);
    EXPECT_EQ(peer_.frames, 0u);
    EXPECT_EQ(store_.readCount(), 0u);
}

// =============================================================================
// Load of a missing session
// =============================================================================

TEST_F(SessionSyncIntegrationTest, MissingLoadKeepsHostAndPeer) {
    ASSERT_TRUE(coordinator_->startSession().hasValue());
    play("d2", "d4", 1);
    const auto hostSnapshot = coordinator_->state().currentSnapshot;
    const auto framesBefore = peer_.frames;

    GameResult<SessionId> outcome = GameResult<SessionId>::ok(SessionId());
    ASSERT_TRUE(coordinator_->load(SessionId("missing"), [&](const GameResult<SessionId>& r) {
                                outcome = r;
                            }).hasValue());

    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::PersistenceFailure);
    EXPECT_EQ(coordinator_->phase(), SessionPhase::Active);
    EXPECT_EQ(coordinator_->state().currentSnapshot, hostSnapshot);
    EXPECT_EQ(peer_.frames, framesBefore);
    EXPECT_EQ(peer_.replica.sessionId(), SessionId("a1b2c3d4"));
}

// =============================================================================
// Overlapping saves
// =============================================================================

TEST_F(SessionSyncIntegrationTest, RapidSavesWriteOnce) {
    ASSERT_TRUE(coordinator_->startSession().hasValue());
    store_.setDeferred(true);

    ASSERT_TRUE(coordinator_->save().hasValue());
    auto second = coordinator_->save();
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::OperationInProgress);

    store_.completePending();
    EXPECT_EQ(store_.writeCount(), 1u);
    EXPECT_EQ(store_.recordCount(), 1u);
    EXPECT_EQ(coordinator_->phase(), SessionPhase::Active);
    EXPECT_TRUE(peer_.replica.lastSavedId().has_value());
}

// =============================================================================
// Load replicates the saved board
// =============================================================================

TEST_F(SessionSyncIntegrationTest, LoadReplicatesSavedBoard) {
    Board saved;
    ASSERT_TRUE(saved.place(sq("a1"), csync::chess::PieceKind::Rook,
                            csync::chess::Owner::White).hasValue());
    ASSERT_TRUE(saved.place(sq("e1"), csync::chess::PieceKind::King,
                            csync::chess::Owner::White).hasValue());
    ASSERT_TRUE(saved.place(sq("e8"), csync::chess::PieceKind::King,
                            csync::chess::Owner::Black).hasValue());
    store_.put(SaveRecord{SessionId("0badcafe"),
                          SnapshotCodec::toDocument(SnapshotCodec::encode(saved)), 42});

    ASSERT_TRUE(coordinator_->startSession().hasValue());
    ASSERT_TRUE(coordinator_->load(SessionId("0badcafe")).hasValue());

    EXPECT_EQ(board_.pieceCount(), 3u);
    EXPECT_EQ(peer_.replica.sessionId(), SessionId("0badcafe"));
    EXPECT_EQ(peer_.replica.snapshot(), SnapshotCodec::encode(saved));
    EXPECT_EQ(SnapshotCodec::encode(peer_.board), SnapshotCodec::encode(board_));
}

// =============================================================================
// Late joiner
// =============================================================================

TEST_F(SessionSyncIntegrationTest, LateJoinerIsCaughtUp) {
    ASSERT_TRUE(coordinator_->startSession().hasValue());
    play("e2", "e4", 1);
    play("c7", "c5", 2);

    auto& late = transport_.attach(PeerId(2));
    ASSERT_TRUE(coordinator_->catchUpPeer(PeerId(2)).hasValue());

    EXPECT_EQ(late.frames, 2u);
    EXPECT_EQ(late.replica.sessionId(), SessionId("a1b2c3d4"));
    EXPECT_EQ(SnapshotCodec::encode(late.board), SnapshotCodec::encode(board_));

    // Catching up again changes nothing.
    ASSERT_TRUE(coordinator_->catchUpPeer(PeerId(2)).hasValue());
    EXPECT_EQ(late.frames, 4u);
    EXPECT_EQ(SnapshotCodec::encode(late.board), SnapshotCodec::encode(board_));

    auto unknown = coordinator_->catchUpPeer(PeerId(3));
    ASSERT_TRUE(unknown.hasError());
}
