#pragma once

/// @file session_replica.hpp
/// @brief Read-only projection of the host's session held by a peer.

#include <optional>

#include "csync/chess/board.hpp"
#include "csync/chess/chess_types.hpp"
#include "csync/foundation/game_network_manager.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/foundation/types.hpp"
#include "csync/service/replication_events.hpp"

namespace csync::service {

/// Peer-side mirror of the host's session.
///
/// Changes only by applying replication events. Every apply is idempotent:
/// an id already held, a save notice already seen or a snapshot equal to
/// the current one is a no-op and apply() returns false. A StateLoaded is
/// decoded before anything changes; a malformed document is rejected with
/// MalformedSnapshot and the replica (and board) stay as they were.
///
/// When a board is attached, every snapshot change is applied to it once.
class SessionReplica {
public:
    explicit SessionReplica(chess::IBoardModel* board = nullptr) : board_(board) {}

    /// Apply one event. Returns true when the replica changed.
    foundation::GameResult<bool> apply(const ReplicationEvent& event);

    /// Decode and apply one message.
    foundation::GameResult<bool> apply(const foundation::NetworkMessage& message);

    [[nodiscard]] const foundation::SessionId& sessionId() const noexcept { return sessionId_; }
    [[nodiscard]] const chess::Snapshot& snapshot() const noexcept { return snapshot_; }
    [[nodiscard]] const std::optional<foundation::SessionId>& lastSavedId() const noexcept {
        return lastSavedId_;
    }

    foundation::Signal<const foundation::SessionId&> onSessionIdChanged;
    foundation::Signal<const chess::Snapshot&> onSnapshotChanged;
    foundation::Signal<const foundation::SessionId&> onSaveNotified;

private:
    bool applyId(const SessionIdAssigned& event);
    bool applySave(const SaveCompleted& event);
    foundation::GameResult<bool> applyState(const StateLoaded& event);

    chess::IBoardModel* board_;
    foundation::SessionId sessionId_;
    chess::Snapshot snapshot_;
    std::optional<foundation::SessionId> lastSavedId_;
};

}  // namespace csync::service
