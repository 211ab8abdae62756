#pragma once

/// @file session_coordinator.hpp
/// @brief Host-authoritative owner of the session id and session state.
///
/// The coordinator is the single writer of SessionState. It drives save and
/// load through the PersistenceGateway, applies loaded snapshots to the
/// board and announces every change through the ReplicationChannel.
///
/// Phases:
/// @code
///   Uninitialized --startSession--> Active --save--> Saving --done--> Active
///                                    Active --load--> Loading --done--> Active
///   any started phase --endSession--> Ended (terminal)
/// @endcode
///
/// Every method must be called on the session thread. Gateway completions
/// are expected there as well (stores post them through the
/// CompletionQueue).

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "csync/chess/board.hpp"
#include "csync/chess/chess_types.hpp"
#include "csync/foundation/game_logger.hpp"
#include "csync/foundation/game_metrics.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/foundation/types.hpp"
#include "csync/service/persistence_gateway.hpp"
#include "csync/service/replication_channel.hpp"

namespace csync::service {

enum class SessionPhase : uint8_t {
    Uninitialized,
    Active,
    Saving,
    Loading,
    Ended
};

constexpr std::string_view sessionPhaseName(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Uninitialized: return "Uninitialized";
        case SessionPhase::Active:        return "Active";
        case SessionPhase::Saving:        return "Saving";
        case SessionPhase::Loading:       return "Loading";
        case SessionPhase::Ended:         return "Ended";
    }
    return "Unknown";
}

/// Which side of the session this process is.
enum class SessionRole : uint8_t {
    Host,
    Client
};

constexpr std::string_view sessionRoleName(SessionRole role) {
    return role == SessionRole::Host ? "host" : "client";
}

/// Parse "host" / "client".
std::optional<SessionRole> parseSessionRole(std::string_view text);

/// The authoritative session state. Exactly one copy exists, in the host.
struct SessionState {
    foundation::SessionId currentSessionId;
    chess::Snapshot currentSnapshot;
    int64_t currentMoveIndex = 0;
    int64_t lastSavedMoveIndex = -1;  ///< -1 until the first save lands
};

using SessionIdGenerator = std::function<foundation::SessionId()>;

/// Eight random lowercase hex characters.
foundation::SessionId randomSessionId();

class SessionCoordinator {
public:
    /// Receives the session id the operation ran against, or the error.
    using SaveCallback = std::function<void(const foundation::GameResult<foundation::SessionId>&)>;
    using LoadCallback = std::function<void(const foundation::GameResult<foundation::SessionId>&)>;

    SessionCoordinator(SessionRole role, chess::IBoardModel& board,
                       PersistenceGateway& gateway, ReplicationChannel& channel,
                       SessionIdGenerator idGenerator = &randomSessionId);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /// Publish counters to @p metrics instead of GameMetrics::instance().
    void setMetrics(foundation::GameMetrics& metrics) { metrics_ = &metrics; }

    /// Sink this coordinator publishes counters to.
    [[nodiscard]] foundation::GameMetrics& metrics() const noexcept { return *metrics_; }

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Uninitialized -> Active with a fresh id; broadcasts SessionIdAssigned.
    foundation::GameResult<foundation::SessionId> startSession();

    /// Issue a new id and reset the move counters. Any save or load in
    /// flight is abandoned and its completion becomes stale.
    foundation::GameResult<foundation::SessionId> newGame();

    /// Terminal. In-flight completions become stale.
    foundation::GameResult<void> endSession();

    // ── Moves ───────────────────────────────────────────────────────────

    /// Capture the board after half-move @p halfMoveIndex and announce it
    /// through onMoveRecorded.
    foundation::GameResult<void> recordMove(int64_t halfMoveIndex);

    // ── Persistence ─────────────────────────────────────────────────────

    /// Start a save of the current board. The returned result covers the
    /// request only; the outcome arrives through @p callback and the
    /// onSaved / onOperationFailed signals.
    foundation::GameResult<void> save(SaveCallback callback = {});

    /// Start a load of @p id. On success the loaded snapshot replaces the
    /// current one, the board is updated and the id is adopted.
    foundation::GameResult<void> load(const foundation::SessionId& id,
                                      LoadCallback callback = {});

    // ── Replication ─────────────────────────────────────────────────────

    /// Send the current id and snapshot to one (re)connected peer.
    foundation::GameResult<void> catchUpPeer(foundation::PeerId peer);

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const SessionState& state() const noexcept { return state_; }
    [[nodiscard]] SessionPhase phase() const noexcept { return phase_; }
    [[nodiscard]] const foundation::SessionId& currentSessionId() const noexcept {
        return state_.currentSessionId;
    }
    [[nodiscard]] bool isHost() const noexcept { return role_ == SessionRole::Host; }
    [[nodiscard]] SessionRole role() const noexcept { return role_; }
    [[nodiscard]] bool isReady() const { return gateway_.isReady(); }

    // ── Signals ─────────────────────────────────────────────────────────

    foundation::Signal<SessionPhase, SessionPhase> onStateChanged;
    foundation::Signal<const foundation::SessionId&, int64_t> onSaved;
    foundation::Signal<const foundation::SessionId&> onLoaded;
    foundation::Signal<const foundation::GameError&> onOperationFailed;
    foundation::Signal<int64_t> onMoveRecorded;
    /// Fired by startSession() and newGame().
    foundation::Signal<const foundation::SessionId&> onSessionStarted;
    foundation::Signal<const foundation::SessionId&> onSessionEnded;

private:
    struct Pending {
        uint64_t serial = 0;
        foundation::SessionId sessionId;
    };

    foundation::GameResult<void> requireHost(std::string_view operation) const;
    foundation::GameResult<void> requireIdle(std::string_view operation) const;
    foundation::GameResult<void> requireStarted(std::string_view operation) const;

    void transition(SessionPhase to);
    Pending beginOperation(SessionPhase phase);
    [[nodiscard]] bool isStale(const Pending& pending) const;
    void announceId();
    foundation::LogContext logContext() const;

    void finishSave(const Pending& pending, int64_t capturedMoveIndex,
                    const foundation::GameResult<void>& result,
                    const SaveCallback& callback);
    void finishLoad(const Pending& pending, const foundation::SessionId& requested,
                    const foundation::GameResult<LoadOutcome>& result,
                    const LoadCallback& callback);
    void failOperation(const foundation::GameError& error, const char* failureMetric);

    SessionRole role_;
    chess::IBoardModel& board_;
    PersistenceGateway& gateway_;
    ReplicationChannel& channel_;
    SessionIdGenerator idGenerator_;
    foundation::GameMetrics* metrics_;

    SessionState state_;
    SessionPhase phase_ = SessionPhase::Uninitialized;
    uint64_t nextSerial_ = 1;
    std::optional<uint64_t> activeSerial_;

    // Completions hold a weak reference; an expired one means the
    // coordinator is gone.
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

}  // namespace csync::service
