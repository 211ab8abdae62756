/// @file session_coordinator.cpp
/// @brief SessionCoordinator implementation.

#include "csync/service/session_coordinator.hpp"

#include "csync/chess/snapshot_codec.hpp"
#include "csync/service/session_metrics.hpp"

#include <algorithm>
#include <random>

namespace csync::service {

using chess::SnapshotCodec;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PeerId;
using foundation::SessionId;

namespace {

GameResult<void> reject(ErrorCode code, std::string message) {
    return GameResult<void>::err(GameError(code, std::move(message)));
}

GameError staleError(std::string_view operation) {
    return GameError(ErrorCode::StaleCompletion,
                     std::string(operation) + " completed after it was superseded");
}

}  // namespace

std::optional<SessionRole> parseSessionRole(std::string_view text) {
    if (text == "host") {
        return SessionRole::Host;
    }
    if (text == "client") {
        return SessionRole::Client;
    }
    return std::nullopt;
}

SessionId randomSessionId() {
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string id(SessionId::kLength, '0');
    for (auto& c : id) {
        c = kHex[digit(engine)];
    }
    return SessionId(std::move(id));
}

SessionCoordinator::SessionCoordinator(SessionRole role, chess::IBoardModel& board,
                                       PersistenceGateway& gateway,
                                       ReplicationChannel& channel,
                                       SessionIdGenerator idGenerator)
    : role_(role),
      board_(board),
      gateway_(gateway),
      channel_(channel),
      idGenerator_(idGenerator ? std::move(idGenerator) : SessionIdGenerator(&randomSessionId)),
      metrics_(&foundation::GameMetrics::instance()) {}

SessionCoordinator::~SessionCoordinator() = default;

// ---------------------------------------------------------------------------
// Guards
// ---------------------------------------------------------------------------

GameResult<void> SessionCoordinator::requireHost(std::string_view operation) const {
    if (isHost()) {
        return GameResult<void>::ok();
    }
    CSYNC_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                  std::string(operation) + " rejected: not the host", logContext());
    return reject(ErrorCode::NotAuthorized,
                  std::string(operation) + " is reserved to the host");
}

GameResult<void> SessionCoordinator::requireStarted(std::string_view operation) const {
    switch (phase_) {
        case SessionPhase::Uninitialized:
            return reject(ErrorCode::SessionNotActive,
                          std::string(operation) + " before the session started");
        case SessionPhase::Ended:
            return reject(ErrorCode::SessionEnded,
                          std::string(operation) + " after the session ended");
        default:
            return GameResult<void>::ok();
    }
}

GameResult<void> SessionCoordinator::requireIdle(std::string_view operation) const {
    auto started = requireStarted(operation);
    if (!started) {
        return started;
    }
    if (phase_ == SessionPhase::Saving || phase_ == SessionPhase::Loading) {
        return reject(ErrorCode::OperationInProgress,
                      std::string(operation) + " while " +
                          std::string(sessionPhaseName(phase_)));
    }
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

LogContext SessionCoordinator::logContext() const {
    LogContext ctx;
    if (state_.currentSessionId.isValid()) {
        ctx.sessionId = state_.currentSessionId;
    }
    ctx.moveIndex = state_.currentMoveIndex;
    return ctx;
}

void SessionCoordinator::transition(SessionPhase to) {
    if (phase_ == to) {
        return;
    }
    auto from = phase_;
    phase_ = to;
    CSYNC_LOG_CTX(LogLevel::Info, LogCategory::Session,
                  std::string(sessionPhaseName(from)) + " -> " +
                      std::string(sessionPhaseName(to)),
                  logContext());
    onStateChanged.emit(from, to);
}

SessionCoordinator::Pending SessionCoordinator::beginOperation(SessionPhase phase) {
    Pending pending{nextSerial_++, state_.currentSessionId};
    // Set before the gateway call: stores may complete synchronously.
    activeSerial_ = pending.serial;
    transition(phase);
    return pending;
}

bool SessionCoordinator::isStale(const Pending& pending) const {
    return !activeSerial_ || *activeSerial_ != pending.serial ||
           phase_ == SessionPhase::Ended ||
           state_.currentSessionId != pending.sessionId;
}

void SessionCoordinator::announceId() {
    auto sent = channel_.broadcast(SessionIdAssigned{state_.currentSessionId});
    if (!sent) {
        CSYNC_LOG_WARN(LogCategory::Session,
                       "session id announcement incomplete: " + sent.error().describe());
    }
}

void SessionCoordinator::failOperation(const GameError& error, const char* failureMetric) {
    activeSerial_.reset();
    transition(SessionPhase::Active);
    metrics_->incrementCounter(failureMetric);
    CSYNC_LOG_CTX(LogLevel::Error, LogCategory::Session, error.describe(), logContext());
    onOperationFailed.emit(error);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

GameResult<SessionId> SessionCoordinator::startSession() {
    if (auto ok = requireHost("startSession"); !ok) {
        return GameResult<SessionId>::err(ok.error());
    }
    if (phase_ == SessionPhase::Ended) {
        return GameResult<SessionId>::err(
            GameError(ErrorCode::SessionEnded, "startSession after the session ended"));
    }
    if (phase_ != SessionPhase::Uninitialized) {
        return GameResult<SessionId>::err(
            GameError(ErrorCode::SessionAlreadyStarted,
                      "session " + state_.currentSessionId.value() + " already started"));
    }

    state_.currentSessionId = idGenerator_();
    state_.currentSnapshot = SnapshotCodec::encode(board_);
    transition(SessionPhase::Active);
    announceId();
    onSessionStarted.emit(state_.currentSessionId);
    return GameResult<SessionId>::ok(state_.currentSessionId);
}

GameResult<SessionId> SessionCoordinator::newGame() {
    if (auto ok = requireHost("newGame"); !ok) {
        return GameResult<SessionId>::err(ok.error());
    }
    if (auto ok = requireStarted("newGame"); !ok) {
        return GameResult<SessionId>::err(ok.error());
    }

    if (activeSerial_) {
        CSYNC_LOG_CTX(LogLevel::Info, LogCategory::Session,
                      "new game abandons the pending " +
                          std::string(sessionPhaseName(phase_)),
                      logContext());
    }
    activeSerial_.reset();

    state_.currentSessionId = idGenerator_();
    state_.currentSnapshot = SnapshotCodec::encode(board_);
    state_.currentMoveIndex = 0;
    state_.lastSavedMoveIndex = -1;
    transition(SessionPhase::Active);
    CSYNC_LOG_CTX(LogLevel::Info, LogCategory::Session, "new game", logContext());
    announceId();
    onSessionStarted.emit(state_.currentSessionId);
    return GameResult<SessionId>::ok(state_.currentSessionId);
}

GameResult<void> SessionCoordinator::endSession() {
    if (auto ok = requireHost("endSession"); !ok) {
        return ok;
    }
    if (phase_ == SessionPhase::Ended) {
        return reject(ErrorCode::SessionEnded, "session already ended");
    }

    activeSerial_.reset();
    transition(SessionPhase::Ended);
    onSessionEnded.emit(state_.currentSessionId);
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// recordMove()
// ---------------------------------------------------------------------------

GameResult<void> SessionCoordinator::recordMove(int64_t halfMoveIndex) {
    if (auto ok = requireHost("recordMove"); !ok) {
        return ok;
    }
    if (halfMoveIndex < 0) {
        return reject(ErrorCode::InvalidArgument,
                      "negative half-move index " + std::to_string(halfMoveIndex));
    }
    if (auto ok = requireStarted("recordMove"); !ok) {
        return ok;
    }

    state_.currentSnapshot = SnapshotCodec::encode(board_);
    state_.currentMoveIndex = halfMoveIndex;
    onMoveRecorded.emit(halfMoveIndex);
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// save()
// ---------------------------------------------------------------------------

GameResult<void> SessionCoordinator::save(SaveCallback callback) {
    if (auto ok = requireHost("save"); !ok) {
        return ok;
    }
    if (auto ok = requireIdle("save"); !ok) {
        return ok;
    }
    if (!gateway_.isReady()) {
        return reject(ErrorCode::PersistenceUnavailable, "session store not ready");
    }

    auto document = SnapshotCodec::toDocument(SnapshotCodec::encode(board_));
    const auto capturedMoveIndex = state_.currentMoveIndex;
    auto pending = beginOperation(SessionPhase::Saving);

    std::weak_ptr<int> alive = lifetime_;
    gateway_.save(pending.sessionId, std::move(document),
                  [this, alive, pending, capturedMoveIndex,
                   callback = std::move(callback)](GameResult<void> result) {
                      if (alive.expired()) {
                          if (callback) {
                              callback(GameResult<SessionId>::err(staleError("save")));
                          }
                          return;
                      }
                      finishSave(pending, capturedMoveIndex, result, callback);
                  });
    return GameResult<void>::ok();
}

void SessionCoordinator::finishSave(const Pending& pending, int64_t capturedMoveIndex,
                                    const GameResult<void>& result,
                                    const SaveCallback& callback) {
    if (isStale(pending)) {
        CSYNC_LOG_DEBUG(LogCategory::Session,
                        "stale save of " + pending.sessionId.value() + " discarded");
        if (callback) {
            callback(GameResult<SessionId>::err(staleError("save")));
        }
        return;
    }

    if (!result) {
        failOperation(result.error(), metrics::kSaveFailuresTotal);
        if (callback) {
            callback(GameResult<SessionId>::err(result.error()));
        }
        return;
    }

    activeSerial_.reset();
    state_.lastSavedMoveIndex = std::max(state_.lastSavedMoveIndex, capturedMoveIndex);
    transition(SessionPhase::Active);
    metrics_->incrementCounter(metrics::kSavesTotal);
    CSYNC_LOG_CTX(LogLevel::Info, LogCategory::Session,
                  "saved at half-move " + std::to_string(capturedMoveIndex), logContext());

    auto sent = channel_.broadcast(SaveCompleted{pending.sessionId});
    if (!sent) {
        CSYNC_LOG_WARN(LogCategory::Session,
                       "save notice incomplete: " + sent.error().describe());
    }
    onSaved.emit(pending.sessionId, state_.lastSavedMoveIndex);
    if (callback) {
        callback(GameResult<SessionId>::ok(pending.sessionId));
    }
}

// ---------------------------------------------------------------------------
// load()
// ---------------------------------------------------------------------------

GameResult<void> SessionCoordinator::load(const SessionId& id, LoadCallback callback) {
    if (auto ok = requireHost("load"); !ok) {
        return ok;
    }
    if (!id.isValid()) {
        return reject(ErrorCode::InvalidArgument, "load needs a session id");
    }
    if (auto ok = requireIdle("load"); !ok) {
        return ok;
    }
    if (!gateway_.isReady()) {
        return reject(ErrorCode::PersistenceUnavailable, "session store not ready");
    }

    auto pending = beginOperation(SessionPhase::Loading);

    std::weak_ptr<int> alive = lifetime_;
    gateway_.load(id, [this, alive, pending, id,
                       callback = std::move(callback)](GameResult<LoadOutcome> result) {
        if (alive.expired()) {
            if (callback) {
                callback(GameResult<SessionId>::err(staleError("load")));
            }
            return;
        }
        finishLoad(pending, id, result, callback);
    });
    return GameResult<void>::ok();
}

void SessionCoordinator::finishLoad(const Pending& pending, const SessionId& requested,
                                    const GameResult<LoadOutcome>& result,
                                    const LoadCallback& callback) {
    if (isStale(pending)) {
        CSYNC_LOG_DEBUG(LogCategory::Session,
                        "stale load of " + requested.value() + " discarded");
        if (callback) {
            callback(GameResult<SessionId>::err(staleError("load")));
        }
        return;
    }

    auto fail = [&](const GameError& error) {
        failOperation(error, metrics::kLoadFailuresTotal);
        if (callback) {
            callback(GameResult<SessionId>::err(error));
        }
    };

    if (!result) {
        fail(result.error());
        return;
    }
    if (!result.value().found) {
        fail(GameError(ErrorCode::PersistenceFailure,
                       "no saved session " + requested.value()));
        return;
    }

    auto decoded = SnapshotCodec::fromDocument(result.value().payload);
    if (!decoded) {
        fail(decoded.error());
        return;
    }

    const bool idChanged = state_.currentSessionId != requested;
    activeSerial_.reset();
    state_.currentSessionId = requested;
    state_.currentSnapshot = std::move(decoded).value();
    board_.applySnapshot(state_.currentSnapshot);
    transition(SessionPhase::Active);
    metrics_->incrementCounter(metrics::kLoadsTotal);
    CSYNC_LOG_CTX(LogLevel::Info, LogCategory::Session,
                  "loaded " + std::to_string(state_.currentSnapshot.size()) + " pieces",
                  logContext());

    if (idChanged) {
        announceId();
    }
    auto sent = channel_.broadcast(
        StateLoaded{SnapshotCodec::toDocument(state_.currentSnapshot)});
    if (!sent) {
        CSYNC_LOG_WARN(LogCategory::Session,
                       "loaded state announcement incomplete: " + sent.error().describe());
    }
    onLoaded.emit(requested);
    if (callback) {
        callback(GameResult<SessionId>::ok(requested));
    }
}

// ---------------------------------------------------------------------------
// catchUpPeer()
// ---------------------------------------------------------------------------

GameResult<void> SessionCoordinator::catchUpPeer(PeerId peer) {
    if (auto ok = requireHost("catchUpPeer"); !ok) {
        return ok;
    }
    if (auto ok = requireStarted("catchUpPeer"); !ok) {
        return ok;
    }

    auto sent = channel_.sendTo(peer, SessionIdAssigned{state_.currentSessionId});
    if (!sent) {
        return sent;
    }
    return channel_.sendTo(peer, StateLoaded{SnapshotCodec::toDocument(state_.currentSnapshot)});
}

}  // namespace csync::service
