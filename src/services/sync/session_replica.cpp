#include "csync/service/session_replica.hpp"

#include "csync/chess/snapshot_codec.hpp"
#include "csync/foundation/game_logger.hpp"

#include <type_traits>

namespace csync::service {

using foundation::GameResult;
using foundation::LogCategory;

GameResult<bool> SessionReplica::apply(const ReplicationEvent& event) {
    return std::visit(
        [this](const auto& e) -> GameResult<bool> {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, SessionIdAssigned>) {
                return GameResult<bool>::ok(applyId(e));
            } else if constexpr (std::is_same_v<T, SaveCompleted>) {
                return GameResult<bool>::ok(applySave(e));
            } else {
                return applyState(e);
            }
        },
        event);
}

GameResult<bool> SessionReplica::apply(const foundation::NetworkMessage& message) {
    auto event = fromMessage(message);
    if (!event) {
        CSYNC_LOG_WARN(LogCategory::Replication,
                       "dropped replication message: " + event.error().describe());
        return GameResult<bool>::err(event.error());
    }
    return apply(event.value());
}

bool SessionReplica::applyId(const SessionIdAssigned& event) {
    if (event.id == sessionId_) {
        return false;
    }
    sessionId_ = event.id;
    CSYNC_LOG_INFO(LogCategory::Replication, "replica joined session " + sessionId_.value());
    onSessionIdChanged.emit(sessionId_);
    return true;
}

bool SessionReplica::applySave(const SaveCompleted& event) {
    if (lastSavedId_ && *lastSavedId_ == event.id) {
        return false;
    }
    lastSavedId_ = event.id;
    onSaveNotified.emit(event.id);
    return true;
}

GameResult<bool> SessionReplica::applyState(const StateLoaded& event) {
    auto decoded = chess::SnapshotCodec::fromDocument(event.document);
    if (!decoded) {
        CSYNC_LOG_WARN(LogCategory::Replication,
                       "rejected snapshot: " + decoded.error().describe());
        return GameResult<bool>::err(decoded.error());
    }
    if (decoded.value() == snapshot_) {
        return GameResult<bool>::ok(false);
    }

    snapshot_ = std::move(decoded).value();
    if (board_ != nullptr) {
        board_->applySnapshot(snapshot_);
    }
    onSnapshotChanged.emit(snapshot_);
    return GameResult<bool>::ok(true);
}

}  // namespace csync::service
