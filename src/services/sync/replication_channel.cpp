/// @file replication_channel.cpp
/// @brief ReplicationChannel and NetworkReplicationTransport.

#include "csync/service/replication_channel.hpp"

#include "csync/foundation/game_logger.hpp"

namespace csync::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::NetworkMessage;
using foundation::PeerId;

// ---------------------------------------------------------------------------
// NetworkReplicationTransport
// ---------------------------------------------------------------------------

GameResult<void> NetworkReplicationTransport::broadcast(const NetworkMessage& message) {
    return network_.broadcast(message);
}

GameResult<void> NetworkReplicationTransport::sendTo(PeerId peer, const NetworkMessage& message) {
    return network_.send(peer, message);
}

// ---------------------------------------------------------------------------
// ReplicationChannel
// ---------------------------------------------------------------------------

GameResult<void> ReplicationChannel::broadcast(const ReplicationEvent& event) {
    auto result = GameResult<void>::ok();
    if (transport_ != nullptr) {
        auto sent = transport_->broadcast(toMessage(event));
        if (!sent) {
            CSYNC_LOG_WARN(LogCategory::Replication,
                           std::string("broadcast of ") + std::string(eventName(event)) +
                               " failed: " + sent.error().describe());
            result = GameResult<void>::err(
                GameError(ErrorCode::ReplicationFailed, sent.error().describe(), sent.error()));
        }
    }

    CSYNC_LOG_DEBUG(LogCategory::Replication,
                    std::string("delivered ") + std::string(eventName(event)));
    onDelivered.emit(event);
    return result;
}

GameResult<void> ReplicationChannel::sendTo(PeerId peer, const ReplicationEvent& event) {
    if (transport_ == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::ReplicationFailed, "no transport attached"));
    }
    auto sent = transport_->sendTo(peer, toMessage(event));
    if (!sent) {
        foundation::LogContext ctx;
        ctx.peerId = peer;
        CSYNC_LOG_CTX(foundation::LogLevel::Warning, LogCategory::Replication,
                      std::string("send of ") + std::string(eventName(event)) +
                          " failed: " + sent.error().describe(),
                      ctx);
        return GameResult<void>::err(
            GameError(ErrorCode::ReplicationFailed, sent.error().describe(), sent.error()));
    }
    return GameResult<void>::ok();
}

}  // namespace csync::service
