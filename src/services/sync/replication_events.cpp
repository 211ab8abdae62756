#include "csync/service/replication_events.hpp"

#include <type_traits>

namespace csync::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::NetworkMessage;
using foundation::SessionId;

namespace {

NetworkMessage makeMessage(uint16_t code, const std::string& text) {
    NetworkMessage msg;
    msg.opcode = code;
    msg.payload.assign(text.begin(), text.end());
    return msg;
}

GameResult<ReplicationEvent> invalid(std::string message) {
    return GameResult<ReplicationEvent>::err(
        GameError(ErrorCode::InvalidMessage, std::move(message)));
}

}  // namespace

std::string_view eventName(const ReplicationEvent& event) {
    return std::visit(
        [](const auto& e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, SessionIdAssigned>) {
                return "SessionIdAssigned";
            } else if constexpr (std::is_same_v<T, SaveCompleted>) {
                return "SaveCompleted";
            } else {
                return "StateLoaded";
            }
        },
        event);
}

NetworkMessage toMessage(const ReplicationEvent& event) {
    return std::visit(
        [](const auto& e) -> NetworkMessage {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, SessionIdAssigned>) {
                return makeMessage(opcode::kSessionIdAssigned, e.id.value());
            } else if constexpr (std::is_same_v<T, SaveCompleted>) {
                return makeMessage(opcode::kSaveCompleted, e.id.value());
            } else {
                return makeMessage(opcode::kStateLoaded, e.document);
            }
        },
        event);
}

GameResult<ReplicationEvent> fromMessage(const NetworkMessage& message) {
    auto text = message.payloadText();
    switch (message.opcode) {
        case opcode::kSessionIdAssigned:
            if (text.empty()) {
                return invalid("SessionIdAssigned without an id");
            }
            return GameResult<ReplicationEvent>::ok(SessionIdAssigned{SessionId(std::move(text))});
        case opcode::kSaveCompleted:
            if (text.empty()) {
                return invalid("SaveCompleted without an id");
            }
            return GameResult<ReplicationEvent>::ok(SaveCompleted{SessionId(std::move(text))});
        case opcode::kStateLoaded:
            return GameResult<ReplicationEvent>::ok(StateLoaded{std::move(text)});
        default:
            return invalid("unknown replication opcode " + std::to_string(message.opcode));
    }
}

}  // namespace csync::service
