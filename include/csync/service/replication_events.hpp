#pragma once

/// @file replication_events.hpp
/// @brief Host-to-peer replication events and their NetworkMessage encoding.

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "csync/foundation/game_network_manager.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/types.hpp"

namespace csync::service {

/// Replication opcodes (0x01xx range).
namespace opcode {
constexpr uint16_t kSessionIdAssigned = 0x0101;
constexpr uint16_t kSaveCompleted = 0x0102;
constexpr uint16_t kStateLoaded = 0x0103;
}  // namespace opcode

/// The host issued or adopted a session id.
struct SessionIdAssigned {
    foundation::SessionId id;
    bool operator==(const SessionIdAssigned&) const = default;
};

/// A save of @p id reached the store.
struct SaveCompleted {
    foundation::SessionId id;
    bool operator==(const SaveCompleted&) const = default;
};

/// The host's snapshot changed wholesale. @p document is the persistence
/// document form (see chess::SnapshotCodec::toDocument).
struct StateLoaded {
    std::string document;
    bool operator==(const StateLoaded&) const = default;
};

using ReplicationEvent = std::variant<SessionIdAssigned, SaveCompleted, StateLoaded>;

/// Event name for log lines ("SessionIdAssigned").
[[nodiscard]] std::string_view eventName(const ReplicationEvent& event);

/// Encode an event. The payload is the id or the document text.
[[nodiscard]] foundation::NetworkMessage toMessage(const ReplicationEvent& event);

/// Decode a message. Unknown opcodes and empty ids are InvalidMessage.
/// The document of a StateLoaded is not validated here.
[[nodiscard]] foundation::GameResult<ReplicationEvent> fromMessage(
    const foundation::NetworkMessage& message);

}  // namespace csync::service
