#pragma once

/// @file replica_client.hpp
/// @brief Peer-side TCP connection to the host feeding a SessionReplica.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "csync/foundation/completion_queue.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/service/session_replica.hpp"

namespace csync::service {

/// TCP client wrapping kcenon's network_system client facade.
///
/// Bytes arrive on a network library thread and are reassembled into
/// frames there; each complete frame is posted to the CompletionQueue and
/// applied to the replica when the session thread drains the queue. The
/// replica is never touched off the session thread.
///
/// onDisconnected fires on the session thread as well.
class ReplicaClient {
public:
    ReplicaClient(foundation::CompletionQueue& completions, SessionReplica& replica);
    ~ReplicaClient();

    ReplicaClient(const ReplicaClient&) = delete;
    ReplicaClient& operator=(const ReplicaClient&) = delete;

    /// Connect and wait up to @p timeout for the connection to come up.
    /// @return ConnectionFailed when it does not.
    [[nodiscard]] foundation::GameResult<void> connect(
        const std::string& host, uint16_t port,
        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void disconnect();

    [[nodiscard]] bool isConnected() const;

    /// Frames that failed to decode or apply since connect().
    [[nodiscard]] std::size_t rejectedCount() const;

    foundation::Signal<> onDisconnected;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace csync::service
