#pragma once

/// @file session_host.hpp
/// @brief Composition roots for the host process and the client process.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "csync/chess/board.hpp"
#include "csync/foundation/completion_queue.hpp"
#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/game_database.hpp"
#include "csync/foundation/game_network_manager.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/job_scheduler.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/service/auto_save_scheduler.hpp"
#include "csync/service/database_session_store.hpp"
#include "csync/service/game_loop.hpp"
#include "csync/service/memory_session_store.hpp"
#include "csync/service/persistence_gateway.hpp"
#include "csync/service/replica_client.hpp"
#include "csync/service/replication_channel.hpp"
#include "csync/service/session_coordinator.hpp"
#include "csync/service/session_replica.hpp"
#include "csync/service/session_settings.hpp"

namespace csync::service {

/// Host process: owns the authoritative session.
///
/// Wires the store (memory or database), the TCP server, the replication
/// channel, the coordinator, the auto-save scheduler and the loop. The loop
/// thread is the session thread; every tick drains the completion queue and
/// advances the auto-save timer. Peers that connect are caught up with the
/// current id and snapshot.
///
/// Work from other threads reaches the session through post().
///
/// Usage:
/// @code
///   SessionHost host(settings);
///   if (auto started = host.start(); !started) { /* report */ }
///   host.post([&] { (void)host.coordinator().recordMove(1); });
///   host.stop();
/// @endcode
class SessionHost {
public:
    explicit SessionHost(SessionSettings settings);
    ~SessionHost();

    SessionHost(const SessionHost&) = delete;
    SessionHost& operator=(const SessionHost&) = delete;

    /// Open the store, listen, start the session and the loop.
    [[nodiscard]] foundation::GameResult<void> start();

    /// End the session, stop the loop, flush completions, close the store
    /// and the server. Safe to call more than once.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_; }

    /// Run @p task on the session thread.
    bool post(foundation::CompletionQueue::Task task);

    /// Follow `autosave.enabled` in @p config. Changes made after this
    /// host is destroyed are ignored.
    void watchConfig(foundation::ConfigManager& config);

    [[nodiscard]] SessionCoordinator& coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] AutoSaveScheduler& autoSave() noexcept { return *autoSave_; }
    [[nodiscard]] chess::Board& board() noexcept { return board_; }
    [[nodiscard]] const SessionReplica& localView() const noexcept { return localView_; }
    [[nodiscard]] foundation::CompletionQueue& completions() noexcept { return completions_; }
    [[nodiscard]] GameLoop& loop() noexcept { return loop_; }
    [[nodiscard]] const SessionSettings& settings() const noexcept { return settings_; }

    /// Non-null with the memory backend.
    [[nodiscard]] MemorySessionStore* memoryStore() noexcept { return memoryStore_; }

private:
    foundation::GameResult<void> openStore();
    /// Undo a partial start(): server, signal connections and store.
    void releaseStartup();
    void onPeerConnected(foundation::PeerId peer);
    void onPeerDisconnected(foundation::PeerId peer);
    void tick(std::chrono::milliseconds delta);

    SessionSettings settings_;
    foundation::CompletionQueue completions_;

    std::unique_ptr<foundation::GameDatabase> database_;
    std::unique_ptr<foundation::GameJobScheduler> jobs_;
    std::unique_ptr<ISessionStore> store_;
    MemorySessionStore* memoryStore_ = nullptr;
    DatabaseSessionStore* databaseStore_ = nullptr;
    std::unique_ptr<PersistenceGateway> gateway_;

    foundation::GameNetworkManager network_;
    NetworkReplicationTransport transport_{network_};
    ReplicationChannel channel_{&transport_};

    chess::Board board_;
    SessionReplica localView_;
    std::unique_ptr<SessionCoordinator> coordinator_;
    std::unique_ptr<AutoSaveScheduler> autoSave_;
    GameLoop loop_;

    foundation::ScopedConnection<const ReplicationEvent&> localViewConnection_;
    foundation::ScopedConnection<foundation::PeerId> connectedConnection_;
    foundation::ScopedConnection<foundation::PeerId> disconnectedConnection_;

    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
    bool running_ = false;
};

/// Client process: mirrors the host into a local board.
///
/// The replica changes only through events received from the host; the
/// loop thread applies them when it drains the completion queue.
///
/// When the connection drops the loop retries per settings().reconnect:
/// each attempt waits its backoff, then connects. A host that comes back
/// on the same address catches the replica up again. Once every attempt
/// has failed the peer stays disconnected until restarted.
class SessionPeer {
public:
    explicit SessionPeer(SessionSettings settings);
    ~SessionPeer();

    SessionPeer(const SessionPeer&) = delete;
    SessionPeer& operator=(const SessionPeer&) = delete;

    /// Connect to the host and start the loop.
    [[nodiscard]] foundation::GameResult<void> start();

    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    bool post(foundation::CompletionQueue::Task task);

    [[nodiscard]] const SessionReplica& replica() const noexcept { return replica_; }
    [[nodiscard]] const chess::Board& board() const noexcept { return board_; }
    [[nodiscard]] ReplicaClient& client() noexcept { return client_; }
    [[nodiscard]] const SessionSettings& settings() const noexcept { return settings_; }

    // Session thread only.
    [[nodiscard]] bool isReconnecting() const noexcept { return reconnecting_; }
    [[nodiscard]] std::size_t reconnectCount() const noexcept { return reconnects_; }
    [[nodiscard]] bool hasGivenUp() const noexcept { return gaveUp_; }

private:
    void tick(std::chrono::milliseconds delta);
    void onConnectionLost();
    void attemptReconnect();

    SessionSettings settings_;
    foundation::CompletionQueue completions_;
    chess::Board board_;
    SessionReplica replica_{&board_};
    ReplicaClient client_{completions_, replica_};
    GameLoop loop_;
    foundation::ScopedConnection<> lostConnection_;

    bool reconnecting_ = false;
    bool gaveUp_ = false;
    uint32_t attemptsMade_ = 0;
    std::chrono::milliseconds untilNextAttempt_{0};
    std::size_t reconnects_ = 0;

    std::atomic<bool> running_{false};
};

}  // namespace csync::service
