#pragma once

/// @file replication_channel.hpp
/// @brief Host-side fan-out of replication events to peers and to the host
///        itself.

#include "csync/foundation/game_network_manager.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/foundation/types.hpp"
#include "csync/service/replication_events.hpp"

namespace csync::service {

/// Reliable, ordered delivery from the host to its peers.
class IReplicationTransport {
public:
    virtual ~IReplicationTransport() = default;

    /// Send to every connected peer.
    [[nodiscard]] virtual foundation::GameResult<void> broadcast(
        const foundation::NetworkMessage& message) = 0;

    /// Send to one peer.
    [[nodiscard]] virtual foundation::GameResult<void> sendTo(
        foundation::PeerId peer, const foundation::NetworkMessage& message) = 0;
};

/// IReplicationTransport over the TCP server of GameNetworkManager.
class NetworkReplicationTransport final : public IReplicationTransport {
public:
    explicit NetworkReplicationTransport(foundation::GameNetworkManager& network)
        : network_(network) {}

    [[nodiscard]] foundation::GameResult<void> broadcast(
        const foundation::NetworkMessage& message) override;
    [[nodiscard]] foundation::GameResult<void> sendTo(
        foundation::PeerId peer, const foundation::NetworkMessage& message) override;

private:
    foundation::GameNetworkManager& network_;
};

/// Stateless event channel.
///
/// broadcast() sends through the transport and then self-delivers through
/// onDelivered, in that order, so host-side observers see exactly the
/// sequence the peers see. A transport failure is logged and returned as
/// ReplicationFailed; self-delivery still happens.
///
/// A channel without a transport only self-delivers (offline play, tests).
class ReplicationChannel {
public:
    explicit ReplicationChannel(IReplicationTransport* transport = nullptr)
        : transport_(transport) {}

    void setTransport(IReplicationTransport* transport) { transport_ = transport; }

    foundation::GameResult<void> broadcast(const ReplicationEvent& event);

    /// Send to one peer only. No self-delivery.
    foundation::GameResult<void> sendTo(foundation::PeerId peer, const ReplicationEvent& event);

    /// Host-side delivery of every broadcast event.
    foundation::Signal<const ReplicationEvent&> onDelivered;

private:
    IReplicationTransport* transport_;
};

}  // namespace csync::service
