#pragma once

/// @file game_network_manager.hpp
/// @brief GameNetworkManager wrapping the kcenon network_system TCP server
///        for host-to-peer session traffic.
///
/// Provides message framing, peer tracking and opcode-based dispatch.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/foundation/types.hpp"

namespace csync::foundation {

/// Application-level message with opcode and binary payload.
///
/// Wire format (serialize/deserialize):
///   [4 bytes: total length (network order)]
///   [2 bytes: opcode (network order)]
///   [N bytes: payload]
struct NetworkMessage {
    static constexpr std::size_t kHeaderSize = 6;
    /// Largest total frame length a receiver buffers.
    static constexpr std::size_t kMaxFrameSize = 1024 * 1024;

    uint16_t opcode = 0;
    std::vector<uint8_t> payload;

    /// Serialize to wire format: [4-byte length][2-byte opcode][payload].
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Deserialize one frame from wire bytes. Returns nullopt on malformed
    /// or truncated input.
    [[nodiscard]] static std::optional<NetworkMessage> deserialize(
        const uint8_t* data, std::size_t size);

    /// Convenience overload.
    [[nodiscard]] static std::optional<NetworkMessage> deserialize(
        const std::vector<uint8_t>& data);

    /// Payload interpreted as text (ids and documents are UTF-8).
    [[nodiscard]] std::string payloadText() const {
        return std::string(payload.begin(), payload.end());
    }
};

/// Reassembles NetworkMessage frames from a TCP byte stream.
///
/// TCP delivers bytes, not frames: one read may carry half a frame or
/// several frames. Bytes are buffered until a complete frame is present.
class FrameAssembler {
public:
    /// Append received bytes and return every frame completed by them.
    /// A frame whose declared length is smaller than the header or larger
    /// than NetworkMessage::kMaxFrameSize poisons the stream: the buffer is
    /// cleared and InvalidMessage is returned.
    GameResult<std::vector<NetworkMessage>> feed(const uint8_t* data, std::size_t size);

    /// Number of bytes waiting for the rest of their frame.
    [[nodiscard]] std::size_t pendingBytes() const noexcept { return buffer_.size(); }

    void clear() { buffer_.clear(); }

private:
    std::vector<uint8_t> buffer_;
};

/// Callback invoked when a message with a specific opcode arrives.
using MessageHandler = std::function<void(PeerId, const NetworkMessage&)>;

/// Snapshot of a connected peer's state.
struct PeerInfo {
    PeerId id;
    std::string remoteAddress;
    std::chrono::steady_clock::time_point connectedAt;
    std::chrono::steady_clock::time_point lastActivity;
};

/// TCP server manager wrapping kcenon's network_system.
///
/// Tracks connected peers, reassembles frames per peer, and dispatches
/// incoming messages to registered opcode handlers. Uses PIMPL to hide all
/// kcenon implementation details from the public API.
///
/// Signals fire on network library threads:
/// - onConnected:    PeerId of the newly connected peer
/// - onDisconnected: PeerId of the disconnected peer
/// - onError:        (PeerId, ErrorCode) when an error occurs on a peer
///
/// Example:
/// @code
///   GameNetworkManager net;
///   net.onConnected.connect([](PeerId peer) {
///       std::cout << "peer " << peer.value() << " connected\n";
///   });
///   auto result = net.listen(19100);
///   if (!result) { /* handle error */ }
///   (void)net.broadcast(msg);
/// @endcode
class GameNetworkManager {
public:
    GameNetworkManager();
    ~GameNetworkManager();

    // Non-copyable, movable.
    GameNetworkManager(const GameNetworkManager&) = delete;
    GameNetworkManager& operator=(const GameNetworkManager&) = delete;
    GameNetworkManager(GameNetworkManager&&) noexcept;
    GameNetworkManager& operator=(GameNetworkManager&&) noexcept;

    // ── Server lifecycle ────────────────────────────────────────────────────

    /// Start listening on the given TCP port.
    [[nodiscard]] GameResult<void> listen(uint16_t port);

    /// Stop the server and forget all peers.
    void stop();

    [[nodiscard]] bool isListening() const;

    // ── Peer I/O ────────────────────────────────────────────────────────────

    /// Send a framed NetworkMessage to a specific peer.
    [[nodiscard]] GameResult<void> send(PeerId peer, const NetworkMessage& msg);

    /// Send a framed NetworkMessage to every connected peer.
    /// Every peer is attempted; SendFailed reports how many sends failed.
    [[nodiscard]] GameResult<void> broadcast(const NetworkMessage& msg);

    /// Close a specific peer connection.
    void close(PeerId peer);

    // ── Message handlers ────────────────────────────────────────────────────

    void registerHandler(uint16_t opcode, MessageHandler handler);
    void unregisterHandler(uint16_t opcode);

    // ── Queries ─────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<PeerInfo> peerInfo(PeerId id) const;
    [[nodiscard]] std::size_t peerCount() const;

    // ── Signals ─────────────────────────────────────────────────────────────

    Signal<PeerId> onConnected;
    Signal<PeerId> onDisconnected;
    Signal<PeerId, ErrorCode> onError;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace csync::foundation
