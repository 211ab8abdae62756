/// @file game_network_manager.cpp
/// @brief GameNetworkManager implementation wrapping kcenon network_system.

#include "csync/foundation/game_network_manager.hpp"

#include "csync/foundation/game_logger.hpp"

// kcenon facade headers (hidden behind PIMPL)
#include <kcenon/network/facade/tcp_facade.h>
#include <kcenon/network/interfaces/i_protocol_server.h>
#include <kcenon/network/interfaces/i_session.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <shared_mutex>
#include <unordered_map>

namespace csync::foundation {

namespace kni = kcenon::network::interfaces;

namespace {

uint32_t readLength(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

}  // namespace

// ---------------------------------------------------------------------------
// NetworkMessage serialization
// ---------------------------------------------------------------------------

std::vector<uint8_t> NetworkMessage::serialize() const {
    const uint32_t totalLen =
        static_cast<uint32_t>(kHeaderSize + payload.size());

    std::vector<uint8_t> buf;
    buf.resize(totalLen);

    // Network byte order (big-endian)
    buf[0] = static_cast<uint8_t>((totalLen >> 24) & 0xFF);
    buf[1] = static_cast<uint8_t>((totalLen >> 16) & 0xFF);
    buf[2] = static_cast<uint8_t>((totalLen >> 8) & 0xFF);
    buf[3] = static_cast<uint8_t>(totalLen & 0xFF);

    buf[4] = static_cast<uint8_t>((opcode >> 8) & 0xFF);
    buf[5] = static_cast<uint8_t>(opcode & 0xFF);

    if (!payload.empty()) {
        std::memcpy(buf.data() + kHeaderSize, payload.data(), payload.size());
    }

    return buf;
}

std::optional<NetworkMessage> NetworkMessage::deserialize(
    const uint8_t* data, std::size_t size) {
    if (size < kHeaderSize) {
        return std::nullopt;
    }

    const uint32_t totalLen = readLength(data);
    if (totalLen < kHeaderSize || totalLen > size) {
        return std::nullopt;
    }

    NetworkMessage msg;
    msg.opcode = static_cast<uint16_t>(
        (static_cast<uint16_t>(data[4]) << 8) | data[5]);

    const auto payloadSize = totalLen - kHeaderSize;
    if (payloadSize > 0) {
        msg.payload.assign(data + kHeaderSize, data + kHeaderSize + payloadSize);
    }

    return msg;
}

std::optional<NetworkMessage> NetworkMessage::deserialize(
    const std::vector<uint8_t>& data) {
    return deserialize(data.data(), data.size());
}

// ---------------------------------------------------------------------------
// FrameAssembler
// ---------------------------------------------------------------------------

GameResult<std::vector<NetworkMessage>> FrameAssembler::feed(
    const uint8_t* data, std::size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);

    std::vector<NetworkMessage> frames;
    std::size_t offset = 0;
    while (buffer_.size() - offset >= NetworkMessage::kHeaderSize) {
        const uint32_t totalLen = readLength(buffer_.data() + offset);
        if (totalLen < NetworkMessage::kHeaderSize) {
            buffer_.clear();
            return GameResult<std::vector<NetworkMessage>>::err(
                GameError(ErrorCode::InvalidMessage,
                          "frame length " + std::to_string(totalLen) +
                              " shorter than header"));
        }
        if (totalLen > NetworkMessage::kMaxFrameSize) {
            buffer_.clear();
            return GameResult<std::vector<NetworkMessage>>::err(
                GameError(ErrorCode::InvalidMessage,
                          "frame length " + std::to_string(totalLen) +
                              " exceeds limit"));
        }
        if (buffer_.size() - offset < totalLen) {
            break;
        }
        auto msg = NetworkMessage::deserialize(buffer_.data() + offset, totalLen);
        if (msg) {
            frames.push_back(std::move(*msg));
        }
        offset += totalLen;
    }
    buffer_.erase(buffer_.begin(),
                  buffer_.begin() + static_cast<std::ptrdiff_t>(offset));

    return GameResult<std::vector<NetworkMessage>>::ok(std::move(frames));
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct GameNetworkManager::Impl {
    std::shared_ptr<kni::i_protocol_server> server;

    // Internal peer data: maps our PeerId -> kcenon session + metadata
    struct InternalPeer {
        std::string kcSessionId;
        std::shared_ptr<kni::i_session> kcSession;
        PeerInfo info;
        FrameAssembler assembler;
    };

    std::unordered_map<PeerId, InternalPeer> peers;
    // Reverse lookup: kcenon string ID -> our PeerId
    std::unordered_map<std::string, PeerId> reverseMap;

    std::unordered_map<uint16_t, MessageHandler> handlers;

    std::atomic<uint64_t> nextPeerId{1};
    mutable std::shared_mutex peerMutex;
    mutable std::shared_mutex handlerMutex;

    // Back-pointer for signal emission (non-owning, always valid during Impl lifetime)
    GameNetworkManager* owner = nullptr;

    PeerId allocatePeerId() {
        return PeerId(nextPeerId.fetch_add(1, std::memory_order_relaxed));
    }

    void dispatch(PeerId peer, const NetworkMessage& msg) {
        MessageHandler handler;
        {
            std::shared_lock lock(handlerMutex);
            auto it = handlers.find(msg.opcode);
            if (it != handlers.end()) {
                handler = it->second;
            }
        }
        if (handler) {
            handler(peer, msg);
        } else {
            CSYNC_LOG_DEBUG(LogCategory::Network,
                            "no handler for opcode " + std::to_string(msg.opcode));
        }
    }

    // Wire up kcenon callbacks to our internal dispatch
    void setupCallbacks(std::shared_ptr<kni::i_protocol_server>& srv) {
        srv->set_connection_callback(
            [this](std::shared_ptr<kni::i_session> kcSession) {
                auto peer = allocatePeerId();
                auto kcId = std::string(kcSession->id());
                auto now = std::chrono::steady_clock::now();

                InternalPeer internal;
                internal.kcSessionId = kcId;
                internal.kcSession = kcSession;
                internal.info.id = peer;
                internal.info.remoteAddress = kcId;
                internal.info.connectedAt = now;
                internal.info.lastActivity = now;

                {
                    std::unique_lock lock(peerMutex);
                    peers.emplace(peer, std::move(internal));
                    reverseMap.emplace(kcId, peer);
                }

                owner->onConnected.emit(peer);
            });

        srv->set_receive_callback(
            [this](std::string_view kcId, const std::vector<uint8_t>& data) {
                PeerId peer;
                GameResult<std::vector<NetworkMessage>> frames =
                    GameResult<std::vector<NetworkMessage>>::ok({});
                {
                    // Exclusive: the assembler buffer is mutated.
                    std::unique_lock lock(peerMutex);
                    auto it = reverseMap.find(std::string(kcId));
                    if (it == reverseMap.end()) {
                        return;
                    }
                    peer = it->second;
                    auto pit = peers.find(peer);
                    if (pit == peers.end()) {
                        return;
                    }
                    pit->second.info.lastActivity = std::chrono::steady_clock::now();
                    frames = pit->second.assembler.feed(data.data(), data.size());
                }

                if (!frames) {
                    CSYNC_LOG_WARN(LogCategory::Network,
                                   frames.error().describe());
                    owner->onError.emit(peer, ErrorCode::InvalidMessage);
                    return;
                }
                for (const auto& msg : frames.value()) {
                    dispatch(peer, msg);
                }
            });

        srv->set_disconnection_callback(
            [this](std::string_view kcId) {
                PeerId peer;
                {
                    std::unique_lock lock(peerMutex);
                    auto it = reverseMap.find(std::string(kcId));
                    if (it == reverseMap.end()) {
                        return;
                    }
                    peer = it->second;
                    peers.erase(peer);
                    reverseMap.erase(it);
                }

                owner->onDisconnected.emit(peer);
            });

        srv->set_error_callback(
            [this](std::string_view kcId, std::error_code ec) {
                PeerId peer;
                {
                    std::shared_lock lock(peerMutex);
                    auto it = reverseMap.find(std::string(kcId));
                    if (it == reverseMap.end()) {
                        return;
                    }
                    peer = it->second;
                }
                if (ec) {
                    CSYNC_LOG_WARN(LogCategory::Network,
                                   "peer " + std::to_string(peer.value()) +
                                       " error: " + ec.message());
                    owner->onError.emit(peer, ErrorCode::NetworkError);
                }
            });
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------

GameNetworkManager::GameNetworkManager()
    : impl_(std::make_unique<Impl>()) {
    impl_->owner = this;
}

GameNetworkManager::~GameNetworkManager() {
    if (impl_) {
        stop();
    }
}

GameNetworkManager::GameNetworkManager(GameNetworkManager&& other) noexcept
    : impl_(std::move(other.impl_)) {
    if (impl_) {
        impl_->owner = this;
    }
}

GameNetworkManager& GameNetworkManager::operator=(GameNetworkManager&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            stop();
        }
        impl_ = std::move(other.impl_);
        if (impl_) {
            impl_->owner = this;
        }
    }
    return *this;
}

// ---------------------------------------------------------------------------
// listen() / stop()
// ---------------------------------------------------------------------------

GameResult<void> GameNetworkManager::listen(uint16_t port) {
    if (impl_->server) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "already listening"));
    }

    kcenon::network::facade::tcp_facade facade;
    auto server = facade.create_server({});
    if (!server) {
        return GameResult<void>::err(
            GameError(ErrorCode::ListenFailed, "failed to create TCP server"));
    }

    impl_->setupCallbacks(server);

    auto result = server->start(port);
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ListenFailed,
                      "failed to start TCP server on port " + std::to_string(port)));
    }

    impl_->server = std::move(server);
    CSYNC_LOG_INFO(LogCategory::Network,
                   "listening on port " + std::to_string(port));
    return GameResult<void>::ok();
}

void GameNetworkManager::stop() {
    if (impl_->server) {
        (void)impl_->server->stop();
        impl_->server.reset();
    }

    std::unique_lock lock(impl_->peerMutex);
    impl_->peers.clear();
    impl_->reverseMap.clear();
}

bool GameNetworkManager::isListening() const {
    return impl_->server != nullptr;
}

// ---------------------------------------------------------------------------
// send() / broadcast() / close()
// ---------------------------------------------------------------------------

GameResult<void> GameNetworkManager::send(PeerId peer, const NetworkMessage& msg) {
    std::shared_ptr<kni::i_session> kcSession;
    {
        std::shared_lock lock(impl_->peerMutex);
        auto it = impl_->peers.find(peer);
        if (it == impl_->peers.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::PeerNotFound,
                          "peer " + std::to_string(peer.value()) + " not found"));
        }
        kcSession = it->second.kcSession;
    }

    auto wireData = msg.serialize();
    auto result = kcSession->send(std::move(wireData));
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::SendFailed,
                      "send failed for peer " + std::to_string(peer.value())));
    }

    return GameResult<void>::ok();
}

GameResult<void> GameNetworkManager::broadcast(const NetworkMessage& msg) {
    auto wireData = msg.serialize();

    std::size_t failed = 0;
    std::shared_lock lock(impl_->peerMutex);
    for (auto& [peer, internal] : impl_->peers) {
        if (!internal.kcSession || !internal.kcSession->is_connected()) {
            continue;
        }
        // Copy for each send (kcenon takes by rvalue)
        auto copy = wireData;
        if (internal.kcSession->send(std::move(copy)).is_err()) {
            ++failed;
        }
    }

    if (failed > 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::SendFailed,
                      "broadcast failed for " + std::to_string(failed) + " peer(s)"));
    }
    return GameResult<void>::ok();
}

void GameNetworkManager::close(PeerId peer) {
    std::shared_ptr<kni::i_session> kcSession;
    {
        std::shared_lock lock(impl_->peerMutex);
        auto it = impl_->peers.find(peer);
        if (it == impl_->peers.end()) {
            return;
        }
        kcSession = it->second.kcSession;
    }

    if (kcSession) {
        kcSession->close();
    }
    // Peer removal happens in the disconnection callback
}

// ---------------------------------------------------------------------------
// Handlers / queries
// ---------------------------------------------------------------------------

void GameNetworkManager::registerHandler(uint16_t opcode, MessageHandler handler) {
    std::unique_lock lock(impl_->handlerMutex);
    impl_->handlers[opcode] = std::move(handler);
}

void GameNetworkManager::unregisterHandler(uint16_t opcode) {
    std::unique_lock lock(impl_->handlerMutex);
    impl_->handlers.erase(opcode);
}

std::optional<PeerInfo> GameNetworkManager::peerInfo(PeerId id) const {
    std::shared_lock lock(impl_->peerMutex);
    auto it = impl_->peers.find(id);
    if (it == impl_->peers.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::size_t GameNetworkManager::peerCount() const {
    std::shared_lock lock(impl_->peerMutex);
    return impl_->peers.size();
}

} // namespace csync::foundation
