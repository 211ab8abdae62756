/// @file replica_client.cpp
/// @brief ReplicaClient implementation over the kcenon TCP client facade.

#include "csync/service/replica_client.hpp"

#include "csync/foundation/game_logger.hpp"
#include "csync/foundation/game_network_manager.hpp"

#include <kcenon/network/facade/tcp_facade.h>
#include <kcenon/network/interfaces/connection_observer.h>
#include <kcenon/network/interfaces/i_protocol_client.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>

namespace csync::service {

namespace kn = kcenon::network;

using foundation::ErrorCode;
using foundation::FrameAssembler;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::NetworkMessage;

struct ReplicaClient::Impl {
    ReplicaClient& owner;
    foundation::CompletionQueue& completions;
    SessionReplica& replica;

    std::shared_ptr<kn::interfaces::i_protocol_client> client;
    // Cleared on destruction; queued completions check it before running.
    std::shared_ptr<std::atomic<bool>> alive = std::make_shared<std::atomic<bool>>(true);

    std::mutex mutex;
    std::condition_variable connectedCv;
    bool connected = false;
    FrameAssembler assembler;
    std::atomic<std::size_t> rejected{0};

    Impl(ReplicaClient& o, foundation::CompletionQueue& c, SessionReplica& r)
        : owner(o), completions(c), replica(r) {}

    void onBytes(std::span<const uint8_t> data) {
        GameResult<std::vector<NetworkMessage>> frames =
            GameResult<std::vector<NetworkMessage>>::ok({});
        {
            std::lock_guard lock(mutex);
            frames = assembler.feed(data.data(), data.size());
        }
        if (!frames) {
            rejected.fetch_add(1);
            CSYNC_LOG_WARN(LogCategory::Network,
                           "host stream corrupt: " + frames.error().describe());
            return;
        }
        for (auto& frame : frames.value()) {
            auto token = alive;
            completions.post([this, token, frame = std::move(frame)]() {
                if (!token->load()) {
                    return;
                }
                auto applied = replica.apply(frame);
                if (!applied) {
                    rejected.fetch_add(1);
                }
            });
        }
    }

    void onConnectionLost(std::optional<std::string_view> reason) {
        {
            std::lock_guard lock(mutex);
            connected = false;
            assembler.clear();
        }
        CSYNC_LOG_INFO(LogCategory::Network,
                       "disconnected from host" +
                           (reason ? ": " + std::string(*reason) : std::string()));
        auto token = alive;
        completions.post([this, token]() {
            if (token->load()) {
                owner.onDisconnected.emit();
            }
        });
    }

    void attachObserver() {
        auto adapter = std::make_shared<kn::interfaces::callback_adapter>();
        adapter->on_connected([this]() {
            std::lock_guard lock(mutex);
            connected = true;
            connectedCv.notify_all();
        }).on_receive([this](std::span<const uint8_t> data) {
            onBytes(data);
        }).on_disconnected([this](std::optional<std::string_view> reason) {
            onConnectionLost(reason);
        }).on_error([](std::error_code ec) {
            CSYNC_LOG_WARN(LogCategory::Network, "client error: " + ec.message());
        });
        client->set_observer(adapter);
    }
};

ReplicaClient::ReplicaClient(foundation::CompletionQueue& completions, SessionReplica& replica)
    : impl_(std::make_unique<Impl>(*this, completions, replica)) {}

ReplicaClient::~ReplicaClient() {
    disconnect();
    impl_->alive->store(false);
}

GameResult<void> ReplicaClient::connect(const std::string& host, uint16_t port,
                                        std::chrono::milliseconds timeout) {
    if (impl_->client) {
        disconnect();
    }

    kn::facade::tcp_facade tcp;
    kn::facade::tcp_facade::client_config cfg{};
    cfg.host = host;
    cfg.port = port;
    cfg.client_id = "csync-replica";
    // The facade starts connecting inside create_client().
    impl_->client = tcp.create_client(cfg);
    if (!impl_->client) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConnectionFailed, "could not create TCP client"));
    }
    impl_->attachObserver();

    std::unique_lock lock(impl_->mutex);
    // The connected callback may have fired before the observer was set.
    if (impl_->client->is_connected()) {
        impl_->connected = true;
    }
    if (!impl_->connectedCv.wait_for(lock, timeout, [this] { return impl_->connected; })) {
        lock.unlock();
        disconnect();
        return GameResult<void>::err(
            GameError(ErrorCode::ConnectionFailed,
                      "no connection to " + host + ":" + std::to_string(port)));
    }

    CSYNC_LOG_INFO(LogCategory::Network,
                   "connected to host " + host + ":" + std::to_string(port));
    return GameResult<void>::ok();
}

void ReplicaClient::disconnect() {
    if (!impl_->client) {
        return;
    }
    auto stopped = impl_->client->stop();
    if (stopped.is_err()) {
        CSYNC_LOG_WARN(LogCategory::Network, "client stop reported an error");
    }
    impl_->client.reset();

    std::lock_guard lock(impl_->mutex);
    impl_->connected = false;
    impl_->assembler.clear();
}

bool ReplicaClient::isConnected() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->connected;
}

std::size_t ReplicaClient::rejectedCount() const {
    return impl_->rejected.load();
}

}  // namespace csync::service
