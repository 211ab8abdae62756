/// @file session_host.cpp
/// @brief SessionHost and SessionPeer wiring.

#include "csync/service/session_host.hpp"

#include "csync/foundation/game_logger.hpp"
#include "csync/foundation/game_metrics.hpp"
#include "csync/service/service_runner.hpp"
#include "csync/service/session_metrics.hpp"

namespace csync::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::PeerId;

namespace {

constexpr std::size_t kDatabaseWorkers = 2;

}  // namespace

// ===========================================================================
// SessionHost
// ===========================================================================

SessionHost::SessionHost(SessionSettings settings)
    : settings_(std::move(settings)),
      board_(chess::Board::standard()),
      loop_(settings_.tickRate) {
    if (settings_.backend == StoreBackend::Database) {
        database_ = std::make_unique<foundation::GameDatabase>();
        jobs_ = std::make_unique<foundation::GameJobScheduler>(kDatabaseWorkers);
        auto store = std::make_unique<DatabaseSessionStore>(*database_, *jobs_, completions_);
        databaseStore_ = store.get();
        store_ = std::move(store);
    } else {
        auto store = std::make_unique<MemorySessionStore>();
        memoryStore_ = store.get();
        store_ = std::move(store);
    }
    gateway_ = std::make_unique<PersistenceGateway>(*store_);

    coordinator_ = std::make_unique<SessionCoordinator>(settings_.role, board_, *gateway_, channel_);
    autoSave_ = std::make_unique<AutoSaveScheduler>(*coordinator_, settings_.autoSave);

    localViewConnection_ = foundation::ScopedConnection<const ReplicationEvent&>(
        channel_.onDelivered, [this](const ReplicationEvent& event) {
            auto applied = localView_.apply(event);
            if (!applied) {
                CSYNC_LOG_WARN(LogCategory::Replication,
                               "local view rejected " + std::string(eventName(event)) +
                                   ": " + applied.error().describe());
            }
        });

    loop_.setTickCallback([this](std::chrono::milliseconds delta) { tick(delta); });
}

SessionHost::~SessionHost() {
    stop();
}

GameResult<void> SessionHost::openStore() {
    if (databaseStore_ == nullptr) {
        return GameResult<void>::ok();
    }

    foundation::DatabaseConfig dbConfig;
    dbConfig.connectionString = settings_.connectionString;
    dbConfig.dbType = settings_.databaseType;
    auto connected = database_->connect(dbConfig);
    if (!connected) {
        return connected;
    }
    return databaseStore_->open();
}

void SessionHost::releaseStartup() {
    connectedConnection_.reset();
    disconnectedConnection_.reset();
    network_.stop();
    if (databaseStore_ != nullptr) {
        databaseStore_->close();
        database_->disconnect();
    }
}

GameResult<void> SessionHost::start() {
    if (running_) {
        return GameResult<void>::ok();
    }
    if (settings_.role != SessionRole::Host) {
        return GameResult<void>::err(
            GameError(ErrorCode::NotAuthorized, "SessionHost needs session.role=host"));
    }

    auto opened = openStore();
    if (!opened) {
        CSYNC_LOG_ERROR(LogCategory::Persistence,
                        "session store unavailable: " + opened.error().describe());
        return opened;
    }

    connectedConnection_ = foundation::ScopedConnection<PeerId>(
        network_.onConnected, [this](PeerId peer) { onPeerConnected(peer); });
    disconnectedConnection_ = foundation::ScopedConnection<PeerId>(
        network_.onDisconnected, [this](PeerId peer) { onPeerDisconnected(peer); });

    auto listening = network_.listen(settings_.port);
    if (!listening) {
        releaseStartup();
        return listening;
    }

    auto started = coordinator_->startSession();
    if (!started) {
        releaseStartup();
        return GameResult<void>::err(started.error());
    }

    if (!loop_.start()) {
        auto ended = coordinator_->endSession();
        if (!ended) {
            CSYNC_LOG_WARN(LogCategory::Session, ended.error().describe());
        }
        releaseStartup();
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError, "session loop already running"));
    }

    running_ = true;
    CSYNC_LOG_INFO(LogCategory::Core,
                   "host session " + started.value().value() + " on port " +
                       std::to_string(settings_.port));
    return GameResult<void>::ok();
}

void SessionHost::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    GracefulShutdown shutdown;
    shutdown.addHook("loop", [this]() { loop_.stop(); });
    // With the loop stopped this thread is the session thread.
    shutdown.addHook("session", [this]() {
        if (coordinator_->phase() != SessionPhase::Ended) {
            auto ended = coordinator_->endSession();
            if (!ended) {
                CSYNC_LOG_WARN(LogCategory::Session, ended.error().describe());
            }
        }
    });
    shutdown.addHook("network", [this]() {
        connectedConnection_.reset();
        disconnectedConnection_.reset();
        network_.stop();
    });
    shutdown.addHook("store", [this]() {
        if (databaseStore_ != nullptr) {
            databaseStore_->close();
        }
    });
    shutdown.addHook("completions", [this]() {
        completions_.close();
        completions_.drain();
    });
    shutdown.addHook("database", [this]() {
        if (database_) {
            database_->disconnect();
        }
    });
    shutdown.execute();
    CSYNC_LOG_INFO(LogCategory::Core, "host stopped");
}

bool SessionHost::post(foundation::CompletionQueue::Task task) {
    return completions_.post(std::move(task));
}

void SessionHost::watchConfig(foundation::ConfigManager& config) {
    std::weak_ptr<int> alive = lifetime_;
    config.watch("autosave.enabled", [this, alive, &config](std::string_view key) {
        if (alive.expired()) {
            return;
        }
        auto enabled = config.get<bool>(key);
        if (!enabled) {
            CSYNC_LOG_WARN(LogCategory::Scheduler,
                           "ignoring autosave.enabled: " + enabled.error().describe());
            return;
        }
        const bool value = enabled.value();
        completions_.post([this, alive, value]() {
            if (!alive.expired()) {
                autoSave_->setEnabled(value);
            }
        });
    });
}

void SessionHost::tick(std::chrono::milliseconds delta) {
    completions_.drain();
    autoSave_->update(delta);
}

void SessionHost::onPeerConnected(PeerId peer) {
    foundation::GameMetrics::instance().incrementGauge(metrics::kPeersConnected);
    completions_.post([this, peer]() {
        auto caughtUp = coordinator_->catchUpPeer(peer);
        LogContext ctx;
        ctx.peerId = peer;
        if (!caughtUp) {
            CSYNC_LOG_CTX(foundation::LogLevel::Warning, LogCategory::Replication,
                          "catch-up failed: " + caughtUp.error().describe(), ctx);
            return;
        }
        CSYNC_LOG_CTX(foundation::LogLevel::Info, LogCategory::Replication,
                      "peer caught up", ctx);
    });
}

void SessionHost::onPeerDisconnected(PeerId peer) {
    foundation::GameMetrics::instance().decrementGauge(metrics::kPeersConnected);
    LogContext ctx;
    ctx.peerId = peer;
    CSYNC_LOG_CTX(foundation::LogLevel::Info, LogCategory::Network, "peer left", ctx);
}

// ===========================================================================
// SessionPeer
// ===========================================================================

SessionPeer::SessionPeer(SessionSettings settings)
    : settings_(std::move(settings)), loop_(settings_.tickRate) {
    loop_.setTickCallback([this](std::chrono::milliseconds delta) { tick(delta); });
    lostConnection_ = foundation::ScopedConnection<>(client_.onDisconnected,
                                                     [this]() { onConnectionLost(); });
}

SessionPeer::~SessionPeer() {
    stop();
}

GameResult<void> SessionPeer::start() {
    if (running_) {
        return GameResult<void>::ok();
    }
    auto connected = client_.connect(settings_.host, settings_.port,
                                     settings_.reconnect.connectTimeout);
    if (!connected) {
        return connected;
    }
    reconnecting_ = false;
    gaveUp_ = false;
    running_ = true;
    if (!loop_.start()) {
        running_ = false;
        client_.disconnect();
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError, "session loop already running"));
    }
    return GameResult<void>::ok();
}

void SessionPeer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    GracefulShutdown shutdown;
    // The loop goes first so no reconnect attempt races the disconnect.
    shutdown.addHook("loop", [this]() { loop_.stop(); });
    shutdown.addHook("client", [this]() { client_.disconnect(); });
    shutdown.addHook("completions", [this]() {
        completions_.close();
        completions_.drain();
    });
    shutdown.execute();
    CSYNC_LOG_INFO(LogCategory::Core, "peer stopped");
}

void SessionPeer::tick(std::chrono::milliseconds delta) {
    completions_.drain();
    if (!reconnecting_ || !running_) {
        return;
    }
    untilNextAttempt_ -= delta;
    if (untilNextAttempt_.count() <= 0) {
        attemptReconnect();
    }
}

void SessionPeer::onConnectionLost() {
    // Late notices from a replaced connection arrive after a reconnect.
    if (!running_ || reconnecting_ || gaveUp_ || client_.isConnected()) {
        return;
    }
    if (settings_.reconnect.attempts == 0) {
        gaveUp_ = true;
        CSYNC_LOG_ERROR(LogCategory::Network, "connection to host lost; reconnect disabled");
        return;
    }
    reconnecting_ = true;
    attemptsMade_ = 0;
    untilNextAttempt_ = settings_.reconnect.delayBefore(1);
    CSYNC_LOG_WARN(LogCategory::Network,
                   "connection to host lost; retrying in " +
                       std::to_string(untilNextAttempt_.count()) + " ms");
}

void SessionPeer::attemptReconnect() {
    ++attemptsMade_;
    auto connected = client_.connect(settings_.host, settings_.port,
                                     settings_.reconnect.connectTimeout);
    if (connected) {
        reconnecting_ = false;
        ++reconnects_;
        CSYNC_LOG_INFO(LogCategory::Network,
                       "reconnected after " + std::to_string(attemptsMade_) + " attempt(s)");
        return;
    }

    if (attemptsMade_ >= settings_.reconnect.attempts) {
        reconnecting_ = false;
        gaveUp_ = true;
        CSYNC_LOG_ERROR(LogCategory::Network,
                        "giving up after " + std::to_string(attemptsMade_) +
                            " reconnect attempt(s): " + connected.error().describe());
        return;
    }
    untilNextAttempt_ = settings_.reconnect.delayBefore(attemptsMade_ + 1);
    CSYNC_LOG_WARN(LogCategory::Network,
                   "reconnect attempt " + std::to_string(attemptsMade_) + " failed; next in " +
                       std::to_string(untilNextAttempt_.count()) + " ms");
}

bool SessionPeer::post(foundation::CompletionQueue::Task task) {
    return completions_.post(std::move(task));
}

}  // namespace csync::service
