/// @file persistence_gateway.cpp
/// @brief PersistenceGateway implementation.

#include "csync/service/persistence_gateway.hpp"

#include "csync/foundation/game_logger.hpp"

#include <chrono>
#include <exception>
#include <memory>

namespace csync::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::SessionId;

namespace {

int64_t nowMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

GameError failure(std::string message) {
    return GameError(ErrorCode::PersistenceFailure, std::move(message));
}

GameError wrapStoreError(const GameError& storeError) {
    return GameError(ErrorCode::PersistenceFailure, storeError.describe(), storeError);
}

/// Wraps a callback so only its first invocation goes through.
template <typename Callback>
class OnceCallback {
public:
    explicit OnceCallback(Callback cb)
        : state_(std::make_shared<State>(State{std::move(cb), false})) {}

    template <typename Arg>
    void operator()(Arg&& arg) const {
        if (state_->fired) {
            CSYNC_LOG_DEBUG(LogCategory::Persistence,
                            "duplicate store completion ignored");
            return;
        }
        state_->fired = true;
        if (state_->cb) {
            state_->cb(std::forward<Arg>(arg));
        }
    }

    [[nodiscard]] bool fired() const { return state_->fired; }

private:
    struct State {
        Callback cb;
        bool fired;
    };
    std::shared_ptr<State> state_;
};

}  // namespace

PersistenceGateway::PersistenceGateway(ISessionStore& store)
    : store_(store), clock_(&nowMicros) {}

void PersistenceGateway::setClock(Clock clock) {
    clock_ = clock ? std::move(clock) : Clock(&nowMicros);
}

bool PersistenceGateway::isReady() const {
    return store_.isReady();
}

// ---------------------------------------------------------------------------
// save()
// ---------------------------------------------------------------------------

void PersistenceGateway::save(const SessionId& id, std::string payload,
                              SaveCallback callback) {
    OnceCallback<SaveCallback> done(std::move(callback));

    if (!store_.isReady()) {
        done(GameResult<void>::err(
            GameError(ErrorCode::PersistenceUnavailable, "session store not ready")));
        return;
    }
    if (!id.isValid() || payload.empty()) {
        done(GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "save needs a session id and a payload")));
        return;
    }

    SaveRecord record{id, std::move(payload), clock_()};
    try {
        store_.write(std::move(record), [done, id](GameResult<void> result) {
            if (!result) {
                CSYNC_LOG_ERROR(LogCategory::Persistence,
                                "save of " + id.value() + " failed: " +
                                    result.error().describe());
                done(GameResult<void>::err(wrapStoreError(result.error())));
                return;
            }
            done(GameResult<void>::ok());
        });
    } catch (const std::exception& e) {
        CSYNC_LOG_ERROR(LogCategory::Persistence,
                        "session store threw on save: " + std::string(e.what()));
        done(GameResult<void>::err(failure(std::string("store threw: ") + e.what())));
    }
}

// ---------------------------------------------------------------------------
// load()
// ---------------------------------------------------------------------------

void PersistenceGateway::load(const SessionId& id, LoadCallback callback) {
    OnceCallback<LoadCallback> done(std::move(callback));

    if (!store_.isReady()) {
        done(GameResult<LoadOutcome>::err(
            GameError(ErrorCode::PersistenceUnavailable, "session store not ready")));
        return;
    }
    if (!id.isValid()) {
        done(GameResult<LoadOutcome>::err(
            GameError(ErrorCode::InvalidArgument, "load needs a session id")));
        return;
    }

    try {
        store_.read(id, [done, id](GameResult<std::optional<SaveRecord>> result) {
            if (!result) {
                CSYNC_LOG_ERROR(LogCategory::Persistence,
                                "load of " + id.value() + " failed: " +
                                    result.error().describe());
                done(GameResult<LoadOutcome>::err(wrapStoreError(result.error())));
                return;
            }

            const auto& record = result.value();
            if (!record) {
                done(GameResult<LoadOutcome>::ok(LoadOutcome{}));
                return;
            }
            if (record->sessionId != id) {
                done(GameResult<LoadOutcome>::err(
                    failure("store returned record " + record->sessionId.value() +
                            " for " + id.value())));
                return;
            }
            if (record->payload.empty()) {
                done(GameResult<LoadOutcome>::err(
                    failure("record " + id.value() + " has an empty payload")));
                return;
            }
            done(GameResult<LoadOutcome>::ok(LoadOutcome{record->payload, true}));
        });
    } catch (const std::exception& e) {
        CSYNC_LOG_ERROR(LogCategory::Persistence,
                        "session store threw on load: " + std::string(e.what()));
        done(GameResult<LoadOutcome>::err(failure(std::string("store threw: ") + e.what())));
    }
}

} // namespace csync::service
