#pragma once

/// @file persistence_gateway.hpp
/// @brief Asynchronous save/load of session records against a session store.
///
/// The gateway is the only component that talks to a store. It checks
/// readiness, stamps records, validates what comes back and converts every
/// store failure (returned or thrown) into a GameError, so nothing thrown by
/// a backend crosses into the session layer.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "csync/foundation/game_result.hpp"
#include "csync/foundation/types.hpp"

namespace csync::service {

/// One persisted session: the document the store holds under a session id.
struct SaveRecord {
    foundation::SessionId sessionId;
    std::string payload;        ///< Persistence document (see SnapshotCodec)
    int64_t timestampUs = 0;    ///< Microseconds since the Unix epoch
};

/// Result of a load that reached the store.
struct LoadOutcome {
    std::string payload;
    bool found = false;
};

/// Backend holding SaveRecords keyed by session id.
///
/// Callbacks may run synchronously inside write()/read() or later on the
/// session thread; implementations never invoke them on a foreign thread.
class ISessionStore {
public:
    using WriteCallback = std::function<void(foundation::GameResult<void>)>;
    using ReadCallback =
        std::function<void(foundation::GameResult<std::optional<SaveRecord>>)>;

    virtual ~ISessionStore() = default;

    /// Initialized and reachable.
    [[nodiscard]] virtual bool isReady() const = 0;

    /// Insert or replace the record for record.sessionId.
    virtual void write(SaveRecord record, WriteCallback callback) = 0;

    /// Fetch the record for @p id; nullopt when none exists.
    virtual void read(const foundation::SessionId& id, ReadCallback callback) = 0;
};

/// Save/load front end over an ISessionStore.
///
/// - Not ready: the callback receives PersistenceUnavailable and the store
///   is never touched.
/// - Store error or exception: PersistenceFailure, with the store's own
///   GameError attached as context when there is one.
/// - Record read back with an empty payload or another session's id:
///   PersistenceFailure.
/// - Each callback fires exactly once. No retry, queueing or buffering.
class PersistenceGateway {
public:
    using SaveCallback = std::function<void(foundation::GameResult<void>)>;
    using LoadCallback = std::function<void(foundation::GameResult<LoadOutcome>)>;
    using Clock = std::function<int64_t()>;

    explicit PersistenceGateway(ISessionStore& store);

    /// Replace the timestamp source (microseconds since epoch). For tests.
    void setClock(Clock clock);

    [[nodiscard]] bool isReady() const;

    void save(const foundation::SessionId& id, std::string payload,
              SaveCallback callback);

    void load(const foundation::SessionId& id, LoadCallback callback);

private:
    ISessionStore& store_;
    Clock clock_;
};

} // namespace csync::service
