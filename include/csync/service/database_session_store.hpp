#pragma once

/// @file database_session_store.hpp
/// @brief ISessionStore over a relational database.
///
/// Records live in one table:
/// @code
///   game_states(session_id VARCHAR(64) PRIMARY KEY,
///               state      TEXT NOT NULL,
///               timestamp_us BIGINT NOT NULL)
/// @endcode
/// SQL runs on GameJobScheduler workers; completions are posted to the
/// CompletionQueue so callbacks run on the session thread.

#include <atomic>
#include <exception>
#include <string>
#include <string_view>

#include "csync/foundation/completion_queue.hpp"
#include "csync/foundation/game_database.hpp"
#include "csync/foundation/job_scheduler.hpp"
#include "csync/service/persistence_gateway.hpp"

namespace csync::service {

class DatabaseSessionStore final : public ISessionStore {
public:
    static constexpr const char* kTableName = "game_states";

    DatabaseSessionStore(foundation::GameDatabase& database,
                         foundation::GameJobScheduler& jobs,
                         foundation::CompletionQueue& completions);
    ~DatabaseSessionStore() override;

    DatabaseSessionStore(const DatabaseSessionStore&) = delete;
    DatabaseSessionStore& operator=(const DatabaseSessionStore&) = delete;

    /// Create the table if needed and mark the store ready.
    /// The database must already be connected.
    [[nodiscard]] foundation::GameResult<void> open();

    /// Stop accepting work and wait for running jobs.
    void close();

    // ISessionStore
    [[nodiscard]] bool isReady() const override;
    void write(SaveRecord record, WriteCallback callback) override;
    void read(const foundation::SessionId& id, ReadCallback callback) override;

    /// DDL for the records table.
    [[nodiscard]] static std::string createTableSql();

    /// Insert-or-replace statement template for a backend. Parameters:
    /// $session_id, $state, $timestamp_us.
    [[nodiscard]] static std::string upsertSql(foundation::DatabaseType type);

    /// Select statement template. Parameter: $session_id.
    [[nodiscard]] static std::string selectSql();

    /// Run one database call on a worker. A thrown exception becomes
    /// DatabaseError so the completion is still delivered.
    template <typename T, typename Fn>
    [[nodiscard]] static foundation::GameResult<T> guarded(std::string_view operation, Fn&& fn) {
        try {
            return fn();
        } catch (const std::exception& e) {
            return foundation::GameResult<T>::err(foundation::GameError(
                foundation::ErrorCode::DatabaseError,
                std::string(operation) + " failed: " + e.what()));
        }
    }

private:
    void complete(std::function<void()> completion);

    foundation::GameDatabase& database_;
    foundation::GameJobScheduler& jobs_;
    foundation::CompletionQueue& completions_;
    std::atomic<bool> open_{false};
};

} // namespace csync::service
