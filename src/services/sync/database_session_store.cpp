/// @file database_session_store.cpp
/// @brief DatabaseSessionStore implementation.

#include "csync/service/database_session_store.hpp"

#include "csync/foundation/game_logger.hpp"

namespace csync::service {

using foundation::DatabaseType;
using foundation::DbValue;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::PreparedStatement;
using foundation::SessionId;

namespace {

std::optional<std::string> columnText(const foundation::DbRow& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    return std::nullopt;
}

int64_t columnInt(const foundation::DbRow& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end()) {
        return 0;
    }
    if (const auto* value = std::get_if<std::int64_t>(&it->second)) {
        return *value;
    }
    // Some drivers hand BIGINT back as text.
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        try {
            return std::stoll(*text);
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

}  // namespace

DatabaseSessionStore::DatabaseSessionStore(foundation::GameDatabase& database,
                                           foundation::GameJobScheduler& jobs,
                                           foundation::CompletionQueue& completions)
    : database_(database), jobs_(jobs), completions_(completions) {}

DatabaseSessionStore::~DatabaseSessionStore() {
    close();
}

// ---------------------------------------------------------------------------
// SQL
// ---------------------------------------------------------------------------

std::string DatabaseSessionStore::createTableSql() {
    return std::string("CREATE TABLE IF NOT EXISTS ") + kTableName +
           " (session_id VARCHAR(64) PRIMARY KEY,"
           " state TEXT NOT NULL,"
           " timestamp_us BIGINT NOT NULL)";
}

std::string DatabaseSessionStore::upsertSql(DatabaseType type) {
    std::string insert = std::string("INSERT INTO ") + kTableName +
                         " (session_id, state, timestamp_us)"
                         " VALUES ($session_id, $state, $timestamp_us)";
    switch (type) {
        case DatabaseType::MySQL:
            return insert +
                   " ON DUPLICATE KEY UPDATE state = VALUES(state),"
                   " timestamp_us = VALUES(timestamp_us)";
        case DatabaseType::PostgreSQL:
        case DatabaseType::SQLite:
            return insert +
                   " ON CONFLICT (session_id) DO UPDATE SET state = excluded.state,"
                   " timestamp_us = excluded.timestamp_us";
    }
    return insert;
}

std::string DatabaseSessionStore::selectSql() {
    return std::string("SELECT session_id, state, timestamp_us FROM ") + kTableName +
           " WHERE session_id = $session_id";
}

// ---------------------------------------------------------------------------
// open() / close()
// ---------------------------------------------------------------------------

GameResult<void> DatabaseSessionStore::open() {
    if (!database_.isConnected()) {
        return GameResult<void>::err(
            GameError(ErrorCode::NotConnected, "database not connected"));
    }
    auto created = database_.execute(createTableSql());
    if (!created) {
        return created;
    }
    open_.store(true);
    CSYNC_LOG_INFO(LogCategory::Database,
                   std::string("session table ready: ") + kTableName);
    return GameResult<void>::ok();
}

void DatabaseSessionStore::close() {
    if (open_.exchange(false)) {
        jobs_.waitAll();
    }
}

bool DatabaseSessionStore::isReady() const {
    return open_.load() && database_.isConnected();
}

void DatabaseSessionStore::complete(std::function<void()> completion) {
    if (!completions_.post(std::move(completion))) {
        CSYNC_LOG_DEBUG(LogCategory::Database,
                        "completion dropped: queue closed");
    }
}

// ---------------------------------------------------------------------------
// write() / read()
// ---------------------------------------------------------------------------

void DatabaseSessionStore::write(SaveRecord record, WriteCallback callback) {
    auto scheduled = jobs_.schedule(
        [this, record = std::move(record), callback]() {
            auto result = guarded<void>("session write", [&]() {
                PreparedStatement stmt(upsertSql(database_.type()));
                stmt.bindString("session_id", record.sessionId.value())
                    .bindString("state", record.payload)
                    .bindInt("timestamp_us", record.timestampUs);
                return database_.execute(stmt);
            });
            if (!result) {
                CSYNC_LOG_ERROR(LogCategory::Database, result.error().describe());
            }
            complete([callback, result]() { callback(result); });
        });

    if (!scheduled) {
        callback(GameResult<void>::err(scheduled.error()));
    }
}

void DatabaseSessionStore::read(const SessionId& id, ReadCallback callback) {
    using ReadResult = GameResult<std::optional<SaveRecord>>;

    auto scheduled = jobs_.schedule([this, id, callback]() {
        auto result = guarded<std::optional<SaveRecord>>("session read", [&]() {
            PreparedStatement stmt(selectSql());
            stmt.bindString("session_id", id.value());

            auto rows = database_.query(stmt);
            if (!rows) {
                return ReadResult::err(rows.error());
            }
            if (rows.value().empty()) {
                return ReadResult::ok(std::nullopt);
            }
            const auto& row = rows.value().front();
            SaveRecord record;
            record.sessionId = SessionId(columnText(row, "session_id").value_or(std::string()));
            record.payload = columnText(row, "state").value_or(std::string());
            record.timestampUs = columnInt(row, "timestamp_us");
            return ReadResult::ok(std::move(record));
        });
        if (!result) {
            CSYNC_LOG_ERROR(LogCategory::Database, result.error().describe());
        }
        complete([callback, result]() { callback(result); });
    });

    if (!scheduled) {
        callback(ReadResult::err(scheduled.error()));
    }
}

} // namespace csync::service
