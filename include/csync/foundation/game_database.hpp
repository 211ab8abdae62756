#pragma once

/// @file game_database.hpp
/// @brief GameDatabase wrapping kcenon database_system with a small
///        connection pool and named-parameter statements.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "csync/foundation/game_result.hpp"

namespace csync::foundation {

// ── Type aliases for database values ────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value in a query result row.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name → value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set from a SELECT query.
using QueryResult = std::vector<DbRow>;

/// Supported database backend types.
enum class DatabaseType : uint8_t {
    PostgreSQL,
    MySQL,
    SQLite
};

/// Parse "postgres" / "postgresql", "mysql" or "sqlite".
[[nodiscard]] std::optional<DatabaseType> parseDatabaseType(std::string_view name);

/// Configuration for GameDatabase connection pool.
struct DatabaseConfig {
    std::string connectionString;
    DatabaseType dbType = DatabaseType::PostgreSQL;
    uint32_t minConnections = 1;
    uint32_t maxConnections = 4;
    std::chrono::seconds connectionTimeout{10};
};

// ── PreparedStatement ───────────────────────────────────────────────────────

/// A parameterized SQL statement with named parameter binding.
///
/// Parameters are written as $name placeholders and substituted by
/// resolve(). String values are quoted with embedded quotes doubled.
///
/// Example:
/// @code
///   PreparedStatement stmt("SELECT state FROM game_states WHERE session_id = $id");
///   stmt.bindString("id", "a1b2c3d4");
///   auto rows = db.execute(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);
    PreparedStatement& bindInt(std::string_view name, std::int64_t value);
    PreparedStatement& bindNull(std::string_view name);

    [[nodiscard]] std::string_view sql() const noexcept;

    /// Resolve the SQL template with all bound parameters substituted.
    [[nodiscard]] std::string resolve() const;

    void clearBindings();

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

// ── GameDatabase ────────────────────────────────────────────────────────────

/// Database adapter wrapping kcenon's database_system.
///
/// Calls block the calling thread; run them on a worker (GameJobScheduler)
/// rather than the session thread. Uses PIMPL to hide all kcenon
/// implementation details.
///
/// Example:
/// @code
///   GameDatabase db;
///   DatabaseConfig config;
///   config.connectionString = "host=localhost dbname=chess";
///   config.dbType = DatabaseType::PostgreSQL;
///
///   auto result = db.connect(config);
///   if (result.hasValue()) {
///       auto rows = db.query("SELECT session_id FROM game_states");
///   }
/// @endcode
class GameDatabase {
public:
    GameDatabase();
    ~GameDatabase();

    GameDatabase(const GameDatabase&) = delete;
    GameDatabase& operator=(const GameDatabase&) = delete;
    GameDatabase(GameDatabase&&) noexcept;
    GameDatabase& operator=(GameDatabase&&) noexcept;

    // ── Connection management ───────────────────────────────────────────

    /// Connect to the database and open the minimum pool connections.
    [[nodiscard]] GameResult<void> connect(const DatabaseConfig& config);

    /// Disconnect all pooled connections.
    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    /// Backend type of the current connection.
    [[nodiscard]] DatabaseType type() const noexcept;

    // ── Queries ─────────────────────────────────────────────────────────

    /// Execute a SELECT query and return the result set.
    [[nodiscard]] GameResult<QueryResult> query(std::string_view sql);

    /// Execute a command (INSERT/UPDATE/DELETE/DDL).
    [[nodiscard]] GameResult<void> execute(std::string_view sql);

    /// Execute a prepared SELECT and return the result set.
    [[nodiscard]] GameResult<QueryResult> query(const PreparedStatement& stmt);

    /// Execute a prepared command.
    [[nodiscard]] GameResult<void> execute(const PreparedStatement& stmt);

    /// Total number of connections in the pool.
    [[nodiscard]] std::size_t poolSize() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace csync::foundation
