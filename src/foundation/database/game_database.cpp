/// @file game_database.cpp
/// @brief GameDatabase implementation wrapping kcenon database_system.

#include "csync/foundation/game_database.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <atomic>
#include <cctype>
#include <condition_variable>
#include <mutex>

namespace csync::foundation {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ::database::database_types toKcenon(DatabaseType type) {
    switch (type) {
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::MySQL:      return ::database::database_types::mysql;
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::postgres;
}

static QueryResult convertResult(
    const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

std::optional<DatabaseType> parseDatabaseType(std::string_view name) {
    if (name == "postgres" || name == "postgresql") {
        return DatabaseType::PostgreSQL;
    }
    if (name == "mysql") {
        return DatabaseType::MySQL;
    }
    if (name == "sqlite") {
        return DatabaseType::SQLite;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(
    std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(
    std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

std::string_view PreparedStatement::sql() const noexcept {
    return sql_;
}

std::string PreparedStatement::resolve() const {
    std::string resolved = sql_;

    for (const auto& [name, val] : params_) {
        std::string placeholder = "$" + name;
        std::string replacement;

        std::visit([&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, DbNull>) {
                replacement = "NULL";
            } else if constexpr (std::is_same_v<T, std::string>) {
                std::string escaped;
                escaped.reserve(arg.size() + 2);
                escaped += '\'';
                for (char c : arg) {
                    if (c == '\'') {
                        escaped += "''";
                    } else {
                        escaped += c;
                    }
                }
                escaped += '\'';
                replacement = std::move(escaped);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                replacement = std::to_string(arg);
            } else if constexpr (std::is_same_v<T, double>) {
                replacement = std::to_string(arg);
            } else if constexpr (std::is_same_v<T, bool>) {
                replacement = arg ? "TRUE" : "FALSE";
            }
        }, val);

        std::size_t pos = 0;
        while ((pos = resolved.find(placeholder, pos)) != std::string::npos) {
            // Match the full parameter name ($id must not hit $identity).
            auto endPos = pos + placeholder.size();
            if (endPos < resolved.size() &&
                (std::isalnum(static_cast<unsigned char>(resolved[endPos])) ||
                 resolved[endPos] == '_')) {
                pos = endPos;
                continue;
            }
            resolved.replace(pos, placeholder.size(), replacement);
            pos += replacement.size();
        }
    }

    return resolved;
}

void PreparedStatement::clearBindings() {
    params_.clear();
}

// ---------------------------------------------------------------------------
// GameDatabase::Impl
// ---------------------------------------------------------------------------

struct PooledConnection {
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool inUse = false;
};

struct GameDatabase::Impl {
    DatabaseConfig config;

    std::vector<PooledConnection> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    // Checkout a connection from the pool (blocking with timeout)
    std::shared_ptr<::database::database_manager> checkout() {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            for (auto& conn : pool) {
                if (!conn.inUse) {
                    conn.inUse = true;
                    return conn.manager;
                }
            }

            if (pool.size() < config.maxConnections) {
                auto conn = createConnection();
                if (conn.manager) {
                    conn.inUse = true;
                    auto mgr = conn.manager;
                    pool.push_back(std::move(conn));
                    return mgr;
                }
            }

            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return nullptr;
            }
        }
    }

    void checkin(::database::database_manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    PooledConnection createConnection() {
        PooledConnection conn;
        conn.context = std::make_shared<::database::database_context>();
        conn.manager = std::make_shared<::database::database_manager>(conn.context);

        if (!conn.manager->set_mode(toKcenon(config.dbType))) {
            conn.manager.reset();
            return conn;
        }

        auto result = conn.manager->connect_result(config.connectionString);
        if (!result.is_ok()) {
            conn.manager.reset();
            return conn;
        }

        return conn;
    }
};

// ---------------------------------------------------------------------------
// Construction / destruction / move
// ---------------------------------------------------------------------------

GameDatabase::GameDatabase()
    : impl_(std::make_unique<Impl>()) {}

GameDatabase::~GameDatabase() {
    if (impl_) {
        disconnect();
    }
}

GameDatabase::GameDatabase(GameDatabase&&) noexcept = default;

GameDatabase& GameDatabase::operator=(GameDatabase&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

// ---------------------------------------------------------------------------
// connect() / disconnect()
// ---------------------------------------------------------------------------

GameResult<void> GameDatabase::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "already connected"));
    }

    impl_->config = config;

    for (uint32_t i = 0; i < config.minConnections; ++i) {
        auto conn = impl_->createConnection();
        if (!conn.manager) {
            disconnect();
            return GameResult<void>::err(
                GameError(ErrorCode::DatabaseError,
                          "failed to create connection " +
                              std::to_string(i + 1) + "/" +
                              std::to_string(config.minConnections)));
        }
        std::lock_guard lock(impl_->poolMutex);
        impl_->pool.push_back(std::move(conn));
    }

    impl_->connected.store(true);
    return GameResult<void>::ok();
}

void GameDatabase::disconnect() {
    impl_->connected.store(false);

    std::lock_guard lock(impl_->poolMutex);
    for (auto& conn : impl_->pool) {
        if (conn.manager) {
            (void)conn.manager->disconnect_result();
        }
    }
    impl_->pool.clear();
}

bool GameDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

DatabaseType GameDatabase::type() const noexcept {
    return impl_->config.dbType;
}

// ---------------------------------------------------------------------------
// query() / execute()
// ---------------------------------------------------------------------------

GameResult<QueryResult> GameDatabase::query(std::string_view sql) {
    if (!impl_->connected.load()) {
        return GameResult<QueryResult>::err(
            GameError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return GameResult<QueryResult>::err(
            GameError(ErrorCode::ConnectionPoolExhausted,
                      "no available connections in pool"));
    }

    auto result = mgr->select_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return GameResult<QueryResult>::err(
            GameError(ErrorCode::QueryFailed, result.error().message));
    }

    return GameResult<QueryResult>::ok(convertResult(result.value()));
}

GameResult<void> GameDatabase::execute(std::string_view sql) {
    if (!impl_->connected.load()) {
        return GameResult<void>::err(
            GameError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConnectionPoolExhausted,
                      "no available connections in pool"));
    }

    auto result = mgr->execute_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return GameResult<void>::err(
            GameError(ErrorCode::QueryFailed, result.error().message));
    }

    return GameResult<void>::ok();
}

GameResult<QueryResult> GameDatabase::query(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

GameResult<void> GameDatabase::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve());
}

std::size_t GameDatabase::poolSize() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return impl_->pool.size();
}

} // namespace csync::foundation
