#pragma once

/// @file session_settings.hpp
/// @brief Typed view of the session executable's configuration.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/game_database.hpp"
#include "csync/foundation/game_logger.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/service/auto_save_scheduler.hpp"
#include "csync/service/session_coordinator.hpp"

namespace csync::service {

/// Where session records are kept.
enum class StoreBackend : uint8_t {
    Memory,
    Database
};

/// How a SessionPeer gets back to the host after losing the connection.
///
/// Attempt n (1-based) waits backoff * 2^(n-1), capped at kMaxBackoff, then
/// connects with connectTimeout. After @c attempts failures the peer stays
/// disconnected; zero attempts disables reconnecting.
struct ReconnectPolicy {
    static constexpr std::chrono::milliseconds kMaxBackoff{30000};

    uint32_t attempts = 3;
    std::chrono::milliseconds backoff{500};
    std::chrono::milliseconds connectTimeout{15000};

    [[nodiscard]] std::chrono::milliseconds delayBefore(uint32_t attempt) const;
};

/// Settings for a SessionHost or SessionPeer.
///
/// | Key                       | Default     |
/// |---------------------------|-------------|
/// | session.role              | host        |
/// | autosave.*                | see AutoSaveConfig |
/// | network.port              | 19100       |
/// | network.host              | 127.0.0.1   |
/// | store.backend             | memory      |
/// | store.type                | postgres    |
/// | store.connection_string   | (empty)     |
/// | loop.tick_rate            | 20          |
/// | log.level                 | (logger defaults) |
/// | log.<category>            | (log.level) |
/// | network.reconnect_attempts   | 3        |
/// | network.reconnect_backoff_ms | 500      |
/// | network.connect_timeout_ms   | 15000    |
struct SessionSettings {
    SessionRole role = SessionRole::Host;
    AutoSaveConfig autoSave;
    uint16_t port = 19100;
    std::string host = "127.0.0.1";
    StoreBackend backend = StoreBackend::Memory;
    foundation::DatabaseType databaseType = foundation::DatabaseType::PostgreSQL;
    std::string connectionString;
    uint32_t tickRate = 20;
    /// Level for every category; unset keeps the logger's defaults.
    std::optional<foundation::LogLevel> logLevel;
    /// Per-category overrides from `log.core`, `log.network`, ...
    std::array<std::optional<foundation::LogLevel>, foundation::kLogCategoryCount> categoryLevels{};
    ReconnectPolicy reconnect;

    /// Build from configuration. Unknown enum text or log level, a zero
    /// port, tick rate, backoff or timeout, a negative attempt count, or a
    /// database backend without a connection string is ConfigInvalidValue.
    static foundation::GameResult<SessionSettings> fromConfig(
        const foundation::ConfigManager& config);

    /// Push the configured levels into @p logger: log.level first, then
    /// the per-category overrides.
    void applyLogging(foundation::GameLogger& logger) const;
};

}  // namespace csync::service
