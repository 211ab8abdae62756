/// @file session_settings.cpp
/// @brief SessionSettings::fromConfig.

#include "csync/service/session_settings.hpp"

#include <cctype>

namespace csync::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<SessionSettings> invalid(std::string message) {
    return GameResult<SessionSettings>::err(
        GameError(ErrorCode::ConfigInvalidValue, std::move(message)));
}

/// "log.network" for LogCategory::Network.
std::string categoryKey(foundation::LogCategory category) {
    std::string key = "log.";
    for (char c : foundation::logCategoryName(category)) {
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

GameResult<std::optional<foundation::LogLevel>> readLevel(const foundation::ConfigManager& config,
                                                          const std::string& key) {
    using LevelResult = GameResult<std::optional<foundation::LogLevel>>;
    if (!config.hasKey(key)) {
        return LevelResult::ok(std::nullopt);
    }
    auto text = config.get<std::string>(key);
    if (!text) {
        return LevelResult::err(text.error());
    }
    auto level = foundation::parseLogLevel(text.value());
    if (!level) {
        return LevelResult::err(GameError(ErrorCode::ConfigInvalidValue,
                                          "unknown " + key + " '" + text.value() + "'"));
    }
    return LevelResult::ok(*level);
}

}  // namespace

std::chrono::milliseconds ReconnectPolicy::delayBefore(uint32_t attempt) const {
    const uint32_t doublings = attempt > 1 ? attempt - 1 : 0;
    auto delay = backoff;
    for (uint32_t i = 0; i < doublings && delay < kMaxBackoff; ++i) {
        delay *= 2;
    }
    return delay < kMaxBackoff ? delay : kMaxBackoff;
}

void SessionSettings::applyLogging(foundation::GameLogger& logger) const {
    if (logLevel) {
        logger.setAllLevels(*logLevel);
    }
    for (std::size_t i = 0; i < categoryLevels.size(); ++i) {
        if (categoryLevels[i]) {
            logger.setCategoryLevel(static_cast<foundation::LogCategory>(i), *categoryLevels[i]);
        }
    }
}

GameResult<SessionSettings> SessionSettings::fromConfig(const foundation::ConfigManager& config) {
    SessionSettings settings;

    auto role = config.getOr<std::string>("session.role", "host");
    if (!role) {
        return GameResult<SessionSettings>::err(role.error());
    }
    auto parsedRole = parseSessionRole(role.value());
    if (!parsedRole) {
        return invalid("session.role must be host or client, got '" + role.value() + "'");
    }
    settings.role = *parsedRole;

    auto autoSave = AutoSaveConfig::fromConfig(config);
    if (!autoSave) {
        return GameResult<SessionSettings>::err(autoSave.error());
    }
    settings.autoSave = autoSave.value();

    auto port = config.getOr<int>("network.port", settings.port);
    if (!port) {
        return GameResult<SessionSettings>::err(port.error());
    }
    if (port.value() <= 0 || port.value() > 65535) {
        return invalid("network.port out of range: " + std::to_string(port.value()));
    }
    settings.port = static_cast<uint16_t>(port.value());

    auto host = config.getOr<std::string>("network.host", settings.host);
    if (!host) {
        return GameResult<SessionSettings>::err(host.error());
    }
    settings.host = host.value();

    auto backend = config.getOr<std::string>("store.backend", "memory");
    if (!backend) {
        return GameResult<SessionSettings>::err(backend.error());
    }
    if (backend.value() == "memory") {
        settings.backend = StoreBackend::Memory;
    } else if (backend.value() == "database") {
        settings.backend = StoreBackend::Database;
    } else {
        return invalid("store.backend must be memory or database, got '" + backend.value() + "'");
    }

    auto type = config.getOr<std::string>("store.type", "postgres");
    if (!type) {
        return GameResult<SessionSettings>::err(type.error());
    }
    auto parsedType = foundation::parseDatabaseType(type.value());
    if (!parsedType) {
        return invalid("unknown store.type '" + type.value() + "'");
    }
    settings.databaseType = *parsedType;

    auto connection = config.getOr<std::string>("store.connection_string", "");
    if (!connection) {
        return GameResult<SessionSettings>::err(connection.error());
    }
    settings.connectionString = connection.value();
    if (settings.backend == StoreBackend::Database && settings.connectionString.empty()) {
        return invalid("store.connection_string is required for the database backend");
    }

    auto tickRate = config.getOr<int>("loop.tick_rate", static_cast<int>(settings.tickRate));
    if (!tickRate) {
        return GameResult<SessionSettings>::err(tickRate.error());
    }
    if (tickRate.value() <= 0) {
        return invalid("loop.tick_rate must be positive");
    }
    settings.tickRate = static_cast<uint32_t>(tickRate.value());

    auto attempts = config.getOr<int>("network.reconnect_attempts",
                                      static_cast<int>(settings.reconnect.attempts));
    if (!attempts) {
        return GameResult<SessionSettings>::err(attempts.error());
    }
    if (attempts.value() < 0) {
        return invalid("network.reconnect_attempts must not be negative");
    }
    settings.reconnect.attempts = static_cast<uint32_t>(attempts.value());

    auto backoff = config.getOr<int>("network.reconnect_backoff_ms",
                                     static_cast<int>(settings.reconnect.backoff.count()));
    if (!backoff) {
        return GameResult<SessionSettings>::err(backoff.error());
    }
    if (backoff.value() <= 0) {
        return invalid("network.reconnect_backoff_ms must be positive");
    }
    settings.reconnect.backoff = std::chrono::milliseconds(backoff.value());

    auto timeout = config.getOr<int>("network.connect_timeout_ms",
                                     static_cast<int>(settings.reconnect.connectTimeout.count()));
    if (!timeout) {
        return GameResult<SessionSettings>::err(timeout.error());
    }
    if (timeout.value() <= 0) {
        return invalid("network.connect_timeout_ms must be positive");
    }
    settings.reconnect.connectTimeout = std::chrono::milliseconds(timeout.value());

    auto level = readLevel(config, "log.level");
    if (!level) {
        return GameResult<SessionSettings>::err(level.error());
    }
    settings.logLevel = level.value();
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        auto categoryLevel = readLevel(config, categoryKey(static_cast<foundation::LogCategory>(i)));
        if (!categoryLevel) {
            return GameResult<SessionSettings>::err(categoryLevel.error());
        }
        settings.categoryLevels[i] = categoryLevel.value();
    }

    return GameResult<SessionSettings>::ok(settings);
}

}  // namespace csync::service
