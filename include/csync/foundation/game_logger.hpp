#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon logger interfaces for structured,
///        category-filtered session logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "csync/foundation/game_result.hpp"
#include "csync/foundation/types.hpp"

namespace csync::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
///
/// Each category can have its own minimum log level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Process lifecycle, configuration
    Session     = 1, ///< Coordinator state machine
    Codec       = 2, ///< Snapshot encode/decode
    Persistence = 3, ///< Gateway and store backends
    Replication = 4, ///< Channel, replicas
    Scheduler   = 5, ///< Auto-save triggers
    Network     = 6, ///< Transport adapters
    Database    = 7  ///< SQL backend
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Session", "Codec", "Persistence",
        "Replication", "Scheduler", "Network", "Database"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("info", "WARNING", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.sessionId = SessionId("a1b2c3d4");
///   ctx.moveIndex = 10;
///   logger.logWithContext(LogLevel::Info, LogCategory::Session,
///                         "Save completed", ctx);
/// @endcode
struct LogContext {
    std::optional<SessionId> sessionId;
    std::optional<PeerId> peerId;
    std::optional<int64_t> moveIndex;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logger registry.
///
/// A logger named "csync.<Category>" is used when one is registered in
/// the kcenon GlobalLoggerRegistry, otherwise the registry's default
/// logger. Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Session     | Info          |
/// | Codec       | Warning       |
/// | Persistence | Info          |
/// | Replication | Info          |
/// | Scheduler   | Debug         |
/// | Network     | Info          |
/// | Database    | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as
    /// " {key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum level on every category.
    void setAllLevels(LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the process-wide GameLogger instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace csync::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global: macros ignore namespaces)
// ---------------------------------------------------------------------------

/// @name CSYNC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// CSYNC_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CSYNC_MIN_LOG_LEVEL
    #define CSYNC_MIN_LOG_LEVEL 0
#endif

#define CSYNC_LOG(level, cat, msg)                                                 \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CSYNC_MIN_LOG_LEVEL &&                      \
            ::csync::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::csync::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CSYNC_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CSYNC_MIN_LOG_LEVEL &&                      \
            ::csync::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::csync::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CSYNC_LOG_DEBUG(cat, msg) \
    CSYNC_LOG(::csync::foundation::LogLevel::Debug, (cat), (msg))

#define CSYNC_LOG_INFO(cat, msg) \
    CSYNC_LOG(::csync::foundation::LogLevel::Info, (cat), (msg))

#define CSYNC_LOG_WARN(cat, msg) \
    CSYNC_LOG(::csync::foundation::LogLevel::Warning, (cat), (msg))

#define CSYNC_LOG_ERROR(cat, msg) \
    CSYNC_LOG(::csync::foundation::LogLevel::Error, (cat), (msg))

/// @}
