#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the session executable.
///
/// Provides signal handling, configuration loading, graceful shutdown
/// coordination, and CLI argument parsing.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/game_result.hpp"

namespace csync::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// The destructor restores the default handlers so that a second signal
/// terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks in registration order.
///
/// The session executable registers: end the session (cancels the
/// auto-save timer), stop the loop, drain the last completions, close the
/// store, stop the network.
///
/// A hook that throws is logged and the next hook still runs. Once the
/// drain timeout has elapsed, the remaining hooks are skipped with a
/// warning.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("session", [&]() { (void)coordinator.endSession(); });
///   shutdown.addHook("loop",    [&]() { loop.stop(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all registered hooks in order.
    /// @return Number of hooks that completed without throwing.
    std::size_t execute();

    [[nodiscard]] std::size_t hookCount() const;

    void setDrainTimeout(std::chrono::milliseconds timeout);

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::milliseconds drainTimeout_{std::chrono::seconds(30)};
};

/// Default config location when neither --config nor CSYNC_CONFIG_PATH
/// is given.
inline constexpr const char* kDefaultConfigPath = "/etc/csync/csync.yaml";

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. CSYNC_CONFIG_PATH environment variable (if set and non-empty)
///   2. @p defaultPath parameter
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] csync::foundation::GameResult<void>
loadConfig(csync::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

}  // namespace csync::service
