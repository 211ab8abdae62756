#pragma once

/// @file auto_save_scheduler.hpp
/// @brief Interval and move-count driven auto-save on top of the
///        SessionCoordinator.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/service/session_coordinator.hpp"

namespace csync::service {

/// Auto-save settings (`autosave.*` config keys).
struct AutoSaveConfig {
    bool enabled = false;
    std::chrono::seconds interval{60};
    int64_t moveInterval = 5;

    /// Read `autosave.enabled`, `autosave.interval_seconds` and
    /// `autosave.move_interval`; absent keys keep their defaults.
    /// A non-positive interval is ConfigInvalidValue.
    static foundation::GameResult<AutoSaveConfig> fromConfig(
        const foundation::ConfigManager& config);
};

/// Drives SessionCoordinator::save() from two triggers.
///
/// - Interval: a cooperative timer advanced by update(). Fires once the
///   accumulated time reaches the interval; at most one save per update().
/// - Move count: fires for a half-move index that is a positive multiple
///   of moveInterval, once per index, and never for an index at or below
///   the last saved index.
///
/// Both triggers run only while enabled, on the host, with the session
/// started. A save the coordinator rejects (one already running, store
/// unavailable) is dropped and counted; nothing is retried.
///
/// The scheduler listens to the coordinator: session end cancels the timer
/// and a new session or new game re-arms it from zero.
class AutoSaveScheduler {
public:
    AutoSaveScheduler(SessionCoordinator& coordinator, AutoSaveConfig config);

    AutoSaveScheduler(const AutoSaveScheduler&) = delete;
    AutoSaveScheduler& operator=(const AutoSaveScheduler&) = delete;

    /// Disabling discards the elapsed time.
    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const noexcept { return config_.enabled; }

    /// Advance the interval timer.
    void update(std::chrono::milliseconds delta);

    [[nodiscard]] std::chrono::milliseconds elapsed() const noexcept { return elapsed_; }
    [[nodiscard]] const AutoSaveConfig& config() const noexcept { return config_; }

    /// Saves requested and accepted by the coordinator.
    [[nodiscard]] std::size_t triggeredCount() const noexcept { return triggered_; }

    /// Triggers the coordinator rejected.
    [[nodiscard]] std::size_t droppedCount() const noexcept { return dropped_; }

private:
    [[nodiscard]] bool canFire() const;
    void fire(const char* reason);
    void onMove(int64_t halfMoveIndex);
    void rearm();

    SessionCoordinator& coordinator_;
    AutoSaveConfig config_;

    std::chrono::milliseconds elapsed_{0};
    bool timerArmed_ = false;
    std::optional<int64_t> lastTriggeredMove_;
    std::size_t triggered_ = 0;
    std::size_t dropped_ = 0;

    foundation::ScopedConnection<int64_t> moveConnection_;
    foundation::ScopedConnection<const foundation::SessionId&> startConnection_;
    foundation::ScopedConnection<const foundation::SessionId&> endConnection_;
};

}  // namespace csync::service
