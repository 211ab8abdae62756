/// @file auto_save_scheduler.cpp
/// @brief AutoSaveScheduler implementation.

#include "csync/service/auto_save_scheduler.hpp"

#include "csync/foundation/game_logger.hpp"
#include "csync/foundation/game_metrics.hpp"
#include "csync/service/session_metrics.hpp"

namespace csync::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::SessionId;

// ---------------------------------------------------------------------------
// AutoSaveConfig
// ---------------------------------------------------------------------------

GameResult<AutoSaveConfig> AutoSaveConfig::fromConfig(const foundation::ConfigManager& config) {
    AutoSaveConfig result;

    auto enabled = config.getOr<bool>("autosave.enabled", result.enabled);
    if (!enabled) {
        return GameResult<AutoSaveConfig>::err(enabled.error());
    }
    auto seconds = config.getOr<int64_t>("autosave.interval_seconds", result.interval.count());
    if (!seconds) {
        return GameResult<AutoSaveConfig>::err(seconds.error());
    }
    auto moves = config.getOr<int64_t>("autosave.move_interval", result.moveInterval);
    if (!moves) {
        return GameResult<AutoSaveConfig>::err(moves.error());
    }

    if (seconds.value() <= 0) {
        return GameResult<AutoSaveConfig>::err(
            GameError(ErrorCode::ConfigInvalidValue,
                      "autosave.interval_seconds must be positive"));
    }
    if (moves.value() <= 0) {
        return GameResult<AutoSaveConfig>::err(
            GameError(ErrorCode::ConfigInvalidValue,
                      "autosave.move_interval must be positive"));
    }

    result.enabled = enabled.value();
    result.interval = std::chrono::seconds(seconds.value());
    result.moveInterval = moves.value();
    return GameResult<AutoSaveConfig>::ok(result);
}

// ---------------------------------------------------------------------------
// AutoSaveScheduler
// ---------------------------------------------------------------------------

AutoSaveScheduler::AutoSaveScheduler(SessionCoordinator& coordinator, AutoSaveConfig config)
    : coordinator_(coordinator),
      config_(config),
      moveConnection_(coordinator.onMoveRecorded,
                      [this](int64_t index) { onMove(index); }),
      startConnection_(coordinator.onSessionStarted,
                       [this](const SessionId&) { rearm(); }),
      endConnection_(coordinator.onSessionEnded, [this](const SessionId&) {
          timerArmed_ = false;
          elapsed_ = std::chrono::milliseconds(0);
          CSYNC_LOG_DEBUG(LogCategory::Scheduler, "auto-save timer cancelled");
      }) {
    // Constructed mid-session: the timer starts now.
    auto phase = coordinator_.phase();
    timerArmed_ = phase != SessionPhase::Uninitialized && phase != SessionPhase::Ended;
}

void AutoSaveScheduler::rearm() {
    timerArmed_ = true;
    elapsed_ = std::chrono::milliseconds(0);
    lastTriggeredMove_.reset();
}

void AutoSaveScheduler::setEnabled(bool enabled) {
    if (config_.enabled == enabled) {
        return;
    }
    config_.enabled = enabled;
    elapsed_ = std::chrono::milliseconds(0);
    CSYNC_LOG_INFO(LogCategory::Scheduler,
                   enabled ? "auto-save enabled" : "auto-save disabled");
}

bool AutoSaveScheduler::canFire() const {
    if (!config_.enabled || !coordinator_.isHost()) {
        return false;
    }
    auto phase = coordinator_.phase();
    return phase != SessionPhase::Uninitialized && phase != SessionPhase::Ended;
}

void AutoSaveScheduler::update(std::chrono::milliseconds delta) {
    if (!timerArmed_ || !canFire()) {
        return;
    }

    elapsed_ += delta;
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.interval);
    if (elapsed_ < interval) {
        return;
    }
    // Missed periods collapse into one save.
    elapsed_ %= interval;
    fire("interval");
}

void AutoSaveScheduler::onMove(int64_t halfMoveIndex) {
    if (!canFire()) {
        return;
    }
    if (halfMoveIndex <= 0 || halfMoveIndex % config_.moveInterval != 0) {
        return;
    }
    if (lastTriggeredMove_ && *lastTriggeredMove_ == halfMoveIndex) {
        return;
    }
    if (halfMoveIndex <= coordinator_.state().lastSavedMoveIndex) {
        return;
    }
    lastTriggeredMove_ = halfMoveIndex;
    fire("move count");
}

void AutoSaveScheduler::fire(const char* reason) {
    auto requested = coordinator_.save();
    if (!requested) {
        ++dropped_;
        coordinator_.metrics().incrementCounter(metrics::kAutoSaveDroppedTotal);
        CSYNC_LOG_INFO(LogCategory::Scheduler,
                       std::string("auto-save (") + reason + ") dropped: " +
                           requested.error().describe());
        return;
    }
    ++triggered_;
    CSYNC_LOG_DEBUG(LogCategory::Scheduler, std::string("auto-save (") + reason + ") requested");
}

}  // namespace csync::service
