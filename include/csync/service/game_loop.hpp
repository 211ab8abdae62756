#pragma once

/// @file game_loop.hpp
/// @brief Fixed-rate session loop with frame timing and metrics.
///
/// GameLoop runs a tick callback at a configurable rate (default 20 Hz =
/// 50 ms per tick) on a dedicated thread, which becomes the session thread:
/// the callback drains the completion queue and advances the auto-save
/// scheduler. Each tick measures its own duration and flags overruns.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace csync::service {

/// Per-tick performance metrics.
struct TickMetrics {
    /// Time spent in the tick callback.
    std::chrono::microseconds updateTime{0};

    /// Wall time since the previous tick started (target time for the first
    /// tick and for manual ticks).
    std::chrono::microseconds frameTime{0};

    /// Ratio of updateTime to target frame time (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Monotonically increasing tick counter (starts at 0).
    uint64_t tickNumber = 0;

    /// True when updateTime exceeded the target frame time.
    bool overrun = false;
};

/// Fixed-rate loop on a dedicated thread.
///
/// Usage:
/// @code
///   GameLoop loop(20);
///   loop.setTickCallback([&](std::chrono::milliseconds delta) {
///       completions.drain();
///       autoSave.update(delta);
///   });
///   (void)loop.start();
///   // ...
///   loop.stop();
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(std::chrono::milliseconds delta)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate  Ticks per second; 0 falls back to 20.
    explicit GameLoop(uint32_t tickRate = 20);

    ~GameLoop();

    // Non-copyable, non-movable (owns a thread).
    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    /// Set the callback invoked each tick with the elapsed time.
    void setTickCallback(TickCallback callback);

    /// Set an optional callback invoked after each tick with metrics.
    void setMetricsCallback(MetricsCallback callback);

    /// Start the loop on a dedicated thread.
    ///
    /// @return true on success, false if already running.
    [[nodiscard]] bool start();

    /// Signal the loop to stop and wait for the thread to join.
    /// The tick in progress completes first.
    void stop();

    /// Execute a single tick manually with the target frame time as delta.
    ///
    /// The loop must not be running on a thread when calling this.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept;
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;
    [[nodiscard]] uint64_t tickCount() const noexcept;

    /// Metrics from the last completed tick.
    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    void run();
    TickMetrics executeTick(std::chrono::microseconds frameTime);

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;

    mutable std::mutex callbackMutex_;
};

}  // namespace csync::service
