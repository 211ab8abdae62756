#pragma once

/// @file game_metrics.hpp
/// @brief In-memory counters and gauges with Prometheus text export.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace csync::foundation {

/// Process-wide metric registry.
///
/// Counters and gauges are created on first use. Thread-safe: the network
/// and database threads update gauges while the session thread counts
/// saves and loads.
///
/// Example:
/// @code
///   auto& metrics = GameMetrics::instance();
///   metrics.incrementCounter("csync_saves_total");
///   metrics.incrementGauge("csync_peers_connected");
///   std::string text = metrics.scrape();
/// @endcode
class GameMetrics {
public:
    GameMetrics();
    ~GameMetrics();

    GameMetrics(const GameMetrics&) = delete;
    GameMetrics& operator=(const GameMetrics&) = delete;
    GameMetrics(GameMetrics&&) noexcept;
    GameMetrics& operator=(GameMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    /// Increment a counter by the given value (default 1).
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Read the current counter value. Returns 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    void setGauge(std::string_view name, double value);
    void incrementGauge(std::string_view name, double delta = 1.0);
    void decrementGauge(std::string_view name, double delta = 1.0);

    /// Read the current gauge value. Returns 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    // ── Export ───────────────────────────────────────────────────────────

    /// Serialize all metrics in Prometheus text exposition format,
    /// sorted by metric name.
    [[nodiscard]] std::string scrape() const;

    /// Clear all metrics. Intended for tests.
    void reset();

    /// Access the global GameMetrics instance.
    static GameMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace csync::foundation
