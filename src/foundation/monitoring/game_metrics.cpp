/// @file game_metrics.cpp
/// @brief In-memory implementation of GameMetrics.

#include "csync/foundation/game_metrics.hpp"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace csync::foundation {

namespace {

// Atomic double add using a CAS loop.
void atomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(
        current, current + delta, std::memory_order_release, std::memory_order_relaxed)) {
    }
}

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct GameMetrics::Impl {
    // The map is guarded for insertion; values are atomics.
    mutable std::mutex counterMutex;
    std::unordered_map<std::string, std::atomic<uint64_t>> counters;

    mutable std::mutex gaugeMutex;
    std::unordered_map<std::string, std::atomic<double>> gauges;
};

// ── Construction / destruction / move ───────────────────────────────────────

GameMetrics::GameMetrics() : impl_(std::make_unique<Impl>()) {}

GameMetrics::~GameMetrics() = default;

GameMetrics::GameMetrics(GameMetrics&&) noexcept = default;

GameMetrics& GameMetrics::operator=(GameMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void GameMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    impl_->counters[std::string(name)].fetch_add(value, std::memory_order_relaxed);
}

uint64_t GameMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(std::string(name));
    if (it == impl_->counters.end()) {
        return 0;
    }
    return it->second.load(std::memory_order_relaxed);
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void GameMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges[std::string(name)].store(value, std::memory_order_release);
}

void GameMetrics::incrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    atomicAdd(impl_->gauges[std::string(name)], delta);
}

void GameMetrics::decrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    atomicAdd(impl_->gauges[std::string(name)], -delta);
}

double GameMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(std::string(name));
    if (it == impl_->gauges.end()) {
        return 0.0;
    }
    return it->second.load(std::memory_order_acquire);
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string GameMetrics::scrape() const {
    std::map<std::string, std::string> lines;

    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [name, value] : impl_->counters) {
            lines[name] = "# TYPE " + name + " counter\n" + name + " " +
                          std::to_string(value.load(std::memory_order_relaxed)) + "\n";
        }
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        for (const auto& [name, value] : impl_->gauges) {
            lines[name] = "# TYPE " + name + " gauge\n" + name + " " +
                          formatDouble(value.load(std::memory_order_acquire)) + "\n";
        }
    }

    std::string out;
    for (const auto& [name, text] : lines) {
        out += text;
    }
    return out;
}

// ── Reset ───────────────────────────────────────────────────────────────────

void GameMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
}

GameMetrics& GameMetrics::instance() {
    static GameMetrics inst;
    return inst;
}

}  // namespace csync::foundation
