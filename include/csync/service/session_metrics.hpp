#pragma once

/// @file session_metrics.hpp
/// @brief Metric names published by the session layer.

namespace csync::service::metrics {

constexpr const char* kSavesTotal = "csync_saves_total";
constexpr const char* kSaveFailuresTotal = "csync_save_failures_total";
constexpr const char* kLoadsTotal = "csync_loads_total";
constexpr const char* kLoadFailuresTotal = "csync_load_failures_total";
constexpr const char* kAutoSaveDroppedTotal = "csync_autosave_dropped_total";
constexpr const char* kPeersConnected = "csync_peers_connected";

}  // namespace csync::service::metrics
