#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for the common foundation: error types, Result
///        aliases, ids, signals, the completion queue and configuration.

#include "csync/foundation/completion_queue.hpp"
#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/error_code.hpp"
#include "csync/foundation/game_error.hpp"
#include "csync/foundation/game_result.hpp"
#include "csync/foundation/signal.hpp"
#include "csync/foundation/types.hpp"
