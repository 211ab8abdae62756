#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for framework error handling.

#include "csync/core/result.hpp"
#include "csync/foundation/game_error.hpp"

namespace csync::foundation {

/// Result type specialized with GameError for framework operations.
///
/// Every adapter, codec and session method that can fail returns
/// GameResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   GameResult<Square> parseSquare(std::string_view text) {
///       auto sq = Square::fromAlgebraic(text);
///       if (!sq) {
///           return GameResult<Square>::err(
///               GameError(ErrorCode::MalformedSnapshot, "bad square"));
///       }
///       return GameResult<Square>::ok(*sq);
///   }
/// @endcode
template <typename T>
using GameResult = csync::Result<T, GameError>;

}  // namespace csync::foundation
