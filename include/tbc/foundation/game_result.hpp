#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for battle-core error handling.

#include "tbc/core/result.hpp"
#include "tbc/foundation/game_error.hpp"

namespace tbc::foundation {

/// Result type specialized with GameError.
///
/// Invalid input (dead unit, target out of reach, unit outside the turn
/// window) is reported through GameResult and never thrown.
///
/// Example:
/// @code
///   GameResult<int32_t> spend(int32_t cost, int32_t budget) {
///       if (cost > budget) {
///           return GameResult<int32_t>::err(
///               GameError(ErrorCode::InsufficientMovement, "not enough movement"));
///       }
///       return GameResult<int32_t>::ok(budget - cost);
///   }
/// @endcode
template <typename T>
using GameResult = tbc::Result<T, GameError>;

/// Shorthand for building an error result with a code and message.
template <typename T>
[[nodiscard]] GameResult<T> makeError(ErrorCode code, std::string message) {
    return GameResult<T>::err(GameError(code, std::move(message)));
}

}  // namespace tbc::foundation
