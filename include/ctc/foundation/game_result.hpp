#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible operation.

#include "ctc/core/result.hpp"
#include "ctc/foundation/game_error.hpp"

namespace ctc::foundation {

/// Result type specialized with GameError.
///
/// @code
///   GameResult<int> parseTick(int ms) {
///       if (ms <= 0) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidArgument, "tick must be positive"));
///       }
///       return GameResult<int>::ok(ms);
///   }
/// @endcode
template <typename T>
using GameResult = ctc::Result<T, GameError>;

}  // namespace ctc::foundation