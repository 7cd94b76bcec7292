#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible engine collaborator.

#include "tbe/core/result.hpp"
#include "tbe/foundation/game_error.hpp"

namespace tbe::foundation {

/// Result specialized with GameError.
///
/// Example:
/// @code
///   GameResult<uint32_t> readLevel(const ConfigManager& config) {
///       auto level = config.get<uint32_t>("simulator.player_level");
///       if (!level) {
///           return GameResult<uint32_t>::err(level.error());
///       }
///       return GameResult<uint32_t>::ok(std::max(level.value(), 1u));
///   }
/// @endcode
template <typename T>
using GameResult = tbe::Result<T, GameError>;

} // namespace tbe::foundation
