#pragma once

/// @file character_codec.hpp
/// @brief YAML persistence for characters.
///
/// Every field survives a round trip: species (including ratio precision),
/// progression attributes, known action ids, and battle state with the full
/// status mapping.

#include <string>
#include <string_view>

#include "tbe/battle/character.hpp"
#include "tbe/battle/experience.hpp"
#include "tbe/foundation/game_result.hpp"

namespace tbe::content {

foundation::GameResult<std::string> encodeCharacter(const battle::Character& character);

/// Fails with DecodeFailed when the document is malformed or the character
/// breaks its invariants: health outside [0, stats.health], or experience
/// not below rules.experienceToLevel.
foundation::GameResult<battle::Character> decodeCharacter(
    std::string_view document, const battle::ProgressionRules& rules = {});

}  // namespace tbe::content
