#pragma once

/// @file status_engine.hpp
/// @brief Status-effect rules wrapped around every action execution.

#include "tbe/battle/action.hpp"
#include "tbe/battle/battle_types.hpp"
#include "tbe/battle/character.hpp"
#include "tbe/foundation/random_source.hpp"

namespace tbe::battle {

/// Execute @p action for @p user against @p target, honoring the user's own
/// statuses first:
///   - Stun n: draw nextU32() % (n + 1). On 0 the stun is removed and the
///     action proceeds; otherwise the turn is lost.
///   - Bleed n: the action proceeds, then the user loses n health.
///   - Otherwise the action simply proceeds.
/// Stun and Bleed never coexist, so at most one branch applies.
BattleLog takeTurn(Character& user, Character& target, const Action& action,
                   foundation::IRandomSource& rng);

/// End-of-round cleanup: drop Defend. Stun and Bleed persist.
void endOfRoundCleanup(Character& character);

}  // namespace tbe::battle
