#pragma once

/// @file turn_order.hpp
/// @brief Turn-order policy and the round driver used by battle callers.

#include <cstdint>

#include "tbe/battle/action.hpp"
#include "tbe/battle/action_pool.hpp"
#include "tbe/battle/battle.hpp"
#include "tbe/battle/character.hpp"
#include "tbe/foundation/random_source.hpp"

namespace tbe::battle {

enum class Side : uint8_t { Player, Enemy };

/// Which side acts first this round.
///
/// Strictly higher action priority wins; on a tie strictly higher speed
/// wins; on a full tie a fair coin decides. The coin is only drawn on a
/// full tie.
[[nodiscard]] Side firstMover(const Action& playerAction, const Character& player,
                              const Action& enemyAction, const Character& enemy,
                              foundation::IRandomSource& rng);

/// A uniformly random action from @p character's known ids, resolved
/// through @p pool. Skip if the character knows nothing.
[[nodiscard]] const Action& chooseAction(const Character& character, const ActionPool& pool,
                                         foundation::IRandomSource& rng);

/// One full round: order both actions, run both turns, close the round.
/// The returned log holds the turn narration followed by endTurn()'s lines.
TurnOutcome playRound(Battle& battle, const Action& playerAction,
                      const Action& enemyAction, foundation::IRandomSource& rng);

}  // namespace tbe::battle
