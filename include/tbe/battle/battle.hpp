#pragma once

/// @file battle.hpp
/// @brief Battle: two-character turn engine.
///
/// A Battle owns copies of the player and the enemy for its duration.
/// Per round the caller resolves turn order (see turn_order.hpp), invokes
/// playerTurn()/enemyTurn() in that order, then endTurn().
///
/// State machine (pure function of current health, never cached):
///   player health 0 -> Defeat   (checked first)
///   enemy health 0  -> Victory
///   otherwise       -> InProgress

#include <cstdint>

#include "tbe/battle/action.hpp"
#include "tbe/battle/battle_types.hpp"
#include "tbe/battle/character.hpp"
#include "tbe/battle/experience.hpp"
#include "tbe/foundation/random_source.hpp"

namespace tbe::battle {

/// Result of Battle::endTurn().
struct TurnOutcome {
    BattleStatus status = BattleStatus::InProgress;
    BattleLog log;
};

class Battle {
public:
    Battle(Character player, Character enemy, ProgressionRules rules = {});

    [[nodiscard]] BattleStatus status() const noexcept;

    /// Run the player's action through the status engine.
    /// Empty log when the battle is already decided.
    BattleLog playerTurn(const Action& action, foundation::IRandomSource& rng);

    /// Run the enemy's action through the status engine.
    /// Empty log when the battle is already decided.
    BattleLog enemyTurn(const Action& action, foundation::IRandomSource& rng);

    /// Close the round.
    ///
    /// Victory: awards experienceValue(enemy) / player level to the player.
    /// Defeat: no reward. InProgress: removes Defend from both sides.
    /// Calling refresh() on the survivors afterwards is the caller's job.
    TurnOutcome endTurn(foundation::IRandomSource& rng);

    [[nodiscard]] const Character& player() const noexcept { return player_; }
    [[nodiscard]] const Character& enemy() const noexcept { return enemy_; }

    [[nodiscard]] Character& player() noexcept { return player_; }
    [[nodiscard]] Character& enemy() noexcept { return enemy_; }

    [[nodiscard]] const ProgressionRules& rules() const noexcept { return rules_; }

    /// Rounds closed so far by endTurn().
    [[nodiscard]] uint32_t round() const noexcept { return round_; }

private:
    Character player_;
    Character enemy_;
    ProgressionRules rules_;
    uint32_t round_ = 0;
};

}  // namespace tbe::battle
