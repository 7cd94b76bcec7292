/// @file turn_order.cpp
/// @brief Turn-order resolution and round driver.

#include "tbe/battle/turn_order.hpp"

#include <string>
#include <utility>

#include "tbe/foundation/game_logger.hpp"

namespace tbe::battle {

Side firstMover(const Action& playerAction, const Character& player,
                const Action& enemyAction, const Character& enemy,
                foundation::IRandomSource& rng) {
    auto playerPriority = playerAction.priority();
    auto enemyPriority = enemyAction.priority();
    if (playerPriority != enemyPriority) {
        return playerPriority > enemyPriority ? Side::Player : Side::Enemy;
    }
    if (player.priority() != enemy.priority()) {
        return player.priority() > enemy.priority() ? Side::Player : Side::Enemy;
    }
    return rng.coinFlip() ? Side::Player : Side::Enemy;
}

const Action& chooseAction(const Character& character, const ActionPool& pool,
                           foundation::IRandomSource& rng) {
    const auto& known = character.attributes.actions;
    if (known.empty()) {
        return ActionPool::skipAction();
    }
    return pool.resolve(known[rng.uniformIndex(known.size())]);
}

TurnOutcome playRound(Battle& battle, const Action& playerAction,
                      const Action& enemyAction, foundation::IRandomSource& rng) {
    auto first = firstMover(playerAction, battle.player(), enemyAction, battle.enemy(), rng);
    TBE_LOG_DEBUG(foundation::LogCategory::Battle,
                  std::string(first == Side::Player ? battle.player().name : battle.enemy().name) +
                  " moves first");

    BattleLog log;
    auto append = [&log](BattleLog lines) {
        log.insert(log.end(), lines.begin(), lines.end());
    };

    if (first == Side::Player) {
        append(battle.playerTurn(playerAction, rng));
        append(battle.enemyTurn(enemyAction, rng));
    } else {
        append(battle.enemyTurn(enemyAction, rng));
        append(battle.playerTurn(playerAction, rng));
    }

    auto outcome = battle.endTurn(rng);
    log.insert(log.end(), outcome.log.begin(), outcome.log.end());
    outcome.log = std::move(log);
    return outcome;
}

}  // namespace tbe::battle
