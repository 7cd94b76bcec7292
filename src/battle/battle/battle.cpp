/// @file battle.cpp
/// @brief Battle turn engine.

#include "tbe/battle/battle.hpp"

#include <algorithm>
#include <utility>

#include "tbe/battle/status_engine.hpp"
#include "tbe/foundation/game_logger.hpp"

namespace tbe::battle {

using foundation::LogCategory;

Battle::Battle(Character player, Character enemy, ProgressionRules rules)
    : player_(std::move(player)), enemy_(std::move(enemy)), rules_(rules) {}

BattleStatus Battle::status() const noexcept {
    if (player_.isDefeated()) {
        return BattleStatus::Defeat;
    }
    if (enemy_.isDefeated()) {
        return BattleStatus::Victory;
    }
    return BattleStatus::InProgress;
}

BattleLog Battle::playerTurn(const Action& action, foundation::IRandomSource& rng) {
    if (status() != BattleStatus::InProgress) {
        return {};
    }
    return takeTurn(player_, enemy_, action, rng);
}

BattleLog Battle::enemyTurn(const Action& action, foundation::IRandomSource& rng) {
    if (status() != BattleStatus::InProgress) {
        return {};
    }
    return takeTurn(enemy_, player_, action, rng);
}

TurnOutcome Battle::endTurn(foundation::IRandomSource& rng) {
    TurnOutcome outcome;
    outcome.status = status();
    ++round_;

    foundation::LogContext ctx;
    ctx.round = round_;

    switch (outcome.status) {
        case BattleStatus::Victory: {
            outcome.log.push_back("Defeated " + enemy_.name + "!");
            auto level = std::max<uint32_t>(player_.attributes.level, 1);
            auto reward = experienceValue(enemy_, rules_) / level;
            auto gained = gainExperience(player_, reward, rng, rules_);
            outcome.log.insert(outcome.log.end(), gained.begin(), gained.end());

            ctx.character = player_.name;
            ctx.extra["experience"] = std::to_string(reward);
            foundation::GameLogger::instance().logWithContext(
                foundation::LogLevel::Info, LogCategory::Battle, "victory", ctx);
            break;
        }
        case BattleStatus::Defeat:
            outcome.log.push_back(player_.name + " died!");
            ctx.character = player_.name;
            foundation::GameLogger::instance().logWithContext(
                foundation::LogLevel::Info, LogCategory::Battle, "defeat", ctx);
            break;
        case BattleStatus::InProgress:
            endOfRoundCleanup(player_);
            endOfRoundCleanup(enemy_);
            ctx.extra["player_health"] = std::to_string(player_.state.health);
            ctx.extra["enemy_health"] = std::to_string(enemy_.state.health);
            foundation::GameLogger::instance().logWithContext(
                foundation::LogLevel::Debug, LogCategory::Battle, "round closed", ctx);
            break;
    }
    return outcome;
}

}  // namespace tbe::battle
