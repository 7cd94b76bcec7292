/// @file status_engine.cpp
/// @brief Pre-action status resolution and end-of-round cleanup.

#include "tbe/battle/status_engine.hpp"

#include "tbe/foundation/game_logger.hpp"

namespace tbe::battle {

using foundation::LogCategory;

BattleLog takeTurn(Character& user, Character& target, const Action& action,
                   foundation::IRandomSource& rng) {
    auto& statuses = user.state.statuses;

    if (statuses.has(Status::Stun)) {
        auto intensity = statuses.intensity(Status::Stun);
        auto roll = rng.nextU32() % (static_cast<uint64_t>(intensity) + 1);
        if (roll != 0) {
            TBE_LOG_DEBUG(LogCategory::Status,
                          user.name + " lost a turn to stun " + std::to_string(intensity));
            return {user.name + " is stunned."};
        }
        statuses.remove(Status::Stun);
        TBE_LOG_DEBUG(LogCategory::Status, user.name + " recovered from stun");
        BattleLog logs{user.name + " is no longer stunned."};
        auto acted = action.apply(user, target);
        logs.insert(logs.end(), acted.begin(), acted.end());
        return logs;
    }

    if (statuses.has(Status::Bleed)) {
        auto logs = action.apply(user, target);
        auto intensity = statuses.intensity(Status::Bleed);
        user.dealDamage(intensity);
        logs.push_back(user.name + " was hurt by bleed.");
        TBE_LOG_DEBUG(LogCategory::Status,
                      user.name + " bled for " + std::to_string(intensity));
        return logs;
    }

    return action.apply(user, target);
}

void endOfRoundCleanup(Character& character) {
    character.state.statuses.remove(Status::Defend);
}

}  // namespace tbe::battle
