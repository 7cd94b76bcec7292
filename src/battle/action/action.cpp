/// @file action.cpp
/// @brief Action dispatch and the per-kind effect rules.

#include "tbe/battle/action.hpp"

#include <algorithm>
#include <type_traits>

#include "tbe/battle/alignment.hpp"
#include "tbe/foundation/game_logger.hpp"

namespace tbe::battle {

using foundation::LogCategory;

uint32_t computeDamage(const DamageParams& params) noexcept {
    uint64_t level = 2ull * params.userLevel / 5 + 2;
    uint64_t statRatio = params.attack / std::max<uint32_t>(params.defense, 1);
    uint64_t stab = params.sameAlignment ? 15 : 10;
    uint64_t eff = effectivenessFactor(params.effectiveness);
    uint64_t damage = level * params.power * statRatio * stab * eff / (50 * 10 * 10) + 2;
    return static_cast<uint32_t>(std::min<uint64_t>(damage, UINT32_MAX));
}

namespace {

std::string usedLine(const Character& user, std::string_view actionName) {
    return user.name + " used " + std::string(actionName) + ".";
}

BattleLog applyAttack(const Attack& attack, Character& user, Character& target) {
    BattleLog logs{usedLine(user, attack.name)};
    if (target.state.statuses.has(Status::Defend)) {
        logs.push_back(target.name + " blocked " + user.name + "'s " + attack.name + ".");
        return logs;
    }

    DamageParams params;
    params.userLevel = user.attributes.level;
    params.power = attack.power;
    params.attack = user.attributes.stats.attack;
    params.defense = target.attributes.stats.defense;
    params.sameAlignment = user.state.alignment == attack.alignment;
    params.effectiveness = effectiveness(attack.alignment, target.state.alignment);

    switch (params.effectiveness) {
        case Effectiveness::SuperEffective:
            logs.emplace_back("It's very effective.");
            break;
        case Effectiveness::NotVeryEffective:
            logs.emplace_back("It's not very effective.");
            break;
        case Effectiveness::Neutral:
            break;
    }

    auto damage = computeDamage(params);
    target.dealDamage(damage);
    TBE_LOG_DEBUG(LogCategory::Action,
                  attack.name + " hit " + target.name + " for " + std::to_string(damage) +
                  " (health " + std::to_string(target.state.health) + ")");
    return logs;
}

BattleLog applyFixedAttack(const FixedAttack& attack, Character& user, Character& target) {
    BattleLog logs{usedLine(user, attack.name)};
    if (target.state.statuses.has(Status::Defend)) {
        logs.push_back(target.name + " blocked " + user.name + "'s attack.");
        return logs;
    }
    target.dealDamage(attack.power);
    return logs;
}

BattleLog applyDefend(const Defend& /*defend*/, Character& user) {
    // Refreshing an existing Defend keeps it; intensity carries no meaning.
    user.state.statuses.ensure(Status::Defend);
    return {user.name + " is defending."};
}

BattleLog applyBleed(const Bleed& bleed, Character& user, Character& target) {
    BattleLog logs{usedLine(user, bleed.name)};
    if (target.state.statuses.has(Status::Stun)) {
        logs.push_back("But " + target.name + " is stunned.");
        return logs;
    }
    auto intensity = target.state.statuses.add(Status::Bleed, bleed.power);
    logs.push_back(target.name + " gained " + std::to_string(bleed.power) + " bleeding.");
    TBE_LOG_DEBUG(LogCategory::Status,
                  target.name + " bleed intensity now " + std::to_string(intensity));
    return logs;
}

BattleLog applyStun(const Stun& stun, Character& user, Character& target) {
    BattleLog logs{usedLine(user, stun.name)};
    if (target.state.statuses.has(Status::Bleed)) {
        logs.push_back("But " + target.name + " is bleeding.");
        return logs;
    }
    auto intensity = target.state.statuses.add(Status::Stun, 1);
    logs.push_back(target.name + " is stunned.");
    TBE_LOG_DEBUG(LogCategory::Status,
                  target.name + " stun intensity now " + std::to_string(intensity));
    return logs;
}

}  // namespace

std::string Action::name() const {
    return std::visit([](const auto& kind) -> std::string {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, Skip>) {
            return "Skip";
        } else {
            return kind.name;
        }
    }, kind_);
}

std::string Action::description() const {
    return std::visit([](const auto& kind) -> std::string {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, Attack>) {
            std::string text = std::string(alignmentName(kind.alignment)) +
                               "-aligned Attack with " + std::to_string(kind.power) + " power.";
            if (kind.priority > 0) {
                text += "\nHas priority.";
            }
            return text;
        } else if constexpr (std::is_same_v<T, FixedAttack>) {
            return "Attack for exactly " + std::to_string(kind.power) + " damage.";
        } else if constexpr (std::is_same_v<T, Defend>) {
            return "Defend against attacks.";
        } else if constexpr (std::is_same_v<T, Bleed>) {
            return "Applies " + std::to_string(kind.power) + " bleeding to the enemy.";
        } else if constexpr (std::is_same_v<T, Stun>) {
            return "Stuns the enemy.";
        } else {
            return "User skips their next turn.";
        }
    }, kind_);
}

int32_t Action::priority() const noexcept {
    if (const auto* attack = as<Attack>()) {
        return attack->priority;
    }
    if (as<Defend>() != nullptr) {
        return kDefendPriority;
    }
    return 0;
}

BattleLog Action::apply(Character& user, Character& target) const {
    return std::visit([&](const auto& kind) -> BattleLog {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, Attack>) {
            return applyAttack(kind, user, target);
        } else if constexpr (std::is_same_v<T, FixedAttack>) {
            return applyFixedAttack(kind, user, target);
        } else if constexpr (std::is_same_v<T, Defend>) {
            return applyDefend(kind, user);
        } else if constexpr (std::is_same_v<T, Bleed>) {
            return applyBleed(kind, user, target);
        } else if constexpr (std::is_same_v<T, Stun>) {
            return applyStun(kind, user, target);
        } else {
            return {usedLine(user, "Skip")};
        }
    }, kind_);
}

ActionKind Action::kind() const noexcept {
    return static_cast<ActionKind>(kind_.index());
}

}  // namespace tbe::battle
