#pragma once

/// @file action.hpp
/// @brief Action: closed set of things a character can do on its turn.
///
/// Each kind is a plain data struct; Action holds one of them in a
/// std::variant and dispatches name/description/priority/apply over it.

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "tbe/battle/battle_types.hpp"
#include "tbe/battle/character.hpp"

namespace tbe::battle {

/// Alignment-typed attack using the level/stat damage formula.
struct Attack {
    std::string name;
    uint32_t power = 0;
    Alignment alignment = Alignment::Rock;
    int32_t priority = 0;
};

/// Attack that removes exactly `power` health.
struct FixedAttack {
    std::string name;
    uint32_t power = 0;
};

/// Raises the user's guard until end of round.
struct Defend {
    std::string name;
};

/// Adds `power` Bleed intensity to the target.
struct Bleed {
    std::string name;
    uint32_t power = 0;
};

/// Adds one Stun intensity to the target.
struct Stun {
    std::string name;
};

/// Does nothing. Stands in for unresolvable action ids.
struct Skip {};

enum class ActionKind : uint8_t { Attack, FixedAttack, Defend, Bleed, Stun, Skip };

constexpr std::string_view actionKindName(ActionKind kind) {
    switch (kind) {
        case ActionKind::Attack:      return "attack";
        case ActionKind::FixedAttack: return "fixed_attack";
        case ActionKind::Defend:      return "defend";
        case ActionKind::Bleed:       return "bleed";
        case ActionKind::Stun:        return "stun";
        case ActionKind::Skip:        return "skip";
    }
    return "unknown";
}

/// Inputs of the damage formula, separated out so it can be tested alone.
struct DamageParams {
    uint32_t userLevel = 0;
    uint32_t power = 0;
    uint32_t attack = 0;
    uint32_t defense = 0;   ///< Clamped to at least 1.
    bool sameAlignment = false;
    Effectiveness effectiveness = Effectiveness::Neutral;
};

/// level * power * (attack / defense) * stab * eff / 5000 + 2, where
/// level = 2 * userLevel / 5 + 2, stab is 15 or 10 and eff is 5, 10 or 20.
/// Only the final division truncates beyond the level and stat ratio terms.
[[nodiscard]] uint32_t computeDamage(const DamageParams& params) noexcept;

class Action {
public:
    using Variant = std::variant<Attack, FixedAttack, Defend, Bleed, Stun, Skip>;

    /// A Skip action.
    Action() = default;

    template <typename Kind,
              typename = std::enable_if_t<std::is_constructible_v<Variant, Kind>>>
    Action(Kind kind) : kind_(std::move(kind)) {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] std::string name() const;

    [[nodiscard]] std::string description() const;

    /// Higher acts first. Defend is kDefendPriority, Attack carries its own,
    /// everything else is 0.
    [[nodiscard]] int32_t priority() const noexcept;

    /// Apply the action's effect to @p user and/or @p target.
    ///
    /// Status-driven turn wrapping (stun, bleed) is not applied here; see
    /// takeTurn() in status_engine.hpp.
    BattleLog apply(Character& user, Character& target) const;

    [[nodiscard]] ActionKind kind() const noexcept;

    /// The held kind, or nullptr if this action is of another kind.
    template <typename Kind>
    [[nodiscard]] const Kind* as() const noexcept {
        return std::get_if<Kind>(&kind_);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return kind_; }

private:
    Variant kind_{Skip{}};
};

}  // namespace tbe::battle
