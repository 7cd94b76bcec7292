#pragma once

/// @file character.hpp
/// @brief Species, progression attributes, per-battle state and Character.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "tbe/battle/battle_types.hpp"
#include "tbe/battle/stat_vector.hpp"

namespace tbe::battle {

/// Immutable template shared by all characters of a kind.
struct Species {
    std::string name;
    uint32_t bst = 0;  ///< Base stat total.
    StatRatios baseStats;
    Alignment alignment = Alignment::Rock;

    bool operator==(const Species&) const = default;
};

/// Progression data that persists across battles.
struct Attributes {
    uint32_t level = 0;
    uint32_t experience = 0;  ///< Always below the experience-to-level threshold.
    RealizedStats stats;
    std::vector<ActionId> actions;

    bool operator==(const Attributes&) const = default;
};

/// Active status effects keyed by kind, each with a stacking intensity.
struct StatusSet {
    std::map<Status, uint32_t> entries;

    [[nodiscard]] bool has(Status status) const {
        return entries.find(status) != entries.end();
    }

    /// Intensity of @p status, or 0 when absent.
    [[nodiscard]] uint32_t intensity(Status status) const {
        auto it = entries.find(status);
        return it == entries.end() ? 0 : it->second;
    }

    /// Create @p status at intensity 0 if absent; existing intensity is kept.
    void ensure(Status status) { entries.try_emplace(status, 0u); }

    /// Create @p status if absent, then raise its intensity by @p amount.
    /// @return The new intensity.
    uint32_t add(Status status, uint32_t amount) {
        auto& value = entries.try_emplace(status, 0u).first->second;
        value += amount;
        return value;
    }

    void remove(Status status) { entries.erase(status); }

    void clear() noexcept { entries.clear(); }

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    bool operator==(const StatusSet&) const = default;
};

/// Mutable state that is reset whenever a battle starts or ends.
struct BattleState {
    Alignment alignment = Alignment::Rock;
    int32_t health = 0;  ///< In [0, attributes.stats.health].
    StatusSet statuses;

    bool operator==(const BattleState&) const = default;
};

/// A combatant: identity, species template, progression and battle state.
///
/// Characters are plain values; a Battle owns copies for its duration.
/// Names are for narration only and need not be unique.
struct Character {
    std::string name;
    Species species;
    Attributes attributes;
    BattleState state;

    /// Level 0, zero stats, no actions, zero health.
    static Character fromSpecies(Species species);

    static Character fromSpecies(Species species, std::vector<ActionId> actions);

    /// Speed stat, used to break turn-order ties.
    [[nodiscard]] int32_t priority() const noexcept;

    /// Restore full health, clear statuses, reset alignment to the species'.
    void refresh();

    /// Subtract @p amount from health, clamping at zero.
    void dealDamage(uint32_t amount) noexcept;

    [[nodiscard]] bool isDefeated() const noexcept { return state.health <= 0; }

    bool operator==(const Character&) const = default;
};

}  // namespace tbe::battle
