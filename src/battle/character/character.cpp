/// @file character.cpp
/// @brief Character lifecycle helpers.

#include "tbe/battle/character.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace tbe::battle {

Character Character::fromSpecies(Species species) {
    Character character;
    character.name = species.name;
    character.state.alignment = species.alignment;
    character.species = std::move(species);
    return character;
}

Character Character::fromSpecies(Species species, std::vector<ActionId> actions) {
    auto character = fromSpecies(std::move(species));
    character.attributes.actions = std::move(actions);
    return character;
}

int32_t Character::priority() const noexcept {
    return static_cast<int32_t>(std::min<uint32_t>(
        attributes.stats.speed,
        static_cast<uint32_t>(std::numeric_limits<int32_t>::max())));
}

void Character::refresh() {
    state.alignment = species.alignment;
    state.health = static_cast<int32_t>(std::min<uint32_t>(
        attributes.stats.health,
        static_cast<uint32_t>(std::numeric_limits<int32_t>::max())));
    state.statuses.clear();
}

void Character::dealDamage(uint32_t amount) noexcept {
    auto remaining = static_cast<int64_t>(state.health) - static_cast<int64_t>(amount);
    state.health = static_cast<int32_t>(std::max<int64_t>(0, remaining));
}

}  // namespace tbe::battle
