#pragma once

/// @file experience.hpp
/// @brief Experience value, experience gain and level-up stat growth.

#include <cstdint>
#include <vector>

#include "tbe/battle/battle_types.hpp"
#include "tbe/battle/character.hpp"
#include "tbe/foundation/config_manager.hpp"
#include "tbe/foundation/game_result.hpp"
#include "tbe/foundation/random_source.hpp"

namespace tbe::battle {

constexpr uint32_t kBaseExperience = 31;
constexpr uint32_t kExperienceToLevel = 100;
constexpr uint32_t kScalingFactor = 100;

/// Tunable progression constants.
struct ProgressionRules {
    uint32_t baseExperience = kBaseExperience;       ///< Divisor of experienceValue().
    uint32_t experienceToLevel = kExperienceToLevel; ///< Experience per level.
    uint32_t scalingFactor = kScalingFactor;         ///< Stat points per level-up.

    /// Read "progression.*" keys, keeping defaults for missing ones.
    /// Zero base_experience or experience_to_level is rejected.
    static foundation::GameResult<ProgressionRules> fromConfig(
        const foundation::ConfigManager& config);
};

/// floor(log2(x)) for x > 0, else 0.
[[nodiscard]] constexpr uint32_t floorLog2(uint64_t x) noexcept {
    uint32_t result = 0;
    while (x > 1) {
        x >>= 1;
        ++result;
    }
    return result;
}

/// Experience awarded for defeating @p character:
/// bst * log2(bst + 1) * (level / log2(level + 1)) / baseExperience,
/// truncating at each division. Zero for level 0 or bst 0.
[[nodiscard]] uint32_t experienceValue(const Character& character,
                                       const ProgressionRules& rules = {});

/// Add @p amount experience, absorbing whole levels.
///
/// When at least one level is gained, realized stats grow by one
/// scale(baseStats, scalingFactor) increment regardless of how many levels
/// the gain spans.
BattleLog gainExperience(Character& character, uint32_t amount,
                         foundation::IRandomSource& rng,
                         const ProgressionRules& rules = {});

/// A character of @p species at @p level with zero experience, realized
/// stats scale(baseStats, level * scalingFactor) and refreshed battle state.
[[nodiscard]] Character characterAtLevel(const Species& species, uint32_t level,
                                         std::vector<ActionId> actions,
                                         foundation::IRandomSource& rng,
                                         const ProgressionRules& rules = {});

}  // namespace tbe::battle
