/// @file experience.cpp
/// @brief Experience and leveling arithmetic.

#include "tbe/battle/experience.hpp"

#include <algorithm>
#include <utility>

#include "tbe/foundation/game_logger.hpp"

namespace tbe::battle {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

GameResult<ProgressionRules> ProgressionRules::fromConfig(
    const foundation::ConfigManager& config) {
    ProgressionRules rules;
    rules.baseExperience =
        config.getOr<uint32_t>("progression.base_experience", rules.baseExperience);
    rules.experienceToLevel =
        config.getOr<uint32_t>("progression.experience_to_level", rules.experienceToLevel);
    rules.scalingFactor =
        config.getOr<uint32_t>("progression.scaling_factor", rules.scalingFactor);

    if (rules.baseExperience == 0) {
        return GameResult<ProgressionRules>::err(
            GameError(ErrorCode::InvalidArgument,
                      "progression.base_experience must be positive"));
    }
    if (rules.experienceToLevel == 0) {
        return GameResult<ProgressionRules>::err(
            GameError(ErrorCode::InvalidArgument,
                      "progression.experience_to_level must be positive"));
    }
    return GameResult<ProgressionRules>::ok(rules);
}

uint32_t experienceValue(const Character& character, const ProgressionRules& rules) {
    auto level = static_cast<uint64_t>(character.attributes.level);
    auto bst = static_cast<uint64_t>(character.species.bst);
    if (level == 0 || bst == 0 || rules.baseExperience == 0) {
        return 0;
    }
    uint64_t bstTerm = bst * floorLog2(bst + 1);
    // level >= 1 so log2(level + 1) >= 1.
    uint64_t levelTerm = level / floorLog2(level + 1);
    return static_cast<uint32_t>(bstTerm * levelTerm / rules.baseExperience);
}

BattleLog gainExperience(Character& character, uint32_t amount,
                         foundation::IRandomSource& rng,
                         const ProgressionRules& rules) {
    BattleLog logs{"Gained " + std::to_string(amount) + " experience!"};
    if (rules.experienceToLevel == 0) {
        return logs;
    }

    auto& attrs = character.attributes;
    uint64_t total = static_cast<uint64_t>(attrs.experience) + amount;
    auto levels = static_cast<uint32_t>(total / rules.experienceToLevel);
    attrs.experience = static_cast<uint32_t>(total % rules.experienceToLevel);
    attrs.level += levels;

    if (levels > 0) {
        auto growth = scale(character.species.baseStats, rules.scalingFactor, rng);
        attrs.stats += growth;
        logs.push_back(character.name + " grew to level " + std::to_string(attrs.level) + "!");
        logs.push_back("Stats increased by " + describeGrowth(growth) + ".");

        foundation::LogContext ctx;
        ctx.character = character.name;
        ctx.extra["levels"] = std::to_string(levels);
        ctx.extra["level"] = std::to_string(attrs.level);
        foundation::GameLogger::instance().logWithContext(
            foundation::LogLevel::Info, LogCategory::Progression, "level up", ctx);
    }
    return logs;
}

Character characterAtLevel(const Species& species, uint32_t level,
                           std::vector<ActionId> actions,
                           foundation::IRandomSource& rng,
                           const ProgressionRules& rules) {
    auto character = Character::fromSpecies(species, std::move(actions));
    character.attributes.level = level;
    auto total = static_cast<uint64_t>(level) * rules.scalingFactor;
    character.attributes.stats =
        scale(species.baseStats, static_cast<uint32_t>(std::min<uint64_t>(total, UINT32_MAX)), rng);
    character.refresh();
    return character;
}

}  // namespace tbe::battle
