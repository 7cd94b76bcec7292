#pragma once

/// @file content_loader.hpp
/// @brief Loads species and the action pool from a YAML content file.
///
/// Document layout:
/// @code
///   species:
///     - name: Rock Pawn
///       bst: 400
///       alignment: rock
///       base_stats: { health: 0.3, attack: 0.3, defense: 0.2, speed: 0.2 }
///   action_padding: 2
///   actions:
///     - { kind: attack, name: Rock Slam, power: 40, alignment: rock, priority: 0 }
///     - { kind: fixed_attack, name: Burst, power: 20 }
///     - { kind: defend, name: Block }
///     - { kind: bleed, name: Cut, power: 1 }
///     - { kind: stun, name: Yawn }
/// @endcode

#include <filesystem>
#include <string_view>
#include <vector>

#include "tbe/battle/action_pool.hpp"
#include "tbe/battle/character.hpp"
#include "tbe/foundation/game_result.hpp"

namespace tbe::content {

/// Species roster plus the shared action pool.
struct Content {
    std::vector<battle::Species> species;
    battle::ActionPool actions;
};

foundation::GameResult<Content> loadContentFile(const std::filesystem::path& path);

foundation::GameResult<Content> loadContent(std::string_view document);

/// Species by exact name, or SpeciesNotFound.
foundation::GameResult<battle::Species> findSpecies(const Content& content,
                                                    std::string_view name);

}  // namespace tbe::content
