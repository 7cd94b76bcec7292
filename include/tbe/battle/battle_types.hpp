#pragma once

/// @file battle_types.hpp
/// @brief Enumerations, ids and constants shared by the battle engine.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tbe::battle {

/// Index into a caller-owned ActionPool.
using ActionId = std::size_t;

/// Player-visible narrative lines produced by engine operations.
using BattleLog = std::vector<std::string>;

/// Alignment triangle: Rock beats Scissors, Scissors beats Paper,
/// Paper beats Rock.
///
/// COUNT is a sentinel used for table sizing.
enum class Alignment : uint8_t {
    Rock,
    Paper,
    Scissors,
    COUNT  ///< Sentinel: number of alignments.
};

constexpr std::size_t kAlignmentCount = static_cast<std::size_t>(Alignment::COUNT);

/// Attack effectiveness class of an alignment matchup.
enum class Effectiveness : uint8_t {
    NotVeryEffective,  ///< 0.5x
    Neutral,           ///< 1x
    SuperEffective     ///< 2x
};

/// Status effect kinds. Bleed and Stun are mutually exclusive on a target.
enum class Status : uint8_t {
    Defend,  ///< Blocks every attack until end of round.
    Bleed,   ///< Intensity is health lost after each of the holder's actions.
    Stun,    ///< Intensity n gives a 1/(n+1) chance to recover per turn.
    COUNT
};

constexpr std::size_t kStatusCount = static_cast<std::size_t>(Status::COUNT);

/// Outcome of a battle as seen from the player's side.
enum class BattleStatus : uint8_t {
    InProgress,
    Victory,  ///< Enemy health reached zero.
    Defeat    ///< Player health reached zero (checked first).
};

/// Priority of Defend actions; ordinary actions default to 0.
constexpr int32_t kDefendPriority = 2;

constexpr std::string_view alignmentName(Alignment alignment) {
    switch (alignment) {
        case Alignment::Rock:     return "Rock";
        case Alignment::Paper:    return "Paper";
        case Alignment::Scissors: return "Scissors";
        case Alignment::COUNT:    break;
    }
    return "Unknown";
}

constexpr std::string_view statusName(Status status) {
    switch (status) {
        case Status::Defend: return "Defend";
        case Status::Bleed:  return "Bleed";
        case Status::Stun:   return "Stun";
        case Status::COUNT:  break;
    }
    return "Unknown";
}

constexpr std::string_view battleStatusName(BattleStatus status) {
    switch (status) {
        case BattleStatus::InProgress: return "InProgress";
        case BattleStatus::Victory:    return "Victory";
        case BattleStatus::Defeat:     return "Defeat";
    }
    return "Unknown";
}

}  // namespace tbe::battle
