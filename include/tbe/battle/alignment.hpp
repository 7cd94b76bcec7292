#pragma once

/// @file alignment.hpp
/// @brief Alignment effectiveness table.

#include <cstdint>
#include <optional>
#include <string_view>

#include "tbe/battle/battle_types.hpp"

namespace tbe::battle {

/// Effectiveness of an @p attacker-aligned attack against a @p defender.
///
/// | attacker \ defender | Rock  | Paper | Scissors |
/// |---------------------|-------|-------|----------|
/// | Rock                | 1x    | 0.5x  | 2x       |
/// | Paper               | 2x    | 1x    | 0.5x     |
/// | Scissors            | 0.5x  | 2x    | 1x       |
[[nodiscard]] Effectiveness effectiveness(Alignment attacker, Alignment defender) noexcept;

/// Multiplier scaled by 10 to keep damage arithmetic integral: 5, 10 or 20.
[[nodiscard]] constexpr uint32_t effectivenessFactor(Effectiveness eff) noexcept {
    switch (eff) {
        case Effectiveness::NotVeryEffective: return 5;
        case Effectiveness::Neutral:          return 10;
        case Effectiveness::SuperEffective:   return 20;
    }
    return 10;
}

/// The alignment that @p alignment is strong against.
[[nodiscard]] Alignment strongAgainst(Alignment alignment) noexcept;

/// The alignment that @p alignment is weak against.
[[nodiscard]] Alignment weakAgainst(Alignment alignment) noexcept;

/// Parse "Rock" / "rock" etc. Case-insensitive.
[[nodiscard]] std::optional<Alignment> parseAlignment(std::string_view name) noexcept;

}  // namespace tbe::battle
