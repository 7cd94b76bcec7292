/// @file alignment.cpp
/// @brief Alignment triangle lookups.

#include "tbe/battle/alignment.hpp"

#include <array>
#include <cctype>

namespace tbe::battle {

namespace {

// Indexed by Alignment: the alignment each one beats.
constexpr std::array<Alignment, kAlignmentCount> kBeats = {
    Alignment::Scissors,  // Rock
    Alignment::Rock,      // Paper
    Alignment::Paper      // Scissors
};

constexpr std::size_t index(Alignment alignment) noexcept {
    return static_cast<std::size_t>(alignment) % kAlignmentCount;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

Alignment strongAgainst(Alignment alignment) noexcept {
    return kBeats[index(alignment)];
}

Alignment weakAgainst(Alignment alignment) noexcept {
    for (std::size_t i = 0; i < kAlignmentCount; ++i) {
        if (kBeats[i] == alignment) {
            return static_cast<Alignment>(i);
        }
    }
    return alignment;
}

Effectiveness effectiveness(Alignment attacker, Alignment defender) noexcept {
    if (strongAgainst(attacker) == defender) {
        return Effectiveness::SuperEffective;
    }
    if (weakAgainst(attacker) == defender) {
        return Effectiveness::NotVeryEffective;
    }
    return Effectiveness::Neutral;
}

std::optional<Alignment> parseAlignment(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kAlignmentCount; ++i) {
        auto candidate = static_cast<Alignment>(i);
        if (equalsIgnoreCase(name, alignmentName(candidate))) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace tbe::battle
