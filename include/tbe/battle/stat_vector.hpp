#pragma once

/// @file stat_vector.hpp
/// @brief StatVector<T>: the (health, attack, defense, speed) tuple.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "tbe/foundation/random_source.hpp"

namespace tbe::battle {

/// Four-component stat tuple over a numeric type.
///
/// Floating vectors hold a species' stat ratios; integer vectors hold a
/// character's realized stats. No sign invariant is enforced here.
template <typename T>
struct StatVector {
    T health{};
    T attack{};
    T defense{};
    T speed{};

    static constexpr std::size_t kComponentCount = 4;

    static constexpr StatVector zero() noexcept { return StatVector{}; }

    /// Build from components in (health, attack, defense, speed) order.
    static constexpr StatVector fromArray(const std::array<T, kComponentCount>& values) noexcept {
        return StatVector{values[0], values[1], values[2], values[3]};
    }

    [[nodiscard]] constexpr std::array<T, kComponentCount> toArray() const noexcept {
        return {health, attack, defense, speed};
    }

    /// Component by index in (health, attack, defense, speed) order.
    [[nodiscard]] constexpr T& at(std::size_t index) noexcept {
        switch (index) {
            case 0: return health;
            case 1: return attack;
            case 2: return defense;
            default: return speed;
        }
    }

    [[nodiscard]] constexpr const T& at(std::size_t index) const noexcept {
        switch (index) {
            case 0: return health;
            case 1: return attack;
            case 2: return defense;
            default: return speed;
        }
    }

    [[nodiscard]] constexpr T sum() const noexcept { return health + attack + defense + speed; }

    [[nodiscard]] constexpr bool isZero() const noexcept { return *this == zero(); }

    constexpr StatVector& operator+=(const StatVector& other) noexcept {
        health += other.health;
        attack += other.attack;
        defense += other.defense;
        speed += other.speed;
        return *this;
    }

    friend constexpr StatVector operator+(StatVector lhs, const StatVector& rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    constexpr bool operator==(const StatVector&) const = default;
};

/// Species stat ratios (not necessarily summing to 1).
using StatRatios = StatVector<double>;

/// Integer stats realized by a character.
using RealizedStats = StatVector<uint32_t>;

/// Split @p total across four components proportionally to @p ratios.
///
/// Each component is floor(total * ratio_i / sum(ratios)); any shortfall left
/// by truncation is handed out one point at a time to components drawn
/// uniformly (with repetition) from @p rng, so the result always sums to
/// exactly @p total. Negative ratios count as 0; an all-zero ratio vector is
/// treated as an equal split.
[[nodiscard]] RealizedStats scale(const StatRatios& ratios, uint32_t total,
                                  foundation::IRandomSource& rng);

/// "health +a, attack +b, defense +c, speed +d"
[[nodiscard]] std::string describeGrowth(const RealizedStats& growth);

}  // namespace tbe::battle
