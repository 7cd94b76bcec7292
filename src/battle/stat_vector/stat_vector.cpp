/// @file stat_vector.cpp
/// @brief Proportional integer scaling of stat ratio vectors.

#include "tbe/battle/stat_vector.hpp"

#include <algorithm>
#include <cmath>

namespace tbe::battle {

RealizedStats scale(const StatRatios& ratios, uint32_t total,
                    foundation::IRandomSource& rng) {
    constexpr std::size_t n = StatRatios::kComponentCount;

    std::array<double, n> weights{};
    double weightSum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        auto ratio = ratios.at(i);
        weights[i] = std::isfinite(ratio) ? std::max(ratio, 0.0) : 0.0;
        weightSum += weights[i];
    }
    if (!(weightSum > 0.0) || !std::isfinite(weightSum)) {
        weights.fill(1.0);
        weightSum = static_cast<double>(n);
    }

    RealizedStats result;
    uint64_t assigned = 0;
    for (std::size_t i = 0; i < n; ++i) {
        auto share = std::floor(static_cast<double>(total) * weights[i] / weightSum);
        result.at(i) = static_cast<uint32_t>(std::clamp(share, 0.0, static_cast<double>(total)));
        assigned += result.at(i);
    }

    // Rounding in the division can overshoot by a point; take it back from
    // the largest component.
    while (assigned > total) {
        auto values = result.toArray();
        auto largest = static_cast<std::size_t>(
            std::max_element(values.begin(), values.end()) - values.begin());
        --result.at(largest);
        --assigned;
    }

    for (; assigned < total; ++assigned) {
        ++result.at(rng.uniformIndex(n));
    }
    return result;
}

std::string describeGrowth(const RealizedStats& growth) {
    return "health +" + std::to_string(growth.health) +
           ", attack +" + std::to_string(growth.attack) +
           ", defense +" + std::to_string(growth.defense) +
           ", speed +" + std::to_string(growth.speed);
}

}  // namespace tbe::battle
