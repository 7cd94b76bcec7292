#pragma once

/// @file random_source.hpp
/// @brief Injectable uniform randomness for the battle engine.
///
/// Every engine operation that needs randomness (stun recovery, turn-order
/// tie-breaks, stat-scaling remainder distribution, enemy action choice)
/// takes an IRandomSource& instead of reaching for global state, so tests
/// can substitute a seeded or scripted source.

#include <cstddef>
#include <cstdint>
#include <random>

namespace tbe::foundation {

/// Abstract uniform random source.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform value over the full uint32_t range.
    virtual uint32_t nextU32() = 0;

    /// Uniform index in [0, bound). Returns 0 when @p bound is 0.
    virtual std::size_t uniformIndex(std::size_t bound) = 0;

    /// Fair coin flip.
    virtual bool coinFlip() = 0;
};

/// IRandomSource backed by std::mt19937.
class RandomSource final : public IRandomSource {
public:
    /// Seeded from std::random_device.
    RandomSource();

    /// Deterministic sequence for a fixed @p seed.
    explicit RandomSource(uint32_t seed);

    uint32_t nextU32() override;

    std::size_t uniformIndex(std::size_t bound) override;

    bool coinFlip() override;

    [[nodiscard]] uint32_t seed() const noexcept { return seed_; }

private:
    uint32_t seed_;
    std::mt19937 engine_;
};

} // namespace tbe::foundation
