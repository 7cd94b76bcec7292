/// @file random_source.cpp
/// @brief RandomSource implementation.

#include "tbe/foundation/random_source.hpp"

namespace tbe::foundation {

RandomSource::RandomSource() : RandomSource(std::random_device{}()) {}

RandomSource::RandomSource(uint32_t seed) : seed_(seed), engine_(seed) {}

uint32_t RandomSource::nextU32() {
    return std::uniform_int_distribution<uint32_t>{}(engine_);
}

std::size_t RandomSource::uniformIndex(std::size_t bound) {
    if (bound == 0) {
        return 0;
    }
    return std::uniform_int_distribution<std::size_t>{0, bound - 1}(engine_);
}

bool RandomSource::coinFlip() {
    return std::bernoulli_distribution{0.5}(engine_);
}

} // namespace tbe::foundation
