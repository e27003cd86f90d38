#pragma once

#include <cstdint>
#include <random>

namespace JumpDash::Game {

// Source of uniform draws, injected so tests can script spawn timing
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform draw in [0, 1)
    virtual float NextUnit() = 0;

    // Uniform draw in [lo, hi)
    float Uniform(float lo, float hi) { return lo + (hi - lo) * NextUnit(); }
};

class MersenneRandom : public RandomSource {
public:
    MersenneRandom();
    explicit MersenneRandom(uint32_t seed);

    float NextUnit() override;

private:
    std::mt19937 m_gen;
    std::uniform_real_distribution<float> m_dist;
};

} // namespace JumpDash::Game
