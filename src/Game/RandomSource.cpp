#include <JumpDash/Game/RandomSource.hpp>

namespace JumpDash::Game {

MersenneRandom::MersenneRandom()
    : MersenneRandom(std::random_device{}()) {
}

MersenneRandom::MersenneRandom(uint32_t seed)
    : m_gen(seed)
    , m_dist(0.0f, 1.0f) {
}

float MersenneRandom::NextUnit() {
    float draw = m_dist(m_gen);
    // uniform_real_distribution<float> can round up to its upper bound
    return draw < 1.0f ? draw : 0.0f;
}

} // namespace JumpDash::Game
