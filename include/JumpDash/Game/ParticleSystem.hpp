#pragma once

#include "RandomSource.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace JumpDash::Game {

struct Particle {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float life = 0.0f;      // Seconds remaining
    bool active = false;
};

// Landing dust. Pooled the same way as obstacles.
class ParticleSystem {
public:
    static constexpr int BURST_COUNT = 5;
    static constexpr float LIFETIME = 1.0f;
    static constexpr float SPREAD = 10.0f;
    static constexpr float RISE_SPEED = 20.0f;

    explicit ParticleSystem(RandomSource& random, size_t capacity = 64);

    // Scatter BURST_COUNT particles around a screen point
    void SpawnBurst(float x, float y);

    void Update(float deltaTime);

    void Reset();

    const std::vector<uint32_t>& GetActive() const { return m_active; }
    const Particle& Get(uint32_t id) const { return m_particles[id]; }

    // Remaining life as a fraction, for fading
    float Alpha(uint32_t id) const { return m_particles[id].life / LIFETIME; }

    size_t ActiveCount() const { return m_active.size(); }
    size_t PooledCount() const { return m_free.size(); }

private:
    RandomSource& m_random;
    size_t m_capacity;
    std::vector<Particle> m_particles;
    std::vector<uint32_t> m_active;
    std::vector<uint32_t> m_free;
};

} // namespace JumpDash::Game
