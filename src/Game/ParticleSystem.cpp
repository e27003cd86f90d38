#include <JumpDash/Game/ParticleSystem.hpp>
#include <cstddef>

namespace JumpDash::Game {

ParticleSystem::ParticleSystem(RandomSource& random, size_t capacity)
    : m_random(random)
    , m_capacity(capacity) {
    m_particles.reserve(m_capacity);
}

void ParticleSystem::SpawnBurst(float x, float y) {
    for (int i = 0; i < BURST_COUNT; ++i) {
        uint32_t id;
        if (!m_free.empty()) {
            id = m_free.back();
            m_free.pop_back();
        } else if (m_particles.size() < m_capacity) {
            id = static_cast<uint32_t>(m_particles.size());
            m_particles.emplace_back();
        } else {
            return;
        }

        Particle& particle = m_particles[id];
        particle.position = glm::vec2(x + m_random.Uniform(-SPREAD, SPREAD),
                                      y + m_random.Uniform(-SPREAD, SPREAD));
        particle.velocity = glm::vec2(0.0f, -RISE_SPEED);
        particle.life = LIFETIME;
        particle.active = true;
        m_active.push_back(id);
    }
}

void ParticleSystem::Update(float deltaTime) {
    for (size_t i = m_active.size(); i-- > 0;) {
        uint32_t id = m_active[i];
        Particle& particle = m_particles[id];
        particle.position += particle.velocity * deltaTime;
        particle.life -= deltaTime;

        if (particle.life <= 0.0f) {
            particle.life = 0.0f;
            particle.active = false;
            m_free.push_back(id);
            m_active.erase(m_active.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
}

void ParticleSystem::Reset() {
    m_particles.clear();
    m_active.clear();
    m_free.clear();
}

} // namespace JumpDash::Game
