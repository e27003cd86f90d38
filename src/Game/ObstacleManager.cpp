#include <JumpDash/Game/ObstacleManager.hpp>
#include <JumpDash/Core/Logger.hpp>
#include <algorithm>

namespace JumpDash::Game {

ObstacleManager::ObstacleManager(const GameConfig& config, const PlayfieldLayout& layout,
                                 RandomSource& random)
    : m_layout(layout)
    , m_random(random)
    , m_speed(config.initialObstacleSpeed)
    , m_spawnIntervalMs(config.initialSpawnIntervalMs)
    , m_spawnJitterMs(config.spawnJitterMs)
    , m_minSpawnGapMs(config.minSpawnGapMs)
    , m_fpsScale(config.fpsScale)
    , m_despawnX(config.despawnX)
    , m_capacity(config.maxObstacles)
    , m_timeSinceLastSpawnMs(0.0f) {
    m_records.reserve(m_capacity);
    m_active.reserve(m_capacity);
    m_free.reserve(m_capacity);
}

void ObstacleManager::Update(float deltaTime) {
    // Scroll left; walk backwards so recycling can erase in place
    for (size_t i = m_active.size(); i-- > 0;) {
        ObstacleId id = m_active[i];
        Obstacle& obstacle = m_records[id];
        obstacle.position -= m_speed * deltaTime * m_fpsScale;

        if (obstacle.position < m_despawnX) {
            obstacle.active = false;
            m_free.push_back(id);
            m_active.erase(m_active.begin() + static_cast<std::ptrdiff_t>(i));
            JUMPDASH_LOG_TRACE_F("Obstacle %u recycled", id);
        }
    }

    m_timeSinceLastSpawnMs += deltaTime * 1000.0f;
    float spawnDelay = ComputeSpawnDelay(m_random.NextUnit());
    if (m_timeSinceLastSpawnMs > spawnDelay) {
        SpawnObstacle();
        m_timeSinceLastSpawnMs = 0.0f;
    }
}

float ObstacleManager::ComputeSpawnDelay(float unitDraw) const {
    float delay = unitDraw * m_spawnIntervalMs + m_spawnJitterMs;
    return std::max(delay, m_minSpawnGapMs);
}

bool ObstacleManager::SpawnObstacle() {
    ObstacleId id;
    if (!m_free.empty()) {
        id = m_free.back();
        m_free.pop_back();
    } else if (m_records.size() < m_capacity) {
        id = static_cast<ObstacleId>(m_records.size());
        m_records.emplace_back();
    } else {
        JUMPDASH_LOG_WARNING_F("Obstacle arena full (%zu), spawn skipped", m_capacity);
        return false;
    }

    Obstacle& obstacle = m_records[id];
    obstacle.position = m_layout.SpawnX();
    obstacle.active = true;
    m_active.push_back(id);

    JUMPDASH_LOG_TRACE_F("Obstacle %u spawned at x=%.1f", id, obstacle.position);
    return true;
}

void ObstacleManager::Reset() {
    m_records.clear();
    m_active.clear();
    m_free.clear();
    m_timeSinceLastSpawnMs = 0.0f;
}

} // namespace JumpDash::Game
