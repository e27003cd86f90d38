#pragma once

#include "GameConfig.hpp"
#include "PlayfieldLayout.hpp"
#include "RandomSource.hpp"
#include <cstdint>
#include <vector>

namespace JumpDash::Game {

using ObstacleId = uint32_t;

struct Obstacle {
    float position = 0.0f;   // Left edge, pixels from the playfield's left side
    bool active = false;
};

/**
 * Scrolling obstacle stream backed by a fixed-capacity arena.
 *
 * Records live in one array. A record is either on the ordered active list
 * or on the free stack, never both. Recycled records are reused before new
 * ones are created, so ActiveCount() + PooledCount() only grows during a run.
 */
class ObstacleManager {
public:
    ObstacleManager(const GameConfig& config, const PlayfieldLayout& layout, RandomSource& random);

    // Scroll, recycle, and maybe spawn. deltaTime is in seconds.
    void Update(float deltaTime);

    // Place an obstacle at the right edge. Returns false when the arena is full.
    bool SpawnObstacle();

    // Drop every record and zero the spawn timer
    void Reset();

    void SetSpeed(float speed) { m_speed = speed; }
    void SetSpawnInterval(float intervalMs) { m_spawnIntervalMs = intervalMs; }

    float GetSpeed() const { return m_speed; }
    float GetSpawnInterval() const { return m_spawnIntervalMs; }
    float GetTimeSinceLastSpawn() const { return m_timeSinceLastSpawnMs; }

    // Spawn delay for a unit draw in [0, 1): jitter plus a share of the
    // interval, never below the minimum gap
    float ComputeSpawnDelay(float unitDraw) const;

    // Active ids in spawn order (oldest first)
    const std::vector<ObstacleId>& GetActive() const { return m_active; }
    const Obstacle& Get(ObstacleId id) const { return m_records[id]; }

    size_t ActiveCount() const { return m_active.size(); }
    size_t PooledCount() const { return m_free.size(); }
    size_t Capacity() const { return m_capacity; }

private:
    const PlayfieldLayout& m_layout;
    RandomSource& m_random;

    float m_speed;
    float m_spawnIntervalMs;
    float m_spawnJitterMs;
    float m_minSpawnGapMs;
    float m_fpsScale;
    float m_despawnX;
    size_t m_capacity;

    std::vector<Obstacle> m_records;
    std::vector<ObstacleId> m_active;
    std::vector<ObstacleId> m_free;
    float m_timeSinceLastSpawnMs;
};

} // namespace JumpDash::Game
